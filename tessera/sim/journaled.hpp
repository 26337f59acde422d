// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <tessera/core/assert.h>
#include <tessera/core/version_stack.hpp>
#include <tessera/sim/config.hpp>
#include <tessera/staking/external.hpp>

#include <utility>

TESSERA_SIM_NAMESPACE_BEGIN

// Whole-value journal for a collaborator's state. The state is copied the
// first time it is written inside a version.
template <class T>
class Journaled : public staking::Transactional
{
    VersionStack<T> stack_;
    unsigned version_{0};

protected:
    explicit Journaled(T value = {})
        : stack_{std::move(value)}
    {
    }

    T const &recent() const
    {
        return stack_.recent();
    }

    T &current()
    {
        return stack_.current(version_);
    }

public:
    void push() override
    {
        ++version_;
    }

    void pop_accept() override
    {
        TESSERA_ASSERT(version_);
        stack_.pop_accept(version_);
        --version_;
    }

    void pop_reject() override
    {
        TESSERA_ASSERT(version_);
        stack_.pop_reject(version_);
        --version_;
    }
};

TESSERA_SIM_NAMESPACE_END
