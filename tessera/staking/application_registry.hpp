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

#include <tessera/core/address.hpp>
#include <tessera/core/result.hpp>
#include <tessera/staking/config.hpp>
#include <tessera/staking/external.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>

TESSERA_STAKING_NAMESPACE_BEGIN

// Resolves application addresses to their callback interface. Does not own
// the applications.
class ApplicationRegistry
{
    ankerl::unordered_dense::map<Address, Application *> applications_{};

public:
    // returns false if the address is already registered
    bool add(Address const &, Application &);

    Application *find(Address const &) const;
    Result<Application *> resolve(Address const &) const;

    size_t size() const
    {
        return applications_.size();
    }
};

TESSERA_STAKING_NAMESPACE_END
