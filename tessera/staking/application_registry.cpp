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

#include <tessera/core/address.hpp>
#include <tessera/core/likely.h>
#include <tessera/staking/application_registry.hpp>
#include <tessera/staking/util/staking_error.hpp>

TESSERA_STAKING_NAMESPACE_BEGIN

bool ApplicationRegistry::add(Address const &address, Application &application)
{
    return applications_.try_emplace(address, &application).second;
}

Application *ApplicationRegistry::find(Address const &address) const
{
    auto const it = applications_.find(address);
    return it == applications_.end() ? nullptr : it->second;
}

Result<Application *> ApplicationRegistry::resolve(Address const &address) const
{
    auto *const application = find(address);
    if (TESSERA_UNLIKELY(application == nullptr)) {
        return StakingError::ApplicationUnreachable;
    }
    return application;
}

TESSERA_STAKING_NAMESPACE_END
