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
#include <tessera/core/int.hpp>
#include <tessera/staking/config.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <vector>

TESSERA_STAKING_NAMESPACE_BEGIN

enum class StakeType : uint8_t
{
    Native = 0,
    LegacyA = 1,
    LegacyB = 2,
};

struct AppAuthorization
{
    uint256_t authorized{0};
    // pending decrease, at most one request outstanding
    uint256_t deauthorizing{0};
};

struct Stakes
{
    uint256_t native{0};
    uint256_t legacy_a{0};
    uint256_t legacy_b{0};
};

struct Roles
{
    Address owner{};
    Address beneficiary{};
    Address authorizer{};
};

// Everything the ledger knows about one operator. Legacy stakes are kept as
// their native-denomination equivalent.
struct OperatorInfo
{
    Address owner{};
    Address beneficiary{};
    Address authorizer{};

    uint256_t native_stake{0};
    uint256_t legacy_a_stake{0};
    uint256_t legacy_b_stake{0};

    uint64_t start_staking_timestamp{0};

    ankerl::unordered_dense::map<Address, AppAuthorization> authorizations{};

    // applications with non-zero authorization, unordered
    std::vector<Address> authorized_applications{};

    bool exists() const noexcept
    {
        return owner != Address{};
    }

    uint256_t total_stake() const noexcept
    {
        return native_stake + legacy_a_stake + legacy_b_stake;
    }

    AppAuthorization authorization(Address const &application) const
    {
        auto const it = authorizations.find(application);
        return it == authorizations.end() ? AppAuthorization{} : it->second;
    }

    // Forgets the application entirely. The list is reordered, the removed
    // slot takes the last entry.
    void remove_authorized_application(Address const &application)
    {
        authorizations.erase(application);
        for (size_t i = 0; i < authorized_applications.size(); ++i) {
            if (authorized_applications[i] == application) {
                authorized_applications[i] = authorized_applications.back();
                authorized_applications.pop_back();
                return;
            }
        }
    }
};

TESSERA_STAKING_NAMESPACE_END
