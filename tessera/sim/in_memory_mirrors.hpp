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
#include <tessera/core/result.hpp>
#include <tessera/sim/config.hpp>
#include <tessera/sim/journaled.hpp>
#include <tessera/staking/external.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <span>
#include <vector>

TESSERA_SIM_NAMESPACE_BEGIN

struct LegacyDelegation
{
    staking::DelegationInfo info{};
    Address owner{};
    Address beneficiary{};
    Address authorizer{};
    // ledgers allowed to mirror this delegation
    std::vector<Address> authorized_ledgers{};
};

struct LegacySeizure
{
    uint256_t amount{0};
    uint256_t reward_multiplier{0};
    Address notifier{};
    std::vector<Address> operators{};
};

struct LegacyMirrorAState
{
    ankerl::unordered_dense::map<Address, LegacyDelegation> delegations{};
    std::vector<LegacySeizure> seizures{};
};

class InMemoryLegacyMirrorA final
    : public staking::LegacyMirrorA
    , public Journaled<LegacyMirrorAState>
{
public:
    void delegate(
        Address const &operator_address, Address const &owner,
        Address const &beneficiary, Address const &authorizer,
        uint256_t const &amount, uint64_t created_at);
    void
    authorize_ledger(Address const &operator_address, Address const &ledger);
    void set_amount(Address const &operator_address, uint256_t const &amount);
    void undelegate(Address const &operator_address, uint64_t undelegated_at);

    std::vector<LegacySeizure> const &seizures() const;

    staking::DelegationInfo
    get_delegation_info(Address const &operator_address) override;
    bool is_authorized_for_operator(
        Address const &operator_address, Address const &ledger) override;
    Address owner_of(Address const &operator_address) override;
    Address beneficiary_of(Address const &operator_address) override;
    Address authorizer_of(Address const &operator_address) override;

    Result<void> seize(
        uint256_t const &amount, uint256_t const &reward_multiplier,
        Address const &notifier,
        std::span<Address const> operators) override;

private:
    LegacyDelegation const *find(Address const &operator_address) const;
};

struct LegacyEscrow
{
    uint256_t tokens{0};
    // null until merged
    Address operator_address{};
};

struct LegacySlash
{
    Address owner{};
    uint256_t penalty{0};
    Address investigator{};
    uint256_t reward{0};
};

struct LegacyMirrorBState
{
    ankerl::unordered_dense::map<Address, LegacyEscrow> escrows{};
    std::vector<LegacySlash> slashes{};
};

class InMemoryLegacyMirrorB final
    : public staking::LegacyMirrorB
    , public Journaled<LegacyMirrorBState>
{
public:
    void deposit(Address const &owner, uint256_t const &amount);
    void set_tokens(Address const &owner, uint256_t const &amount);

    bool is_merged(Address const &owner) const;
    std::vector<LegacySlash> const &slashes() const;

    uint256_t get_all_tokens(Address const &owner) override;
    Result<void> slash_staker(
        Address const &owner, uint256_t const &penalty,
        Address const &investigator, uint256_t const &reward) override;
    Result<uint256_t> request_merge(
        Address const &staker, Address const &operator_address) override;
};

TESSERA_SIM_NAMESPACE_END
