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
#include <tessera/sim/in_memory_mirrors.hpp>
#include <tessera/sim/sim_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <algorithm>
#include <span>
#include <vector>

TESSERA_SIM_NAMESPACE_BEGIN

/////////////////////
// Legacy Mirror A //
/////////////////////

void InMemoryLegacyMirrorA::delegate(
    Address const &operator_address, Address const &owner,
    Address const &beneficiary, Address const &authorizer,
    uint256_t const &amount, uint64_t const created_at)
{
    auto &delegation = current().delegations[operator_address];
    delegation.info = staking::DelegationInfo{
        .amount = amount, .created_at = created_at, .undelegated_at = 0};
    delegation.owner = owner;
    delegation.beneficiary = beneficiary;
    delegation.authorizer = authorizer;
}

void InMemoryLegacyMirrorA::authorize_ledger(
    Address const &operator_address, Address const &ledger)
{
    current().delegations[operator_address].authorized_ledgers.push_back(
        ledger);
}

void InMemoryLegacyMirrorA::set_amount(
    Address const &operator_address, uint256_t const &amount)
{
    current().delegations[operator_address].info.amount = amount;
}

void InMemoryLegacyMirrorA::undelegate(
    Address const &operator_address, uint64_t const undelegated_at)
{
    current().delegations[operator_address].info.undelegated_at =
        undelegated_at;
}

std::vector<LegacySeizure> const &InMemoryLegacyMirrorA::seizures() const
{
    return recent().seizures;
}

LegacyDelegation const *
InMemoryLegacyMirrorA::find(Address const &operator_address) const
{
    auto const &delegations = recent().delegations;
    auto const it = delegations.find(operator_address);
    return it == delegations.end() ? nullptr : &it->second;
}

staking::DelegationInfo
InMemoryLegacyMirrorA::get_delegation_info(Address const &operator_address)
{
    auto const *const delegation = find(operator_address);
    return delegation ? delegation->info : staking::DelegationInfo{};
}

bool InMemoryLegacyMirrorA::is_authorized_for_operator(
    Address const &operator_address, Address const &ledger)
{
    auto const *const delegation = find(operator_address);
    return delegation &&
           std::ranges::find(delegation->authorized_ledgers, ledger) !=
               delegation->authorized_ledgers.end();
}

Address InMemoryLegacyMirrorA::owner_of(Address const &operator_address)
{
    auto const *const delegation = find(operator_address);
    return delegation ? delegation->owner : Address{};
}

Address InMemoryLegacyMirrorA::beneficiary_of(Address const &operator_address)
{
    auto const *const delegation = find(operator_address);
    return delegation ? delegation->beneficiary : Address{};
}

Address InMemoryLegacyMirrorA::authorizer_of(Address const &operator_address)
{
    auto const *const delegation = find(operator_address);
    return delegation ? delegation->authorizer : Address{};
}

Result<void> InMemoryLegacyMirrorA::seize(
    uint256_t const &amount, uint256_t const &reward_multiplier,
    Address const &notifier, std::span<Address const> const operators)
{
    for (auto const &operator_address : operators) {
        auto const *const delegation = find(operator_address);
        if (TESSERA_UNLIKELY(delegation == nullptr)) {
            return MirrorError::UnknownStaker;
        }
        if (TESSERA_UNLIKELY(delegation->info.amount < amount)) {
            return MirrorError::InsufficientStake;
        }
    }

    auto &state = current();
    for (auto const &operator_address : operators) {
        state.delegations[operator_address].info.amount -= amount;
    }
    state.seizures.push_back(LegacySeizure{
        .amount = amount,
        .reward_multiplier = reward_multiplier,
        .notifier = notifier,
        .operators = {operators.begin(), operators.end()}});
    return outcome::success();
}

/////////////////////
// Legacy Mirror B //
/////////////////////

void InMemoryLegacyMirrorB::deposit(
    Address const &owner, uint256_t const &amount)
{
    current().escrows[owner].tokens += amount;
}

void InMemoryLegacyMirrorB::set_tokens(
    Address const &owner, uint256_t const &amount)
{
    current().escrows[owner].tokens = amount;
}

bool InMemoryLegacyMirrorB::is_merged(Address const &owner) const
{
    auto const &escrows = recent().escrows;
    auto const it = escrows.find(owner);
    return it != escrows.end() && it->second.operator_address != Address{};
}

std::vector<LegacySlash> const &InMemoryLegacyMirrorB::slashes() const
{
    return recent().slashes;
}

uint256_t InMemoryLegacyMirrorB::get_all_tokens(Address const &owner)
{
    auto const &escrows = recent().escrows;
    auto const it = escrows.find(owner);
    return it == escrows.end() ? uint256_t{0} : it->second.tokens;
}

Result<void> InMemoryLegacyMirrorB::slash_staker(
    Address const &owner, uint256_t const &penalty,
    Address const &investigator, uint256_t const &reward)
{
    if (TESSERA_UNLIKELY(!recent().escrows.contains(owner))) {
        return MirrorError::UnknownStaker;
    }
    if (TESSERA_UNLIKELY(get_all_tokens(owner) < penalty)) {
        return MirrorError::InsufficientStake;
    }

    auto &state = current();
    state.escrows[owner].tokens -= penalty;
    state.slashes.push_back(LegacySlash{
        .owner = owner,
        .penalty = penalty,
        .investigator = investigator,
        .reward = reward});
    return outcome::success();
}

Result<uint256_t> InMemoryLegacyMirrorB::request_merge(
    Address const &staker, Address const &operator_address)
{
    auto const &escrows = recent().escrows;
    auto const it = escrows.find(staker);
    if (TESSERA_UNLIKELY(it == escrows.end())) {
        return MirrorError::UnknownStaker;
    }
    auto const &bound = it->second.operator_address;
    if (TESSERA_UNLIKELY(bound != Address{} && bound != operator_address)) {
        return MirrorError::AlreadyMerged;
    }
    auto &escrow = current().escrows[staker];
    escrow.operator_address = operator_address;
    return escrow.tokens;
}

TESSERA_SIM_NAMESPACE_END
