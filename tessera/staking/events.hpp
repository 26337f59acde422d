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
#include <tessera/staking/util/operator_info.hpp>

#include <cstdint>
#include <string_view>
#include <variant>

TESSERA_STAKING_NAMESPACE_BEGIN

////////////////////////////
// Operator Ledger Events //
////////////////////////////

struct Staked
{
    StakeType stake_type;
    Address owner;
    Address operator_address;
    Address beneficiary;
    Address authorizer;
    uint256_t amount;
};

struct ToppedUp
{
    StakeType stake_type;
    Address operator_address;
    uint256_t amount;
};

struct Unstaked
{
    StakeType stake_type;
    Address operator_address;
    uint256_t amount;
};

//////////////////////////
// Authorization Events //
//////////////////////////

struct AuthorizationIncreased
{
    Address operator_address;
    Address application;
    uint256_t from_amount;
    uint256_t to_amount;
};

struct AuthorizationDecreaseRequested
{
    Address operator_address;
    Address application;
    uint256_t from_amount;
    uint256_t to_amount;
};

struct AuthorizationDecreaseApproved
{
    Address operator_address;
    Address application;
    uint256_t from_amount;
    uint256_t to_amount;
};

// emitted by authorization correction and by a forced decrease
struct AuthorizationInvoluntaryDecreased
{
    Address operator_address;
    Address application;
    uint256_t from_amount;
    uint256_t to_amount;
};

/////////////////////
// Slashing Events //
/////////////////////

struct SlashingEventQueued
{
    uint64_t index;
    Address operator_address;
    Address application;
    uint256_t amount;
};

struct TokensSeized
{
    Address operator_address;
    uint256_t amount;
    bool discrepancy;
};

struct SlashingProcessed
{
    Address caller;
    uint64_t count;
    uint256_t reward;
};

struct NotifierRewarded
{
    Address notifier;
    uint256_t amount;
};

///////////////////////
// Governance Events //
///////////////////////

struct MinimumStakeAmountSet
{
    uint256_t amount;
};

struct ApplicationApproved
{
    Address application;
};

struct ApplicationDisabled
{
    Address application;
};

struct PanicButtonSet
{
    Address application;
    Address panic_button;
};

struct AuthorizationCeilingSet
{
    uint64_t ceiling;
};

struct StakeDiscrepancyPenaltySet
{
    uint256_t penalty;
    uint256_t reward_multiplier;
};

struct NotificationRewardSet
{
    uint256_t reward;
};

struct NotificationRewardPushed
{
    uint256_t reward;
};

struct NotificationRewardWithdrawn
{
    Address recipient;
    uint256_t amount;
};

struct GovernanceTransferred
{
    Address old_governance;
    Address new_governance;
};

using StakingEvent = std::variant<
    Staked, ToppedUp, Unstaked, AuthorizationIncreased,
    AuthorizationDecreaseRequested, AuthorizationDecreaseApproved,
    AuthorizationInvoluntaryDecreased, SlashingEventQueued, TokensSeized,
    SlashingProcessed, NotifierRewarded, MinimumStakeAmountSet,
    ApplicationApproved, ApplicationDisabled, PanicButtonSet,
    AuthorizationCeilingSet, StakeDiscrepancyPenaltySet,
    NotificationRewardSet, NotificationRewardPushed,
    NotificationRewardWithdrawn, GovernanceTransferred>;

std::string_view event_name(StakingEvent const &);

TESSERA_STAKING_NAMESPACE_END
