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
#include <tessera/core/assert.h>
#include <tessera/core/checked_math.hpp>
#include <tessera/core/fmt/address_fmt.hpp>
#include <tessera/core/fmt/int_fmt.hpp>
#include <tessera/core/int.hpp>
#include <tessera/core/likely.h>
#include <tessera/staking/events.hpp>
#include <tessera/staking/staking_ledger.hpp>
#include <tessera/staking/util/constants.hpp>
#include <tessera/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>

TESSERA_STAKING_NAMESPACE_BEGIN

StakingLedger::StakingLedger(
    LedgerConfig const &config, Collaborators const &collaborators)
    : ledger_{config.ledger}
    , state_{LedgerGlobals{
          .governance = config.governance,
          .params = config.params,
          .notifiers_treasury = 0,
          .slashing_queue_index = 0}}
    , token_{collaborators.token}
    , legacy_a_{collaborators.legacy_a}
    , legacy_b_{collaborators.legacy_b}
    , legacy_a_oracle_{collaborators.legacy_a_oracle}
    , legacy_b_oracle_{collaborators.legacy_b_oracle}
    , applications_{collaborators.applications}
{
    TESSERA_ASSERT(
        config.params.stake_discrepancy_reward_multiplier <=
        MAX_REWARD_MULTIPLIER);
}

void StakingLedger::add_transactional(Transactional &transactional)
{
    TESSERA_ASSERT(!state_.version(), "cannot register inside a unit");
    transactionals_.push_back(&transactional);
}

void StakingLedger::set_timestamp(uint64_t const timestamp)
{
    timestamp_ = timestamp;
}

uint64_t StakingLedger::timestamp() const
{
    return timestamp_;
}

Address const &StakingLedger::ledger_address() const
{
    return ledger_;
}

void StakingLedger::push()
{
    state_.push();
    for (auto *const t : transactionals_) {
        t->push();
    }
}

void StakingLedger::pop_accept()
{
    state_.pop_accept();
    for (auto *const t : transactionals_) {
        t->pop_accept();
    }
}

void StakingLedger::pop_reject()
{
    state_.pop_reject();
    for (auto *const t : transactionals_) {
        t->pop_reject();
    }
}

Result<void> StakingLedger::only_governance(Address const &sender) const
{
    if (TESSERA_UNLIKELY(sender != state_.globals().governance)) {
        return StakingError::NotGovernance;
    }
    return outcome::success();
}

Result<OperatorInfo *> StakingLedger::only_owner_or_operator(
    Address const &sender, Address const &operator_address)
{
    auto const &info = state_.recent_operator(operator_address);
    if (TESSERA_UNLIKELY(!info.exists())) {
        return StakingError::UnknownOperator;
    }
    if (TESSERA_UNLIKELY(
            sender != info.owner && sender != operator_address)) {
        return StakingError::NotOwnerOrOperator;
    }
    return &state_.current_operator(operator_address);
}

Result<OperatorInfo *> StakingLedger::only_authorizer(
    Address const &sender, Address const &operator_address)
{
    auto const &info = state_.recent_operator(operator_address);
    if (TESSERA_UNLIKELY(!info.exists())) {
        return StakingError::UnknownOperator;
    }
    if (TESSERA_UNLIKELY(sender != info.authorizer)) {
        return StakingError::NotAuthorizer;
    }
    return &state_.current_operator(operator_address);
}

////////////////
// Governance //
////////////////

Result<void> StakingLedger::set_minimum_stake_amount(
    Address const &sender, uint256_t const &amount)
{
    return transact("set_minimum_stake_amount", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_governance(sender));
        state_.current_globals().params.min_stake_amount = amount;
        state_.store_event(MinimumStakeAmountSet{.amount = amount});
        LOG_INFO("StakingLedger: minimum stake amount set to {}", amount);
        return outcome::success();
    });
}

Result<void> StakingLedger::approve_application(
    Address const &sender, Address const &application)
{
    return transact("approve_application", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_governance(sender));
        if (TESSERA_UNLIKELY(application == Address{})) {
            return StakingError::InvalidInput;
        }
        auto const &recent = state_.recent_application(application);
        if (TESSERA_UNLIKELY(recent.active())) {
            return StakingError::ApplicationAlreadyApproved;
        }
        auto &info = state_.current_application(application);
        info.approved = true;
        info.disabled = false;
        state_.store_event(ApplicationApproved{.application = application});
        LOG_INFO("StakingLedger: application {} approved", application);
        return outcome::success();
    });
}

Result<void> StakingLedger::set_panic_button(
    Address const &sender, Address const &application,
    Address const &panic_button)
{
    return transact("set_panic_button", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_governance(sender));
        auto const &recent = state_.recent_application(application);
        if (TESSERA_UNLIKELY(!recent.approved)) {
            return StakingError::ApplicationNotApproved;
        }
        state_.current_application(application).panic_button = panic_button;
        state_.store_event(PanicButtonSet{
            .application = application, .panic_button = panic_button});
        LOG_INFO(
            "StakingLedger: panic button of {} set to {}",
            application,
            panic_button);
        return outcome::success();
    });
}

Result<void> StakingLedger::set_authorization_ceiling(
    Address const &sender, uint64_t const ceiling)
{
    return transact("set_authorization_ceiling", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_governance(sender));
        state_.current_globals().params.authorization_ceiling = ceiling;
        state_.store_event(AuthorizationCeilingSet{.ceiling = ceiling});
        LOG_INFO("StakingLedger: authorization ceiling set to {}", ceiling);
        return outcome::success();
    });
}

Result<void> StakingLedger::set_stake_discrepancy_penalty(
    Address const &sender, uint256_t const &penalty,
    uint256_t const &reward_multiplier)
{
    return transact("set_stake_discrepancy_penalty", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_governance(sender));
        if (TESSERA_UNLIKELY(reward_multiplier > MAX_REWARD_MULTIPLIER)) {
            return StakingError::InvalidInput;
        }
        auto &params = state_.current_globals().params;
        params.stake_discrepancy_penalty = penalty;
        params.stake_discrepancy_reward_multiplier = reward_multiplier;
        state_.store_event(StakeDiscrepancyPenaltySet{
            .penalty = penalty, .reward_multiplier = reward_multiplier});
        LOG_INFO(
            "StakingLedger: discrepancy penalty set to {} with reward "
            "multiplier {}",
            penalty,
            reward_multiplier);
        return outcome::success();
    });
}

Result<void> StakingLedger::set_notification_reward(
    Address const &sender, uint256_t const &reward)
{
    return transact("set_notification_reward", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_governance(sender));
        state_.current_globals().params.notification_reward = reward;
        state_.store_event(NotificationRewardSet{.reward = reward});
        LOG_INFO("StakingLedger: notification reward set to {}", reward);
        return outcome::success();
    });
}

Result<void> StakingLedger::transfer_governance(
    Address const &sender, Address const &new_governance)
{
    return transact("transfer_governance", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_governance(sender));
        if (TESSERA_UNLIKELY(new_governance == Address{})) {
            return StakingError::InvalidInput;
        }
        auto &globals = state_.current_globals();
        auto const old_governance = globals.governance;
        globals.governance = new_governance;
        state_.store_event(GovernanceTransferred{
            .old_governance = old_governance,
            .new_governance = new_governance});
        LOG_INFO(
            "StakingLedger: governance transferred from {} to {}",
            old_governance,
            new_governance);
        return outcome::success();
    });
}

Result<void> StakingLedger::disable_application(
    Address const &sender, Address const &application)
{
    return transact("disable_application", [&]() -> Result<void> {
        auto const &recent = state_.recent_application(application);
        if (TESSERA_UNLIKELY(!recent.approved)) {
            return StakingError::ApplicationNotApproved;
        }
        if (TESSERA_UNLIKELY(
                recent.panic_button == Address{} ||
                sender != recent.panic_button)) {
            return StakingError::NotPanicButton;
        }
        if (TESSERA_UNLIKELY(recent.disabled)) {
            return StakingError::ApplicationDisabled;
        }
        state_.current_application(application).disabled = true;
        state_.store_event(ApplicationDisabled{.application = application});
        LOG_WARNING("StakingLedger: application {} disabled", application);
        return outcome::success();
    });
}

/////////////
// Queries //
/////////////

Stakes StakingLedger::stakes(Address const &operator_address) const
{
    auto const &info = state_.recent_operator(operator_address);
    return Stakes{
        .native = info.native_stake,
        .legacy_a = info.legacy_a_stake,
        .legacy_b = info.legacy_b_stake};
}

Roles StakingLedger::roles_of(Address const &operator_address) const
{
    auto const &info = state_.recent_operator(operator_address);
    return Roles{
        .owner = info.owner,
        .beneficiary = info.beneficiary,
        .authorizer = info.authorizer};
}

uint64_t StakingLedger::get_start_staking_timestamp(
    Address const &operator_address) const
{
    return state_.recent_operator(operator_address).start_staking_timestamp;
}

AppAuthorization StakingLedger::authorization(
    Address const &operator_address, Address const &application) const
{
    return state_.recent_operator(operator_address).authorization(application);
}

uint256_t StakingLedger::authorized_stake(
    Address const &operator_address, Address const &application) const
{
    return authorization(operator_address, application).authorized;
}

uint256_t StakingLedger::get_available_to_authorize(
    Address const &operator_address, Address const &application) const
{
    auto const &info = state_.recent_operator(operator_address);
    return saturating_sub(
        info.total_stake(), info.authorization(application).authorized);
}

uint256_t
StakingLedger::get_max_authorization(Address const &operator_address) const
{
    auto const &info = state_.recent_operator(operator_address);
    uint256_t max_authorization{0};
    for (auto const &application : info.authorized_applications) {
        max_authorization = std::max(
            max_authorization, info.authorization(application).authorized);
    }
    return max_authorization;
}

uint256_t StakingLedger::get_min_staked(
    Address const &operator_address, StakeType const stake_type) const
{
    auto const &info = state_.recent_operator(operator_address);
    uint256_t min_staked = get_max_authorization(operator_address);
    if (min_staked == 0) {
        return 0;
    }
    if (stake_type != StakeType::Native) {
        min_staked = saturating_sub(min_staked, info.native_stake);
    }
    if (stake_type != StakeType::LegacyA) {
        min_staked = saturating_sub(min_staked, info.legacy_a_stake);
    }
    if (stake_type != StakeType::LegacyB) {
        min_staked = saturating_sub(min_staked, info.legacy_b_stake);
    }
    return min_staked;
}

std::vector<Address>
StakingLedger::authorized_applications(Address const &operator_address) const
{
    return state_.recent_operator(operator_address).authorized_applications;
}

uint64_t
StakingLedger::get_applications_length(Address const &operator_address) const
{
    return state_.recent_operator(operator_address)
        .authorized_applications.size();
}

ApplicationInfo
StakingLedger::application_info(Address const &application) const
{
    return state_.recent_application(application);
}

uint64_t StakingLedger::slashing_queue_length() const
{
    return state_.slashing_queue_length();
}

uint64_t StakingLedger::slashing_queue_index() const
{
    return state_.globals().slashing_queue_index;
}

SlashingEvent const &StakingLedger::slashing_event(uint64_t const index) const
{
    return state_.slashing_event(index);
}

uint256_t StakingLedger::notifiers_treasury() const
{
    return state_.globals().notifiers_treasury;
}

StakingParams const &StakingLedger::params() const
{
    return state_.globals().params;
}

Address const &StakingLedger::governance() const
{
    return state_.globals().governance;
}

std::span<StakingEvent const> StakingLedger::events() const
{
    return state_.events();
}

TESSERA_STAKING_NAMESPACE_END
