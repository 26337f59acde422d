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
#include <tessera/staking/external.hpp>
#include <tessera/staking/staking_ledger.hpp>
#include <tessera/staking/util/constants.hpp>
#include <tessera/staking/util/operator_info.hpp>
#include <tessera/staking/util/slashing_event.hpp>
#include <tessera/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <span>

TESSERA_STAKING_NAMESPACE_BEGIN

Result<uint64_t> StakingLedger::enqueue_slashing(
    Address const &application, uint256_t const &amount,
    std::span<Address const> const operators)
{
    auto const &app = state_.recent_application(application);
    if (TESSERA_UNLIKELY(!app.approved)) {
        return StakingError::ApplicationNotApproved;
    }
    if (TESSERA_UNLIKELY(app.disabled)) {
        return StakingError::ApplicationDisabled;
    }
    if (TESSERA_UNLIKELY(amount == 0 || operators.empty())) {
        return StakingError::InvalidInput;
    }

    for (auto const &operator_address : operators) {
        auto const authorized = state_.recent_operator(operator_address)
                                    .authorization(application)
                                    .authorized;
        if (TESSERA_UNLIKELY(authorized < amount)) {
            return StakingError::AmountExceedsAuthorized;
        }
        auto const index = state_.push_slashing_event(SlashingEvent{
            .operator_address = operator_address,
            .amount = amount,
            .application = application});
        state_.store_event(SlashingEventQueued{
            .index = index,
            .operator_address = operator_address,
            .application = application,
            .amount = amount});
    }
    return operators.size();
}

Result<void> StakingLedger::reward_notifier(
    Address const &notifier, uint256_t const &reward_multiplier,
    uint64_t const count)
{
    auto const &globals = state_.globals();
    BOOST_OUTCOME_TRY(
        auto const base,
        checked_mul(uint256_t{count}, globals.params.notification_reward));
    BOOST_OUTCOME_TRY(auto reward, checked_percent(base, reward_multiplier));
    reward = std::min(reward, globals.notifiers_treasury);

    state_.store_event(
        NotifierRewarded{.notifier = notifier, .amount = reward});
    if (reward == 0) {
        return outcome::success();
    }
    state_.current_globals().notifiers_treasury -= reward;
    BOOST_OUTCOME_TRY(token_.transfer(ledger_, notifier, reward));
    return outcome::success();
}

Result<void> StakingLedger::slash(
    Address const &sender, uint256_t const &amount,
    std::span<Address const> const operators)
{
    return transact("slash", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(enqueue_slashing(sender, amount, operators));
        return outcome::success();
    });
}

Result<void> StakingLedger::seize(
    Address const &sender, uint256_t const &amount,
    uint256_t const &reward_multiplier, Address const &notifier,
    std::span<Address const> const operators)
{
    return transact("seize", [&]() -> Result<void> {
        if (TESSERA_UNLIKELY(reward_multiplier > MAX_REWARD_MULTIPLIER)) {
            return StakingError::InvalidInput;
        }
        BOOST_OUTCOME_TRY(
            auto const count, enqueue_slashing(sender, amount, operators));
        if (notifier != Address{}) {
            BOOST_OUTCOME_TRY(
                reward_notifier(notifier, reward_multiplier, count));
        }
        return outcome::success();
    });
}

Result<uint256_t> StakingLedger::seize_legacy_a(
    OperatorInfo &info, Address const &operator_address,
    uint256_t const &amount, uint256_t const &reward_multiplier,
    Address const &notifier)
{
    if (info.legacy_a_stake == 0) {
        return amount;
    }
    auto penalty = std::min(amount, info.legacy_a_stake);
    auto const legacy = legacy_a_oracle_.from_native(penalty);
    if (legacy.amount == 0) {
        return amount;
    }
    penalty -= legacy.remainder;
    info.legacy_a_stake -= penalty;

    Address const operators[] = {operator_address};
    BOOST_OUTCOME_TRY(
        legacy_a_.seize(legacy.amount, reward_multiplier, notifier, operators));
    return amount - penalty;
}

Result<uint256_t> StakingLedger::seize_legacy_b(
    OperatorInfo &info, uint256_t const &amount,
    uint256_t const &reward_multiplier, Address const &notifier)
{
    if (info.legacy_b_stake == 0) {
        return amount;
    }
    auto penalty = std::min(amount, info.legacy_b_stake);
    auto const legacy = legacy_b_oracle_.from_native(penalty);
    if (legacy.amount == 0) {
        return amount;
    }
    penalty -= legacy.remainder;
    info.legacy_b_stake -= penalty;

    BOOST_OUTCOME_TRY(
        auto const base,
        checked_percent(legacy.amount, SLASHING_REWARD_PERCENT));
    BOOST_OUTCOME_TRY(
        auto const reward, checked_percent(base, reward_multiplier));
    BOOST_OUTCOME_TRY(
        legacy_b_.slash_staker(info.owner, legacy.amount, notifier, reward));
    return amount - penalty;
}

Result<uint256_t> StakingLedger::process_slashing_event(
    Address const &processor, SlashingEvent const &event)
{
    auto const &operator_address = event.operator_address;
    // queued events always target an operator with authorization
    TESSERA_ASSERT(state_.recent_operator(operator_address).exists());
    auto &info = state_.current_operator(operator_address);

    auto remaining = event.amount;

    auto const burned = std::min(remaining, info.native_stake);
    info.native_stake -= burned;
    remaining -= burned;

    if (remaining > 0 && info.legacy_a_stake > 0) {
        // seize against the live delegation, not the cached one
        auto const delegation =
            legacy_a_.get_delegation_info(operator_address);
        info.legacy_a_stake =
            legacy_a_oracle_.to_native(delegation.amount).amount;
        BOOST_OUTCOME_TRY(
            auto const uncovered,
            seize_legacy_a(
                info,
                operator_address,
                remaining,
                SLASHING_REWARD_MULTIPLIER,
                processor));
        remaining = uncovered;
    }

    if (remaining > 0 && info.legacy_b_stake > 0) {
        BOOST_OUTCOME_TRY(
            auto const uncovered,
            seize_legacy_b(
                info, remaining, SLASHING_REWARD_MULTIPLIER, processor));
        remaining = uncovered;
    }

    state_.store_event(TokensSeized{
        .operator_address = operator_address,
        .amount = event.amount - remaining,
        .discrepancy = false});

    BOOST_OUTCOME_TRY(correct_authorizations(info, operator_address));
    return burned;
}

Result<uint64_t>
StakingLedger::process_slashing(Address const &sender, uint64_t const count)
{
    return transact("process_slashing", [&]() -> Result<uint64_t> {
        auto const index = state_.globals().slashing_queue_index;
        auto const length = state_.slashing_queue_length();
        if (TESSERA_UNLIKELY(count == 0 || index >= length)) {
            return StakingError::NothingToProcess;
        }

        auto const end = index + std::min(count, length - index);
        uint256_t burned{0};
        for (auto i = index; i < end; ++i) {
            BOOST_OUTCOME_TRY(
                auto const amount,
                process_slashing_event(sender, state_.slashing_event(i)));
            BOOST_OUTCOME_TRY(auto const total, checked_add(burned, amount));
            burned = total;
        }

        BOOST_OUTCOME_TRY(
            auto const reward,
            checked_percent(burned, SLASHING_REWARD_PERCENT));
        auto &globals = state_.current_globals();
        TESSERA_ASSERT(end > globals.slashing_queue_index);
        globals.slashing_queue_index = end;
        BOOST_OUTCOME_TRY(
            auto const treasury,
            checked_add(globals.notifiers_treasury, burned - reward));
        globals.notifiers_treasury = treasury;

        auto const processed = end - index;
        state_.store_event(SlashingProcessed{
            .caller = sender, .count = processed, .reward = reward});

        if (reward > 0) {
            BOOST_OUTCOME_TRY(token_.transfer(ledger_, sender, reward));
        }
        return processed;
    });
}

Result<void> StakingLedger::push_notification_reward(
    Address const &sender, uint256_t const &amount)
{
    return transact("push_notification_reward", [&]() -> Result<void> {
        if (TESSERA_UNLIKELY(amount == 0)) {
            return StakingError::InvalidInput;
        }
        auto &globals = state_.current_globals();
        BOOST_OUTCOME_TRY(
            auto const treasury,
            checked_add(globals.notifiers_treasury, amount));
        globals.notifiers_treasury = treasury;
        state_.store_event(NotificationRewardPushed{.reward = amount});

        BOOST_OUTCOME_TRY(
            token_.transfer_from(ledger_, sender, ledger_, amount));
        return outcome::success();
    });
}

Result<void> StakingLedger::withdraw_notification_reward(
    Address const &sender, Address const &recipient, uint256_t const &amount)
{
    return transact("withdraw_notification_reward", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_governance(sender));
        auto &globals = state_.current_globals();
        if (TESSERA_UNLIKELY(amount > globals.notifiers_treasury)) {
            return StakingError::InsufficientTreasury;
        }
        globals.notifiers_treasury -= amount;
        state_.store_event(NotificationRewardWithdrawn{
            .recipient = recipient, .amount = amount});
        LOG_INFO(
            "StakingLedger: {} withdrawn from the notifiers treasury to {}",
            amount,
            recipient);

        BOOST_OUTCOME_TRY(token_.transfer(ledger_, recipient, amount));
        return outcome::success();
    });
}

TESSERA_STAKING_NAMESPACE_END
