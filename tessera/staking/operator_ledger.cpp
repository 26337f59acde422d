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
#include <tessera/core/checked_math.hpp>
#include <tessera/core/int.hpp>
#include <tessera/core/likely.h>
#include <tessera/staking/events.hpp>
#include <tessera/staking/external.hpp>
#include <tessera/staking/staking_ledger.hpp>
#include <tessera/staking/util/constants.hpp>
#include <tessera/staking/util/operator_info.hpp>
#include <tessera/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <initializer_list>
#include <utility>

TESSERA_STAKING_NAMESPACE_BEGIN

Result<void>
StakingLedger::check_unclaimed(Address const &operator_address)
{
    if (TESSERA_UNLIKELY(operator_address == Address{})) {
        return StakingError::InvalidInput;
    }
    if (TESSERA_UNLIKELY(state_.recent_operator(operator_address).exists())) {
        return StakingError::OperatorAlreadyInUse;
    }
    return outcome::success();
}

uint256_t
StakingLedger::legacy_a_amount_in_native(Address const &operator_address)
{
    auto const delegation = legacy_a_.get_delegation_info(operator_address);
    if (delegation.created_at == 0 || delegation.undelegated_at != 0) {
        return 0;
    }
    return legacy_a_oracle_.to_native(delegation.amount).amount;
}

Result<void> StakingLedger::stake(
    Address const &sender, Address const &operator_address,
    Address const &beneficiary, Address const &authorizer,
    uint256_t const &amount)
{
    return transact("stake", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(check_unclaimed(operator_address));
        // the identity may not be delegated in the predecessor system either
        if (TESSERA_UNLIKELY(
                legacy_a_.get_delegation_info(operator_address).created_at !=
                0)) {
            return StakingError::OperatorAlreadyInUse;
        }
        if (TESSERA_UNLIKELY(
                amount <= state_.globals().params.min_stake_amount)) {
            return StakingError::AmountBelowMinimum;
        }

        auto &info = state_.current_operator(operator_address);
        info.owner = sender;
        info.beneficiary = beneficiary == Address{} ? sender : beneficiary;
        info.authorizer = authorizer == Address{} ? sender : authorizer;
        info.native_stake = amount;
        info.start_staking_timestamp = timestamp_;

        state_.store_event(Staked{
            .stake_type = StakeType::Native,
            .owner = info.owner,
            .operator_address = operator_address,
            .beneficiary = info.beneficiary,
            .authorizer = info.authorizer,
            .amount = amount});

        BOOST_OUTCOME_TRY(
            token_.transfer_from(ledger_, sender, ledger_, amount));
        return outcome::success();
    });
}

Result<void> StakingLedger::stake_legacy_a(
    Address const &, Address const &operator_address)
{
    return transact("stake_legacy_a", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(check_unclaimed(operator_address));
        if (TESSERA_UNLIKELY(!legacy_a_.is_authorized_for_operator(
                operator_address, ledger_))) {
            return StakingError::LegacyNotAuthorized;
        }
        auto const amount = legacy_a_amount_in_native(operator_address);
        if (TESSERA_UNLIKELY(amount == 0)) {
            return StakingError::NothingToSync;
        }

        auto &info = state_.current_operator(operator_address);
        info.owner = legacy_a_.owner_of(operator_address);
        info.beneficiary = legacy_a_.beneficiary_of(operator_address);
        info.authorizer = legacy_a_.authorizer_of(operator_address);
        // a mirror reporting no owner would leave the operator unclaimed
        if (TESSERA_UNLIKELY(!info.exists())) {
            return StakingError::NothingToSync;
        }
        info.legacy_a_stake = amount;

        state_.store_event(Staked{
            .stake_type = StakeType::LegacyA,
            .owner = info.owner,
            .operator_address = operator_address,
            .beneficiary = info.beneficiary,
            .authorizer = info.authorizer,
            .amount = amount});
        return outcome::success();
    });
}

Result<void> StakingLedger::stake_legacy_b(
    Address const &sender, Address const &operator_address,
    Address const &beneficiary, Address const &authorizer)
{
    return transact("stake_legacy_b", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(check_unclaimed(operator_address));
        if (TESSERA_UNLIKELY(
                legacy_a_.get_delegation_info(operator_address).created_at !=
                0)) {
            return StakingError::OperatorAlreadyInUse;
        }
        BOOST_OUTCOME_TRY(
            auto const legacy_amount,
            legacy_b_.request_merge(sender, operator_address));
        auto const amount = legacy_b_oracle_.to_native(legacy_amount).amount;
        if (TESSERA_UNLIKELY(amount == 0)) {
            return StakingError::NothingToSync;
        }

        auto &info = state_.current_operator(operator_address);
        info.owner = sender;
        info.beneficiary = beneficiary == Address{} ? sender : beneficiary;
        info.authorizer = authorizer == Address{} ? sender : authorizer;
        info.legacy_b_stake = amount;

        state_.store_event(Staked{
            .stake_type = StakeType::LegacyB,
            .owner = info.owner,
            .operator_address = operator_address,
            .beneficiary = info.beneficiary,
            .authorizer = info.authorizer,
            .amount = amount});
        return outcome::success();
    });
}

Result<void> StakingLedger::top_up(
    Address const &sender, Address const &operator_address,
    uint256_t const &amount)
{
    return transact("top_up", [&]() -> Result<void> {
        if (TESSERA_UNLIKELY(amount == 0)) {
            return StakingError::InvalidInput;
        }
        if (TESSERA_UNLIKELY(
                !state_.recent_operator(operator_address).exists())) {
            return StakingError::UnknownOperator;
        }

        auto &info = state_.current_operator(operator_address);
        BOOST_OUTCOME_TRY(
            auto const native_stake, checked_add(info.native_stake, amount));
        info.native_stake = native_stake;
        state_.store_event(ToppedUp{
            .stake_type = StakeType::Native,
            .operator_address = operator_address,
            .amount = amount});

        BOOST_OUTCOME_TRY(
            token_.transfer_from(ledger_, sender, ledger_, amount));
        return outcome::success();
    });
}

Result<void> StakingLedger::top_up_legacy_a(
    Address const &sender, Address const &operator_address)
{
    return transact("top_up_legacy_a", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto *const info, only_owner_or_operator(sender, operator_address));
        if (TESSERA_UNLIKELY(!legacy_a_.is_authorized_for_operator(
                operator_address, ledger_))) {
            return StakingError::LegacyNotAuthorized;
        }
        auto const amount = legacy_a_amount_in_native(operator_address);
        if (TESSERA_UNLIKELY(amount <= info->legacy_a_stake)) {
            return StakingError::NothingToTopUp;
        }

        auto const topped_up = amount - info->legacy_a_stake;
        info->legacy_a_stake = amount;
        state_.store_event(ToppedUp{
            .stake_type = StakeType::LegacyA,
            .operator_address = operator_address,
            .amount = topped_up});
        return outcome::success();
    });
}

Result<void> StakingLedger::top_up_legacy_b(
    Address const &sender, Address const &operator_address)
{
    return transact("top_up_legacy_b", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto *const info, only_owner_or_operator(sender, operator_address));
        BOOST_OUTCOME_TRY(
            auto const legacy_amount,
            legacy_b_.request_merge(info->owner, operator_address));
        auto const amount = legacy_b_oracle_.to_native(legacy_amount).amount;
        if (TESSERA_UNLIKELY(amount <= info->legacy_b_stake)) {
            return StakingError::NothingToTopUp;
        }

        auto const topped_up = amount - info->legacy_b_stake;
        info->legacy_b_stake = amount;
        state_.store_event(ToppedUp{
            .stake_type = StakeType::LegacyB,
            .operator_address = operator_address,
            .amount = topped_up});
        return outcome::success();
    });
}

Result<void> StakingLedger::unstake_native(
    Address const &sender, Address const &operator_address,
    uint256_t const &amount)
{
    return transact("unstake_native", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto *const info, only_owner_or_operator(sender, operator_address));
        auto const min_staked =
            get_min_staked(operator_address, StakeType::Native);
        if (TESSERA_UNLIKELY(
                amount == 0 || amount > info->native_stake ||
                info->native_stake - amount < min_staked)) {
            return StakingError::InsufficientStake;
        }
        auto const remaining = info->native_stake - amount;
        if (TESSERA_UNLIKELY(
                remaining < state_.globals().params.min_stake_amount &&
                info->start_staking_timestamp + MIN_STAKE_TIME > timestamp_)) {
            return StakingError::TooEarlyToUnstake;
        }

        info->native_stake = remaining;
        state_.store_event(Unstaked{
            .stake_type = StakeType::Native,
            .operator_address = operator_address,
            .amount = amount});

        BOOST_OUTCOME_TRY(token_.transfer(ledger_, info->owner, amount));
        return outcome::success();
    });
}

Result<void> StakingLedger::unstake_legacy_a(
    Address const &sender, Address const &operator_address)
{
    return transact("unstake_legacy_a", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto *const info, only_owner_or_operator(sender, operator_address));
        if (TESSERA_UNLIKELY(info->legacy_a_stake == 0)) {
            return StakingError::NothingToUnstake;
        }
        if (TESSERA_UNLIKELY(
                get_min_staked(operator_address, StakeType::LegacyA) != 0)) {
            return StakingError::StillAuthorized;
        }

        auto const amount = info->legacy_a_stake;
        info->legacy_a_stake = 0;
        state_.store_event(Unstaked{
            .stake_type = StakeType::LegacyA,
            .operator_address = operator_address,
            .amount = amount});
        return outcome::success();
    });
}

Result<void> StakingLedger::unstake_legacy_b(
    Address const &sender, Address const &operator_address,
    uint256_t const &amount)
{
    return transact("unstake_legacy_b", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto *const info, only_owner_or_operator(sender, operator_address));
        auto const min_staked =
            get_min_staked(operator_address, StakeType::LegacyB);
        if (TESSERA_UNLIKELY(
                amount == 0 || amount > info->legacy_b_stake ||
                info->legacy_b_stake - amount < min_staked)) {
            return StakingError::InsufficientStake;
        }
        // only whole legacy units leave the ledger
        auto const remainder = legacy_b_oracle_.from_native(amount).remainder;
        auto const unstaked = amount - remainder;
        if (TESSERA_UNLIKELY(unstaked == 0)) {
            return StakingError::NothingToUnstake;
        }

        info->legacy_b_stake -= unstaked;
        state_.store_event(Unstaked{
            .stake_type = StakeType::LegacyB,
            .operator_address = operator_address,
            .amount = unstaked});
        return outcome::success();
    });
}

Result<void> StakingLedger::unstake_all(
    Address const &sender, Address const &operator_address)
{
    return transact("unstake_all", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto *const info, only_owner_or_operator(sender, operator_address));
        if (TESSERA_UNLIKELY(!info->authorized_applications.empty())) {
            return StakingError::StillAuthorized;
        }
        auto const min_stake_amount = state_.globals().params.min_stake_amount;
        if (TESSERA_UNLIKELY(
                info->native_stake != 0 && min_stake_amount != 0 &&
                info->start_staking_timestamp + MIN_STAKE_TIME > timestamp_)) {
            return StakingError::TooEarlyToUnstake;
        }
        if (TESSERA_UNLIKELY(info->total_stake() == 0)) {
            return StakingError::NothingToUnstake;
        }

        auto const native = info->native_stake;
        Stakes const unstaked{
            .native = native,
            .legacy_a = info->legacy_a_stake,
            .legacy_b = info->legacy_b_stake};
        info->native_stake = 0;
        info->legacy_a_stake = 0;
        info->legacy_b_stake = 0;

        for (auto const &[type, amount] :
             {std::pair{StakeType::Native, unstaked.native},
              std::pair{StakeType::LegacyA, unstaked.legacy_a},
              std::pair{StakeType::LegacyB, unstaked.legacy_b}}) {
            if (amount != 0) {
                state_.store_event(Unstaked{
                    .stake_type = type,
                    .operator_address = operator_address,
                    .amount = amount});
            }
        }

        if (native != 0) {
            BOOST_OUTCOME_TRY(token_.transfer(ledger_, info->owner, native));
        }
        return outcome::success();
    });
}

TESSERA_STAKING_NAMESPACE_END
