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
#include <tessera/core/int.hpp>
#include <tessera/core/likely.h>
#include <tessera/staking/events.hpp>
#include <tessera/staking/external.hpp>
#include <tessera/staking/staking_ledger.hpp>
#include <tessera/staking/util/operator_info.hpp>
#include <tessera/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <vector>

TESSERA_STAKING_NAMESPACE_BEGIN

Result<void> StakingLedger::correct_authorizations(
    OperatorInfo &info, Address const &operator_address)
{
    auto const total_stake = info.total_stake();

    // removal reorders the list
    std::vector<Address> const applications = info.authorized_applications;
    for (auto const &application : applications) {
        auto &authorization = info.authorizations[application];
        if (authorization.authorized <= total_stake) {
            continue;
        }

        auto const from_amount = authorization.authorized;
        authorization.authorized = total_stake;
        if (authorization.deauthorizing > total_stake) {
            authorization.deauthorizing = total_stake;
        }
        if (total_stake == 0) {
            info.remove_authorized_application(application);
        }
        state_.store_event(AuthorizationInvoluntaryDecreased{
            .operator_address = operator_address,
            .application = application,
            .from_amount = from_amount,
            .to_amount = total_stake});

        BOOST_OUTCOME_TRY(auto *const app, applications_.resolve(application));
        BOOST_OUTCOME_TRY(app->involuntary_authorization_decrease(
            operator_address, from_amount, total_stake));
    }
    return outcome::success();
}

Result<void> StakingLedger::notify_legacy_a_discrepancy(
    Address const &sender, Address const &operator_address)
{
    return transact("notify_legacy_a_discrepancy", [&]() -> Result<void> {
        if (TESSERA_UNLIKELY(
                state_.recent_operator(operator_address).legacy_a_stake ==
                0)) {
            return StakingError::NothingToSlash;
        }
        auto &info = state_.current_operator(operator_address);

        auto const delegation = legacy_a_.get_delegation_info(operator_address);
        auto const live = legacy_a_oracle_.to_native(delegation.amount).amount;
        bool const undelegated = delegation.undelegated_at != 0;
        if (TESSERA_UNLIKELY(info.legacy_a_stake <= live && !undelegated)) {
            return StakingError::NoDiscrepancy;
        }

        info.legacy_a_stake = live;
        auto const &params = state_.globals().params;
        BOOST_OUTCOME_TRY(seize_legacy_a(
            info,
            operator_address,
            params.stake_discrepancy_penalty,
            params.stake_discrepancy_reward_multiplier,
            sender));
        state_.store_event(TokensSeized{
            .operator_address = operator_address,
            .amount = live - info.legacy_a_stake,
            .discrepancy = true});

        if (undelegated) {
            info.legacy_a_stake = 0;
        }
        return correct_authorizations(info, operator_address);
    });
}

Result<void> StakingLedger::notify_legacy_b_discrepancy(
    Address const &sender, Address const &operator_address)
{
    return transact("notify_legacy_b_discrepancy", [&]() -> Result<void> {
        if (TESSERA_UNLIKELY(
                state_.recent_operator(operator_address).legacy_b_stake ==
                0)) {
            return StakingError::NothingToSlash;
        }
        auto &info = state_.current_operator(operator_address);

        auto const live =
            legacy_b_oracle_.to_native(legacy_b_.get_all_tokens(info.owner))
                .amount;
        if (TESSERA_UNLIKELY(info.legacy_b_stake <= live)) {
            return StakingError::NoDiscrepancy;
        }

        info.legacy_b_stake = live;
        auto const &params = state_.globals().params;
        BOOST_OUTCOME_TRY(seize_legacy_b(
            info,
            params.stake_discrepancy_penalty,
            params.stake_discrepancy_reward_multiplier,
            sender));
        state_.store_event(TokensSeized{
            .operator_address = operator_address,
            .amount = live - info.legacy_b_stake,
            .discrepancy = true});

        return correct_authorizations(info, operator_address);
    });
}

TESSERA_STAKING_NAMESPACE_END
