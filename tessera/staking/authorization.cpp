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
#include <tessera/staking/util/operator_info.hpp>
#include <tessera/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <vector>

TESSERA_STAKING_NAMESPACE_BEGIN

namespace
{
    Result<void> check_active(ApplicationInfo const &info)
    {
        if (TESSERA_UNLIKELY(!info.approved)) {
            return StakingError::ApplicationNotApproved;
        }
        if (TESSERA_UNLIKELY(info.disabled)) {
            return StakingError::ApplicationDisabled;
        }
        return outcome::success();
    }
}

Result<void> StakingLedger::increase_authorization(
    Address const &sender, Address const &operator_address,
    Address const &application, uint256_t const &amount)
{
    return transact("increase_authorization", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto *const info, only_authorizer(sender, operator_address));
        if (TESSERA_UNLIKELY(amount == 0)) {
            return StakingError::InvalidInput;
        }
        BOOST_OUTCOME_TRY(check_active(state_.recent_application(application)));

        auto const from_amount = info->authorization(application).authorized;
        if (from_amount == 0) {
            auto const ceiling = state_.globals().params.authorization_ceiling;
            if (TESSERA_UNLIKELY(
                    ceiling != 0 &&
                    info->authorized_applications.size() >= ceiling)) {
                return StakingError::TooManyApplications;
            }
            info->authorized_applications.push_back(application);
        }

        auto const available =
            saturating_sub(info->total_stake(), from_amount);
        if (TESSERA_UNLIKELY(available < amount)) {
            return StakingError::NotEnoughStakeToAuthorize;
        }

        BOOST_OUTCOME_TRY(
            auto const to_amount, checked_add(from_amount, amount));
        info->authorizations[application].authorized = to_amount;
        state_.store_event(AuthorizationIncreased{
            .operator_address = operator_address,
            .application = application,
            .from_amount = from_amount,
            .to_amount = to_amount});

        BOOST_OUTCOME_TRY(auto *const app, applications_.resolve(application));
        BOOST_OUTCOME_TRY(app->authorization_increased(
            operator_address, from_amount, to_amount));
        return outcome::success();
    });
}

Result<void> StakingLedger::do_request_authorization_decrease(
    OperatorInfo &info, Address const &operator_address,
    Address const &application, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(check_active(state_.recent_application(application)));
    if (TESSERA_UNLIKELY(amount == 0)) {
        return StakingError::InvalidInput;
    }

    auto &authorization = info.authorizations[application];
    if (TESSERA_UNLIKELY(amount > authorization.authorized)) {
        return StakingError::AmountExceedsAuthorized;
    }

    // a new request replaces the pending one
    authorization.deauthorizing = amount;
    auto const from_amount = authorization.authorized;
    auto const to_amount = from_amount - amount;
    state_.store_event(AuthorizationDecreaseRequested{
        .operator_address = operator_address,
        .application = application,
        .from_amount = from_amount,
        .to_amount = to_amount});

    BOOST_OUTCOME_TRY(auto *const app, applications_.resolve(application));
    BOOST_OUTCOME_TRY(app->authorization_decrease_requested(
        operator_address, from_amount, to_amount));
    return outcome::success();
}

Result<void> StakingLedger::request_authorization_decrease(
    Address const &sender, Address const &operator_address,
    Address const &application, uint256_t const &amount)
{
    return transact("request_authorization_decrease", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto *const info, only_authorizer(sender, operator_address));
        return do_request_authorization_decrease(
            *info, operator_address, application, amount);
    });
}

Result<void> StakingLedger::request_authorization_decrease(
    Address const &sender, Address const &operator_address,
    Address const &application)
{
    return transact("request_authorization_decrease", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto *const info, only_authorizer(sender, operator_address));
        auto const authorized = info->authorization(application).authorized;
        if (TESSERA_UNLIKELY(authorized == 0)) {
            return StakingError::NothingWasAuthorized;
        }
        return do_request_authorization_decrease(
            *info, operator_address, application, authorized);
    });
}

Result<void> StakingLedger::request_authorization_decrease(
    Address const &sender, Address const &operator_address)
{
    return transact("request_authorization_decrease", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto *const info, only_authorizer(sender, operator_address));
        if (TESSERA_UNLIKELY(info->authorized_applications.empty())) {
            return StakingError::NothingWasAuthorized;
        }
        std::vector<Address> const applications =
            info->authorized_applications;
        for (auto const &application : applications) {
            auto const authorized =
                info->authorization(application).authorized;
            if (authorized > 0) {
                BOOST_OUTCOME_TRY(do_request_authorization_decrease(
                    *info, operator_address, application, authorized));
            }
        }
        return outcome::success();
    });
}

Result<uint256_t> StakingLedger::approve_authorization_decrease(
    Address const &sender, Address const &operator_address)
{
    return transact(
        "approve_authorization_decrease", [&]() -> Result<uint256_t> {
            BOOST_OUTCOME_TRY(check_active(state_.recent_application(sender)));
            if (TESSERA_UNLIKELY(
                    !state_.recent_operator(operator_address).exists())) {
                return StakingError::UnknownOperator;
            }
            auto &info = state_.current_operator(operator_address);
            auto const it = info.authorizations.find(sender);
            if (TESSERA_UNLIKELY(
                    it == info.authorizations.end() ||
                    it->second.deauthorizing == 0)) {
                return StakingError::NothingToDecrease;
            }

            auto &authorization = it->second;
            auto const from_amount = authorization.authorized;
            authorization.authorized -= authorization.deauthorizing;
            authorization.deauthorizing = 0;
            auto const to_amount = authorization.authorized;
            state_.store_event(AuthorizationDecreaseApproved{
                .operator_address = operator_address,
                .application = sender,
                .from_amount = from_amount,
                .to_amount = to_amount});

            if (to_amount == 0) {
                info.remove_authorized_application(sender);
            }
            return to_amount;
        });
}

Result<void> StakingLedger::force_decrease_authorization(
    Address const &, Address const &operator_address,
    Address const &application)
{
    return transact("force_decrease_authorization", [&]() -> Result<void> {
        if (TESSERA_UNLIKELY(
                !state_.recent_application(application).disabled)) {
            return StakingError::ApplicationNotDisabled;
        }
        if (TESSERA_UNLIKELY(
                !state_.recent_operator(operator_address).exists())) {
            return StakingError::UnknownOperator;
        }
        auto &info = state_.current_operator(operator_address);
        auto const from_amount = info.authorization(application).authorized;
        if (TESSERA_UNLIKELY(from_amount == 0)) {
            return StakingError::NothingWasAuthorized;
        }

        info.remove_authorized_application(application);
        state_.store_event(AuthorizationInvoluntaryDecreased{
            .operator_address = operator_address,
            .application = application,
            .from_amount = from_amount,
            .to_amount = 0});
        return outcome::success();
    });
}

TESSERA_STAKING_NAMESPACE_END
