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

#include <tessera/staking/events.hpp>

#include <string_view>
#include <type_traits>
#include <variant>

TESSERA_STAKING_NAMESPACE_BEGIN

std::string_view event_name(StakingEvent const &event)
{
    return std::visit(
        [](auto const &e) -> std::string_view {
            using E = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<E, Staked>) {
                return "Staked";
            }
            else if constexpr (std::is_same_v<E, ToppedUp>) {
                return "ToppedUp";
            }
            else if constexpr (std::is_same_v<E, Unstaked>) {
                return "Unstaked";
            }
            else if constexpr (std::is_same_v<E, AuthorizationIncreased>) {
                return "AuthorizationIncreased";
            }
            else if constexpr (std::is_same_v<
                                   E,
                                   AuthorizationDecreaseRequested>) {
                return "AuthorizationDecreaseRequested";
            }
            else if constexpr (std::is_same_v<
                                   E,
                                   AuthorizationDecreaseApproved>) {
                return "AuthorizationDecreaseApproved";
            }
            else if constexpr (std::is_same_v<
                                   E,
                                   AuthorizationInvoluntaryDecreased>) {
                return "AuthorizationInvoluntaryDecreased";
            }
            else if constexpr (std::is_same_v<E, SlashingEventQueued>) {
                return "SlashingEventQueued";
            }
            else if constexpr (std::is_same_v<E, TokensSeized>) {
                return "TokensSeized";
            }
            else if constexpr (std::is_same_v<E, SlashingProcessed>) {
                return "SlashingProcessed";
            }
            else if constexpr (std::is_same_v<E, NotifierRewarded>) {
                return "NotifierRewarded";
            }
            else if constexpr (std::is_same_v<E, MinimumStakeAmountSet>) {
                return "MinimumStakeAmountSet";
            }
            else if constexpr (std::is_same_v<E, ApplicationApproved>) {
                return "ApplicationApproved";
            }
            else if constexpr (std::is_same_v<E, ApplicationDisabled>) {
                return "ApplicationDisabled";
            }
            else if constexpr (std::is_same_v<E, PanicButtonSet>) {
                return "PanicButtonSet";
            }
            else if constexpr (std::is_same_v<E, AuthorizationCeilingSet>) {
                return "AuthorizationCeilingSet";
            }
            else if constexpr (std::is_same_v<E, StakeDiscrepancyPenaltySet>) {
                return "StakeDiscrepancyPenaltySet";
            }
            else if constexpr (std::is_same_v<E, NotificationRewardSet>) {
                return "NotificationRewardSet";
            }
            else if constexpr (std::is_same_v<E, NotificationRewardPushed>) {
                return "NotificationRewardPushed";
            }
            else if constexpr (std::is_same_v<
                                   E,
                                   NotificationRewardWithdrawn>) {
                return "NotificationRewardWithdrawn";
            }
            else {
                static_assert(std::is_same_v<E, GovernanceTransferred>);
                return "GovernanceTransferred";
            }
        },
        event);
}

TESSERA_STAKING_NAMESPACE_END
