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
#include <tessera/staking/application_registry.hpp>
#include <tessera/staking/config.hpp>
#include <tessera/staking/events.hpp>
#include <tessera/staking/external.hpp>
#include <tessera/staking/ledger_state.hpp>
#include <tessera/staking/util/application_info.hpp>
#include <tessera/staking/util/operator_info.hpp>
#include <tessera/staking/util/slashing_event.hpp>
#include <tessera/staking/util/staking_params.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <span>
#include <vector>

TESSERA_STAKING_NAMESPACE_BEGIN

// The external systems a ledger talks to. None are owned by the ledger.
struct Collaborators
{
    Token &token;
    LegacyMirrorA &legacy_a;
    LegacyMirrorB &legacy_b;
    ConversionOracle &legacy_a_oracle;
    ConversionOracle &legacy_b_oracle;
    ApplicationRegistry &applications;
};

// Multi-source staking ledger. Tracks native and legacy stake per operator,
// per-application authorization and the slashing queue.
//
// Every mutating call takes the calling identity first and runs as one unit:
// either it returns success and all of its effects are kept, or it returns
// an error and nothing it did is observable, on the ledger or on any
// collaborator registered with `add_transactional`. Not thread safe.
class StakingLedger
{
    Address const ledger_;
    LedgerState state_;

    Token &token_;
    LegacyMirrorA &legacy_a_;
    LegacyMirrorB &legacy_b_;
    ConversionOracle &legacy_a_oracle_;
    ConversionOracle &legacy_b_oracle_;
    ApplicationRegistry &applications_;

    std::vector<Transactional *> transactionals_{};

    uint64_t timestamp_{0};

public:
    StakingLedger(LedgerConfig const &, Collaborators const &);

    StakingLedger(StakingLedger const &) = delete;
    StakingLedger &operator=(StakingLedger const &) = delete;

    // collaborator state that is pushed and popped with every operation
    void add_transactional(Transactional &);

    // seconds, used by the minimum stake time rule
    void set_timestamp(uint64_t);
    uint64_t timestamp() const;

    Address const &ledger_address() const;

    /////////////////////
    // Operator Ledger //
    /////////////////////

    // Creates an operator from native stake pulled from `sender`. A null
    // beneficiary or authorizer defaults to `sender`.
    Result<void> stake(
        Address const &sender, Address const &operator_address,
        Address const &beneficiary, Address const &authorizer,
        uint256_t const &amount);

    // Creates an operator from its delegation in legacy mirror A. Roles are
    // taken from the mirror.
    Result<void>
    stake_legacy_a(Address const &sender, Address const &operator_address);

    // Creates an operator from the escrow `sender` holds in legacy mirror B.
    Result<void> stake_legacy_b(
        Address const &sender, Address const &operator_address,
        Address const &beneficiary, Address const &authorizer);

    Result<void> top_up(
        Address const &sender, Address const &operator_address,
        uint256_t const &amount);
    Result<void>
    top_up_legacy_a(Address const &sender, Address const &operator_address);
    Result<void>
    top_up_legacy_b(Address const &sender, Address const &operator_address);

    Result<void> unstake_native(
        Address const &sender, Address const &operator_address,
        uint256_t const &amount);
    Result<void>
    unstake_legacy_a(Address const &sender, Address const &operator_address);
    Result<void> unstake_legacy_b(
        Address const &sender, Address const &operator_address,
        uint256_t const &amount);
    Result<void>
    unstake_all(Address const &sender, Address const &operator_address);

    ///////////////////
    // Authorization //
    ///////////////////

    Result<void> increase_authorization(
        Address const &sender, Address const &operator_address,
        Address const &application, uint256_t const &amount);

    Result<void> request_authorization_decrease(
        Address const &sender, Address const &operator_address,
        Address const &application, uint256_t const &amount);

    // requests a decrease of everything authorized to `application`
    Result<void> request_authorization_decrease(
        Address const &sender, Address const &operator_address,
        Address const &application);

    // requests a decrease of everything authorized to every application
    Result<void> request_authorization_decrease(
        Address const &sender, Address const &operator_address);

    // Called by the application. Returns the remaining authorization.
    Result<uint256_t> approve_authorization_decrease(
        Address const &sender, Address const &operator_address);

    Result<void> force_decrease_authorization(
        Address const &sender, Address const &operator_address,
        Address const &application);

    //////////////
    // Slashing //
    //////////////

    Result<void> slash(
        Address const &sender, uint256_t const &amount,
        std::span<Address const> operators);

    Result<void> seize(
        Address const &sender, uint256_t const &amount,
        uint256_t const &reward_multiplier, Address const &notifier,
        std::span<Address const> operators);

    // Processes at most `count` queued events. Returns how many were
    // processed.
    Result<uint64_t>
    process_slashing(Address const &sender, uint64_t count);

    Result<void>
    push_notification_reward(Address const &sender, uint256_t const &amount);
    Result<void> withdraw_notification_reward(
        Address const &sender, Address const &recipient,
        uint256_t const &amount);

    /////////////////
    // Discrepancy //
    /////////////////

    Result<void> notify_legacy_a_discrepancy(
        Address const &sender, Address const &operator_address);
    Result<void> notify_legacy_b_discrepancy(
        Address const &sender, Address const &operator_address);

    ////////////////
    // Governance //
    ////////////////

    Result<void>
    set_minimum_stake_amount(Address const &sender, uint256_t const &amount);
    Result<void>
    approve_application(Address const &sender, Address const &application);
    Result<void> set_panic_button(
        Address const &sender, Address const &application,
        Address const &panic_button);
    Result<void>
    set_authorization_ceiling(Address const &sender, uint64_t ceiling);
    Result<void> set_stake_discrepancy_penalty(
        Address const &sender, uint256_t const &penalty,
        uint256_t const &reward_multiplier);
    Result<void>
    set_notification_reward(Address const &sender, uint256_t const &reward);
    Result<void> transfer_governance(
        Address const &sender, Address const &new_governance);

    // only callable by the application's panic button
    Result<void>
    disable_application(Address const &sender, Address const &application);

    /////////////
    // Queries //
    /////////////

    Stakes stakes(Address const &operator_address) const;
    Roles roles_of(Address const &operator_address) const;
    uint64_t get_start_staking_timestamp(Address const &operator_address) const;

    AppAuthorization authorization(
        Address const &operator_address, Address const &application) const;
    uint256_t authorized_stake(
        Address const &operator_address, Address const &application) const;
    uint256_t get_available_to_authorize(
        Address const &operator_address, Address const &application) const;

    // part of one stake source that must stay to back the largest
    // authorization once the other two sources are used up
    uint256_t
    get_min_staked(Address const &operator_address, StakeType) const;
    uint256_t get_max_authorization(Address const &operator_address) const;

    std::vector<Address>
    authorized_applications(Address const &operator_address) const;
    uint64_t get_applications_length(Address const &operator_address) const;

    ApplicationInfo application_info(Address const &application) const;

    uint64_t slashing_queue_length() const;
    uint64_t slashing_queue_index() const;
    SlashingEvent const &slashing_event(uint64_t index) const;

    uint256_t notifiers_treasury() const;
    StakingParams const &params() const;
    Address const &governance() const;

    std::span<StakingEvent const> events() const;

private:
    /////////////
    // Helpers //
    /////////////

    // runs `f` as one unit over the ledger and every transactional
    // collaborator
    template <class F>
    auto transact(char const *name, F &&f) -> decltype(f());

    void push();
    void pop_accept();
    void pop_reject();

    Result<void> only_governance(Address const &sender) const;
    Result<OperatorInfo *> only_owner_or_operator(
        Address const &sender, Address const &operator_address);
    Result<OperatorInfo *>
    only_authorizer(Address const &sender, Address const &operator_address);

    // identity claimed here or delegated in legacy mirror A
    Result<void> check_unclaimed(Address const &operator_address);

    // native equivalent of an operator's live legacy-A delegation, zero if
    // it was undelegated
    uint256_t legacy_a_amount_in_native(Address const &operator_address);

    Result<void> do_request_authorization_decrease(
        OperatorInfo &, Address const &operator_address,
        Address const &application, uint256_t const &amount);

    Result<uint64_t> enqueue_slashing(
        Address const &application, uint256_t const &amount,
        std::span<Address const> operators);
    Result<void> reward_notifier(
        Address const &notifier, uint256_t const &reward_multiplier,
        uint64_t count);

    // native amount burned
    Result<uint256_t> process_slashing_event(
        Address const &processor, SlashingEvent const &);

    // both return the part of `amount` that was not covered
    Result<uint256_t> seize_legacy_a(
        OperatorInfo &, Address const &operator_address,
        uint256_t const &amount, uint256_t const &reward_multiplier,
        Address const &notifier);
    Result<uint256_t> seize_legacy_b(
        OperatorInfo &, uint256_t const &amount,
        uint256_t const &reward_multiplier, Address const &notifier);

    // clamps every authorization to the operator's total stake
    Result<void>
    correct_authorizations(OperatorInfo &, Address const &operator_address);
};

template <class F>
auto StakingLedger::transact(char const *const name, F &&f) -> decltype(f())
{
    push();
    auto result = f();
    if (result.has_error()) {
        pop_reject();
        LOG_DEBUG(
            "StakingLedger: {} rejected: {}",
            name,
            result.error().message().c_str());
    }
    else {
        pop_accept();
    }
    return result;
}

TESSERA_STAKING_NAMESPACE_END
