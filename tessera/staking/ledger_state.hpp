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
#include <tessera/core/version_stack.hpp>
#include <tessera/staking/config.hpp>
#include <tessera/staking/events.hpp>
#include <tessera/staking/util/application_info.hpp>
#include <tessera/staking/util/operator_info.hpp>
#include <tessera/staking/util/slashing_event.hpp>
#include <tessera/staking/util/staking_params.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <span>
#include <vector>

TESSERA_STAKING_NAMESPACE_BEGIN

struct LedgerGlobals
{
    Address governance{};
    StakingParams params{};
    uint256_t notifiers_treasury{0};
    // first unprocessed entry of the slashing queue
    uint64_t slashing_queue_index{0};
};

// Versioned storage behind the staking ledger. `recent_*` reads the latest
// value of any version, `current_*` returns a copy owned by the open
// version that may be modified. `pop_reject` discards everything written
// since the matching `push`, including appended queue entries and events.
class LedgerState
{
    // segmented so references stay valid while other entries are inserted
    ankerl::unordered_dense::segmented_map<
        Address, VersionStack<OperatorInfo>>
        operators_{};
    ankerl::unordered_dense::segmented_map<
        Address, VersionStack<ApplicationInfo>>
        applications_{};
    VersionStack<LedgerGlobals> globals_;

    // append only, journaled by length
    std::vector<SlashingEvent> slashing_queue_{};
    VersionStack<uint64_t> slashing_queue_length_{0};
    std::vector<StakingEvent> events_{};
    VersionStack<uint64_t> events_length_{0};

    unsigned version_{0};

public:
    explicit LedgerState(LedgerGlobals);

    LedgerState(LedgerState &&) = delete;
    LedgerState(LedgerState const &) = delete;
    LedgerState &operator=(LedgerState &&) = delete;
    LedgerState &operator=(LedgerState const &) = delete;

    OperatorInfo const &recent_operator(Address const &) const;
    OperatorInfo &current_operator(Address const &);

    ApplicationInfo const &recent_application(Address const &) const;
    ApplicationInfo &current_application(Address const &);

    LedgerGlobals const &globals() const;
    LedgerGlobals &current_globals();

    uint64_t slashing_queue_length() const;
    SlashingEvent const &slashing_event(uint64_t index) const;
    // returns the index of the new entry
    uint64_t push_slashing_event(SlashingEvent const &);

    void store_event(StakingEvent);
    std::span<StakingEvent const> events() const;

    void push();
    void pop_accept();
    void pop_reject();

    unsigned version() const
    {
        return version_;
    }
};

TESSERA_STAKING_NAMESPACE_END
