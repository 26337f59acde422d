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
#include <tessera/staking/events.hpp>
#include <tessera/staking/ledger_state.hpp>
#include <tessera/staking/util/application_info.hpp>
#include <tessera/staking/util/operator_info.hpp>
#include <tessera/staking/util/slashing_event.hpp>

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

TESSERA_STAKING_NAMESPACE_BEGIN

namespace
{
    template <class Map>
    void accept_all(Map &map, unsigned const version)
    {
        for (auto &it : map) {
            it.second.pop_accept(version);
        }
    }

    template <class Map>
    void reject_all(Map &map, unsigned const version)
    {
        std::vector<Address> removals;

        for (auto &it : map) {
            if (it.second.pop_reject(version)) {
                removals.push_back(it.first);
            }
        }

        while (removals.size()) {
            map.erase(removals.back());
            removals.pop_back();
        }
    }
}

LedgerState::LedgerState(LedgerGlobals globals)
    : globals_{std::move(globals)}
{
}

OperatorInfo const &
LedgerState::recent_operator(Address const &operator_address) const
{
    static OperatorInfo const empty{};

    auto const it = operators_.find(operator_address);
    if (it == operators_.end()) {
        return empty;
    }
    return it->second.recent();
}

OperatorInfo &LedgerState::current_operator(Address const &operator_address)
{
    auto it = operators_.find(operator_address);
    if (it == operators_.end()) {
        it = operators_
                 .try_emplace(
                     operator_address,
                     VersionStack<OperatorInfo>{OperatorInfo{}, version_})
                 .first;
    }
    return it->second.current(version_);
}

ApplicationInfo const &
LedgerState::recent_application(Address const &application) const
{
    static ApplicationInfo const empty{};

    auto const it = applications_.find(application);
    if (it == applications_.end()) {
        return empty;
    }
    return it->second.recent();
}

ApplicationInfo &LedgerState::current_application(Address const &application)
{
    auto it = applications_.find(application);
    if (it == applications_.end()) {
        it = applications_
                 .try_emplace(
                     application,
                     VersionStack<ApplicationInfo>{
                         ApplicationInfo{}, version_})
                 .first;
    }
    return it->second.current(version_);
}

LedgerGlobals const &LedgerState::globals() const
{
    return globals_.recent();
}

LedgerGlobals &LedgerState::current_globals()
{
    return globals_.current(version_);
}

uint64_t LedgerState::slashing_queue_length() const
{
    return slashing_queue_length_.recent();
}

SlashingEvent const &LedgerState::slashing_event(uint64_t const index) const
{
    TESSERA_ASSERT(index < slashing_queue_length());
    return slashing_queue_[index];
}

uint64_t LedgerState::push_slashing_event(SlashingEvent const &event)
{
    auto &length = slashing_queue_length_.current(version_);
    TESSERA_ASSERT(length == slashing_queue_.size());
    slashing_queue_.push_back(event);
    return length++;
}

void LedgerState::store_event(StakingEvent event)
{
    auto &length = events_length_.current(version_);
    TESSERA_ASSERT(length == events_.size());
    events_.push_back(std::move(event));
    ++length;
}

std::span<StakingEvent const> LedgerState::events() const
{
    return {events_.data(), events_length_.recent()};
}

void LedgerState::push()
{
    ++version_;
}

void LedgerState::pop_accept()
{
    TESSERA_ASSERT(version_);

    accept_all(operators_, version_);
    accept_all(applications_, version_);
    globals_.pop_accept(version_);
    slashing_queue_length_.pop_accept(version_);
    events_length_.pop_accept(version_);

    --version_;
}

void LedgerState::pop_reject()
{
    TESSERA_ASSERT(version_);

    reject_all(operators_, version_);
    reject_all(applications_, version_);

    // created at version 0, never left empty
    globals_.pop_reject(version_);
    slashing_queue_length_.pop_reject(version_);
    events_length_.pop_reject(version_);

    slashing_queue_.resize(slashing_queue_length_.recent());
    events_.resize(events_length_.recent());

    --version_;
}

TESSERA_STAKING_NAMESPACE_END
