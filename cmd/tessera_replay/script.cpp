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

#include "script.hpp"

#include <tessera/core/address.hpp>
#include <tessera/core/int.hpp>
#include <tessera/core/likely.h>
#include <tessera/sim/scripted_application.hpp>
#include <tessera/sim/sim_environment.hpp>
#include <tessera/staking/staking_ledger.hpp>
#include <tessera/staking/util/operator_info.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <istream>
#include <memory>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

TESSERA_ANONYMOUS_NAMESPACE_BEGIN

std::vector<std::string_view> split(std::string_view line)
{
    std::vector<std::string_view> words;
    while (!line.empty()) {
        auto const begin = line.find_first_not_of(" \t\r");
        if (begin == std::string_view::npos) {
            break;
        }
        line.remove_prefix(begin);
        auto const end = line.find_first_of(" \t\r");
        words.push_back(line.substr(0, end));
        if (end == std::string_view::npos) {
            break;
        }
        line.remove_prefix(end);
    }
    return words;
}

Result<uint256_t> parse_amount(std::string_view const word)
{
    if (TESSERA_UNLIKELY(
            word.empty() || !std::ranges::all_of(word, [](char const c) {
                return c >= '0' && c <= '9';
            }))) {
        return ScriptError::InvalidNumber;
    }
    try {
        return intx::from_string<uint256_t>(std::string{word});
    }
    catch (std::out_of_range const &) {
        return ScriptError::InvalidNumber;
    }
}

Result<uint64_t> parse_u64(std::string_view const word)
{
    BOOST_OUTCOME_TRY(auto const value, parse_amount(word));
    if (TESSERA_UNLIKELY(value > uint256_t{UINT64_MAX})) {
        return ScriptError::InvalidNumber;
    }
    return static_cast<uint64_t>(value);
}

// cursor over the arguments of one command
class Args
{
    std::span<std::string_view const> words_;
    size_t next_{1};

public:
    explicit Args(std::span<std::string_view const> const words)
        : words_{words}
    {
    }

    Result<std::string_view> word()
    {
        if (TESSERA_UNLIKELY(next_ >= words_.size())) {
            return ScriptError::MissingArgument;
        }
        return words_[next_++];
    }

    bool done() const
    {
        return next_ >= words_.size();
    }

    Result<void> finish() const
    {
        if (TESSERA_UNLIKELY(!done())) {
            return ScriptError::TooManyArguments;
        }
        return outcome::success();
    }
};

TESSERA_ANONYMOUS_NAMESPACE_END

TESSERA_NAMESPACE_BEGIN

Result<Address> named_address(std::string_view const name)
{
    Address address{};
    if (TESSERA_UNLIKELY(
            name.empty() || name.size() > sizeof(address.bytes))) {
        return ScriptError::InvalidAddress;
    }
    std::memcpy(address.bytes, name.data(), name.size());
    return address;
}

ScriptRunner::ScriptRunner(sim::SimEnvironment &env, std::ostream &out)
    : env_{env}
    , out_{out}
{
}

sim::ScriptedApplication *
ScriptRunner::application(std::string_view const name) const
{
    auto const it = applications_.find(std::string{name});
    return it == applications_.end() ? nullptr : it->second.get();
}

Result<Address> ScriptRunner::parse_address(std::string_view const word)
{
    if (word == "-") {
        return Address{};
    }
    if (word.starts_with("0x")) {
        auto const address = evmc::from_hex<Address>(word);
        if (TESSERA_UNLIKELY(!address.has_value())) {
            return ScriptError::InvalidAddress;
        }
        return *address;
    }
    BOOST_OUTCOME_TRY(auto const address, named_address(word));
    accounts_.try_emplace(std::string{word}, address);
    return address;
}

Result<ScriptRunner::Operation>
ScriptRunner::parse(std::span<std::string_view const> const words)
{
    auto &ledger = env_.ledger;
    auto const command = words.front();
    Args args{words};

    auto const address = [&]() -> Result<Address> {
        BOOST_OUTCOME_TRY(auto const word, args.word());
        return parse_address(word);
    };
    auto const amount = [&]() -> Result<uint256_t> {
        BOOST_OUTCOME_TRY(auto const word, args.word());
        return parse_amount(word);
    };
    auto const u64 = [&]() -> Result<uint64_t> {
        BOOST_OUTCOME_TRY(auto const word, args.word());
        return parse_u64(word);
    };
    auto const addresses = [&]() -> Result<std::vector<Address>> {
        std::vector<Address> result;
        while (!args.done()) {
            BOOST_OUTCOME_TRY(auto const a, address());
            result.push_back(a);
        }
        return result;
    };

    ////////////////////////
    // Environment setup  //
    ////////////////////////

    if (command == "time") {
        BOOST_OUTCOME_TRY(auto const t, u64());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[&ledger, t]() -> Result<void> {
            ledger.set_timestamp(t);
            return outcome::success();
        }};
    }
    if (command == "advance") {
        BOOST_OUTCOME_TRY(auto const t, u64());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[&ledger, t]() -> Result<void> {
            ledger.set_timestamp(ledger.timestamp() + t);
            return outcome::success();
        }};
    }
    if (command == "mint") {
        BOOST_OUTCOME_TRY(auto const to, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[this, to, value]() -> Result<void> {
            env_.token.mint(to, value);
            return outcome::success();
        }};
    }
    if (command == "approve") {
        BOOST_OUTCOME_TRY(auto const owner, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[this, owner, value]() -> Result<void> {
            env_.token.approve(owner, env_.ledger.ledger_address(), value);
            return outcome::success();
        }};
    }
    if (command == "legacy_a_delegate") {
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(auto const owner, address());
        BOOST_OUTCOME_TRY(auto const beneficiary, address());
        BOOST_OUTCOME_TRY(auto const authorizer, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, this]() -> Result<void> {
            env_.legacy_a.delegate(
                op,
                owner,
                beneficiary,
                authorizer,
                value,
                std::max<uint64_t>(env_.ledger.timestamp(), 1));
            return outcome::success();
        }};
    }
    if (command == "legacy_a_authorize") {
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[this, op]() -> Result<void> {
            env_.legacy_a.authorize_ledger(op, env_.ledger.ledger_address());
            return outcome::success();
        }};
    }
    if (command == "legacy_a_set") {
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[this, op, value]() -> Result<void> {
            env_.legacy_a.set_amount(op, value);
            return outcome::success();
        }};
    }
    if (command == "legacy_a_undelegate") {
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[this, op]() -> Result<void> {
            env_.legacy_a.undelegate(
                op, std::max<uint64_t>(env_.ledger.timestamp(), 1));
            return outcome::success();
        }};
    }
    if (command == "legacy_b_deposit") {
        BOOST_OUTCOME_TRY(auto const owner, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[this, owner, value]() -> Result<void> {
            env_.legacy_b.deposit(owner, value);
            return outcome::success();
        }};
    }
    if (command == "legacy_b_set") {
        BOOST_OUTCOME_TRY(auto const owner, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[this, owner, value]() -> Result<void> {
            env_.legacy_b.set_tokens(owner, value);
            return outcome::success();
        }};
    }
    if (command == "app") {
        BOOST_OUTCOME_TRY(auto const name, args.word());
        BOOST_OUTCOME_TRY(auto const app, parse_address(name));
        BOOST_OUTCOME_TRY(args.finish());
        if (TESSERA_UNLIKELY(application(name) != nullptr)) {
            return ScriptError::DuplicateApplication;
        }
        auto &scripted =
            *applications_
                 .emplace(
                     std::string{name},
                     std::make_unique<sim::ScriptedApplication>())
                 .first->second;
        return Operation{[this, app, &scripted]() -> Result<void> {
            if (TESSERA_UNLIKELY(!env_.applications.add(app, scripted))) {
                return ScriptError::DuplicateApplication;
            }
            return outcome::success();
        }};
    }
    if (command == "app_fail") {
        BOOST_OUTCOME_TRY(auto const name, args.word());
        BOOST_OUTCOME_TRY(auto const failing, u64());
        BOOST_OUTCOME_TRY(args.finish());
        auto *const scripted = application(name);
        if (TESSERA_UNLIKELY(scripted == nullptr)) {
            return ScriptError::UnknownApplication;
        }
        return Operation{[scripted, failing]() -> Result<void> {
            scripted->set_failing(failing != 0);
            return outcome::success();
        }};
    }

    /////////////////////
    // Operator Ledger //
    /////////////////////

    if (command == "stake") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(auto const beneficiary, address());
        BOOST_OUTCOME_TRY(auto const authorizer, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, &ledger] {
            return ledger.stake(sender, op, beneficiary, authorizer, value);
        }};
    }
    if (command == "stake_legacy_a") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{
            [=, &ledger] { return ledger.stake_legacy_a(sender, op); }};
    }
    if (command == "stake_legacy_b") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(auto const beneficiary, address());
        BOOST_OUTCOME_TRY(auto const authorizer, address());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, &ledger] {
            return ledger.stake_legacy_b(sender, op, beneficiary, authorizer);
        }};
    }
    if (command == "top_up") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{
            [=, &ledger] { return ledger.top_up(sender, op, value); }};
    }
    if (command == "top_up_legacy_a" || command == "top_up_legacy_b" ||
        command == "unstake_legacy_a" || command == "unstake_all") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(args.finish());
        auto const member = command == "top_up_legacy_a"
                                ? &staking::StakingLedger::top_up_legacy_a
                            : command == "top_up_legacy_b"
                                ? &staking::StakingLedger::top_up_legacy_b
                            : command == "unstake_legacy_a"
                                ? &staking::StakingLedger::unstake_legacy_a
                                : &staking::StakingLedger::unstake_all;
        return Operation{
            [=, &ledger] { return (ledger.*member)(sender, op); }};
    }
    if (command == "unstake_native" || command == "unstake_legacy_b") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        auto const member = command == "unstake_native"
                                ? &staking::StakingLedger::unstake_native
                                : &staking::StakingLedger::unstake_legacy_b;
        return Operation{
            [=, &ledger] { return (ledger.*member)(sender, op, value); }};
    }

    ///////////////////
    // Authorization //
    ///////////////////

    if (command == "increase_authorization") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(auto const app, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, &ledger] {
            return ledger.increase_authorization(sender, op, app, value);
        }};
    }
    if (command == "request_decrease") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const op, address());
        if (args.done()) {
            return Operation{[=, &ledger] {
                return ledger.request_authorization_decrease(sender, op);
            }};
        }
        BOOST_OUTCOME_TRY(auto const app, address());
        if (args.done()) {
            return Operation{[=, &ledger] {
                return ledger.request_authorization_decrease(sender, op, app);
            }};
        }
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, &ledger] {
            return ledger.request_authorization_decrease(
                sender, op, app, value);
        }};
    }
    if (command == "approve_decrease") {
        BOOST_OUTCOME_TRY(auto const app, address());
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, this, &ledger]() -> Result<void> {
            BOOST_OUTCOME_TRY(
                auto const remaining,
                ledger.approve_authorization_decrease(app, op));
            out_ << "  remaining authorization " << intx::to_string(remaining)
                 << '\n';
            return outcome::success();
        }};
    }
    if (command == "force_decrease") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(auto const app, address());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, &ledger] {
            return ledger.force_decrease_authorization(sender, op, app);
        }};
    }

    //////////////
    // Slashing //
    //////////////

    if (command == "slash") {
        BOOST_OUTCOME_TRY(auto const app, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(auto const operators, addresses());
        return Operation{[=, &ledger] {
            return ledger.slash(app, value, operators);
        }};
    }
    if (command == "seize") {
        BOOST_OUTCOME_TRY(auto const app, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(auto const multiplier, amount());
        BOOST_OUTCOME_TRY(auto const notifier, address());
        BOOST_OUTCOME_TRY(auto const operators, addresses());
        return Operation{[=, &ledger] {
            return ledger.seize(app, value, multiplier, notifier, operators);
        }};
    }
    if (command == "process_slashing") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const count, u64());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, this, &ledger]() -> Result<void> {
            BOOST_OUTCOME_TRY(
                auto const processed, ledger.process_slashing(sender, count));
            out_ << "  processed " << processed << '\n';
            return outcome::success();
        }};
    }
    if (command == "push_reward") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, &ledger] {
            return ledger.push_notification_reward(sender, value);
        }};
    }
    if (command == "withdraw_reward") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const recipient, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, &ledger] {
            return ledger.withdraw_notification_reward(
                sender, recipient, value);
        }};
    }
    if (command == "notify_legacy_a" || command == "notify_legacy_b") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const op, address());
        BOOST_OUTCOME_TRY(args.finish());
        auto const member =
            command == "notify_legacy_a"
                ? &staking::StakingLedger::notify_legacy_a_discrepancy
                : &staking::StakingLedger::notify_legacy_b_discrepancy;
        return Operation{
            [=, &ledger] { return (ledger.*member)(sender, op); }};
    }

    ////////////////
    // Governance //
    ////////////////

    if (command == "set_min_stake" || command == "set_notification_reward") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const value, amount());
        BOOST_OUTCOME_TRY(args.finish());
        auto const member =
            command == "set_min_stake"
                ? &staking::StakingLedger::set_minimum_stake_amount
                : &staking::StakingLedger::set_notification_reward;
        return Operation{
            [=, &ledger] { return (ledger.*member)(sender, value); }};
    }
    if (command == "approve_app" || command == "disable_app" ||
        command == "transfer_governance") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const target, address());
        BOOST_OUTCOME_TRY(args.finish());
        auto const member =
            command == "approve_app"
                ? &staking::StakingLedger::approve_application
            : command == "disable_app"
                ? &staking::StakingLedger::disable_application
                : &staking::StakingLedger::transfer_governance;
        return Operation{
            [=, &ledger] { return (ledger.*member)(sender, target); }};
    }
    if (command == "set_panic_button") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const app, address());
        BOOST_OUTCOME_TRY(auto const button, address());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, &ledger] {
            return ledger.set_panic_button(sender, app, button);
        }};
    }
    if (command == "set_ceiling") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const ceiling, u64());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, &ledger] {
            return ledger.set_authorization_ceiling(sender, ceiling);
        }};
    }
    if (command == "set_penalty") {
        BOOST_OUTCOME_TRY(auto const sender, address());
        BOOST_OUTCOME_TRY(auto const penalty, amount());
        BOOST_OUTCOME_TRY(auto const multiplier, amount());
        BOOST_OUTCOME_TRY(args.finish());
        return Operation{[=, &ledger] {
            return ledger.set_stake_discrepancy_penalty(
                sender, penalty, multiplier);
        }};
    }

    return ScriptError::UnknownCommand;
}

Result<void> ScriptRunner::execute(std::string_view const line)
{
    auto const words = split(line);
    if (words.empty()) {
        return outcome::success();
    }
    BOOST_OUTCOME_TRY(auto const operation, parse(words));
    return operation();
}

ScriptSummary ScriptRunner::run(std::istream &in)
{
    ScriptSummary summary;
    std::string line;
    uint64_t number = 0;
    while (std::getline(in, line)) {
        ++number;
        std::string_view text{line};
        if (auto const comment = text.find('#');
            comment != std::string_view::npos) {
            text = text.substr(0, comment);
        }
        auto words = split(text);
        if (words.empty()) {
            continue;
        }
        bool expect_failure = false;
        if (words.front().starts_with('!')) {
            expect_failure = true;
            words.front().remove_prefix(1);
            if (words.front().empty()) {
                words.erase(words.begin());
            }
        }
        if (words.empty()) {
            continue;
        }

        ++summary.lines;
        auto const operation = parse(words);
        if (operation.has_error()) {
            ++summary.mismatched;
            out_ << "line " << number << ": " << words.front()
                 << " malformed: "
                 << operation.assume_error().message().c_str() << '\n';
            continue;
        }

        auto const result = operation.assume_value()();
        if (result.has_error()) {
            ++summary.rejected;
            out_ << "line " << number << ": " << words.front()
                 << " rejected: " << result.assume_error().message().c_str()
                 << '\n';
        }
        else {
            ++summary.succeeded;
            out_ << "line " << number << ": " << words.front() << " ok\n";
        }
        if (result.has_error() != expect_failure) {
            ++summary.mismatched;
            out_ << "line " << number << ": unexpected "
                 << (expect_failure ? "success" : "rejection") << '\n';
        }
    }
    return summary;
}

void ScriptRunner::print_state(std::ostream &os) const
{
    auto const &ledger = env_.ledger;
    for (auto const &[name, address] : accounts_) {
        auto const roles = ledger.roles_of(address);
        auto const balance = env_.token.balance_of(address);
        if (roles.owner == Address{} && balance == 0) {
            continue;
        }
        os << name << ": balance " << intx::to_string(balance);
        if (roles.owner != Address{}) {
            auto const stakes = ledger.stakes(address);
            os << " native " << intx::to_string(stakes.native)
               << " legacy_a " << intx::to_string(stakes.legacy_a)
               << " legacy_b " << intx::to_string(stakes.legacy_b)
               << " applications "
               << ledger.get_applications_length(address);
        }
        os << '\n';
    }
    os << "notifiers treasury " << intx::to_string(ledger.notifiers_treasury())
       << '\n'
       << "slashing queue " << ledger.slashing_queue_index() << '/'
       << ledger.slashing_queue_length() << '\n'
       << "events " << ledger.events().size() << '\n';
}

TESSERA_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<tessera::ScriptError>::mapping> const &
quick_status_code_from_enum<tessera::ScriptError>::value_mappings()
{
    using tessera::ScriptError;

    static std::initializer_list<mapping> const v = {
        {ScriptError::Success, "success", {errc::success}},
        {ScriptError::UnknownCommand, "unknown command", {}},
        {ScriptError::MissingArgument, "missing argument", {}},
        {ScriptError::TooManyArguments, "too many arguments", {}},
        {ScriptError::InvalidNumber, "invalid number", {}},
        {ScriptError::InvalidAddress, "invalid address", {}},
        {ScriptError::UnknownApplication, "unknown application", {}},
        {ScriptError::DuplicateApplication,
         "application is already registered",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
