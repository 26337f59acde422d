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
#include <tessera/core/config.hpp>
#include <tessera/core/int.hpp>
#include <tessera/core/result.hpp>
#include <tessera/sim/scripted_application.hpp>
#include <tessera/sim/sim_environment.hpp>

#include <ankerl/unordered_dense.h>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

TESSERA_NAMESPACE_BEGIN

enum class ScriptError
{
    Success = 0,
    UnknownCommand,
    MissingArgument,
    TooManyArguments,
    InvalidNumber,
    InvalidAddress,
    UnknownApplication,
    DuplicateApplication,
};

struct ScriptSummary
{
    uint64_t lines{0};
    uint64_t succeeded{0};
    // operations the ledger rejected
    uint64_t rejected{0};
    // lines whose outcome did not match the `!` expectation, or that could
    // not be parsed
    uint64_t mismatched{0};
};

// Address of a named account: the name's bytes, zero padded. Names are at
// most 20 bytes long.
Result<Address> named_address(std::string_view name);

// Applies a line-oriented script of ledger operations to a simulated
// environment. Accounts are referred to by name, or by `0x` prefixed hex.
// A line starting with `!` is expected to be rejected by the ledger.
class ScriptRunner
{
public:
    using Operation = std::function<Result<void>()>;

private:
    sim::SimEnvironment &env_;
    std::ostream &out_;

    // named accounts in order of first use
    ankerl::unordered_dense::map<std::string, Address> accounts_{};
    ankerl::unordered_dense::map<
        std::string, std::unique_ptr<sim::ScriptedApplication>>
        applications_{};

    Result<Address> parse_address(std::string_view);
    Result<Operation> parse(std::span<std::string_view const> words);

public:
    ScriptRunner(sim::SimEnvironment &, std::ostream &);

    // Parses and executes one line. A malformed line fails with a
    // ScriptError before anything is executed.
    Result<void> execute(std::string_view line);

    ScriptSummary run(std::istream &);
    void print_state(std::ostream &) const;

    sim::ScriptedApplication *application(std::string_view name) const;
};

TESSERA_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<tessera::ScriptError>
    : quick_status_code_from_enum_defaults<tessera::ScriptError>
{
    static constexpr auto const domain_name = "Script Error";
    static constexpr auto const domain_uuid =
        "71c2d5e8-9a04-4b3f-8d61-2e5fa0b73c19";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
