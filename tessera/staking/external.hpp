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
#include <tessera/staking/config.hpp>

#include <cstdint>
#include <span>

TESSERA_STAKING_NAMESPACE_BEGIN

// Anything whose state must follow the ledger's accept/reject decisions.
// Calls nest: every push is matched by exactly one pop.
class Transactional
{
public:
    virtual ~Transactional() = default;

    virtual void push() = 0;
    virtual void pop_accept() = 0;
    virtual void pop_reject() = 0;
};

// Fungible token holding the native stake.
class Token
{
public:
    virtual ~Token() = default;

    virtual Result<void> transfer(
        Address const &from, Address const &to, uint256_t const &amount) = 0;

    // moves `amount` from `from` to `to` against the allowance `from` gave
    // to `spender`
    virtual Result<void> transfer_from(
        Address const &spender, Address const &from, Address const &to,
        uint256_t const &amount) = 0;
};

struct DelegationInfo
{
    uint256_t amount{0};
    uint64_t created_at{0};
    uint64_t undelegated_at{0};
};

// Predecessor staking system whose delegations are mirrored as legacy-A
// stake. Amounts are in its own denomination.
class LegacyMirrorA
{
public:
    virtual ~LegacyMirrorA() = default;

    virtual DelegationInfo
    get_delegation_info(Address const &operator_address) = 0;
    virtual bool is_authorized_for_operator(
        Address const &operator_address, Address const &ledger) = 0;
    virtual Address owner_of(Address const &operator_address) = 0;
    virtual Address beneficiary_of(Address const &operator_address) = 0;
    virtual Address authorizer_of(Address const &operator_address) = 0;

    virtual Result<void> seize(
        uint256_t const &amount, uint256_t const &reward_multiplier,
        Address const &notifier, std::span<Address const> operators) = 0;
};

// Predecessor escrow whose stakes are merged as legacy-B stake. Amounts are
// in its own denomination.
class LegacyMirrorB
{
public:
    virtual ~LegacyMirrorB() = default;

    virtual uint256_t get_all_tokens(Address const &owner) = 0;

    virtual Result<void> slash_staker(
        Address const &owner, uint256_t const &penalty,
        Address const &investigator, uint256_t const &reward) = 0;

    // binds the staker's escrow to one operator and returns its amount;
    // fails once the escrow is bound to a different operator
    virtual Result<uint256_t> request_merge(
        Address const &staker, Address const &operator_address) = 0;
};

struct Conversion
{
    uint256_t amount{0};
    // part of the input that could not be converted
    uint256_t remainder{0};
};

class ConversionOracle
{
public:
    virtual ~ConversionOracle() = default;

    virtual Conversion to_native(uint256_t const &legacy_amount) const = 0;
    virtual Conversion from_native(uint256_t const &native_amount) const = 0;
};

// Consumer of authorized stake. Each callback runs inside the ledger
// operation that triggered it; an error rejects that operation.
class Application
{
public:
    virtual ~Application() = default;

    virtual Result<void> authorization_increased(
        Address const &operator_address, uint256_t const &from_amount,
        uint256_t const &to_amount) = 0;

    virtual Result<void> authorization_decrease_requested(
        Address const &operator_address, uint256_t const &from_amount,
        uint256_t const &to_amount) = 0;

    virtual Result<void> involuntary_authorization_decrease(
        Address const &operator_address, uint256_t const &from_amount,
        uint256_t const &to_amount) = 0;
};

TESSERA_STAKING_NAMESPACE_END
