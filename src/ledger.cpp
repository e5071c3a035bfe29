// =============================================================================
// ledger.cpp - Journaled fungible balances (tokens and pool shares)
// =============================================================================

#include "amm/ledger.hpp"
#include "amm/chain.hpp"

namespace amm {

FungibleLedger::FungibleLedger(Chain& chain, const Address& emitter)
    : chain_(chain), emitter_(emitter) {}

// =============================================================================
// Queries
// =============================================================================

Amount FungibleLedger::balance_of(const Address& owner) const {
    auto it = balances_.find(owner);
    return it != balances_.end() ? it->second : Amount(0);
}

Amount FungibleLedger::allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find({owner, spender});
    return it != allowances_.end() ? it->second : Amount(0);
}

// =============================================================================
// Journaled Setters
// =============================================================================

void FungibleLedger::set_balance(const Address& owner, const Amount& value) {
    Amount before = balance_of(owner);
    balances_[owner] = value;
    chain_.record([this, owner, before] { balances_[owner] = before; });
}

void FungibleLedger::set_allowance(const Address& owner, const Address& spender, const Amount& value) {
    Amount before = allowance(owner, spender);
    allowances_[{owner, spender}] = value;
    chain_.record([this, owner, spender, before] { allowances_[{owner, spender}] = before; });
}

void FungibleLedger::set_total_supply(const Amount& value) {
    Amount before = total_supply_;
    total_supply_ = value;
    chain_.record([this, before] { total_supply_ = before; });
}

// =============================================================================
// Transfers
// =============================================================================

bool FungibleLedger::transfer(const Address& from, const Address& to, const Amount& value) {
    if (addresses::is_zero(to)) return false;

    Amount from_balance = balance_of(from);
    if (from_balance < value) return false;

    set_balance(from, from_balance - value);
    set_balance(to, balance_of(to) + value);
    chain_.emit(emitter_, Transfer{from, to, value});
    return true;
}

bool FungibleLedger::approve(const Address& owner, const Address& spender, const Amount& value) {
    if (addresses::is_zero(spender)) return false;

    set_allowance(owner, spender, value);
    chain_.emit(emitter_, Approval{owner, spender, value});
    return true;
}

bool FungibleLedger::transfer_from(const Address& spender, const Address& from,
                                   const Address& to, const Amount& value) {
    Amount allowed = allowance(from, spender);
    if (allowed < value) return false;
    if (balance_of(from) < value || addresses::is_zero(to)) return false;

    set_allowance(from, spender, allowed - value);
    return transfer(from, to, value);
}

// =============================================================================
// Supply
// =============================================================================

void FungibleLedger::mint(const Address& to, const Amount& value) {
    set_total_supply(total_supply_ + value);
    set_balance(to, balance_of(to) + value);
    chain_.emit(emitter_, Transfer{addresses::ZERO, to, value});
}

bool FungibleLedger::burn(const Address& from, const Amount& value) {
    Amount from_balance = balance_of(from);
    if (from_balance < value) return false;

    set_balance(from, from_balance - value);
    set_total_supply(total_supply_ - value);
    chain_.emit(emitter_, Transfer{from, addresses::ZERO, value});
    return true;
}

} // namespace amm
