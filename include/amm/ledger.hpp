#ifndef AMM_LEDGER_HPP
#define AMM_LEDGER_HPP

#include <map>
#include <utility>

#include "types.hpp"

namespace amm {

class Chain;

// =============================================================================
// FungibleLedger - journaled balances, allowances and supply
//
// Backs both the paired token and the exchange's pool shares. Failed
// transfers return false and change nothing; every change is recorded on the
// chain journal and emits Transfer/Approval from the owning contract.
// =============================================================================

class FungibleLedger {
public:
    FungibleLedger(Chain& chain, const Address& emitter);

    // Non-copyable
    FungibleLedger(const FungibleLedger&) = delete;
    FungibleLedger& operator=(const FungibleLedger&) = delete;

    Amount total_supply() const { return total_supply_; }
    Amount balance_of(const Address& owner) const;
    Amount allowance(const Address& owner, const Address& spender) const;

    bool transfer(const Address& from, const Address& to, const Amount& value);
    bool approve(const Address& owner, const Address& spender, const Amount& value);
    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, const Amount& value);

    void mint(const Address& to, const Amount& value);
    bool burn(const Address& from, const Amount& value);

private:
    Chain& chain_;
    Address emitter_;

    Amount total_supply_{0};
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;  // (owner, spender)

    void set_balance(const Address& owner, const Amount& value);
    void set_allowance(const Address& owner, const Address& spender, const Amount& value);
    void set_total_supply(const Amount& value);
};

} // namespace amm

#endif // AMM_LEDGER_HPP
