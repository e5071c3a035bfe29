// =============================================================================
// token.cpp - Reference fungible token
// =============================================================================

#include "amm/token.hpp"
#include "amm/chain.hpp"

namespace amm {

Token::Token(Chain& chain, std::string name, std::string symbol, uint8_t decimals)
    : chain_(chain),
      address_(chain.new_address()),
      name_(std::move(name)),
      symbol_(std::move(symbol)),
      decimals_(decimals),
      ledger_(chain, address_) {}

Amount Token::balance_of(const Address& holder) const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return ledger_.balance_of(holder);
}

Amount Token::total_supply() const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return ledger_.total_supply();
}

Amount Token::allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return ledger_.allowance(owner, spender);
}

bool Token::transfer(const Address& sender, const Address& to, const Amount& value) {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return ledger_.transfer(sender, to, value);
}

bool Token::transfer_from(const Address& spender, const Address& from,
                          const Address& to, const Amount& value) {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return ledger_.transfer_from(spender, from, to, value);
}

bool Token::approve(const Address& owner, const Address& spender, const Amount& value) {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return ledger_.approve(owner, spender, value);
}

void Token::mint(const Address& to, const Amount& value) {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    ledger_.mint(to, value);
}

} // namespace amm
