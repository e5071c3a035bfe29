#ifndef AMM_TOKEN_HPP
#define AMM_TOKEN_HPP

#include <string>

#include "types.hpp"
#include "ledger.hpp"

namespace amm {

class Chain;

// =============================================================================
// Token Ledger Interface
//
// The exchange only relies on these three calls. A false return means the
// transfer did not happen; callers must treat it as a failure.
// =============================================================================

class IToken {
public:
    virtual ~IToken() = default;

    virtual Address address() const = 0;
    virtual Amount balance_of(const Address& holder) const = 0;

    // sender moves its own balance
    virtual bool transfer(const Address& sender, const Address& to, const Amount& value) = 0;

    // spender moves from's balance within its allowance
    virtual bool transfer_from(const Address& spender, const Address& from,
                               const Address& to, const Amount& value) = 0;
};

// =============================================================================
// Token - fungible token with allowances and owner-free minting
// =============================================================================

class Token : public IToken {
public:
    Token(Chain& chain, std::string name, std::string symbol, uint8_t decimals = 18);
    ~Token() override = default;

    // Non-copyable
    Token(const Token&) = delete;
    Token& operator=(const Token&) = delete;

    const std::string& name() const { return name_; }
    const std::string& symbol() const { return symbol_; }
    uint8_t decimals() const { return decimals_; }

    Address address() const override { return address_; }
    Amount balance_of(const Address& holder) const override;
    Amount total_supply() const;
    Amount allowance(const Address& owner, const Address& spender) const;

    bool transfer(const Address& sender, const Address& to, const Amount& value) override;
    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, const Amount& value) override;
    bool approve(const Address& owner, const Address& spender, const Amount& value);

    void mint(const Address& to, const Amount& value);

protected:
    Chain& chain_;

private:
    Address address_;
    std::string name_;
    std::string symbol_;
    uint8_t decimals_;
    FungibleLedger ledger_;
};

} // namespace amm

#endif // AMM_TOKEN_HPP
