#ifndef AMM_REGISTRY_HPP
#define AMM_REGISTRY_HPP

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "types.hpp"
#include "exchange.hpp"

namespace amm {

class Chain;
class IToken;

// =============================================================================
// Registry Interface (routing lookups)
// =============================================================================

class IRegistry {
public:
    virtual ~IRegistry() = default;

    // nullptr when no exchange exists for token
    virtual Exchange* get_exchange(const Address& token) const = 0;
};

// =============================================================================
// Registry - creates and indexes one exchange per token
// =============================================================================

class Registry : public IRegistry {
public:
    explicit Registry(Chain& chain, ExchangeConfig config = {});
    ~Registry() override = default;

    // Non-copyable
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    Address address() const { return address_; }

    // Throws INVALID_EXCHANGE for a zero token or one that already has an exchange.
    // The registry owns the exchange. When called inside an enclosing
    // Chain::transact that later reverts, the exchange is destroyed and the
    // returned reference must not be used.
    Exchange& create_exchange(IToken& token);

    Exchange* get_exchange(const Address& token) const override;
    std::optional<Address> get_token(const Address& exchange) const;
    std::optional<Address> get_token_with_id(uint64_t token_id) const;
    uint64_t token_count() const;

private:
    Chain& chain_;
    ExchangeConfig config_;
    Address address_;

    std::vector<std::unique_ptr<Exchange>> exchanges_;
    std::map<Address, Exchange*> token_to_exchange_;
    std::map<Address, Address> exchange_to_token_;
    std::map<uint64_t, Address> id_to_token_;
    uint64_t token_count_{0};
};

} // namespace amm

#endif // AMM_REGISTRY_HPP
