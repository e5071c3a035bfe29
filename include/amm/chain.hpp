#ifndef AMM_CHAIN_HPP
#define AMM_CHAIN_HPP

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <vector>

#include "types.hpp"
#include "event.hpp"

namespace amm {

// =============================================================================
// Chain - execution environment for exchanges
//
// Owns the logical clock used by deadlines, native currency balances and the
// event log. Every state change made inside transact() is journaled and rolled
// back if the callback throws, so nested cross-exchange calls settle
// all-or-nothing. One transaction runs at a time (recursive mutex, nested
// calls from the same thread are allowed).
// =============================================================================

class Chain {
public:
    Chain();
    ~Chain() = default;

    // Non-copyable
    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    // =========================================================================
    // Logical Clock
    // =========================================================================

    uint64_t block_number() const;
    void advance_blocks(uint64_t count = 1);

    // Allocate a fresh contract identity
    Address new_address();

    // =========================================================================
    // Native Currency
    // =========================================================================

    Amount balance_of(const Address& account) const;

    // Credit native currency out of thin air (genesis / test funding)
    void mint_native(const Address& to, const Amount& amount);

    // Throws ASSET_TRANSFER_FAILED on insufficient balance or rejecting recipient
    void transfer_native(const Address& from, const Address& to, const Amount& amount);

    // Mark an account as refusing incoming native transfers
    void set_rejects_native(const Address& account, bool rejects);

    // =========================================================================
    // Transactions
    // =========================================================================

    using TxCallback = std::function<void()>;
    using UndoFn = std::function<void()>;

    // Run callback atomically. On exception, journaled changes made since
    // entry are undone in reverse order and the exception is rethrown.
    void transact(const TxCallback& callback);

    bool in_transaction() const;

    // Register an undo action for a change just applied. Outside a
    // transaction changes are final and nothing is recorded.
    void record(UndoFn undo);

    std::recursive_mutex& mutex() const { return mutex_; }

    // =========================================================================
    // Events
    // =========================================================================

    void emit(const Address& emitter, EventData data);

    std::vector<LogEntry> events() const;
    std::vector<LogEntry> events_since(size_t index) const;
    size_t event_count() const;

    // Listeners see events once the outermost transaction commits
    void subscribe(EventListener* listener);
    void unsubscribe(EventListener* listener);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t committed;
        uint64_t reverted;
        uint64_t events;
    };
    Stats get_stats() const;

private:
    mutable std::recursive_mutex mutex_;

    uint64_t block_number_{1};
    uint64_t next_address_{1};

    std::map<Address, Amount> native_balances_;
    std::set<Address> rejects_native_;

    std::vector<LogEntry> events_;
    std::vector<EventListener*> listeners_;

    // Journal of the active (outermost) transaction
    std::vector<UndoFn> journal_;
    size_t depth_{0};
    size_t tx_first_event_{0};

    std::atomic<uint64_t> committed_{0};
    std::atomic<uint64_t> reverted_{0};

    void revert_to(size_t checkpoint);
    void notify(size_t first_event);
};

} // namespace amm

#endif // AMM_CHAIN_HPP
