// =============================================================================
// chain.cpp - Execution environment: clock, native balances, journal, events
// =============================================================================

#include "amm/chain.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace amm {

// =============================================================================
// Internal Constants
// =============================================================================

namespace {

// Contract identities live in their own prefix so they never collide with
// externally chosen account ids
constexpr uint8_t CONTRACT_PREFIX = 0xC0;

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

Chain::Chain() = default;

// =============================================================================
// Logical Clock
// =============================================================================

uint64_t Chain::block_number() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return block_number_;
}

void Chain::advance_blocks(uint64_t count) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    block_number_ += count;
}

Address Chain::new_address() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Address addr = addresses::from_id(next_address_++);
    addr[0] = CONTRACT_PREFIX;
    return addr;
}

// =============================================================================
// Native Currency
// =============================================================================

Amount Chain::balance_of(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = native_balances_.find(account);
    return it != native_balances_.end() ? it->second : Amount(0);
}

void Chain::mint_native(const Address& to, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Amount& balance = native_balances_[to];
    Amount before = balance;
    balance += amount;
    record([this, to, before] { native_balances_[to] = before; });
}

void Chain::transfer_native(const Address& from, const Address& to, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (amount == 0) return;

    if (rejects_native_.count(to) != 0) {
        throw ExchangeError(ErrorCode::ASSET_TRANSFER_FAILED,
                            "Chain: recipient " + addresses::to_hex(to) + " rejected native transfer");
    }

    Amount from_before = balance_of(from);
    if (from_before < amount) {
        throw ExchangeError(ErrorCode::ASSET_TRANSFER_FAILED,
                            "Chain: insufficient native balance for " + addresses::to_hex(from));
    }
    if (from == to) return;
    Amount to_before = balance_of(to);

    native_balances_[from] = from_before - amount;
    native_balances_[to] = to_before + amount;

    record([this, from, to, from_before, to_before] {
        native_balances_[to] = to_before;
        native_balances_[from] = from_before;
    });
}

void Chain::set_rejects_native(const Address& account, bool rejects) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (rejects) {
        rejects_native_.insert(account);
    } else {
        rejects_native_.erase(account);
    }
}

// =============================================================================
// Transactions
// =============================================================================

void Chain::transact(const TxCallback& callback) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    const size_t checkpoint = journal_.size();
    if (depth_ == 0) {
        tx_first_event_ = events_.size();
    }
    ++depth_;

    try {
        callback();
    } catch (const std::exception& e) {
        revert_to(checkpoint);
        if (--depth_ == 0) {
            journal_.clear();
            reverted_.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("transaction reverted at block {}: {}", block_number_, e.what());
        }
        throw;
    } catch (...) {
        revert_to(checkpoint);
        if (--depth_ == 0) {
            journal_.clear();
            reverted_.fetch_add(1, std::memory_order_relaxed);
        }
        throw;
    }

    if (--depth_ == 0) {
        journal_.clear();
        committed_.fetch_add(1, std::memory_order_relaxed);
        notify(tx_first_event_);
    }
}

bool Chain::in_transaction() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return depth_ > 0;
}

void Chain::record(UndoFn undo) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (depth_ == 0) return;
    journal_.push_back(std::move(undo));
}

void Chain::revert_to(size_t checkpoint) {
    while (journal_.size() > checkpoint) {
        UndoFn undo = std::move(journal_.back());
        journal_.pop_back();
        undo();
    }
}

// =============================================================================
// Events
// =============================================================================

void Chain::emit(const Address& emitter, EventData data) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    events_.push_back(LogEntry{block_number_, emitter, std::move(data)});
    if (depth_ == 0) {
        notify(events_.size() - 1);
        return;
    }
    record([this] { events_.pop_back(); });
}

std::vector<LogEntry> Chain::events() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return events_;
}

std::vector<LogEntry> Chain::events_since(size_t index) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (index >= events_.size()) return {};
    return std::vector<LogEntry>(events_.begin() + static_cast<std::ptrdiff_t>(index), events_.end());
}

size_t Chain::event_count() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return events_.size();
}

void Chain::subscribe(EventListener* listener) {
    if (!listener) return;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void Chain::unsubscribe(EventListener* listener) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

// Delivers a snapshot of [first_event, end). Events a listener emits while
// being notified are delivered by their own commit.
void Chain::notify(size_t first_event) {
    if (first_event >= events_.size()) return;
    const std::vector<LogEntry> batch(events_.begin() + static_cast<std::ptrdiff_t>(first_event),
                                      events_.end());
    const std::vector<EventListener*> listeners = listeners_;
    for (const LogEntry& entry : batch) {
        for (EventListener* listener : listeners) {
            listener->on_event(entry);
        }
    }
}

// =============================================================================
// Statistics
// =============================================================================

Chain::Stats Chain::get_stats() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return Stats{
        committed_.load(std::memory_order_relaxed),
        reverted_.load(std::memory_order_relaxed),
        static_cast<uint64_t>(events_.size())
    };
}

} // namespace amm
