#pragma once
// Call budgets: per-conversation guardrails
//
// Each conversation gets a total-call ceiling and a limit on consecutive
// unproductive retrievals. Once either trips, the budget is exhausted and
// stays exhausted until the conversation is started again.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace kosha {

struct BudgetPolicy {
    size_t max_calls = 12;          // Total tool invocations per conversation
    size_t max_unproductive = 3;    // Consecutive retrievals below the floor
    float similarity_floor = 0.25f; // Best score needed to count as productive
    size_t max_conversations = 10000; // Ledger size; least recently used is evicted
};

struct BudgetState {
    size_t calls = 0;
    size_t unproductive = 0;
    bool exhausted = false;
    std::string reason;
};

// One conversation's counters. Callers lock mutex() around
// admit() ... record() so a conversation's calls stay sequential.
class CallBudget {
public:
    explicit CallBudget(const BudgetPolicy& policy) : policy_(policy) {}

    std::mutex& mutex() { return mutex_; }

    // False when the conversation may not make another call
    bool admit() {
        if (state_.exhausted) return false;
        if (state_.calls >= policy_.max_calls) {
            exhaust("reached the limit of " + std::to_string(policy_.max_calls) + " tool calls");
            return false;
        }
        if (state_.unproductive >= policy_.max_unproductive) {
            exhaust(std::to_string(state_.unproductive) +
                    " consecutive retrievals found nothing above the similarity floor");
            return false;
        }
        return true;
    }

    // Account for a call that ran. best_score is the top similarity of a
    // retrieval, absent when it returned nothing or failed.
    void record(bool retrieval, const float* best_score) {
        state_.calls++;
        if (!retrieval) return;
        if (best_score && *best_score >= policy_.similarity_floor) {
            state_.unproductive = 0;
        } else {
            state_.unproductive++;
        }
    }

    void reset() { state_ = BudgetState{}; }

    const BudgetState& state() const { return state_; }
    const BudgetPolicy& policy() const { return policy_; }

    // Ledger tick of the last acquire
    uint64_t last_used() const { return last_used_.load(std::memory_order_relaxed); }
    void touch(uint64_t tick) { last_used_.store(tick, std::memory_order_relaxed); }

private:
    void exhaust(std::string reason) {
        state_.exhausted = true;
        state_.reason = std::move(reason);
    }

    BudgetPolicy policy_;
    BudgetState state_;
    std::mutex mutex_;
    std::atomic<uint64_t> last_used_{0};
};

// Conversation id -> budget. The table lock is held only for lookup
// and insert; different conversations never contend beyond that.
// Holds at most max_conversations entries: inserting past the cap drops
// the least recently used one, which starts fresh if it comes back.
class BudgetLedger {
public:
    explicit BudgetLedger(BudgetPolicy policy = {}) : policy_(policy) {}

    // Existing budget, or a fresh one for an unseen conversation
    std::shared_ptr<CallBudget> acquire(const std::string& conversation_id) {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = budgets_.find(conversation_id);
            if (it != budgets_.end()) {
                it->second->touch(++tick_);
                return it->second;
            }
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = budgets_.find(conversation_id);
        if (it == budgets_.end()) {
            if (policy_.max_conversations > 0 && budgets_.size() >= policy_.max_conversations) {
                evict_oldest();
            }
            it = budgets_.emplace(conversation_id, std::make_shared<CallBudget>(policy_)).first;
        }
        it->second->touch(++tick_);
        return it->second;
    }

    // Create or reset. Waits for an in-flight call of this conversation.
    void start(const std::string& conversation_id) {
        auto budget = acquire(conversation_id);
        std::lock_guard<std::mutex> lock(budget->mutex());
        budget->reset();
    }

    // Forget the conversation; true if it was known
    bool end(const std::string& conversation_id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return budgets_.erase(conversation_id) > 0;
    }

    // Copy of the counters, or nothing for an unknown conversation
    bool snapshot(const std::string& conversation_id, BudgetState& out) const {
        std::shared_ptr<CallBudget> budget;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = budgets_.find(conversation_id);
            if (it == budgets_.end()) return false;
            budget = it->second;
        }
        std::lock_guard<std::mutex> lock(budget->mutex());
        out = budget->state();
        return true;
    }

    size_t active() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return budgets_.size();
    }

    const BudgetPolicy& policy() const { return policy_; }

private:
    // Caller holds the table lock exclusively
    void evict_oldest() {
        auto oldest = budgets_.begin();
        for (auto it = budgets_.begin(); it != budgets_.end(); ++it) {
            if (it->second->last_used() < oldest->second->last_used()) oldest = it;
        }
        if (oldest != budgets_.end()) budgets_.erase(oldest);
    }

    BudgetPolicy policy_;
    std::atomic<uint64_t> tick_{0};
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CallBudget>> budgets_;
};

} // namespace kosha
