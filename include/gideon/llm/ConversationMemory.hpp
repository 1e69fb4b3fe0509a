/**
 * ConversationMemory.hpp - Bounded FIFO of recent conversation turns
 */

#pragma once

#include "gideon/Types.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace gideon::llm {

class ConversationMemory {
public:
    explicit ConversationMemory(std::size_t capacity = 10);

    // Oldest turn is evicted once capacity is reached
    void append(ConversationTurn turn);

    /**
     * Last `k` turns, oldest first (the order a chat prompt wants them).
     */
    std::vector<ConversationTurn> recent(std::size_t k) const;
    std::vector<ConversationTurn> all() const;

    std::size_t size() const;
    std::size_t capacity() const;

    // Capacity is at least 1; shrinking evicts the oldest turns
    void setCapacity(std::size_t capacity);

    void clear();
    void shrinkToFit();

private:
    void evictLocked();

    mutable std::mutex mutex_;
    std::deque<ConversationTurn> turns_;
    std::size_t capacity_;
};

} // namespace gideon::llm
