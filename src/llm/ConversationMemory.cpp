/**
 * ConversationMemory.cpp - Recent-turn window used as chat context
 */

#include "gideon/llm/ConversationMemory.hpp"

#include <algorithm>

namespace gideon::llm {

ConversationMemory::ConversationMemory(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {
}

void ConversationMemory::append(ConversationTurn turn) {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.push_back(std::move(turn));
    evictLocked();
}

std::vector<ConversationTurn> ConversationMemory::recent(std::size_t k) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = std::min(k, turns_.size());
    return std::vector<ConversationTurn>(turns_.end() - static_cast<std::ptrdiff_t>(n), turns_.end());
}

std::vector<ConversationTurn> ConversationMemory::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ConversationTurn>(turns_.begin(), turns_.end());
}

std::size_t ConversationMemory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

std::size_t ConversationMemory::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

void ConversationMemory::setCapacity(std::size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = std::max<std::size_t>(capacity, 1);
    evictLocked();
}

void ConversationMemory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.clear();
}

void ConversationMemory::shrinkToFit() {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.shrink_to_fit();
}

void ConversationMemory::evictLocked() {
    while (turns_.size() > capacity_) {
        turns_.pop_front();
    }
}

} // namespace gideon::llm
