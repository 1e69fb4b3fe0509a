/**
 * JsonlConversationLog.cpp - Conversation log writer thread
 */

#include "gideon/llm/JsonlConversationLog.hpp"
#include "gideon/core/Channel.hpp"

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gideon::llm {

constexpr std::size_t LOG_QUEUE_CAPACITY = 256;
constexpr std::chrono::milliseconds LOG_POLL{100};

struct JsonlConversationLog::Impl {
    std::string path;
    std::ofstream file;
    core::Channel<ConversationTurn> queue{LOG_QUEUE_CAPACITY};
    std::thread worker;

    std::mutex flush_mutex;
    std::condition_variable flushed_cv;
    std::size_t queued = 0;
    std::atomic<std::size_t> written{0};
    std::atomic<std::size_t> dropped{0};

    void writerLoop() {
        while (true) {
            auto turn = queue.popFor(LOG_POLL);
            if (!turn) {
                if (queue.closed() && queue.size() == 0) break;
                continue;
            }

            file << toJsonLine(*turn) << '\n';
            file.flush();
            if (!file) {
                std::cerr << "[ConversationLog] Write failed: " << path << std::endl;
                file.clear();
            }

            {
                std::lock_guard<std::mutex> lock(flush_mutex);
                written++;
            }
            flushed_cv.notify_all();
        }
    }
};

JsonlConversationLog::JsonlConversationLog(const std::string& path)
    : impl_(std::make_unique<Impl>()) {
    impl_->path = path;
    impl_->file.open(path, std::ios::out | std::ios::app);
    if (!impl_->file.is_open()) {
        std::cerr << "[ConversationLog] Cannot open " << path << std::endl;
        impl_->queue.close();
        return;
    }
    impl_->worker = std::thread([this]() { impl_->writerLoop(); });
    std::cout << "[ConversationLog] Appending turns to " << path << std::endl;
}

JsonlConversationLog::~JsonlConversationLog() {
    impl_->queue.close();
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

bool JsonlConversationLog::isOpen() const {
    return impl_->file.is_open();
}

void JsonlConversationLog::appendTurn(const ConversationTurn& turn) {
    std::lock_guard<std::mutex> lock(impl_->flush_mutex);
    if (!impl_->queue.push(turn)) {
        impl_->dropped++;
        return;
    }
    impl_->queued++;
}

void JsonlConversationLog::flush() {
    std::unique_lock<std::mutex> lock(impl_->flush_mutex);
    impl_->flushed_cv.wait(lock, [this]() {
        return impl_->written.load() >= impl_->queued || !impl_->worker.joinable();
    });
}

std::size_t JsonlConversationLog::written() const {
    return impl_->written.load();
}

std::size_t JsonlConversationLog::dropped() const {
    return impl_->dropped.load();
}

std::string JsonlConversationLog::toJsonLine(const ConversationTurn& turn) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        turn.timestamp.time_since_epoch()).count();
    json line = {
        {"timestamp", ms},
        {"user", turn.user_text},
        {"assistant", turn.assistant_text}
    };
    // Invalid UTF-8 from the recognizer is replaced rather than thrown on
    return line.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace gideon::llm
