/**
 * JsonlConversationLog.hpp - Append-only JSON-lines store for finished turns
 */

#pragma once

#include "gideon/llm/LanguageModel.hpp"

#include <memory>
#include <string>

namespace gideon::llm {

/**
 * appendTurn() only queues; a worker thread owns the file and writes
 * one {"timestamp", "user", "assistant"} object per line.
 */
class JsonlConversationLog : public ConversationLog {
public:
    explicit JsonlConversationLog(const std::string& path);
    ~JsonlConversationLog() override;

    JsonlConversationLog(const JsonlConversationLog&) = delete;
    JsonlConversationLog& operator=(const JsonlConversationLog&) = delete;

    // false if the file could not be opened for append
    bool isOpen() const;

    void appendTurn(const ConversationTurn& turn) override;

    // Block until every queued turn is on disk
    void flush();

    std::size_t written() const;
    std::size_t dropped() const;

    static std::string toJsonLine(const ConversationTurn& turn);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gideon::llm
