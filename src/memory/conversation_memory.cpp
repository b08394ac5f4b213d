/**
 * @file conversation_memory.cpp
 * @brief Conversation memory implementation
 */

#include "memory/conversation_memory.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>

namespace parley {
namespace memory {

bool is_summary_message(const Message& message) {
    return message.role == MessageRole::System &&
           utils::starts_with(message.content, constants::memory::SUMMARY_PREFIX);
}

void ConversationMemory::add_message(const Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back({next_seq_++, message});
}

void ConversationMemory::add_messages(const std::vector<Message>& messages) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& msg : messages) {
        messages_.push_back({next_seq_++, msg});
    }
}

std::vector<Message> ConversationMemory::get_messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Message> result;
    result.reserve(messages_.size());
    for (const auto& entry : messages_) {
        result.push_back(entry.message);
    }
    return result;
}

std::vector<Message> ConversationMemory::get_recent_messages(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t start = messages_.size() > n ? messages_.size() - n : 0;
    std::vector<Message> result;
    result.reserve(messages_.size() - start);
    for (size_t i = start; i < messages_.size(); ++i) {
        result.push_back(messages_[i].message);
    }
    return result;
}

size_t ConversationMemory::message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

size_t ConversationMemory::verbatim_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(messages_.begin(), messages_.end(),
        [](const SequencedMessage& entry) { return !is_summary_message(entry.message); }));
}

void ConversationMemory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.clear();
    LOG_MEMORY("Conversation history cleared");
}

CompressionCandidate ConversationMemory::compression_candidate(size_t keep_recent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    CompressionCandidate candidate;

    // Walk back over keep_recent verbatim messages; everything before is old
    size_t kept = 0;
    size_t cut = messages_.size();
    while (cut > 0 && kept < keep_recent) {
        --cut;
        if (!is_summary_message(messages_[cut].message)) ++kept;
    }
    // Never split an assistant tool-call from its tool results
    while (cut > 0 && cut < messages_.size() && messages_[cut].message.role == MessageRole::Tool) {
        --cut;
    }

    for (size_t i = 0; i < cut; ++i) {
        candidate.messages.push_back(messages_[i].message);
        candidate.last_seq = messages_[i].seq;
    }
    return candidate;
}

size_t ConversationMemory::replace_prefix(uint64_t last_seq, const std::string& summary_text) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto end = std::find_if(messages_.begin(), messages_.end(),
        [last_seq](const SequencedMessage& entry) { return entry.seq > last_seq; });
    size_t removed = static_cast<size_t>(std::distance(messages_.begin(), end));
    if (removed == 0) {
        return 0;
    }

    // The summary reuses the last replaced sequence number so order is kept
    SequencedMessage summary{last_seq, Message::system(summary_text)};
    messages_.erase(messages_.begin(), end);
    messages_.insert(messages_.begin(), summary);
    LOG_MEMORY("replaced " + std::to_string(removed) + " messages with a summary");
    return removed;
}

} // namespace memory
} // namespace parley
