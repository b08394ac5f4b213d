#pragma once

/**
 * @file conversation_memory.h
 * @brief Verbatim session history
 *
 * Messages get increasing sequence numbers so a background compressor can
 * replace exactly the prefix it summarized, even if newer turns were
 * appended while it was running.
 */

#include "core/types.h"
#include <string>
#include <vector>
#include <mutex>
#include <cstdint>

namespace parley {
namespace memory {

/**
 * @brief Message plus its position in the session
 */
struct SequencedMessage {
    uint64_t seq = 0;
    Message message;
};

/**
 * @brief Slice of history chosen for compression
 */
struct CompressionCandidate {
    std::vector<Message> messages;
    uint64_t last_seq = 0;       ///< Highest sequence number included

    bool empty() const { return messages.empty(); }
};

/**
 * @brief Thread-safe session history
 */
class ConversationMemory {
public:
    ConversationMemory() = default;

    // Non-copyable
    ConversationMemory(const ConversationMemory&) = delete;
    ConversationMemory& operator=(const ConversationMemory&) = delete;

    void add_message(const Message& message);

    /// Appends several messages atomically (one completed turn)
    void add_messages(const std::vector<Message>& messages);

    std::vector<Message> get_messages() const;

    /// Last n messages, oldest first
    std::vector<Message> get_recent_messages(size_t n) const;

    size_t message_count() const;

    /// Non-summary messages, the quantity the compression threshold applies to
    size_t verbatim_count() const;

    void clear();

    /**
     * @brief Everything except the newest keep_recent verbatim messages
     *
     * Existing summary messages are included so repeated compression folds
     * them into the new summary. Empty when nothing is old enough.
     */
    CompressionCandidate compression_candidate(size_t keep_recent) const;

    /**
     * @brief Replace messages with seq <= last_seq by one summary message
     * @return Number of messages removed
     */
    size_t replace_prefix(uint64_t last_seq, const std::string& summary_text);

private:
    mutable std::mutex mutex_;
    std::vector<SequencedMessage> messages_;
    uint64_t next_seq_ = 1;
};

/// True for the system message a compression pass inserted
bool is_summary_message(const Message& message);

} // namespace memory
} // namespace parley
