#ifndef AGENTMUX_MESSAGE_BUFFER_HPP
#define AGENTMUX_MESSAGE_BUFFER_HPP

#include <agentmux/types.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace agentmux
{

/// Result of MessageBuffer::read
struct ReadResult
{
    std::vector<BufferedMessage> messages;
    bool truncated = false;   // start_offset was below the retained floor
    uint64_t next_offset = 0; // Offset to pass to the next read
    bool has_more = false;    // More messages were available past the limit

    json to_json() const;
};

/// Fixed-capacity ring of received messages for one session.
///
/// Single writer (the session's read loop), any number of concurrent readers.
/// Readers never take a lock shared with the writer: every slot holds an
/// immutable message published through an atomic shared_ptr, and a reader
/// checks the sequence number it finds against the one it expects. A mismatch
/// means the slot was recycled, so the reader restarts from the new floor.
class MessageBuffer
{
  public:
    explicit MessageBuffer(size_t capacity = 1000, size_t max_bytes = 1024 * 1024);

    MessageBuffer(const MessageBuffer&) = delete;
    MessageBuffer& operator=(const MessageBuffer&) = delete;

    /// Append a decoded message. Writer thread only.
    /// @return Sequence number assigned to the message
    uint64_t append(Message message, json raw, size_t size);

    /// Read up to max_count messages starting at start_offset
    ReadResult read(uint64_t start_offset, size_t max_count) const;

    /// Up to the last count retained messages, oldest first
    std::vector<BufferedMessage> tail(size_t count) const;

    /// Number of retained messages
    size_t size() const;

    /// Sequence number the next append will receive
    uint64_t next_sequence() const
    {
        return next_seq_.load(std::memory_order_acquire);
    }

    /// Oldest retained sequence number
    uint64_t floor() const
    {
        return floor_.load(std::memory_order_acquire);
    }

    /// Payload bytes currently retained
    size_t total_bytes() const
    {
        return total_bytes_.load(std::memory_order_relaxed);
    }

    size_t capacity() const
    {
        return capacity_;
    }

    size_t max_bytes() const
    {
        return max_bytes_;
    }

  private:
    using Slot = std::shared_ptr<const BufferedMessage>;

    size_t capacity_;
    size_t max_bytes_;

    std::vector<Slot> slots_;

    // Writer-owned byte accounting, indexed like slots_
    std::vector<size_t> slot_bytes_;

    std::atomic<uint64_t> next_seq_{0};
    std::atomic<uint64_t> floor_{0};
    std::atomic<size_t> total_bytes_{0};

    // Collect [start, end) into out; false if a slot was recycled under the reader
    bool collect(uint64_t start, uint64_t end, std::vector<BufferedMessage>& out) const;
};

} // namespace agentmux

#endif // AGENTMUX_MESSAGE_BUFFER_HPP
