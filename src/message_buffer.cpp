#include <agentmux/message_buffer.hpp>
#include <algorithm>
#include <stdexcept>

namespace agentmux
{

namespace
{
// Restarts allowed when the writer laps a reader
constexpr int kMaxReadAttempts = 8;
} // namespace

json ReadResult::to_json() const
{
    json items = json::array();
    for (const auto& msg : messages)
        items.push_back(msg.to_json());

    return {{"messages", items},
            {"truncated", truncated},
            {"next_offset", next_offset},
            {"has_more", has_more}};
}

MessageBuffer::MessageBuffer(size_t capacity, size_t max_bytes)
    : capacity_(capacity), max_bytes_(max_bytes)
{
    if (capacity_ == 0)
        throw std::invalid_argument("MessageBuffer capacity must be at least 1");

    slots_.resize(capacity_);
    slot_bytes_.assign(capacity_, 0);
}

uint64_t MessageBuffer::append(Message message, json raw, size_t size)
{
    const uint64_t seq = next_seq_.load(std::memory_order_relaxed);
    const size_t index = seq % capacity_;

    uint64_t floor = floor_.load(std::memory_order_relaxed);
    size_t total = total_bytes_.load(std::memory_order_relaxed);

    // Slot recycling: the message in this slot leaves the window
    total -= slot_bytes_[index];
    slot_bytes_[index] = 0;
    if (seq >= capacity_)
        floor = std::max<uint64_t>(floor, seq - capacity_ + 1);

    // Byte cap: evict oldest first, never the message being appended
    while (floor < seq && total + size > max_bytes_)
    {
        size_t& evicted = slot_bytes_[floor % capacity_];
        total -= evicted;
        evicted = 0;
        ++floor;
    }

    // Raise the floor before the slot is overwritten so readers see truncation
    floor_.store(floor, std::memory_order_release);

    auto entry = std::make_shared<BufferedMessage>();
    entry->seq = seq;
    entry->timestamp = std::chrono::system_clock::now();
    entry->kind = classify(message);
    entry->message = std::move(message);
    entry->raw = std::move(raw);
    entry->size = size;

    std::atomic_store_explicit(&slots_[index], Slot(std::move(entry)), std::memory_order_release);

    slot_bytes_[index] = size;
    total_bytes_.store(total + size, std::memory_order_relaxed);

    next_seq_.store(seq + 1, std::memory_order_release);
    return seq;
}

ReadResult MessageBuffer::read(uint64_t start_offset, size_t max_count) const
{
    if (max_count == 0)
        throw std::invalid_argument("read limit must be at least 1");

    ReadResult result;

    for (int attempt = 0; attempt < kMaxReadAttempts; ++attempt)
    {
        const uint64_t end = next_seq_.load(std::memory_order_acquire);
        const uint64_t floor = floor_.load(std::memory_order_acquire);

        uint64_t from = start_offset;
        if (from < floor)
        {
            result.truncated = true;
            from = floor;
        }

        if (from >= end)
        {
            result.next_offset = from;
            return result;
        }

        const uint64_t to = from + std::min<uint64_t>(max_count, end - from);

        std::vector<BufferedMessage> out;
        out.reserve(static_cast<size_t>(to - from));
        bool complete = collect(from, to, out);

        if (complete || !out.empty())
        {
            // A lapped read still returns the contiguous prefix it captured
            result.next_offset = from + out.size();
            result.has_more = result.next_offset < end || !complete;
            result.messages = std::move(out);
            return result;
        }

        // First slot already recycled; resume from the new floor
        result.truncated = true;
        start_offset = floor_.load(std::memory_order_acquire);
    }

    result.truncated = true;
    result.next_offset = floor_.load(std::memory_order_acquire);
    result.has_more = result.next_offset < next_seq_.load(std::memory_order_acquire);
    return result;
}

bool MessageBuffer::collect(uint64_t start, uint64_t end, std::vector<BufferedMessage>& out) const
{
    for (uint64_t seq = start; seq < end; ++seq)
    {
        Slot slot = std::atomic_load_explicit(&slots_[seq % capacity_], std::memory_order_acquire);
        if (!slot || slot->seq != seq)
            return false;
        out.push_back(*slot);
    }
    return true;
}

std::vector<BufferedMessage> MessageBuffer::tail(size_t count) const
{
    if (count == 0)
        return {};

    const uint64_t end = next_seq_.load(std::memory_order_acquire);
    const uint64_t from = end > count ? end - count : 0;
    return read(from, count).messages;
}

size_t MessageBuffer::size() const
{
    uint64_t end = next_seq_.load(std::memory_order_acquire);
    uint64_t floor = floor_.load(std::memory_order_acquire);
    return end > floor ? static_cast<size_t>(end - floor) : 0;
}

} // namespace agentmux
