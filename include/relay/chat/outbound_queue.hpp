#ifndef RELAY_CHAT_OUTBOUND_QUEUE_HPP
#define RELAY_CHAT_OUTBOUND_QUEUE_HPP

/**
 * @file outbound_queue.hpp
 * @brief Bounded single-consumer FIFO with a half-close signal.
 *
 * The Hub pushes serialized events without ever blocking; a push onto a
 * full queue fails and the Hub treats the consumer as dead. The Writer pump
 * is the only consumer. Closing the queue keeps already buffered frames
 * poppable; the consumer sees drained() once the last one is taken.
 */

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace relay::chat
{
    class OutboundQueue
    {
    public:
        enum class PushResult
        {
            Queued,
            Full,
            Closed,
        };

        /// Called (outside the lock) after a successful push and on close.
        using ReadyHandler = std::function<void()>;

        explicit OutboundQueue(std::size_t capacity);

        OutboundQueue(const OutboundQueue &) = delete;
        OutboundQueue &operator=(const OutboundQueue &) = delete;

        /// Non-blocking enqueue.
        PushResult try_push(std::string frame);

        /// Returns true for the call that actually closed the queue.
        bool close();

        std::optional<std::string> try_pop();

        /// Closed and nothing left to pop.
        bool drained() const;

        bool is_closed() const;
        std::size_t size() const;
        std::size_t capacity() const noexcept { return capacity_; }

        void set_ready_handler(ReadyHandler handler);

    private:
        void notify();

        mutable std::mutex mutex_;
        std::deque<std::string> items_;
        const std::size_t capacity_;
        bool closed_ = false;
        ReadyHandler ready_;
    };

} // namespace relay::chat

#endif // RELAY_CHAT_OUTBOUND_QUEUE_HPP
