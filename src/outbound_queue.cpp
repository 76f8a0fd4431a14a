#include <relay/chat/outbound_queue.hpp>

#include <utility>

namespace relay::chat
{
    OutboundQueue::OutboundQueue(std::size_t capacity)
        : mutex_(), items_(), capacity_(capacity), closed_(false), ready_()
    {
    }

    OutboundQueue::PushResult OutboundQueue::try_push(std::string frame)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return PushResult::Closed;
            if (items_.size() >= capacity_)
                return PushResult::Full;
            items_.push_back(std::move(frame));
        }

        notify();
        return PushResult::Queued;
    }

    bool OutboundQueue::close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return false;
            closed_ = true;
        }

        notify();
        return true;
    }

    std::optional<std::string> OutboundQueue::try_pop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty())
            return std::nullopt;

        std::string front = std::move(items_.front());
        items_.pop_front();
        return front;
    }

    bool OutboundQueue::drained() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && items_.empty();
    }

    bool OutboundQueue::is_closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t OutboundQueue::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    void OutboundQueue::set_ready_handler(ReadyHandler handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = std::move(handler);
    }

    void OutboundQueue::notify()
    {
        ReadyHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = ready_;
        }

        if (handler)
            handler();
    }

} // namespace relay::chat
