#ifndef RELAY_CHAT_CLIENT_HPP
#define RELAY_CHAT_CLIENT_HPP

/**
 * @file client.hpp
 * @brief Server-side representative of one live connection.
 *
 * Identity and display name never change. The outbound queue is shared by
 * the Hub (producer) and the connection's Writer (consumer). Presence flags
 * are written only from the Hub's event loop.
 */

#include <cstddef>
#include <string>
#include <utility>

#include <relay/chat/outbound_queue.hpp>
#include <relay/chat/protocol.hpp>

namespace relay::chat
{
    class Client
    {
    public:
        Client(std::string id, std::string username, std::size_t queueCapacity)
            : id_(std::move(id)),
              username_(std::move(username)),
              queue_(queueCapacity),
              isTyping_(false),
              lastSeen_(Clock::now())
        {
        }

        Client(const Client &) = delete;
        Client &operator=(const Client &) = delete;

        const std::string &id() const noexcept { return id_; }
        const std::string &username() const noexcept { return username_; }

        OutboundQueue &queue() noexcept { return queue_; }
        const OutboundQueue &queue() const noexcept { return queue_; }

        // Hub-only state.
        bool is_typing() const noexcept { return isTyping_; }
        void set_typing(bool typing) noexcept { isTyping_ = typing; }

        TimePoint last_seen() const noexcept { return lastSeen_; }
        void touch(TimePoint when) noexcept { lastSeen_ = when; }

        Presence presence() const
        {
            return Presence{id_, username_, isTyping_, lastSeen_};
        }

    private:
        const std::string id_;
        const std::string username_;
        OutboundQueue queue_;
        bool isTyping_;
        TimePoint lastSeen_;
    };

} // namespace relay::chat

#endif // RELAY_CHAT_CLIENT_HPP
