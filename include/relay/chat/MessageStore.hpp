#ifndef RELAY_CHAT_MESSAGE_STORE_HPP
#define RELAY_CHAT_MESSAGE_STORE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <relay/chat/protocol.hpp> // ChatMessage

namespace relay::chat
{
    /**
     * @brief Storage abstraction for chat messages.
     *
     * Expected semantics:
     *  - append(msg): adds a message at the end of the log.
     *  - edit(id, requester, content): changes the content of the message
     *    with this id and marks it edited, only when requester is its author.
     *  - remove(id, requester): deletes the message with this id, only when
     *    requester is its author. Survivors keep their relative order.
     *  - recent(limit):
     *      -> returns the last min(size, limit) messages
     *      -> ordered oldest-first
     *
     * "Not found" and "not the author" are reported the same way (false).
     *
     * Implementations are not synchronized; the Hub is their only caller.
     */
    class IMessageStore
    {
    public:
        virtual ~IMessageStore() = default;

        virtual void append(const ChatMessage &msg) = 0;

        virtual bool edit(const std::string &id,
                          const std::string &requesterId,
                          const std::string &content) = 0;

        virtual bool remove(const std::string &id, const std::string &requesterId) = 0;

        virtual std::vector<ChatMessage> recent(std::size_t limit) const = 0;

        virtual std::optional<ChatMessage> find(const std::string &id) const = 0;

        virtual std::size_t size() const = 0;
    };

} // namespace relay::chat

#endif // RELAY_CHAT_MESSAGE_STORE_HPP
