#ifndef RELAY_CHAT_MEMORY_MESSAGE_STORE_HPP
#define RELAY_CHAT_MEMORY_MESSAGE_STORE_HPP

#include <vector>

#include <relay/chat/MessageStore.hpp>

namespace relay::chat
{
    /// In-process log; vanishes with the process.
    class MemoryMessageStore : public IMessageStore
    {
    public:
        MemoryMessageStore() = default;

        void append(const ChatMessage &msg) override;

        bool edit(const std::string &id,
                  const std::string &requesterId,
                  const std::string &content) override;

        bool remove(const std::string &id, const std::string &requesterId) override;

        [[nodiscard]] std::vector<ChatMessage> recent(std::size_t limit) const override;

        [[nodiscard]] std::optional<ChatMessage> find(const std::string &id) const override;

        [[nodiscard]] std::size_t size() const override { return messages_.size(); }

    private:
        std::vector<ChatMessage>::iterator find_owned(const std::string &id,
                                                      const std::string &requesterId);

        std::vector<ChatMessage> messages_;
    };

} // namespace relay::chat

#endif // RELAY_CHAT_MEMORY_MESSAGE_STORE_HPP
