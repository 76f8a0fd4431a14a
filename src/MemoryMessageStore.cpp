#include <relay/chat/MemoryMessageStore.hpp>

#include <algorithm>

namespace relay::chat
{
    void MemoryMessageStore::append(const ChatMessage &msg)
    {
        messages_.push_back(msg);
    }

    std::vector<ChatMessage>::iterator MemoryMessageStore::find_owned(const std::string &id,
                                                                      const std::string &requesterId)
    {
        return std::find_if(
            messages_.begin(), messages_.end(),
            [&](const ChatMessage &m)
            {
                return m.id == id && m.userId == requesterId;
            });
    }

    bool MemoryMessageStore::edit(const std::string &id,
                                  const std::string &requesterId,
                                  const std::string &content)
    {
        auto it = find_owned(id, requesterId);
        if (it == messages_.end())
            return false;

        it->content = content;
        it->edited = true;
        return true;
    }

    bool MemoryMessageStore::remove(const std::string &id, const std::string &requesterId)
    {
        auto it = find_owned(id, requesterId);
        if (it == messages_.end())
            return false;

        messages_.erase(it);
        return true;
    }

    std::vector<ChatMessage> MemoryMessageStore::recent(std::size_t limit) const
    {
        const std::size_t n = std::min(limit, messages_.size());
        return std::vector<ChatMessage>(messages_.end() - static_cast<std::ptrdiff_t>(n), messages_.end());
    }

    std::optional<ChatMessage> MemoryMessageStore::find(const std::string &id) const
    {
        auto it = std::find_if(
            messages_.begin(), messages_.end(),
            [&id](const ChatMessage &m)
            {
                return m.id == id;
            });

        if (it == messages_.end())
            return std::nullopt;
        return *it;
    }

} // namespace relay::chat
