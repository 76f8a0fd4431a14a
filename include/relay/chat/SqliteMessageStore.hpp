#ifndef RELAY_CHAT_SQLITE_MESSAGE_STORE_HPP
#define RELAY_CHAT_SQLITE_MESSAGE_STORE_HPP

#include <string>
#include <vector>
#include <optional>

#include <relay/chat/MessageStore.hpp>

struct sqlite3;

namespace relay::chat
{
    /**
     * @brief Durable message log backed by SQLite (WAL journal).
     *
     * Insertion order is kept by an autoincrement sequence column, so edits
     * and deletes never reorder survivors. Pass ":memory:" for a private
     * in-memory database. SQLite failures are thrown as std::runtime_error.
     */
    class SqliteMessageStore : public IMessageStore
    {
    public:
        explicit SqliteMessageStore(const std::string &db_path);
        ~SqliteMessageStore() override;

        SqliteMessageStore(const SqliteMessageStore &) = delete;
        SqliteMessageStore &operator=(const SqliteMessageStore &) = delete;
        SqliteMessageStore(SqliteMessageStore &&) = delete;
        SqliteMessageStore &operator=(SqliteMessageStore &&) = delete;

        void append(const ChatMessage &msg) override;

        bool edit(const std::string &id,
                  const std::string &requesterId,
                  const std::string &content) override;

        bool remove(const std::string &id, const std::string &requesterId) override;

        [[nodiscard]] std::vector<ChatMessage> recent(std::size_t limit) const override;

        [[nodiscard]] std::optional<ChatMessage> find(const std::string &id) const override;

        [[nodiscard]] std::size_t size() const override;

    private:
        sqlite3 *db_{nullptr};

        void init_schema();
    };

} // namespace relay::chat

#endif // RELAY_CHAT_SQLITE_MESSAGE_STORE_HPP
