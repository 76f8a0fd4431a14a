#include <relay/chat/SqliteMessageStore.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <sqlite3.h>

namespace relay::chat
{
    // ───────────────────────── Internal helpers ─────────────────────────

    namespace
    {
        void sqlite_check(int rc, sqlite3 *db, const char *stage)
        {
            if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE)
            {
                std::string msg = "[SqliteMessageStore] ";
                msg += stage;
                msg += " error: ";
                msg += sqlite3_errmsg(db);
                throw std::runtime_error(msg);
            }
        }

        /// Prepared statement finalized on scope exit.
        class Statement
        {
        public:
            Statement(sqlite3 *db, const char *sql, const char *stage)
                : db_(db)
            {
                sqlite_check(sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr), db_, stage);
            }

            ~Statement() { sqlite3_finalize(stmt_); }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            void bind(int index, const std::string &value, const char *stage)
            {
                sqlite_check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT), db_, stage);
            }

            void bind(int index, sqlite3_int64 value, const char *stage)
            {
                sqlite_check(sqlite3_bind_int64(stmt_, index, value), db_, stage);
            }

            /// Returns true while a row is available.
            bool step(const char *stage)
            {
                int rc = sqlite3_step(stmt_);
                sqlite_check(rc, db_, stage);
                return rc == SQLITE_ROW;
            }

            sqlite3_stmt *get() const noexcept { return stmt_; }

        private:
            sqlite3 *db_;
            sqlite3_stmt *stmt_{nullptr};
        };

        std::string column_string(sqlite3_stmt *stmt, int col)
        {
            const unsigned char *text = sqlite3_column_text(stmt, col);
            if (!text)
                return {};
            return reinterpret_cast<const char *>(text);
        }

        ChatMessage read_row(sqlite3_stmt *stmt)
        {
            ChatMessage m;
            m.id = column_string(stmt, 0);
            m.userId = column_string(stmt, 1);
            m.username = column_string(stmt, 2);
            m.content = column_string(stmt, 3);
            m.timestamp = TimePoint{std::chrono::milliseconds{sqlite3_column_int64(stmt, 4)}};
            m.edited = sqlite3_column_int(stmt, 5) != 0;
            return m;
        }

        sqlite3_int64 to_millis(TimePoint tp)
        {
            return static_cast<sqlite3_int64>(
                std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
        }
    } // namespace

    // ───────────────────────── Ctor / Dtor ─────────────────────────

    SqliteMessageStore::SqliteMessageStore(const std::string &db_path)
    {
        int rc = sqlite3_open(db_path.c_str(), &db_);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteMessageStore] Failed to open DB: ";
            msg += sqlite3_errstr(rc);
            sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error(msg);
        }

        char *errmsg = nullptr;
        rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteMessageStore] Failed to set WAL: ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error(msg);
        }

        try
        {
            init_schema();
        }
        catch (const std::exception &)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }

    SqliteMessageStore::~SqliteMessageStore()
    {
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    void SqliteMessageStore::init_schema()
    {
        const char *sql =
            "CREATE TABLE IF NOT EXISTS messages ("
            "  seq       INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  id        TEXT NOT NULL UNIQUE,"
            "  user_id   TEXT NOT NULL,"
            "  username  TEXT NOT NULL,"
            "  content   TEXT NOT NULL,"
            "  ts_ms     INTEGER NOT NULL,"
            "  edited    INTEGER NOT NULL DEFAULT 0"
            ");";

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteMessageStore] Failed to create table: ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            throw std::runtime_error(msg);
        }
    }

    // ───────────────────────── Mutations ─────────────────────────

    void SqliteMessageStore::append(const ChatMessage &msg)
    {
        Statement stmt(db_,
                       "INSERT INTO messages (id, user_id, username, content, ts_ms, edited) "
                       "VALUES (?1, ?2, ?3, ?4, ?5, ?6);",
                       "prepare append");

        stmt.bind(1, msg.id, "bind id");
        stmt.bind(2, msg.userId, "bind user_id");
        stmt.bind(3, msg.username, "bind username");
        stmt.bind(4, msg.content, "bind content");
        stmt.bind(5, to_millis(msg.timestamp), "bind ts");
        stmt.bind(6, static_cast<sqlite3_int64>(msg.edited ? 1 : 0), "bind edited");

        stmt.step("step append");
    }

    bool SqliteMessageStore::edit(const std::string &id,
                                  const std::string &requesterId,
                                  const std::string &content)
    {
        Statement stmt(db_,
                       "UPDATE messages SET content = ?1, edited = 1 "
                       "WHERE id = ?2 AND user_id = ?3;",
                       "prepare edit");

        stmt.bind(1, content, "bind content");
        stmt.bind(2, id, "bind id");
        stmt.bind(3, requesterId, "bind user_id");

        stmt.step("step edit");
        return sqlite3_changes(db_) > 0;
    }

    bool SqliteMessageStore::remove(const std::string &id, const std::string &requesterId)
    {
        Statement stmt(db_,
                       "DELETE FROM messages WHERE id = ?1 AND user_id = ?2;",
                       "prepare remove");

        stmt.bind(1, id, "bind id");
        stmt.bind(2, requesterId, "bind user_id");

        stmt.step("step remove");
        return sqlite3_changes(db_) > 0;
    }

    // ───────────────────────── Queries ─────────────────────────

    std::vector<ChatMessage> SqliteMessageStore::recent(std::size_t limit) const
    {
        std::vector<ChatMessage> out;
        if (limit == 0)
            return out;

        Statement stmt(db_,
                       "SELECT id, user_id, username, content, ts_ms, edited "
                       "FROM messages "
                       "ORDER BY seq DESC "
                       "LIMIT ?1;",
                       "prepare recent");

        stmt.bind(1, static_cast<sqlite3_int64>(limit), "bind limit");

        while (stmt.step("step recent"))
            out.push_back(read_row(stmt.get()));

        std::reverse(out.begin(), out.end()); // oldest-first
        return out;
    }

    std::optional<ChatMessage> SqliteMessageStore::find(const std::string &id) const
    {
        Statement stmt(db_,
                       "SELECT id, user_id, username, content, ts_ms, edited "
                       "FROM messages WHERE id = ?1;",
                       "prepare find");

        stmt.bind(1, id, "bind id");

        if (!stmt.step("step find"))
            return std::nullopt;
        return read_row(stmt.get());
    }

    std::size_t SqliteMessageStore::size() const
    {
        Statement stmt(db_, "SELECT COUNT(*) FROM messages;", "prepare size");

        if (!stmt.step("step size"))
            return 0;
        return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

} // namespace relay::chat
