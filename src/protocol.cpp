#include <relay/chat/protocol.hpp>

#include <cstdio>
#include <ctime>
#include <type_traits>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <nlohmann/json.hpp>

namespace relay::chat
{
    namespace
    {
        template <typename>
        inline constexpr bool always_false_v = false;

        // Invalid UTF-8 (display names come from the request target) is
        // replaced with U+FFFD instead of throwing.
        std::string dump(const nlohmann::json &j)
        {
            return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        const nlohmann::json *string_field(const nlohmann::json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
                return nullptr;
            return &*it;
        }
    } // namespace

    std::optional<Command> parse_command(std::string_view frame, std::string &error)
    {
        nlohmann::json j = nlohmann::json::parse(frame.begin(), frame.end(), nullptr, false);
        if (j.is_discarded())
        {
            error = "invalid JSON";
            return std::nullopt;
        }

        if (!j.is_object())
        {
            error = "frame is not a JSON object";
            return std::nullopt;
        }

        const auto *type = string_field(j, "type");
        if (!type)
        {
            error = "missing \"type\"";
            return std::nullopt;
        }

        const auto &kind = type->get_ref<const std::string &>();

        if (kind == "message")
        {
            const auto *content = string_field(j, "content");
            if (!content || content->get_ref<const std::string &>().empty())
            {
                error = "message requires a non-empty \"content\"";
                return std::nullopt;
            }
            return SendMessage{content->get<std::string>()};
        }

        if (kind == "typing")
        {
            auto it = j.find("isTyping");
            if (it == j.end() || !it->is_boolean())
            {
                error = "typing requires a boolean \"isTyping\"";
                return std::nullopt;
            }
            return SetTyping{it->get<bool>()};
        }

        if (kind == "edit")
        {
            const auto *id = string_field(j, "messageId");
            const auto *content = string_field(j, "content");
            if (!id || !content)
            {
                error = "edit requires \"messageId\" and \"content\"";
                return std::nullopt;
            }
            return EditMessage{id->get<std::string>(), content->get<std::string>()};
        }

        if (kind == "delete")
        {
            const auto *id = string_field(j, "messageId");
            if (!id)
            {
                error = "delete requires \"messageId\"";
                return std::nullopt;
            }
            return DeleteMessage{id->get<std::string>()};
        }

        error = "unknown type \"" + kind + "\"";
        return std::nullopt;
    }

    const char *command_name(const Command &cmd) noexcept
    {
        return std::visit(
            [](const auto &c) -> const char *
            {
                using T = std::decay_t<decltype(c)>;
                if constexpr (std::is_same_v<T, SendMessage>)
                    return "message";
                else if constexpr (std::is_same_v<T, SetTyping>)
                    return "typing";
                else if constexpr (std::is_same_v<T, EditMessage>)
                    return "edit";
                else if constexpr (std::is_same_v<T, DeleteMessage>)
                    return "delete";
                else
                    static_assert(always_false_v<T>, "unhandled command");
            },
            cmd);
    }

    std::string serialize_message(const ChatMessage &msg)
    {
        nlohmann::json j{
            {"id", msg.id},
            {"type", "message"},
            {"username", msg.username},
            {"userId", msg.userId},
            {"content", msg.content},
            {"timestamp", format_timestamp(msg.timestamp)},
            {"edited", msg.edited},
        };
        return dump(j);
    }

    std::string serialize_user_list(const std::vector<Presence> &users, TimePoint now)
    {
        nlohmann::json list = nlohmann::json::array();
        for (const auto &u : users)
        {
            list.push_back({
                {"id", u.id},
                {"username", u.username},
                {"isTyping", u.isTyping},
                {"lastSeen", format_timestamp(u.lastSeen)},
            });
        }

        nlohmann::json j{
            {"type", "userList"},
            {"users", std::move(list)},
            {"count", users.size()},
            {"timestamp", format_timestamp(now)},
        };
        return dump(j);
    }

    std::string serialize_message_edited(const std::string &messageId,
                                         const std::string &content,
                                         TimePoint now)
    {
        nlohmann::json j{
            {"type", "messageEdited"},
            {"messageId", messageId},
            {"content", content},
            {"timestamp", format_timestamp(now)},
        };
        return dump(j);
    }

    std::string serialize_message_deleted(const std::string &messageId, TimePoint now)
    {
        nlohmann::json j{
            {"type", "messageDeleted"},
            {"messageId", messageId},
            {"timestamp", format_timestamp(now)},
        };
        return dump(j);
    }

    std::string format_timestamp(TimePoint tp)
    {
        using namespace std::chrono;

        const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
        std::time_t tt = static_cast<std::time_t>(ms / 1000);
        long long millis = ms % 1000;
        if (millis < 0)
        {
            millis += 1000;
            --tt;
        }

        std::tm tm{};
#if defined(_WIN32)
        gmtime_s(&tm, &tt);
#else
        gmtime_r(&tt, &tm);
#endif
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      tm.tm_year + 1900,
                      tm.tm_mon + 1,
                      tm.tm_mday,
                      tm.tm_hour,
                      tm.tm_min,
                      tm.tm_sec,
                      static_cast<int>(millis));
        return buf;
    }

    std::string make_uuid()
    {
        // random_generator is not thread-safe; one per thread.
        thread_local boost::uuids::random_generator gen;
        return boost::uuids::to_string(gen());
    }

} // namespace relay::chat
