#ifndef RELAY_CHAT_PROTOCOL_HPP
#define RELAY_CHAT_PROTOCOL_HPP

/**
 * @file protocol.hpp
 * @brief JSON wire protocol of the chat relay.
 *
 * Every frame is a flat JSON object discriminated by "type".
 *
 * Inbound (client -> server):
 *
 *   { "type": "message", "content": "hi" }
 *   { "type": "typing",  "isTyping": true }
 *   { "type": "edit",    "messageId": "...", "content": "bye" }
 *   { "type": "delete",  "messageId": "..." }
 *
 * Outbound (server -> client):
 *
 *   { "id", "type": "message", "username", "userId", "content", "timestamp", "edited" }
 *   { "type": "userList", "users": [ { "id", "username", "isTyping", "lastSeen" } ], "count", "timestamp" }
 *   { "type": "messageEdited",  "messageId", "content", "timestamp" }
 *   { "type": "messageDeleted", "messageId", "timestamp" }
 *
 * Timestamps are ISO-8601 UTC with millisecond precision.
 */

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace relay::chat
{
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    /// A persisted chat line.
    struct ChatMessage
    {
        std::string id;
        std::string username; ///< author display name at time of authorship
        std::string userId;   ///< author identity
        std::string content;
        TimePoint timestamp{};
        bool edited = false;
    };

    /// One entry of a presence snapshot.
    struct Presence
    {
        std::string id;
        std::string username;
        bool isTyping = false;
        TimePoint lastSeen{};
    };

    // ---- Inbound commands --------------------------------------------------

    struct SendMessage
    {
        std::string content;
    };

    struct SetTyping
    {
        bool isTyping = false;
    };

    struct EditMessage
    {
        std::string messageId;
        std::string content;
    };

    struct DeleteMessage
    {
        std::string messageId;
    };

    using Command = std::variant<SendMessage, SetTyping, EditMessage, DeleteMessage>;

    /**
     * @brief Decode one inbound text frame.
     *
     * Returns std::nullopt for anything that is not a known, well-formed
     * command; @p error then describes why (for logging only).
     */
    std::optional<Command> parse_command(std::string_view frame, std::string &error);

    /// Name of the command variant, as it appears in "type".
    const char *command_name(const Command &cmd) noexcept;

    // ---- Outbound events ---------------------------------------------------

    std::string serialize_message(const ChatMessage &msg);

    std::string serialize_user_list(const std::vector<Presence> &users, TimePoint now);

    std::string serialize_message_edited(const std::string &messageId,
                                         const std::string &content,
                                         TimePoint now);

    std::string serialize_message_deleted(const std::string &messageId, TimePoint now);

    // ---- Helpers -----------------------------------------------------------

    /// ISO-8601 UTC, e.g. 2025-12-07T10:15:30.123Z
    std::string format_timestamp(TimePoint tp);

    /// Random (v4) UUID in canonical textual form.
    std::string make_uuid();

} // namespace relay::chat

#endif // RELAY_CHAT_PROTOCOL_HPP
