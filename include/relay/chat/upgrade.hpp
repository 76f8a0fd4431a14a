#ifndef RELAY_CHAT_UPGRADE_HPP
#define RELAY_CHAT_UPGRADE_HPP

#include <optional>
#include <string>
#include <string_view>

namespace relay::chat
{
    /// Path and display name extracted from an upgrade request target.
    struct UpgradeTarget
    {
        std::string path;
        std::string username;
    };

    /// Value of the first @p key parameter in the query, percent-decoded.
    std::optional<std::string> query_param(std::string_view target, std::string_view key);

    /// Decodes %XX escapes and '+'; malformed escapes are kept verbatim.
    std::string percent_decode(std::string_view in);

    /// Copy of @p in with every byte that is not part of a well-formed
    /// UTF-8 sequence replaced by U+FFFD.
    std::string sanitize_utf8(std::string_view in);

    /**
     * @brief Split "/ws?username=alice" into its path and display name.
     *
     * The display name falls back to @p defaultUsername when the parameter
     * is absent or empty. Decoded bytes that are not valid UTF-8 are
     * replaced by U+FFFD.
     */
    UpgradeTarget parse_upgrade_target(std::string_view target, std::string_view defaultUsername);

} // namespace relay::chat

#endif // RELAY_CHAT_UPGRADE_HPP
