#include <relay/chat/upgrade.hpp>

#include <utility>

namespace relay::chat
{
    namespace
    {
        int hex_value(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        // Length of the well-formed UTF-8 sequence starting at @p i, or 0.
        std::size_t utf8_sequence_length(std::string_view in, std::size_t i) noexcept
        {
            const auto b0 = static_cast<unsigned char>(in[i]);
            std::size_t len = 0;
            unsigned char lo = 0x80;
            unsigned char hi = 0xBF;

            if (b0 < 0x80)
                return 1;
            if (b0 >= 0xC2 && b0 <= 0xDF)
                len = 2;
            else if (b0 >= 0xE0 && b0 <= 0xEF)
            {
                len = 3;
                if (b0 == 0xE0)
                    lo = 0xA0;
                else if (b0 == 0xED)
                    hi = 0x9F;
            }
            else if (b0 >= 0xF0 && b0 <= 0xF4)
            {
                len = 4;
                if (b0 == 0xF0)
                    lo = 0x90;
                else if (b0 == 0xF4)
                    hi = 0x8F;
            }
            else
                return 0;

            if (i + len > in.size())
                return 0;

            for (std::size_t k = 1; k < len; ++k)
            {
                const auto b = static_cast<unsigned char>(in[i + k]);
                if (b < lo || b > hi)
                    return 0;
                lo = 0x80;
                hi = 0xBF;
            }
            return len;
        }
    } // namespace

    std::string sanitize_utf8(std::string_view in)
    {
        static constexpr std::string_view replacement = "\xEF\xBF\xBD";

        std::string out;
        out.reserve(in.size());

        std::size_t i = 0;
        while (i < in.size())
        {
            const std::size_t len = utf8_sequence_length(in, i);
            if (len == 0)
            {
                out.append(replacement);
                ++i;
                continue;
            }
            out.append(in.substr(i, len));
            i += len;
        }
        return out;
    }

    std::string percent_decode(std::string_view in)
    {
        std::string out;
        out.reserve(in.size());

        for (std::size_t i = 0; i < in.size(); ++i)
        {
            const char c = in[i];
            if (c == '+')
            {
                out.push_back(' ');
            }
            else if (c == '%' && i + 2 < in.size())
            {
                const int hi = hex_value(in[i + 1]);
                const int lo = hex_value(in[i + 2]);
                if (hi < 0 || lo < 0)
                {
                    out.push_back(c);
                    continue;
                }
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
            }
            else
            {
                out.push_back(c);
            }
        }
        return out;
    }

    std::optional<std::string> query_param(std::string_view target, std::string_view key)
    {
        const auto q = target.find('?');
        if (q == std::string_view::npos)
            return std::nullopt;

        std::string_view query = target.substr(q + 1);

        // Fragments never reach the server, but be lenient.
        if (const auto hash = query.find('#'); hash != std::string_view::npos)
            query = query.substr(0, hash);

        while (!query.empty())
        {
            const auto amp = query.find('&');
            std::string_view pair = query.substr(0, amp);
            query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);

            const auto eq = pair.find('=');
            std::string_view name = pair.substr(0, eq);
            std::string_view value = (eq == std::string_view::npos) ? std::string_view{} : pair.substr(eq + 1);

            if (percent_decode(name) == key)
                return percent_decode(value);
        }

        return std::nullopt;
    }

    UpgradeTarget parse_upgrade_target(std::string_view target, std::string_view defaultUsername)
    {
        UpgradeTarget out;

        const auto q = target.find('?');
        out.path = std::string(target.substr(0, q));
        if (out.path.empty())
            out.path = "/";

        auto name = query_param(target, "username");
        if (name && !name->empty())
            out.username = sanitize_utf8(*name);
        else
            out.username = std::string(defaultUsername);

        return out;
    }

} // namespace relay::chat
