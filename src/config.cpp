#include <relay/chat/config.hpp>

#include <algorithm>
#include <stdexcept>

namespace relay::chat
{
    void Config::normalize()
    {
        if (port != 0 && (port < 1024 || port > 65535))
            throw std::invalid_argument("Invalid WebSocket port");

        if (path.empty() || path.front() != '/')
            throw std::invalid_argument("WebSocket path must start with '/'");

        if (store != "memory" && store != "sqlite")
            throw std::invalid_argument("Unknown message store backend: " + store);

        maxMessageSize = std::max<std::size_t>(maxMessageSize, 128);
        sendQueueCapacity = std::max<std::size_t>(sendQueueCapacity, 1);

        if (idleTimeout.count() < 2)
            idleTimeout = std::chrono::seconds{2};

        // A ping must reach the peer before its read deadline expires.
        if (pingInterval.count() <= 0 || pingInterval >= idleTimeout)
            pingInterval = std::chrono::seconds{std::max<long long>(1, idleTimeout.count() * 9 / 10)};

        if (writeTimeout.count() <= 0)
            writeTimeout = std::chrono::seconds{10};

        if (handshakeTimeout.count() <= 0)
            handshakeTimeout = std::chrono::seconds{10};

        if (defaultUsername.empty())
            defaultUsername = "Anonymous";

        if (metricsPort < 0 || metricsPort > 65535)
            metricsPort = 0;
    }

    Config Config::from_core(const vix::config::Config &core)
    {
        Config cfg;

        if (core.has("websocket.port"))
            cfg.port = core.getInt("websocket.port", cfg.port);

        if (core.has("websocket.bind_address"))
            cfg.bindAddress = core.getString("websocket.bind_address", cfg.bindAddress);

        if (core.has("websocket.path"))
            cfg.path = core.getString("websocket.path", cfg.path);

        if (core.has("websocket.max_message_size"))
        {
            auto v = core.getInt("websocket.max_message_size", static_cast<int>(cfg.maxMessageSize));
            cfg.maxMessageSize = static_cast<std::size_t>(std::max(0, v));
        }

        if (core.has("websocket.idle_timeout"))
        {
            auto v = core.getInt("websocket.idle_timeout", static_cast<int>(cfg.idleTimeout.count()));
            cfg.idleTimeout = std::chrono::seconds(v);
        }

        if (core.has("websocket.ping_interval"))
        {
            auto v = core.getInt("websocket.ping_interval", static_cast<int>(cfg.pingInterval.count()));
            cfg.pingInterval = std::chrono::seconds(v);
        }

        if (core.has("websocket.write_timeout"))
        {
            auto v = core.getInt("websocket.write_timeout", static_cast<int>(cfg.writeTimeout.count()));
            cfg.writeTimeout = std::chrono::seconds(v);
        }

        if (core.has("websocket.handshake_timeout"))
        {
            auto v = core.getInt("websocket.handshake_timeout", static_cast<int>(cfg.handshakeTimeout.count()));
            cfg.handshakeTimeout = std::chrono::seconds(v);
        }

        if (core.has("websocket.send_queue"))
        {
            auto v = core.getInt("websocket.send_queue", static_cast<int>(cfg.sendQueueCapacity));
            cfg.sendQueueCapacity = static_cast<std::size_t>(std::max(0, v));
        }

        if (core.has("websocket.enable_deflate"))
            cfg.enablePerMessageDeflate = core.getBool("websocket.enable_deflate", cfg.enablePerMessageDeflate);

        if (core.has("server.io_threads"))
            cfg.ioThreads = std::max(0, core.getInt("server.io_threads", cfg.ioThreads));

        if (core.has("chat.history_limit"))
        {
            auto v = core.getInt("chat.history_limit", static_cast<int>(cfg.historyLimit));
            cfg.historyLimit = static_cast<std::size_t>(std::max(0, v));
        }

        if (core.has("chat.default_username"))
            cfg.defaultUsername = core.getString("chat.default_username", cfg.defaultUsername);

        if (core.has("chat.store"))
            cfg.store = core.getString("chat.store", cfg.store);

        if (core.has("chat.sqlite_path"))
            cfg.sqlitePath = core.getString("chat.sqlite_path", cfg.sqlitePath);

        if (core.has("metrics.address"))
            cfg.metricsAddress = core.getString("metrics.address", cfg.metricsAddress);

        if (core.has("metrics.port"))
            cfg.metricsPort = core.getInt("metrics.port", cfg.metricsPort);

        cfg.normalize();
        return cfg;
    }

} // namespace relay::chat
