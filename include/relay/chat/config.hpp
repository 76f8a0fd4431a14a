#ifndef RELAY_CHAT_CONFIG_HPP
#define RELAY_CHAT_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Chat relay configuration.
 *
 * @details
 * Wraps the core `vix::config::Config` into a strongly-typed structure used
 * by the acceptor, the sessions and the hub. Keeps every knob in one place
 * instead of scattering literals across the codebase.
 */

#include <cstddef>
#include <chrono>
#include <string>

#include <vix/config/Config.hpp>

namespace relay::chat
{
    /**
     * @struct Config
     * @brief Tunables controlling the relay.
     */
    struct Config
    {
        /// Listening address and port (0 = ephemeral, used by tests).
        std::string bindAddress = "0.0.0.0";
        int port = 9090;

        /// Only HTTP target path accepted for the WebSocket upgrade.
        std::string path = "/ws";

        /// Maximum accepted inbound frame size in bytes.
        std::size_t maxMessageSize = 512;

        /// Read deadline, refreshed on every frame and every pong.
        std::chrono::seconds idleTimeout{60};

        /// Interval between server-initiated pings. Always below idleTimeout.
        std::chrono::seconds pingInterval{54};

        /// Upper bound for a single write, ping or close.
        std::chrono::seconds writeTimeout{10};

        /// Upper bound for reading the HTTP upgrade request.
        std::chrono::seconds handshakeTimeout{10};

        /// Capacity of each client's outbound queue.
        std::size_t sendQueueCapacity = 256;

        /// Number of stored messages replayed to a newly joined client.
        std::size_t historyLimit = 50;

        /// Display name used when the upgrade request carries none.
        std::string defaultUsername = "Anonymous";

        bool enablePerMessageDeflate = false;

        /// I/O threads for the acceptor (0 = hardware_concurrency / 2).
        int ioThreads = 0;

        /// "memory" (default) or "sqlite".
        std::string store = "memory";
        std::string sqlitePath = "chat_messages.db";

        /// Prometheus exporter; disabled when metricsPort is 0.
        std::string metricsAddress = "0.0.0.0";
        int metricsPort = 0;

        /**
         * @brief Clamp values into their valid ranges.
         *
         * Throws std::invalid_argument for values that cannot be repaired
         * (port out of range, unknown store backend, empty path).
         */
        void normalize();

        /**
         * @brief Build a Config from the core Vix config.
         *
         * Expected keys (all optional):
         *  - websocket.port / websocket.bind_address / websocket.path
         *  - websocket.max_message_size (int, bytes)
         *  - websocket.idle_timeout / ping_interval / write_timeout /
         *    handshake_timeout (int, seconds)
         *  - websocket.send_queue (int) / websocket.enable_deflate (bool)
         *  - server.io_threads (int)
         *  - chat.history_limit / chat.default_username / chat.store /
         *    chat.sqlite_path
         *  - metrics.address / metrics.port
         */
        static Config from_core(const vix::config::Config &core);
    };

} // namespace relay::chat

#endif // RELAY_CHAT_CONFIG_HPP
