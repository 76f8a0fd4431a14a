#ifndef RELAY_CHAT_SERVER_HPP
#define RELAY_CHAT_SERVER_HPP

/**
 * @file server.hpp
 * @brief Public entry point of the chat relay.
 *
 * Wires the pieces together:
 *  - one Hub driven by its own io_context on a dedicated thread
 *  - the LowLevelServer accept engine and its I/O threads
 *  - the message store selected by Config::store
 *
 * @code{.cpp}
 * vix::config::Config core{"config/config.json"};
 * relay::chat::Server server(relay::chat::Config::from_core(core));
 * server.listen_blocking(); // returns on SIGINT / SIGTERM
 * @endcode
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <relay/chat/config.hpp>
#include <relay/chat/hub.hpp>
#include <relay/chat/MessageStore.hpp>
#include <relay/chat/Metrics.hpp>
#include <relay/chat/websocket.hpp>

namespace relay::chat
{
    namespace net = boost::asio;

    class Server
    {
    public:
        /// Store backend chosen from cfg.store.
        explicit Server(Config cfg);

        /// Explicit store, mostly for tests.
        Server(Config cfg, std::unique_ptr<IMessageStore> store);

        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        /// Start the hub thread and the accept engine. Returns immediately.
        void start();

        /// Stop accepting, drop live connections, drain the hub. Idempotent.
        void stop();

        /// start(), then block until SIGINT, SIGTERM or stop().
        void listen_blocking();

        /// Port actually bound; 0 once stopped.
        std::uint16_t port() const noexcept { return engine_ ? engine_->port() : 0; }

        ChatMetrics &metrics() noexcept { return metrics_; }
        const Config &config() const noexcept { return cfg_; }

        static std::unique_ptr<IMessageStore> make_store(const Config &cfg);

    private:
        Config cfg_;
        ChatMetrics metrics_;

        net::io_context hubIo_;
        net::executor_work_guard<net::io_context::executor_type> hubWork_;
        std::thread hubThread_;
        std::shared_ptr<Hub> hub_;

        std::unique_ptr<LowLevelServer> engine_;

        net::io_context signalIo_;

        std::atomic<bool> started_{false};
        std::atomic<bool> stopped_{false};
    };

} // namespace relay::chat

#endif // RELAY_CHAT_SERVER_HPP
