#ifndef RELAY_CHAT_ENGINE_HPP
#define RELAY_CHAT_ENGINE_HPP

/**
 * @file websocket.hpp
 * @brief Low-level WebSocket accept engine.
 *
 * This component:
 *  - owns the I/O io_context and its threads
 *  - accepts TCP connections on the configured address
 *  - creates one relay::chat::Session per connection, bound to the Hub
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <relay/chat/config.hpp>
#include <relay/chat/hub.hpp>
#include <relay/chat/Metrics.hpp>

namespace relay::chat
{
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    class LowLevelServer
    {
    public:
        LowLevelServer(const Config &cfg,
                       std::shared_ptr<Hub> hub,
                       ChatMetrics &metrics);

        ~LowLevelServer();

        LowLevelServer(const LowLevelServer &) = delete;
        LowLevelServer &operator=(const LowLevelServer &) = delete;

        /// Start accepting connections and running the io_context in background threads.
        void run();

        /// Cooperative async stop: close acceptor and stop the io_context.
        void stop_async();

        /// Join all I/O threads.
        void join_threads();

        bool is_stop_requested() const { return stopRequested_.load(); }

        /// Port actually bound (differs from the configured one when it was 0).
        std::uint16_t port() const noexcept { return boundPort_; }

    private:
        void init_acceptor();
        void start_accept();
        void start_io_threads();
        void handle_client(tcp::socket socket);

        std::size_t compute_io_thread_count() const;

    private:
        Config cfg_;
        std::shared_ptr<Hub> hub_;
        ChatMetrics &metrics_;

        std::shared_ptr<net::io_context> ioContext_;
        std::unique_ptr<tcp::acceptor> acceptor_;
        std::vector<std::thread> ioThreads_;
        std::uint16_t boundPort_ = 0;

        std::atomic<bool> stopRequested_{false};
    };

} // namespace relay::chat

#endif // RELAY_CHAT_ENGINE_HPP
