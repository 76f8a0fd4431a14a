#ifndef RELAY_CHAT_METRICS_HPP
#define RELAY_CHAT_METRICS_HPP

/**
 * @file Metrics.hpp
 * @brief Lightweight Prometheus-style counters for the chat relay.
 *
 * Typical usage
 * -------------
 * @code{.cpp}
 * relay::chat::Server server(cfg);
 *
 * relay::chat::MetricsExporter exporter(cfg, server.metrics());
 * exporter.start();
 *
 * server.listen_blocking();
 * @endcode
 */

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <relay/chat/config.hpp>

namespace relay::chat
{
    /**
     * @struct ChatMetrics
     * @brief Aggregated counters for relay activity.
     *
     * All fields are 64-bit atomics and can be incremented from the I/O
     * threads and the hub thread without external synchronization.
     */
    struct ChatMetrics
    {
        std::atomic<std::uint64_t> connections_total{0};
        std::atomic<std::uint64_t> connections_active{0};
        std::atomic<std::uint64_t> frames_in_total{0};
        std::atomic<std::uint64_t> frames_out_total{0};
        std::atomic<std::uint64_t> protocol_errors_total{0};
        std::atomic<std::uint64_t> evictions_total{0};
        std::atomic<std::uint64_t> errors_total{0};

        /**
         * @brief Render all counters in Prometheus text format (v0.0.4).
         */
        [[nodiscard]] std::string render_prometheus() const;
    };

    /**
     * @brief Minimal HTTP endpoint exposing `/metrics`.
     *
     * Binds Config::metricsAddress / Config::metricsPort in the constructor
     * (throws std::system_error on failure; port 0 picks an ephemeral port)
     * and serves from its own thread between start() and stop(). Any other
     * path returns 404.
     */
    class MetricsExporter
    {
    public:
        MetricsExporter(const Config &cfg, ChatMetrics &metrics);
        ~MetricsExporter();

        MetricsExporter(const MetricsExporter &) = delete;
        MetricsExporter &operator=(const MetricsExporter &) = delete;

        void start();

        /// Close the acceptor and join the serving thread. Idempotent.
        void stop();

        std::uint16_t port() const noexcept { return boundPort_; }

    private:
        void init_acceptor();
        void do_accept();
        void serve(boost::asio::ip::tcp::socket socket);

        std::string address_;
        int requestedPort_;
        ChatMetrics &metrics_;

        boost::asio::io_context ioContext_;
        boost::asio::ip::tcp::acceptor acceptor_;
        std::uint16_t boundPort_ = 0;

        std::thread thread_;
        std::atomic<bool> stopRequested_{false};
    };

} // namespace relay::chat

#endif // RELAY_CHAT_METRICS_HPP
