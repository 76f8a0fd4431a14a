#ifndef RELAY_CHAT_SESSION_HPP
#define RELAY_CHAT_SESSION_HPP

/**
 * @file session.hpp
 * @brief Per-connection pump pair bridging one WebSocket to the Hub.
 *
 * Responsibilities:
 *  - Read the HTTP upgrade request, pick the display name, perform the
 *    WebSocket handshake and register a new Client with the Hub.
 *  - Reader: enforce the frame size limit and the read deadline (refreshed
 *    by frames and pongs), decode commands and dispatch them to the Hub.
 *  - Writer: drain the Client's outbound queue in order, ping on a fixed
 *    interval, bound every write by a deadline, send a close frame once the
 *    Hub closes the queue.
 *
 * All handlers run on the socket's strand. Every terminal path goes through
 * teardown(), which unregisters from the Hub and closes the socket exactly
 * once; the destructor unregisters if teardown never ran.
 */

#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <relay/chat/client.hpp>
#include <relay/chat/config.hpp>
#include <relay/chat/hub.hpp>
#include <relay/chat/Metrics.hpp>

namespace relay::chat
{
    namespace beast = boost::beast;
    namespace http = boost::beast::http;
    namespace ws = boost::beast::websocket;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(tcp::socket socket,
                const Config &cfg,
                std::shared_ptr<Hub> hub,
                ChatMetrics &metrics);

        ~Session();

        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;

        /// Start the upgrade handshake; pumps start once it succeeds.
        void run();

    private:
        enum class State
        {
            Connecting,
            Registered,
            Unregistering,
            Closed,
        };

        // Handshake
        void do_read_request();
        void on_read_request(const boost::system::error_code &ec, std::size_t bytes);
        void reject(http::status status, std::string body);
        void on_accept(const boost::system::error_code &ec);

        // Reader
        void do_read();
        void on_read(const boost::system::error_code &ec, std::size_t bytes);
        void arm_read_deadline(std::chrono::seconds timeout);
        void on_read_deadline(const boost::system::error_code &ec);

        // Writer
        void on_queue_ready();
        void do_write_next();
        void on_write_complete(const boost::system::error_code &ec, std::size_t bytes);
        void arm_ping_timer();
        void on_ping_timer(const boost::system::error_code &ec);
        void do_ping();
        void on_ping_complete(const boost::system::error_code &ec);
        void do_close_frame();
        void on_close_complete(const boost::system::error_code &ec);
        void arm_write_deadline();
        void cancel_write_deadline();
        void on_write_deadline(const boost::system::error_code &ec);

        // Single exit path.
        void teardown(std::string_view reason);
        void release_transport();

        std::string peer() const;

    private:
        net::any_io_executor strand_;
        ws::stream<tcp::socket> ws_;

        Config cfg_;
        std::shared_ptr<Hub> hub_;
        ChatMetrics &metrics_;

        beast::flat_buffer buffer_;
        http::request<http::string_body> request_;
        std::string username_;

        net::steady_timer readDeadline_;
        net::steady_timer writeDeadline_;
        net::steady_timer pingTimer_;

        std::shared_ptr<Client> client_;
        State state_ = State::Connecting;

        std::string currentFrame_;
        bool writeInProgress_ = false;
        bool pingPending_ = false;
        bool closeSent_ = false;
    };

} // namespace relay::chat

#endif // RELAY_CHAT_SESSION_HPP
