#include <relay/chat/session.hpp>

#include <utility>

#include <boost/asio/post.hpp>

#include <vix/utils/Logger.hpp>

#include <relay/chat/protocol.hpp>
#include <relay/chat/upgrade.hpp>

namespace relay::chat
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    Session::Session(tcp::socket socket,
                     const Config &cfg,
                     std::shared_ptr<Hub> hub,
                     ChatMetrics &metrics)
        : strand_(socket.get_executor()),
          ws_(std::move(socket)),
          cfg_(cfg),
          hub_(std::move(hub)),
          metrics_(metrics),
          buffer_(),
          request_(),
          username_(),
          readDeadline_(strand_),
          writeDeadline_(strand_),
          pingTimer_(strand_),
          client_()
    {
        {
            boost::system::error_code ec;
            ws_.next_layer().set_option(tcp::no_delay(true), ec);
        }

        ws_.read_message_max(cfg_.maxMessageSize);

        if (cfg_.enablePerMessageDeflate)
        {
            ws::permessage_deflate pmd;
            pmd.server_enable = true;
            ws_.set_option(pmd);
        }

        ws_.set_option(ws::stream_base::decorator(
            [](ws::response_type &res)
            {
                res.set(http::field::server, "relay-chat");
            }));

        // A pong proves the peer is alive.
        ws_.control_callback(
            [this](ws::frame_type kind, beast::string_view)
            {
                if (kind == ws::frame_type::pong && state_ == State::Registered)
                    arm_read_deadline(cfg_.idleTimeout);
            });
    }

    Session::~Session()
    {
        if (state_ == State::Registered && client_)
        {
            hub_->unregister_client(client_);
        }
    }

    void Session::run()
    {
        auto self = shared_from_this();

        // Start on the strand so every handler shares it.
        net::post(strand_,
                  [this, self]()
                  {
                      logger.log(Logger::Level::DEBUG,
                                 "[Chat][Session] Starting handshake with {}", peer());
                      do_read_request();
                  });
    }

    // ───────────────────────── Handshake ─────────────────────────

    void Session::do_read_request()
    {
        arm_read_deadline(cfg_.handshakeTimeout);

        auto self = shared_from_this();
        http::async_read(
            ws_.next_layer(),
            buffer_,
            request_,
            [this, self](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_read_request(ec, bytes);
            });
    }

    void Session::on_read_request(const boost::system::error_code &ec, std::size_t)
    {
        if (state_ != State::Connecting)
            return;

        if (ec)
        {
            if (ec == http::error::end_of_stream)
            {
                logger.log(Logger::Level::DEBUG,
                           "[Chat][Session] Peer closed before upgrading");
            }
            else
            {
                logger.log(Logger::Level::WARN,
                           "[Chat][Session] Failed to read upgrade request: {}", ec.message());
            }
            teardown("handshake read failed");
            return;
        }

        if (!ws::is_upgrade(request_))
        {
            reject(http::status::bad_request, "WebSocket upgrade required\n");
            return;
        }

        const auto rawTarget = request_.target();
        const auto target = parse_upgrade_target(
            std::string_view{rawTarget.data(), rawTarget.size()},
            cfg_.defaultUsername);

        if (target.path != cfg_.path)
        {
            logger.log(Logger::Level::WARN,
                       "[Chat][Session] Rejected upgrade on unknown path {}", target.path);
            reject(http::status::not_found, "Not found\n");
            return;
        }

        username_ = target.username;

        auto self = shared_from_this();
        ws_.async_accept(
            request_,
            [this, self](const boost::system::error_code &acceptEc)
            {
                on_accept(acceptEc);
            });
    }

    void Session::reject(http::status status, std::string body)
    {
        auto res = std::make_shared<http::response<http::string_body>>(status, request_.version());
        res->set(http::field::server, "relay-chat");
        res->set(http::field::content_type, "text/plain");
        res->keep_alive(false);
        res->body() = std::move(body);
        res->prepare_payload();

        auto self = shared_from_this();
        http::async_write(
            ws_.next_layer(),
            *res,
            [this, self, res](const boost::system::error_code &ec, std::size_t)
            {
                if (ec && ec != net::error::operation_aborted)
                {
                    logger.log(Logger::Level::DEBUG,
                               "[Chat][Session] Failed to send rejection: {}", ec.message());
                }
                teardown("upgrade rejected");
            });
    }

    void Session::on_accept(const boost::system::error_code &ec)
    {
        if (state_ != State::Connecting)
            return;

        if (ec)
        {
            logger.log(Logger::Level::ERROR,
                       "[Chat][Session] Accept failed: {}", ec.message());
            teardown("handshake failed");
            return;
        }

        client_ = std::make_shared<Client>(make_uuid(), username_, cfg_.sendQueueCapacity);

        std::weak_ptr<Session> weak = shared_from_this();
        client_->queue().set_ready_handler(
            [weak, strand = strand_]()
            {
                if (auto self = weak.lock())
                {
                    net::post(strand,
                              [self]()
                              {
                                  self->on_queue_ready();
                              });
                }
            });

        state_ = State::Registered;
        metrics_.connections_total.fetch_add(1);

        logger.log(Logger::Level::INFO,
                   "[Chat][Session] Handshake OK: {} ({}) from {}",
                   client_->username(), client_->id(), peer());

        hub_->register_client(client_);

        arm_read_deadline(cfg_.idleTimeout);
        arm_ping_timer();
        do_read();
    }

    // ───────────────────────── Reader ─────────────────────────

    void Session::do_read()
    {
        auto self = shared_from_this();
        ws_.async_read(
            buffer_,
            [this, self](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_read(ec, bytes);
            });
    }

    void Session::on_read(const boost::system::error_code &ec, std::size_t bytes)
    {
        if (state_ != State::Registered)
            return;

        if (ec)
        {
            if (ec == ws::error::closed)
            {
                logger.log(Logger::Level::INFO,
                           "[Chat][Session] Closed by {}", client_->username());
            }
            else if (ec == ws::error::message_too_big)
            {
                metrics_.protocol_errors_total.fetch_add(1);
                logger.log(Logger::Level::WARN,
                           "[Chat][Session] Frame from {} exceeds {} bytes",
                           client_->username(), cfg_.maxMessageSize);
            }
            else if (ec != net::error::operation_aborted)
            {
                logger.log(Logger::Level::WARN,
                           "[Chat][Session] Read error from {}: {}",
                           client_->username(), ec.message());
            }
            teardown("read failed");
            return;
        }

        metrics_.frames_in_total.fetch_add(1);
        arm_read_deadline(cfg_.idleTimeout);

        const bool isText = ws_.got_text();
        std::string data = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        logger.log(Logger::Level::DEBUG,
                   "[Chat][Session] Received {} bytes from {}", bytes, client_->username());

        if (!isText)
        {
            metrics_.protocol_errors_total.fetch_add(1);
            logger.log(Logger::Level::WARN,
                       "[Chat][Session] Ignoring binary frame from {}", client_->username());
        }
        else
        {
            std::string error;
            if (auto command = parse_command(data, error))
            {
                hub_->dispatch(client_, std::move(*command));
            }
            else
            {
                metrics_.protocol_errors_total.fetch_add(1);
                logger.log(Logger::Level::WARN,
                           "[Chat][Session] Ignoring malformed frame from {}: {}",
                           client_->username(), error);
            }
        }

        do_read();
    }

    void Session::arm_read_deadline(std::chrono::seconds timeout)
    {
        readDeadline_.expires_after(timeout);

        auto self = shared_from_this();
        readDeadline_.async_wait(
            [this, self](const boost::system::error_code &ec)
            {
                on_read_deadline(ec);
            });
    }

    void Session::on_read_deadline(const boost::system::error_code &ec)
    {
        if (ec == net::error::operation_aborted)
            return;

        // Re-armed after this wait was already queued.
        if (readDeadline_.expiry() > net::steady_timer::clock_type::now())
            return;

        if (state_ == State::Connecting)
        {
            logger.log(Logger::Level::WARN,
                       "[Chat][Session] Handshake timeout for {}", peer());
            teardown("handshake timeout");
        }
        else if (state_ == State::Registered)
        {
            logger.log(Logger::Level::WARN,
                       "[Chat][Session] Idle timeout reached for {}, closing connection",
                       client_->username());
            teardown("idle timeout");
        }
    }

    // ───────────────────────── Writer ─────────────────────────

    void Session::on_queue_ready()
    {
        if (state_ != State::Registered || writeInProgress_)
            return;

        do_write_next();
    }

    void Session::do_write_next()
    {
        if (state_ != State::Registered)
        {
            writeInProgress_ = false;
            return;
        }

        if (pingPending_)
        {
            do_ping();
            return;
        }

        auto next = client_->queue().try_pop();
        if (!next)
        {
            if (client_->queue().drained())
                do_close_frame();
            else
                writeInProgress_ = false;
            return;
        }

        writeInProgress_ = true;
        currentFrame_ = std::move(*next);

        arm_write_deadline();

        auto self = shared_from_this();
        ws_.text(true);
        ws_.async_write(
            net::buffer(currentFrame_),
            [this, self](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_write_complete(ec, bytes);
            });
    }

    void Session::on_write_complete(const boost::system::error_code &ec, std::size_t bytes)
    {
        cancel_write_deadline();

        if (state_ != State::Registered)
            return;

        if (ec)
        {
            if (ec != net::error::operation_aborted)
            {
                logger.log(Logger::Level::WARN,
                           "[Chat][Session] Write error to {}: {}",
                           client_->username(), ec.message());
            }
            teardown("write failed");
            return;
        }

        logger.log(Logger::Level::DEBUG,
                   "[Chat][Session] Sent {} bytes to {}", bytes, client_->username());

        do_write_next();
    }

    void Session::arm_ping_timer()
    {
        pingTimer_.expires_after(cfg_.pingInterval);

        auto self = shared_from_this();
        pingTimer_.async_wait(
            [this, self](const boost::system::error_code &ec)
            {
                on_ping_timer(ec);
            });
    }

    void Session::on_ping_timer(const boost::system::error_code &ec)
    {
        if (ec == net::error::operation_aborted || state_ != State::Registered)
            return;

        // Pings share the writer's turn with data frames.
        if (writeInProgress_)
            pingPending_ = true;
        else
            do_ping();

        arm_ping_timer();
    }

    void Session::do_ping()
    {
        pingPending_ = false;
        writeInProgress_ = true;

        arm_write_deadline();

        auto self = shared_from_this();
        ws_.async_ping(
            ws::ping_data{},
            [this, self](const boost::system::error_code &ec)
            {
                on_ping_complete(ec);
            });
    }

    void Session::on_ping_complete(const boost::system::error_code &ec)
    {
        cancel_write_deadline();

        if (state_ != State::Registered)
            return;

        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Chat][Session] Ping to {} failed: {}", client_->username(), ec.message());
            teardown("ping failed");
            return;
        }

        do_write_next();
    }

    void Session::do_close_frame()
    {
        if (closeSent_)
            return;

        closeSent_ = true;
        writeInProgress_ = true;
        pingTimer_.cancel();

        logger.log(Logger::Level::DEBUG,
                   "[Chat][Session] Outbound queue closed, sending close frame to {}",
                   client_->username());

        arm_write_deadline();

        auto self = shared_from_this();
        ws_.async_close(
            ws::close_reason(ws::close_code::normal),
            [this, self](const boost::system::error_code &ec)
            {
                on_close_complete(ec);
            });
    }

    void Session::on_close_complete(const boost::system::error_code &ec)
    {
        cancel_write_deadline();

        if (ec && ec != net::error::operation_aborted && state_ == State::Registered)
        {
            logger.log(Logger::Level::DEBUG,
                       "[Chat][Session] Close handshake with {} failed: {}",
                       client_->username(), ec.message());
        }

        teardown("closed by hub");
    }

    void Session::arm_write_deadline()
    {
        writeDeadline_.expires_after(cfg_.writeTimeout);

        auto self = shared_from_this();
        writeDeadline_.async_wait(
            [this, self](const boost::system::error_code &ec)
            {
                on_write_deadline(ec);
            });
    }

    void Session::cancel_write_deadline()
    {
        // Pushing the expiry out also disarms a completion already queued.
        writeDeadline_.expires_at(net::steady_timer::time_point::max());
    }

    void Session::on_write_deadline(const boost::system::error_code &ec)
    {
        if (ec == net::error::operation_aborted || state_ != State::Registered)
            return;

        if (writeDeadline_.expiry() > net::steady_timer::clock_type::now())
            return;

        logger.log(Logger::Level::WARN,
                   "[Chat][Session] Write timeout for {}, closing connection",
                   client_->username());
        teardown("write timeout");
    }

    // ───────────────────────── Teardown ─────────────────────────

    void Session::teardown(std::string_view reason)
    {
        if (state_ == State::Unregistering || state_ == State::Closed)
            return;

        const bool wasRegistered = (state_ == State::Registered);
        state_ = State::Unregistering;

        readDeadline_.cancel();
        writeDeadline_.cancel();
        pingTimer_.cancel();

        if (wasRegistered)
        {
            hub_->unregister_client(client_);
            logger.log(Logger::Level::INFO,
                       "[Chat][Session] {} ({}) leaving: {}",
                       client_->username(), client_->id(), reason);
        }
        else
        {
            logger.log(Logger::Level::DEBUG,
                       "[Chat][Session] Dropping connection from {}: {}", peer(), reason);
        }

        release_transport();
        state_ = State::Closed;
    }

    void Session::release_transport()
    {
        auto &socket = ws_.next_layer();
        if (!socket.is_open())
            return;

        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != net::error::not_connected)
        {
            logger.log(Logger::Level::DEBUG,
                       "[Chat][Session] Socket shutdown: {}", ec.message());
        }

        socket.close(ec);
        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Chat][Session] Socket close failed: {}", ec.message());
        }
    }

    std::string Session::peer() const
    {
        boost::system::error_code ec;
        const auto endpoint = ws_.next_layer().remote_endpoint(ec);
        if (ec)
            return "<disconnected>";

        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace relay::chat
