#include <relay/chat/Metrics.hpp>

#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <vix/utils/Logger.hpp>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace relay::chat
{
    using tcp = boost::asio::ip::tcp;
    namespace bb = boost::beast;
    namespace http = bb::http;
    namespace net = boost::asio;

    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace
    {
        constexpr std::chrono::seconds kRequestTimeout{5};

        // One scrape: the request read and the response written back.
        struct Exchange
        {
            explicit Exchange(tcp::socket socket)
                : stream(std::move(socket))
            {
            }

            bb::tcp_stream stream;
            bb::flat_buffer buffer;
            http::request<http::string_body> req;
            http::response<http::string_body> res;
        };

        [[nodiscard]] bool is_metrics_request(const http::request<http::string_body> &req) noexcept
        {
            return (req.method() == http::verb::get && req.target() == "/metrics");
        }

        void set_common_headers(http::response<http::string_body> &res, unsigned version)
        {
            res.version(version);
            res.set(http::field::server, "relay-chat-metrics");
            res.set(http::field::cache_control, "no-store");
            res.set(http::field::connection, "close");
        }

        void write_counter(std::ostream &os,
                           const char *name,
                           const char *type,
                           const char *help,
                           std::uint64_t value)
        {
            os << "# HELP " << name << ' ' << help << "\n"
               << "# TYPE " << name << ' ' << type << "\n"
               << name << ' ' << value << "\n\n";
        }
    } // namespace

    std::string ChatMetrics::render_prometheus() const
    {
        std::ostringstream os;

        write_counter(os, "relay_chat_connections_total", "counter",
                      "Total WebSocket connections accepted", connections_total.load());
        write_counter(os, "relay_chat_connections_active", "gauge",
                      "Currently registered connections", connections_active.load());
        write_counter(os, "relay_chat_frames_in_total", "counter",
                      "Total text frames received from clients", frames_in_total.load());
        write_counter(os, "relay_chat_frames_out_total", "counter",
                      "Total frames enqueued for delivery to clients", frames_out_total.load());
        write_counter(os, "relay_chat_protocol_errors_total", "counter",
                      "Inbound frames dropped as malformed or unknown", protocol_errors_total.load());
        write_counter(os, "relay_chat_evictions_total", "counter",
                      "Clients disconnected because their outbound queue was full", evictions_total.load());
        write_counter(os, "relay_chat_errors_total", "counter",
                      "Transport and store errors", errors_total.load());

        return os.str();
    }

    MetricsExporter::MetricsExporter(const Config &cfg, ChatMetrics &metrics)
        : address_(cfg.metricsAddress),
          requestedPort_(cfg.metricsPort),
          metrics_(metrics),
          ioContext_(1),
          acceptor_(ioContext_)
    {
        init_acceptor();
    }

    MetricsExporter::~MetricsExporter()
    {
        stop();
    }

    void MetricsExporter::init_acceptor()
    {
        if (requestedPort_ < 0 || requestedPort_ > 65535)
            throw std::invalid_argument("Invalid metrics port");

        boost::system::error_code ec;

        const auto address = net::ip::make_address(address_, ec);
        if (ec)
            throw std::system_error(ec, "metrics address '" + address_ + "'");

        tcp::endpoint endpoint(address, static_cast<unsigned short>(requestedPort_));
        acceptor_.open(endpoint.protocol(), ec);
        if (ec)
            throw std::system_error(ec, "open metrics acceptor");

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::system_error(ec, "reuse_address");

        acceptor_.bind(endpoint, ec);
        if (ec)
            throw std::system_error(ec, "bind metrics acceptor");

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::system_error(ec, "listen metrics acceptor");

        boundPort_ = acceptor_.local_endpoint().port();
    }

    void MetricsExporter::start()
    {
        if (thread_.joinable() || stopRequested_)
            return;

        do_accept();

        thread_ = std::thread(
            [this]()
            {
                try
                {
                    ioContext_.run();
                }
                catch (const std::exception &e)
                {
                    metrics_.errors_total.fetch_add(1);
                    logger.log(Logger::Level::ERROR,
                               "[Chat][Metrics] Exporter error: {}", e.what());
                }
            });

        logger.log(Logger::Level::INFO,
                   "[Chat][Metrics] Listening on http://{}:{}/metrics",
                   address_, boundPort_);
    }

    void MetricsExporter::stop()
    {
        if (stopRequested_.exchange(true))
            return;

        net::post(ioContext_,
                  [this]()
                  {
                      boost::system::error_code ec;
                      acceptor_.close(ec);
                      if (ec)
                      {
                          logger.log(Logger::Level::WARN,
                                     "[Chat][Metrics] Acceptor close failed: {}", ec.message());
                      }
                      ioContext_.stop();
                  });

        if (thread_.joinable())
            thread_.join();
    }

    void MetricsExporter::do_accept()
    {
        acceptor_.async_accept(
            [this](boost::system::error_code ec, tcp::socket socket)
            {
                if (ec)
                {
                    if (ec == net::error::operation_aborted)
                        return;

                    logger.log(Logger::Level::DEBUG,
                               "[Chat][Metrics] Accept failed: {}", ec.message());
                }
                else
                {
                    serve(std::move(socket));
                }

                if (!stopRequested_)
                    do_accept();
            });
    }

    void MetricsExporter::serve(tcp::socket socket)
    {
        auto exchange = std::make_shared<Exchange>(std::move(socket));
        exchange->stream.expires_after(kRequestTimeout);

        http::async_read(
            exchange->stream,
            exchange->buffer,
            exchange->req,
            [this, exchange](const boost::system::error_code &ec, std::size_t)
            {
                if (ec)
                {
                    logger.log(Logger::Level::DEBUG,
                               "[Chat][Metrics] Read failed: {}", ec.message());
                    return;
                }

                auto &req = exchange->req;
                auto &res = exchange->res;

                if (is_metrics_request(req))
                {
                    res.result(http::status::ok);
                    set_common_headers(res, req.version());
                    res.set(http::field::content_type, "text/plain; version=0.0.4; charset=utf-8");
                    res.body() = metrics_.render_prometheus();
                }
                else
                {
                    res.result(http::status::not_found);
                    set_common_headers(res, req.version());
                    res.set(http::field::content_type, "text/plain; charset=utf-8");
                    res.body() = "Not Found\n";
                }
                res.prepare_payload();

                http::async_write(
                    exchange->stream,
                    res,
                    [exchange](const boost::system::error_code &writeEc, std::size_t)
                    {
                        if (writeEc)
                        {
                            logger.log(Logger::Level::DEBUG,
                                       "[Chat][Metrics] Write failed: {}", writeEc.message());
                        }

                        boost::system::error_code ignore;
                        exchange->stream.socket().shutdown(tcp::socket::shutdown_send, ignore);
                    });
            });
    }

} // namespace relay::chat
