#include <relay/chat/websocket.hpp>
#include <relay/chat/session.hpp>

#include <algorithm>
#include <system_error>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <vix/utils/Logger.hpp>

#if defined(__linux__)
#include <pthread.h>
#include <sched.h>
#endif

namespace relay::chat
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace
    {
        void set_affinity(std::size_t thread_index)
        {
#ifdef __linux__
            unsigned int hc = std::thread::hardware_concurrency();
            if (hc == 0u)
                hc = 1u;

            const unsigned int cpu =
                static_cast<unsigned int>(thread_index % static_cast<std::size_t>(hc));

            cpu_set_t cpuset;
            CPU_ZERO(&cpuset);
            CPU_SET(cpu, &cpuset);

            if (const int rc = pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset); rc != 0)
            {
                logger.log(Logger::Level::DEBUG,
                           "[Chat][Server] Could not pin IO thread {} to CPU {} (rc={})",
                           thread_index, cpu, rc);
            }
#else
            (void)thread_index;
#endif
        }
    }

    LowLevelServer::LowLevelServer(const Config &cfg,
                                   std::shared_ptr<Hub> hub,
                                   ChatMetrics &metrics)
        : cfg_(cfg),
          hub_(std::move(hub)),
          metrics_(metrics),
          ioContext_(std::make_shared<net::io_context>()),
          acceptor_(nullptr),
          ioThreads_(),
          stopRequested_(false)
    {
        cfg_.normalize();
        init_acceptor();

        logger.log(Logger::Level::INFO,
                   "[Chat][Server] Config -> maxMessageSize={} idleTimeout={}s pingInterval={}s sendQueue={}",
                   cfg_.maxMessageSize,
                   cfg_.idleTimeout.count(),
                   cfg_.pingInterval.count(),
                   cfg_.sendQueueCapacity);
    }

    LowLevelServer::~LowLevelServer()
    {
        stop_async();
        join_threads();
    }

    void LowLevelServer::init_acceptor()
    {
        acceptor_ = std::make_unique<tcp::acceptor>(*ioContext_);
        boost::system::error_code ec;

        const auto address = net::ip::make_address(cfg_.bindAddress, ec);
        if (ec)
            throw std::system_error(ec, "bind address '" + cfg_.bindAddress + "'");

        tcp::endpoint endpoint(address, static_cast<unsigned short>(cfg_.port));
        acceptor_->open(endpoint.protocol(), ec);
        if (ec)
            throw std::system_error(ec, "open acceptor");

        acceptor_->set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::system_error(ec, "reuse_address");

        acceptor_->bind(endpoint, ec);
        if (ec)
            throw std::system_error(ec, "bind acceptor");

        acceptor_->listen(net::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::system_error(ec, "listen acceptor");

        boundPort_ = acceptor_->local_endpoint().port();

        logger.log(Logger::Level::INFO,
                   "[Chat][Server] Listening on ws://{}:{}{}",
                   cfg_.bindAddress, boundPort_, cfg_.path);
    }

    void LowLevelServer::run()
    {
        start_accept();
        start_io_threads();
    }

    void LowLevelServer::start_accept()
    {
        // Each connection gets its own strand; all of its handlers run on it.
        acceptor_->async_accept(
            net::make_strand(*ioContext_),
            [this](boost::system::error_code ec, tcp::socket socket)
            {
                if (ec)
                {
                    if (ec != net::error::operation_aborted)
                    {
                        metrics_.errors_total.fetch_add(1);
                        logger.log(Logger::Level::WARN,
                                   "[Chat][Server] Accept failed: {}", ec.message());
                    }
                }
                else if (!stopRequested_)
                {
                    handle_client(std::move(socket));
                }

                if (!stopRequested_)
                {
                    start_accept();
                }
            });
    }

    void LowLevelServer::handle_client(tcp::socket socket)
    {
        auto session = std::make_shared<Session>(
            std::move(socket),
            cfg_,
            hub_,
            metrics_);

        session->run();
    }

    std::size_t LowLevelServer::compute_io_thread_count() const
    {
        if (cfg_.ioThreads > 0)
            return static_cast<std::size_t>(cfg_.ioThreads);

        const unsigned int hc = std::thread::hardware_concurrency();
        const unsigned int v = (hc != 0u) ? (hc / 2u) : 1u;
        return static_cast<std::size_t>(std::max(1u, v));
    }

    void LowLevelServer::start_io_threads()
    {
        const std::size_t n = compute_io_thread_count();
        ioThreads_.reserve(n);

        for (std::size_t i = 0; i < n; ++i)
        {
            ioThreads_.emplace_back([this, i]()
                                    {
        try
        {
            set_affinity(i);
            ioContext_->run();
        }
        catch (const std::exception &e)
        {
            metrics_.errors_total.fetch_add(1);
            logger.log(Logger::Level::ERROR,
                       "[Chat][Server] IO thread {} error: {}", i, e.what());
        }

        logger.log(Logger::Level::DEBUG,
                   "[Chat][Server] IO thread {} finished", i); });
        }
    }

    void LowLevelServer::stop_async()
    {
        if (stopRequested_.exchange(true))
            return;

        // Close on the io_context so it never races a pending accept.
        net::post(*ioContext_,
                  [this]()
                  {
                      if (acceptor_ && acceptor_->is_open())
                      {
                          boost::system::error_code ec;
                          acceptor_->close(ec);
                          if (ec)
                          {
                              logger.log(Logger::Level::WARN,
                                         "[Chat][Server] Acceptor close failed: {}", ec.message());
                          }
                      }
                      ioContext_->stop();
                  });

        if (ioThreads_.empty())
            ioContext_->stop();
    }

    void LowLevelServer::join_threads()
    {
        for (auto &t : ioThreads_)
        {
            if (t.joinable())
                t.join();
        }
    }

} // namespace relay::chat
