#include <relay/chat/server.hpp>

#include <csignal>
#include <exception>
#include <stdexcept>
#include <utility>

#include <boost/asio/signal_set.hpp>

#include <vix/utils/Logger.hpp>

#include <relay/chat/MemoryMessageStore.hpp>
#include <relay/chat/SqliteMessageStore.hpp>

namespace relay::chat
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace
    {
        Config normalized(Config cfg)
        {
            cfg.normalize();
            return cfg;
        }
    }

    std::unique_ptr<IMessageStore> Server::make_store(const Config &cfg)
    {
        if (cfg.store == "sqlite")
        {
            logger.log(Logger::Level::INFO,
                       "[Chat][Server] Using SQLite message store at {}", cfg.sqlitePath);
            return std::make_unique<SqliteMessageStore>(cfg.sqlitePath);
        }

        if (cfg.store == "memory")
            return std::make_unique<MemoryMessageStore>();

        throw std::invalid_argument("Unknown message store backend: " + cfg.store);
    }

    Server::Server(Config cfg)
        : Server(cfg, make_store(normalized(cfg)))
    {
    }

    Server::Server(Config cfg, std::unique_ptr<IMessageStore> store)
        : cfg_(normalized(std::move(cfg))),
          metrics_(),
          hubIo_(),
          hubWork_(net::make_work_guard(hubIo_)),
          hubThread_(),
          hub_(std::make_shared<Hub>(hubIo_.get_executor(), std::move(store), cfg_.historyLimit, metrics_)),
          engine_(std::make_unique<LowLevelServer>(cfg_, hub_, metrics_)),
          signalIo_()
    {
    }

    Server::~Server()
    {
        stop();
    }

    void Server::start()
    {
        if (started_.exchange(true))
            return;

        hubThread_ = std::thread(
            [this]()
            {
                try
                {
                    hubIo_.run();
                }
                catch (const std::exception &e)
                {
                    metrics_.errors_total.fetch_add(1);
                    logger.log(Logger::Level::ERROR,
                               "[Chat][Server] Hub loop error: {}", e.what());
                }
            });

        engine_->run();

        logger.log(Logger::Level::INFO,
                   "[Chat][Server] Chat relay started on port {}", port());
    }

    void Server::stop()
    {
        if (stopped_.exchange(true))
            return;

        signalIo_.stop();

        if (engine_)
        {
            engine_->stop_async();
            engine_->join_threads();
            // Destroying the engine drops the remaining sessions, which
            // unregister their clients from the hub.
            engine_.reset();
        }

        hubWork_.reset();
        if (hubThread_.joinable())
            hubThread_.join();

        logger.log(Logger::Level::INFO, "[Chat][Server] Chat relay stopped");
    }

    void Server::listen_blocking()
    {
        start();

        net::signal_set signals(signalIo_, SIGINT, SIGTERM);
        signals.async_wait(
            [](const boost::system::error_code &ec, int signo)
            {
                if (!ec)
                {
                    logger.log(Logger::Level::INFO,
                               "[Chat][Server] Received signal {}, shutting down", signo);
                }
            });

        if (!stopped_)
            signalIo_.run();

        stop();
    }

} // namespace relay::chat
