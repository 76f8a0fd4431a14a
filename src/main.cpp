#include <exception>
#include <memory>
#include <string>

#include <vix/config/Config.hpp>
#include <vix/utils/Logger.hpp>

#include <relay/chat.hpp>

int main(int argc, char **argv)
{
    using Logger = vix::utils::Logger;
    auto &logger = Logger::getInstance();

    const std::string configPath = (argc > 1) ? argv[1] : "config/config.json";

    try
    {
        vix::config::Config coreConfig{configPath};
        auto cfg = relay::chat::Config::from_core(coreConfig);

        relay::chat::Server server(cfg);

        std::unique_ptr<relay::chat::MetricsExporter> exporter;
        if (cfg.metricsPort > 0)
        {
            exporter = std::make_unique<relay::chat::MetricsExporter>(cfg, server.metrics());
            exporter->start();
        }

        server.listen_blocking();
        return 0;
    }
    catch (const std::exception &e)
    {
        logger.log(Logger::Level::ERROR, "[Chat][main] Fatal error: {}", e.what());
        return 1;
    }
}
