#include "WirecatApplication.hpp"

#include <zerowire/core/ConfigLoader.hpp>
#include <zerowire/core/Logger.hpp>
#include <zerowire/core/LoggingConfig.hpp>

#include <iostream>

int main(int argc, char **argv)
{
    zerowire::core::setThreadTag("wirecat");
    try
    {
        auto cfg = zerowire::core::ConfigLoader::load(argc, argv);
        zerowire::core::applyLoggingConfig(cfg.engine);

        wirecat::WirecatApplication app(cfg);
        app.run();

        zerowire::core::shutdownLogger();
        return 0;
    }
    catch (const std::exception &e)
    {
        SLOG_FATAL("Wirecat", "Abort", "what={}", e.what());
        zerowire::core::shutdownLogger();
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
