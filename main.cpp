#include "include/blink_monitor_system.h"
#include "include/logger.h"
#include "include/config.h"
#include <iostream>

int main(int argc, char **argv)
{
    try
    {
        BlinkMonitor::Config config;
        if (argc > 1)
        {
            config = BlinkMonitor::loadConfig(argv[1]);
            std::cout << "Loaded configuration from " << argv[1] << std::endl;
        }

        BlinkMonitor::Logger::getInstance().setupConfig(config);

        BlinkMonitor::BlinkMonitorSystem system(config);

        if (!system.initialize())
        {
            std::cerr << "Failed to initialize blink monitor" << std::endl;
            BlinkMonitor::Logger::shutdown();
            return -1;
        }

        return system.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        BlinkMonitor::Logger::shutdown();
        return -1;
    }
}
