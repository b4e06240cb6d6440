/// @file main.cpp
/// @brief skychart viewer entry point.

#include "core/application.hpp"
#include "core/logger.hpp"

int main(int /*argc*/, char* /*argv*/[])
{
    skychart::core::Logger::init();
    SKC_CORE_INFO("skychart viewer starting");

    {
        skychart::core::Application app;
        app.run();
    }

    SKC_CORE_INFO("skychart viewer shut down");
    skychart::core::Logger::shutdown();
    return 0;
}
