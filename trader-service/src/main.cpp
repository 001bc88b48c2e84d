#include "TraderApp.hpp"
#include <iostream>

int main()
{
    try
    {
        trader::TraderApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Trader Session v1.0.0 Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        app.run();

        std::cout << "[main] Trader Session stopped" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
