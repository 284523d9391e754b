#include "app/Application.hpp"
#include "utils/Config.hpp"
#include "utils/Logger.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        auto& config = NewsDesk::Config::getInstance();
        NewsDesk::Logger::init(NewsDesk::Logger::levelFromString(config.getLogLevel()));
        NewsDesk::Application app(config);
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
