#include "utils/Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace NewsDesk {

std::shared_ptr<spdlog::logger> Logger::logger_;

static std::mutex& loggerMutex() {
    static std::mutex mtx;
    return mtx;
}

void Logger::init(spdlog::level::level_enum level, const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    if (!logFile.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true));
    }
    // stdout belongs to the command-line output
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>("newsdesk", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%L%$] [thread %t] %v");

    std::lock_guard<std::mutex> lock(loggerMutex());
    spdlog::drop("newsdesk");
    spdlog::register_logger(logger);
    logger_ = logger;
}

void Logger::setLevel(spdlog::level::level_enum level) {
    get()->set_level(level);
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    static std::once_flag defaultInit;
    std::call_once(defaultInit, []() {
        if (!logger_) init(spdlog::level::warn);
    });
    return logger_;
}

spdlog::level::level_enum Logger::levelFromString(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") return spdlog::level::warn;
    return level;
}

}
