#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace NewsDesk {

class Logger {
public:
    // Safe to call more than once; the last call wins.
    static void init(spdlog::level::level_enum level, const std::string& logFile = "");
    static void setLevel(spdlog::level::level_enum level);

    static std::shared_ptr<spdlog::logger>& get();

    static spdlog::level::level_enum levelFromString(const std::string& name);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

}

#define LOG_TRACE(...)    ::NewsDesk::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::NewsDesk::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::NewsDesk::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::NewsDesk::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::NewsDesk::Logger::get()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::NewsDesk::Logger::get()->critical(__VA_ARGS__)
