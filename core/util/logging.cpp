#include "util/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace vibescore {

namespace {

constexpr const char* kLoggerName = "vibescore";

std::shared_ptr<spdlog::logger> createLogger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>(kLoggerName, sink);
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    log->set_level(spdlog::level::info);
    log->flush_on(spdlog::level::warn);
    spdlog::register_logger(log);
    return log;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get(kLoggerName);
        if (!instance) instance = createLogger();
    });
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace vibescore
