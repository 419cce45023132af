#include "landforge/logging/Log.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace landforge::logsys {

namespace {
    constexpr const char* kLoggerName = "landforge";

    std::mutex                      g_mutex;
    std::shared_ptr<spdlog::logger> g_logger;

    void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
        spdlog::drop(kLoggerName);
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
        g_logger = std::move(logger);
    }
}

void init(const fs::path& logDir, spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(g_mutex);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::error_code ec;
    fs::create_directories(logDir, ec);
    bool fileSink = false;
    if (!ec) {
        try {
            const auto file = (logDir / "landforge.log").string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4));
            fileSink = true;
        } catch (const spdlog::spdlog_ex&) {
            // unwritable directory: stdout sink only
        }
    }

    install(std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end()), level);
    if (fileSink)
        g_logger->info("Logging started in {}", logDir.string());
    else
        g_logger->warn("Could not open a log file under '{}', logging to stdout only", logDir.string());
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        install(std::make_shared<spdlog::logger>(kLoggerName, std::move(sink)), spdlog::level::info);
    }
    return g_logger;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) g_logger->flush();
    spdlog::drop(kLoggerName);
    g_logger.reset();
}

} // namespace landforge::logsys
