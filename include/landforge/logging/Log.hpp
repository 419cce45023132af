#pragma once
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace landforge::logsys {
    // Rotating "<logDir>/landforge.log" (1MB * 4) plus a colour stdout sink.
    // Falls back to stdout only when logDir cannot be created.
    void init(const std::filesystem::path& logDir,
              spdlog::level::level_enum level = spdlog::level::info);

    // "landforge"; created stdout-only on first use if init() was never called.
    std::shared_ptr<spdlog::logger> get();

    void shutdown();
}
