#include "sweep/Logging.hpp"

#include <memory>
#include <system_error>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include "sweep/Config.hpp"

bool InitLogging(const std::filesystem::path& log_file, bool debug) {
    std::shared_ptr<spdlog::logger> logger;
    bool opened = true;
    try {
        std::error_code ec;
        if (log_file.has_parent_path()) {
            std::filesystem::create_directories(log_file.parent_path(), ec);
        }
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false);
        logger = std::make_shared<spdlog::logger>("buildsweep", sink);
    } catch (const spdlog::spdlog_ex&) {
        logger = std::make_shared<spdlog::logger>("buildsweep", std::make_shared<spdlog::sinks::null_sink_mt>());
        opened = false;
    }

    logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(logger);
    return opened;
}

std::filesystem::path DefaultLogPath() {
    return UserDataDir() / "buildsweep.log";
}
