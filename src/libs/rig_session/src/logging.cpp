#include <rig_session/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>

namespace rig_session {

namespace {

const char* session_logger_name = "rig_session";

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

spdlog::level::level_enum parse_level(const std::string& name, bool& known) {
    const spdlog::level::level_enum level = spdlog::level::from_str(name);
    known = level != spdlog::level::off || name == "off";
    return known ? level : spdlog::level::info;
}

} // namespace

std::shared_ptr<spdlog::logger> session_logger() {
    auto& logger = logger_slot();
    if (!logger) logger = spdlog::default_logger();
    return logger;
}

bool configure_session_logging(const LoggingSettings& settings) {
    bool known_level = true;
    const spdlog::level::level_enum level = parse_level(settings.level, known_level);

    if (settings.file.empty()) {
        logger_slot() = spdlog::default_logger();
        logger_slot()->set_level(level);
        if (!known_level) logger_slot()->warn("log_level_unknown value={} using=info", settings.level);
        return true;
    }

    const std::filesystem::path log_file(settings.file);
    if (log_file.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(log_file.parent_path(), ec);
    }

    try {
        spdlog::drop(session_logger_name);
        auto logger = spdlog::basic_logger_mt(session_logger_name, log_file.string(), true);
        logger->set_level(level);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Session logger initialized. file={}", log_file.string());
        if (!known_level) logger->warn("log_level_unknown value={} using=info", settings.level);
        logger_slot() = std::move(logger);
    } catch (const spdlog::spdlog_ex& e) {
        logger_slot() = spdlog::default_logger();
        logger_slot()->warn("session_log_unavailable file={} what={}", log_file.string(), e.what());
        return false;
    }
    return true;
}

} // namespace rig_session
