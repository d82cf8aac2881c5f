#pragma once

#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace rig_session {

struct LoggingSettings {
    std::string file;            // empty -> default logger
    std::string level = "info";  // spdlog level name
};

// Logger shared by the placement store and drag controller. Until
// configure_session_logging() succeeds this is spdlog's default logger.
std::shared_ptr<spdlog::logger> session_logger();

// Installs a file logger when settings.file is set. Returns false and keeps
// the default logger when the file sink cannot be created.
bool configure_session_logging(const LoggingSettings& settings);

} // namespace rig_session
