#include <vellum/core/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace vellum {

Result<void> setLogLevel(const std::string& level) {
    std::string name = level;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // from_str maps unrecognized names to off
    auto parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off && name != "off") {
        return Error{ErrorCode::InvalidArgument, "Unknown log level: " + level};
    }
    spdlog::set_level(parsed);
    return {};
}

Result<void> initLogging(const LoggingOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!options.file.empty()) {
        std::error_code ec;
        if (options.file.has_parent_path()) {
            std::filesystem::create_directories(options.file.parent_path(), ec);
        }
        if (ec) {
            return Error{ErrorCode::InvalidArgument,
                         "Cannot create log directory: " + ec.message()};
        }
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file.string(), options.maxFileSize, options.maxFiles));
        } catch (const spdlog::spdlog_ex& ex) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("Cannot open log file: ") + ex.what()};
        }
    }

    auto logger = std::make_shared<spdlog::logger>("vellum", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::flush_on(spdlog::level::warn);

    if (auto r = setLogLevel(options.level); !r) {
        return r;
    }
    if (!options.file.empty()) {
        spdlog::debug("Log rotation enabled: {} (max {}MB x {} files)", options.file.string(),
                      options.maxFileSize / (1024 * 1024), options.maxFiles);
    }
    return {};
}

} // namespace vellum
