#include "core/Logging.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace VT100Lex::Core {

bool InitLogging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    bool fileOk = true;
    std::string fileError;
    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
        } catch (const spdlog::spdlog_ex& ex) {
            fileOk = false;
            fileError = ex.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("vt100lex", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.level));
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [t%t] %v");
    spdlog::set_default_logger(logger);

    if (!fileOk) {
        spdlog::error("Failed to open log file {}: {}", config.file, fileError);
    }
    return fileOk;
}

} // namespace VT100Lex::Core
