#include "core/Config.h"
#include "core/Logging.h"
#include "pty/SerialSource.h"
#include "terminal/Lexer.h"
#include "terminal/Token.h"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace VT100Lex;
using namespace std::chrono_literals;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void HandleInterrupt(int) {
    g_interrupted = 1;
}

struct CommandLine {
    std::optional<std::string> configPath;
    std::optional<std::string> level;
    std::optional<std::string> logFile;
    std::optional<std::string> device;
    bool help = false;
};

void PrintUsage(const char* argv0) {
    fmt::print(stderr,
               "Usage: {} [--config FILE] [--level LEVEL] [--log FILE] [SOURCE]\n"
               "\n"
               "Reads bytes from SOURCE (a tty, FIFO or file; '-' for stdin) and prints\n"
               "every recognized VT100 token.\n"
               "\n"
               "  --config FILE   configuration file (default: {})\n"
               "  --level LEVEL   log level: trace, debug, info, warn, error, critical, off\n"
               "  --log FILE      also write the log to FILE\n"
               "  -h, --help      show this help\n",
               argv0, Core::Config::GetDefaultConfigPath());
}

bool ParseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::optional<std::string>& target) {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Missing value for {}\n", arg);
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
        } else if (arg == "--config") {
            if (!next(cmd.configPath)) return false;
        } else if (arg == "--level") {
            if (!next(cmd.level)) return false;
        } else if (arg == "--log") {
            if (!next(cmd.logFile)) return false;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            fmt::print(stderr, "Unknown option {}\n", arg);
            return false;
        } else if (!cmd.device) {
            cmd.device = arg;
        } else {
            fmt::print(stderr, "Unexpected argument {}\n", arg);
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!ParseCommandLine(argc, argv, cmd)) {
        PrintUsage(argv[0]);
        return EXIT_FAILURE;
    }
    if (cmd.help) {
        PrintUsage(argv[0]);
        return EXIT_SUCCESS;
    }

    // Load configuration, command line wins
    Core::Config config;
    bool configOk = cmd.configPath ? config.Load(*cmd.configPath) : config.LoadDefault();

    if (cmd.level) {
        if (!Core::Config::IsValidLogLevel(*cmd.level)) {
            fmt::print(stderr, "Unknown log level {}\n", *cmd.level);
            return EXIT_FAILURE;
        }
        config.GetLoggingMut().level = *cmd.level;
    }
    if (cmd.logFile) {
        config.GetLoggingMut().file = *cmd.logFile;
    }
    if (cmd.device) {
        config.GetSourceMut().device = *cmd.device;
    }

    if (!Core::InitLogging(config.GetLogging())) {
        spdlog::warn("Logging to console only");
    }

    for (const auto& warning : config.GetWarnings()) {
        spdlog::warn("Config: {}", warning);
    }
    if (!configOk) {
        spdlog::warn("Config file unusable, continuing with defaults");
    }

    const auto& lexerConfig = config.GetLexer();
    Terminal::LexerOptions options;
    options.inputQueueCapacity = static_cast<size_t>(lexerConfig.inputQueueCapacity);
    options.outputQueueCapacity = static_cast<size_t>(lexerConfig.outputQueueCapacity);
    options.maxParamValue = lexerConfig.maxParamValue;

    std::optional<Terminal::Lexer> lexer;
    try {
        lexer.emplace(options);
    } catch (const std::logic_error& ex) {
        spdlog::critical("Failed to initialize lexer: {}", ex.what());
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);

    const auto& sourceConfig = config.GetSource();
    Pty::SerialSource source(sourceConfig.baudRate, sourceConfig.rawMode);

    std::atomic<bool> sourceClosed{false};
    source.SetDataCallback([&lexer](const char* data, size_t size) {
        if (!lexer->Feed(data, size)) {
            spdlog::debug("Lexer stopped, dropping {} bytes", size);
        }
    });
    source.SetClosedCallback([&sourceClosed]() {
        sourceClosed = true;
    });

    // Print tokens as they arrive; once the source is gone, stop when every
    // fed byte has been processed and its token printed
    std::atomic<size_t> tokenCount{0};
    std::thread consumer([&]() {
        while (true) {
            auto token = lexer->Output().PopFor(50ms);
            if (token) {
                fmt::print("{}\n", Terminal::ToString(*token));
                ++tokenCount;
                continue;
            }
            if (lexer->Output().IsClosed()) {
                break;
            }
            if (sourceClosed && lexer->PendingInput() == 0 && lexer->Output().Size() == 0) {
                break;
            }
        }
    });

    if (!source.Start(sourceConfig.device)) {
        lexer->Shutdown();
        consumer.join();
        return EXIT_FAILURE;
    }

    while (!g_interrupted && !sourceClosed) {
        std::this_thread::sleep_for(50ms);
    }

    if (g_interrupted) {
        spdlog::info("Interrupted");
        // Releases a reader blocked in Feed() before joining it
        lexer->Shutdown();
        source.Stop();
        consumer.join();
    } else {
        source.Stop();
        consumer.join();
        lexer->Shutdown();
    }

    spdlog::info("{} tokens", tokenCount.load());
    return EXIT_SUCCESS;
}
