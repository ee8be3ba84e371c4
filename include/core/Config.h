#pragma once

#include <string>
#include <vector>

namespace VT100Lex::Core {

// Queue sizes and parameter limits for Terminal::Lexer
struct LexerConfig {
    int inputQueueCapacity = 10;
    int outputQueueCapacity = 10;
    int maxParamValue = 999;    // Largest numeric parameter accepted in a sequence
};

// spdlog setup
struct LoggingConfig {
    std::string level = "info";  // trace, debug, info, warn, error, critical, off
    std::string file;            // Empty = console only
};

// Where bytes come from
struct SourceConfig {
    std::string device = "-";   // Path to a tty, FIFO or file; "-" = stdin
    int baudRate = 9600;        // Applied only when the device is a tty
    bool rawMode = true;        // Put a tty into raw mode before reading
};

// Main configuration class
class Config {
public:
    Config();
    ~Config() = default;

    // Load configuration from file
    bool Load(const std::string& path);

    // Load from default location ($XDG_CONFIG_HOME/vt100lex/config.json)
    bool LoadDefault();

    // Save configuration to file
    bool Save(const std::string& path) const;

    // Get configuration path
    static std::string GetDefaultConfigPath();

    // Accessors
    const LexerConfig& GetLexer() const { return m_lexer; }
    const LoggingConfig& GetLogging() const { return m_logging; }
    const SourceConfig& GetSource() const { return m_source; }

    // Mutable accessors for command line overrides and testing
    LexerConfig& GetLexerMut() { return m_lexer; }
    LoggingConfig& GetLoggingMut() { return m_logging; }
    SourceConfig& GetSourceMut() { return m_source; }

    // Check if config was loaded successfully
    bool IsLoaded() const { return m_loaded; }

    // Get any warnings from loading
    const std::vector<std::string>& GetWarnings() const { return m_warnings; }

    static bool IsValidLogLevel(const std::string& level);
    static bool IsSupportedBaudRate(int baudRate);

private:
    bool ParseJson(const std::string& json);
    void SetDefaults();

    LexerConfig m_lexer;
    LoggingConfig m_logging;
    SourceConfig m_source;

    bool m_loaded = false;
    std::vector<std::string> m_warnings;
};

} // namespace VT100Lex::Core
