#include "core/Config.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace VT100Lex::Core {

namespace {

constexpr int kMinQueueCapacity = 1;
constexpr int kMaxQueueCapacity = 4096;
constexpr int kMinParamLimit = 9;
constexpr int kMaxParamLimit = 65535;

constexpr int kBaudRates[] = {
    1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200, 230400, 460800, 921600
};

constexpr const char* kLogLevels[] = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

// Reads an integer setting, clamping it to [minValue, maxValue]
void ReadInt(const nlohmann::json& section, const char* sectionName, const char* key,
             int minValue, int maxValue, int& target, std::vector<std::string>& warnings) {
    auto it = section.find(key);
    if (it == section.end()) {
        return;
    }
    if (!it->is_number_integer()) {
        warnings.push_back(std::string(sectionName) + "." + key + " must be an integer");
        return;
    }

    long long value = 0;
    if (it->is_number_unsigned()) {
        // Anything above maxValue only needs to compare as too large
        auto raw = it->get<unsigned long long>();
        value = raw > static_cast<unsigned long long>(maxValue) ? static_cast<long long>(maxValue) + 1
                                                                : static_cast<long long>(raw);
    } else {
        value = it->get<long long>();
    }

    long long clamped = std::clamp(value, static_cast<long long>(minValue), static_cast<long long>(maxValue));
    if (clamped != value) {
        warnings.push_back(std::string(sectionName) + "." + key + " out of range [" +
                           std::to_string(minValue) + ", " + std::to_string(maxValue) + "], clamped");
    }
    target = static_cast<int>(clamped);
}

bool ReadString(const nlohmann::json& section, const char* sectionName, const char* key,
                std::string& target, std::vector<std::string>& warnings) {
    auto it = section.find(key);
    if (it == section.end()) {
        return false;
    }
    if (!it->is_string()) {
        warnings.push_back(std::string(sectionName) + "." + key + " must be a string");
        return false;
    }
    target = it->get<std::string>();
    return true;
}

void ReadBool(const nlohmann::json& section, const char* sectionName, const char* key,
              bool& target, std::vector<std::string>& warnings) {
    auto it = section.find(key);
    if (it == section.end()) {
        return;
    }
    if (!it->is_boolean()) {
        warnings.push_back(std::string(sectionName) + "." + key + " must be true or false");
        return;
    }
    target = it->get<bool>();
}

} // namespace

Config::Config() {
    SetDefaults();
}

void Config::SetDefaults() {
    m_lexer = LexerConfig{};
    m_logging = LoggingConfig{};
    m_source = SourceConfig{};
}

bool Config::IsValidLogLevel(const std::string& level) {
    return std::find(std::begin(kLogLevels), std::end(kLogLevels), level) != std::end(kLogLevels);
}

bool Config::IsSupportedBaudRate(int baudRate) {
    return std::find(std::begin(kBaudRates), std::end(kBaudRates), baudRate) != std::end(kBaudRates);
}

std::string Config::GetDefaultConfigPath() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = std::filesystem::current_path();
    }
    return (base / "vt100lex" / "config.json").string();
}

bool Config::LoadDefault() {
    return Load(GetDefaultConfigPath());
}

bool Config::Load(const std::string& path) {
    m_warnings.clear();
    m_loaded = false;
    SetDefaults();

    std::ifstream file(path);
    if (!file) {
        // No config file is not an error
        m_loaded = true;
        return true;
    }

    std::stringstream content;
    content << file.rdbuf();

    if (!ParseJson(content.str())) {
        SetDefaults();
        return false;
    }

    m_loaded = true;
    return true;
}

bool Config::ParseJson(const std::string& json) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& ex) {
        m_warnings.push_back(std::string("Invalid JSON: ") + ex.what());
        return false;
    }
    if (!root.is_object()) {
        m_warnings.push_back("Invalid JSON: top level must be an object");
        return false;
    }

    for (const auto& item : root.items()) {
        const std::string& name = item.key();
        const nlohmann::json& section = item.value();

        if (name != "lexer" && name != "logging" && name != "source") {
            m_warnings.push_back("Unknown section \"" + name + "\" ignored");
            continue;
        }
        if (!section.is_object()) {
            m_warnings.push_back("Section \"" + name + "\" must be an object");
            continue;
        }

        if (name == "lexer") {
            ReadInt(section, "lexer", "inputQueueCapacity", kMinQueueCapacity, kMaxQueueCapacity,
                    m_lexer.inputQueueCapacity, m_warnings);
            ReadInt(section, "lexer", "outputQueueCapacity", kMinQueueCapacity, kMaxQueueCapacity,
                    m_lexer.outputQueueCapacity, m_warnings);
            ReadInt(section, "lexer", "maxParamValue", kMinParamLimit, kMaxParamLimit,
                    m_lexer.maxParamValue, m_warnings);
        } else if (name == "logging") {
            std::string level;
            if (ReadString(section, "logging", "level", level, m_warnings)) {
                std::transform(level.begin(), level.end(), level.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                if (IsValidLogLevel(level)) {
                    m_logging.level = level;
                } else {
                    m_warnings.push_back("Unknown log level \"" + level + "\", using \"" +
                                         m_logging.level + "\"");
                }
            }
            ReadString(section, "logging", "file", m_logging.file, m_warnings);
        } else {
            std::string device;
            if (ReadString(section, "source", "device", device, m_warnings)) {
                if (device.empty()) {
                    m_warnings.push_back("source.device is empty, using \"" + m_source.device + "\"");
                } else {
                    m_source.device = device;
                }
            }

            int baudRate = m_source.baudRate;
            ReadInt(section, "source", "baudRate", 0, kBaudRates[std::size(kBaudRates) - 1],
                    baudRate, m_warnings);
            if (IsSupportedBaudRate(baudRate)) {
                m_source.baudRate = baudRate;
            } else {
                m_warnings.push_back("Unsupported baud rate " + std::to_string(baudRate) +
                                     ", using " + std::to_string(m_source.baudRate));
            }

            ReadBool(section, "source", "rawMode", m_source.rawMode, m_warnings);
        }
    }

    return true;
}

bool Config::Save(const std::string& path) const {
    std::filesystem::path filePath(path);
    std::error_code ec;
    if (filePath.has_parent_path()) {
        std::filesystem::create_directories(filePath.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    nlohmann::json root;
    root["lexer"] = {
        {"inputQueueCapacity", m_lexer.inputQueueCapacity},
        {"outputQueueCapacity", m_lexer.outputQueueCapacity},
        {"maxParamValue", m_lexer.maxParamValue},
    };
    root["logging"] = {
        {"level", m_logging.level},
        {"file", m_logging.file},
    };
    root["source"] = {
        {"device", m_source.device},
        {"baudRate", m_source.baudRate},
        {"rawMode", m_source.rawMode},
    };

    std::string text;
    try {
        text = root.dump(4);
    } catch (const nlohmann::json::type_error& ex) {
        // Strings that are not valid UTF-8
        spdlog::error("Failed to serialize config: {}", ex.what());
        return false;
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return false;
    }
    file << text << "\n";
    return static_cast<bool>(file);
}

} // namespace VT100Lex::Core
