#pragma once

#include <escp/result.hpp>
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace escp {

//=============================================================================
// Config - layered settings for the renderer and printer tools
//
// Precedence, lowest first: built-in defaults, YAML file, ESCP_* environment
// variables, command line overrides.
//=============================================================================
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // An empty configPath falls back to the XDG location if that file exists
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Value at a dotted path (e.g. "printer.device"); nullopt if missing or not convertible
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // Path of the file that was loaded, empty if none
    const std::string& loadedFrom() const { return _loadedFrom; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "ESCP_";

    static constexpr const char* KEY_PRINTER_DEVICE = "printer.device";
    static constexpr const char* KEY_PRINTER_STATUS_TIMEOUT_MS = "printer.status-timeout-ms";
    static constexpr const char* KEY_PRINTER_QUERY_STATUS = "printer.query-status";
    static constexpr const char* KEY_OUTPUT_PATH = "output.path";
    static constexpr const char* KEY_LOG_LEVEL = "log.level";

    static constexpr const char* DEFAULT_DEVICE = "/dev/usb/lp0";

    // Typed accessors for the known keys
    std::string printerDevice() const;
    std::chrono::milliseconds statusTimeout() const;
    bool queryStatusFirst() const;
    std::string outputPath() const;
    std::string logLevel() const;

    // "printer.status-timeout-ms" -> "ESCP_PRINTER_STATUS_TIMEOUT_MS"
    static std::string pathToEnvVar(const std::string& path);

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides();

    YAML::Node getNode(const std::string& path) const;

    static void mergeNodes(YAML::Node& target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedFrom;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace escp
