#include <escp/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace escp {

// ─── Helpers ─────────────────────────────────────────────────────────────────

static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// {a: {b: {c: value}}} for "a.b.c"
static YAML::Node nestedNode(const std::vector<std::string>& parts, const YAML::Node& value) {
    YAML::Node node = YAML::Clone(value);
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        YAML::Node parent(YAML::NodeType::Map);
        parent[*it] = node;
        node.reset(parent);
    }
    return node;
}

static const char* const KNOWN_KEYS[] = {
    Config::KEY_PRINTER_DEVICE,
    Config::KEY_PRINTER_STATUS_TIMEOUT_MS,
    Config::KEY_PRINTER_QUERY_STATUS,
    Config::KEY_OUTPUT_PATH,
    Config::KEY_LOG_LEVEL,
};

// ─── Construction ────────────────────────────────────────────────────────────

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    loadDefaults();

    if (!_configPath.empty()) {
        // An explicitly named file must load
        if (auto res = loadFile(_configPath); !res) {
            return res;
        }
        _loadedFrom = _configPath;
        yinfo("Loaded config from: {}", _configPath);
    } else {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            if (auto res = loadFile(xdgPath.string()); !res) {
                ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
            } else {
                _loadedFrom = xdgPath.string();
                yinfo("Loaded config from: {}", _loadedFrom);
            }
        }
    }

    try {
        applyEnvOverrides();
        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err(Error(ErrorKind::Config, "Invalid config override: " + std::string(e.what())));
    }
    return Ok();
}

void Config::loadDefaults() {
    _config["printer"]["device"] = DEFAULT_DEVICE;
    _config["printer"]["status-timeout-ms"] = 1000;
    _config["printer"]["query-status"] = false;
    _config["output"]["path"] = "";
    _config["log"]["level"] = "info";
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err(Error(ErrorKind::Config, "Cannot open config file: " + path));
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (!fileConfig || fileConfig.IsNull()) {
            return Ok();
        }
        if (!fileConfig.IsMap()) {
            return Err(Error(ErrorKind::Config, "Config file is not a YAML map: " + path));
        }
        mergeNodes(_config, fileConfig);
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err(Error(ErrorKind::Config, "YAML parse error in " + path + ": " + std::string(e.what())));
    }
}

void Config::applyEnvOverrides() {
    for (const char* key : KNOWN_KEYS) {
        std::string envVar = pathToEnvVar(key);
        const char* val = std::getenv(envVar.c_str());
        if (!val) continue;

        ydebug("Config: {} overridden by {}", key, envVar);
        mergeNodes(_config, nestedNode(splitPath(key), YAML::Node(std::string(val))));
    }
}

// ─── Lookup ──────────────────────────────────────────────────────────────────

YAML::Node Config::getNode(const std::string& path) const {
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : splitPath(path)) {
        if (!current.IsMap()) {
            return YAML::Node();
        }
        // const operator[] never inserts
        const YAML::Node& parent = current;
        YAML::Node next = parent[part];
        if (!next) {
            return YAML::Node();
        }
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

void Config::mergeNodes(YAML::Node& target, const YAML::Node& source) {
    if (!source.IsMap()) return;

    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;

        const YAML::Node& constTarget = target;
        YAML::Node existing = constTarget[key];
        if (value.IsMap() && existing && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }

    return configDir / "escp-layout" / "config.yaml";
}

// ─── Typed accessors ─────────────────────────────────────────────────────────

std::string Config::printerDevice() const {
    return get<std::string>(KEY_PRINTER_DEVICE, DEFAULT_DEVICE);
}

std::chrono::milliseconds Config::statusTimeout() const {
    return std::chrono::milliseconds(get<int>(KEY_PRINTER_STATUS_TIMEOUT_MS, 1000));
}

bool Config::queryStatusFirst() const {
    return get<bool>(KEY_PRINTER_QUERY_STATUS, false);
}

std::string Config::outputPath() const {
    return get<std::string>(KEY_OUTPUT_PATH, "");
}

std::string Config::logLevel() const {
    return get<std::string>(KEY_LOG_LEVEL, "info");
}

} // namespace escp
