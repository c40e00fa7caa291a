// Single Responsibility: Configuration file parsing

#include "clipring/ConfigParser.hpp"
#include <glib.h>
#include <unistd.h>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace clipring {

std::string getConfigPath() {
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    std::string configDir;

    if (xdgConfig && *xdgConfig) {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        configDir = home ? std::string(home) + "/.config" : "/tmp";
    }

    return configDir + "/clipring/clipring.toml";
}

std::string getDataDir() {
    const char* xdgData = std::getenv("XDG_DATA_HOME");
    std::string dataDir;

    if (xdgData && *xdgData) {
        dataDir = xdgData;
    } else {
        const char* home = std::getenv("HOME");
        dataDir = home ? std::string(home) + "/.local/share" : "/tmp";
    }

    dataDir += "/clipring";

    // Create directory if it doesn't exist
    std::error_code ec;
    fs::create_directories(dataDir, ec);

    return dataDir;
}

std::string getDefaultHistoryPath() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        fs::path dir = exe.parent_path();
        if (access(dir.c_str(), W_OK) == 0) {
            return (dir / "clipring.history").string();
        }
    }
    return getDataDir() + "/clipring.history";
}

// Simple TOML-like parser (manual, no external dependency)
static std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    size_t end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

static std::string parseString(const std::string& value) {
    std::string v = trim(value);
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

static int parseInt(const std::string& key, const std::string& value, int fallback) {
    try {
        size_t used = 0;
        int parsed = std::stoi(trim(value), &used);
        if (used == trim(value).size()) return parsed;
    } catch (const std::exception&) {
    }
    g_warning("config: %s = %s is not an integer, using %d",
              key.c_str(), value.c_str(), fallback);
    return fallback;
}

static bool parseBool(const std::string& value) {
    std::string v = trim(value);
    return v == "true" || v == "1";
}

Config parseConfig(const std::string& contents) {
    Config config;
    std::istringstream in(contents);

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);

        // Skip comments, section headers and empty lines
        if (line.empty() || line[0] == '#' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // Parse known keys
        if (key == "poll_interval_ms") config.pollIntervalMs = parseInt(key, value, config.pollIntervalMs);
        else if (key == "show_newlines") config.showNewlines = parseBool(value);
        else if (key == "history_file") {
            config.historyFile = parseString(value);
            config.historyFileConfigured = !config.historyFile.empty();
        }
        else if (key == "paste_command") config.pasteCommand = parseString(value);
        else if (key == "copy_command") config.copyCommand = parseString(value);
        else if (key == "clipboard_timeout_ms") config.clipboardTimeoutMs = parseInt(key, value, config.clipboardTimeoutMs);
        else if (key == "window_width") config.windowWidth = parseInt(key, value, config.windowWidth);
        else if (key == "window_height") config.windowHeight = parseInt(key, value, config.windowHeight);
        else if (key == "socket_path") config.socketPath = parseString(value);
        else g_debug("config: unknown key %s", key.c_str());
    }

    if (config.pollIntervalMs <= 0) {
        g_warning("config: poll_interval_ms must be positive, using 1000");
        config.pollIntervalMs = 1000;
    }

    return config;
}

Config loadConfigFrom(const std::string& path) {
    Config config;

    std::ifstream file(path);
    if (file.is_open()) {
        std::stringstream buffer;
        buffer << file.rdbuf();
        config = parseConfig(buffer.str());
    }
    // Missing file: defaults

    config.configPath = path;
    if (!config.historyFileConfigured) {
        config.historyFile = getDefaultHistoryPath();
    }
    return config;
}

Config loadConfig() {
    return loadConfigFrom(getConfigPath());
}

bool saveConfig(const Config& config) {
    if (config.configPath.empty()) return false;

    std::error_code ec;
    fs::create_directories(fs::path(config.configPath).parent_path(), ec);

    std::ofstream file(config.configPath);
    if (!file.is_open()) {
        g_warning("cannot write config %s", config.configPath.c_str());
        return false;
    }

    file << "# ClipRing Configuration\n\n";
    file << "[general]\n";
    file << "poll_interval_ms = " << config.pollIntervalMs << "\n";
    file << "show_newlines = " << (config.showNewlines ? "true" : "false") << "\n";
    // A resolved default stays unwritten so it follows the executable
    if (config.historyFileConfigured)
        file << "history_file = \"" << config.historyFile << "\"\n";
    file << "\n";

    file << "[clipboard]\n";
    file << "paste_command = \"" << config.pasteCommand << "\"\n";
    file << "copy_command = \"" << config.copyCommand << "\"\n";
    file << "clipboard_timeout_ms = " << config.clipboardTimeoutMs << "\n\n";

    file << "[window]\n";
    file << "window_width = " << config.windowWidth << "\n";
    file << "window_height = " << config.windowHeight << "\n";
    file << "socket_path = \"" << config.socketPath << "\"\n";

    return file.good();
}

} // namespace clipring
