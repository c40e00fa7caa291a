#pragma once
#include <string>

namespace clipring {

struct Config {
    // Window dimensions
    int windowWidth = 420;
    int windowHeight = 480;

    // Behavior
    int pollIntervalMs = 1000;
    bool showNewlines = false;

    // Clipboard tools (read stdout / write stdin)
    std::string pasteCommand = "wl-paste --no-newline --type text";
    std::string copyCommand = "wl-copy";
    int clipboardTimeoutMs = 500;

    // Paths
    std::string configPath;
    std::string historyFile;
    bool historyFileConfigured = false;  // history_file came from the config file
    std::string socketPath = "/tmp/clipring-ui.sock";
};

} // namespace clipring
