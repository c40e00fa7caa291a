#pragma once
// Single Responsibility: Control-socket command handling

#include "Forward.hpp"
#include <string>
#include <functional>
#include <unordered_map>

namespace clipring {

class IPCHandler {
public:
    using Handler = std::function<std::string(const std::string&)>;

    explicit IPCHandler(ClipboardManager& manager);
    ~IPCHandler();

    // Command registration
    void registerCommand(const std::string& name, Handler handler);
    bool hasCommand(const std::string& name) const;

    // Command execution
    std::string handleCommand(const std::string& command, const std::string& args);

    // "cmd args..." as received from the socket
    std::string handleLine(const std::string& line);

private:
    ClipboardManager& m_manager;
    std::unordered_map<std::string, Handler> m_commands;

    // Standard commands
    std::string cmdList(const std::string& args);
    std::string cmdSelect(const std::string& args);
    std::string cmdClear(const std::string& args);
    std::string cmdNewlines(const std::string& args);
    std::string cmdSave(const std::string& args);
};

// Runs one command line against the saved history without a UI, then does
// the final save. Returns false when that save fails.
bool runDetached(const Config& config, ClipboardPort& port,
                 const std::string& line, std::string& reply);

} // namespace clipring
