// Single Responsibility: Control-socket command handling

#include "clipring/IPCHandler.hpp"
#include "clipring/ClipboardManager.hpp"
#include "clipring/HistoryError.hpp"
#include <glib.h>
#include <cstdint>
#include <stdexcept>

namespace clipring {

IPCHandler::IPCHandler(ClipboardManager& manager)
    : m_manager(manager) {
    // Register standard commands
    registerCommand("list", [this](const std::string& a) { return cmdList(a); });
    registerCommand("select", [this](const std::string& a) { return cmdSelect(a); });
    registerCommand("clear", [this](const std::string& a) { return cmdClear(a); });
    registerCommand("newlines", [this](const std::string& a) { return cmdNewlines(a); });
    registerCommand("save", [this](const std::string& a) { return cmdSave(a); });
}

IPCHandler::~IPCHandler() = default;

void IPCHandler::registerCommand(const std::string& name, Handler handler) {
    m_commands[name] = std::move(handler);
}

bool IPCHandler::hasCommand(const std::string& name) const {
    return m_commands.count(name) > 0;
}

std::string IPCHandler::handleCommand(const std::string& command,
                                      const std::string& args) {
    auto it = m_commands.find(command);
    if (it != m_commands.end()) {
        return it->second(args);
    }
    return "unknown command: " + command;
}

std::string IPCHandler::handleLine(const std::string& line) {
    std::string cmd = line;
    while (!cmd.empty() && (cmd.back() == '\n' || cmd.back() == '\r'))
        cmd.pop_back();

    std::string args;
    size_t spacePos = cmd.find(' ');
    if (spacePos != std::string::npos) {
        args = cmd.substr(spacePos + 1);
        cmd = cmd.substr(0, spacePos);
    }
    return handleCommand(cmd, args);
}

std::string IPCHandler::cmdList(const std::string& /*args*/) {
    std::string result;
    for (const auto& [slot, label] : m_manager.labels()) {
        result += std::to_string(slot) + " | " + label + "\n";
    }
    return result.empty() ? "no items" : result;
}

std::string IPCHandler::cmdSelect(const std::string& args) {
    if (args.empty()) return "error: no slot provided";

    Slot slot = 0;
    try {
        size_t used = 0;
        unsigned long parsed = std::stoul(args, &used);
        if (used != args.size() || parsed > UINT32_MAX) throw std::out_of_range("slot");
        slot = static_cast<Slot>(parsed);
    } catch (const std::exception&) {
        return "error: invalid slot: " + args;
    }

    HistoryError result = m_manager.select(slot);
    if (result != HistoryError::None) {
        return std::string("error: ") + errorString(result);
    }
    return "selected " + std::to_string(slot);
}

std::string IPCHandler::cmdClear(const std::string& /*args*/) {
    m_manager.clear();
    return "cleared";
}

std::string IPCHandler::cmdNewlines(const std::string& args) {
    if (args == "on") m_manager.setShowNewlines(true);
    else if (args == "off") m_manager.setShowNewlines(false);
    else if (!args.empty()) return "error: expected on or off";

    return std::string("newlines ") + (m_manager.showNewlines() ? "on" : "off");
}

std::string IPCHandler::cmdSave(const std::string& /*args*/) {
    return m_manager.save() ? "saved" : "error: save failed";
}

// ============================================================================
// Detached execution (no running instance)
// ============================================================================

bool runDetached(const Config& config, ClipboardPort& port,
                 const std::string& line, std::string& reply) {
    ClipboardManager manager(config, port);
    HistoryError status = manager.startup();
    if (status != HistoryError::None) {
        g_warning("running '%s' on empty history: %s", line.c_str(), errorString(status));
    }

    IPCHandler ipc(manager);
    reply = ipc.handleLine(line);
    return manager.shutdown();
}

} // namespace clipring
