// Clipboard access through external command-line tools
// (wl-paste/wl-copy on Wayland, xclip/xsel on X11)

#include "clipring/ClipboardPort.hpp"
#include "clipring/Config.hpp"
#include <glib.h>
#include <sys/wait.h>
#include <array>
#include <cstdio>
#include <format>

namespace clipring {

namespace {

// popen() handle that is closed exactly once
class Pipe {
public:
    Pipe(const std::string& cmd, const char* mode) : m_file(popen(cmd.c_str(), mode)) {}
    ~Pipe() { close(); }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    FILE* get() const { return m_file; }
    explicit operator bool() const { return m_file != nullptr; }

    // True if the command exited with status 0
    bool close() {
        if (!m_file) return false;
        int status = pclose(m_file);
        m_file = nullptr;
        return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }

private:
    FILE* m_file;
};

} // namespace

CommandClipboard::CommandClipboard(const Config& config)
    : m_pasteCommand(withTimeout(config.pasteCommand, config.clipboardTimeoutMs)),
      m_copyCommand(withTimeout(config.copyCommand, config.clipboardTimeoutMs)) {
}

std::string CommandClipboard::withTimeout(const std::string& cmd, int timeoutMs) const {
    if (cmd.empty() || timeoutMs <= 0) return cmd;
    return std::format("timeout {:.3f}s {}", timeoutMs / 1000.0, cmd);
}

bool CommandClipboard::acquire() {
    if (m_held) return false;
    if (m_pasteCommand.empty() || m_copyCommand.empty()) return false;
    m_held = true;
    return true;
}

void CommandClipboard::release() {
    m_held = false;
}

std::optional<std::string> CommandClipboard::readText() {
    if (!m_held) return std::nullopt;

    Pipe pipe(m_pasteCommand + " 2>/dev/null", "r");
    if (!pipe) return std::nullopt;

    std::array<char, 4096> buf;
    std::string result;
    size_t n;
    while ((n = fread(buf.data(), 1, buf.size(), pipe.get())) > 0) {
        result.append(buf.data(), n);
    }

    // Non-zero exit: nothing copied, or no text target offered
    if (!pipe.close()) return std::nullopt;
    return result;
}

bool CommandClipboard::writeText(const std::string& text) {
    if (!m_held) return false;

    Pipe pipe(m_copyCommand + " 2>/dev/null", "w");
    if (!pipe) {
        g_warning("cannot run copy command: %s", m_copyCommand.c_str());
        return false;
    }

    size_t written = fwrite(text.data(), 1, text.size(), pipe.get());
    bool exited = pipe.close();
    return written == text.size() && exited;
}

} // namespace clipring
