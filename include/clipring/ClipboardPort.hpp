#pragma once
// Single Responsibility: Access to the system clipboard

#include "Forward.hpp"
#include <optional>
#include <string>

namespace clipring {

// Every read or write must happen between acquire() and release().
// Use ScopedClipboard rather than calling them by hand.
class ClipboardPort {
public:
    virtual ~ClipboardPort() = default;

    virtual bool acquire() = 0;
    virtual void release() = 0;

    // Empty result: clipboard empty, busy, or holding non-text data
    virtual std::optional<std::string> readText() = 0;
    virtual bool writeText(const std::string& text) = 0;
};

// Holds the clipboard for exactly one operation, releases on scope exit
class ScopedClipboard {
public:
    explicit ScopedClipboard(ClipboardPort& port)
        : m_port(port), m_acquired(port.acquire()) {}
    ~ScopedClipboard() {
        if (m_acquired) m_port.release();
    }

    ScopedClipboard(const ScopedClipboard&) = delete;
    ScopedClipboard& operator=(const ScopedClipboard&) = delete;

    bool acquired() const { return m_acquired; }

private:
    ClipboardPort& m_port;
    bool m_acquired;
};

// Talks to the clipboard through external tools (wl-paste/wl-copy,
// xclip, xsel). Reads the paste command's stdout, feeds the copy
// command's stdin.
class CommandClipboard : public ClipboardPort {
public:
    explicit CommandClipboard(const Config& config);

    bool acquire() override;
    void release() override;
    std::optional<std::string> readText() override;
    bool writeText(const std::string& text) override;

private:
    std::string m_pasteCommand;
    std::string m_copyCommand;
    bool m_held = false;

    std::string withTimeout(const std::string& cmd, int timeoutMs) const;
};

} // namespace clipring
