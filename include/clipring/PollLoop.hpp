#pragma once
// Single Responsibility: Periodic clipboard polling on the GLib main loop

#include "Forward.hpp"
#include "ClipboardEntry.hpp"
#include <glib.h>
#include <cstdint>
#include <functional>
#include <optional>

namespace clipring {

class PollLoop {
public:
    using AcceptedCallback = std::function<void(Slot, const ClipboardEntry&)>;

    static constexpr unsigned DEFAULT_INTERVAL_MS = 1000;

    PollLoop(HistoryStore& store, ClipboardPort& port,
             unsigned intervalMs = DEFAULT_INTERVAL_MS);
    ~PollLoop();

    PollLoop(const PollLoop&) = delete;
    PollLoop& operator=(const PollLoop&) = delete;

    // Attaches a timeout source to the thread-default main context
    void start();
    void stop();
    bool isRunning() const { return m_source != nullptr; }

    // One poll: read the clipboard and offer any text to the store
    std::optional<Slot> tick();

    void setInterval(unsigned intervalMs);
    unsigned interval() const { return m_intervalMs; }

    void setOnAccepted(AcceptedCallback callback);

    std::uint64_t ticks() const { return m_ticks; }
    std::uint64_t accepted() const { return m_accepted; }

private:
    HistoryStore& m_store;
    ClipboardPort& m_port;
    unsigned m_intervalMs;
    GSource* m_source = nullptr;
    AcceptedCallback m_onAccepted;
    std::uint64_t m_ticks = 0;
    std::uint64_t m_accepted = 0;

    static gboolean onTimeout(gpointer data);
};

} // namespace clipring
