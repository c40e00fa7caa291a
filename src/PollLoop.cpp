// Single Responsibility: Periodic clipboard polling on the GLib main loop

#include "clipring/PollLoop.hpp"
#include "clipring/ClipboardPort.hpp"
#include "clipring/HistoryStore.hpp"
#include <utility>

namespace clipring {

PollLoop::PollLoop(HistoryStore& store, ClipboardPort& port, unsigned intervalMs)
    : m_store(store),
      m_port(port),
      m_intervalMs(intervalMs > 0 ? intervalMs : DEFAULT_INTERVAL_MS) {
}

PollLoop::~PollLoop() {
    stop();
}

void PollLoop::start() {
    if (m_source) return;

    m_source = g_timeout_source_new(m_intervalMs);
    g_source_set_callback(m_source, onTimeout, this, nullptr);
    g_source_attach(m_source, g_main_context_get_thread_default());
    g_debug("polling clipboard every %u ms", m_intervalMs);
}

void PollLoop::stop() {
    if (!m_source) return;
    g_source_destroy(m_source);
    g_source_unref(m_source);
    m_source = nullptr;
}

void PollLoop::setInterval(unsigned intervalMs) {
    m_intervalMs = intervalMs > 0 ? intervalMs : DEFAULT_INTERVAL_MS;
    if (m_source) {
        stop();
        start();
    }
}

void PollLoop::setOnAccepted(AcceptedCallback callback) {
    m_onAccepted = std::move(callback);
}

gboolean PollLoop::onTimeout(gpointer data) {
    static_cast<PollLoop*>(data)->tick();
    return G_SOURCE_CONTINUE;
}

std::optional<Slot> PollLoop::tick() {
    m_ticks++;

    std::optional<std::string> text;
    {
        ScopedClipboard clipboard(m_port);
        if (!clipboard.acquired()) {
            g_debug("tick %llu: clipboard busy",
                    static_cast<unsigned long long>(m_ticks));
            return std::nullopt;
        }
        text = m_port.readText();
    }

    // Busy or non-text clipboard: nothing new this tick
    if (!text) return std::nullopt;

    auto slot = m_store.offer(*text);
    if (!slot) return std::nullopt;

    m_accepted++;
    g_debug("tick %llu: new entry in slot %u",
            static_cast<unsigned long long>(m_ticks), *slot);
    if (m_onAccepted) m_onAccepted(*slot, ClipboardEntry(*text));
    return slot;
}

} // namespace clipring
