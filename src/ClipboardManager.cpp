// History engine: owns the store and wires polling, selection and
// persistence around it. Everything runs on the GLib main loop.

#include "clipring/ClipboardManager.hpp"
#include "clipring/HistoryFile.hpp"
#include "clipring/LabelRenderer.hpp"
#include <glib.h>
#include <glib/gstdio.h>
#include <cerrno>

namespace clipring {

ClipboardManager::ClipboardManager(const Config& config, ClipboardPort& port)
    : m_historyPath(config.historyFile),
      m_pollLoop(m_store, port, static_cast<unsigned>(config.pollIntervalMs)),
      m_resolver(m_store, port) {
    m_store.setShowNewlines(config.showNewlines);
    m_pollLoop.setOnAccepted([this](Slot slot, const ClipboardEntry& entry) {
        notifyAdded(slot, entry);
    });
}

ClipboardManager::~ClipboardManager() {
    shutdown();
}

// ============================================================================
// Lifecycle
// ============================================================================

HistoryError ClipboardManager::startup() {
    HistoryError status = HistoryError::None;

    if (!m_historyPath.empty()) {
        LoadResult loaded = loadHistory(m_historyPath);
        if (loaded.error == HistoryError::ReadFailed) {
            g_warning("cannot read history file %s (%s), it will not be overwritten",
                      m_historyPath.c_str(), loaded.detail.c_str());
            m_saveBlocked = true;
            status = loaded.error;
        } else if (loaded.error == HistoryError::CorruptStore) {
            g_warning("ignoring history file %s (%s: %s)", m_historyPath.c_str(),
                      errorString(loaded.error), loaded.detail.c_str());
            if (!moveAsideCorrupt()) m_saveBlocked = true;
            status = loaded.error;
        }

        // Replay in saved order; duplicates in the file collapse here.
        // No per-entry callbacks: listeners rebuild from labels() once.
        for (const auto& text : loaded.texts) m_store.offer(text);
        g_message("restored %zu entries from %s", m_store.size(), m_historyPath.c_str());
    }

    m_pollLoop.start();
    m_started = true;
    return status;
}

bool ClipboardManager::shutdown() {
    if (!m_started) return true;
    m_pollLoop.stop();
    m_started = false;

    if (m_saveBlocked) {
        g_critical("history in %s was never loaded and is left as it was; "
                   "%zu entries from this session are not saved",
                   m_historyPath.c_str(), m_store.size());
        return false;
    }

    if (save()) return true;

    g_warning("final save to %s failed, retrying", m_historyPath.c_str());
    if (save()) return true;

    g_critical("clipboard history could not be saved to %s", m_historyPath.c_str());
    return false;
}

// ============================================================================
// History operations
// ============================================================================

std::optional<Slot> ClipboardManager::offer(const std::string& text) {
    auto slot = m_store.offer(text);
    if (slot) notifyAdded(*slot, ClipboardEntry(text));
    return slot;
}

HistoryError ClipboardManager::select(Slot slot) {
    return m_resolver.select(slot);
}

std::optional<ClipboardEntry> ClipboardManager::resolve(Slot slot) const {
    return m_resolver.resolve(slot);
}

void ClipboardManager::clear() {
    m_store.clear();
    // Listeners drop their displayed slots before clear() returns
    if (m_onCleared) m_onCleared();
}

// ============================================================================
// Display
// ============================================================================

void ClipboardManager::setShowNewlines(bool show) {
    if (show == m_store.showNewlines()) return;
    m_store.setShowNewlines(show);
    if (m_onShowNewlinesChanged) m_onShowNewlinesChanged(show);
}

bool ClipboardManager::showNewlines() const {
    return m_store.showNewlines();
}

std::string ClipboardManager::labelFor(const ClipboardEntry& entry) const {
    return renderLabel(entry, m_store.showNewlines());
}

std::vector<std::pair<Slot, std::string>> ClipboardManager::labels() const {
    bool showNewlines = m_store.showNewlines();
    std::vector<std::pair<Slot, std::string>> result;
    for (const auto& [slot, entry] : m_store.all()) {
        result.emplace_back(slot, renderLabel(entry, showNewlines));
    }
    return result;
}

void ClipboardManager::setOnEntryAdded(EntryAddedCallback callback) {
    m_onEntryAdded = std::move(callback);
}

void ClipboardManager::setOnCleared(ClearedCallback callback) {
    m_onCleared = std::move(callback);
}

void ClipboardManager::setOnShowNewlinesChanged(PreferenceCallback callback) {
    m_onShowNewlinesChanged = std::move(callback);
}

void ClipboardManager::notifyAdded(Slot slot, const ClipboardEntry& entry) {
    if (m_onEntryAdded) m_onEntryAdded(slot, labelFor(entry));
}

// ============================================================================
// Persistence
// ============================================================================

bool ClipboardManager::save() const {
    if (m_historyPath.empty()) return true;
    if (m_saveBlocked) {
        g_warning("not saving over unreadable history file %s", m_historyPath.c_str());
        return false;
    }
    return saveHistory(m_store.texts(), m_historyPath);
}

// Keeps the unparseable bytes for inspection; the next save starts fresh
bool ClipboardManager::moveAsideCorrupt() const {
    std::string aside = m_historyPath + CORRUPT_SUFFIX;
    if (g_rename(m_historyPath.c_str(), aside.c_str()) != 0) {
        g_warning("cannot move corrupt history %s aside: %s",
                  m_historyPath.c_str(), g_strerror(errno));
        return false;
    }
    g_message("corrupt history kept as %s", aside.c_str());
    return true;
}

} // namespace clipring
