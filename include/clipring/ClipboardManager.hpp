#pragma once
// Single Responsibility: History engine facade (store, polling, selection, persistence)

#include "Forward.hpp"
#include "ClipboardEntry.hpp"
#include "Config.hpp"
#include "HistoryError.hpp"
#include "HistoryStore.hpp"
#include "PollLoop.hpp"
#include "SelectionResolver.hpp"
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clipring {

class ClipboardManager {
public:
    using EntryAddedCallback = std::function<void(Slot, const std::string& label)>;
    using ClearedCallback = std::function<void()>;
    using PreferenceCallback = std::function<void(bool show)>;

    static constexpr const char* CORRUPT_SUFFIX = ".corrupt";

    ClipboardManager(const Config& config, ClipboardPort& port);
    ~ClipboardManager();

    // Lifecycle
    HistoryError startup();  // Load + replay history (no callbacks), start polling
    bool shutdown();         // Stop polling, final save

    // History operations
    std::optional<Slot> offer(const std::string& text);
    HistoryError select(Slot slot);
    std::optional<ClipboardEntry> resolve(Slot slot) const;
    void clear();

    // Display; a change of value fires the preference callback
    void setShowNewlines(bool show);
    bool showNewlines() const;
    std::string labelFor(const ClipboardEntry& entry) const;
    std::vector<std::pair<Slot, std::string>> labels() const;

    // Presentation callbacks
    void setOnEntryAdded(EntryAddedCallback callback);
    void setOnCleared(ClearedCallback callback);
    void setOnShowNewlinesChanged(PreferenceCallback callback);

    // Persistence
    bool save() const;
    const std::string& historyPath() const { return m_historyPath; }

    HistoryStore& store() { return m_store; }
    const HistoryStore& store() const { return m_store; }
    PollLoop& pollLoop() { return m_pollLoop; }

private:
    std::string m_historyPath;
    HistoryStore m_store;
    PollLoop m_pollLoop;
    SelectionResolver m_resolver;
    EntryAddedCallback m_onEntryAdded;
    ClearedCallback m_onCleared;
    PreferenceCallback m_onShowNewlinesChanged;
    bool m_started = false;
    bool m_saveBlocked = false;  // File exists but could not be read

    void notifyAdded(Slot slot, const ClipboardEntry& entry);
    bool moveAsideCorrupt() const;
};

} // namespace clipring
