#pragma once
// Single Responsibility: Ordered, deduplicated clipboard history

#include "ClipboardEntry.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace clipring {

class HistoryStore {
public:
    HistoryStore() = default;

    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    // Appends text unless an identical entry exists. Returns the new slot,
    // or nothing for a duplicate (store left untouched).
    std::optional<Slot> offer(const std::string& text);

    // Drops every entry and restarts slot numbering at 0
    void clear();

    // Empty result means the slot is unknown or was invalidated by clear()
    std::optional<ClipboardEntry> get(Slot slot) const;

    // Snapshot in insertion order, oldest first
    std::vector<std::pair<Slot, ClipboardEntry>> all() const;
    std::vector<std::string> texts() const;

    bool contains(const std::string& text) const;
    std::size_t size() const;
    bool empty() const;
    Slot nextSlot() const;

    // Display preference only, stored entries are never touched
    void setShowNewlines(bool show);
    bool showNewlines() const;

private:
    mutable std::mutex m_mutex;
    // index == slot; push_back never relocates entries, so the views
    // in m_slotByText stay valid until clear()
    std::deque<ClipboardEntry> m_entries;
    std::unordered_map<std::string_view, Slot> m_slotByText;
    bool m_showNewlines = false;
};

} // namespace clipring
