// Single Responsibility: Ordered, deduplicated clipboard history

#include "clipring/HistoryStore.hpp"

namespace clipring {

std::optional<Slot> HistoryStore::offer(const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_slotByText.count(std::string_view(text))) return std::nullopt;

    // Entries are only ever removed all at once, so the next slot is the size
    Slot slot = static_cast<Slot>(m_entries.size());
    const ClipboardEntry& entry = m_entries.emplace_back(text);
    m_slotByText.emplace(std::string_view(entry.text()), slot);
    return slot;
}

void HistoryStore::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_slotByText.clear();
    m_entries.clear();
}

std::optional<ClipboardEntry> HistoryStore::get(Slot slot) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (slot >= m_entries.size()) return std::nullopt;
    return m_entries[slot];
}

std::vector<std::pair<Slot, ClipboardEntry>> HistoryStore::all() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::pair<Slot, ClipboardEntry>> result;
    result.reserve(m_entries.size());
    for (size_t i = 0; i < m_entries.size(); i++) {
        result.emplace_back(static_cast<Slot>(i), m_entries[i]);
    }
    return result;
}

std::vector<std::string> HistoryStore::texts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) result.push_back(entry.text());
    return result;
}

bool HistoryStore::contains(const std::string& text) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slotByText.count(std::string_view(text)) > 0;
}

std::size_t HistoryStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool HistoryStore::empty() const {
    return size() == 0;
}

Slot HistoryStore::nextSlot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<Slot>(m_entries.size());
}

void HistoryStore::setShowNewlines(bool show) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_showNewlines = show;
}

bool HistoryStore::showNewlines() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_showNewlines;
}

} // namespace clipring
