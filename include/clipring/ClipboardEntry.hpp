#pragma once
// Single Responsibility: Immutable captured clipboard text

#include <cstdint>
#include <string>
#include <utility>

namespace clipring {

// Insertion-time identifier of an entry, reset only by HistoryStore::clear()
using Slot = std::uint32_t;

class ClipboardEntry {
public:
    explicit ClipboardEntry(std::string text) : m_text(std::move(text)) {}

    const std::string& text() const { return m_text; }
    bool empty() const { return m_text.empty(); }

    bool operator==(const ClipboardEntry& other) const { return m_text == other.m_text; }

private:
    std::string m_text;  // Exact bytes as copied, newlines included
};

} // namespace clipring
