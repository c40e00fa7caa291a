#pragma once
// Single Responsibility: Short display labels for history entries

#include "ClipboardEntry.hpp"
#include <cstddef>
#include <string>

namespace clipring {

inline constexpr std::size_t kMaxLabelChars = 20;
inline constexpr std::size_t kTruncatedChars = 17;
inline constexpr const char* kEllipsis = "...";

// Collapses newlines to spaces unless showNewlines is set, then cuts
// anything longer than kMaxLabelChars code points down to kTruncatedChars
// plus kEllipsis. Always returns valid UTF-8.
std::string renderLabel(const ClipboardEntry& entry, bool showNewlines);
std::string renderLabel(const std::string& text, bool showNewlines);

} // namespace clipring
