#pragma once
// Single Responsibility: Binary history file (save/load)
//
// Layout, all integers little-endian u32:
//   "CLPR" | version | count | { length | bytes } * count

#include "HistoryError.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace clipring {

inline constexpr char kHistoryMagic[4] = {'C', 'L', 'P', 'R'};
inline constexpr std::uint32_t kHistoryVersion = 1;

struct LoadResult {
    std::vector<std::string> texts;
    HistoryError error = HistoryError::None;
    std::string detail;

    bool ok() const { return error == HistoryError::None; }
};

std::string encodeHistory(const std::vector<std::string>& texts);

// Returns false and fills detail when the buffer is not a valid history file
bool decodeHistory(const std::string& data, std::vector<std::string>& texts,
                   std::string& detail);

// Atomic replace: the previous file survives a failed or interrupted save
bool saveHistory(const std::vector<std::string>& texts, const std::string& path);

// Missing file is an empty history, not an error. ReadFailed means the
// file is there but its bytes could not be read; CorruptStore means they
// were read and do not decode.
LoadResult loadHistory(const std::string& path);

} // namespace clipring
