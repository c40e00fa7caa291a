#pragma once
// Error taxonomy shared by the engine components

namespace clipring {

enum class HistoryError {
    None,
    NotFound,         // Slot never assigned or cleared since
    NoTextAvailable,  // Clipboard busy or holding non-text data
    WriteFailed,      // Clipboard could not be written
    CorruptStore,     // History file exists but cannot be parsed
    ReadFailed        // History file exists but cannot be read
};

const char* errorString(HistoryError error);

} // namespace clipring
