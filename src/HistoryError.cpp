#include "clipring/HistoryError.hpp"

namespace clipring {

const char* errorString(HistoryError error) {
    switch (error) {
        case HistoryError::None:            return "ok";
        case HistoryError::NotFound:        return "entry not found";
        case HistoryError::NoTextAvailable: return "no text on clipboard";
        case HistoryError::WriteFailed:     return "clipboard write failed";
        case HistoryError::CorruptStore:    return "history file is corrupt";
        case HistoryError::ReadFailed:      return "history file could not be read";
    }
    return "unknown error";
}

} // namespace clipring
