#pragma once
// Single Responsibility: Slot -> entry resolution and clipboard restore

#include "Forward.hpp"
#include "ClipboardEntry.hpp"
#include "HistoryError.hpp"
#include <optional>

namespace clipring {

class SelectionResolver {
public:
    SelectionResolver(const HistoryStore& store, ClipboardPort& port);

    // Empty result: slot is stale (cleared) or was never assigned
    std::optional<ClipboardEntry> resolve(Slot slot) const;

    // None, NotFound or WriteFailed. History is never modified.
    HistoryError select(Slot slot);

private:
    const HistoryStore& m_store;
    ClipboardPort& m_port;
};

} // namespace clipring
