// Single Responsibility: Slot -> entry resolution and clipboard restore

#include "clipring/SelectionResolver.hpp"
#include "clipring/ClipboardPort.hpp"
#include "clipring/HistoryStore.hpp"
#include <glib.h>

namespace clipring {

SelectionResolver::SelectionResolver(const HistoryStore& store, ClipboardPort& port)
    : m_store(store), m_port(port) {
}

std::optional<ClipboardEntry> SelectionResolver::resolve(Slot slot) const {
    return m_store.get(slot);
}

HistoryError SelectionResolver::select(Slot slot) {
    auto entry = resolve(slot);
    if (!entry) return HistoryError::NotFound;

    ScopedClipboard clipboard(m_port);
    if (!clipboard.acquired() || !m_port.writeText(entry->text())) {
        g_warning("could not restore slot %u to the clipboard", slot);
        return HistoryError::WriteFailed;
    }
    return HistoryError::None;
}

} // namespace clipring
