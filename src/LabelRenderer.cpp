// Single Responsibility: Short display labels for history entries

#include "clipring/LabelRenderer.hpp"
#include <glib.h>
#include <algorithm>

namespace clipring {

std::string renderLabel(const std::string& text, bool showNewlines) {
    std::string label = text;
    if (!showNewlines) {
        std::replace(label.begin(), label.end(), '\n', ' ');
    }

    // GTK labels need valid UTF-8; g_utf8_validate also rejects embedded NULs
    if (!g_utf8_validate(label.data(), static_cast<gssize>(label.size()), nullptr)) {
        gchar* valid = g_utf8_make_valid(label.data(), static_cast<gssize>(label.size()));
        label = valid;
        g_free(valid);
    }

    glong length = g_utf8_strlen(label.c_str(), -1);
    if (length <= static_cast<glong>(kMaxLabelChars)) {
        return label;
    }

    const gchar* cut = g_utf8_offset_to_pointer(label.c_str(),
                                                static_cast<glong>(kTruncatedChars));
    label.erase(static_cast<size_t>(cut - label.c_str()));
    label += kEllipsis;
    return label;
}

std::string renderLabel(const ClipboardEntry& entry, bool showNewlines) {
    return renderLabel(entry.text(), showNewlines);
}

} // namespace clipring
