// Single Responsibility: Binary history file (save/load)

#include "clipring/HistoryFile.hpp"
#include <glib.h>
#include <glib/gstdio.h>
#include <cerrno>
#include <cstring>
#include <format>

namespace clipring {

// ============================================================================
// Encoding
// ============================================================================

static void appendU32(std::string& out, std::uint32_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>((value >> 16) & 0xFF));
    out.push_back(static_cast<char>((value >> 24) & 0xFF));
}

static bool readU32(const std::string& data, size_t& pos, std::uint32_t& value) {
    if (data.size() - pos < 4) return false;
    const auto* p = reinterpret_cast<const unsigned char*>(data.data() + pos);
    value = static_cast<std::uint32_t>(p[0])
          | (static_cast<std::uint32_t>(p[1]) << 8)
          | (static_cast<std::uint32_t>(p[2]) << 16)
          | (static_cast<std::uint32_t>(p[3]) << 24);
    pos += 4;
    return true;
}

std::string encodeHistory(const std::vector<std::string>& texts) {
    std::string out(kHistoryMagic, sizeof(kHistoryMagic));
    appendU32(out, kHistoryVersion);
    appendU32(out, static_cast<std::uint32_t>(texts.size()));
    for (const auto& text : texts) {
        appendU32(out, static_cast<std::uint32_t>(text.size()));
        out += text;
    }
    return out;
}

bool decodeHistory(const std::string& data, std::vector<std::string>& texts,
                   std::string& detail) {
    texts.clear();

    if (data.size() < sizeof(kHistoryMagic) ||
        std::memcmp(data.data(), kHistoryMagic, sizeof(kHistoryMagic)) != 0) {
        detail = "bad magic";
        return false;
    }
    size_t pos = sizeof(kHistoryMagic);

    std::uint32_t version = 0;
    if (!readU32(data, pos, version)) {
        detail = "truncated header";
        return false;
    }
    if (version != kHistoryVersion) {
        detail = std::format("unsupported version {}", version);
        return false;
    }

    std::uint32_t count = 0;
    if (!readU32(data, pos, count)) {
        detail = "truncated header";
        return false;
    }

    std::vector<std::string> records;
    for (std::uint32_t i = 0; i < count; i++) {
        std::uint32_t length = 0;
        if (!readU32(data, pos, length) || data.size() - pos < length) {
            detail = std::format("truncated record {} of {}", i + 1, count);
            return false;
        }
        records.emplace_back(data, pos, length);
        pos += length;
    }

    if (pos != data.size()) {
        detail = std::format("{} trailing bytes", data.size() - pos);
        return false;
    }

    texts = std::move(records);
    return true;
}

// ============================================================================
// File I/O
// ============================================================================

bool saveHistory(const std::vector<std::string>& texts, const std::string& path) {
    gchar* dir = g_path_get_dirname(path.c_str());
    if (g_mkdir_with_parents(dir, 0700) != 0) {
        g_warning("cannot create directory %s: %s", dir, g_strerror(errno));
        g_free(dir);
        return false;
    }
    g_free(dir);

    std::string data = encodeHistory(texts);

    // Writes a temp file beside the target and renames it into place
    GError* error = nullptr;
    if (!g_file_set_contents(path.c_str(), data.data(),
                             static_cast<gssize>(data.size()), &error)) {
        g_warning("cannot save history to %s: %s", path.c_str(), error->message);
        g_error_free(error);
        return false;
    }

    g_debug("saved %zu entries to %s", texts.size(), path.c_str());
    return true;
}

LoadResult loadHistory(const std::string& path) {
    LoadResult result;

    if (!g_file_test(path.c_str(), G_FILE_TEST_EXISTS)) {
        g_debug("no history file at %s", path.c_str());
        return result;
    }

    gchar* contents = nullptr;
    gsize length = 0;
    GError* error = nullptr;
    if (!g_file_get_contents(path.c_str(), &contents, &length, &error)) {
        result.error = HistoryError::ReadFailed;
        result.detail = error->message;
        g_error_free(error);
        return result;
    }

    std::string data(contents, length);
    g_free(contents);

    if (!decodeHistory(data, result.texts, result.detail)) {
        result.error = HistoryError::CorruptStore;
        result.texts.clear();
    }
    return result;
}

} // namespace clipring
