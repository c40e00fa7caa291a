#pragma once
// GTK4 Layer-Shell popup listing the clipboard history

#include "Forward.hpp"
#include "Config.hpp"
#include "ClipboardEntry.hpp"
#include <gtk/gtk.h>
#include <gtk4-layer-shell.h>
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clipring {

class ClipboardRenderer {
public:
    explicit ClipboardRenderer(const Config& config, ClipboardManager& manager);
    ~ClipboardRenderer();

    void initialize();  // Create window + UI (call AFTER gtk_init)
    void show();
    void hide();
    void toggle();
    bool isVisible() const;

    // Presentation callbacks from ClipboardManager
    void onEntryAdded(Slot slot, const std::string& label);
    void onCleared();

    void setOnQuit(std::function<void()> callback);
    void showNotice(const std::string& text);
    void refresh();

private:
    const Config& m_config;
    ClipboardManager& m_manager;

    // GTK widgets
    GtkWidget* m_window = nullptr;
    GtkWidget* m_listBox = nullptr;
    GtkWidget* m_scrolled = nullptr;
    GtkWidget* m_countLabel = nullptr;
    GtkWidget* m_noticeLabel = nullptr;
    GtkWidget* m_newlineCheck = nullptr;

    // Displayed rows, newest first
    std::vector<std::pair<Slot, std::string>> m_rows;
    std::optional<Slot> m_activeSlot;
    GtkWidget* m_activeRow = nullptr;  // Row widget of m_activeSlot, if built
    int m_selectedIndex = 0;
    std::atomic<bool> m_visible{false};
    std::function<void()> m_onQuit;

    // UI building
    void buildUI();
    GtkWidget* createHeader();
    GtkWidget* createFooter();

    // List management
    void rebuildRows();
    void updateList();
    GtkWidget* createRow(Slot slot, const std::string& label, bool selected);
    void setRowActive(GtkWidget* row, bool active);
    void updateCount();
    void updateSelection(int newIndex);
    void scrollToIndex(int index);

    void selectRow(int index);
    void selectSlot(Slot slot);
    void applyShowNewlines(bool show);

    // Keyboard handler
    static gboolean onKeyPress(GtkEventControllerKey* controller,
                               guint keyval, guint keycode,
                               GdkModifierType state, gpointer data);

    // Helpers
    void removeAllChildren(GtkWidget* box);

    static constexpr int ITEM_HEIGHT = 32;
};

} // namespace clipring
