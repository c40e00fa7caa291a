// ClipRing UI: compact history popup
// GTK4 Layer-Shell window, standalone Wayland client

#include "clipring/ClipboardRenderer.hpp"
#include "clipring/ClipboardManager.hpp"
#include <algorithm>
#include <string>

namespace clipring {

// ── CSS: compact vertical list, dark theme ──────────────────────────────────
static const char* CLIPBOARD_CSS = R"CSS(
.ClipRing { background: transparent; }

.cr-root {
  background: #0a0a0a;
  border: 1px solid #2a2a2a;
}

.cr-header {
  background: #0e0e0e;
  border-bottom: 1px solid #1a1a1a;
  padding: 4px 8px;
}
.cr-title {
  font-family: "Fira Code", monospace;
  font-size: 11px;
  color: #7a9a7a;
}
.cr-count {
  font-size: 9px;
  font-family: "Fira Code", monospace;
  color: #3a4a4a;
}
.cr-notice {
  font-size: 9px;
  color: #d08770;
}

.cr-scroll { min-height: 120px; }
.cr-list { padding: 2px 4px; }

.cr-item {
  padding: 3px 8px;
  border-radius: 0;
  border: 1px solid transparent;
  background: transparent;
}
.cr-item:hover {
  background: #161616;
  border-color: #1a2a1a;
}
.cr-item.selected {
  background: rgba(42, 90, 42, 0.25);
  border-color: #3a6a3a;
}

.cr-marker {
  font-size: 9px;
  color: #2a3a3a;
  min-width: 10px;
}
.cr-item.active .cr-marker {
  color: #5a9a5a;
}

.cr-label {
  font-family: "Fira Code", monospace;
  font-size: 11px;
  color: #7a8a8a;
}
.cr-item.selected .cr-label {
  color: #9aaa9a;
}

.cr-footer {
  background: #0a0a0a;
  border-top: 1px solid #1a1a1a;
  padding: 2px 8px;
}
.cr-footer button, .cr-footer checkbutton {
  font-size: 10px;
  color: #5a6a6a;
  border-radius: 0;
}
)CSS";

// Marker for the entry most recently restored to the clipboard
static const char* ACTIVE_MARKER = "\xe2\x97\x8f";  // ●

// ── Ctor / Dtor ─────────────────────────────────────────────────────────────

ClipboardRenderer::ClipboardRenderer(const Config& config, ClipboardManager& manager)
    : m_config(config), m_manager(manager) {}

ClipboardRenderer::~ClipboardRenderer() {
    if (m_window) { gtk_window_destroy(GTK_WINDOW(m_window)); m_window = nullptr; }
}

// ── Initialize ──────────────────────────────────────────────────────────────

void ClipboardRenderer::initialize() {
    GtkCssProvider* css = gtk_css_provider_new();
    gtk_css_provider_load_from_string(css, CLIPBOARD_CSS);
    gtk_style_context_add_provider_for_display(
        gdk_display_get_default(), GTK_STYLE_PROVIDER(css),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION);
    g_object_unref(css);

    m_window = gtk_window_new();
    gtk_window_set_title(GTK_WINDOW(m_window), "ClipRing");
    gtk_window_set_default_size(GTK_WINDOW(m_window),
                                m_config.windowWidth, m_config.windowHeight);

    // Falls back to a plain toplevel where the compositor lacks layer-shell
    if (gtk_layer_is_supported()) {
        gtk_layer_init_for_window(GTK_WINDOW(m_window));
        gtk_layer_set_layer(GTK_WINDOW(m_window), GTK_LAYER_SHELL_LAYER_TOP);
        gtk_layer_set_keyboard_mode(GTK_WINDOW(m_window),
                                    GTK_LAYER_SHELL_KEYBOARD_MODE_ON_DEMAND);
        gtk_layer_set_anchor(GTK_WINDOW(m_window), GTK_LAYER_SHELL_EDGE_TOP, TRUE);
        gtk_layer_set_anchor(GTK_WINDOW(m_window), GTK_LAYER_SHELL_EDGE_RIGHT, TRUE);
        gtk_layer_set_namespace(GTK_WINDOW(m_window), "clipring");
    }
    gtk_widget_add_css_class(m_window, "ClipRing");

    buildUI();

    g_signal_connect(m_window, "close-request",
        G_CALLBACK(+[](GtkWindow*, gpointer d) -> gboolean {
            auto* s = static_cast<ClipboardRenderer*>(d);
            gtk_widget_set_visible(s->m_window, FALSE);
            s->m_visible = false;
            return TRUE;
        }), this);

    // Labels depend on the newline setting, which IPC may have changed
    g_signal_connect(m_window, "show",
        G_CALLBACK(+[](GtkWidget*, gpointer d) {
            auto* s = static_cast<ClipboardRenderer*>(d);
            s->m_selectedIndex = 0;
            if (s->m_scrolled) {
                auto* vadj = gtk_scrolled_window_get_vadjustment(
                    GTK_SCROLLED_WINDOW(s->m_scrolled));
                if (vadj) gtk_adjustment_set_value(vadj, 0);
            }
            s->refresh();
        }), this);

    refresh();
}

// ── UI Assembly ─────────────────────────────────────────────────────────────
//
//  ╭──────────────────────────────────╮
//  │ ClipRing                      3  │
//  ├──────────────────────────────────┤
//  │ ● newest entry...                │
//  │   older entry                    │
//  │   oldest entry                   │
//  ├──────────────────────────────────┤
//  │ [Clear] [x] Show lines    [Quit] │
//  ╰──────────────────────────────────╯

void ClipboardRenderer::buildUI() {
    GtkWidget* root = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_widget_add_css_class(root, "cr-root");

    gtk_box_append(GTK_BOX(root), createHeader());

    m_scrolled = gtk_scrolled_window_new();
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(m_scrolled),
                                   GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);
    gtk_widget_set_vexpand(m_scrolled, TRUE);
    gtk_widget_add_css_class(m_scrolled, "cr-scroll");

    m_listBox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 1);
    gtk_widget_add_css_class(m_listBox, "cr-list");
    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(m_scrolled), m_listBox);
    gtk_box_append(GTK_BOX(root), m_scrolled);

    gtk_box_append(GTK_BOX(root), createFooter());

    gtk_window_set_child(GTK_WINDOW(m_window), root);

    // Key handler
    GtkEventController* kc = gtk_event_controller_key_new();
    g_signal_connect(kc, "key-pressed", G_CALLBACK(onKeyPress), this);
    gtk_widget_add_controller(m_window, kc);
}

GtkWidget* ClipboardRenderer::createHeader() {
    GtkWidget* box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
    gtk_widget_add_css_class(box, "cr-header");

    GtkWidget* title = gtk_label_new("ClipRing");
    gtk_widget_add_css_class(title, "cr-title");
    gtk_box_append(GTK_BOX(box), title);

    m_noticeLabel = gtk_label_new("");
    gtk_widget_add_css_class(m_noticeLabel, "cr-notice");
    gtk_widget_set_hexpand(m_noticeLabel, TRUE);
    gtk_label_set_ellipsize(GTK_LABEL(m_noticeLabel), PANGO_ELLIPSIZE_END);
    gtk_widget_set_visible(m_noticeLabel, FALSE);
    gtk_box_append(GTK_BOX(box), m_noticeLabel);

    m_countLabel = gtk_label_new("0");
    gtk_widget_add_css_class(m_countLabel, "cr-count");
    gtk_widget_set_hexpand(m_countLabel, TRUE);
    gtk_widget_set_halign(m_countLabel, GTK_ALIGN_END);
    gtk_box_append(GTK_BOX(box), m_countLabel);

    return box;
}

GtkWidget* ClipboardRenderer::createFooter() {
    GtkWidget* box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
    gtk_widget_add_css_class(box, "cr-footer");

    // Clear: the list is rebuilt from the onCleared callback
    GtkWidget* clearBtn = gtk_button_new_with_label("Clear");
    gtk_widget_set_can_focus(clearBtn, FALSE);
    g_signal_connect(clearBtn, "clicked",
        G_CALLBACK(+[](GtkButton*, gpointer d) {
            static_cast<ClipboardRenderer*>(d)->m_manager.clear();
        }), this);
    gtk_box_append(GTK_BOX(box), clearBtn);

    m_newlineCheck = gtk_check_button_new_with_label("Show separate lines");
    gtk_widget_set_can_focus(m_newlineCheck, FALSE);
    gtk_widget_set_hexpand(m_newlineCheck, TRUE);
    gtk_check_button_set_active(GTK_CHECK_BUTTON(m_newlineCheck), m_manager.showNewlines());
    g_signal_connect(m_newlineCheck, "toggled",
        G_CALLBACK(+[](GtkCheckButton* btn, gpointer d) {
            static_cast<ClipboardRenderer*>(d)->applyShowNewlines(
                gtk_check_button_get_active(btn));
        }), this);
    gtk_box_append(GTK_BOX(box), m_newlineCheck);

    GtkWidget* quitBtn = gtk_button_new_with_label("Quit");
    gtk_widget_set_can_focus(quitBtn, FALSE);
    g_signal_connect(quitBtn, "clicked",
        G_CALLBACK(+[](GtkButton*, gpointer d) {
            auto* s = static_cast<ClipboardRenderer*>(d);
            if (s->m_onQuit) s->m_onQuit();
        }), this);
    gtk_box_append(GTK_BOX(box), quitBtn);

    return box;
}

// ── List management ─────────────────────────────────────────────────────────

void ClipboardRenderer::removeAllChildren(GtkWidget* box) {
    GtkWidget* child = gtk_widget_get_first_child(box);
    while (child) {
        GtkWidget* next = gtk_widget_get_next_sibling(child);
        gtk_box_remove(GTK_BOX(box), child);
        child = next;
    }
}

void ClipboardRenderer::rebuildRows() {
    m_rows = m_manager.labels();
    std::reverse(m_rows.begin(), m_rows.end());
}

GtkWidget* ClipboardRenderer::createRow(Slot slot, const std::string& label, bool selected) {
    struct RowData { ClipboardRenderer* self; Slot slot; };

    GtkWidget* btn = gtk_button_new();
    gtk_widget_set_can_focus(btn, FALSE);
    gtk_widget_add_css_class(btn, "cr-item");
    if (selected) gtk_widget_add_css_class(btn, "selected");

    GtkWidget* hbox = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 4);

    GtkWidget* marker = gtk_label_new(" ");
    gtk_widget_add_css_class(marker, "cr-marker");
    gtk_box_append(GTK_BOX(hbox), marker);

    GtkWidget* text = gtk_label_new(label.empty() ? "[Empty]" : label.c_str());
    gtk_widget_set_hexpand(text, TRUE);
    gtk_label_set_xalign(GTK_LABEL(text), 0);
    gtk_widget_add_css_class(text, "cr-label");
    gtk_box_append(GTK_BOX(hbox), text);

    gtk_button_set_child(GTK_BUTTON(btn), hbox);

    // Rows carry their slot, so prepending a row never shifts a binding
    g_signal_connect_data(btn, "clicked",
        G_CALLBACK(+[](GtkButton*, gpointer d) {
            auto* rd = static_cast<RowData*>(d);
            rd->self->selectSlot(rd->slot);
        }),
        new RowData{this, slot},
        +[](gpointer d, GClosure*) { delete static_cast<RowData*>(d); },
        G_CONNECT_DEFAULT);

    if (m_activeSlot && *m_activeSlot == slot) {
        setRowActive(btn, true);
        m_activeRow = btn;
    }
    return btn;
}

void ClipboardRenderer::setRowActive(GtkWidget* row, bool active) {
    if (active) gtk_widget_add_css_class(row, "active");
    else        gtk_widget_remove_css_class(row, "active");

    GtkWidget* hbox = gtk_button_get_child(GTK_BUTTON(row));
    GtkWidget* marker = hbox ? gtk_widget_get_first_child(hbox) : nullptr;
    if (marker) gtk_label_set_text(GTK_LABEL(marker), active ? ACTIVE_MARKER : " ");
}

void ClipboardRenderer::updateCount() {
    if (m_countLabel) {
        gtk_label_set_text(GTK_LABEL(m_countLabel),
                           std::to_string(m_rows.size()).c_str());
    }
}

void ClipboardRenderer::updateList() {
    if (!m_listBox) return;
    removeAllChildren(m_listBox);
    m_activeRow = nullptr;

    for (size_t i = 0; i < m_rows.size(); i++) {
        const auto& [slot, label] = m_rows[i];
        gtk_box_append(GTK_BOX(m_listBox),
                       createRow(slot, label, static_cast<int>(i) == m_selectedIndex));
    }
    updateCount();
}

void ClipboardRenderer::updateSelection(int newIndex) {
    if (newIndex == m_selectedIndex || !m_listBox) return;

    int idx = 0;
    GtkWidget* btn = gtk_widget_get_first_child(m_listBox);
    while (btn) {
        if (idx == m_selectedIndex) gtk_widget_remove_css_class(btn, "selected");
        if (idx == newIndex)        gtk_widget_add_css_class(btn, "selected");
        btn = gtk_widget_get_next_sibling(btn);
        idx++;
    }
    m_selectedIndex = newIndex;
    scrollToIndex(newIndex);
}

void ClipboardRenderer::scrollToIndex(int index) {
    if (!m_scrolled) return;
    GtkAdjustment* vadj = gtk_scrolled_window_get_vadjustment(
        GTK_SCROLLED_WINDOW(m_scrolled));
    if (!vadj) return;
    double page = gtk_adjustment_get_page_size(vadj);
    double top = index * ITEM_HEIGHT;
    double bot = top + ITEM_HEIGHT;
    double cur = gtk_adjustment_get_value(vadj);
    if (bot > cur + page) gtk_adjustment_set_value(vadj, bot - page);
    else if (top < cur)   gtk_adjustment_set_value(vadj, top);
}

// ── Selection / settings ────────────────────────────────────────────────────

void ClipboardRenderer::selectRow(int index) {
    if (index < 0 || index >= static_cast<int>(m_rows.size())) return;
    selectSlot(m_rows[index].first);
}

void ClipboardRenderer::selectSlot(Slot slot) {
    HistoryError result = m_manager.select(slot);
    if (result == HistoryError::NotFound) {
        // Row outlived a clear; resync with the store
        refresh();
        return;
    }
    if (result != HistoryError::None) {
        showNotice(errorString(result));
        return;
    }

    m_activeSlot = slot;
    hide();
    updateList();
}

// Persisting and relabelling happen in the manager's preference callback
void ClipboardRenderer::applyShowNewlines(bool show) {
    m_manager.setShowNewlines(show);
}

// ── Presentation callbacks ──────────────────────────────────────────────────

void ClipboardRenderer::onEntryAdded(Slot slot, const std::string& label) {
    // Newest first, like the history popup
    m_rows.insert(m_rows.begin(), std::make_pair(slot, label));
    if (m_selectedIndex > 0) m_selectedIndex++;
    m_activeSlot = slot;
    if (!m_listBox) return;

    // One new widget per entry; existing rows only lose their highlights
    GtkWidget* first = gtk_widget_get_first_child(m_listBox);
    if (first && m_selectedIndex == 0) gtk_widget_remove_css_class(first, "selected");
    if (m_activeRow) setRowActive(m_activeRow, false);
    m_activeRow = nullptr;

    gtk_box_prepend(GTK_BOX(m_listBox), createRow(slot, label, m_selectedIndex == 0));
    updateCount();
}

void ClipboardRenderer::onCleared() {
    m_rows.clear();
    m_activeSlot.reset();
    m_selectedIndex = 0;
    updateList();
}

// ── Keyboard handler ────────────────────────────────────────────────────────

gboolean ClipboardRenderer::onKeyPress(GtkEventControllerKey*,
                                       guint keyval, guint,
                                       GdkModifierType, gpointer data) {
    auto* self = static_cast<ClipboardRenderer*>(data);
    int count = static_cast<int>(self->m_rows.size());

    if (keyval == GDK_KEY_Escape) {
        self->hide();
        return TRUE;
    }
    if (keyval == GDK_KEY_Down) {
        self->updateSelection(std::max(0, std::min(self->m_selectedIndex + 1, count - 1)));
        return TRUE;
    }
    if (keyval == GDK_KEY_Up) {
        self->updateSelection(std::max(self->m_selectedIndex - 1, 0));
        return TRUE;
    }
    if (keyval == GDK_KEY_Home) {
        self->updateSelection(0);
        return TRUE;
    }
    if (keyval == GDK_KEY_End) {
        self->updateSelection(std::max(0, count - 1));
        return TRUE;
    }
    if (keyval == GDK_KEY_Return || keyval == GDK_KEY_KP_Enter) {
        self->selectRow(self->m_selectedIndex);
        return TRUE;
    }
    return FALSE;
}

// ── Public API ──────────────────────────────────────────────────────────────

void ClipboardRenderer::show() {
    if (m_window && !m_visible) { gtk_window_present(GTK_WINDOW(m_window)); m_visible = true; }
}

void ClipboardRenderer::hide() {
    if (m_window && m_visible) { gtk_widget_set_visible(m_window, FALSE); m_visible = false; }
}

void ClipboardRenderer::toggle() {
    if (!m_window) return;
    if (m_visible) hide(); else show();
}

bool ClipboardRenderer::isVisible() const { return m_visible; }

void ClipboardRenderer::setOnQuit(std::function<void()> callback) {
    m_onQuit = std::move(callback);
}

void ClipboardRenderer::showNotice(const std::string& text) {
    if (!m_noticeLabel) return;
    gtk_label_set_text(GTK_LABEL(m_noticeLabel), text.c_str());
    gtk_widget_set_visible(m_noticeLabel, !text.empty());
}

void ClipboardRenderer::refresh() {
    rebuildRows();
    if (m_selectedIndex >= static_cast<int>(m_rows.size()))
        m_selectedIndex = std::max(0, static_cast<int>(m_rows.size()) - 1);
    if (m_newlineCheck)
        gtk_check_button_set_active(GTK_CHECK_BUTTON(m_newlineCheck), m_manager.showNewlines());
    updateList();
}

} // namespace clipring
