// ClipRing - clipboard history for Linux desktops
// Standalone GTK4 process: polls the clipboard, shows the history popup,
// receives commands on a Unix socket.

#include "clipring/ClipboardManager.hpp"
#include "clipring/ClipboardPort.hpp"
#include "clipring/ClipboardRenderer.hpp"
#include "clipring/ConfigParser.hpp"
#include "clipring/IPCHandler.hpp"
#include <gtk/gtk.h>
#include <glib-unix.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>

using namespace clipring;

static IPCHandler* g_ipcHandler = nullptr;
static int g_listenSock = -1;
static GMainLoop* g_mainLoop = nullptr;

// ============================================================================
// Send command to existing instance (returns true if it answered)
// ============================================================================

static bool sendCommand(const std::string& socketPath, const std::string& cmd) {
    int sock = socket(AF_UNIX, SOCK_STREAM, 0);
    if (sock == -1) return false;

    struct sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1) {
        close(sock);
        return false;
    }

    ssize_t written = write(sock, cmd.c_str(), cmd.size());
    shutdown(sock, SHUT_WR);

    // Print the reply so `clipring-ui list` is scriptable
    char buf[4096];
    ssize_t n;
    while ((n = read(sock, buf, sizeof(buf))) > 0) {
        fwrite(buf, 1, static_cast<size_t>(n), stdout);
    }
    close(sock);
    return written > 0;
}

// ============================================================================
// Socket listener (one command per connection, reply then close)
// ============================================================================

static gboolean onSocketAccept(GIOChannel*, GIOCondition, gpointer) {
    struct sockaddr_un clientAddr{};
    socklen_t clientLen = sizeof(clientAddr);
    int clientSock = accept(g_listenSock,
        reinterpret_cast<struct sockaddr*>(&clientAddr), &clientLen);
    if (clientSock == -1) return TRUE;

    char buf[256] = {};
    ssize_t n = read(clientSock, buf, sizeof(buf) - 1);

    if (n > 0 && g_ipcHandler) {
        std::string reply = g_ipcHandler->handleLine(std::string(buf, static_cast<size_t>(n)));
        reply += "\n";
        if (write(clientSock, reply.c_str(), reply.size()) < 0)
            g_debug("control client went away before the reply");
    }
    close(clientSock);

    return TRUE;
}

static bool createSocketListener(const std::string& socketPath) {
    unlink(socketPath.c_str());

    g_listenSock = socket(AF_UNIX, SOCK_STREAM, 0);
    if (g_listenSock == -1) return false;

    struct sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(g_listenSock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1 ||
        listen(g_listenSock, 5) == -1) {
        close(g_listenSock);
        g_listenSock = -1;
        return false;
    }

    GIOChannel* channel = g_io_channel_unix_new(g_listenSock);
    g_io_add_watch(channel, G_IO_IN, onSocketAccept, nullptr);
    g_io_channel_unref(channel);

    return true;
}

// ============================================================================
// Signal handler (clean shutdown, history is saved after the loop ends)
// ============================================================================

static gboolean onSignal(gpointer) {
    if (g_mainLoop) g_main_loop_quit(g_mainLoop);
    return G_SOURCE_CONTINUE;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    // Parse command
    std::string cmd;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--toggle" || arg == "toggle") cmd = "toggle";
        else if (arg == "--show" || arg == "show") cmd = "show";
        else if (arg == "--hide" || arg == "hide") cmd = "hide";
        else if (arg == "--list" || arg == "list") cmd = "list";
        else if (arg == "--clear" || arg == "clear") cmd = "clear";
    }

    Config config = loadConfig();

    // Clipboard tools must not kill us by exiting before reading stdin
    signal(SIGPIPE, SIG_IGN);

    // If we have a command, try sending to existing instance first
    if (!cmd.empty()) {
        if (sendCommand(config.socketPath, cmd)) {
            return 0;  // Sent to running instance, done
        }

        // History commands need no window: run against the saved file and exit
        if (cmd == "list" || cmd == "clear") {
            CommandClipboard clipboard(config);
            std::string reply;
            bool saved = runDetached(config, clipboard, cmd, reply);
            printf("%s\n", reply.c_str());
            return saved ? 0 : 1;
        }
        // UI commands -> start an instance and execute below
    }

    gtk_init();

    // Create components
    CommandClipboard clipboard(config);
    ClipboardManager manager(config, clipboard);
    ClipboardRenderer renderer(config, manager);
    IPCHandler ipc(manager);
    g_ipcHandler = &ipc;

    manager.setOnEntryAdded([&renderer](Slot slot, const std::string& label) {
        renderer.onEntryAdded(slot, label);
    });
    manager.setOnCleared([&renderer]() { renderer.onCleared(); });

    // Checkbox and `newlines` command both land here
    manager.setOnShowNewlinesChanged([&config, &renderer](bool show) {
        config.showNewlines = show;
        if (!saveConfig(config))
            g_warning("newline preference not saved to %s", config.configPath.c_str());
        renderer.refresh();
    });

    ipc.registerCommand("show", [&renderer](const std::string&) {
        renderer.show();
        return std::string("shown");
    });
    ipc.registerCommand("hide", [&renderer](const std::string&) {
        renderer.hide();
        return std::string("hidden");
    });
    ipc.registerCommand("toggle", [&renderer](const std::string&) {
        renderer.toggle();
        return std::string(renderer.isVisible() ? "shown" : "hidden");
    });

    g_mainLoop = g_main_loop_new(nullptr, FALSE);
    renderer.setOnQuit([]() { g_main_loop_quit(g_mainLoop); });

    // Create UI (window, CSS, widgets - but don't show yet)
    renderer.initialize();

    // Replay does not notify per entry; build the rows once
    HistoryError status = manager.startup();
    renderer.refresh();
    if (status != HistoryError::None) {
        renderer.showNotice(std::string("history not restored: ") + errorString(status));
    }

    if (!createSocketListener(config.socketPath)) {
        g_warning("control socket %s unavailable: %s",
                  config.socketPath.c_str(), g_strerror(errno));
    }

    // If started with a command, execute it now
    if (!cmd.empty()) {
        std::string reply = ipc.handleLine(cmd);
        printf("%s\n", reply.c_str());
        fflush(stdout);
    }

    g_unix_signal_add(SIGINT, onSignal, nullptr);
    g_unix_signal_add(SIGTERM, onSignal, nullptr);

    // Run GLib main loop
    g_main_loop_run(g_mainLoop);
    g_main_loop_unref(g_mainLoop);
    g_mainLoop = nullptr;

    // Cleanup
    g_ipcHandler = nullptr;
    if (g_listenSock >= 0) close(g_listenSock);
    unlink(config.socketPath.c_str());

    // Final save must finish before exit
    return manager.shutdown() ? 0 : 1;
}
