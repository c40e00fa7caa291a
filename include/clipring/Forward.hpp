#pragma once
// Forward declarations for loose coupling (SOLID: Dependency Inversion)

namespace clipring {

// Data structures
class ClipboardEntry;
struct Config;

// Engine (Single Responsibility each)
class ClipboardPort;
class HistoryStore;
class PollLoop;
class SelectionResolver;
class ClipboardManager;

// Application
class ClipboardRenderer;
class IPCHandler;

} // namespace clipring
