#include <gtest/gtest.h>
#include "clipring/PollLoop.hpp"
#include "clipring/HistoryStore.hpp"
#include "FakeClipboard.hpp"
#include <vector>

using namespace clipring;
using clipring::test::FakeClipboard;

class PollLoopTest : public ::testing::Test {
protected:
    HistoryStore store;
    FakeClipboard clipboard;
};

// ============================================================================
// Single ticks
// ============================================================================

TEST_F(PollLoopTest, TickOffersNewText) {
    PollLoop loop(store, clipboard);
    clipboard.content = "hello";

    auto slot = loop.tick();
    ASSERT_TRUE(slot);
    EXPECT_EQ(*slot, 0u);
    EXPECT_EQ(store.texts(), std::vector<std::string>{"hello"});
}

TEST_F(PollLoopTest, UnchangedClipboardAddsNothing) {
    PollLoop loop(store, clipboard);
    clipboard.content = "same";

    EXPECT_TRUE(loop.tick());
    EXPECT_FALSE(loop.tick());
    EXPECT_FALSE(loop.tick());
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(loop.ticks(), 3u);
    EXPECT_EQ(loop.accepted(), 1u);
}

TEST_F(PollLoopTest, NonTextClipboardIsNoOp) {
    PollLoop loop(store, clipboard);
    clipboard.content.reset();

    EXPECT_FALSE(loop.tick());
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(clipboard.acquires, 1);
    EXPECT_EQ(clipboard.releases, 1);
}

TEST_F(PollLoopTest, BusyClipboardIsNoOp) {
    PollLoop loop(store, clipboard);
    clipboard.content = "text";
    clipboard.busy = true;

    EXPECT_FALSE(loop.tick());
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(clipboard.releases, 0);

    clipboard.busy = false;
    EXPECT_TRUE(loop.tick());
}

TEST_F(PollLoopTest, ClipboardReleasedAfterEveryRead) {
    PollLoop loop(store, clipboard);
    clipboard.content = "a";
    loop.tick();
    clipboard.content = "b";
    loop.tick();
    loop.tick();

    EXPECT_EQ(clipboard.acquires, 3);
    EXPECT_EQ(clipboard.releases, 3);
    EXPECT_FALSE(clipboard.held);
    EXPECT_FALSE(clipboard.usedWithoutAcquire);
}

TEST_F(PollLoopTest, CallbackFiresOnlyForAcceptedText) {
    PollLoop loop(store, clipboard);
    std::vector<std::pair<Slot, std::string>> seen;
    loop.setOnAccepted([&](Slot slot, const ClipboardEntry& entry) {
        seen.emplace_back(slot, entry.text());
    });

    for (const char* text : {"hello", "world", "hello"}) {
        clipboard.content = text;
        loop.tick();
    }

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], std::make_pair(Slot{0}, std::string("hello")));
    EXPECT_EQ(seen[1], std::make_pair(Slot{1}, std::string("world")));
}

TEST_F(PollLoopTest, EmptyTextIsRecorded) {
    PollLoop loop(store, clipboard);
    clipboard.content = "";
    EXPECT_TRUE(loop.tick());
    EXPECT_EQ(store.get(0)->text(), "");
}

// ============================================================================
// Scheduling
// ============================================================================

TEST_F(PollLoopTest, DefaultInterval) {
    PollLoop loop(store, clipboard);
    EXPECT_EQ(loop.interval(), 1000u);

    PollLoop zero(store, clipboard, 0);
    EXPECT_EQ(zero.interval(), PollLoop::DEFAULT_INTERVAL_MS);
}

TEST_F(PollLoopTest, StartStop) {
    PollLoop loop(store, clipboard, 50);
    EXPECT_FALSE(loop.isRunning());

    loop.start();
    EXPECT_TRUE(loop.isRunning());
    loop.start();  // no second source
    EXPECT_TRUE(loop.isRunning());

    loop.stop();
    EXPECT_FALSE(loop.isRunning());
    loop.stop();
}

TEST_F(PollLoopTest, SetIntervalWhileRunning) {
    PollLoop loop(store, clipboard, 50);
    loop.start();
    loop.setInterval(20);
    EXPECT_TRUE(loop.isRunning());
    EXPECT_EQ(loop.interval(), 20u);
}

TEST_F(PollLoopTest, TimerDrivesTicksOnMainLoop) {
    GMainContext* context = g_main_context_new();
    g_main_context_push_thread_default(context);
    GMainLoop* mainLoop = g_main_loop_new(context, FALSE);

    clipboard.content = "from timer";
    {
        PollLoop loop(store, clipboard, 10);
        loop.start();

        GSource* quit = g_timeout_source_new(200);
        g_source_set_callback(quit, +[](gpointer d) -> gboolean {
            g_main_loop_quit(static_cast<GMainLoop*>(d));
            return G_SOURCE_REMOVE;
        }, mainLoop, nullptr);
        g_source_attach(quit, context);
        g_source_unref(quit);

        g_main_loop_run(mainLoop);

        EXPECT_GE(loop.ticks(), 2u);
        EXPECT_EQ(loop.accepted(), 1u);
    }

    EXPECT_EQ(store.texts(), std::vector<std::string>{"from timer"});

    g_main_loop_unref(mainLoop);
    g_main_context_pop_thread_default(context);
    g_main_context_unref(context);
}

TEST_F(PollLoopTest, StoppedLoopDoesNotTick) {
    GMainContext* context = g_main_context_new();
    g_main_context_push_thread_default(context);

    clipboard.content = "ignored";
    PollLoop loop(store, clipboard, 5);
    loop.start();
    loop.stop();

    gint64 deadline = g_get_monotonic_time() + 50 * 1000;
    while (g_get_monotonic_time() < deadline) {
        g_main_context_iteration(context, FALSE);
    }

    EXPECT_EQ(loop.ticks(), 0u);
    EXPECT_TRUE(store.empty());

    g_main_context_pop_thread_default(context);
    g_main_context_unref(context);
}
