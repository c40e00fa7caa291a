#include <gtest/gtest.h>
#include "clipring/ClipboardManager.hpp"
#include "clipring/HistoryFile.hpp"
#include "FakeClipboard.hpp"
#include <glib.h>
#include <sys/stat.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

using namespace clipring;
using clipring::test::FakeClipboard;
namespace fs = std::filesystem;

// ============================================================================
// Fixture: config pointing at a temp history file
// ============================================================================

class ClipboardManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        GError* error = nullptr;
        gchar* dir = g_dir_make_tmp("clipring-manager-XXXXXX", &error);
        ASSERT_NE(dir, nullptr) << (error ? error->message : "");
        tempDir = dir;
        g_free(dir);

        config.historyFile = (tempDir / "clipring.history").string();
        config.pollIntervalMs = 60000;  // ticks are driven by hand
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    std::unique_ptr<ClipboardManager> makeManager() {
        auto manager = std::make_unique<ClipboardManager>(config, clipboard);
        manager->setOnEntryAdded([this](Slot slot, const std::string& label) {
            added.emplace_back(slot, label);
        });
        manager->setOnCleared([this]() { clearedCount++; });
        return manager;
    }

    fs::path tempDir;
    Config config;
    FakeClipboard clipboard;
    std::vector<std::pair<Slot, std::string>> added;
    int clearedCount = 0;
};

// ============================================================================
// Offer / notify
// ============================================================================

TEST_F(ClipboardManagerTest, OfferNotifiesWithLabel) {
    auto manager = makeManager();

    EXPECT_TRUE(manager->offer("line1\nline2"));
    ASSERT_EQ(added.size(), 1u);
    EXPECT_EQ(added[0].first, 0u);
    EXPECT_EQ(added[0].second, "line1 line2");
}

TEST_F(ClipboardManagerTest, HelloWorldHelloScenario) {
    auto manager = makeManager();

    EXPECT_EQ(manager->offer("hello"), std::optional<Slot>(0));
    EXPECT_EQ(manager->offer("world"), std::optional<Slot>(1));
    EXPECT_FALSE(manager->offer("hello").has_value());

    EXPECT_EQ(manager->store().texts(), (std::vector<std::string>{"hello", "world"}));
    EXPECT_EQ(added.size(), 2u);
}

TEST_F(ClipboardManagerTest, PolledTextReachesPresentation) {
    auto manager = makeManager();
    clipboard.content = "copied elsewhere";

    manager->pollLoop().tick();
    ASSERT_EQ(added.size(), 1u);
    EXPECT_EQ(added[0].second, "copied elsewhere");
}

TEST_F(ClipboardManagerTest, LabelsFollowPreference) {
    config.showNewlines = true;
    auto manager = makeManager();
    EXPECT_TRUE(manager->showNewlines());

    manager->offer("a\nb");
    EXPECT_EQ(manager->labels()[0].second, "a\nb");

    manager->setShowNewlines(false);
    EXPECT_EQ(manager->labels()[0].second, "a b");
    EXPECT_EQ(manager->resolve(0)->text(), "a\nb");
}

TEST_F(ClipboardManagerTest, ShowNewlinesChangeNotifiesOnce) {
    auto manager = makeManager();
    std::vector<bool> changes;
    manager->setOnShowNewlinesChanged([&](bool show) { changes.push_back(show); });

    manager->setShowNewlines(false);  // already off
    manager->setShowNewlines(true);
    manager->setShowNewlines(true);
    manager->setShowNewlines(false);

    EXPECT_EQ(changes, (std::vector<bool>{true, false}));
}

// ============================================================================
// Clear
// ============================================================================

TEST_F(ClipboardManagerTest, ClearNotifiesSynchronously) {
    auto manager = makeManager();
    manager->offer("a");

    bool storeEmptyInCallback = false;
    manager->setOnCleared([&]() { storeEmptyInCallback = manager->store().empty(); });

    manager->clear();
    EXPECT_TRUE(storeEmptyInCallback);
    EXPECT_EQ(manager->select(0), HistoryError::NotFound);
}

TEST_F(ClipboardManagerTest, SlotsRestartAfterClear) {
    auto manager = makeManager();
    manager->offer("a");
    manager->offer("b");
    manager->clear();
    EXPECT_EQ(clearedCount, 1);

    EXPECT_EQ(manager->offer("c"), std::optional<Slot>(0));
    EXPECT_EQ(manager->resolve(0)->text(), "c");
}

// ============================================================================
// Selection
// ============================================================================

TEST_F(ClipboardManagerTest, SelectRestoresAndIsNotReadded) {
    auto manager = makeManager();
    manager->offer("first");
    manager->offer("second");

    EXPECT_EQ(manager->select(0), HistoryError::None);
    ASSERT_TRUE(clipboard.content);
    EXPECT_EQ(*clipboard.content, "first");

    // Next poll sees the restored text, which is already known
    EXPECT_FALSE(manager->pollLoop().tick());
    EXPECT_EQ(manager->store().size(), 2u);
}

// ============================================================================
// Startup / shutdown
// ============================================================================

TEST_F(ClipboardManagerTest, FirstRunStartsEmpty) {
    auto manager = makeManager();
    EXPECT_EQ(manager->startup(), HistoryError::None);
    EXPECT_TRUE(manager->store().empty());
    EXPECT_TRUE(manager->pollLoop().isRunning());
    EXPECT_TRUE(manager->shutdown());
    EXPECT_FALSE(manager->pollLoop().isRunning());
}

TEST_F(ClipboardManagerTest, RestartRestoresHistory) {
    {
        auto manager = makeManager();
        manager->startup();
        manager->offer("a");
        manager->offer("b");
        EXPECT_TRUE(manager->shutdown());
    }

    added.clear();
    auto manager = makeManager();
    EXPECT_EQ(manager->startup(), HistoryError::None);

    EXPECT_EQ(manager->store().texts(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(manager->resolve(0)->text(), "a");
    EXPECT_EQ(manager->resolve(1)->text(), "b");

    auto labels = manager->labels();
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels[0], std::make_pair(Slot{0}, std::string("a")));
    EXPECT_EQ(labels[1], std::make_pair(Slot{1}, std::string("b")));
}

TEST_F(ClipboardManagerTest, ReplayDoesNotNotifyPerEntry) {
    std::vector<std::string> saved;
    for (int i = 0; i < 500; i++) saved.push_back("entry " + std::to_string(i));
    ASSERT_TRUE(saveHistory(saved, config.historyFile));

    auto manager = makeManager();
    EXPECT_EQ(manager->startup(), HistoryError::None);
    EXPECT_TRUE(added.empty());
    EXPECT_EQ(manager->labels().size(), 500u);

    // Live offers still notify
    manager->offer("after startup");
    ASSERT_EQ(added.size(), 1u);
    EXPECT_EQ(added[0].first, 500u);
}

TEST_F(ClipboardManagerTest, DestructorSavesHistory) {
    {
        auto manager = makeManager();
        manager->startup();
        manager->offer("kept");
    }

    LoadResult result = loadHistory(config.historyFile);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.texts, std::vector<std::string>{"kept"});
}

TEST_F(ClipboardManagerTest, DuplicatesInFileCollapseOnReplay) {
    ASSERT_TRUE(saveHistory({"x", "y", "x", "z", "y"}, config.historyFile));

    auto manager = makeManager();
    EXPECT_EQ(manager->startup(), HistoryError::None);
    EXPECT_EQ(manager->store().texts(), (std::vector<std::string>{"x", "y", "z"}));
}

TEST_F(ClipboardManagerTest, CorruptFileStartsEmpty) {
    {
        std::ofstream out(config.historyFile, std::ios::binary);
        out << "garbage";
    }

    auto manager = makeManager();
    EXPECT_EQ(manager->startup(), HistoryError::CorruptStore);
    EXPECT_TRUE(manager->store().empty());
    EXPECT_TRUE(manager->pollLoop().isRunning());

    manager->offer("fresh");
    EXPECT_TRUE(manager->shutdown());
    EXPECT_EQ(loadHistory(config.historyFile).texts, std::vector<std::string>{"fresh"});
}

TEST_F(ClipboardManagerTest, CorruptFileIsMovedAside) {
    {
        std::ofstream out(config.historyFile, std::ios::binary);
        out << "garbage";
    }

    auto manager = makeManager();
    EXPECT_EQ(manager->startup(), HistoryError::CorruptStore);
    EXPECT_FALSE(fs::exists(config.historyFile));

    std::string aside = config.historyFile + ClipboardManager::CORRUPT_SUFFIX;
    std::ifstream in(aside, std::ios::binary);
    std::string kept((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(kept, "garbage");
}

// ============================================================================
// Unreadable history file
// ============================================================================

TEST_F(ClipboardManagerTest, UnreadablePathIsLeftInPlace) {
    // Reading a directory fails regardless of privileges
    config.historyFile = (tempDir / "history-dir").string();
    fs::create_directory(config.historyFile);

    auto manager = makeManager();
    EXPECT_EQ(manager->startup(), HistoryError::ReadFailed);
    EXPECT_TRUE(manager->store().empty());
    EXPECT_TRUE(manager->pollLoop().isRunning());

    manager->offer("session");
    EXPECT_FALSE(manager->save());
    EXPECT_FALSE(manager->shutdown());

    EXPECT_TRUE(fs::is_directory(config.historyFile));
    EXPECT_FALSE(fs::exists(config.historyFile + ClipboardManager::CORRUPT_SUFFIX));
}

TEST_F(ClipboardManagerTest, UnreadableFileIsNotOverwritten) {
    if (geteuid() == 0) GTEST_SKIP() << "root reads mode 000 files";

    ASSERT_TRUE(saveHistory({"precious"}, config.historyFile));
    ASSERT_EQ(chmod(config.historyFile.c_str(), 0), 0);

    {
        auto manager = makeManager();
        EXPECT_EQ(manager->startup(), HistoryError::ReadFailed);
        manager->offer("session");
        EXPECT_FALSE(manager->shutdown());
    }

    ASSERT_EQ(chmod(config.historyFile.c_str(), 0600), 0);
    EXPECT_EQ(loadHistory(config.historyFile).texts, std::vector<std::string>{"precious"});
}

TEST_F(ClipboardManagerTest, ClearedHistoryIsSavedEmpty) {
    ASSERT_TRUE(saveHistory({"a"}, config.historyFile));

    auto manager = makeManager();
    manager->startup();
    manager->clear();
    EXPECT_TRUE(manager->shutdown());

    LoadResult result = loadHistory(config.historyFile);
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.texts.empty());
}

TEST_F(ClipboardManagerTest, ShutdownWithoutStartupDoesNotTouchFile) {
    ASSERT_TRUE(saveHistory({"a"}, config.historyFile));
    {
        auto manager = makeManager();
        manager->offer("b");
    }
    EXPECT_EQ(loadHistory(config.historyFile).texts, std::vector<std::string>{"a"});
}

TEST_F(ClipboardManagerTest, FailedFinalSaveIsReported) {
    // Parent "directory" is a regular file, so the save cannot create it
    { std::ofstream out(tempDir / "blocker"); }
    config.historyFile = (tempDir / "blocker" / "clipring.history").string();

    auto manager = makeManager();
    EXPECT_EQ(manager->startup(), HistoryError::None);
    manager->offer("a");
    EXPECT_FALSE(manager->shutdown());
}

TEST_F(ClipboardManagerTest, EmptyPathDisablesPersistence) {
    config.historyFile.clear();
    auto manager = makeManager();
    EXPECT_EQ(manager->startup(), HistoryError::None);
    manager->offer("a");
    EXPECT_TRUE(manager->save());
    EXPECT_TRUE(manager->shutdown());
}
