#include "file_watcher.h"
#include "test_support.h"

#include <gtest/gtest.h>
#include <functional>
#include <memory>

using namespace test_support;
using std::chrono::milliseconds;

class FileWatcherTest : public ::testing::Test {
protected:
    TempDir dir_{"file_watcher"};
    std::vector<std::pair<std::string, FileWatcher::ChangeKind>> changes_;

    void SetUp() override {
        std::filesystem::create_directories(dir_.path() / "proj");
    }

    std::unique_ptr<FileWatcher> makeWatcher(milliseconds stability = milliseconds(200)) {
        auto watcher = std::make_unique<FileWatcher>(dir_.str(), ".jsonl", stability);
        watcher->setChangeCallback([this](const std::string& path, FileWatcher::ChangeKind kind) {
            changes_.emplace_back(path, kind);
        });
        return watcher;
    }

    bool pollUntil(FileWatcher& watcher, const std::function<bool()>& done,
                   milliseconds limit = milliseconds(5000)) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            watcher.poll(milliseconds(50));
            if (done()) return true;
        }
        return false;
    }

    size_t countFor(const std::string& path) const {
        size_t n = 0;
        for (const auto& change : changes_) {
            if (change.first == path) ++n;
        }
        return n;
    }
};

TEST_F(FileWatcherTest, ReportsExistingFilesOnStart) {
    auto b = dir_.path() / "proj" / "b.jsonl";
    auto a = dir_.path() / "proj" / "a.jsonl";
    writeFile(b, "{}\n");
    writeFile(a, "{}\n");
    writeFile(dir_.path() / "proj" / "ignored.txt", "x\n");

    auto watcher = makeWatcher();
    watcher->start(true);

    ASSERT_EQ(changes_.size(), 2u);
    EXPECT_EQ(changes_[0].first, a.string());
    EXPECT_EQ(changes_[1].first, b.string());
    EXPECT_EQ(changes_[0].second, FileWatcher::ChangeKind::Added);

    // Nothing else happens to them, so nothing more is reported
    watcher->poll(milliseconds(300));
    EXPECT_EQ(changes_.size(), 2u);
}

TEST_F(FileWatcherTest, WithoutScanExistingFilesAreSilent) {
    writeFile(dir_.path() / "proj" / "a.jsonl", "{}\n");

    auto watcher = makeWatcher();
    watcher->start(false);

    EXPECT_TRUE(changes_.empty());
}

TEST_F(FileWatcherTest, NewFileIsReportedAfterItSettles) {
    auto watcher = makeWatcher();
    watcher->start(true);
    ASSERT_TRUE(changes_.empty());

    auto path = dir_.path() / "proj" / "new.jsonl";
    writeFile(path, "{\"type\":\"user\"}\n");

    // Not yet past the stability interval
    watcher->poll(milliseconds(0));
    EXPECT_EQ(countFor(path.string()), 0u);

    ASSERT_TRUE(pollUntil(*watcher, [&] { return countFor(path.string()) > 0; }));
    EXPECT_EQ(countFor(path.string()), 1u);
    EXPECT_EQ(changes_.back().second, FileWatcher::ChangeKind::Added);
}

TEST_F(FileWatcherTest, AppendToKnownFileIsReportedAsModified) {
    auto path = dir_.path() / "proj" / "s.jsonl";
    writeFile(path, "{}\n");

    auto watcher = makeWatcher();
    watcher->start(true);
    ASSERT_EQ(changes_.size(), 1u);

    appendFile(path, "{}\n");

    ASSERT_TRUE(pollUntil(*watcher, [&] { return changes_.size() > 1; }));
    EXPECT_EQ(changes_[1].first, path.string());
    EXPECT_EQ(changes_[1].second, FileWatcher::ChangeKind::Modified);
}

TEST_F(FileWatcherTest, FilesInNewDirectoriesAreFound) {
    auto watcher = makeWatcher();
    watcher->start(true);

    auto path = dir_.path() / "brand-new-project" / "nested" / "s.jsonl";
    writeFile(path, "{}\n");

    ASSERT_TRUE(pollUntil(*watcher, [&] { return countFor(path.string()) > 0; }));
}

TEST_F(FileWatcherTest, OtherExtensionsAreIgnored) {
    auto watcher = makeWatcher();
    watcher->start(true);

    writeFile(dir_.path() / "proj" / "notes.md", "# notes\n");
    auto path = dir_.path() / "proj" / "later.jsonl";
    writeFile(path, "{}\n");

    ASSERT_TRUE(pollUntil(*watcher, [&] { return countFor(path.string()) > 0; }));
    EXPECT_EQ(changes_.size(), 1u);
}

TEST_F(FileWatcherTest, StartFailsForMissingRoot) {
    FileWatcher watcher((dir_.path() / "missing").string());
    EXPECT_THROW(watcher.start(true), std::runtime_error);
    EXPECT_FALSE(watcher.isWatching());
}

TEST_F(FileWatcherTest, StopEndsWatching) {
    auto watcher = makeWatcher();
    watcher->start(true);
    EXPECT_TRUE(watcher->isWatching());

    watcher->stop();
    EXPECT_FALSE(watcher->isWatching());

    writeFile(dir_.path() / "proj" / "after.jsonl", "{}\n");
    watcher->poll(milliseconds(300));
    EXPECT_TRUE(changes_.empty());
}
