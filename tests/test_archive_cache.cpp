#include <gtest/gtest.h>
#include "fake_github.hpp"
#include "../main/src/archive.hpp"
#include "../main/src/archive_cache.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"
#include "../main/src/release_client.hpp"
#include "../main/src/utils.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ArchiveCacheTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;
    fs::path cache_dir;

    void SetUp() override {
        init_localization();
        suite_work_dir = fs::absolute("tmp_archive_cache_test");
        cache_dir = suite_work_dir / "cache";
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(suite_work_dir);

        settings = FakeGitHub::settings(cache_dir);
        executor = std::make_unique<ResilientExecutor>(settings.retry, settings.circuit_breaker, settings.rate_limit, clock, 1);
        client = std::make_unique<ReleaseClient>(github, *executor, settings, "token");
        endpoint = parse_endpoint("ghrelasset://acme/widgets/maven/repo.zip");
    }

    void TearDown() override {
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }

    std::string make_zip(const std::map<std::string, std::string>& entries) {
        fs::path tmp = suite_work_dir / "seed.zip";
        write_zip_entries(tmp, entries);
        std::string bytes = read_file_bytes(tmp);
        fs::remove(tmp);
        return bytes;
    }

    FakeClock clock;
    FakeGitHub github;
    Settings settings;
    std::unique_ptr<ResilientExecutor> executor;
    std::unique_ptr<ReleaseClient> client;
    RepositoryEndpoint endpoint;
};

TEST_F(ArchiveCacheTest, ZipEntriesSurviveRewrite) {
    fs::path zip = suite_work_dir / "a.zip";
    std::string binary("\x00\x01\xff\x7f", 4);
    write_zip_entries(zip, {{"com/example/a.jar", binary}, {"empty.txt", ""}});
    EXPECT_FALSE(fs::exists(zip.string() + ".tmp"));

    auto entries = read_zip_entries(zip);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries["com/example/a.jar"], binary);
    EXPECT_EQ(entries["empty.txt"], "");
}

TEST_F(ArchiveCacheTest, CorruptArchiveIsReported) {
    fs::path zip = suite_work_dir / "bad.zip";
    std::ofstream(zip) << "this is not a zip file";
    EXPECT_THROW(read_zip_entries(zip), CacheException);
}

TEST_F(ArchiveCacheTest, DirectoryTracksDirtyStateAndLists) {
    fs::path zip = suite_work_dir / "dir.zip";
    ArchiveDirectory dir(zip);
    EXPECT_EQ(dir.size(), 0u);
    EXPECT_FALSE(dir.dirty());

    dir.write("com/example/b.pom", "b");
    dir.write("com/example/a.jar", "a");
    dir.write("org/other.txt", "o");
    EXPECT_TRUE(dir.dirty());
    EXPECT_EQ(dir.list("com/"), (std::vector<std::string>{"com/example/a.jar", "com/example/b.pom"}));
    EXPECT_EQ(dir.list("").size(), 3u);

    dir.flush();
    EXPECT_FALSE(dir.dirty());
    ArchiveDirectory reopened(zip);
    EXPECT_EQ(reopened.read("org/other.txt"), "o");
    EXPECT_FALSE(reopened.exists("missing"));
}

TEST_F(ArchiveCacheTest, StagingListKeepsFirstTouchOrder) {
    StagingList staging;
    staging.add("b");
    staging.add("a");
    staging.add("b");
    EXPECT_EQ(staging.size(), 2u);
    EXPECT_EQ(staging.paths(), (std::vector<std::string>{"b", "a"}));
    EXPECT_TRUE(staging.contains("a"));
    staging.clear();
    EXPECT_TRUE(staging.empty());
}

TEST_F(ArchiveCacheTest, OpenWithoutRemoteStartsEmpty) {
    ArchiveCache cache(cache_dir, endpoint, *client);
    cache.open();
    EXPECT_TRUE(cache.is_open());
    EXPECT_EQ(cache.archive_path(), cache_dir / endpoint.cache_key());
    EXPECT_FALSE(fs::exists(cache.archive_path()));
    EXPECT_TRUE(cache.list("").empty());
    EXPECT_EQ(cache.read("anything"), std::nullopt);
}

TEST_F(ArchiveCacheTest, OpenDownloadsRemoteArchiveOnce) {
    github.add_asset("maven", "repo.zip", make_zip({{"com/example/a.txt", "remote"}}));
    {
        ArchiveCache cache(cache_dir, endpoint, *client);
        cache.open();
        EXPECT_EQ(cache.read("/com/example/a.txt"), "remote");
        EXPECT_TRUE(fs::exists(cache.archive_path()));
    }
    int downloads = github.count("GET", FakeGitHub::CDN);
    EXPECT_EQ(downloads, 1);

    ArchiveCache again(cache_dir, endpoint, *client);
    again.open();
    EXPECT_EQ(again.read("com/example/a.txt"), "remote");
    EXPECT_EQ(github.count("GET", FakeGitHub::CDN), 1);
}

TEST_F(ArchiveCacheTest, WritesPersistOnClose) {
    {
        ArchiveCache cache(cache_dir, endpoint, *client);
        cache.open();
        cache.write("\\com\\example\\x.txt", "local");
        EXPECT_TRUE(cache.has_pending_changes());
        cache.close();
        EXPECT_FALSE(cache.is_open());
        cache.close();
    }
    ArchiveCache reopened(cache_dir, endpoint, *client);
    reopened.open();
    EXPECT_EQ(reopened.read("com/example/x.txt"), "local");
    EXPECT_TRUE(reopened.exists("com/example/x.txt"));
}

TEST_F(ArchiveCacheTest, RejectsTraversalPaths) {
    ArchiveCache cache(cache_dir, endpoint, *client);
    cache.open();
    EXPECT_THROW(cache.write("com/../../etc/passwd", "x"), GhrelException);
    EXPECT_THROW(cache.read("a//b"), GhrelException);
    EXPECT_THROW(cache.exists("/"), GhrelException);
}

TEST_F(ArchiveCacheTest, SecondHandleOnSameArchiveIsLocked) {
    ArchiveCache first(cache_dir, endpoint, *client);
    first.open();
    ArchiveCache second(cache_dir, endpoint, *client);
    EXPECT_THROW(second.open(), CacheException);
    first.close();
    EXPECT_NO_THROW(second.open());
}

TEST_F(ArchiveCacheTest, OperationsBeforeOpenFail) {
    ArchiveCache cache(cache_dir, endpoint, *client);
    EXPECT_THROW(cache.read("a"), CacheException);
    EXPECT_THROW(cache.write("a", "b"), CacheException);
    EXPECT_FALSE(cache.has_pending_changes());
}

TEST_F(ArchiveCacheTest, ReloadReplacesLocalCopy) {
    github.add_asset("maven", "repo.zip", make_zip({{"v.txt", "1"}}));
    ArchiveCache cache(cache_dir, endpoint, *client);
    cache.open();
    EXPECT_EQ(cache.read("v.txt"), "1");

    github.releases.at("maven").assets.clear();
    github.add_asset("maven", "repo.zip", make_zip({{"v.txt", "2"}}));
    cache.reload_from_remote();
    EXPECT_EQ(cache.read("v.txt"), "2");
}

TEST_F(ArchiveCacheTest, ReloadRefusedWithPendingChanges) {
    ArchiveCache cache(cache_dir, endpoint, *client);
    cache.open();
    cache.write("x", "y");
    EXPECT_THROW(cache.reload_from_remote(), CacheException);
    EXPECT_EQ(cache.read("x"), "y");
}
