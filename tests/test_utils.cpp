#include <gtest/gtest.h>
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"
#include "../main/src/utils.hpp"
#include <filesystem>
#include <future>
#include <thread>

namespace fs = std::filesystem;

class LockTest : public ::testing::Test {
protected:
    fs::path test_root;

    void SetUp() override {
        init_localization();
        test_root = fs::absolute("tmp_lock_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);
    }

    void TearDown() override {
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }
};

TEST_F(LockTest, BasicLocking) {
    std::unique_ptr<FileLock> lock1;
    EXPECT_NO_THROW(lock1 = std::make_unique<FileLock>(test_root / "a.lock"));
    EXPECT_THROW(FileLock lock2(test_root / "a.lock"), CacheException);
    EXPECT_NO_THROW(FileLock other(test_root / "b.lock"));
}

TEST_F(LockTest, LockReleaseAndReacquire) {
    {
        FileLock lock1(test_root / "a.lock");
    }
    EXPECT_NO_THROW(FileLock lock2(test_root / "a.lock"));
}

TEST_F(LockTest, ConcurrencyTest) {
    std::promise<void> locked;
    std::promise<void> done;
    auto locked_future = locked.get_future();
    auto done_future = done.get_future();

    std::thread holder([&]() {
        FileLock lock(test_root / "a.lock");
        locked.set_value();
        done_future.wait();
    });

    locked_future.wait();
    EXPECT_THROW(FileLock lock(test_root / "a.lock"), CacheException);
    done.set_value();
    holder.join();
    EXPECT_NO_THROW(FileLock lock(test_root / "a.lock"));
}

class UtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }
};

TEST_F(UtilsTest, NormalizesResourcePaths) {
    EXPECT_EQ(normalize_resource_path("/com/example/a.jar"), "com/example/a.jar");
    EXPECT_EQ(normalize_resource_path("com\\example\\a.jar"), "com/example/a.jar");
    EXPECT_EQ(normalize_resource_path("a..b/c"), "a..b/c");
    EXPECT_THROW(normalize_resource_path(""), GhrelException);
    EXPECT_THROW(normalize_resource_path("///"), GhrelException);
    EXPECT_THROW(normalize_resource_path("a//b"), GhrelException);
    EXPECT_THROW(normalize_resource_path("a/../b"), GhrelException);
    EXPECT_THROW(normalize_resource_path(".."), GhrelException);
}

TEST_F(UtilsTest, ParsesIsoTimestamps) {
    std::chrono::system_clock::time_point tp;
    ASSERT_TRUE(parse_iso8601("2024-06-01T12:00:00Z", tp));
    EXPECT_EQ(format_utc(tp, "%Y%m%d%H%M%S"), "20240601120000");
    ASSERT_TRUE(parse_iso8601("2024-06-01T12:00:00.250Z", tp));
    EXPECT_EQ(format_utc(tp, "%Y%m%d.%H%M%S"), "20240601.120000");
    EXPECT_TRUE(parse_iso8601("2024-06-01T12:00:00+00:00", tp));
    EXPECT_FALSE(parse_iso8601("2024-06-01T12:00:00+02:00", tp));
    EXPECT_FALSE(parse_iso8601("not a date", tp));
}

TEST_F(UtilsTest, AtomicWriteReplacesContent) {
    fs::path dir = fs::absolute("tmp_utils_test");
    fs::remove_all(dir);
    fs::path file = dir / "nested/out.bin";
    write_file_atomic(file, "first");
    write_file_atomic(file, std::string("se\0cond", 7));
    EXPECT_EQ(read_file_bytes(file), std::string("se\0cond", 7));
    EXPECT_FALSE(fs::exists(file.string() + ".tmp"));
    EXPECT_THROW(read_file_bytes(dir / "missing"), CacheException);
    fs::remove_all(dir);
}

TEST_F(UtilsTest, TrimAndLower) {
    EXPECT_EQ(trim("  a b \r\n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("X-RateLimit-Remaining"), "x-ratelimit-remaining");
}
