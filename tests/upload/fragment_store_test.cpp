#include "bitsd/upload/fragment_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace fs = std::filesystem;
using bitsd::upload::ErrorKind;
using bitsd::upload::FragmentStore;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() /
                   ("bitsd_store_test_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

std::vector<std::uint8_t> bytes(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

} // namespace

TEST(FragmentStoreTest, WritesAtAbsoluteOffsetsInAnyOrder) {
    const auto dir = create_temp_dir();
    auto opened = FragmentStore::open(dir / "a.part");
    ASSERT_TRUE(opened.is_ok());
    auto store = std::move(opened.value());

    ASSERT_TRUE(store->write({6, 11}, bytes("world")).is_ok());
    ASSERT_TRUE(store->write({0, 6}, bytes("hello ")).is_ok());
    EXPECT_TRUE(store->ranges().covers(11));

    const fs::path target = dir / "greeting.txt";
    ASSERT_TRUE(store->promote(target).is_ok());
    EXPECT_TRUE(store->released());
    EXPECT_EQ(read_file(target), "hello world");
    EXPECT_FALSE(fs::exists(dir / "a.part"));

    fs::remove_all(dir);
}

TEST(FragmentStoreTest, RejectsPayloadOfWrongLength) {
    const auto dir = create_temp_dir();
    auto store = std::move(FragmentStore::open(dir / "b.part").value());

    auto result = store->write({0, 4}, bytes("abc"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Malformed);
    EXPECT_TRUE(store->ranges().empty());

    fs::remove_all(dir);
}

TEST(FragmentStoreTest, DiscardDeletesBackingFile) {
    const auto dir = create_temp_dir();
    const fs::path backing = dir / "c.part";
    auto store = std::move(FragmentStore::open(backing).value());
    ASSERT_TRUE(store->write({0, 3}, bytes("abc")).is_ok());
    ASSERT_TRUE(fs::exists(backing));

    store->discard();
    EXPECT_TRUE(store->released());
    EXPECT_FALSE(fs::exists(backing));

    auto late = store->write({3, 4}, bytes("d"));
    ASSERT_TRUE(late.is_error());
    EXPECT_EQ(late.error().kind, ErrorKind::NotOpen);

    fs::remove_all(dir);
}

TEST(FragmentStoreTest, DestructorRemovesUnpromotedFile) {
    const auto dir = create_temp_dir();
    const fs::path backing = dir / "d.part";
    {
        auto store = std::move(FragmentStore::open(backing).value());
        ASSERT_TRUE(store->write({0, 1}, bytes("x")).is_ok());
    }
    EXPECT_FALSE(fs::exists(backing));

    fs::remove_all(dir);
}

TEST(FragmentStoreTest, ComparesRetransmittedBytes) {
    const auto dir = create_temp_dir();
    auto store = std::move(FragmentStore::open(dir / "e.part").value());
    ASSERT_TRUE(store->write({0, 4}, bytes("abcd")).is_ok());

    auto same = store->matches_received({2, 6}, bytes("cdef"));
    ASSERT_TRUE(same.is_ok());
    EXPECT_TRUE(same.value());

    auto different = store->matches_received({0, 2}, bytes("xy"));
    ASSERT_TRUE(different.is_ok());
    EXPECT_FALSE(different.value());

    fs::remove_all(dir);
}

TEST(FragmentStoreTest, OpenFailsInMissingDirectory) {
    const auto dir = create_temp_dir();
    auto opened = FragmentStore::open(dir / "missing" / "f.part");
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().kind, ErrorKind::Internal);

    fs::remove_all(dir);
}

TEST(FragmentStoreTest, PromoteOverwritesExistingTarget) {
    const auto dir = create_temp_dir();
    const fs::path target = dir / "existing.txt";
    {
        std::ofstream out(target, std::ios::binary);
        out << "old contents that are longer";
    }

    auto store = std::move(FragmentStore::open(dir / "g.part").value());
    ASSERT_TRUE(store->write({0, 3}, bytes("new")).is_ok());
    ASSERT_TRUE(store->promote(target).is_ok());
    EXPECT_EQ(read_file(target), "new");

    fs::remove_all(dir);
}

TEST(FragmentStoreTest, OnlyOpenCreatesStores) {
    static_assert(!std::is_constructible_v<FragmentStore, fs::path, std::fstream>,
                  "stores must come from FragmentStore::open");
    static_assert(!std::is_copy_constructible_v<FragmentStore>);

    const auto dir = create_temp_dir();
    auto opened = FragmentStore::open(dir / "h.part");
    ASSERT_TRUE(opened.is_ok());
    ASSERT_NE(opened.value(), nullptr);
    EXPECT_EQ(opened.value()->path(), dir / "h.part");
    EXPECT_TRUE(fs::exists(dir / "h.part"));

    opened.value().reset();
    EXPECT_FALSE(fs::exists(dir / "h.part"));
    fs::remove_all(dir);
}
