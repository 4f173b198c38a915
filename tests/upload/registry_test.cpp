#include "bitsd/upload/registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using bitsd::upload::ErrorKind;
using bitsd::upload::RegistryOptions;
using bitsd::upload::SessionRegistry;
using bitsd::upload::SessionState;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() /
                   ("bitsd_registry_test_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

std::size_t count_files(const fs::path& dir) {
    std::size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            ++count;
        }
    }
    return count;
}

class SessionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        RegistryOptions options;
        options.staging_dir = root_ / "staging";
        registry_ = std::make_unique<SessionRegistry>(options);
        ASSERT_TRUE(registry_->prepare_staging().is_ok());
    }

    void TearDown() override {
        registry_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    std::unique_ptr<SessionRegistry> registry_;
};

} // namespace

TEST(SessionIdTest, GeneratesBracedLowerCaseUuids) {
    const std::regex layout("\\{[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}\\}");
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        const auto id = SessionRegistry::generate_id();
        EXPECT_TRUE(std::regex_match(id, layout)) << id;
        EXPECT_TRUE(seen.insert(id).second) << "duplicate id " << id;
    }
}

TEST_F(SessionRegistryTest, CreateLookupRemove) {
    auto created = registry_->create(root_ / "file.bin");
    ASSERT_TRUE(created.is_ok());
    const auto session = created.value();

    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_EQ(registry_->lookup(session->id()), session);
    EXPECT_TRUE(registry_->target_in_use(root_ / "file.bin"));
    EXPECT_EQ(count_files(root_ / "staging"), 1u);

    registry_->remove(session->id());
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_EQ(registry_->lookup(session->id()), nullptr);
    EXPECT_FALSE(registry_->target_in_use(root_ / "file.bin"));

    // Idempotent
    registry_->remove(session->id());
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(SessionRegistryTest, SecondSessionForSameTargetIsRefused) {
    auto first = registry_->create(root_ / "shared.bin");
    ASSERT_TRUE(first.is_ok());

    auto second = registry_->create(root_ / "." / "shared.bin");
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().kind, ErrorKind::TargetInUse);

    registry_->remove(first.value()->id());
    EXPECT_TRUE(registry_->create(root_ / "shared.bin").is_ok());
}

TEST_F(SessionRegistryTest, DirectoryTargetsAreDenied) {
    fs::create_directories(root_ / "dir");
    auto as_directory = registry_->create(root_ / "dir");
    ASSERT_TRUE(as_directory.is_error());
    EXPECT_EQ(as_directory.error().kind, ErrorKind::AccessDenied);

    auto missing_parent = registry_->create(root_ / "nowhere" / "file.bin");
    ASSERT_TRUE(missing_parent.is_error());
    EXPECT_EQ(missing_parent.error().kind, ErrorKind::AccessDenied);
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(SessionRegistryTest, BackingFileFailureInsertsNothing) {
    fs::remove_all(root_ / "staging");

    auto created = registry_->create(root_ / "file.bin");
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, ErrorKind::Internal);
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_FALSE(registry_->target_in_use(root_ / "file.bin"));
}

TEST_F(SessionRegistryTest, ExpireIdleCancelsAndRemoves) {
    auto idle = registry_->create(root_ / "idle.bin").value();
    const auto now = std::chrono::steady_clock::now();

    EXPECT_TRUE(registry_->expire_idle(std::chrono::hours(1), now).empty());
    EXPECT_EQ(registry_->size(), 1u);

    const auto expired = registry_->expire_idle(std::chrono::seconds(1), now + std::chrono::minutes(5));
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired.front(), idle->id());
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_EQ(idle->state(), SessionState::Cancelled);
    EXPECT_EQ(count_files(root_ / "staging"), 0u);
    EXPECT_FALSE(registry_->target_in_use(root_ / "idle.bin"));
}

TEST_F(SessionRegistryTest, PrepareStagingRemovesStaleBackingFiles) {
    {
        std::ofstream(root_ / "staging" / "old.part") << "stale";
        std::ofstream(root_ / "staging" / "keep.txt") << "unrelated";
    }

    auto removed = registry_->prepare_staging();
    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(removed.value(), 1u);
    EXPECT_FALSE(fs::exists(root_ / "staging" / "old.part"));
    EXPECT_TRUE(fs::exists(root_ / "staging" / "keep.txt"));
}
