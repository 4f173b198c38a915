#pragma once

#include "bitsd/upload/range_set.hpp"
#include "bitsd/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace bitsd::upload {

/**
 * @brief Temporary backing file of one upload plus the ranges written to it
 *
 * Bytes are written at their absolute offset, so fragments may arrive in any
 * order. The file is either promoted onto the target path or discarded; a
 * store destroyed in neither state deletes its file.
 *
 * Not thread-safe: the owning UploadSession serializes access.
 */
class FragmentStore {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief Create (truncate) the backing file at @p backing_path
     */
    static UploadResult<std::unique_ptr<FragmentStore>> open(std::filesystem::path backing_path);

    /// Use open(); the tag keeps construction inside the class
    FragmentStore(PrivateTag, std::filesystem::path path, std::fstream file);
    ~FragmentStore();

    FragmentStore(const FragmentStore&) = delete;
    FragmentStore& operator=(const FragmentStore&) = delete;

    /**
     * @brief Write @p payload at @p range.start and record the range
     *
     * The range is recorded only after the bytes reached the file.
     */
    UploadResult<void> write(ByteRange range, const std::vector<std::uint8_t>& payload);

    /**
     * @brief Compare @p payload against bytes already received in @p range
     *
     * Only the overlap with previously written ranges is read back.
     * @return true when every overlapping byte is identical
     */
    UploadResult<bool> matches_received(ByteRange range, const std::vector<std::uint8_t>& payload);

    /**
     * @brief Move the backing file onto @p target, replacing any existing file
     *
     * Uses rename(2). When the staging directory lives on another volume the
     * file is copied next to the target first and then renamed into place,
     * so the target path only ever shows a complete file.
     */
    UploadResult<void> promote(const std::filesystem::path& target);

    /**
     * @brief Close and delete the backing file (no-op once released)
     */
    void discard() noexcept;

    [[nodiscard]] const RangeSet& ranges() const noexcept { return ranges_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool released() const noexcept { return released_; }

private:
    UploadResult<void> copy_across_volumes(const std::filesystem::path& target);

    std::filesystem::path path_;
    std::fstream file_;
    RangeSet ranges_;
    bool released_ = false;
};

} // namespace bitsd::upload
