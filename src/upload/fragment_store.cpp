#include "bitsd/upload/fragment_store.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace bitsd::upload {
namespace fs = std::filesystem;

namespace {

fs::path partial_path_for(const fs::path& target) {
    return target.parent_path() / ("." + target.filename().string() + ".bitsd-partial");
}

} // namespace

UploadResult<std::unique_ptr<FragmentStore>> FragmentStore::open(fs::path backing_path) {
    {
        std::ofstream create(backing_path, std::ios::binary | std::ios::trunc);
        if (!create) {
            return upload_error<std::unique_ptr<FragmentStore>>(
                ErrorKind::Internal, "Failed to create backing file: " + backing_path.string());
        }
    }

    std::fstream file(backing_path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        std::error_code ec;
        fs::remove(backing_path, ec);
        return upload_error<std::unique_ptr<FragmentStore>>(
            ErrorKind::Internal, "Failed to open backing file: " + backing_path.string());
    }

    return bitsd::Ok<std::unique_ptr<FragmentStore>, UploadError>(
        std::make_unique<FragmentStore>(PrivateTag{}, std::move(backing_path), std::move(file)));
}

FragmentStore::FragmentStore(PrivateTag, fs::path path, std::fstream file)
    : path_(std::move(path)), file_(std::move(file)) {}

FragmentStore::~FragmentStore() {
    discard();
}

UploadResult<void> FragmentStore::write(ByteRange range, const std::vector<std::uint8_t>& payload) {
    if (released_) {
        return upload_error(ErrorKind::NotOpen, "Backing file already released");
    }
    if (payload.size() != range.length()) {
        return upload_error(ErrorKind::Malformed, "Payload length does not match range");
    }

    file_.clear();
    file_.seekp(static_cast<std::streamoff>(range.start));
    file_.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    file_.flush();
    if (!file_) {
        file_.clear();
        return upload_error(ErrorKind::Internal,
                            "Failed to write " + std::to_string(payload.size()) + " bytes at offset " +
                            std::to_string(range.start) + " to " + path_.string());
    }

    ranges_.insert(range);
    return upload_ok();
}

UploadResult<bool> FragmentStore::matches_received(ByteRange range, const std::vector<std::uint8_t>& payload) {
    std::vector<char> existing;
    for (const auto& overlap : ranges_.intersection(range)) {
        existing.resize(static_cast<std::size_t>(overlap.length()));

        file_.clear();
        file_.seekg(static_cast<std::streamoff>(overlap.start));
        file_.read(existing.data(), static_cast<std::streamsize>(existing.size()));
        if (!file_) {
            file_.clear();
            return upload_error<bool>(ErrorKind::Internal,
                                      "Failed to read back received bytes from " + path_.string());
        }

        const auto offset = static_cast<std::size_t>(overlap.start - range.start);
        for (std::size_t i = 0; i < existing.size(); ++i) {
            if (static_cast<std::uint8_t>(existing[i]) != payload[offset + i]) {
                return bitsd::Ok<bool, UploadError>(false);
            }
        }
    }
    return bitsd::Ok<bool, UploadError>(true);
}

UploadResult<void> FragmentStore::promote(const fs::path& target) {
    if (released_) {
        return upload_error(ErrorKind::NotOpen, "Backing file already released");
    }

    file_.close();
    if (file_.fail()) {
        return upload_error(ErrorKind::Internal, "Failed to close backing file: " + path_.string());
    }

    std::error_code ec;
    fs::rename(path_, target, ec);
    if (ec == std::errc::cross_device_link) {
        return copy_across_volumes(target);
    }
    if (ec) {
        return upload_error(ErrorKind::Internal,
                            "Failed to move " + path_.string() + " to " + target.string() + ": " + ec.message());
    }

    released_ = true;
    return upload_ok();
}

UploadResult<void> FragmentStore::copy_across_volumes(const fs::path& target) {
    // Non-atomic step: the copy lands on a hidden sibling, only the final
    // rename (same directory, same volume) publishes it.
    spdlog::warn("Staging and target are on different volumes, copying {} before rename", path_.string());

    const fs::path partial = partial_path_for(target);
    std::error_code ec;

    fs::copy_file(path_, partial, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        fs::remove(partial, ec);
        return upload_error(ErrorKind::Internal, "Failed to copy backing file next to " + target.string());
    }

    const auto expected = fs::file_size(path_, ec);
    const auto copied = ec ? 0 : fs::file_size(partial, ec);
    if (ec || copied != expected) {
        fs::remove(partial, ec);
        return upload_error(ErrorKind::Internal, "Copied file size mismatch for " + target.string());
    }

    fs::rename(partial, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(partial, ec);
        return upload_error(ErrorKind::Internal, "Failed to publish " + target.string() + ": " + reason);
    }

    fs::remove(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove backing file {}: {}", path_.string(), ec.message());
    }
    released_ = true;
    return upload_ok();
}

void FragmentStore::discard() noexcept {
    if (released_) {
        return;
    }
    released_ = true;

    if (file_.is_open()) {
        file_.close();
    }

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove backing file {}: {}", path_.string(), ec.message());
    }
}

} // namespace bitsd::upload
