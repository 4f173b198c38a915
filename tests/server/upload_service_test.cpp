#include "bitsd/events/components.hpp"
#include "bitsd/events/event_bus.hpp"
#include "bitsd/protocol/headers.hpp"
#include "bitsd/upload/registry.hpp"
#include "bitsd/upload/service.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using bitsd::events::EventBus;
using bitsd::events::MetricsComponent;
using bitsd::events::RequestRejectedEvent;
using bitsd::network::HttpMethod;
using bitsd::network::HttpRequest;
using bitsd::network::HttpResponse;
using bitsd::upload::RegistryOptions;
using bitsd::upload::SessionRegistry;
using bitsd::upload::UploadService;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() /
                   ("bitsd_service_test_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
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

HttpRequest bits_request(const std::string& packet, const std::string& url = "/") {
    HttpRequest request;
    request.method = HttpMethod::BITS_POST;
    request.url = url;
    request.headers["BITS-Packet-Type"] = packet;
    return request;
}

class UploadServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        staging_ = root_ / ".staging";
        RegistryOptions options;
        options.staging_dir = staging_;
        options.session.max_fragment_size = 1024;
        registry_ = std::make_unique<SessionRegistry>(options);
        ASSERT_TRUE(registry_->prepare_staging().is_ok());
        metrics_ = std::make_unique<MetricsComponent>(bus_);
        service_ = std::make_unique<UploadService>(root_, *registry_, bus_);
    }

    void TearDown() override {
        service_.reset();
        registry_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    HttpResponse create(const std::string& url) {
        return service_->handle_request(bits_request("Create-Session", url));
    }

    std::string open_session(const std::string& url) {
        auto response = create(url);
        EXPECT_EQ(response.status_code, 201);
        return response.get_header("BITS-Session-Id");
    }

    HttpResponse fragment(const std::string& id, std::uint64_t first, const std::string& data, std::uint64_t total) {
        auto request = bits_request("Fragment");
        request.headers["BITS-Session-Id"] = id;
        request.headers["Content-Range"] = "bytes " + std::to_string(first) + "-" +
                                           std::to_string(first + data.size() - 1) + "/" + std::to_string(total);
        request.body.assign(data.begin(), data.end());
        return service_->handle_request(request);
    }

    HttpResponse close(const std::string& id) {
        auto request = bits_request("Close-Session");
        request.headers["BITS-Session-Id"] = id;
        return service_->handle_request(request);
    }

    HttpResponse cancel(const std::string& id) {
        auto request = bits_request("Cancel-Session");
        request.headers["BITS-Session-Id"] = id;
        return service_->handle_request(request);
    }

    fs::path root_;
    fs::path staging_;
    EventBus bus_;
    std::unique_ptr<MetricsComponent> metrics_;
    std::unique_ptr<SessionRegistry> registry_;
    std::unique_ptr<UploadService> service_;
};

const std::string kUnknownId = "{00000000-0000-0000-0000-000000000001}";

} // namespace

TEST_F(UploadServiceTest, CreateSessionNegotiatesProtocol) {
    auto request = bits_request("Create-Session", "/file.bin");
    request.headers["BITS-Supported-Protocols"] = bitsd::protocol::kUploadProtocolGuid;
    auto response = service_->handle_request(request);

    EXPECT_EQ(response.status_code, 201);
    EXPECT_EQ(response.get_header("BITS-Protocol"), bitsd::protocol::kUploadProtocolGuid);
    EXPECT_EQ(response.get_header("BITS-Packet-Type"), "Ack");
    EXPECT_EQ(response.get_header("BITS-Session-Id").size(), 38u);
    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_EQ(metrics_->get_stats().sessions_created.load(), 1u);
}

TEST_F(UploadServiceTest, UnknownProtocolIsRejected) {
    auto request = bits_request("Create-Session", "/file.bin");
    request.headers["BITS-Supported-Protocols"] = "{11111111-2222-3333-4444-555555555555}";
    auto response = service_->handle_request(request);

    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(response.get_header("BITS-Error-Code"), "0x80070057");
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_EQ(metrics_->get_stats().requests_rejected.load(), 1u);
}

TEST_F(UploadServiceTest, OutOfOrderFragmentsAssembleTheFile) {
    const auto id = open_session("/data.bin");
    const std::string content = "The quick brown fox jumps over the lazy dog";

    auto tail = fragment(id, 20, content.substr(20), content.size());
    EXPECT_EQ(tail.status_code, 200);
    EXPECT_EQ(tail.get_header("BITS-Received-Content-Range"), "0");

    auto middle = fragment(id, 10, content.substr(10, 10), content.size());
    EXPECT_EQ(middle.status_code, 200);
    EXPECT_EQ(middle.get_header("BITS-Received-Content-Range"), "0");

    auto head = fragment(id, 0, content.substr(0, 10), content.size());
    EXPECT_EQ(head.status_code, 200);
    EXPECT_EQ(head.get_header("BITS-Received-Content-Range"), std::to_string(content.size()));

    auto closed = close(id);
    EXPECT_EQ(closed.status_code, 200);
    EXPECT_EQ(closed.get_header("BITS-Session-Id"), id);
    EXPECT_EQ(read_file(root_ / "data.bin"), content);
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_EQ(count_files(staging_), 0u);
    EXPECT_EQ(metrics_->get_stats().bytes_committed.load(), content.size());

    // The session is gone after commit
    EXPECT_EQ(close(id).status_code, 404);
}

TEST_F(UploadServiceTest, RetransmittedFragmentIsAcceptedAgain) {
    const auto id = open_session("/retry.bin");
    EXPECT_EQ(fragment(id, 0, "abcd", 8).status_code, 200);
    auto again = fragment(id, 0, "abcd", 8);
    EXPECT_EQ(again.status_code, 200);
    EXPECT_EQ(again.get_header("BITS-Received-Content-Range"), "4");

    EXPECT_EQ(fragment(id, 4, "efgh", 8).status_code, 200);
    EXPECT_EQ(close(id).status_code, 200);
    EXPECT_EQ(read_file(root_ / "retry.bin"), "abcdefgh");
}

TEST_F(UploadServiceTest, IncompleteCloseKeepsSessionOpen) {
    const auto id = open_session("/partial.bin");
    EXPECT_EQ(fragment(id, 0, "abcd", 8).status_code, 200);

    auto early = close(id);
    EXPECT_EQ(early.status_code, 400);
    EXPECT_EQ(early.get_header("BITS-Error-Code"), "0x80070026");
    EXPECT_EQ(early.get_header("BITS-Error-Context"), "0x5");
    EXPECT_FALSE(fs::exists(root_ / "partial.bin"));
    EXPECT_EQ(registry_->size(), 1u);

    EXPECT_EQ(fragment(id, 4, "efgh", 8).status_code, 200);
    EXPECT_EQ(close(id).status_code, 200);
    EXPECT_EQ(read_file(root_ / "partial.bin"), "abcdefgh");
}

TEST_F(UploadServiceTest, CancelDiscardsEverything) {
    const auto id = open_session("/cancelled.bin");
    EXPECT_EQ(fragment(id, 0, "abcd", 8).status_code, 200);
    EXPECT_EQ(count_files(staging_), 1u);

    EXPECT_EQ(cancel(id).status_code, 200);
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_EQ(count_files(staging_), 0u);
    EXPECT_FALSE(fs::exists(root_ / "cancelled.bin"));

    EXPECT_EQ(fragment(id, 4, "efgh", 8).status_code, 404);
    EXPECT_EQ(cancel(id).status_code, 200);
}

TEST_F(UploadServiceTest, UnknownSessionIsNotFound) {
    auto response = fragment(kUnknownId, 0, "abcd", 4);
    EXPECT_EQ(response.status_code, 404);
    EXPECT_EQ(response.get_header("BITS-Error-Code"), "0x80070490");
    EXPECT_EQ(response.get_header("BITS-Session-Id"), kUnknownId);

    EXPECT_EQ(close(kUnknownId).status_code, 404);
    EXPECT_EQ(cancel(kUnknownId).status_code, 200);
}

TEST_F(UploadServiceTest, TotalSizeConflictRemovesSession) {
    const auto id = open_session("/conflict.bin");
    EXPECT_EQ(fragment(id, 0, "abcd", 8).status_code, 200);

    auto conflict = fragment(id, 4, "efgh", 9);
    EXPECT_EQ(conflict.status_code, 400);
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_EQ(count_files(staging_), 0u);
    EXPECT_EQ(metrics_->get_stats().sessions_failed.load(), 1u);

    EXPECT_EQ(fragment(id, 4, "efgh", 8).status_code, 404);
}

TEST_F(UploadServiceTest, OversizedFragmentIsTooLarge) {
    const auto id = open_session("/big.bin");
    auto response = fragment(id, 0, std::string(2048, 'x'), 4096);
    EXPECT_EQ(response.status_code, 500);
    EXPECT_EQ(response.get_header("BITS-Error-Code"), "0x80200020");
    EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(UploadServiceTest, PayloadLengthMismatchIsMalformed) {
    const auto id = open_session("/mismatch.bin");
    auto request = bits_request("Fragment");
    request.headers["BITS-Session-Id"] = id;
    request.headers["Content-Range"] = "bytes 0-9/10";
    request.body = {'a', 'b'};

    EXPECT_EQ(service_->handle_request(request).status_code, 400);
    EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(UploadServiceTest, SecondSessionForSameTargetConflicts) {
    const auto id = open_session("/shared.bin");
    auto second = create("/shared.bin");
    EXPECT_EQ(second.status_code, 409);
    EXPECT_EQ(second.get_header("BITS-Error-Code"), "0x80070020");

    EXPECT_EQ(cancel(id).status_code, 200);
    EXPECT_EQ(create("/shared.bin").status_code, 201);
}

TEST_F(UploadServiceTest, TargetsOutsideTheRootAreDenied) {
    auto escape = create("/../outside.bin");
    EXPECT_EQ(escape.status_code, 403);
    EXPECT_EQ(escape.get_header("BITS-Error-Code"), "0x80070005");

    EXPECT_EQ(create("/a/../../outside.bin").status_code, 403);
    EXPECT_EQ(create("/.staging/evil.part").status_code, 403);
    EXPECT_EQ(create("/").status_code, 403);

    fs::create_directories(root_ / "folder");
    EXPECT_EQ(create("/folder").status_code, 403);
    EXPECT_EQ(create("/missing/file.bin").status_code, 403);
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(UploadServiceTest, SymlinkedDirectoriesCannotLeaveTheRoot) {
    const fs::path outside = create_temp_dir();
    fs::create_directory_symlink(outside, root_ / "link");
    fs::create_directory_symlink(staging_, root_ / "stage_link");

    auto escaped = create("/link/escaped.txt");
    EXPECT_EQ(escaped.status_code, 403);
    EXPECT_EQ(escaped.get_header("BITS-Error-Code"), "0x80070005");
    EXPECT_EQ(create("/stage_link/planted.part").status_code, 403);
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_FALSE(fs::exists(outside / "escaped.txt"));

    // A link that stays inside the root is followed
    fs::create_directories(root_ / "real");
    fs::create_directory_symlink(root_ / "real", root_ / "alias");
    const auto id = open_session("/alias/kept.txt");
    EXPECT_EQ(fragment(id, 0, "kept", 4).status_code, 200);
    EXPECT_EQ(close(id).status_code, 200);
    EXPECT_EQ(read_file(root_ / "real" / "kept.txt"), "kept");

    std::error_code ec;
    fs::remove_all(outside, ec);
}

TEST_F(UploadServiceTest, CloseFailsWhenTargetDirectoryVanishes) {
    fs::create_directories(root_ / "sub");
    const auto id = open_session("/sub/file.bin");
    ASSERT_EQ(fragment(id, 0, "abcd", 4).status_code, 200);
    ASSERT_EQ(count_files(staging_), 1u);

    fs::remove_all(root_ / "sub");

    auto failed = close(id);
    EXPECT_EQ(failed.status_code, 500);
    EXPECT_EQ(failed.get_header("BITS-Error-Code"), "0x1");
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_EQ(count_files(staging_), 0u);
    EXPECT_EQ(metrics_->get_stats().sessions_failed.load(), 1u);

    EXPECT_EQ(close(id).status_code, 404);
}

TEST_F(UploadServiceTest, RejectionsNameTheirPacketType) {
    std::vector<RequestRejectedEvent> rejected;
    bus_.subscribe<RequestRejectedEvent>([&rejected](const RequestRejectedEvent& event) {
        rejected.push_back(event);
    });

    EXPECT_EQ(fragment(kUnknownId, 0, "x", 1).status_code, 404);
    EXPECT_EQ(service_->handle_request(bits_request("Teleport")).status_code, 400);
    EXPECT_EQ(create("/../outside.bin").status_code, 403);
    EXPECT_EQ(service_->handle_request(bits_request("Ping")).status_code, 200);

    ASSERT_EQ(rejected.size(), 3u);
    EXPECT_EQ(rejected[0].packet_type, "Fragment");
    EXPECT_EQ(rejected[0].session_id, kUnknownId);
    EXPECT_EQ(rejected[0].kind, bitsd::upload::ErrorKind::UnknownSession);
    EXPECT_EQ(rejected[1].packet_type, "Malformed");
    EXPECT_EQ(rejected[1].kind, bitsd::upload::ErrorKind::Malformed);
    EXPECT_EQ(rejected[2].packet_type, "Create-Session");
    EXPECT_EQ(rejected[2].kind, bitsd::upload::ErrorKind::AccessDenied);
    EXPECT_EQ(metrics_->get_stats().requests_rejected.load(), 3u);
}

TEST_F(UploadServiceTest, PingAndMalformedPackets) {
    auto ping = service_->handle_request(bits_request("Ping"));
    EXPECT_EQ(ping.status_code, 200);
    EXPECT_EQ(ping.get_header("BITS-Packet-Type"), "Ack");

    auto bogus = service_->handle_request(bits_request("Teleport"));
    EXPECT_EQ(bogus.status_code, 400);
    EXPECT_EQ(bogus.get_header("BITS-Error-Code"), "0x80070057");
}

TEST_F(UploadServiceTest, OtherMethodsAreNotAllowed) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = "/file.bin";
    auto response = service_->handle_request(request);
    EXPECT_EQ(response.status_code, 405);
    EXPECT_EQ(response.get_header("Allow"), "BITS_POST");
}

TEST_F(UploadServiceTest, IdleSessionsExpire) {
    const auto id = open_session("/idle.bin");
    EXPECT_EQ(fragment(id, 0, "ab", 4).status_code, 200);

    EXPECT_EQ(service_->expire_idle_sessions(std::chrono::seconds(3600)), 0u);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(service_->expire_idle_sessions(std::chrono::seconds(0)), 1u);

    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_EQ(count_files(staging_), 0u);
    EXPECT_EQ(metrics_->get_stats().sessions_expired.load(), 1u);
    EXPECT_EQ(fragment(id, 2, "cd", 4).status_code, 404);
}

TEST_F(UploadServiceTest, ConcurrentSessionsStayIsolated) {
    constexpr int kSessions = 8;
    constexpr int kChunk = 16;
    constexpr int kChunks = 32;

    std::vector<std::string> ids;
    std::vector<std::string> contents;
    for (int s = 0; s < kSessions; ++s) {
        ids.push_back(open_session("/parallel_" + std::to_string(s) + ".bin"));
        contents.emplace_back(static_cast<std::size_t>(kChunk * kChunks), static_cast<char>('A' + s));
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int s = 0; s < kSessions; ++s) {
        workers.emplace_back([&, s] {
            // Odd sessions send back to front
            for (int i = 0; i < kChunks; ++i) {
                const int chunk = (s % 2 == 0) ? i : kChunks - 1 - i;
                const auto offset = static_cast<std::uint64_t>(chunk * kChunk);
                auto response = fragment(ids[static_cast<std::size_t>(s)], offset,
                                         contents[static_cast<std::size_t>(s)].substr(offset, kChunk),
                                         contents[static_cast<std::size_t>(s)].size());
                if (response.status_code != 200) {
                    failures++;
                }
            }
            if (close(ids[static_cast<std::size_t>(s)]).status_code != 200) {
                failures++;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(failures.load(), 0);
    for (int s = 0; s < kSessions; ++s) {
        EXPECT_EQ(read_file(root_ / ("parallel_" + std::to_string(s) + ".bin")),
                  contents[static_cast<std::size_t>(s)]);
    }
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(UploadServiceTest, ConcurrentFragmentsOnOneSession) {
    const auto id = open_session("/same.bin");
    constexpr int kThreads = 4;
    constexpr int kChunk = 64;
    const std::string content(kThreads * kChunk, 'z');

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            const auto offset = static_cast<std::uint64_t>(t * kChunk);
            fragment(id, offset, content.substr(offset, kChunk), content.size());
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(close(id).status_code, 200);
    EXPECT_EQ(read_file(root_ / "same.bin"), content);
}
