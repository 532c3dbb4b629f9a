#include <gtest/gtest.h>
#include <managers/profiling_manager.hpp>
#include "http_test_server.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class ProfileSaverTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::vector<std::string> lines;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "knadmin_profile_saver_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    StatusCallback collect() {
        return [this](const std::string& l) { lines.push_back(l); };
    }

    static std::string read_file(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static HttpTestServer::Reply reply(int status, const std::string& body) {
        HttpTestServer::Reply r;
        r.status = status;
        r.body = body;
        return r;
    }
};

TEST(ProfileFiles, Names) {
    EXPECT_EQ(profile_file_name("activator-abc", ProfileKind::Heap, "20240101-120000"),
              "activator-abc-heap-20240101-120000.pprof");
    EXPECT_EQ(profile_file_name("activator-abc", ProfileKind::Trace, "20240101-120000"),
              "activator-abc-trace-20240101-120000.trace");
    EXPECT_EQ(profile_file_name("p", ProfileKind::MemAllocs, "t"), "p-mem-allocs-t.pprof");
}

TEST(ProfileFiles, AllRequests) {
    auto requests = all_profile_requests(7);
    ASSERT_EQ(requests.size(), 8u);
    for (const auto& req : requests) {
        EXPECT_EQ(req.seconds.has_value(), takes_duration(req.kind));
        if (req.seconds) EXPECT_EQ(*req.seconds, 7);
    }
}

TEST_F(ProfileSaverTest, SavesEachProfile) {
    HttpTestServer server(reply(200, "some-binary-data"));
    ProfileDownloader downloader(server.port());
    downloader.ready().signal();

    ProfileSaver saver(downloader, test_dir, collect());
    std::vector<ProfileRequest> requests(2);
    requests[0].kind = ProfileKind::Heap;
    requests[1].kind = ProfileKind::CPU;
    requests[1].seconds = 2;

    auto result = saver.save_all("pod", requests, "ts");
    ASSERT_TRUE(result.is_ok()) << result.error;
    ASSERT_EQ(result.value.size(), 2u);

    fs::path heap = test_dir / "pod-heap-ts.pprof";
    EXPECT_EQ(read_file(heap), "some-binary-data");
    EXPECT_TRUE(fs::exists(test_dir / "pod-cpu-ts.pprof"));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "Saving heap profile data to " + heap.string());
    EXPECT_EQ(server.targets().at(1), "/debug/pprof/profile?seconds=2");
}

TEST_F(ProfileSaverTest, FailureRemovesFileAndStops) {
    HttpTestServer server(reply(404, "unknown profile"));
    ProfileDownloader downloader(server.port());
    downloader.ready().signal();

    ProfileSaver saver(downloader, test_dir, collect());
    std::vector<ProfileRequest> requests(2);
    requests[0].kind = ProfileKind::Mutex;
    requests[1].kind = ProfileKind::Heap;

    auto result = saver.save_all("pod", requests, "ts");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error, "download error: unknown profile, code 404");
    EXPECT_FALSE(fs::exists(test_dir / "pod-mutex-ts.pprof"));
    EXPECT_EQ(server.accepted(), 1);
    EXPECT_EQ(lines.size(), 1u);
}

TEST_F(ProfileSaverTest, UnwritableFileIsRemovedAndReported) {
    HttpTestServer server(reply(200, "some-binary-data"));
    ProfileDownloader downloader(server.port());
    downloader.ready().signal();

    fs::path file = test_dir / "pod-heap-ts.pprof";
    fs::create_symlink("/dev/full", file);

    ProfileSaver saver(downloader, test_dir, collect());
    std::vector<ProfileRequest> requests(1);
    requests[0].kind = ProfileKind::Heap;

    auto result = saver.save_all("pod", requests, "ts");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("failed to"), std::string::npos);
    EXPECT_FALSE(fs::exists(fs::symlink_status(file)));
}

TEST_F(ProfileSaverTest, StoppedDownloaderLeavesNoFiles) {
    ProfileDownloader downloader(1);
    downloader.stop().signal();

    ProfileSaver saver(downloader, test_dir, collect());
    std::vector<ProfileRequest> requests(1);
    requests[0].kind = ProfileKind::Goroutine;

    auto result = saver.save_all("pod", requests, "ts");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("download failed"), std::string::npos);
    EXPECT_TRUE(fs::is_empty(test_dir));
}

TEST(ProfilingManager, ValidatesBeforeConnecting) {
    auto config = Config::parse("");
    ASSERT_TRUE(config.is_ok());
    ProfilingManager manager(config.value, nullptr);

    ProfilingOptions opts;
    EXPECT_EQ(manager.run(opts).error,
              "'profiling' requires the pod name provided with the --target option");

    opts.target = "pod";
    EXPECT_EQ(manager.run(opts).error,
              "'profiling' requires at least one profile type option or --all");

    ProfileRequest cpu;
    cpu.kind = ProfileKind::CPU;
    cpu.seconds = 0;
    opts.requests = {cpu};
    EXPECT_EQ(manager.run(opts).error, "--cpu requires a positive number of seconds");
}
