// SPECTRE - Circuit Asset Loader Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include <gtest/gtest.h>
#include "spectre/circuits/asset_loader.h"
#include "spectre/prover/errors.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace spectre {
namespace test {

namespace {

const char* REMOTE = "https://example.invalid/circuits";

Bytes ValidWasm() {
    return {0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00};
}

Bytes ValidZkey() {
    return Bytes(64, 0x5a);
}

/// Serves canned responses and counts calls
class FakeFetcher : public IArtifactFetcher {
public:
    std::vector<FetchResult> FetchAll(const std::vector<std::string>& urls,
                                      const TransferProgress& progress) override {
        ++calls;
        requested = urls;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        for (size_t i = 0; i < responses.size(); ++i) {
            uint64_t size = responses[i].body.size();
            if (!progress(i, size / 2, size) || !progress(i, size, size)) {
                throw ArtifactError("Transfer aborted");
            }
        }
        return responses;
    }

    std::vector<FetchResult> responses{{200, ValidWasm()}, {200, ValidZkey()}};
    std::vector<std::string> requested;
    std::atomic<int> calls{0};
    std::chrono::milliseconds delay{0};
};

} // namespace

class AssetLoaderTest : public ::testing::Test {
protected:
    util::fs::TempDirectory local_;
    util::fs::TempDirectory cache_;
    std::shared_ptr<FakeFetcher> fetcher_ = std::make_shared<FakeFetcher>();

    AssetLoaderOptions RemoteOnly() {
        AssetLoaderOptions options;
        options.localDirs = {local_.GetPath() / "missing"};
        options.remoteBase = REMOTE;
        return options;
    }

    void WriteLocal(const util::fs::Path& dir, const Bytes& wasm, const Bytes& zkey) {
        ASSERT_TRUE(util::fs::EnsureDirectory(dir));
        ASSERT_TRUE(util::fs::WriteFile(dir / "transaction2.wasm", wasm.data(), wasm.size()));
        ASSERT_TRUE(util::fs::WriteFile(dir / "transaction2.zkey", zkey.data(), zkey.size()));
    }
};

// ============================================================================
// WASM Validation
// ============================================================================

TEST(WasmMagicTest, AcceptsWasmHeader) {
    EXPECT_NO_THROW(ValidateWasmMagic(ValidWasm(), "from test"));
}

TEST(WasmMagicTest, ReportsHeaderBytes) {
    Bytes html = {'<', '!', 'D', 'O', 'C'};
    try {
        ValidateWasmMagic(html, "downloaded from x");
        FAIL() << "Expected ArtifactError";
    } catch (const ArtifactError& e) {
        EXPECT_STREQ(e.what(), "Invalid WASM file downloaded from x. Got header: 3c 21 44 4f");
    }
    EXPECT_THROW(ValidateWasmMagic(Bytes{0x00, 0x61}, "short"), ArtifactError);
}

// ============================================================================
// Local Directories
// ============================================================================

TEST_F(AssetLoaderTest, PrefersFirstLocalDirectory) {
    WriteLocal(local_.GetPath() / "a", ValidWasm(), Bytes(8, 1));
    WriteLocal(local_.GetPath() / "b", ValidWasm(), Bytes(8, 2));

    AssetLoaderOptions options;
    options.localDirs = {local_.GetPath() / "none", local_.GetPath() / "a", local_.GetPath() / "b"};
    CircuitAssetLoader loader(options, fetcher_);

    ArtifactsPtr artifacts = loader.Load();
    EXPECT_EQ(artifacts->zkey, Bytes(8, 1));
    EXPECT_EQ(artifacts->source, (local_.GetPath() / "a").string());
    EXPECT_EQ(fetcher_->calls.load(), 0);
}

TEST_F(AssetLoaderTest, InvalidLocalFilesAreReported) {
    WriteLocal(local_.GetPath(), Bytes{'b', 'a', 'd', '!'}, ValidZkey());
    AssetLoaderOptions options;
    options.localDirs = {local_.GetPath()};
    options.remoteBase.clear();
    CircuitAssetLoader loader(options, fetcher_);
    try {
        loader.Load();
        FAIL() << "Expected ArtifactError";
    } catch (const ArtifactError& e) {
        EXPECT_NE(std::string(e.what()).find("not found in any local directory"),
                  std::string::npos);
        EXPECT_NE(std::string(e.what()).find("Got header: 62 61 64 21"), std::string::npos);
    }
}

TEST_F(AssetLoaderTest, InvalidLocalDirectoryFallsThroughToNext) {
    WriteLocal(local_.GetPath() / "broken", Bytes{'<', 'h', 't', 'm'}, ValidZkey());
    WriteLocal(local_.GetPath() / "empty-key", ValidWasm(), Bytes{});
    WriteLocal(local_.GetPath() / "good", ValidWasm(), Bytes(8, 3));

    AssetLoaderOptions options;
    options.localDirs = {local_.GetPath() / "broken", local_.GetPath() / "empty-key",
                         local_.GetPath() / "good"};
    CircuitAssetLoader loader(options, fetcher_);

    ArtifactsPtr artifacts = loader.Load();
    EXPECT_EQ(artifacts->source, (local_.GetPath() / "good").string());
    EXPECT_EQ(artifacts->zkey, Bytes(8, 3));
    EXPECT_EQ(fetcher_->calls.load(), 0);
}

TEST_F(AssetLoaderTest, InvalidLocalDirectoryFallsThroughToRemote) {
    WriteLocal(local_.GetPath(), Bytes{'<', 'h', 't', 'm'}, ValidZkey());
    AssetLoaderOptions options = RemoteOnly();
    options.localDirs = {local_.GetPath()};
    CircuitAssetLoader loader(options, fetcher_);

    ArtifactsPtr artifacts = loader.Load();
    EXPECT_EQ(artifacts->source, REMOTE);
    EXPECT_EQ(fetcher_->calls.load(), 1);
}

TEST_F(AssetLoaderTest, CustomCircuitName) {
    AssetLoaderOptions options;
    options.name = "transaction16";
    options.localDirs = {local_.GetPath()};
    CircuitAssetLoader loader(options, fetcher_);
    EXPECT_EQ(loader.WasmPath(local_.GetPath()), local_.GetPath() / "transaction16.wasm");
    EXPECT_EQ(loader.ZkeyPath(local_.GetPath()), local_.GetPath() / "transaction16.zkey");
}

// ============================================================================
// Remote Fallback
// ============================================================================

TEST_F(AssetLoaderTest, FetchesBothFilesFromRemote) {
    CircuitAssetLoader loader(RemoteOnly(), fetcher_);

    std::vector<LoadProgress> events;
    ArtifactsPtr artifacts = loader.Load([&](const LoadProgress& p) { events.push_back(p); });

    EXPECT_EQ(artifacts->wasm, ValidWasm());
    EXPECT_EQ(artifacts->source, REMOTE);
    ASSERT_EQ(fetcher_->requested.size(), 2u);
    EXPECT_EQ(fetcher_->requested[0], std::string(REMOTE) + "/transaction2.wasm");
    EXPECT_EQ(fetcher_->requested[1], std::string(REMOTE) + "/transaction2.zkey");

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().stage, LoadStage::Ready);
    bool sawDownload = false;
    for (const auto& e : events) {
        if (e.stage == LoadStage::Downloading) {
            sawDownload = true;
            EXPECT_LE(e.bytesLoaded, e.totalBytes);
        }
    }
    EXPECT_TRUE(sawDownload);
}

TEST_F(AssetLoaderTest, CachesAfterFirstLoad) {
    CircuitAssetLoader loader(RemoteOnly(), fetcher_);
    ArtifactsPtr first = loader.Load();
    ArtifactsPtr second = loader.Load();
    EXPECT_EQ(first, second);
    EXPECT_EQ(fetcher_->calls.load(), 1);

    loader.Reset();
    EXPECT_FALSE(loader.IsLoaded());
    loader.Load();
    EXPECT_EQ(fetcher_->calls.load(), 2);
}

TEST_F(AssetLoaderTest, HttpErrorNamesBothStatuses) {
    fetcher_->responses[1].httpStatus = 404;
    CircuitAssetLoader loader(RemoteOnly(), fetcher_);
    try {
        loader.Load();
        FAIL() << "Expected ArtifactError";
    } catch (const ArtifactError& e) {
        EXPECT_STREQ(e.what(), "Failed to fetch circuit files: WASM=200, zkey=404");
    }
}

TEST_F(AssetLoaderTest, FailedLoadIsRetried) {
    fetcher_->responses[0].body = {'<', 'h', 't', 'm', 'l'};
    CircuitAssetLoader loader(RemoteOnly(), fetcher_);
    EXPECT_THROW(loader.Load(), ArtifactError);
    EXPECT_FALSE(loader.IsLoaded());

    fetcher_->responses[0].body = ValidWasm();
    EXPECT_NO_THROW(loader.Load());
    EXPECT_EQ(fetcher_->calls.load(), 2);
}

TEST_F(AssetLoaderTest, ConcurrentCallersShareOneFetch) {
    fetcher_->delay = std::chrono::milliseconds(100);
    CircuitAssetLoader loader(RemoteOnly(), fetcher_);

    std::vector<std::future<ArtifactsPtr>> results;
    for (int i = 0; i < 4; ++i) {
        results.push_back(std::async(std::launch::async, [&] { return loader.Load(); }));
    }
    ArtifactsPtr first = results[0].get();
    for (size_t i = 1; i < results.size(); ++i) {
        EXPECT_EQ(results[i].get(), first);
    }
    EXPECT_EQ(fetcher_->calls.load(), 1);
}

TEST_F(AssetLoaderTest, WaitersReceiveProgress) {
    fetcher_->delay = std::chrono::milliseconds(150);
    CircuitAssetLoader loader(RemoteOnly(), fetcher_);

    std::atomic<int> starterEvents{0};
    std::atomic<int> waiterEvents{0};
    std::atomic<bool> waiterSawReady{false};
    auto starter = std::async(std::launch::async, [&] {
        return loader.Load([&](const LoadProgress&) { ++starterEvents; });
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ArtifactsPtr waited = loader.Load([&](const LoadProgress& p) {
        ++waiterEvents;
        if (p.stage == LoadStage::Ready) waiterSawReady = true;
    });

    EXPECT_EQ(starter.get(), waited);
    EXPECT_EQ(fetcher_->calls.load(), 1);
    EXPECT_GT(starterEvents.load(), 0);
    EXPECT_GT(waiterEvents.load(), 0);
    EXPECT_TRUE(waiterSawReady.load());
}

TEST_F(AssetLoaderTest, StarterCancelDoesNotFailWaiter) {
    fetcher_->delay = std::chrono::milliseconds(200);
    CircuitAssetLoader loader(RemoteOnly(), fetcher_);

    CancellationToken cancel;
    auto starter = std::async(std::launch::async, [&] { return loader.Load({}, &cancel); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    std::atomic<int> waiterEvents{0};
    auto waiter = std::async(std::launch::async, [&] {
        return loader.Load([&](const LoadProgress&) { ++waiterEvents; });
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel.Cancel();

    EXPECT_THROW(starter.get(), ArtifactError);
    ArtifactsPtr artifacts;
    ASSERT_NO_THROW(artifacts = waiter.get());
    ASSERT_NE(artifacts, nullptr);
    EXPECT_EQ(artifacts->wasm, ValidWasm());
    EXPECT_TRUE(loader.IsLoaded());
    EXPECT_EQ(fetcher_->calls.load(), 2);
    EXPECT_GT(waiterEvents.load(), 0);
}

TEST_F(AssetLoaderTest, WaiterCancelLeavesSharedLoadRunning) {
    fetcher_->delay = std::chrono::milliseconds(200);
    CircuitAssetLoader loader(RemoteOnly(), fetcher_);

    auto starter = std::async(std::launch::async, [&] { return loader.Load(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    CancellationToken cancel;
    auto waiter = std::async(std::launch::async, [&] { return loader.Load({}, &cancel); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel.Cancel();

    EXPECT_THROW(waiter.get(), ArtifactError);
    EXPECT_NO_THROW(starter.get());
    EXPECT_TRUE(loader.IsLoaded());
    EXPECT_EQ(fetcher_->calls.load(), 1);
}

TEST_F(AssetLoaderTest, SharedFailureReachesWaiters) {
    fetcher_->delay = std::chrono::milliseconds(150);
    fetcher_->responses[1].httpStatus = 503;
    CircuitAssetLoader loader(RemoteOnly(), fetcher_);

    auto starter = std::async(std::launch::async, [&] { return loader.Load(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto waiter = std::async(std::launch::async, [&] { return loader.Load(); });

    EXPECT_THROW(starter.get(), ArtifactError);
    try {
        waiter.get();
        FAIL() << "Expected ArtifactError";
    } catch (const ArtifactError& e) {
        EXPECT_STREQ(e.what(), "Failed to fetch circuit files: WASM=200, zkey=503");
    }
    EXPECT_EQ(fetcher_->calls.load(), 1);
    EXPECT_FALSE(loader.IsLoaded());
}

TEST_F(AssetLoaderTest, CancelledLoadFails) {
    CancellationToken cancel;
    cancel.Cancel();
    CircuitAssetLoader loader(RemoteOnly(), fetcher_);
    EXPECT_THROW(loader.Load({}, &cancel), ArtifactError);
    EXPECT_FALSE(loader.IsLoaded());
}

TEST_F(AssetLoaderTest, CancelDuringDownloadAborts) {
    CancellationToken cancel;
    CircuitAssetLoader loader(RemoteOnly(), fetcher_);
    auto onProgress = [&](const LoadProgress& p) {
        if (p.stage == LoadStage::Downloading && p.bytesLoaded > 0) cancel.Cancel();
    };
    EXPECT_THROW(loader.Load(onProgress, &cancel), ArtifactError);
}

TEST_F(AssetLoaderTest, NoRemoteMeansNotFound) {
    AssetLoaderOptions options = RemoteOnly();
    options.remoteBase.clear();
    CircuitAssetLoader loader(options, fetcher_);
    EXPECT_THROW(loader.Load(), ArtifactError);
    EXPECT_EQ(fetcher_->calls.load(), 0);
}

// ============================================================================
// Persistent Cache
// ============================================================================

TEST_F(AssetLoaderTest, DownloadedFilesPersistToCache) {
    AssetLoaderOptions options = RemoteOnly();
    options.cacheDir = cache_.GetPath() / "circuits";

    {
        CircuitAssetLoader loader(options, fetcher_);
        loader.Load();
    }
    EXPECT_TRUE(std::filesystem::exists(options.cacheDir / "transaction2.wasm"));
    EXPECT_TRUE(std::filesystem::exists(options.cacheDir / "transaction2.version"));

    CircuitAssetLoader reloaded(options, fetcher_);
    ArtifactsPtr artifacts = reloaded.Load();
    EXPECT_EQ(artifacts->source, options.cacheDir.string());
    EXPECT_EQ(artifacts->zkey, ValidZkey());
    EXPECT_EQ(fetcher_->calls.load(), 1);
}

TEST_F(AssetLoaderTest, StaleCacheIsIgnored) {
    AssetLoaderOptions options = RemoteOnly();
    options.cacheDir = cache_.GetPath();
    WriteLocal(cache_.GetPath(), ValidWasm(), Bytes(4, 9));
    ASSERT_TRUE(util::fs::WriteFile(cache_.GetPath() / "transaction2.version", "0"));

    CircuitAssetLoader loader(options, fetcher_);
    ArtifactsPtr artifacts = loader.Load();
    EXPECT_EQ(artifacts->source, REMOTE);
    EXPECT_EQ(fetcher_->calls.load(), 1);
}

} // namespace test
} // namespace spectre
