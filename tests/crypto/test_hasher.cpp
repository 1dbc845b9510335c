// SPECTRE - Hasher Handle Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include <gtest/gtest.h>
#include "spectre/crypto/hasher.h"
#include "spectre/prover/errors.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace spectre {
namespace test {

namespace {

/// Produces wrong digests so the self-test rejects it
class BrokenHasher : public IPoseidonHasher {
public:
    const char* Name() const override { return "broken"; }
    FieldElement Hash(const std::vector<FieldElement>&) const override {
        return FieldElement::Zero();
    }
};

} // namespace

TEST(HasherHandleTest, InitializesOnce) {
    std::atomic<int> created{0};
    HasherHandle handle([&created]() {
        ++created;
        return std::make_unique<NativePoseidonHasher>();
    });

    EXPECT_FALSE(handle.IsReady());
    auto first = handle.Get();
    auto second = handle.Get();
    EXPECT_TRUE(handle.IsReady());
    EXPECT_EQ(first, second);
    EXPECT_EQ(created.load(), 1);
}

TEST(HasherHandleTest, ConcurrentCallersShareInitialization) {
    std::atomic<int> created{0};
    HasherHandle handle([&created]() {
        ++created;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return std::make_unique<NativePoseidonHasher>();
    });

    std::vector<std::thread> threads;
    std::vector<HasherHandle::HasherPtr> results(8);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&handle, &results, i]() { results[i] = handle.Get(); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(created.load(), 1);
    for (const auto& r : results) {
        EXPECT_EQ(r, results[0]);
    }
}

TEST(HasherHandleTest, FailureIsRetried) {
    std::atomic<int> attempts{0};
    HasherHandle handle([&attempts]() -> std::unique_ptr<IPoseidonHasher> {
        if (attempts++ == 0) {
            return std::make_unique<BrokenHasher>();
        }
        return std::make_unique<NativePoseidonHasher>();
    });

    EXPECT_THROW(handle.Get(), HashInitError);
    EXPECT_FALSE(handle.IsReady());

    auto hasher = handle.Get();
    ASSERT_TRUE(hasher);
    EXPECT_STREQ(hasher->Name(), "native");
    EXPECT_EQ(attempts.load(), 2);
}

TEST(HasherHandleTest, FactoryExceptionBecomesHashInitError) {
    HasherHandle handle([]() -> std::unique_ptr<IPoseidonHasher> {
        throw std::runtime_error("library missing");
    });
    try {
        handle.Get();
        FAIL() << "expected HashInitError";
    } catch (const HashInitError& e) {
        EXPECT_EQ(e.GetStage(), ErrorStage::HashInit);
        EXPECT_NE(std::string(e.what()).find("library missing"), std::string::npos);
    }
}

TEST(HasherHandleTest, FromInstanceIsReadyImmediately) {
    auto handle = HasherHandle::FromInstance(std::make_shared<NativePoseidonHasher>());
    EXPECT_TRUE(handle->IsReady());
    EXPECT_STREQ(handle->Get()->Name(), "native");
}

TEST(HasherHandleTest, InitAsyncResolves) {
    auto handle = HasherHandle::ForBackend(HasherBackend::Bignum);
    auto future = handle->InitAsync();
    auto hasher = future.get();
    ASSERT_TRUE(hasher);
    EXPECT_STREQ(hasher->Name(), "bignum");
}

TEST(HasherHandleTest, InitAsyncMarksReady) {
    std::atomic<int> created{0};
    HasherHandle handle([&created]() {
        ++created;
        return std::make_unique<NativePoseidonHasher>();
    });
    EXPECT_FALSE(handle.IsReady());

    HasherHandle::HasherPtr hasher = handle.InitAsync().get();
    ASSERT_TRUE(hasher);
    EXPECT_TRUE(handle.IsReady());
    EXPECT_EQ(handle.Get(), hasher);
    EXPECT_EQ(handle.InitAsync().get(), hasher);
    EXPECT_EQ(created.load(), 1);
}

TEST(HasherHandleTest, FailedInitAsyncStaysNotReady) {
    HasherHandle handle([]() -> std::unique_ptr<IPoseidonHasher> {
        return std::make_unique<BrokenHasher>();
    });
    auto future = handle.InitAsync();
    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_FALSE(handle.IsReady());
}

} // namespace test
} // namespace spectre
