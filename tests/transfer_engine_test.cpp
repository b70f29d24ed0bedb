#include "rdm/transfer_engine.hpp"

#include "fake_http_client.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

using rdm::EngineOptions;
using rdm::Status;
using rdm::TransferEngine;
using rdm::test::FakeBehavior;
using rdm::test::FakeHttpClient;
using rdm::test::makeBody;
using rdm::test::readFile;
using rdm::test::waitFor;

namespace {

constexpr const char* kUrl = "http://example.com/files/data.bin";

class TransferEngineTest : public ::testing::Test {
protected:
    std::unique_ptr<TransferEngine> start(const std::shared_ptr<FakeHttpClient>& client) {
        EngineOptions options;
        options.output_dir = dir_.string();
        options.max_chunk_size = 1024;
        return std::make_unique<TransferEngine>(kUrl, options, client);
    }

    [[nodiscard]] std::filesystem::path destination() const { return dir_.path() / "data.bin"; }

    static FakeBehavior gated() {
        FakeBehavior behavior;
        behavior.gated = true;
        return behavior;
    }

    rdm::test::TempDir dir_;
};

TEST_F(TransferEngineTest, CompletesKnownSizeInBoundedChunks) {
    const auto body = makeBody(5000);
    auto client = std::make_shared<FakeHttpClient>(body);
    auto engine = start(client);

    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Complete; }));

    EXPECT_EQ(engine->bytesTransferred(), 5000);
    EXPECT_EQ(engine->size(), 5000);
    EXPECT_EQ(engine->progress(), 100);
    EXPECT_EQ(client->readSizes(), (std::vector<std::size_t>{1024, 1024, 1024, 1024, 904}));
    EXPECT_EQ(client->requestedOffsets(), (std::vector<std::uint64_t>{0}));
    EXPECT_EQ(readFile(destination()), body);
}

TEST_F(TransferEngineTest, DestinationIsLastUrlSegmentInOutputDir) {
    auto client = std::make_shared<FakeHttpClient>(makeBody(10));
    auto engine = start(client);

    EXPECT_EQ(engine->url(), kUrl);
    EXPECT_EQ(std::filesystem::path{engine->destination()}, destination());
    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Complete; }));
    EXPECT_EQ(engine->getProgress().filename, "data.bin");
}

TEST_F(TransferEngineTest, PauseAfterFirstChunkThenResumeCompletes) {
    const auto body = makeBody(5000);
    auto client = std::make_shared<FakeHttpClient>(body, gated());
    auto engine = start(client);

    client->release(1);
    ASSERT_TRUE(waitFor([&] { return engine->bytesTransferred() == 1024; }));
    engine->pause();

    EXPECT_EQ(engine->status(), Status::Paused);
    EXPECT_EQ(std::filesystem::file_size(destination()), 1024u);
    EXPECT_EQ(engine->progress(), 20);

    engine->resume();
    EXPECT_EQ(engine->status(), Status::Downloading);
    client->release(4);

    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Complete; }));
    EXPECT_EQ(engine->bytesTransferred(), 5000);
    EXPECT_EQ(client->requestedOffsets(), (std::vector<std::uint64_t>{0, 1024}));
    EXPECT_EQ(readFile(destination()), body);
}

TEST_F(TransferEngineTest, ResumingTwiceWithoutProgressKeepsPrefix) {
    const auto body = makeBody(3000);
    auto client = std::make_shared<FakeHttpClient>(body, gated());
    auto engine = start(client);

    client->release(1);
    ASSERT_TRUE(waitFor([&] { return engine->bytesTransferred() == 1024; }));
    engine->pause();
    engine->resume();
    engine->pause();
    engine->resume();
    engine->pause();

    EXPECT_EQ(engine->bytesTransferred(), 1024);
    engine->shutdown();
    EXPECT_EQ(readFile(destination()), body.substr(0, 1024));

    engine->resume();
    client->release(10);
    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Complete; }));
    EXPECT_EQ(readFile(destination()), body);
}

TEST_F(TransferEngineTest, CounterIsMonotonicAcrossPauseResumeCycles) {
    const auto body = makeBody(5000);
    auto client = std::make_shared<FakeHttpClient>(body, gated());
    auto engine = start(client);

    std::atomic<bool> sampling{true};
    std::vector<std::int64_t> samples;
    std::thread sampler([&] {
        while (sampling.load()) {
            samples.push_back(engine->bytesTransferred());
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    });

    for (std::int64_t step = 1; step <= 4; ++step) {
        client->release(1);
        ASSERT_TRUE(waitFor([&] { return engine->bytesTransferred() == step * 1024; }));
        engine->pause();
        engine->resume();
    }
    client->release(10);
    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Complete; }));

    sampling.store(false);
    sampler.join();

    EXPECT_TRUE(std::is_sorted(samples.begin(), samples.end()));
    EXPECT_LE(*std::max_element(samples.begin(), samples.end()), 5000);
    EXPECT_EQ(readFile(destination()), body);
}

TEST_F(TransferEngineTest, CancelWritesNothingAfterTheRequest) {
    auto client = std::make_shared<FakeHttpClient>(makeBody(8000), gated());
    auto engine = start(client);

    client->release(2);
    ASSERT_TRUE(waitFor([&] { return engine->bytesTransferred() == 2048; }));
    engine->cancel();
    client->release(10);
    engine->shutdown();

    EXPECT_EQ(engine->status(), Status::Cancelled);
    EXPECT_EQ(engine->bytesTransferred(), 2048);
    // Partial file is left for the caller to clean up.
    EXPECT_EQ(std::filesystem::file_size(destination()), 2048u);
}

TEST_F(TransferEngineTest, CancelWhilePausedIsTerminal) {
    auto client = std::make_shared<FakeHttpClient>(makeBody(4000), gated());
    auto engine = start(client);

    client->release(1);
    ASSERT_TRUE(waitFor([&] { return engine->bytesTransferred() == 1024; }));
    engine->pause();
    engine->cancel();
    EXPECT_EQ(engine->status(), Status::Cancelled);

    engine->resume();
    engine->pause();
    EXPECT_EQ(engine->status(), Status::Cancelled);
    EXPECT_EQ(client->requestedOffsets().size(), 1u);
}

TEST_F(TransferEngineTest, FaultMidTransferKeepsWrittenPrefix) {
    const auto body = makeBody(5000);
    FakeBehavior behavior;
    behavior.fail_at = 3000;
    auto client = std::make_shared<FakeHttpClient>(body, behavior);
    auto engine = start(client);

    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Error; }));

    EXPECT_EQ(engine->bytesTransferred(), 3000);
    EXPECT_EQ(engine->progress(), 60);
    EXPECT_EQ(readFile(destination()), body.substr(0, 3000));
    EXPECT_NE(engine->getProgress().error_message.find("Connection reset"), std::string::npos);
}

TEST_F(TransferEngineTest, ResumeFromErrorRetriesFromWrittenOffset) {
    const auto body = makeBody(5000);
    FakeBehavior behavior;
    behavior.fail_at = 2500;
    auto client = std::make_shared<FakeHttpClient>(body, behavior);
    auto engine = start(client);

    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Error; }));
    engine->resume();

    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Complete; }));
    EXPECT_TRUE(engine->getProgress().error_message.empty());
    EXPECT_EQ(client->requestedOffsets(), (std::vector<std::uint64_t>{0, 2500}));
    EXPECT_EQ(readFile(destination()), body);
}

TEST_F(TransferEngineTest, FailedRequestEndsInErrorWithoutThrowing) {
    FakeBehavior behavior;
    behavior.fail_open = true;
    auto client = std::make_shared<FakeHttpClient>(makeBody(100), behavior);
    auto engine = start(client);

    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Error; }));
    EXPECT_EQ(engine->bytesTransferred(), 0);
    EXPECT_EQ(engine->size(), rdm::kUnknownSize);
    EXPECT_EQ(engine->progress(), rdm::kUnknownProgress);
    EXPECT_FALSE(std::filesystem::exists(destination()));
}

TEST_F(TransferEngineTest, TruncatedBodyIsAnError) {
    FakeBehavior behavior;
    behavior.truncate_at = 2500;
    auto client = std::make_shared<FakeHttpClient>(makeBody(5000), behavior);
    auto engine = start(client);

    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Error; }));
    EXPECT_EQ(engine->bytesTransferred(), 2500);
    EXPECT_EQ(engine->size(), 5000);
    EXPECT_NE(engine->getProgress().error_message.find("2500 of 5000"), std::string::npos);
}

TEST_F(TransferEngineTest, UnknownSizeReportsSentinelUntilComplete) {
    const auto body = makeBody(2100);
    FakeBehavior behavior = gated();
    behavior.send_content_length = false;
    behavior.send_content_range = false;
    auto client = std::make_shared<FakeHttpClient>(body, behavior);
    auto engine = start(client);

    EXPECT_EQ(engine->size(), rdm::kUnknownSize);
    EXPECT_EQ(engine->progress(), rdm::kUnknownProgress);

    client->release(1);
    ASSERT_TRUE(waitFor([&] { return engine->bytesTransferred() == 1024; }));
    EXPECT_EQ(engine->progress(), rdm::kUnknownProgress);

    client->release(10);
    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Complete; }));
    EXPECT_EQ(engine->size(), 2100);
    EXPECT_EQ(engine->progress(), 100);
    EXPECT_EQ(readFile(destination()), body);
}

TEST_F(TransferEngineTest, ServerIgnoringRangeDoesNotRewritePrefix) {
    const auto body = makeBody(5000);
    FakeBehavior behavior = gated();
    behavior.honor_range = false;
    auto client = std::make_shared<FakeHttpClient>(body, behavior);
    auto engine = start(client);

    client->release(2);
    ASSERT_TRUE(waitFor([&] { return engine->bytesTransferred() == 2048; }));
    engine->pause();
    engine->resume();
    client->release(100);

    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Complete; }));
    EXPECT_EQ(engine->size(), 5000);
    EXPECT_EQ(client->requestedOffsets(), (std::vector<std::uint64_t>{0, 2048}));
    EXPECT_EQ(readFile(destination()), body);
}

TEST_F(TransferEngineTest, CallsOnTerminalStateAreIgnored) {
    auto client = std::make_shared<FakeHttpClient>(makeBody(1500));
    auto engine = start(client);
    ASSERT_TRUE(waitFor([&] { return engine->status() == Status::Complete; }));

    engine->pause();
    engine->cancel();
    engine->resume();

    EXPECT_EQ(engine->status(), Status::Complete);
    EXPECT_EQ(client->requestedOffsets().size(), 1u);
}

TEST_F(TransferEngineTest, DestructionStopsABlockedTransfer) {
    auto client = std::make_shared<FakeHttpClient>(makeBody(5000), gated());
    auto engine = start(client);

    client->release(1);
    ASSERT_TRUE(waitFor([&] { return engine->bytesTransferred() == 1024; }));
    engine.reset();

    EXPECT_EQ(std::filesystem::file_size(destination()), 1024u);
}

} // namespace
