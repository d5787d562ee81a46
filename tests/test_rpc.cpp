#include "vqeval/core/Errors.hpp"
#include "vqeval/io/EvalClient.hpp"
#include "vqeval/io/EvalServer.hpp"
#include "vqeval/io/Recording.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace vqeval;

namespace {

void record(const std::string& path, const std::vector<cv::Mat>& frames) {
    FrameRecorder rec(path);
    ASSERT_TRUE(rec.isOpen());
    for (const auto& m : frames) {
        const Frame f{
            std::span<const std::uint8_t>(m.data, m.total() * m.elemSize()),
            static_cast<std::uint32_t>(m.cols),
            static_cast<std::uint32_t>(m.rows),
            PixelFormat::BGR24,
            0
        };
        ASSERT_TRUE(rec.write(f));
    }
}

} // namespace

class RpcTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto frames = test::patternVideo(12, 64, 48);
        record(dir.file("ref.vqr"), frames);
        record(dir.file("same.vqr"), frames);
        record(dir.file("noisy.vqr"), test::noisyCopy(frames, 10.0));
        record(dir.file("empty.vqr"), {});

        server = std::make_unique<EvalServer>(0, serverOptions());
        client = std::make_unique<EvalClient>("localhost:" + std::to_string(server->port()));
    }

    void TearDown() override {
        client.reset();
        server->shutdown();
        server.reset();
    }

    virtual EvalServer::Options serverOptions() const {
        EvalServer::Options opt;
        opt.monitorMs = 0;
        opt.workerThreads = 2;
        opt.defaults.targetWidth  = 0;
        opt.defaults.targetHeight = 0;
        return opt;
    }

    EvalClient::Request request(const std::string& ref, const std::string& cand) const {
        EvalClient::Request r;
        r.referencePath = dir.file(ref);
        r.candidatePath = dir.file(cand);
        return r;
    }

    test::TempDir dir;
    std::unique_ptr<EvalServer> server;
    std::unique_ptr<EvalClient> client;
};

TEST_F(RpcTest, UnaryEvaluation) {
    const auto same = client->evaluate(request("ref.vqr", "same.vqr"));
    EXPECT_EQ(same.count, 12u);
    EXPECT_EQ(same.planned, 12u);
    EXPECT_TRUE(std::isinf(same.meanPsnr));
    EXPECT_NEAR(same.meanSsim, 1.0, 1e-12);

    const auto noisy = client->evaluate(request("ref.vqr", "noisy.vqr"));
    EXPECT_EQ(noisy.count, 12u);
    EXPECT_TRUE(std::isfinite(noisy.meanPsnr));
    EXPECT_LT(noisy.meanSsim, 1.0);
}

TEST_F(RpcTest, RequestOverridesSampleCount) {
    auto req = request("ref.vqr", "noisy.vqr");
    req.maxSamples = 4;
    const auto r = client->evaluate(req);
    EXPECT_EQ(r.planned, 4u);
    EXPECT_EQ(r.count, 4u);
}

TEST_F(RpcTest, StreamingDeliversEverySample) {
    std::vector<std::size_t> indices;
    const auto r = client->evaluateStream(request("ref.vqr", "noisy.vqr"),
                                          [&](const MetricSample& s) { indices.push_back(s.index); });
    EXPECT_EQ(r.count, 12u);
    EXPECT_EQ(indices.size(), r.count);
}

TEST_F(RpcTest, EvaluationErrorsKeepTheirKind) {
    try {
        (void)client->evaluate(request("ref.vqr", "missing.mp4"));
        FAIL() << "expected EvalError";
    } catch (const EvalError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SourceUnavailable);
    }

    try {
        (void)client->evaluateStream(request("ref.vqr", "empty.vqr"), {});
        FAIL() << "expected EvalError";
    } catch (const EvalError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EmptySource);
    }
}

TEST_F(RpcTest, BadParametersAreInvalidArgument) {
    auto req = request("ref.vqr", "same.vqr");
    req.ssimWindow = 4;
    EXPECT_THROW((void)client->evaluate(req), std::invalid_argument);
}

TEST(RpcClient, UnreachableServerIsATransportError) {
    EvalClient::Options opt;
    opt.deadlineMs   = 300;
    opt.waitForReady = false;
    EvalClient client("localhost:1", opt);

    EvalClient::Request req;
    req.referencePath = "a.vqr";
    req.candidatePath = "b.vqr";
    EXPECT_THROW((void)client.evaluate(req), std::runtime_error);
}

/* Single evaluation slot and a long, upscaled recording to keep it busy. */
class RpcBusyTest : public RpcTest {
protected:
    void SetUp() override {
        RpcTest::SetUp();
        const auto base = test::patternVideo(4, 32, 32, 50);
        std::vector<cv::Mat> frames;
        for (std::size_t i = 0; i < 400; ++i) frames.push_back(base[i % base.size()]);
        record(dir.file("long.vqr"), frames);
    }

    EvalServer::Options serverOptions() const override {
        EvalServer::Options opt = RpcTest::serverOptions();
        opt.maxConcurrent = 1;
        opt.workerThreads = 0;
        return opt;
    }

    // every pair is upscaled to 1080p, so one call runs for seconds
    EvalClient::Request slowRequest() const {
        auto r = request("long.vqr", "long.vqr");
        r.exhaustive   = true;
        r.targetWidth  = 1920;
        r.targetHeight = 1080;
        return r;
    }

    std::unique_ptr<EvalClient> clientWithDeadline(int ms) const {
        EvalClient::Options opt;
        opt.deadlineMs = ms;
        return std::make_unique<EvalClient>("localhost:" + std::to_string(server->port()), opt);
    }

    // true once a quick call gets through within `budget`
    bool slotFreedWithin(std::chrono::milliseconds budget) {
        const auto until = std::chrono::steady_clock::now() + budget;
        while (std::chrono::steady_clock::now() < until) {
            try {
                (void)client->evaluate(request("ref.vqr", "same.vqr"));
                return true;
            } catch (const std::runtime_error&) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }
        return false;
    }
};

TEST_F(RpcBusyTest, SecondCallIsRejectedWhileSlotIsTaken) {
    auto slowClient = clientWithDeadline(3000);
    std::promise<void> started;
    auto startedFuture = started.get_future();
    bool signalled = false;
    bool slowFailed = false;

    std::thread slow([&] {
        try {
            (void)slowClient->evaluateStream(slowRequest(), [&](const MetricSample&) {
                if (!signalled) { signalled = true; started.set_value(); }
            });
        } catch (const std::runtime_error&) {
            slowFailed = true;   // deadline
        }
    });

    ASSERT_EQ(startedFuture.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    try {
        (void)client->evaluate(request("ref.vqr", "same.vqr"));
        ADD_FAILURE() << "expected the call to be rejected";
    } catch (const EvalError& e) {
        ADD_FAILURE() << "unexpected EvalError: " << e.what();
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("too many evaluations"), std::string::npos) << e.what();
    }

    slow.join();
    EXPECT_TRUE(slowFailed);
    EXPECT_TRUE(slotFreedWithin(std::chrono::seconds(3)));
}

TEST_F(RpcBusyTest, ExpiredDeadlineStopsTheEvaluation) {
    auto slowClient = clientWithDeadline(300);
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW((void)slowClient->evaluate(slowRequest()), std::runtime_error);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(2));

    // the server notices at the next sample and gives the slot back
    EXPECT_TRUE(slotFreedWithin(std::chrono::seconds(3)));
}
