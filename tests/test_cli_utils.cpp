#include "utils.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

/* argv-style array; argv[0] is the program and argv[1] the mode. */
class Argv {
public:
    explicit Argv(std::vector<std::string> args) : store_(std::move(args)) {
        store_.insert(store_.begin(), {"vqeval", "compare"});
        for (auto& s : store_) ptrs_.push_back(s.data());
    }
    int argc() const { return static_cast<int>(ptrs_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> store_;
    std::vector<char*> ptrs_;
};

vqeval::EvalConfig configOf(std::vector<std::string> args) {
    Argv a(std::move(args));
    return config_from_args(a.argc(), a.argv());
}

} // namespace

TEST(CliUtils, ParseSize) {
    int w = -1, h = -1;
    EXPECT_TRUE(parse_size("640x360", w, h));
    EXPECT_EQ(w, 640);
    EXPECT_EQ(h, 360);

    EXPECT_TRUE(parse_size("native", w, h));
    EXPECT_EQ(w, 0);
    EXPECT_EQ(h, 0);

    for (const char* bad : {"", "640", "x360", "640x", "0x360", "64ax36", "640x-1", "axb"}) {
        w = h = 7;
        EXPECT_FALSE(parse_size(bad, w, h)) << bad;
        EXPECT_EQ(w, 7);
    }
}

TEST(CliUtils, DefaultConfig) {
    const auto cfg = configOf({});
    EXPECT_EQ(cfg.maxSamples, 50u);
    EXPECT_EQ(cfg.targetWidth, 640);
    EXPECT_EQ(cfg.targetHeight, 360);
    EXPECT_EQ(cfg.ssimWindow, 7);
    EXPECT_EQ(cfg.workerThreads, 0u);
}

TEST(CliUtils, OptionsMapOntoConfig) {
    const auto cfg = configOf({"--samples=20", "--size=320x180", "--window=11", "--threads=3"});
    EXPECT_EQ(cfg.maxSamples, 20u);
    EXPECT_EQ(cfg.targetWidth, 320);
    EXPECT_EQ(cfg.targetHeight, 180);
    EXPECT_EQ(cfg.ssimWindow, 11);
    EXPECT_EQ(cfg.workerThreads, 3u);

    EXPECT_EQ(configOf({"--samples=20", "--exhaustive"}).maxSamples, 0u);
    EXPECT_TRUE(configOf({"--size=native"}).keepNativeSize());
}

TEST(CliUtils, MalformedOptionsThrow) {
    EXPECT_THROW(configOf({"--samples=abc"}), std::invalid_argument);
    EXPECT_THROW(configOf({"--samples=-1"}), std::invalid_argument);
    EXPECT_THROW(configOf({"--size=big"}), std::invalid_argument);
    EXPECT_THROW(configOf({"--window=8"}), std::invalid_argument);
    EXPECT_THROW(configOf({"--threads=-2"}), std::invalid_argument);
}

TEST(CliUtils, PrintResult) {
    vqeval::EvaluationResult r{};
    r.meanPsnr = std::numeric_limits<double>::infinity();
    r.meanSsim = 1.0;
    r.count    = 50;
    r.planned  = 50;

    std::ostringstream os;
    print_result(os, "clip.mp4", r);
    const std::string out = os.str();
    EXPECT_NE(out.find("=== clip.mp4 ==="), std::string::npos);
    EXPECT_NE(out.find("PSNR: inf dB  (excellent)"), std::string::npos);
    EXPECT_NE(out.find("SSIM: 1.0000  (very high similarity)"), std::string::npos);
    EXPECT_NE(out.find("compared 50/50 pairs"), std::string::npos);
    EXPECT_EQ(out.find("ended early"), std::string::npos);
}

TEST(CliUtils, PrintPartialResult) {
    vqeval::EvaluationResult r{};
    r.meanPsnr = 31.234;
    r.meanSsim = 0.8;
    r.count    = 5;
    r.planned  = 50;

    std::ostringstream os;
    print_result(os, "cand", r);
    const std::string out = os.str();
    EXPECT_NE(out.find("PSNR: 31.23 dB  (good)"), std::string::npos);
    EXPECT_NE(out.find("SSIM: 0.8000  (degraded structure)"), std::string::npos);
    EXPECT_NE(out.find("compared 5/50 pairs (source ended early)"), std::string::npos);
}
