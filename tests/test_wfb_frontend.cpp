#include <gtest/gtest.h>

#include <cmath>

#include <algorithm>
#include <vector>

#include "internal/frontends/wfb_frontend.hpp"
#include "internal/utils/logging.hpp"
#include "internal/utils/numeric_utils.hpp"

using namespace vha;
using namespace vha::frontend;

namespace {

FrontendConfig makeConfig(int nbands = 17) {
    FrontendConfig config;
    config.nbands = nbands;
    return config;
}

}  // namespace

TEST(SampleRingBufferTest, StartsZeroedAndKeepsNewestSamples) {
    SampleRingBuffer buffer(3);
    EXPECT_EQ(buffer.capacity(), 3u);
    EXPECT_DOUBLE_EQ(buffer[0], 0.0);
    EXPECT_DOUBLE_EQ(buffer[2], 0.0);

    for (double x : {1.0, 2.0, 3.0, 4.0}) {
        buffer.push(x);
    }
    // 最旧在前
    EXPECT_DOUBLE_EQ(buffer[0], 2.0);
    EXPECT_DOUBLE_EQ(buffer[1], 3.0);
    EXPECT_DOUBLE_EQ(buffer[2], 4.0);
}

TEST(SampleRingBufferTest, ZeroCapacityThrows) {
    EXPECT_THROW(SampleRingBuffer(0), ConfigError);
}

TEST(WfbHelpersTest, WindowPeakIsOne) {
    auto window = calculateWindow(32);
    ASSERT_EQ(window.size(), 32u);
    EXPECT_NEAR(*std::max_element(window.begin(), window.end()), 1.0, 1e-12);
    EXPECT_NEAR(window.front(), 0.0, 1e-12);
    EXPECT_NEAR(window.back(), 0.0, 1e-12);
}

TEST(WfbHelpersTest, EdgeBandsAreCalibratedDown) {
    auto window = calculateWindow(32);
    auto calibration = calculateCalibrationDb(window, 17, 100.0);
    ASSERT_EQ(calibration.size(), 17u);
    EXPECT_NEAR(calibration.front(), calibration[1] - kEdgeBandAdjustmentDb, 1e-12);
    EXPECT_NEAR(calibration.back(), calibration[1] - kEdgeBandAdjustmentDb, 1e-12);
    for (size_t b = 2; b + 1 < calibration.size(); ++b) {
        EXPECT_DOUBLE_EQ(calibration[b], calibration[1]);
    }
}

TEST(WfbHelpersTest, CenterFrequenciesSpanDcToNyquist) {
    auto freqs = calculateCenterFrequencies(0.5, 32, 16000.0);
    ASSERT_EQ(freqs.size(), 17u);
    EXPECT_NEAR(freqs.front(), 0.0, 1e-9);
    EXPECT_NEAR(freqs.back(), 8000.0, 1e-6);
    for (size_t k = 1; k < freqs.size(); ++k) {
        EXPECT_GT(freqs[k], freqs[k - 1]);
    }
}

TEST(WfbHelpersTest, WeightsArePalindromicAroundZeroCenter) {
    Matrix synthesis = calculateSynthesisMatrix(17, 32);
    EXPECT_EQ(synthesis.rows, 16u);
    EXPECT_EQ(synthesis.cols, 17u);

    std::vector<double> gains(17);
    for (size_t b = 0; b < gains.size(); ++b) {
        gains[b] = 0.1 + 0.05 * static_cast<double>(b);
    }
    auto weights = buildWeights(synthesis, gains);
    ASSERT_EQ(weights.size(), 32u);
    EXPECT_DOUBLE_EQ(weights[16], 0.0);
    for (size_t i = 1; i < 16; ++i) {
        EXPECT_DOUBLE_EQ(weights[16 + i], weights[15 - i]) << "i=" << i;
    }
}

TEST(WfbHelpersTest, UnityGainsGiveSingleTap) {
    Matrix synthesis = calculateSynthesisMatrix(17, 32);
    auto weights = buildWeights(synthesis, std::vector<double>(17, 1.0));
    // 单位增益: 只剩第 nfft/2 - 1 个全通级的输出
    for (size_t i = 0; i < weights.size(); ++i) {
        double expected = i == 15 ? 1.0 : 0.0;
        EXPECT_NEAR(weights[i], expected, 1e-12) << "i=" << i;
    }
}

TEST(WfbHelpersTest, WeightLengthMismatchThrows) {
    Matrix synthesis = calculateSynthesisMatrix(17, 32);
    EXPECT_THROW(buildWeights(synthesis, std::vector<double>(16, 1.0)), InputValidationError);
}

TEST(WfbHelpersTest, DecibelGainsToLinear) {
    auto lin = utils::db2lin({0.0, -6.0, -12.0, -18.0});
    EXPECT_NEAR(lin[1], 0.50119, 1e-5);
    EXPECT_NEAR(lin[3], 0.12589, 1e-5);
}

// =============================================================================
// WfbFrontend
// =============================================================================

class WfbFrontendTest : public ::testing::Test {
protected:
    void SetUp() override {
        log::setVerbose(false);
    }
};

TEST_F(WfbFrontendTest, ConstructionSizesState) {
    WfbFrontend frontend(makeConfig());
    EXPECT_EQ(frontend.getNbands(), 17);
    EXPECT_EQ(frontend.getNfft(), 32);
    EXPECT_EQ(frontend.getBufferSize(), 24);
    EXPECT_EQ(frontend.getTaps().rows, 24u);
    EXPECT_EQ(frontend.getTaps().cols, 32u);
    EXPECT_EQ(frontend.getTemp().size(), 32u);
    EXPECT_EQ(frontend.getWeights().size(), 32u);
    EXPECT_EQ(frontend.getCalibrationDb().size(), 17u);
    EXPECT_EQ(frontend.getSynthesisMatrix().rows, 16u);
    EXPECT_EQ(frontend.getSampleBuffer().capacity(), 24u);
    EXPECT_EQ(frontend.getCenterFrequencies().size(), 17u);
}

TEST_F(WfbFrontendTest, TooFewBandsRejected) {
    EXPECT_THROW(WfbFrontend(makeConfig(1)), ConfigError);
}

TEST_F(WfbFrontendTest, BadAllpassCoefficientRejected) {
    auto config = makeConfig();
    config.apcoefficient = 1.0;
    EXPECT_THROW(WfbFrontend frontend(config), ConfigError);
}

TEST_F(WfbFrontendTest, SilenceHitsLowerBound) {
    WfbFrontend frontend(makeConfig());
    auto power = frontend.processFrontend(std::vector<double>(24, 0.0));
    ASSERT_EQ(power.size(), 17u);
    for (double p : power) {
        EXPECT_DOUBLE_EQ(p, 30.0);
    }
}

TEST_F(WfbFrontendTest, LoudToneExceedsLowerBound) {
    WfbFrontend frontend(makeConfig());
    const double pi = std::acos(-1.0);
    std::vector<double> power;
    int n = 0;
    for (int block = 0; block < 20; ++block) {
        std::vector<double> samples(24);
        for (double& s : samples) {
            s = 0.5 * std::sin(2.0 * pi * 1000.0 * n++ / 16000.0);
        }
        power = frontend.processFrontend(samples);
    }
    EXPECT_GT(*std::max_element(power.begin(), power.end()), 60.0);
    for (double p : power) {
        EXPECT_TRUE(std::isfinite(p));
    }
}

TEST_F(WfbFrontendTest, QuietToneKeepsLevelBelowLowerBound) {
    WfbFrontend loud(makeConfig());
    WfbFrontend quiet(makeConfig());
    const double pi = std::acos(-1.0);
    std::vector<double> loud_power;
    std::vector<double> quiet_power;
    int n = 0;
    for (int block = 0; block < 20; ++block) {
        std::vector<double> samples(24);
        for (double& s : samples) {
            s = std::sin(2.0 * pi * 1000.0 * n++ / 16000.0);
        }
        std::vector<double> loud_samples(samples);
        std::vector<double> quiet_samples(samples);
        for (size_t i = 0; i < samples.size(); ++i) {
            loud_samples[i] *= 1e-1;
            quiet_samples[i] *= 1e-4;
        }
        loud_power = loud.processFrontend(loud_samples);
        quiet_power = quiet.processFrontend(quiet_samples);
    }

    // 幅度缩小 1000 倍, 每个频带恰好低 60 dB, 不被下限截断
    EXPECT_LT(*std::max_element(quiet_power.begin(), quiet_power.end()), 30.0);
    for (size_t b = 0; b < quiet_power.size(); ++b) {
        ASSERT_TRUE(std::isfinite(quiet_power[b]));
        EXPECT_NEAR(quiet_power[b], loud_power[b] - 60.0, 1e-6) << "band " << b;
    }
}

TEST_F(WfbFrontendTest, SampleRateMismatchThrows) {
    WfbFrontend frontend(makeConfig());
    AudioBlock block = AudioBlock::fromSamples(std::vector<double>(24, 0.1), 8000.0);
    EXPECT_THROW(frontend.processFrontend(block), InputValidationError);
}

TEST_F(WfbFrontendTest, EmptyBlockThrows) {
    WfbFrontend frontend(makeConfig());
    EXPECT_THROW(frontend.processFrontend(std::vector<double>()), InputValidationError);
}

TEST_F(WfbFrontendTest, UpdateWeightsKeepsMirror) {
    WfbFrontend frontend(makeConfig());
    std::vector<double> gains(17, 0.5);
    gains[3] = 0.25;
    gains[10] = 1.0;
    frontend.updateWeights(gains);
    const auto& weights = frontend.getWeights();
    EXPECT_DOUBLE_EQ(weights[16], 0.0);
    for (size_t i = 1; i < 16; ++i) {
        EXPECT_DOUBLE_EQ(weights[16 + i], weights[15 - i]);
    }
    EXPECT_THROW(frontend.updateWeights(std::vector<double>(3, 1.0)), InputValidationError);
}

TEST_F(WfbFrontendTest, UnitySynthesisIsAllpassDelayed) {
    WfbFrontend frontend(makeConfig());
    std::vector<double> samples(24);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = std::sin(0.3 * static_cast<double>(i));
    }
    frontend.processFrontend(samples);
    AudioBlock out = frontend.synthesize();
    ASSERT_EQ(out.size(), 24u);
    EXPECT_DOUBLE_EQ(out.sample_rate, 16000.0);

    // 初始权重只选中第 nfft/2 = 16 个全通级
    const Matrix& taps = frontend.getTaps();
    for (size_t n = 0; n < out.size(); ++n) {
        EXPECT_NEAR(out.samples[n], taps(n, 16), 1e-12);
    }

    // 单位增益权重选中第 15 个全通级
    frontend.updateWeights(std::vector<double>(17, 1.0));
    out = frontend.synthesize();
    for (size_t n = 0; n < out.size(); ++n) {
        EXPECT_NEAR(out.samples[n], taps(n, 15), 1e-12);
    }
}

TEST_F(WfbFrontendTest, InitialWeightsAreCenterImpulse) {
    WfbFrontend frontend(makeConfig());
    const auto& weights = frontend.getWeights();
    ASSERT_EQ(weights.size(), 32u);
    for (size_t k = 0; k < weights.size(); ++k) {
        EXPECT_DOUBLE_EQ(weights[k], k == 16 ? 1.0 : 0.0) << "k=" << k;
    }
}

TEST_F(WfbFrontendTest, SynthesizeBlockMatchesMemberSynthesis) {
    WfbFrontend frontend(makeConfig());
    std::vector<double> samples(24, 0.2);
    frontend.processFrontend(samples);

    std::vector<double> gains(17, 0.3);
    frontend.updateWeights(gains);
    AudioBlock expected = frontend.synthesize();
    auto block = synthesizeBlock(frontend.getTaps(), frontend.getSynthesisMatrix(), gains, 24);
    ASSERT_EQ(block.size(), expected.size());
    for (size_t n = 0; n < block.size(); ++n) {
        EXPECT_NEAR(block[n], expected.samples[n], 1e-12);
    }
}
