#include <gtest/gtest.h>

#include <cmath>

#include <algorithm>
#include <limits>
#include <memory>
#include <vector>

#include "internal/backends/sem/sem_backend.hpp"
#include "internal/backends/sem/sem_types.hpp"
#include "internal/backends/spm_backend.hpp"
#include "internal/utils/logging.hpp"

using namespace vha;
using namespace vha::sem;

namespace {

constexpr double kFloor12Db = 0.292054;

// 1.5 ms 块长对应的算法采样率 (1/ms)
constexpr double kFs = 1.0 / 1.5;

SemBackendConfig silentBandConfig(SmoothingMode smoothing = SmoothingMode::XI_SMOOTH) {
    SemBackendConfig config;
    config.tau_speech_ms = 5.0;
    config.tau_noise_ms = 700.0;
    config.tau_xnr_ms = 200.0;
    config.speech_prior_mean = 80.0;
    config.noise_prior_mean = 80.0;
    config.gain_threshold_db = 12.0;
    config.switch_threshold_db = 0.0;
    config.smoothing = smoothing;
    return config;
}

}  // namespace

// =============================================================================
// 参数
// =============================================================================

TEST(SemParametersTest, GainThresholdIsRecalculated) {
    GainParameters gain(1.0, 12.0);
    EXPECT_DOUBLE_EQ(gain.slope_db, 1.0);
    EXPECT_DOUBLE_EQ(gain.threshold_db, 3.0);
    EXPECT_NEAR(gain.threshold_lin, kFloor12Db, 1e-6);
    // 由线性下限反推的门限
    EXPECT_NEAR(-20.0 * std::log10(gain.threshold_lin), 10.6907, 1e-3);
}

TEST(SemParametersTest, GainThresholdMustBePositive) {
    EXPECT_THROW(GainParameters(1.0, 0.0), ConfigError);
    EXPECT_THROW(GainParameters(1.0, -3.0), ConfigError);
}

TEST(SemParametersTest, SourceParametersHoldForgettingFactor) {
    SourceParameters source(5.0, kFs);
    EXPECT_GT(source.lambda, 0.0);
    EXPECT_LT(source.lambda, 1.0);
    EXPECT_NEAR(source.fc, 2.3 / (2.0 * std::acos(-1.0) * 5.0e-3), 1e-9);
    EXPECT_THROW(SourceParameters(0.0, kFs), ConfigError);
    EXPECT_THROW(SourceParameters(5.0, 0.0), ConfigError);
}

TEST(SemParametersTest, InferenceIterationsMustBePositive) {
    EXPECT_THROW(InferenceParameters(0), ConfigError);
    InferenceParameters inference(3, false, true);
    EXPECT_EQ(inference.iterations, 3);
    EXPECT_FALSE(inference.autostart);
    EXPECT_TRUE(inference.free_energy);
}

TEST(SemParametersTest, SpeechMustBeFasterThanNoise) {
    auto config = silentBandConfig();
    config.tau_speech_ms = 700.0;
    config.tau_noise_ms = 5.0;
    EXPECT_THROW(SemParameters::fromConfig(config, kFs, 2), ConfigError);
    EXPECT_THROW(SemBackend(config, kFs, 2), ConfigError);

    EXPECT_THROW(ModuleParameters(SourceParameters(10.0, kFs), SourceParameters(10.0, kFs),
                                  SourceParameters(200.0, kFs), GainParameters(1.0, 12.0),
                                  VadParameters(1.0, 4.0), kFs, 2),
                 ConfigError);
}

TEST(SemParametersTest, BandCountMustBePositive) {
    EXPECT_THROW(SemParameters::fromConfig(silentBandConfig(), kFs, 0), ConfigError);
}

// =============================================================================
// 状态
// =============================================================================

TEST(SemStatesTest, BernoulliStateKeepsComplement) {
    BernoulliState state(3, {0.3, 0.7}, std::vector<double>(3, 1.0));
    for (int b = 0; b < 3; ++b) {
        EXPECT_NEAR(state.p[b] + state.q[b], 1.0, 1e-12);
        EXPECT_DOUBLE_EQ(state.p[b], 0.7);
    }
    updateBernoulliState(state, 0.25, 1);
    EXPECT_DOUBLE_EQ(state.p[1], 0.25);
    EXPECT_NEAR(state.p[1] + state.q[1], 1.0, 1e-12);
    EXPECT_THROW(updateBernoulliState(state, 1.5, 1), InputValidationError);
    EXPECT_THROW(updateBernoulliState(state, 0.5, 3), InputValidationError);
}

TEST(SemStatesTest, InvalidPriorsRejected) {
    EXPECT_THROW(BernoulliState(2, {0.6, 0.6}, std::vector<double>(2, 1.0)), ConfigError);
    EXPECT_THROW(BernoulliState(2, {1.0}, std::vector<double>(2, 1.0)), ConfigError);
    EXPECT_THROW(BernoulliState(2, {0.5, 0.5}, std::vector<double>(2, 0.0)), ConfigError);
    EXPECT_THROW(BernoulliState(2, {0.5, 0.5}, std::vector<double>(3, 1.0)), ConfigError);
    EXPECT_THROW(SourceState(2, {0.0, 0.0}, {1.0, -1.0}), ConfigError);
    EXPECT_THROW(SourceState(2, {0.0}, {1.0, 1.0}), ConfigError);
}

TEST(SemStatesTest, InitialStateFromPriors) {
    auto params = SemParameters::fromConfig(silentBandConfig(), kFs, 2);
    SemStates states(params, 80.0, 1.0, 70.0, 2.0);
    EXPECT_DOUBLE_EQ(states.speech.mean(1), 80.0);
    EXPECT_DOUBLE_EQ(states.noise.precision(0), 2.0);
    EXPECT_DOUBLE_EQ(states.xi_smooth.mean(0), 0.0);
    const double lambda = params.modules.speech.lambda;
    const double expected = (1.0 - lambda) / (lambda * lambda);
    EXPECT_NEAR(states.speech.transitionPrecision(0), expected, 1e-9 * expected);
    for (int b = 0; b < 2; ++b) {
        EXPECT_DOUBLE_EQ(states.gain.p[b], 0.5);
        EXPECT_DOUBLE_EQ(states.vad.q[b], 0.5);
        EXPECT_DOUBLE_EQ(states.gain.auxiliary[b], 1.0);
        EXPECT_DOUBLE_EQ(states.vad.auxiliary[b], 1.0);
        EXPECT_DOUBLE_EQ(states.gain.wiener_gain_spectral_floor[b], 0.0);
    }
}

TEST(SemStatesTest, SpectralFloorIsIdempotent) {
    std::vector<double> gains = {0.05, 0.3, 0.292054, 0.9, 1.0};
    auto once = wienerGainSpectralFloor(gains, kFloor12Db);
    auto twice = wienerGainSpectralFloor(once, kFloor12Db);
    EXPECT_EQ(once, twice);
    EXPECT_DOUBLE_EQ(once[0], kFloor12Db);
    EXPECT_DOUBLE_EQ(once[3], 0.9);
}

// =============================================================================
// SemBackend
// =============================================================================

class SemBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        log::setVerbose(false);
    }
};

TEST_F(SemBackendTest, SilentBandIsAttenuatedToFloor) {
    for (SmoothingMode mode : {SmoothingMode::XI_SMOOTH, SmoothingMode::NONE}) {
        SemBackend backend(silentBandConfig(mode), kFs, 2);
        auto output = backend.processBackend(std::vector<double>(50, -40.0), 0);

        ASSERT_EQ(output.gains.size(), 50u);
        for (double g : output.gains) {
            EXPECT_NEAR(g, kFloor12Db, 1e-6) << smoothingModeToString(mode);
        }
        for (double p : output.inference.vad_probability) {
            EXPECT_LT(p, 0.5) << smoothingModeToString(mode);
        }
        EXPECT_LT(output.inference.gain_probability.back(), 0.5);
    }
}

TEST_F(SemBackendTest, GainsStayWithinFloorAndOne) {
    SemBackend backend(silentBandConfig(), kFs, 2);
    std::vector<double> series;
    for (int t = 0; t < 200; ++t) {
        series.push_back(t % 40 < 20 ? 40.0 : 95.0);
    }
    auto output = backend.processBackend(series, 1);
    for (double g : output.gains) {
        EXPECT_GE(g, backend.getGainThresholdLin());
        EXPECT_LE(g, 1.0);
    }
    for (double p : output.inference.vad_probability) {
        EXPECT_GE(p, 0.0);
        EXPECT_LE(p, 1.0);
    }
}

TEST_F(SemBackendTest, PosteriorsAreWrittenBack) {
    SemBackend backend(silentBandConfig(), kFs, 2);
    auto output = backend.processBackend(std::vector<double>(20, 60.0), 1);
    const auto& q = output.inference.final_posteriors;
    const auto& states = backend.getStates();

    EXPECT_DOUBLE_EQ(states.speech.mean(1), q.speech.mean);
    EXPECT_DOUBLE_EQ(states.noise.precision(1), q.noise.precision);
    EXPECT_DOUBLE_EQ(states.xi_smooth.mean(1), q.xi_smooth.mean);
    EXPECT_DOUBLE_EQ(states.gain.p[1], q.gain_probability);
    EXPECT_DOUBLE_EQ(states.vad.p[1], q.vad_probability);
    EXPECT_NEAR(states.vad.p[1] + states.vad.q[1], 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(states.gain.auxiliary[1], q.zeta_gain);
    EXPECT_DOUBLE_EQ(states.gain.wiener_gain_spectral_floor[1], output.gains.back());

    // 频带 0 未被处理
    EXPECT_DOUBLE_EQ(states.speech.mean(0), 80.0);
    EXPECT_DOUBLE_EQ(states.gain.wiener_gain_spectral_floor[0], 0.0);
}

TEST_F(SemBackendTest, InputValidation) {
    SemBackend backend(silentBandConfig(), kFs, 2);
    EXPECT_THROW(backend.processBackend({}, 0), InputValidationError);
    EXPECT_THROW(backend.processBackend({50.0, std::nan("")}, 0), InputValidationError);
    EXPECT_THROW(backend.processBackend({50.0}, 2), InputValidationError);
    EXPECT_THROW(backend.processBackend({50.0}, -1), InputValidationError);
}

TEST_F(SemBackendTest, LazyInferenceStillProducesResults) {
    auto config = silentBandConfig();
    config.autostart = false;
    SemBackend backend(config, kFs, 2);

    auto inference = backend.prepareInference(std::vector<double>(10, 50.0), 0);
    EXPECT_FALSE(inference->isComplete());
    EXPECT_EQ(inference->result().size(), 10u);
    EXPECT_TRUE(inference->isComplete());

    auto output = backend.processBackend(std::vector<double>(10, 50.0), 0);
    EXPECT_EQ(output.gains.size(), 10u);
}

TEST_F(SemBackendTest, AutostartRunsPreparedInference) {
    auto config = silentBandConfig();
    config.autostart = true;
    SemBackend eager(config, kFs, 2);
    EXPECT_TRUE(eager.prepareInference(std::vector<double>(10, 50.0), 0)->isComplete());

    config.autostart = false;
    SemBackend lazy(config, kFs, 2);
    EXPECT_FALSE(lazy.prepareInference(std::vector<double>(10, 50.0), 0)->isComplete());

    // processBackend 的结果不受 autostart 影响
    std::vector<double> series = {50.0, 52.0, 70.0, 71.0, 49.0};
    auto eager_out = eager.processBackend(series, 1);
    auto lazy_out = lazy.processBackend(series, 1);
    ASSERT_EQ(eager_out.gains.size(), lazy_out.gains.size());
    for (size_t t = 0; t < series.size(); ++t) {
        EXPECT_DOUBLE_EQ(eager_out.gains[t], lazy_out.gains[t]);
    }
}

TEST_F(SemBackendTest, FreeEnergyRecordedPerStep) {
    auto config = silentBandConfig();
    config.free_energy = true;
    SemBackend backend(config, kFs, 2);
    auto output = backend.processBackend(std::vector<double>(15, 55.0), 0);
    ASSERT_EQ(output.inference.free_energy.size(), 15u);
    for (double f : output.inference.free_energy) {
        EXPECT_TRUE(std::isfinite(f));
    }

    SemBackend quiet(silentBandConfig(), kFs, 2);
    EXPECT_TRUE(quiet.processBackend(std::vector<double>(15, 55.0), 0).inference.free_energy.empty());
}

TEST_F(SemBackendTest, StateUpdates) {
    SemBackend backend(silentBandConfig(), kFs, 2);

    backend.updateState(StateField::SPEECH, 0, 50.0, 2.0);
    EXPECT_DOUBLE_EQ(backend.getStates().speech.mean(0), 50.0);
    EXPECT_DOUBLE_EQ(backend.getStates().speech.precision(0), 2.0);

    backend.updateState(StateField::GAIN, 1, 0.7);
    EXPECT_DOUBLE_EQ(backend.getStates().gain.p[1], 0.7);
    EXPECT_NEAR(backend.getStates().gain.q[1], 0.3, 1e-12);

    backend.updateState(StateField::SWITCH, 1, 0.2);
    EXPECT_DOUBLE_EQ(backend.getStates().vad.p[1], 0.2);

    backend.updateTransition(StateField::NOISE, 0, 5.0);
    EXPECT_DOUBLE_EQ(backend.getStates().noise.transitionPrecision(0), 5.0);
}

TEST_F(SemBackendTest, StateUpdateErrors) {
    SemBackend backend(silentBandConfig(), kFs, 2);
    EXPECT_THROW(backend.updateState(StateField::GAIN, 0, 50.0, 2.0), InputValidationError);
    EXPECT_THROW(backend.updateState(StateField::SPEECH, 0, 0.5), InputValidationError);
    EXPECT_THROW(backend.updateState(StateField::SPEECH, 0, 50.0, 0.0), InputValidationError);
    EXPECT_THROW(backend.updateState(StateField::SPEECH, 5, 50.0, 1.0), InputValidationError);
    EXPECT_THROW(backend.updateState(StateField::VAD, 0, -0.1), InputValidationError);
    EXPECT_THROW(backend.updateTransition(StateField::VAD, 0, 1.0), InputValidationError);
    EXPECT_THROW(backend.updateTransition(StateField::SPEECH, 0, -1.0), InputValidationError);
}

TEST_F(SemBackendTest, RunBackendOverMatrix) {
    SemBackend backend(silentBandConfig(), kFs, 2);
    Matrix powerdb(12, 2, 60.0);
    auto results = backend.runBackend(powerdb);
    EXPECT_EQ(results.numBlocks(), 12u);
    EXPECT_EQ(results.numBands(), 2u);
    ASSERT_EQ(results.inference.size(), 2u);
    EXPECT_EQ(results.inference[0].size(), 12u);
    for (double g : results.gains.data) {
        EXPECT_GE(g, backend.getGainThresholdLin());
        EXPECT_LE(g, 1.0);
    }

    EXPECT_THROW(backend.runBackend(Matrix(12, 3, 60.0)), InputValidationError);
    EXPECT_THROW(backend.runBackend(Matrix()), InputValidationError);
}

TEST_F(SemBackendTest, ComputeGainsPerBlock) {
    SemBackend backend(silentBandConfig(), kFs, 2);
    auto gains = backend.computeGains({60.0, 40.0});
    EXPECT_EQ(gains.size(), 2u);
    EXPECT_THROW(backend.computeGains({60.0}), InputValidationError);
}

// =============================================================================
// 工厂
// =============================================================================

TEST_F(SemBackendTest, FactoryCreatesBothBackends) {
    EXPECT_TRUE(SpmBackendFactory::isAvailable(BackendType::SEM));
    EXPECT_EQ(SpmBackendFactory::getAvailableBackends().size(), 2u);

    auto sem = SpmBackendFactory::create(BackendType::SEM);
    ASSERT_NE(sem, nullptr);
    EXPECT_FALSE(sem->isInitialized());
    auto err = sem->initialize(HearingAidConfig::Sem());
    EXPECT_TRUE(err.isOk()) << err.message;
    EXPECT_EQ(sem->getNbands(), 17);

    auto baseline = SpmBackendFactory::create(BackendType::BASELINE);
    ASSERT_NE(baseline, nullptr);
    ASSERT_TRUE(baseline->initialize(HearingAidConfig::Baseline()).isOk());
    auto results = baseline->runBackend(Matrix(4, 17, 50.0));
    EXPECT_TRUE(results.inference.empty());
    for (double g : results.gains.data) {
        EXPECT_DOUBLE_EQ(g, 1.0);
    }
}

TEST_F(SemBackendTest, FactoryReportsInvalidConfig) {
    auto sem = SpmBackendFactory::create(BackendType::SEM);
    auto config = HearingAidConfig::Sem().withTimeConstants(700.0, 5.0);
    auto err = sem->initialize(config);
    EXPECT_FALSE(err.isOk());
    EXPECT_EQ(err.code, ErrorCode::INVALID_CONFIG);
    EXPECT_FALSE(sem->isInitialized());
}
