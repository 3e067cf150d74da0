#include <gtest/gtest.h>

#include <string>

#include "internal/config/config_loader.hpp"

using namespace vha;
using namespace vha::config;

namespace {

const std::string kFrontendYaml = R"(
  frontend:
    nbands: 9
    fs: 16000
    spl_reference_db: 100.0
    spl_power_estimate_lower_bound_db: 30.0
    apcoefficient: 0.4
    buffer_size_s: 0.002
)";

const std::string kSemYaml = R"(
parameters:
  hearingaid:
    type: "SEMHearingAid"
)" + kFrontendYaml + R"(
  backend:
    general:
      name: "SEM"
      type: "SEMBackend"
    inference:
      iterations: 3
      autostart: false
      free_energy: true
    filters:
      time_constants90:
        s: [5.0, 10.0]
        n: 700
        xnr: 200
    priors:
      speech:
        mean: 80.0
        precision: 1.0
      noise:
        mean: 70.0
        precision: 2.0
)";

std::string configPath(const std::string& name) {
    return std::string(VHA_CONFIG_DIR) + "/" + name;
}

}  // namespace

TEST(ConfigLoaderTest, LoadsSampleSemConfig) {
    HearingAidConfig config = loadHearingAidConfig(configPath("sem_config.yaml"));
    EXPECT_EQ(config.type, HearingAidType::SEM);
    EXPECT_EQ(config.name, "SEM Hearing Aid");
    EXPECT_EQ(config.processing_strategy, ProcessingStrategy::BATCH_OFFLINE);
    EXPECT_EQ(config.frontend.nbands, 17);
    EXPECT_DOUBLE_EQ(config.frontend.fs, 16000.0);
    EXPECT_DOUBLE_EQ(config.frontend.buffer_size_s, 0.0015);
    EXPECT_EQ(config.backend.iterations, 2);
    EXPECT_DOUBLE_EQ(config.backend.tau_speech_ms, 5.0);
    EXPECT_DOUBLE_EQ(config.backend.tau_noise_ms, 10000.0);
    EXPECT_DOUBLE_EQ(config.backend.tau_xnr_ms, 200.0);
    EXPECT_DOUBLE_EQ(config.backend.speech_prior_mean, 80.0);
    EXPECT_DOUBLE_EQ(config.backend.noise_prior_mean, 70.0);
    EXPECT_DOUBLE_EQ(config.backend.gain_threshold_db, 12.0);
    EXPECT_DOUBLE_EQ(config.backend.switch_threshold_db, 4.0);
    EXPECT_EQ(config.backend.smoothing, SmoothingMode::XI_SMOOTH);
}

TEST(ConfigLoaderTest, LoadsSampleBaselineConfig) {
    HearingAidConfig config = loadHearingAidConfig(configPath("baseline_config.yaml"));
    EXPECT_EQ(config.type, HearingAidType::BASELINE);
    EXPECT_EQ(config.processing_strategy, ProcessingStrategy::BATCH_ONLINE);
    EXPECT_EQ(config.frontend.nbands, 17);
}

TEST(ConfigLoaderTest, OptionalKeysTakeDefaults) {
    HearingAidConfig config = parseHearingAidConfig(kSemYaml);
    EXPECT_EQ(config.name, "SEMHearingAid");
    EXPECT_EQ(config.processing_strategy, ProcessingStrategy::BATCH_OFFLINE);
    EXPECT_DOUBLE_EQ(config.backend.gain_threshold_db, 12.0);
    EXPECT_DOUBLE_EQ(config.backend.gain_slope, 1.0);
    EXPECT_DOUBLE_EQ(config.backend.switch_threshold_db, 0.0);
    EXPECT_DOUBLE_EQ(config.backend.switch_slope, 1.0);
    EXPECT_EQ(config.backend.smoothing, SmoothingMode::XI_SMOOTH);
}

TEST(ConfigLoaderTest, ReadsAllSections) {
    HearingAidConfig config = parseHearingAidConfig(kSemYaml);
    EXPECT_EQ(config.frontend.nbands, 9);
    EXPECT_DOUBLE_EQ(config.frontend.apcoefficient, 0.4);
    EXPECT_EQ(config.frontend.bufferSize(), 32);
    EXPECT_EQ(config.backend.iterations, 3);
    EXPECT_FALSE(config.backend.autostart);
    EXPECT_TRUE(config.backend.free_energy);
    EXPECT_DOUBLE_EQ(config.backend.noise_prior_precision, 2.0);
}

TEST(ConfigLoaderTest, TimeConstantListUsesFirstValue) {
    HearingAidConfig config = parseHearingAidConfig(kSemYaml);
    EXPECT_DOUBLE_EQ(config.backend.tau_speech_ms, 5.0);
    EXPECT_DOUBLE_EQ(config.backend.tau_noise_ms, 700.0);
}

TEST(ConfigLoaderTest, MissingFieldNamesKeyPath) {
    const std::string yaml = R"(
parameters:
  hearingaid:
    type: "Baseline"
  frontend:
    nbands: 17
    fs: 16000
    spl_reference_db: 100.0
    apcoefficient: 0.5
    buffer_size_s: 0.0015
)";
    try {
        parseHearingAidConfig(yaml);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MISSING_FIELD);
        EXPECT_NE(std::string(e.what()).find("parameters.frontend.spl_power_estimate_lower_bound_db"),
                  std::string::npos);
    }
}

TEST(ConfigLoaderTest, MissingBackendSectionForSem) {
    const std::string yaml = "parameters:\n  hearingaid:\n    type: \"SEM\"\n" + kFrontendYaml;
    try {
        parseHearingAidConfig(yaml);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MISSING_FIELD);
        EXPECT_NE(std::string(e.what()).find("parameters.backend"), std::string::npos);
    }
}

TEST(ConfigLoaderTest, InvalidValuesRejected) {
    std::string yaml = kSemYaml;
    yaml.replace(yaml.find("n: 700"), 6, "n: 2");
    // s = 5 ms 不小于 n = 2 ms
    EXPECT_THROW(parseHearingAidConfig(yaml), ConfigError);

    std::string bad_type = "parameters:\n  hearingaid:\n    type: \"Cochlear\"\n" + kFrontendYaml;
    EXPECT_THROW(parseHearingAidConfig(bad_type), ConfigError);
}

TEST(ConfigLoaderTest, MissingFileReportsReadError) {
    try {
        loadHearingAidConfig("/nonexistent/vha_config.yaml");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FILE_READ_ERROR);
    }
}

TEST(ConfigLoaderTest, StrategyAliases) {
    EXPECT_EQ(parseProcessingStrategy("streaming"), ProcessingStrategy::STREAMING);
    EXPECT_EQ(parseProcessingStrategy("Stream"), ProcessingStrategy::STREAMING);
    EXPECT_EQ(parseProcessingStrategy("BatchProcessingOnline"), ProcessingStrategy::BATCH_ONLINE);
    EXPECT_EQ(parseProcessingStrategy("online"), ProcessingStrategy::BATCH_ONLINE);
    EXPECT_EQ(parseProcessingStrategy("batch_online"), ProcessingStrategy::BATCH_ONLINE);
    EXPECT_EQ(parseProcessingStrategy("BATCHPROCESSINGOFFLINE"), ProcessingStrategy::BATCH_OFFLINE);
    EXPECT_EQ(parseProcessingStrategy("offline"), ProcessingStrategy::BATCH_OFFLINE);
    EXPECT_THROW(parseProcessingStrategy("realtime"), ConfigError);
}

TEST(ConfigLoaderTest, TypeAndSmoothingNames) {
    EXPECT_EQ(parseHearingAidType("SEMHearingAid"), HearingAidType::SEM);
    EXPECT_EQ(parseHearingAidType("baseline"), HearingAidType::BASELINE);
    EXPECT_EQ(parseSmoothingMode("None"), SmoothingMode::NONE);
    EXPECT_EQ(parseSmoothingMode("xi_smooth"), SmoothingMode::XI_SMOOTH);
    EXPECT_THROW(parseSmoothingMode("kalman"), ConfigError);
}
