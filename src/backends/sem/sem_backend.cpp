#include "internal/backends/sem/sem_backend.hpp"

#include <cmath>

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace vha {
namespace sem {

SemBackend::SemBackend() = default;

SemBackend::SemBackend(const SemBackendConfig& config, double fs, int nbands) {
    build(config, fs, nbands);
    name_ = config.name;
}

SemBackend::~SemBackend() = default;

void SemBackend::build(const SemBackendConfig& config, double fs, int nbands) {
    auto params = std::make_unique<SemParameters>(SemParameters::fromConfig(config, fs, nbands));
    auto states = std::make_unique<SemStates>(*params,
        config.speech_prior_mean, config.speech_prior_precision,
        config.noise_prior_mean, config.noise_prior_precision);
    params_ = std::move(params);
    states_ = std::move(states);
}

// =============================================================================
// ISpmBackend
// =============================================================================

ErrorInfo SemBackend::initialize(const HearingAidConfig& config) {
    try {
        auto err = config.frontend.validate();
        if (!err.isOk()) {
            return err;
        }
        build(config.backend, config.frontend.algorithmSampleRate(), config.frontend.nbands);
        name_ = config.backend.name;
    } catch (const VhaError& e) {
        return e.toErrorInfo();
    } catch (const std::exception& e) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "Failed to initialize SEM backend", e.what());
    }
    return ErrorInfo::ok();
}

void SemBackend::shutdown() {
    states_.reset();
    params_.reset();
}

int SemBackend::getNbands() const {
    return params_ ? params_->modules.nbands : 0;
}

std::vector<double> SemBackend::computeGains(const std::vector<double>& powerdb) {
    validatePowerVector(powerdb, getNbands());
    std::vector<double> gains(powerdb.size());
    for (size_t band = 0; band < powerdb.size(); ++band) {
        auto output = processBackend({powerdb[band]}, static_cast<int>(band));
        gains[band] = output.gains.front();
    }
    return gains;
}

SemResults SemBackend::runBackend(const Matrix& powerdb) {
    const int nbands = getNbands();
    validatePowerMatrix(powerdb, nbands);

    SemResults results;
    results.gains = Matrix(powerdb.rows, nbands);
    results.inference.reserve(nbands);
    for (int band = 0; band < nbands; ++band) {
        auto output = processBackend(powerdb.column(band), band);
        results.gains.setColumn(band, output.gains);
        results.inference.push_back(std::move(output.inference));
    }
    return results;
}

// =============================================================================
// 单频带处理
// =============================================================================

void SemBackend::checkBand(int band) const {
    const int nbands = getNbands();
    if (band < 0 || band >= nbands) {
        throw InputValidationError("Band index " + std::to_string(band) +
            " is out of range. Backend has " + std::to_string(nbands) +
            " bands (valid indices: 0.." + std::to_string(nbands - 1) + ")");
    }
}

std::unique_ptr<SemInference> SemBackend::prepareInference(const std::vector<double>& powerdb, int band) const {
    if (!params_) {
        throw VhaError(ErrorCode::NOT_INITIALIZED, "SEM backend is not initialized");
    }
    checkBand(band);
    if (powerdb.empty()) {
        throw InputValidationError("power series for band " + std::to_string(band) + " is empty");
    }
    for (size_t t = 0; t < powerdb.size(); ++t) {
        if (!std::isfinite(powerdb[t])) {
            throw InputValidationError("power series for band " + std::to_string(band) +
                " contains a non-finite value at index " + std::to_string(t));
        }
    }
    auto inference = std::make_unique<SemInference>(*params_, *states_, band, powerdb);
    if (params_->inference.autostart) {
        inference->run();
    }
    return inference;
}

SemBandOutput SemBackend::processBackend(const std::vector<double>& powerdb, int band) {
    auto inference = prepareInference(powerdb, band);

    // 写回状态需要后验, 未执行的推理在此执行
    SemBandOutput output;
    output.inference = inference->result();
    output.gains = wienerGainSpectralFloor(output.inference.gain_probability, getGainThresholdLin());
    writeBack(band, output.inference, output.gains);
    return output;
}

void SemBackend::writeBack(int band, const SemInferenceResult& result, const std::vector<double>& gains) {
    const SemPosteriors& q = result.final_posteriors;
    updateState(StateField::SPEECH, band, q.speech.mean, q.speech.precision);
    updateState(StateField::NOISE, band, q.noise.mean, q.noise.precision);
    if (params_->modules.smoothing == SmoothingMode::XI_SMOOTH) {
        updateState(StateField::XI_SMOOTH, band, q.xi_smooth.mean, q.xi_smooth.precision);
    }
    updateState(StateField::GAIN, band, q.gain_probability);
    updateState(StateField::VAD, band, q.vad_probability);
    states_->gain.auxiliary[band] = q.zeta_gain;
    states_->vad.auxiliary[band] = q.zeta_switch;
    states_->gain.wiener_gain_spectral_floor[band] = gains.back();
}

// =============================================================================
// 状态更新
// =============================================================================

BliState& SemBackend::source(StateField field) {
    switch (field) {
        case StateField::SPEECH:    return states_->speech;
        case StateField::NOISE:     return states_->noise;
        case StateField::XI_SMOOTH: return states_->xi_smooth;
        default:
            throw InputValidationError(std::string("state field '") + stateFieldToString(field) +
                "' is not a Gaussian source, use speech, noise or xi_smooth");
    }
}

void SemBackend::updateState(StateField field, int band, double mean, double precision) {
    checkBand(band);
    if (!std::isfinite(mean) || !(precision > 0.0) || !std::isfinite(precision)) {
        throw InputValidationError(std::string("invalid ") + stateFieldToString(field) +
            " state: mean = " + std::to_string(mean) + ", precision = " + std::to_string(precision));
    }
    BliState& bli = source(field);
    bli.state.mean[band] = mean;
    bli.state.precision[band] = precision;
}

void SemBackend::updateState(StateField field, int band, double probability) {
    checkBand(band);
    switch (field) {
        case StateField::GAIN:
            updateBernoulliState(states_->gain, probability, band);
            break;
        case StateField::VAD:
        case StateField::SWITCH:
            updateBernoulliState(states_->vad, probability, band);
            break;
        default:
            throw InputValidationError(std::string("state field '") + stateFieldToString(field) +
                "' is not a Bernoulli state, use gain, vad or switch");
    }
}

void SemBackend::updateTransition(StateField field, int band, double precision) {
    checkBand(band);
    if (!(precision > 0.0) || !std::isfinite(precision)) {
        throw InputValidationError("transition precision must be positive, got " + std::to_string(precision));
    }
    source(field).transition.precision[band] = precision;
}

// =============================================================================
// 访问器
// =============================================================================

const SemParameters& SemBackend::getParameters() const {
    if (!params_) {
        throw VhaError(ErrorCode::NOT_INITIALIZED, "SEM backend is not initialized");
    }
    return *params_;
}

const SemStates& SemBackend::getStates() const {
    if (!states_) {
        throw VhaError(ErrorCode::NOT_INITIALIZED, "SEM backend is not initialized");
    }
    return *states_;
}

}  // namespace sem
}  // namespace vha
