#include "internal/backends/sem/sem_types.hpp"

#include <cmath>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "internal/utils/numeric_utils.hpp"

namespace vha {
namespace sem {

namespace {

constexpr double kEps = std::numeric_limits<double>::epsilon();

void checkLength(const std::vector<double>& values, int nbands, const std::string& field) {
    if (static_cast<int>(values.size()) != nbands) {
        throw ConfigError(field + " must have length " + std::to_string(nbands) +
            ", got " + std::to_string(values.size()));
    }
}

void checkPositive(const std::vector<double>& values, const std::string& field) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (!(values[i] > 0.0) || !std::isfinite(values[i])) {
            throw ConfigError(field + "[" + std::to_string(i) + "] must be positive, got " +
                std::to_string(values[i]));
        }
    }
}

void checkBands(int nbands) {
    if (nbands <= 0) {
        throw ConfigError("nbands must be positive, got " + std::to_string(nbands));
    }
}

}  // namespace

// =============================================================================
// Parameters
// =============================================================================

SourceParameters::SourceParameters(double tau90_ms, double fs)
    : tau90(tau90_ms), sampling_frequency(fs) {
    if (!(tau90_ms > 0.0)) {
        throw ConfigError("time constant tau90 must be positive, got " + std::to_string(tau90_ms));
    }
    if (!(fs > 0.0)) {
        throw ConfigError("sampling frequency must be positive, got " + std::to_string(fs));
    }
    lambda = utils::tau2ff(tau90_ms, fs);
    fc = utils::calculateFc(tau90_ms);
}

GainParameters::GainParameters(double slope, double configured_threshold_db)
    : slope_db(slope) {
    if (!(configured_threshold_db > 0.0) || !std::isfinite(configured_threshold_db)) {
        throw ConfigError("gain threshold must be a positive dB value, got " +
            std::to_string(configured_threshold_db));
    }
    double g = std::pow(10.0, -configured_threshold_db / 20.0);
    // 残余抑制量取整 (ties-to-even)
    double resid_db = std::nearbyint(-20.0 * std::log10(1.0 - g));
    double sg = std::pow(10.0, -resid_db / 20.0);
    threshold_db = resid_db;
    threshold_lin = std::pow(10.0, 20.0 * std::log10(1.0 - sg + kEps) / 20.0);
}

VadParameters::VadParameters(double slope, double threshold)
    : slope_db(slope), threshold_db(threshold) {}

InferenceParameters::InferenceParameters(int iterations, bool autostart, bool free_energy)
    : iterations(iterations), autostart(autostart), free_energy(free_energy) {
    if (iterations <= 0) {
        throw ConfigError("inference iterations must be > 0, got " + std::to_string(iterations));
    }
}

ModuleParameters::ModuleParameters(const SourceParameters& speech,
    const SourceParameters& noise,
    const SourceParameters& xi_smooth,
    const GainParameters& gain,
    const VadParameters& vad,
    double sampling_frequency,
    int nbands,
    SmoothingMode smoothing)
    : speech(speech),
      noise(noise),
      xi_smooth(xi_smooth),
      gain(gain),
      vad(vad),
      sampling_frequency(sampling_frequency),
      nbands(nbands),
      smoothing(smoothing) {
    if (!(sampling_frequency > 0.0)) {
        throw ConfigError("sampling frequency must be positive, got " + std::to_string(sampling_frequency));
    }
    checkBands(nbands);
    if (!(speech.tau90 < noise.tau90)) {
        throw ConfigError("speech time constant (" + std::to_string(speech.tau90) +
            " ms) must be smaller than noise time constant (" + std::to_string(noise.tau90) + " ms)");
    }
}

SemParameters SemParameters::fromConfig(const SemBackendConfig& config, double fs, int nbands) {
    auto err = config.validate();
    if (!err.isOk()) {
        throw ConfigError(err.code, err.message);
    }
    return SemParameters{
        InferenceParameters(config.iterations, config.autostart, config.free_energy),
        ModuleParameters(SourceParameters(config.tau_speech_ms, fs),
                         SourceParameters(config.tau_noise_ms, fs),
                         SourceParameters(config.tau_xnr_ms, fs),
                         GainParameters(config.gain_slope, config.gain_threshold_db),
                         VadParameters(config.switch_slope, config.switch_threshold_db),
                         fs,
                         nbands,
                         config.smoothing)};
}

// =============================================================================
// States
// =============================================================================

SourceState::SourceState(int nbands, std::vector<double> prior_mean, std::vector<double> prior_precision)
    : mean(std::move(prior_mean)), precision(std::move(prior_precision)) {
    checkBands(nbands);
    checkLength(mean, nbands, "source mean");
    checkLength(precision, nbands, "source precision");
    checkPositive(precision, "source precision");
    for (double m : mean) {
        if (!std::isfinite(m)) {
            throw ConfigError("source mean must be finite");
        }
    }
}

SourceTransitionState::SourceTransitionState(int nbands, double lambda) {
    checkBands(nbands);
    precision.assign(nbands, 1.0 / utils::lambdaToProcessVar(lambda));
}

BliState::BliState(const SourceParameters& params, int nbands, double prior_mean, double prior_precision)
    : state(nbands,
            std::vector<double>(std::max(nbands, 0), prior_mean),
            std::vector<double>(std::max(nbands, 0), prior_precision)),
      transition(nbands, params.lambda) {}

BernoulliState::BernoulliState(int nbands, const std::vector<double>& prior, std::vector<double> aux)
    : auxiliary(std::move(aux)) {
    checkBands(nbands);
    if (prior.size() != 2) {
        throw ConfigError("Bernoulli prior must have two entries, got " + std::to_string(prior.size()));
    }
    if (prior[0] < 0.0 || prior[1] < 0.0 || std::abs(prior[0] + prior[1] - 1.0) > kEps) {
        throw ConfigError("Bernoulli prior must be non-negative and sum to 1, got [" +
            std::to_string(prior[0]) + ", " + std::to_string(prior[1]) + "]");
    }
    checkLength(auxiliary, nbands, "auxiliary");
    checkPositive(auxiliary, "auxiliary");
    p.assign(nbands, prior[1]);
    q.assign(nbands, prior[0]);
}

void BernoulliState::update(int band, double value) {
    if (band < 0 || band >= static_cast<int>(p.size())) {
        throw InputValidationError("band index " + std::to_string(band) + " out of range [0, " +
            std::to_string(p.size()) + ")");
    }
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw InputValidationError("Bernoulli probability must lie in [0, 1], got " + std::to_string(value));
    }
    p[band] = value;
    q[band] = 1.0 - value;
}

GainState::GainState(int nbands,
    const std::vector<double>& prior,
    std::vector<double> auxiliary,
    std::vector<double> floor)
    : BernoulliState(nbands, prior, std::move(auxiliary)),
      wiener_gain_spectral_floor(std::move(floor)) {
    checkLength(wiener_gain_spectral_floor, nbands, "wiener_gain_spectral_floor");
}

VadState::VadState(int nbands, const std::vector<double>& prior, std::vector<double> auxiliary)
    : BernoulliState(nbands, prior, std::move(auxiliary)) {}

void updateBernoulliState(BernoulliState& state, double value, int band) {
    state.update(band, value);
}

SemStates::SemStates(const SemParameters& params,
    double speech_prior_mean,
    double speech_prior_precision,
    double noise_prior_mean,
    double noise_prior_precision,
    double xi_smooth_prior_mean,
    double xi_smooth_prior_precision)
    : speech(params.modules.speech, params.modules.nbands, speech_prior_mean, speech_prior_precision),
      noise(params.modules.noise, params.modules.nbands, noise_prior_mean, noise_prior_precision),
      xi_smooth(params.modules.xi_smooth, params.modules.nbands, xi_smooth_prior_mean, xi_smooth_prior_precision),
      gain(params.modules.nbands,
           {0.5, 0.5},
           std::vector<double>(params.modules.nbands, 1.0),
           std::vector<double>(params.modules.nbands, 0.0)),
      vad(params.modules.nbands, {0.5, 0.5}, std::vector<double>(params.modules.nbands, 1.0)) {}

// =============================================================================
// Spectral floor
// =============================================================================

std::vector<double> wienerGainSpectralFloor(const std::vector<double>& gains, double gmin_lin) {
    std::vector<double> floored(gains.size());
    for (size_t i = 0; i < gains.size(); ++i) {
        floored[i] = std::max(gains[i], gmin_lin);
    }
    return floored;
}

}  // namespace sem
}  // namespace vha
