#include "internal/backends/sem/sem_inference.hpp"

#include <cmath>

#include <string>
#include <utility>
#include <vector>

#include "internal/utils/numeric_utils.hpp"
#include "internal/vha_types.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace vha {
namespace sem {

namespace {

const double kLog2Pi = std::log(2.0 * M_PI);

// 先验 N(μ, τ_prior) 经转移精度 τ 预测: 方差相加
GaussianPosterior predict(const GaussianPosterior& posterior, double transition_precision) {
    GaussianPosterior prior;
    prior.mean = posterior.mean;
    prior.precision = 1.0 / (posterior.variance() + 1.0 / transition_precision);
    return prior;
}

GaussianPosterior fromNatural(double weighted_mean, double precision, const char* name) {
    if (!(precision > 0.0) || !std::isfinite(precision) || !std::isfinite(weighted_mean)) {
        throw InternalInvariantError(std::string("Invalid posterior for ") + name +
            ": weighted_mean = " + std::to_string(weighted_mean) +
            ", precision = " + std::to_string(precision));
    }
    GaussianPosterior q;
    q.mean = weighted_mean / precision;
    q.precision = precision;
    return q;
}

double gaussianEntropy(const GaussianPosterior& q) {
    return 0.5 * (kLog2Pi + 1.0 + std::log(q.variance()));
}

double bernoulliEntropy(double p) {
    double h = 0.0;
    if (p > 0.0) h -= p * std::log(p);
    if (p < 1.0) h -= (1.0 - p) * std::log(1.0 - p);
    return h;
}

// E_q[-log N(a | b, 1/τ)]
double gaussianEnergy(double mean_diff, double variance_sum, double precision = 1.0) {
    return 0.5 * (kLog2Pi - std::log(precision)) + 0.5 * precision * (mean_diff * mean_diff + variance_sum);
}

}  // namespace

SemInference::SemInference(const SemParameters& params,
    const SemStates& states,
    int band,
    std::vector<double> observations)
    : band_(band),
      iterations_(params.inference.iterations),
      free_energy_(params.inference.free_energy),
      smoothed_(params.modules.smoothing == SmoothingMode::XI_SMOOTH),
      observations_(std::move(observations)),
      tau_speech_(states.speech.transitionPrecision(band)),
      tau_noise_(states.noise.transitionPrecision(band)),
      tau_xi_smooth_(states.xi_smooth.transitionPrecision(band)),
      tau_xi_(tau_xi_smooth_),
      switch_gate_(params.modules.vad.threshold_db, params.modules.vad.slope_db, states.vad.auxiliary[band]),
      gain_gate_(params.modules.gain.threshold_db, params.modules.gain.slope_db, states.gain.auxiliary[band]) {
    q_.speech = {states.speech.mean(band), states.speech.precision(band)};
    q_.noise = {states.noise.mean(band), states.noise.precision(band)};
    q_.xi = {0.0, 1.0};
    q_.xi_smooth = {states.xi_smooth.mean(band), states.xi_smooth.precision(band)};
    q_.vad_probability = states.vad.p[band];
    q_.gain_probability = states.gain.p[band];
    q_.zeta_switch = switch_gate_.zeta();
    q_.zeta_gain = gain_gate_.zeta();
}

void SemInference::run() {
    if (complete_) return;

    const size_t n = observations_.size();
    result_.gain_probability.reserve(n);
    result_.vad_probability.reserve(n);
    result_.speech_mean.reserve(n);
    result_.noise_mean.reserve(n);
    result_.xi_mean.reserve(n);
    result_.xi_smooth_mean.reserve(n);
    result_.zeta_switch.reserve(n);
    result_.zeta_gain.reserve(n);
    if (free_energy_) {
        result_.free_energy.reserve(n);
    }

    for (double y : observations_) {
        step(y);
    }

    result_.final_posteriors = q_;
    complete_ = true;
}

const SemInferenceResult& SemInference::result() {
    run();
    return result_;
}

const GaussianPosterior& SemInference::gate() const {
    return smoothed_ ? q_.xi_smooth : q_.xi;
}

// =============================================================================
// 时间步
// =============================================================================

void SemInference::step(double y) {
    speech_prior_ = predict(q_.speech, tau_speech_);
    noise_prior_ = predict(q_.noise, tau_noise_);
    xi_smooth_prior_ = predict(q_.xi_smooth, tau_xi_smooth_);

    for (int it = 0; it < iterations_; ++it) {
        updateSpeech(y);
        updateNoise(y);
        updateXi();
        if (smoothed_) {
            updateXiSmooth();
        }
        const GaussianPosterior& g = gate();
        switch_gate_.updateZeta(g.mean, g.variance());
        gain_gate_.updateZeta(g.mean, g.variance());
        q_.zeta_switch = switch_gate_.zeta();
        q_.zeta_gain = gain_gate_.zeta();
        updateSwitch(y);
        updateGain();
    }

    result_.gain_probability.push_back(q_.gain_probability);
    result_.vad_probability.push_back(q_.vad_probability);
    result_.speech_mean.push_back(q_.speech.mean);
    result_.noise_mean.push_back(q_.noise.mean);
    result_.xi_mean.push_back(q_.xi.mean);
    result_.xi_smooth_mean.push_back(q_.xi_smooth.mean);
    result_.zeta_switch.push_back(q_.zeta_switch);
    result_.zeta_gain.push_back(q_.zeta_gain);
    if (free_energy_) {
        result_.free_energy.push_back(freeEnergy(y));
    }
}

// =============================================================================
// 坐标上升更新
// =============================================================================

void SemInference::updateSpeech(double y) {
    const double pi = q_.vad_probability;
    // 先验 + 混合分量 (精度 π) + ξ 节点 (s = ξ + n, 精度 τξ)
    double precision = speech_prior_.precision + pi + tau_xi_;
    double weighted_mean = speech_prior_.precision * speech_prior_.mean + pi * y +
                           tau_xi_ * (q_.xi.mean + q_.noise.mean);
    q_.speech = fromNatural(weighted_mean, precision, "speech");
}

void SemInference::updateNoise(double y) {
    const double pi = 1.0 - q_.vad_probability;
    // 先验 + 混合分量 (精度 1 - π) + ξ 节点 (n = s - ξ, 精度 τξ)
    double precision = noise_prior_.precision + pi + tau_xi_;
    double weighted_mean = noise_prior_.precision * noise_prior_.mean + pi * y +
                           tau_xi_ * (q_.speech.mean - q_.xi.mean);
    q_.noise = fromNatural(weighted_mean, precision, "noise");
}

void SemInference::updateXi() {
    double precision = tau_xi_;
    double weighted_mean = tau_xi_ * (q_.speech.mean - q_.noise.mean);
    if (smoothed_) {
        precision += 1.0;
        weighted_mean += q_.xi_smooth.mean;
    } else {
        auto from_switch = switch_gate_.messageToLatent(q_.vad_probability);
        auto from_gain = gain_gate_.messageToLatent(q_.gain_probability);
        precision += from_switch.precision + from_gain.precision;
        weighted_mean += from_switch.weighted_mean + from_gain.weighted_mean;
    }
    q_.xi = fromNatural(weighted_mean, precision, "xi");
}

void SemInference::updateXiSmooth() {
    auto from_switch = switch_gate_.messageToLatent(q_.vad_probability);
    auto from_gain = gain_gate_.messageToLatent(q_.gain_probability);
    double precision = xi_smooth_prior_.precision + 1.0 + from_switch.precision + from_gain.precision;
    double weighted_mean = xi_smooth_prior_.precision * xi_smooth_prior_.mean + q_.xi.mean +
                           from_switch.weighted_mean + from_gain.weighted_mean;
    q_.xi_smooth = fromNatural(weighted_mean, precision, "xi_smooth");
}

void SemInference::updateSwitch(double y) {
    ext::Categorical2 prior = switch_gate_.messageToOutput(gate().mean);

    double ds = y - q_.speech.mean;
    double dn = y - q_.noise.mean;
    double log_speech = std::log(prior.probs[0]) - 0.5 * kLog2Pi - 0.5 * (ds * ds + q_.speech.variance());
    double log_noise = std::log(prior.probs[1]) - 0.5 * kLog2Pi - 0.5 * (dn * dn + q_.noise.variance());
    double norm = utils::logSumExp(log_speech, log_noise);
    double p = std::exp(log_speech - norm);
    if (!std::isfinite(p)) {
        throw InternalInvariantError("Non-finite voice activity probability: log_speech = " +
            std::to_string(log_speech) + ", log_noise = " + std::to_string(log_noise));
    }
    q_.vad_probability = p;
}

void SemInference::updateGain() {
    // 均匀先验不改变 sigmoid 消息
    q_.gain_probability = gain_gate_.messageToOutput(gate().mean).pOne();
}

// =============================================================================
// 自由能
// =============================================================================

double SemInference::freeEnergy(double y) const {
    const double pi = q_.vad_probability;
    const double w = q_.gain_probability;

    double energy = 0.0;
    auto priorEnergy = [](const GaussianPosterior& prior, const GaussianPosterior& q) {
        double d = q.mean - prior.mean;
        return 0.5 * (kLog2Pi - std::log(prior.precision)) + 0.5 * prior.precision * (d * d + q.variance());
    };
    energy += priorEnergy(speech_prior_, q_.speech);
    energy += priorEnergy(noise_prior_, q_.noise);
    energy += gaussianEnergy(q_.xi.mean - (q_.speech.mean - q_.noise.mean),
                             q_.xi.variance() + q_.speech.variance() + q_.noise.variance(), tau_xi_);
    if (smoothed_) {
        energy += priorEnergy(xi_smooth_prior_, q_.xi_smooth);
        energy += gaussianEnergy(q_.xi_smooth.mean - q_.xi.mean, q_.xi_smooth.variance() + q_.xi.variance());
    }

    const GaussianPosterior& g = gate();
    energy += switch_gate_.averageEnergy(pi, g.mean, g.variance());
    energy += gain_gate_.averageEnergy(w, g.mean, g.variance());
    energy += std::log(2.0);    // Categorical([0.5, 0.5]) 先验

    energy += pi * gaussianEnergy(y - q_.speech.mean, q_.speech.variance());
    energy += (1.0 - pi) * gaussianEnergy(y - q_.noise.mean, q_.noise.variance());

    double entropy = gaussianEntropy(q_.speech) + gaussianEntropy(q_.noise) + gaussianEntropy(q_.xi);
    if (smoothed_) {
        entropy += gaussianEntropy(q_.xi_smooth);
    }
    entropy += bernoulliEntropy(pi) + bernoulliEntropy(w);

    double free_energy = energy - entropy;
    if (!std::isfinite(free_energy)) {
        throw InternalInvariantError("Non-finite free energy at band " + std::to_string(band_) +
            ": energy = " + std::to_string(energy) + ", entropy = " + std::to_string(entropy));
    }
    return free_energy;
}

}  // namespace sem
}  // namespace vha
