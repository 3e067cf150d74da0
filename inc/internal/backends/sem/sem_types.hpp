#ifndef SEM_TYPES_HPP
#define SEM_TYPES_HPP

/**
 * SEM 参数与状态
 *
 * 参数 (SemParameters) 在构造后不可变, 所有频带共享;
 * 状态 (SemStates) 按频带保存, 每块推理后原地更新。
 */

#include <vector>

#include "internal/vha_config.hpp"
#include "internal/vha_types.hpp"

namespace vha {
namespace sem {

// =============================================================================
// Parameters (参数)
// =============================================================================

/// @brief 漏积分源参数: 90% 时间常数 (ms), 算法采样率 (1/ms), 遗忘因子, 截止频率
struct SourceParameters {
    double tau90;
    double sampling_frequency;
    double lambda;
    double fc;

    SourceParameters(double tau90_ms, double fs);
};

/**
 * @brief 增益 sigmoid 门参数
 *
 * 由配置的 GMIN (dB) 经两步变换得到实际阈值:
 *   g = 10^(-thr/20), resid_db = round(-20 log10(1 - g)),
 *   sg = 10^(-resid_db/20), threshold_lin = 10^(20 log10(1 - sg + eps)/20)
 * threshold_db 保存的是 resid_db, 不是配置的原值。
 */
struct GainParameters {
    double slope_db;
    double threshold_db;
    double threshold_lin;

    GainParameters(double slope, double configured_threshold_db);
};

struct VadParameters {
    double slope_db;
    double threshold_db;

    VadParameters(double slope, double threshold);
};

struct InferenceParameters {
    int iterations;
    bool autostart;
    bool free_energy;

    InferenceParameters(int iterations = 1, bool autostart = true, bool free_energy = true);
};

struct ModuleParameters {
    SourceParameters speech;
    SourceParameters noise;
    SourceParameters xi_smooth;
    GainParameters gain;
    VadParameters vad;
    double sampling_frequency;
    int nbands;
    SmoothingMode smoothing;

    ModuleParameters(const SourceParameters& speech,
                     const SourceParameters& noise,
                     const SourceParameters& xi_smooth,
                     const GainParameters& gain,
                     const VadParameters& vad,
                     double sampling_frequency,
                     int nbands,
                     SmoothingMode smoothing = SmoothingMode::XI_SMOOTH);
};

struct SemParameters {
    InferenceParameters inference;
    ModuleParameters modules;

    /// @brief 由后端配置构建, fs 为算法采样率 (1/ms)
    static SemParameters fromConfig(const SemBackendConfig& config, double fs, int nbands);
};

// =============================================================================
// States (状态)
// =============================================================================

/// @brief 各频带的高斯后验 (均值、精度)
struct SourceState {
    std::vector<double> mean;
    std::vector<double> precision;

    SourceState(int nbands, std::vector<double> prior_mean, std::vector<double> prior_precision);
};

/// @brief 转移精度 1 / (λ² / (1 - λ))
struct SourceTransitionState {
    std::vector<double> precision;

    SourceTransitionState(int nbands, double lambda);
};

/// @brief Basic Leaky Integrator = 后验状态 + 转移精度
struct BliState {
    SourceState state;
    SourceTransitionState transition;

    BliState(const SourceParameters& params, int nbands, double prior_mean = 0.0, double prior_precision = 1.0);

    double mean(int band) const { return state.mean[band]; }
    double precision(int band) const { return state.precision[band]; }
    double transitionPrecision(int band) const { return transition.precision[band]; }
};

/**
 * @brief 二值隐变量的伯努利状态
 *
 * 不变量: p[i] + q[i] = 1, auxiliary[i] > 0。
 * prior = [P(off), P(on)], 即 p 取 prior[1], q 取 prior[0]。
 */
struct BernoulliState {
    std::vector<double> p;
    std::vector<double> q;
    std::vector<double> auxiliary;

    BernoulliState(int nbands, const std::vector<double>& prior, std::vector<double> auxiliary);

    /// @brief p = value, q = 1 - value
    void update(int band, double value);
};

struct GainState : BernoulliState {
    std::vector<double> wiener_gain_spectral_floor;

    GainState(int nbands,
              const std::vector<double>& prior,
              std::vector<double> auxiliary,
              std::vector<double> wiener_gain_spectral_floor);
};

struct VadState : BernoulliState {
    VadState(int nbands, const std::vector<double>& prior, std::vector<double> auxiliary);
};

/// @brief 伯努利状态更新 (p = value, q = 1 - value)
void updateBernoulliState(BernoulliState& state, double value, int band);

struct SemStates {
    BliState speech;
    BliState noise;
    BliState xi_smooth;
    GainState gain;
    VadState vad;

    SemStates(const SemParameters& params,
              double speech_prior_mean = 0.0,
              double speech_prior_precision = 1.0,
              double noise_prior_mean = 0.0,
              double noise_prior_precision = 1.0,
              double xi_smooth_prior_mean = 0.0,
              double xi_smooth_prior_precision = 1.0);
};

// =============================================================================
// Spectral floor
// =============================================================================

/// @brief 逐元素 max(gain, gmin_lin)
std::vector<double> wienerGainSpectralFloor(const std::vector<double>& gains, double gmin_lin);

}  // namespace sem
}  // namespace vha

#endif  // SEM_TYPES_HPP
