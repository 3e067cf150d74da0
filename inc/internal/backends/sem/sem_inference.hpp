#ifndef SEM_INFERENCE_HPP
#define SEM_INFERENCE_HPP

/**
 * SemInference - 单频带 SEM 滤波模型的变分推理
 *
 * 模型 (每个时间步):
 *   s        ~ N(s_prior, τs)          s_prior ~ N(μs, τs_prior)
 *   n        ~ N(n_prior, τn)          n_prior ~ N(μn, τn_prior)
 *   ξ        ~ N(s - n, τξ)           τξ 取 ξ_smooth 的转移精度
 *   ξ_smooth ~ N(ξ, 1), 漏积分先验    (仅 SmoothingMode::XI_SMOOTH)
 *   π_switch ~ Sigmoid(η (g - κ), ζ_switch)
 *   w        ~ Sigmoid(η (g - θ), ζ_gain),  w ~ Categorical([0.5, 0.5])
 *   y        ~ NormalMixture(π_switch; (s, 1), (n, 1))
 * 其中 g 为 ξ_smooth (平滑) 或 ξ (不平滑)。
 *
 * 平均场分解 q(s)q(n)q(ξ)q(ξ_smooth)q(ζ_switch)q(ζ_gain)q(π_switch)q(w),
 * 每个时间步做 iterations 轮坐标上升, 后验作为下一步的先验。
 */

#include <vector>

#include "internal/backends/sem/sem_types.hpp"
#include "internal/extensions/sigmoid_node.hpp"

namespace vha {
namespace sem {

/// @brief 高斯后验 (均值、精度)
struct GaussianPosterior {
    double mean = 0.0;
    double precision = 1.0;

    double variance() const { return 1.0 / precision; }
};

/// @brief 序列结束时的全部后验, 用于写回 SemStates
struct SemPosteriors {
    GaussianPosterior speech;
    GaussianPosterior noise;
    GaussianPosterior xi;
    GaussianPosterior xi_smooth;
    double vad_probability = 0.5;       ///< q(π_switch = 1)
    double gain_probability = 0.5;      ///< q(w = 1)
    double zeta_switch = 1.0;
    double zeta_gain = 1.0;
};

/// @brief 推理历史, 每个时间步一项
struct SemInferenceResult {
    std::vector<double> gain_probability;   ///< P(w = 1)
    std::vector<double> vad_probability;    ///< P(π_switch = 1)
    std::vector<double> speech_mean;
    std::vector<double> noise_mean;
    std::vector<double> xi_mean;
    std::vector<double> xi_smooth_mean;
    std::vector<double> zeta_switch;
    std::vector<double> zeta_gain;
    std::vector<double> free_energy;        ///< 仅在开启自由能时填充

    SemPosteriors final_posteriors;

    size_t size() const { return gain_probability.size(); }
};

class SemInference {
public:
    /**
     * @brief 以后端状态为热启动准备一个频带的推理
     * @param band 频带索引 (0-based, 已由调用方校验)
     * @param observations 该频带的功率序列 (dB)
     */
    SemInference(const SemParameters& params,
                 const SemStates& states,
                 int band,
                 std::vector<double> observations);

    /// @brief 执行推理 (已执行则直接返回)
    void run();

    bool isComplete() const { return complete_; }

    /// @brief 推理结果, 未执行时先执行
    const SemInferenceResult& result();

    int band() const { return band_; }
    int iterations() const { return iterations_; }
    const std::vector<double>& observations() const { return observations_; }

private:
    void step(double y);
    void updateSpeech(double y);
    void updateNoise(double y);
    void updateXi();
    void updateXiSmooth();
    void updateSwitch(double y);
    void updateGain();
    double freeEnergy(double y) const;

    // sigmoid 门所连接的隐变量 (ξ_smooth 或 ξ)
    const GaussianPosterior& gate() const;

    int band_;
    int iterations_;
    bool free_energy_;
    bool smoothed_;
    std::vector<double> observations_;

    // 转移精度
    double tau_speech_;
    double tau_noise_;
    double tau_xi_smooth_;
    double tau_xi_;         ///< ξ 节点精度

    // 当前时间步的先验预测 (均值、精度)
    GaussianPosterior speech_prior_;
    GaussianPosterior noise_prior_;
    GaussianPosterior xi_smooth_prior_;

    SemPosteriors q_;
    ext::SigmoidGate switch_gate_;
    ext::SigmoidGate gain_gate_;

    bool complete_ = false;
    SemInferenceResult result_;
};

}  // namespace sem
}  // namespace vha

#endif  // SEM_INFERENCE_HPP
