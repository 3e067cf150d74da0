#ifndef SIGMOID_NODE_HPP
#define SIGMOID_NODE_HPP

/**
 * SigmoidNode - logistic 因子节点 (Jaakkola-Jordan 变分下界)
 *
 *   out ~ Sigmoid(in, ζ)
 *
 * in 为连续高斯隐变量, out 为二值 (两类 categorical), ζ 为下界的辅助参数。
 * 提供三个方向的消息更新规则与平均能量 (自由能贡献)。
 */

#include <array>
#include <string>

namespace vha {
namespace ext {

// =============================================================================
// 常量
// =============================================================================

constexpr double kLambdaZetaLimit = 1e-8;   // |ζ| 小于此值时取 λ 的极限 0.125
constexpr double kLambdaAtZero = 0.125;
constexpr double kCategoricalTiny = 1e-12;  // categorical 概率的截断

// =============================================================================
// 消息 / 分布
// =============================================================================

/// @brief 自然参数形式的高斯消息 (加权均值 ξ = precision * mean)
struct GaussianWeightedMeanPrecision {
    double weighted_mean = 0.0;
    double precision = 0.0;

    double mean() const { return weighted_mean / precision; }
    double variance() const { return 1.0 / precision; }
};

/// @brief 两类 categorical, probs[0] = P(out = 1)
struct Categorical2 {
    std::array<double, 2> probs{{0.5, 0.5}};

    double pOne() const { return probs[0]; }
};

// =============================================================================
// 规则
// =============================================================================

/// @brief λ(ζ) = 0.5 (σ(ζ) - 0.5) / ζ, ζ -> 0 时为 0.125
double sigmoidLambda(double zeta);

/**
 * @brief 指向连续输入 in 的消息
 * @param p_out_one P(out = 1), 来自 categorical 或点质量
 * @param zeta 当前下界参数
 * @return NormalWeightedMeanPrecision(P(out=1) - 0.5, 2λ)
 */
GaussianWeightedMeanPrecision ruleIn(double p_out_one, double zeta);

/**
 * @brief 指向离散输出 out 的消息
 * @param m_in q(in) 的均值
 * @return [σ(m), 1-σ(m)], 截断到 [tiny, 1-tiny] 后重新归一化
 */
Categorical2 ruleOut(double m_in);

/**
 * @brief 下界参数 ζ 的最优值 sqrt(m² + v)
 * @throws InternalInvariantError m, v 或 ζ² 非有限
 * @throws NumericalDomainError v < 0 或 ζ² <= 0
 */
double ruleZeta(double m_in, double v_in);

/**
 * @brief 平均能量
 *
 *   U = -(m_in m_out - softplus(-ζ) - 0.5 (m_in + ζ) - λ (m_in² + v_in - ζ²))
 *
 * @param m_out P(out = 1) (categorical) 或点质量取值
 * @throws InternalInvariantError 任一中间量非有限, 消息包含全部输入与中间量
 */
double averageEnergy(double m_out, double m_in, double v_in, double zeta);

// =============================================================================
// SigmoidGate - 带阈值与斜率的 sigmoid 门
// =============================================================================
//
// 把节点输入 in = slope * (g - threshold) 表示为对隐变量 g 的消息,
// 供 SEM 的 VAD 门 (π_switch) 和增益门 (w) 使用。
//

class SigmoidGate {
public:
    SigmoidGate(double threshold, double slope = 1.0, double zeta = 1.0);

    /// @brief 指向 g 的高斯消息
    GaussianWeightedMeanPrecision messageToLatent(double p_out_one) const;

    /// @brief 指向输出的 categorical
    Categorical2 messageToOutput(double m_g) const;

    /// @brief 用 q(g) 更新 ζ
    void updateZeta(double m_g, double v_g);

    /// @brief 该门的平均能量
    double averageEnergy(double p_out_one, double m_g, double v_g) const;

    double zeta() const { return zeta_; }
    void setZeta(double zeta) { zeta_ = zeta; }
    double threshold() const { return threshold_; }
    double slope() const { return slope_; }

private:
    double threshold_;
    double slope_;
    double zeta_;
};

}  // namespace ext
}  // namespace vha

#endif  // SIGMOID_NODE_HPP
