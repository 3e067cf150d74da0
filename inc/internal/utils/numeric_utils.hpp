#ifndef NUMERIC_UTILS_HPP
#define NUMERIC_UTILS_HPP

/**
 * NumericUtils - 数值工具模块
 *
 * 时间常数/遗忘因子换算, Gamma 超参数, dB 换算, logistic 函数。
 */

#include <utility>
#include <vector>

namespace vha {
namespace utils {

// =============================================================================
// 时间常数 / 遗忘因子
// =============================================================================

/**
 * @brief 90% 时间常数转换为遗忘因子
 * @param tau 时间常数 (ms)
 * @param fs 采样率 (1/ms)
 * @return 遗忘因子 λ = 1 - exp(-1 / ((tau / 2.3) * fs + eps)), 取值 (0, 1)
 */
double tau2ff(double tau, double fs);

/**
 * @brief 时间常数对应的截止频率 (Hz)
 * @param tau 时间常数 (ms)
 */
double calculateFc(double tau);

/// @brief 按语音存在概率混合两个遗忘因子: λs θ + λn (1 - θ)
double calculateLambda(double lambda_s, double lambda_n, double theta);

/// @brief 遗忘因子对应的过程方差 λ² / (1 - λ)
double lambdaToProcessVar(double lambda);

/// @brief 遗忘因子对应的观测方差 1 / λ
double lambdaToObservationVar(double lambda);

/**
 * @brief 由期望精度生成 Gamma 分布 (shape, rate)
 * @param expected_tau 期望精度
 * @param strength 先验强度 (shape)
 */
std::pair<double, double> gammaHyperparametersShapeRate(double expected_tau, double strength = 1.0);

// =============================================================================
// dB 换算
// =============================================================================

double dbToLinear(double db);
double linearToDb(double lin);
std::vector<double> db2lin(const std::vector<double>& db);

// =============================================================================
// Logistic
// =============================================================================

/// @brief 数值稳定的 logistic 函数
double logistic(double x);

/// @brief 数值稳定的 softplus log(1 + exp(x))
double softplus(double x);

/// @brief 数值稳定的 log(exp(a) + exp(b))
double logSumExp(double a, double b);

}  // namespace utils
}  // namespace vha

#endif  // NUMERIC_UTILS_HPP
