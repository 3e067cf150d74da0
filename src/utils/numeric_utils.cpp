#include "internal/utils/numeric_utils.hpp"

#include <cmath>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "internal/vha_types.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace vha {
namespace utils {

namespace {

constexpr double kEps = std::numeric_limits<double>::epsilon();
constexpr double kTau90Divisor = 2.3;   // ln(10): 90% 衰减
constexpr double kScaleFactorDb = 20.0;

}  // namespace

// =============================================================================
// 时间常数 / 遗忘因子
// =============================================================================

double tau2ff(double tau, double fs) {
    if (!(tau > 0.0) || !(fs > 0.0)) {
        throw ConfigError("tau2ff requires tau > 0 and fs > 0, got tau=" +
            std::to_string(tau) + ", fs=" + std::to_string(fs));
    }
    return 1.0 - std::exp(-1.0 / ((tau / kTau90Divisor) * fs + kEps));
}

double calculateFc(double tau) {
    if (!(tau > 0.0)) {
        throw ConfigError("calculateFc requires tau > 0, got " + std::to_string(tau));
    }
    // tau 单位为 ms
    return 1.0 / (2.0 * M_PI * (tau / kTau90Divisor / 1000.0));
}

double calculateLambda(double lambda_s, double lambda_n, double theta) {
    return lambda_s * theta + lambda_n * (1.0 - theta);
}

double lambdaToProcessVar(double lambda) {
    if (!(lambda > 0.0) || !(lambda < 1.0)) {
        throw ConfigError("forgetting factor must lie in (0, 1), got " + std::to_string(lambda));
    }
    return lambda * lambda / (1.0 - lambda);
}

double lambdaToObservationVar(double lambda) {
    if (!(lambda > 0.0)) {
        throw ConfigError("forgetting factor must be positive, got " + std::to_string(lambda));
    }
    return 1.0 / lambda;
}

std::pair<double, double> gammaHyperparametersShapeRate(double expected_tau, double strength) {
    if (!(expected_tau > 0.0) || !(strength > 0.0)) {
        throw ConfigError("Gamma hyperparameters require positive expectation and strength");
    }
    return {strength, strength / expected_tau};
}

// =============================================================================
// dB 换算
// =============================================================================

double dbToLinear(double db) {
    return std::pow(10.0, db / kScaleFactorDb);
}

double linearToDb(double lin) {
    return kScaleFactorDb * std::log10(lin);
}

std::vector<double> db2lin(const std::vector<double>& db) {
    std::vector<double> lin(db.size());
    for (size_t i = 0; i < db.size(); ++i) {
        lin[i] = dbToLinear(db[i]);
    }
    return lin;
}

// =============================================================================
// Logistic
// =============================================================================

double logistic(double x) {
    if (x >= 0.0) {
        return 1.0 / (1.0 + std::exp(-x));
    }
    double e = std::exp(x);
    return e / (1.0 + e);
}

double softplus(double x) {
    if (x > 0.0) {
        return x + std::log1p(std::exp(-x));
    }
    return std::log1p(std::exp(x));
}

double logSumExp(double a, double b) {
    double m = std::max(a, b);
    if (std::isinf(m) && m < 0.0) {
        return m;
    }
    return m + std::log(std::exp(a - m) + std::exp(b - m));
}

}  // namespace utils
}  // namespace vha
