#include "internal/extensions/sigmoid_node.hpp"

#include <cmath>

#include <algorithm>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include "internal/utils/numeric_utils.hpp"
#include "internal/vha_types.hpp"

namespace vha {
namespace ext {

namespace {

std::string formatValues(std::initializer_list<std::pair<const char*, double>> values) {
    std::ostringstream oss;
    oss << std::setprecision(17);
    bool first = true;
    for (const auto& kv : values) {
        if (!first) oss << ", ";
        oss << kv.first << " = " << kv.second;
        first = false;
    }
    return oss.str();
}

}  // namespace

// =============================================================================
// 规则
// =============================================================================

double sigmoidLambda(double zeta) {
    if (!std::isfinite(zeta)) {
        throw InternalInvariantError("Non-finite ζ in Sigmoid λ: " + formatValues({{"ζ", zeta}}));
    }
    if (std::abs(zeta) < kLambdaZetaLimit) {
        return kLambdaAtZero;
    }
    return 0.5 * (utils::logistic(zeta) - 0.5) / zeta;
}

GaussianWeightedMeanPrecision ruleIn(double p_out_one, double zeta) {
    if (!std::isfinite(p_out_one)) {
        throw InternalInvariantError("Non-finite P(out=1) in Sigmoid(:in): " +
            formatValues({{"m_out", p_out_one}, {"ζ", zeta}}));
    }
    double lambda = sigmoidLambda(zeta);
    GaussianWeightedMeanPrecision msg;
    msg.weighted_mean = p_out_one - 0.5;
    msg.precision = 2.0 * lambda;
    return msg;
}

Categorical2 ruleOut(double m_in) {
    if (!std::isfinite(m_in)) {
        throw InternalInvariantError("Non-finite mean in Sigmoid(:out): " + formatValues({{"m_in", m_in}}));
    }
    double p = utils::logistic(m_in);
    double p1 = std::clamp(p, kCategoricalTiny, 1.0 - kCategoricalTiny);
    double p2 = std::clamp(1.0 - p, kCategoricalTiny, 1.0 - kCategoricalTiny);
    double total = p1 + p2;

    Categorical2 result;
    result.probs = {{p1 / total, p2 / total}};
    return result;
}

double ruleZeta(double m_in, double v_in) {
    if (!std::isfinite(m_in) || !std::isfinite(v_in)) {
        throw InternalInvariantError("Degenerate or invalid Gaussian in Sigmoid(:ζ): " +
            formatValues({{"mean", m_in}, {"variance", v_in}}));
    }
    if (v_in < 0.0) {
        throw NumericalDomainError("Negative variance in Sigmoid(:ζ): " +
            formatValues({{"variance", v_in}, {"mean", m_in}}));
    }
    double zeta_sq = m_in * m_in + v_in;
    if (!std::isfinite(zeta_sq)) {
        throw InternalInvariantError("Invalid ζ² in Sigmoid(:ζ): " +
            formatValues({{"ζ²", zeta_sq}, {"mean", m_in}, {"variance", v_in}}));
    }
    if (zeta_sq <= 0.0) {
        throw NumericalDomainError("Cannot take sqrt of non-positive ζ² in Sigmoid(:ζ): " +
            formatValues({{"ζ²", zeta_sq}, {"mean", m_in}, {"variance", v_in}}));
    }
    return std::sqrt(zeta_sq);
}

double averageEnergy(double m_out, double m_in, double v_in, double zeta) {
    if (!std::isfinite(m_out) || !std::isfinite(m_in) || !std::isfinite(v_in) || !std::isfinite(zeta)) {
        throw InternalInvariantError("Non-finite values in Sigmoid average energy: " +
            formatValues({{"m_out", m_out}, {"m_in", m_in}, {"v_in", v_in}, {"ζ", zeta}}));
    }

    double lambda = sigmoidLambda(zeta);

    double m_in_sq = m_in * m_in;
    double zeta_sq = zeta * zeta;
    if (!std::isfinite(m_in_sq) || !std::isfinite(zeta_sq)) {
        throw InternalInvariantError("Overflow in Sigmoid average energy: " +
            formatValues({{"m_in²", m_in_sq}, {"ζ²", zeta_sq}, {"m_in", m_in}, {"ζ", zeta}}));
    }

    double term1 = m_in * m_out;
    double term2 = utils::softplus(-zeta);
    double term3 = 0.5 * (m_in + zeta);
    double term4 = lambda * (m_in_sq + v_in - zeta_sq);
    if (!std::isfinite(term1) || !std::isfinite(term2) || !std::isfinite(term3) || !std::isfinite(term4)) {
        throw InternalInvariantError("Non-finite intermediate terms in Sigmoid average energy: " +
            formatValues({{"term1", term1}, {"term2", term2}, {"term3", term3}, {"term4", term4},
                          {"m_out", m_out}, {"m_in", m_in}, {"v_in", v_in}, {"ζ", zeta}, {"λ", lambda}}));
    }

    double energy = -(term1 - term2 - term3 - term4);
    if (!std::isfinite(energy)) {
        throw InternalInvariantError("Non-finite Sigmoid average energy: " +
            formatValues({{"U", energy}, {"m_out", m_out}, {"m_in", m_in}, {"v_in", v_in},
                          {"ζ", zeta}, {"λ", lambda}, {"term1", term1}, {"term2", term2},
                          {"term3", term3}, {"term4", term4}}));
    }
    return energy;
}

// =============================================================================
// SigmoidGate
// =============================================================================

SigmoidGate::SigmoidGate(double threshold, double slope, double zeta)
    : threshold_(threshold), slope_(slope), zeta_(zeta) {}

GaussianWeightedMeanPrecision SigmoidGate::messageToLatent(double p_out_one) const {
    // in = slope * (g - threshold)
    GaussianWeightedMeanPrecision in_msg = ruleIn(p_out_one, zeta_);
    GaussianWeightedMeanPrecision msg;
    msg.precision = slope_ * slope_ * in_msg.precision;
    msg.weighted_mean = slope_ * in_msg.weighted_mean + msg.precision * threshold_;
    return msg;
}

Categorical2 SigmoidGate::messageToOutput(double m_g) const {
    return ruleOut(slope_ * (m_g - threshold_));
}

void SigmoidGate::updateZeta(double m_g, double v_g) {
    zeta_ = ruleZeta(slope_ * (m_g - threshold_), slope_ * slope_ * v_g);
}

double SigmoidGate::averageEnergy(double p_out_one, double m_g, double v_g) const {
    return ext::averageEnergy(p_out_one, slope_ * (m_g - threshold_), slope_ * slope_ * v_g, zeta_);
}

}  // namespace ext
}  // namespace vha
