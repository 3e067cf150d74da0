#ifndef BASELINE_BACKEND_HPP
#define BASELINE_BACKEND_HPP

#include <string>
#include <vector>

#include "internal/backends/spm_backend.hpp"

namespace vha {

// =============================================================================
// Baseline Backend (单位增益)
// =============================================================================
//
// 所有频带增益恒为 1, 输出只包含 WFB 分析/合成本身的失真。
//

class BaselineBackend : public ISpmBackend {
public:
    BaselineBackend() = default;
    ~BaselineBackend() override = default;

    ErrorInfo initialize(const HearingAidConfig& config) override;
    void shutdown() override { nbands_ = 0; }
    bool isInitialized() const override { return nbands_ > 0; }
    BackendType getType() const override { return BackendType::BASELINE; }
    std::string getName() const override { return "Baseline"; }
    int getNbands() const override { return nbands_; }

    std::vector<double> computeGains(const std::vector<double>& powerdb) override;
    SemResults runBackend(const Matrix& powerdb) override;

private:
    int nbands_ = 0;
};

}  // namespace vha

#endif  // BASELINE_BACKEND_HPP
