#include "internal/backends/baseline/baseline_backend.hpp"

#include <vector>

namespace vha {

ErrorInfo BaselineBackend::initialize(const HearingAidConfig& config) {
    auto err = config.frontend.validate();
    if (!err.isOk()) {
        return err;
    }
    nbands_ = config.frontend.nbands;
    return ErrorInfo::ok();
}

std::vector<double> BaselineBackend::computeGains(const std::vector<double>& powerdb) {
    validatePowerVector(powerdb, nbands_);
    return std::vector<double>(nbands_, 1.0);
}

SemResults BaselineBackend::runBackend(const Matrix& powerdb) {
    validatePowerMatrix(powerdb, nbands_);
    SemResults results;
    results.gains = Matrix(powerdb.rows, nbands_, 1.0);
    return results;
}

}  // namespace vha
