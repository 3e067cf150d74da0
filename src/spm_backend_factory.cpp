#include "internal/backends/spm_backend.hpp"

#include <cmath>

#include <memory>
#include <string>
#include <vector>

#include "internal/backends/baseline/baseline_backend.hpp"
#include "internal/backends/sem/sem_backend.hpp"

namespace vha {

// =============================================================================
// SpmBackendFactory 实现
// =============================================================================

std::unique_ptr<ISpmBackend> SpmBackendFactory::create(BackendType type) {
    switch (type) {
        case BackendType::BASELINE:
            return std::make_unique<BaselineBackend>();

        case BackendType::SEM:
            return std::make_unique<sem::SemBackend>();

        default:
            return nullptr;
    }
}

bool SpmBackendFactory::isAvailable(BackendType type) {
    switch (type) {
        case BackendType::BASELINE:
        case BackendType::SEM:
            return true;

        default:
            return false;
    }
}

std::vector<BackendType> SpmBackendFactory::getAvailableBackends() {
    return {BackendType::BASELINE, BackendType::SEM};
}

// =============================================================================
// 输入校验
// =============================================================================

void validatePowerMatrix(const Matrix& powerdb, int nbands) {
    if (powerdb.isEmpty()) {
        throw InputValidationError("power matrix is empty");
    }
    if (static_cast<int>(powerdb.cols) != nbands) {
        throw InputValidationError("power matrix has " + std::to_string(powerdb.cols) +
            " columns, expected " + std::to_string(nbands) + " bands");
    }
    for (size_t r = 0; r < powerdb.rows; ++r) {
        for (size_t c = 0; c < powerdb.cols; ++c) {
            if (!std::isfinite(powerdb(r, c))) {
                throw InputValidationError("power matrix contains a non-finite value at block " +
                    std::to_string(r) + ", band " + std::to_string(c));
            }
        }
    }
}

void validatePowerVector(const std::vector<double>& powerdb, int nbands) {
    if (static_cast<int>(powerdb.size()) != nbands) {
        throw InputValidationError("power vector has " + std::to_string(powerdb.size()) +
            " entries, expected " + std::to_string(nbands) + " bands");
    }
    for (size_t b = 0; b < powerdb.size(); ++b) {
        if (!std::isfinite(powerdb[b])) {
            throw InputValidationError("power vector contains a non-finite value at band " + std::to_string(b));
        }
    }
}

}  // namespace vha
