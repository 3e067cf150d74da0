#ifndef VHA_TYPES_HPP
#define VHA_TYPES_HPP

#include <cstddef>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vha {

// =============================================================================
// Hearing Aid Type (助听器类型)
// =============================================================================

enum class HearingAidType {
    BASELINE,       // 单位增益 (仅 WFB 分析/合成)
    SEM,            // Spectral Enhancement Model 降噪
};

inline const char* hearingAidTypeToString(HearingAidType type) {
    switch (type) {
        case HearingAidType::BASELINE: return "BaselineHearingAid";
        case HearingAidType::SEM:      return "SEMHearingAid";
        default:                       return "unknown";
    }
}

// =============================================================================
// Backend Type (增益后端类型)
// =============================================================================

enum class BackendType {
    BASELINE,       // 单位增益
    SEM,            // SEM 变分推理
};

inline const char* backendTypeToString(BackendType type) {
    switch (type) {
        case BackendType::BASELINE: return "BaselineBackend";
        case BackendType::SEM:      return "SEMBackend";
        default:                    return "unknown";
    }
}

inline BackendType backendTypeFor(HearingAidType type) {
    return type == HearingAidType::BASELINE ? BackendType::BASELINE : BackendType::SEM;
}

// =============================================================================
// Processing Strategy (处理策略)
// =============================================================================

enum class ProcessingStrategy {
    STREAMING,          // 逐块实时处理
    BATCH_ONLINE,       // 整段输入, 逐块顺序处理
    BATCH_OFFLINE,      // 整段输入, 先前端再后端再合成
};

inline const char* processingStrategyToString(ProcessingStrategy strategy) {
    switch (strategy) {
        case ProcessingStrategy::STREAMING:     return "streaming";
        case ProcessingStrategy::BATCH_ONLINE:  return "batch_online";
        case ProcessingStrategy::BATCH_OFFLINE: return "batch_offline";
        default:                                return "unknown";
    }
}

// =============================================================================
// SEM State Field (SEM 状态字段)
// =============================================================================

enum class StateField {
    SPEECH,
    NOISE,
    XI_SMOOTH,
    GAIN,
    VAD,
    SWITCH,         // VAD 的别名
};

inline const char* stateFieldToString(StateField field) {
    switch (field) {
        case StateField::SPEECH:    return "speech";
        case StateField::NOISE:     return "noise";
        case StateField::XI_SMOOTH: return "xi_smooth";
        case StateField::GAIN:      return "gain";
        case StateField::VAD:       return "vad";
        case StateField::SWITCH:    return "switch";
        default:                    return "unknown";
    }
}

// =============================================================================
// Smoothing Mode (SNR 平滑方式)
// =============================================================================

enum class SmoothingMode {
    NONE,           // sigmoid 门直接连接 ξ
    XI_SMOOTH,      // ξ 经过漏积分器平滑后再连接 sigmoid 门
};

inline const char* smoothingModeToString(SmoothingMode mode) {
    switch (mode) {
        case SmoothingMode::NONE:      return "none";
        case SmoothingMode::XI_SMOOTH: return "xi_smooth";
        default:                       return "unknown";
    }
}

// =============================================================================
// Error Code (错误码)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 配置错误 (1xx)
    INVALID_CONFIG = 100,
    MISSING_FIELD = 101,

    // 输入/数值错误 (2xx)
    INVALID_INPUT = 200,
    DOMAIN_ERROR = 201,

    // 运行时错误 (3xx)
    NOT_INITIALIZED = 300,
    PROCESSING_FAILED = 301,

    // 内部错误 (4xx)
    INTERNAL_ERROR = 400,
    FILE_READ_ERROR = 401,
    FILE_WRITE_ERROR = 402,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                return "OK";
        case ErrorCode::INVALID_CONFIG:    return "INVALID_CONFIG";
        case ErrorCode::MISSING_FIELD:     return "MISSING_FIELD";
        case ErrorCode::INVALID_INPUT:     return "INVALID_INPUT";
        case ErrorCode::DOMAIN_ERROR:      return "DOMAIN_ERROR";
        case ErrorCode::NOT_INITIALIZED:   return "NOT_INITIALIZED";
        case ErrorCode::PROCESSING_FAILED: return "PROCESSING_FAILED";
        case ErrorCode::INTERNAL_ERROR:    return "INTERNAL_ERROR";
        case ErrorCode::FILE_READ_ERROR:   return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR:  return "FILE_WRITE_ERROR";
        default:                           return "UNKNOWN";
    }
}

// =============================================================================
// Error Info (错误信息)
// =============================================================================

struct ErrorInfo {
    ErrorCode code;
    std::string message;
    std::string detail;  // 详细信息(调试用)

    bool isOk() const { return code == ErrorCode::OK; }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }
};

// =============================================================================
// Exceptions (异常类型)
// =============================================================================
//
// 核心算法内部通过异常报告错误, 由 HearingAid 工厂 / Vha::HearingAid 在边界处
// 转换为 ErrorInfo。
//

class VhaError : public std::runtime_error {
public:
    VhaError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

    ErrorInfo toErrorInfo() const {
        return ErrorInfo::error(code_, what());
    }

private:
    ErrorCode code_;
};

/// @brief 配置错误: 缺失字段、非法取值、长度不一致、s/n 顺序错误
class ConfigError : public VhaError {
public:
    explicit ConfigError(const std::string& message)
        : VhaError(ErrorCode::INVALID_CONFIG, message) {}
    ConfigError(ErrorCode code, const std::string& message)
        : VhaError(code, message) {}
};

/// @brief 数值退化: 负方差、非正 ζ²
class NumericalDomainError : public VhaError {
public:
    explicit NumericalDomainError(const std::string& message)
        : VhaError(ErrorCode::DOMAIN_ERROR, message) {}
};

/// @brief 内部不变量被破坏: 结构上不应出现的 NaN/Inf
class InternalInvariantError : public VhaError {
public:
    explicit InternalInvariantError(const std::string& message)
        : VhaError(ErrorCode::INTERNAL_ERROR, message) {}
};

/// @brief 处理边界的输入校验失败
class InputValidationError : public VhaError {
public:
    explicit InputValidationError(const std::string& message)
        : VhaError(ErrorCode::INVALID_INPUT, message) {}
};

// =============================================================================
// Audio Block (音频块)
// =============================================================================

struct AudioBlock {
    std::vector<double> samples;    // 单声道样本 (double)
    double sample_rate = 0.0;       // 采样率 (Hz)

    size_t size() const { return samples.size(); }

    bool isEmpty() const { return samples.empty(); }

    // 便捷方法: 获取时长 (毫秒)
    double getDurationMs() const {
        if (samples.empty() || sample_rate <= 0.0) return 0.0;
        return static_cast<double>(samples.size()) * 1000.0 / sample_rate;
    }

    static AudioBlock fromSamples(std::vector<double> data, double sample_rate) {
        AudioBlock block;
        block.samples = std::move(data);
        block.sample_rate = sample_rate;
        return block;
    }
};

// =============================================================================
// Matrix (行主序稠密矩阵)
// =============================================================================

struct Matrix {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<double> data;

    Matrix() = default;
    Matrix(size_t r, size_t c, double value = 0.0) : rows(r), cols(c), data(r * c, value) {}

    double& operator()(size_t r, size_t c) { return data[r * cols + c]; }
    double operator()(size_t r, size_t c) const { return data[r * cols + c]; }

    bool isEmpty() const { return data.empty(); }

    const double* rowPtr(size_t r) const { return data.data() + r * cols; }
    double* rowPtr(size_t r) { return data.data() + r * cols; }

    std::vector<double> row(size_t r) const {
        return std::vector<double>(rowPtr(r), rowPtr(r) + cols);
    }

    std::vector<double> column(size_t c) const {
        std::vector<double> result(rows);
        for (size_t r = 0; r < rows; ++r) {
            result[r] = data[r * cols + c];
        }
        return result;
    }

    void setRow(size_t r, const std::vector<double>& values) {
        for (size_t c = 0; c < cols && c < values.size(); ++c) {
            data[r * cols + c] = values[c];
        }
    }

    void setColumn(size_t c, const std::vector<double>& values) {
        for (size_t r = 0; r < rows && r < values.size(); ++r) {
            data[r * cols + c] = values[r];
        }
    }
};

}  // namespace vha

#endif  // VHA_TYPES_HPP
