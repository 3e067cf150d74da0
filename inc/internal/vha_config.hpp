#ifndef VHA_CONFIG_HPP
#define VHA_CONFIG_HPP

#include <cmath>

#include <string>

#include "vha_types.hpp"

namespace vha {

// =============================================================================
// Frontend Config (WFB 前端配置)
// =============================================================================

struct FrontendConfig {
    std::string type = "WFBFrontend";
    std::string name = "WFB";

    int nbands = 17;                                ///< 频带数 (>= 2)
    double fs = 16000.0;                            ///< 采样率 (Hz)
    double spl_reference_db = 100.0;                ///< 满量程对应的参考声压级 (dB)
    double spl_power_estimate_lower_bound_db = 30.0; ///< 功率估计下限 (dB)
    double apcoefficient = 0.5;                     ///< 全通滤波器系数 (|a| < 1)
    double buffer_size_s = 0.0015;                  ///< 块长 (秒)

    /// @brief 块长 (样本数)
    int bufferSize() const {
        return static_cast<int>(std::lround(buffer_size_s * fs));
    }

    /// @brief FFT 长度 nfft = 2 * (nbands - 1)
    int nfft() const {
        return 2 * (nbands - 1);
    }

    /// @brief 后端算法采样率 (每毫秒的块数)
    double algorithmSampleRate() const {
        return 1.0 / (buffer_size_s * 1000.0);
    }

    ErrorInfo validate() const {
        if (nbands < 2) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "frontend.nbands must be >= 2, got " + std::to_string(nbands));
        }
        if (!(fs > 0.0)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "frontend.fs must be positive, got " + std::to_string(fs));
        }
        if (!(std::abs(apcoefficient) < 1.0)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "frontend.apcoefficient must satisfy |a| < 1, got " + std::to_string(apcoefficient));
        }
        if (!(buffer_size_s > 0.0)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "frontend.buffer_size_s must be positive, got " + std::to_string(buffer_size_s));
        }
        if (bufferSize() < 1) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "frontend.buffer_size_s * fs must be at least one sample");
        }
        if (!std::isfinite(spl_reference_db) || !std::isfinite(spl_power_estimate_lower_bound_db)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "frontend SPL calibration values must be finite");
        }
        return ErrorInfo::ok();
    }
};

// =============================================================================
// SEM Backend Config (SEM 后端配置)
// =============================================================================

struct SemBackendConfig {
    std::string type = "SEMBackend";
    std::string name = "SEM";

    // -------------------------------------------------------------------------
    // 推理
    // -------------------------------------------------------------------------

    int iterations = 2;                 ///< 每个时间步的变分迭代次数
    bool autostart = true;              ///< 立即执行推理 (false 则首次读取结果时执行)
    bool free_energy = false;           ///< 记录自由能

    // -------------------------------------------------------------------------
    // 时间常数 (ms, 90% 衰减)
    // -------------------------------------------------------------------------

    double tau_speech_ms = 5.0;
    double tau_noise_ms = 10000.0;
    double tau_xnr_ms = 200.0;

    // -------------------------------------------------------------------------
    // 先验
    // -------------------------------------------------------------------------

    double speech_prior_mean = 80.0;
    double speech_prior_precision = 1.0;
    double noise_prior_mean = 70.0;
    double noise_prior_precision = 1.0;

    // -------------------------------------------------------------------------
    // Sigmoid 门
    // -------------------------------------------------------------------------

    double gain_slope = 1.0;
    double gain_threshold_db = 12.0;    ///< 增益阈值 (GMIN, dB)
    double switch_slope = 1.0;
    double switch_threshold_db = 4.0;   ///< VAD 阈值 (dB)

    SmoothingMode smoothing = SmoothingMode::XI_SMOOTH;

    ErrorInfo validate() const {
        if (iterations <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "backend.inference.iterations must be > 0, got " + std::to_string(iterations));
        }
        if (!(tau_speech_ms > 0.0)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "backend.filters.time_constants90.s must be positive, got " + std::to_string(tau_speech_ms));
        }
        if (!(tau_noise_ms > 0.0)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "backend.filters.time_constants90.n must be positive, got " + std::to_string(tau_noise_ms));
        }
        if (!(tau_xnr_ms > 0.0)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "backend.filters.time_constants90.xnr must be positive, got " + std::to_string(tau_xnr_ms));
        }
        if (!(tau_speech_ms < tau_noise_ms)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "backend.filters.time_constants90: s (" + std::to_string(tau_speech_ms) +
                ") must be smaller than n (" + std::to_string(tau_noise_ms) +
                "), the speech tracker has to be faster than the noise tracker");
        }
        if (!(speech_prior_precision > 0.0)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "backend.priors.speech.precision must be positive, got " +
                std::to_string(speech_prior_precision));
        }
        if (!(noise_prior_precision > 0.0)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "backend.priors.noise.precision must be positive, got " +
                std::to_string(noise_prior_precision));
        }
        if (!std::isfinite(speech_prior_mean) || !std::isfinite(noise_prior_mean)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "backend.priors means must be finite");
        }
        if (!std::isfinite(gain_threshold_db) || !std::isfinite(switch_threshold_db)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "backend gain/switch thresholds must be finite");
        }
        if (!(gain_slope > 0.0) || !(switch_slope > 0.0)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "backend gain/switch slopes must be positive");
        }
        return ErrorInfo::ok();
    }
};

// =============================================================================
// Hearing Aid Config (助听器配置)
// =============================================================================

struct HearingAidConfig {
    HearingAidType type = HearingAidType::SEM;
    std::string name = "SEM Hearing Aid";
    ProcessingStrategy processing_strategy = ProcessingStrategy::BATCH_OFFLINE;

    FrontendConfig frontend;
    SemBackendConfig backend;       ///< 仅 SEM 使用

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 单位增益基线配置
    static HearingAidConfig Baseline() {
        HearingAidConfig config;
        config.type = HearingAidType::BASELINE;
        config.name = "Baseline Hearing Aid";
        config.processing_strategy = ProcessingStrategy::BATCH_ONLINE;
        return config;
    }

    /// @brief SEM 降噪配置
    static HearingAidConfig Sem() {
        return HearingAidConfig();
    }

    /// @brief 按类型返回默认处理策略
    static ProcessingStrategy defaultStrategy(HearingAidType type) {
        return type == HearingAidType::BASELINE ? ProcessingStrategy::BATCH_ONLINE
                                                : ProcessingStrategy::BATCH_OFFLINE;
    }

    // -------------------------------------------------------------------------
    // 链式配置
    // -------------------------------------------------------------------------

    HearingAidConfig withStrategy(ProcessingStrategy strategy) const {
        auto c = *this;
        c.processing_strategy = strategy;
        return c;
    }

    HearingAidConfig withBands(int nbands) const {
        auto c = *this;
        c.frontend.nbands = nbands;
        return c;
    }

    HearingAidConfig withSampleRate(double fs) const {
        auto c = *this;
        c.frontend.fs = fs;
        return c;
    }

    HearingAidConfig withTimeConstants(double speech_ms, double noise_ms) const {
        auto c = *this;
        c.backend.tau_speech_ms = speech_ms;
        c.backend.tau_noise_ms = noise_ms;
        return c;
    }

    HearingAidConfig withGainThreshold(double threshold_db) const {
        auto c = *this;
        c.backend.gain_threshold_db = threshold_db;
        return c;
    }

    HearingAidConfig withIterations(int iterations) const {
        auto c = *this;
        c.backend.iterations = iterations;
        return c;
    }

    HearingAidConfig withSmoothing(SmoothingMode mode) const {
        auto c = *this;
        c.backend.smoothing = mode;
        return c;
    }

    /// @brief 验证配置是否有效
    /// @return 错误信息
    ErrorInfo validate() const {
        auto err = frontend.validate();
        if (!err.isOk()) {
            return err;
        }
        if (type == HearingAidType::SEM) {
            return backend.validate();
        }
        return ErrorInfo::ok();
    }
};

}  // namespace vha

#endif  // VHA_CONFIG_HPP
