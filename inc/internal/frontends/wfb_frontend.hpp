#ifndef WFB_FRONTEND_HPP
#define WFB_FRONTEND_HPP

/**
 * WfbFrontend - 频率弯折滤波器组 (Warped-Frequency Filter Bank)
 *
 * 分析: 一阶全通级联 -> 加窗 FFT -> 各频带功率 (dB)
 * 合成: 频带增益 -> 合成矩阵 -> 对称 FIR 权重 -> taps · weights
 *
 * 每个音频流独占一个实例, 状态 (环形缓冲、全通状态) 依赖历史样本。
 */

#include <fftw3.h>

#include <vector>

#include "internal/vha_config.hpp"
#include "internal/vha_types.hpp"

namespace vha {
namespace frontend {

// =============================================================================
// 常量
// =============================================================================

constexpr double kEdgeBandAdjustmentDb = 3.0103;   // 单边谱折叠的边缘频带修正
constexpr double kPowerScaleFactor = 10.0;

// =============================================================================
// Sample Ring Buffer (固定容量环形缓冲, 构造时清零)
// =============================================================================

class SampleRingBuffer {
public:
    explicit SampleRingBuffer(size_t capacity);

    void push(double sample);

    /// @brief 第 n 个样本, n = 0 为最旧
    double operator[](size_t n) const;

    size_t capacity() const { return data_.size(); }

private:
    std::vector<double> data_;
    size_t head_ = 0;   // 下一个写入位置 (同时是最旧样本的位置)
};

// =============================================================================
// 工具函数
// =============================================================================

/// @brief 归一化 Hann 窗 (峰值为 1), w[k] = 0.5 (1 - cos(2πk/(n-1)))
std::vector<double> calculateWindow(int nfft);

/// @brief 各频带 dB 校准, 边缘频带减去 3.0103 dB
std::vector<double> calculateCalibrationDb(const std::vector<double>& window,
                                           int nbands,
                                           double spl_reference_db);

/// @brief 全通弯折后各 FFT bin 的中心频率 (Hz)
std::vector<double> calculateCenterFrequencies(double apcoefficient, int nfft, double fs);

/**
 * @brief 合成矩阵 [nfft/2 x nbands]
 *
 * 实部 DFT 基 (cos(2πjk/nfft)/nfft) 乘以频带扩展矩阵 (镜像非边缘频带),
 * 取前 nfft/2 行并倒序, 再乘以 Hann(nfft-1) 的前 nfft/2 点。
 */
Matrix calculateSynthesisMatrix(int nbands, int nfft);

/// @brief weights = [w; 0; reverse(w[0 .. end-1])], w = S · gains
std::vector<double> buildWeights(const Matrix& synthesis_matrix, const std::vector<double>& gains);

/// @brief 以给定 taps 快照合成一个块: taps · weights 的最后 buffer_size 个样本
std::vector<double> synthesizeBlock(const Matrix& taps,
                                    const Matrix& synthesis_matrix,
                                    const std::vector<double>& gains,
                                    int buffer_size);

// =============================================================================
// WFB Frontend
// =============================================================================

class WfbFrontend {
public:
    explicit WfbFrontend(const FrontendConfig& config);
    ~WfbFrontend();

    WfbFrontend(const WfbFrontend&) = delete;
    WfbFrontend& operator=(const WfbFrontend&) = delete;

    // -------------------------------------------------------------------------
    // 分析 / 合成
    // -------------------------------------------------------------------------

    /**
     * @brief 处理一个音频块
     * @param block 输入块 (采样率需与前端一致)
     * @return 各频带功率 (dB), 长度 nbands
     *
     * 样本压入环形缓冲 (覆盖最旧样本), 重新计算全通级联 taps,
     * 对最后一行 taps 加窗做 FFT 得到功率。
     */
    std::vector<double> processFrontend(const AudioBlock& block);
    std::vector<double> processFrontend(const std::vector<double>& samples);

    /// @brief 由频带线性增益重建合成权重 (增益不做截断)
    void updateWeights(const std::vector<double>& gains);

    /// @brief taps · weights 的最后 buffer_size 个样本
    /// @note 调用前应已用当前块的增益调用 updateWeights
    AudioBlock synthesize() const;

    // -------------------------------------------------------------------------
    // 访问器
    // -------------------------------------------------------------------------

    int getNbands() const { return config_.nbands; }
    int getNfft() const { return nfft_; }
    int getBufferSize() const { return buffer_size_; }
    double getFs() const { return config_.fs; }
    double getApCoefficient() const { return config_.apcoefficient; }
    const FrontendConfig& getConfig() const { return config_; }

    const Matrix& getTaps() const { return taps_; }
    const std::vector<double>& getTemp() const { return temp_; }
    const std::vector<double>& getWeights() const { return weights_; }
    const std::vector<double>& getWindow() const { return window_; }
    const std::vector<double>& getCalibrationDb() const { return calibration_db_; }
    const Matrix& getSynthesisMatrix() const { return synthesis_matrix_; }
    const SampleRingBuffer& getSampleBuffer() const { return sample_buffer_; }

    std::vector<double> getCenterFrequencies() const;

private:
    void allpassFilter();
    std::vector<double> computePower();
    std::vector<double> convertToDb(const std::vector<double>& power) const;

    FrontendConfig config_;
    int nfft_;
    int buffer_size_;

    SampleRingBuffer sample_buffer_;
    Matrix taps_;                       // [buffer_size x nfft]
    std::vector<double> temp_;          // 全通状态, 跨样本/跨块保留
    std::vector<double> weights_;       // [nfft]
    std::vector<double> window_;        // [nfft]
    std::vector<double> calibration_db_; // [nbands]
    Matrix synthesis_matrix_;           // [nfft/2 x nbands]

    // FFTW
    double* fft_in_ = nullptr;
    fftw_complex* fft_out_ = nullptr;
    fftw_plan plan_ = nullptr;
};

}  // namespace frontend
}  // namespace vha

#endif  // WFB_FRONTEND_HPP
