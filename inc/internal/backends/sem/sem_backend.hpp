#ifndef SEM_BACKEND_HPP
#define SEM_BACKEND_HPP

#include <memory>
#include <string>
#include <vector>

#include "internal/backends/sem/sem_inference.hpp"
#include "internal/backends/sem/sem_types.hpp"
#include "internal/backends/spm_backend.hpp"

namespace vha {
namespace sem {

/// @brief 单频带处理输出
struct SemBandOutput {
    SemInferenceResult inference;
    std::vector<double> gains;      ///< max(P(w=1), threshold_lin)
};

// =============================================================================
// SEM Backend
// =============================================================================
//
// 每个频带独立推理, 状态按频带保存并在每次处理后写回,
// 因此同一实例只能服务一个音频流。
//

class SemBackend : public ISpmBackend {
public:
    SemBackend();

    /// @brief 直接构建 (失败抛出 ConfigError)
    /// @param fs 算法采样率 (1/ms)
    SemBackend(const SemBackendConfig& config, double fs, int nbands);

    ~SemBackend() override;

    // ISpmBackend
    ErrorInfo initialize(const HearingAidConfig& config) override;
    void shutdown() override;
    bool isInitialized() const override { return params_ != nullptr; }
    BackendType getType() const override { return BackendType::SEM; }
    std::string getName() const override { return name_; }
    int getNbands() const override;
    std::vector<double> computeGains(const std::vector<double>& powerdb) override;
    SemResults runBackend(const Matrix& powerdb) override;

    // -------------------------------------------------------------------------
    // 单频带处理
    // -------------------------------------------------------------------------

    /**
     * @brief 准备一个频带的推理
     *
     * autostart 时返回已执行的推理, 否则返回未执行的推理,
     * 首次读取 result() 时才执行。
     * @param powerdb 该频带的功率序列 (dB)
     * @param band 频带索引 [0, nbands)
     * @throws InputValidationError 频带越界, 序列为空或含 NaN/Inf
     */
    std::unique_ptr<SemInference> prepareInference(const std::vector<double>& powerdb, int band) const;

    /**
     * @brief 处理一个频带的功率序列
     *
     * 后验须写回状态, 因此返回时推理总已执行, 结果与 autostart 无关。
     * 延迟执行只能通过 prepareInference() 获得。
     * 序列末尾的后验写回状态, 下一次调用由此继续。
     */
    SemBandOutput processBackend(const std::vector<double>& powerdb, int band);

    // -------------------------------------------------------------------------
    // 状态更新
    // -------------------------------------------------------------------------

    /// @brief 高斯源 (SPEECH / NOISE / XI_SMOOTH) 的均值与精度
    void updateState(StateField field, int band, double mean, double precision);

    /// @brief 伯努利状态 (GAIN / VAD / SWITCH) 的 p, q = 1 - p
    void updateState(StateField field, int band, double probability);

    /// @brief 高斯源的转移精度
    void updateTransition(StateField field, int band, double precision);

    // -------------------------------------------------------------------------
    // 访问器
    // -------------------------------------------------------------------------

    const SemParameters& getParameters() const;
    const SemStates& getStates() const;

    double getGainThresholdDb() const { return getParameters().modules.gain.threshold_db; }
    double getGainThresholdLin() const { return getParameters().modules.gain.threshold_lin; }
    double getVadThresholdDb() const { return getParameters().modules.vad.threshold_db; }
    double getSamplingFrequency() const { return getParameters().modules.sampling_frequency; }

private:
    void build(const SemBackendConfig& config, double fs, int nbands);
    void checkBand(int band) const;
    BliState& source(StateField field);
    void writeBack(int band, const SemInferenceResult& result, const std::vector<double>& gains);

    std::string name_ = "SEM";
    std::unique_ptr<SemParameters> params_;
    std::unique_ptr<SemStates> states_;
};

}  // namespace sem
}  // namespace vha

#endif  // SEM_BACKEND_HPP
