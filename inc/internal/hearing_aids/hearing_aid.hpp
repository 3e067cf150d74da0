#ifndef HEARING_AID_HPP
#define HEARING_AID_HPP

/**
 * HearingAid - WFB 前端 + 增益后端的处理流水线
 *
 * 每块: processFrontend -> computeGains -> updateWeights -> synthesize
 *
 * 处理策略:
 * - STREAMING:     每次调用处理一个块 (不超过 buffer_size 个样本)
 * - BATCH_ONLINE:  整段输入, 逐块顺序处理
 * - BATCH_OFFLINE: 整段输入, 先对所有块做前端分析, 再按频带整段推理, 最后逐块合成
 */

#include <memory>
#include <string>
#include <vector>

#include "internal/backends/spm_backend.hpp"
#include "internal/frontends/wfb_frontend.hpp"
#include "internal/vha_config.hpp"
#include "internal/vha_types.hpp"

namespace vha {

class HearingAid {
public:
    /// @throws ConfigError 配置无效
    explicit HearingAid(const HearingAidConfig& config);
    ~HearingAid();

    HearingAid(const HearingAid&) = delete;
    HearingAid& operator=(const HearingAid&) = delete;

    // -------------------------------------------------------------------------
    // 处理
    // -------------------------------------------------------------------------

    /// @brief 按当前处理策略处理
    AudioBlock process(const AudioBlock& signal);

    /// @brief 单块流水线, 返回 buffer_size 个样本
    AudioBlock processBlock(const AudioBlock& block);

    AudioBlock processStreaming(const AudioBlock& block);
    AudioBlock processOnline(const AudioBlock& signal);
    AudioBlock processOffline(const AudioBlock& signal);

    // -------------------------------------------------------------------------
    // 策略
    // -------------------------------------------------------------------------

    void setProcessingStrategy(ProcessingStrategy strategy) { strategy_ = strategy; }
    ProcessingStrategy getProcessingStrategy() const { return strategy_; }

    // -------------------------------------------------------------------------
    // 访问器
    // -------------------------------------------------------------------------

    HearingAidType getType() const { return config_.type; }
    const std::string& getName() const { return config_.name; }
    const HearingAidConfig& getConfig() const { return config_; }
    int getBufferSize() const { return frontend_->getBufferSize(); }
    int getNbands() const { return frontend_->getNbands(); }
    double getSampleRate() const { return frontend_->getFs(); }

    frontend::WfbFrontend& getFrontend() { return *frontend_; }
    ISpmBackend& getBackend() { return *backend_; }

    /// @brief 最近一块的增益 (逐块处理)
    const std::vector<double>& getLastGains() const { return last_gains_; }

    /// @brief 最近一次离线处理的结果, 基线或尚未离线处理时为 nullptr
    const SemResults* getLastResults() const { return last_results_.get(); }

private:
    void validateSignal(const AudioBlock& signal) const;
    void validateSynthesisInputs(const std::vector<Matrix>& taps_history, const Matrix& gains) const;

    HearingAidConfig config_;
    ProcessingStrategy strategy_;
    std::unique_ptr<frontend::WfbFrontend> frontend_;
    std::unique_ptr<ISpmBackend> backend_;

    std::vector<double> last_gains_;
    std::unique_ptr<SemResults> last_results_;
};

}  // namespace vha

#endif  // HEARING_AID_HPP
