#ifndef VHA_API_HPP
#define VHA_API_HPP

/**
 * VhaSDK - Virtual Hearing Aid SDK
 *
 * 单声道语音增强: 频率弯折滤波器组 (WFB) + SEM 变分推理降噪。
 *
 * 使用示例 1 - 整段处理:
 *
 *   Vha::HearingAid ha(Vha::HearingAidConfig::Sem());
 *   auto result = ha.Process(samples, 16000);
 *   if (result && result->IsSuccess()) {
 *       result->SaveToFile("enhanced.wav");
 *   }
 *
 * 使用示例 2 - 从 YAML 配置文件创建:
 *
 *   Vha::HearingAid ha("config/sem_config.yaml");
 *
 * 使用示例 3 - 流式处理 (每次一个块, 块长 = GetBufferSize()):
 *
 *   ha.SetProcessingStrategy(Vha::ProcessingStrategy::STREAMING);
 *   for (const auto& block : blocks) {
 *       auto out = ha.ProcessBlock(block, 16000);
 *   }
 */

#include <cstdint>

#include <memory>
#include <string>
#include <vector>

namespace Vha {

// =============================================================================
// HearingAidType - 助听器类型
// =============================================================================

enum class HearingAidType {
    BASELINE,           ///< 单位增益 (仅 WFB 分析/合成)
    SEM,                ///< SEM 降噪
};

// =============================================================================
// ProcessingStrategy - 处理策略
// =============================================================================

enum class ProcessingStrategy {
    STREAMING,          ///< 逐块实时处理
    BATCH_ONLINE,       ///< 整段输入, 逐块顺序处理
    BATCH_OFFLINE,      ///< 整段输入, 前端 -> 后端 -> 合成
};

// =============================================================================
// HearingAidConfig - 助听器配置
// =============================================================================

struct HearingAidConfig {
    HearingAidType type = HearingAidType::SEM;
    ProcessingStrategy strategy = ProcessingStrategy::BATCH_OFFLINE;
    std::string name = "SEM Hearing Aid";

    // -------------------------------------------------------------------------
    // WFB 前端
    // -------------------------------------------------------------------------

    int nbands = 17;                    ///< 频带数 (>= 2)
    int sample_rate = 16000;            ///< 采样率 (Hz)
    double buffer_size_s = 0.0015;      ///< 块长 (秒)
    double apcoefficient = 0.5;         ///< 全通系数
    double spl_reference_db = 100.0;
    double spl_lower_bound_db = 30.0;

    // -------------------------------------------------------------------------
    // SEM 后端
    // -------------------------------------------------------------------------

    int iterations = 2;
    bool free_energy = false;
    double tau_speech_ms = 5.0;         ///< 语音时间常数 (必须小于噪声时间常数)
    double tau_noise_ms = 10000.0;
    double tau_xnr_ms = 200.0;
    double speech_prior_mean = 80.0;
    double noise_prior_mean = 70.0;
    double gain_threshold_db = 12.0;    ///< 最大抑制量 (GMIN)
    double switch_threshold_db = 4.0;   ///< VAD 阈值
    bool smooth_snr = true;             ///< sigmoid 门之前平滑 ξ

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 单位增益基线
    static HearingAidConfig Baseline() {
        HearingAidConfig config;
        config.type = HearingAidType::BASELINE;
        config.strategy = ProcessingStrategy::BATCH_ONLINE;
        config.name = "Baseline Hearing Aid";
        return config;
    }

    /// @brief SEM 降噪
    static HearingAidConfig Sem() {
        return HearingAidConfig();
    }

    // 链式配置
    HearingAidConfig withStrategy(ProcessingStrategy s) const {
        auto c = *this;
        c.strategy = s;
        return c;
    }

    HearingAidConfig withBands(int n) const {
        auto c = *this;
        c.nbands = n;
        return c;
    }

    HearingAidConfig withGainThreshold(double db) const {
        auto c = *this;
        c.gain_threshold_db = db;
        return c;
    }
};

// =============================================================================
// ProcessResult - 处理结果
// =============================================================================

class ProcessResult {
public:
    ProcessResult();
    ~ProcessResult();

    // 禁止拷贝，允许移动
    ProcessResult(const ProcessResult&) = delete;
    ProcessResult& operator=(const ProcessResult&) = delete;
    ProcessResult(ProcessResult&&) noexcept;
    ProcessResult& operator=(ProcessResult&&) noexcept;

    // -------------------------------------------------------------------------
    // 音频数据获取
    // -------------------------------------------------------------------------

    /// @brief 输出音频 (double, 与输入同采样率)
    const std::vector<double>& GetAudio() const;

    /// @brief 输出音频 (int16)
    std::vector<int16_t> GetAudioInt16() const;

    /// @brief 各块增益 [num_blocks][nbands], 仅 SEM 离线处理时非空
    const std::vector<std::vector<double>>& GetGains() const;

    // -------------------------------------------------------------------------
    // 状态检查
    // -------------------------------------------------------------------------

    bool IsSuccess() const;

    /// @brief 错误码名称, 成功为 "OK"
    std::string GetCode() const;

    std::string GetMessage() const;

    bool IsEmpty() const;

    // -------------------------------------------------------------------------
    // 性能指标
    // -------------------------------------------------------------------------

    int GetSampleRate() const;

    /// @brief 音频时长 (毫秒)
    double GetDurationMs() const;

    /// @brief 处理耗时 (毫秒)
    double GetProcessingTimeMs() const;

    /// @brief 实时率 (处理时间 / 音频时长)
    double GetRTF() const;

    // -------------------------------------------------------------------------
    // 文件操作
    // -------------------------------------------------------------------------

    /// @brief 保存为 16-bit PCM WAV
    bool SaveToFile(const std::string& file_path) const;

private:
    friend class HearingAid;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// HearingAid - 助听器
// =============================================================================

class HearingAid {
public:
    explicit HearingAid(const HearingAidConfig& config = HearingAidConfig::Sem());

    /// @brief 从 YAML 配置文件创建
    explicit HearingAid(const std::string& config_path);

    ~HearingAid();

    HearingAid(const HearingAid&) = delete;
    HearingAid& operator=(const HearingAid&) = delete;

    // =========================================================================
    // 处理
    // =========================================================================

    /// @brief 按当前处理策略处理一段音频
    /// @return 处理结果, 失败时 IsSuccess() 为 false 并携带错误信息
    std::shared_ptr<ProcessResult> Process(const std::vector<double>& samples, int sample_rate);

    /// @brief 流式处理一个块 (不超过 GetBufferSize() 个样本)
    std::shared_ptr<ProcessResult> ProcessBlock(const std::vector<double>& block, int sample_rate);

    /// @brief 读取音频文件, 必要时重采样到前端采样率, 处理后写出 WAV
    std::shared_ptr<ProcessResult> ProcessFile(const std::string& input_path, const std::string& output_path);

    // =========================================================================
    // 配置
    // =========================================================================

    void SetProcessingStrategy(ProcessingStrategy strategy);
    ProcessingStrategy GetProcessingStrategy() const;

    /// @brief 开关 Info 级日志
    static void SetVerbose(bool verbose);

    // =========================================================================
    // 辅助方法
    // =========================================================================

    bool IsInitialized() const;

    /// @brief 初始化失败原因
    std::string GetLastError() const;

    std::string GetName() const;
    HearingAidType GetType() const;
    int GetNumBands() const;
    int GetSampleRate() const;
    int GetBufferSize() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// 音频工具
// =============================================================================

/**
 * @brief 读取音频文件, 多声道混为单声道, 必要时重采样
 * @param path 文件路径
 * @param sample_rate 目标采样率 (Hz)
 * @param samples 输出样本
 * @param error 失败原因 (可选)
 * @return 是否成功
 */
bool LoadAudio(const std::string& path, int sample_rate, std::vector<double>& samples,
               std::string* error = nullptr);

/// @brief 保存为 16-bit PCM 单声道 WAV
bool SaveAudio(const std::vector<double>& samples, int sample_rate, const std::string& path);

}  // namespace Vha

#endif  // VHA_API_HPP
