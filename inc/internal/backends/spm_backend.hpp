#ifndef SPM_BACKEND_HPP
#define SPM_BACKEND_HPP

#include <memory>
#include <string>
#include <vector>

#include "internal/backends/sem/sem_inference.hpp"
#include "internal/vha_config.hpp"
#include "internal/vha_types.hpp"

namespace vha {

// =============================================================================
// Backend Results (整段处理结果)
// =============================================================================

struct SemResults {
    Matrix gains;                                       ///< [num_blocks x nbands], 已施加谱底
    std::vector<sem::SemInferenceResult> inference;     ///< 按频带的推理历史 (基线为空)

    size_t numBlocks() const { return gains.rows; }
    size_t numBands() const { return gains.cols; }
};

// =============================================================================
// SPM Backend Interface (信号处理模型后端抽象接口)
// =============================================================================
//
// 前端给出每块各频带功率 (dB), 后端返回各频带线性增益。
//
// 已实现的后端:
// - BaselineBackend: 单位增益
// - SemBackend:      SEM 变分推理 + 谱底
//

class ISpmBackend {
public:
    virtual ~ISpmBackend() = default;

    // -------------------------------------------------------------------------
    // 生命周期管理
    // -------------------------------------------------------------------------

    /// @brief 初始化后端
    /// @param config 助听器配置 (使用 frontend 与 backend 两部分)
    /// @return 错误信息, OK表示成功
    virtual ErrorInfo initialize(const HearingAidConfig& config) = 0;

    virtual void shutdown() = 0;

    virtual bool isInitialized() const = 0;

    // -------------------------------------------------------------------------
    // 后端信息
    // -------------------------------------------------------------------------

    virtual BackendType getType() const = 0;

    /// @brief 获取后端名称 (用于日志)
    virtual std::string getName() const = 0;

    virtual int getNbands() const = 0;

    // -------------------------------------------------------------------------
    // 增益计算
    // -------------------------------------------------------------------------

    /// @brief 单块: 每个频带一个功率值 -> 每个频带一个增益
    virtual std::vector<double> computeGains(const std::vector<double>& powerdb) = 0;

    /// @brief 整段: [num_blocks x nbands] 功率矩阵 -> 增益与诊断信息
    virtual SemResults runBackend(const Matrix& powerdb) = 0;
};

// =============================================================================
// Backend Factory (后端工厂)
// =============================================================================

class SpmBackendFactory {
public:
    /// @brief 创建后端实例 (未初始化)
    /// @return 后端实例, 未知类型返回nullptr
    static std::unique_ptr<ISpmBackend> create(BackendType type);

    static bool isAvailable(BackendType type);

    static std::vector<BackendType> getAvailableBackends();

    static const char* getBackendName(BackendType type) {
        return backendTypeToString(type);
    }
};

/// @brief 校验功率矩阵: 非空、列数为 nbands、无 NaN/Inf
void validatePowerMatrix(const Matrix& powerdb, int nbands);

/// @brief 校验单块功率向量
void validatePowerVector(const std::vector<double>& powerdb, int nbands);

}  // namespace vha

#endif  // SPM_BACKEND_HPP
