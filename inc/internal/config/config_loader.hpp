#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

/**
 * ConfigLoader - YAML 配置加载
 *
 * 文件结构:
 *   parameters:
 *     hearingaid: {name, type, processing_strategy}
 *     frontend:   {nbands, fs, spl_reference_db, spl_power_estimate_lower_bound_db,
 *                  apcoefficient, buffer_size_s}
 *     backend:    {general: {name, type},
 *                  inference: {iterations, autostart, free_energy},
 *                  filters: {time_constants90: {s, n, xnr}},
 *                  priors: {speech: {mean, precision}, noise: {mean, precision}},
 *                  gain: {threshold}, switch: {threshold}, smoothing}
 *
 * 缺失的必需字段以 ConfigError (MISSING_FIELD) 报告, 消息包含完整的键路径。
 */

#include <string>

#include "internal/vha_config.hpp"
#include "internal/vha_types.hpp"

namespace vha {
namespace config {

/// @brief 从 YAML 文件加载并校验
/// @throws ConfigError 文件不可读 (FILE_READ_ERROR)、字段缺失或取值非法
HearingAidConfig loadHearingAidConfig(const std::string& path);

/// @brief 从 YAML 文本解析并校验
HearingAidConfig parseHearingAidConfig(const std::string& yaml_text);

/// @brief streaming|stream, batchprocessingonline|online|batch_online,
///        batchprocessingoffline|offline|batch_offline (不区分大小写)
ProcessingStrategy parseProcessingStrategy(const std::string& name);

/// @brief SEMHearingAid|SEM, BaselineHearingAid|Baseline (不区分大小写)
HearingAidType parseHearingAidType(const std::string& name);

/// @brief none|xi_smooth (不区分大小写)
SmoothingMode parseSmoothingMode(const std::string& name);

}  // namespace config
}  // namespace vha

#endif  // CONFIG_LOADER_HPP
