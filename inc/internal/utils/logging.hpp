#ifndef VHA_LOGGING_HPP
#define VHA_LOGGING_HPP

/**
 * Logging - 控制台日志
 *
 * Info 输出到 stdout, Warning/Error 输出到 stderr。
 * 处理指标 (块数、耗时、吞吐) 在离线批处理结束时输出。
 */

#include <string>

namespace vha {
namespace log {

/// @brief 开启/关闭 Info 级输出 (Warning/Error 始终输出)
void setVerbose(bool verbose);
bool isVerbose();

void logInfo(const std::string& message);
void logWarning(const std::string& message);
void logError(const std::string& message);

// =============================================================================
// 处理指标
// =============================================================================

/// @brief 后端处理完成: 块数、耗时、每秒块数
void logBackendProcessing(const std::string& name, int num_blocks, double seconds);

/// @brief 合成完成: 块数、耗时、每秒块数
void logSynthesisMetrics(const std::string& name, int num_blocks, double seconds);

void logHearingAidCreated(const std::string& name, const std::string& strategy);

}  // namespace log
}  // namespace vha

#endif  // VHA_LOGGING_HPP
