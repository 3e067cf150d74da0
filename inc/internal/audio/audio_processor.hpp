#ifndef AUDIO_PROCESSOR_HPP
#define AUDIO_PROCESSOR_HPP

/**
 * AudioProcessor - 音频辅助模块
 *
 * 处理链路外围的电平测量、声道/采样率转换与 WAV 读写。
 * 核心算法只接受单声道、采样率与前端一致的 double 样本。
 */

#include <cstdint>

#include <string>
#include <vector>

#include "internal/vha_types.hpp"

namespace vha {
namespace audio {

// =============================================================================
// 电平
// =============================================================================

/**
 * @brief 计算音频的 RMS (Root Mean Square)
 * @param audio 音频样本
 * @return RMS 值, 空输入为 0
 */
double calculateRMS(const std::vector<double>& audio);

/// @brief 20 log10(rms(processed) / rms(reference)), 任一为 0 时返回 -inf/+inf
double rmsRatioDb(const std::vector<double>& processed, const std::vector<double>& reference);

// =============================================================================
// 转换
// =============================================================================

/**
 * @brief 重采样音频 (线性插值)
 * @param audio 输入音频
 * @param src_rate 源采样率
 * @param dst_rate 目标采样率
 */
std::vector<double> resampleAudio(const std::vector<double>& audio, double src_rate, double dst_rate);

/// @brief 交织多声道样本取平均得到单声道
std::vector<double> mixToMono(const std::vector<double>& interleaved, int channels);

/// @brief double [-1, 1] 转 int16 (超出范围截断)
std::vector<int16_t> doubleToInt16(const std::vector<double>& audio);

// =============================================================================
// WAV 读写
// =============================================================================

/**
 * @brief 读取音频文件 (libsndfile), 多声道混为单声道
 * @throws VhaError FILE_READ_ERROR
 */
AudioBlock readAudioFile(const std::string& path);

/**
 * @brief 写 16-bit PCM 单声道 WAV
 * @return 错误信息
 */
ErrorInfo writeWav(const AudioBlock& audio, const std::string& path);

}  // namespace audio
}  // namespace vha

#endif  // AUDIO_PROCESSOR_HPP
