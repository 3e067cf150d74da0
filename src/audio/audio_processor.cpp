#include "internal/audio/audio_processor.hpp"

#include <sndfile.h>

#include <cmath>
#include <cstdint>
#include <cstdio>

#include <limits>
#include <string>
#include <vector>

namespace vha {
namespace audio {

// =============================================================================
// 电平
// =============================================================================

double calculateRMS(const std::vector<double>& audio) {
    if (audio.empty()) return 0.0;

    double sum_squares = 0.0;
    for (double sample : audio) {
        sum_squares += sample * sample;
    }
    return std::sqrt(sum_squares / audio.size());
}

double rmsRatioDb(const std::vector<double>& processed, const std::vector<double>& reference) {
    double ref = calculateRMS(reference);
    double out = calculateRMS(processed);
    if (ref == 0.0) {
        return out == 0.0 ? 0.0 : std::numeric_limits<double>::infinity();
    }
    if (out == 0.0) {
        return -std::numeric_limits<double>::infinity();
    }
    return 20.0 * std::log10(out / ref);
}

// =============================================================================
// 转换
// =============================================================================

std::vector<double> resampleAudio(const std::vector<double>& audio, double src_rate, double dst_rate) {
    if (audio.empty() || src_rate == dst_rate || dst_rate <= 0.0 || src_rate <= 0.0) {
        return audio;
    }

    double ratio = dst_rate / src_rate;
    size_t output_size = static_cast<size_t>(audio.size() * ratio);
    std::vector<double> resampled(output_size);

    for (size_t i = 0; i < output_size; ++i) {
        double src_pos = i / ratio;
        size_t src_idx = static_cast<size_t>(src_pos);
        double frac = src_pos - src_idx;

        if (src_idx + 1 < audio.size()) {
            resampled[i] = audio[src_idx] * (1.0 - frac) + audio[src_idx + 1] * frac;
        } else if (src_idx < audio.size()) {
            resampled[i] = audio[src_idx];
        } else {
            resampled[i] = 0.0;
        }
    }

    return resampled;
}

std::vector<double> mixToMono(const std::vector<double>& interleaved, int channels) {
    if (channels <= 1) {
        return interleaved;
    }
    const size_t frames = interleaved.size() / channels;
    std::vector<double> mono(frames, 0.0);
    for (size_t f = 0; f < frames; ++f) {
        double acc = 0.0;
        for (int c = 0; c < channels; ++c) {
            acc += interleaved[f * channels + c];
        }
        mono[f] = acc / channels;
    }
    return mono;
}

std::vector<int16_t> doubleToInt16(const std::vector<double>& audio) {
    std::vector<int16_t> result(audio.size());
    for (size_t i = 0; i < audio.size(); ++i) {
        double sample = audio[i];
        if (sample > 1.0) sample = 1.0;
        if (sample < -1.0) sample = -1.0;
        result[i] = static_cast<int16_t>(sample * 32767.0);
    }
    return result;
}

// =============================================================================
// WAV 读写
// =============================================================================

AudioBlock readAudioFile(const std::string& path) {
    SF_INFO info{};
    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &info);
    if (!file) {
        throw VhaError(ErrorCode::FILE_READ_ERROR,
            "Failed to open audio file " + path + ": " + sf_strerror(nullptr));
    }

    std::vector<double> interleaved(static_cast<size_t>(info.frames) * info.channels);
    sf_count_t read = sf_readf_double(file, interleaved.data(), info.frames);
    sf_close(file);
    if (read != info.frames) {
        throw VhaError(ErrorCode::FILE_READ_ERROR,
            "Short read from " + path + ": " + std::to_string(read) + " of " +
            std::to_string(info.frames) + " frames");
    }

    return AudioBlock::fromSamples(mixToMono(interleaved, info.channels), info.samplerate);
}

ErrorInfo writeWav(const AudioBlock& audio, const std::string& path) {
    if (audio.isEmpty()) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT, "Empty audio data");
    }

    // WAV 文件头
    struct WavHeader {
        char riff[4] = {'R', 'I', 'F', 'F'};
        uint32_t file_size;
        char wave[4] = {'W', 'A', 'V', 'E'};
        char fmt[4] = {'f', 'm', 't', ' '};
        uint32_t fmt_size = 16;
        uint16_t audio_format = 1;  // PCM
        uint16_t num_channels = 1;
        uint32_t sample_rate;
        uint32_t byte_rate;
        uint16_t block_align;
        uint16_t bits_per_sample = 16;
        char data[4] = {'d', 'a', 't', 'a'};
        uint32_t data_size;
    };

    auto int16_data = doubleToInt16(audio.samples);
    uint32_t data_size = static_cast<uint32_t>(int16_data.size() * sizeof(int16_t));

    WavHeader header;
    header.sample_rate = static_cast<uint32_t>(std::lround(audio.sample_rate));
    header.byte_rate = header.sample_rate * header.num_channels * (header.bits_per_sample / 8);
    header.block_align = header.num_channels * (header.bits_per_sample / 8);
    header.data_size = data_size;
    header.file_size = sizeof(WavHeader) - 8 + data_size;

    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR, "Failed to open file: " + path);
    }

    size_t written = fwrite(&header, sizeof(WavHeader), 1, file);
    written += fwrite(int16_data.data(), sizeof(int16_t), int16_data.size(), file);
    fclose(file);

    if (written != 1 + int16_data.size()) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR, "Short write to file: " + path);
    }
    return ErrorInfo::ok();
}

}  // namespace audio
}  // namespace vha
