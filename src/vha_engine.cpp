#include "vha_api.hpp"

#include <cstdint>

#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/audio/audio_processor.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/hearing_aids/hearing_aid.hpp"
#include "internal/utils/logging.hpp"

namespace Vha {

// =============================================================================
// ProcessResult 实现
// =============================================================================

struct ProcessResult::Impl {
    std::vector<double> audio;
    std::vector<std::vector<double>> gains;
    int sample_rate = 16000;
    double duration_ms = 0.0;
    double processing_time_ms = 0.0;
    bool success = false;
    vha::ErrorCode code = vha::ErrorCode::OK;
    std::string message;
};

ProcessResult::ProcessResult() : impl_(std::make_unique<Impl>()) {}
ProcessResult::~ProcessResult() = default;

ProcessResult::ProcessResult(ProcessResult&&) noexcept = default;
ProcessResult& ProcessResult::operator=(ProcessResult&&) noexcept = default;

const std::vector<double>& ProcessResult::GetAudio() const {
    return impl_->audio;
}

std::vector<int16_t> ProcessResult::GetAudioInt16() const {
    return vha::audio::doubleToInt16(impl_->audio);
}

const std::vector<std::vector<double>>& ProcessResult::GetGains() const {
    return impl_->gains;
}

bool ProcessResult::IsSuccess() const {
    return impl_->success;
}

std::string ProcessResult::GetCode() const {
    return vha::errorCodeToString(impl_->code);
}

std::string ProcessResult::GetMessage() const {
    return impl_->message;
}

bool ProcessResult::IsEmpty() const {
    return impl_->audio.empty();
}

int ProcessResult::GetSampleRate() const {
    return impl_->sample_rate;
}

double ProcessResult::GetDurationMs() const {
    return impl_->duration_ms;
}

double ProcessResult::GetProcessingTimeMs() const {
    return impl_->processing_time_ms;
}

double ProcessResult::GetRTF() const {
    if (impl_->duration_ms <= 0.0) return 0.0;
    return impl_->processing_time_ms / impl_->duration_ms;
}

bool ProcessResult::SaveToFile(const std::string& file_path) const {
    if (impl_->audio.empty()) {
        return false;
    }
    return SaveAudio(impl_->audio, impl_->sample_rate, file_path);
}

// =============================================================================
// HearingAid 实现
// =============================================================================

// 转换 Vha::HearingAidType 到 vha::HearingAidType
static vha::HearingAidType convertType(HearingAidType type) {
    switch (type) {
        case HearingAidType::BASELINE:
            return vha::HearingAidType::BASELINE;
        case HearingAidType::SEM:
        default:
            return vha::HearingAidType::SEM;
    }
}

static vha::ProcessingStrategy convertStrategy(ProcessingStrategy strategy) {
    switch (strategy) {
        case ProcessingStrategy::STREAMING:
            return vha::ProcessingStrategy::STREAMING;
        case ProcessingStrategy::BATCH_ONLINE:
            return vha::ProcessingStrategy::BATCH_ONLINE;
        case ProcessingStrategy::BATCH_OFFLINE:
        default:
            return vha::ProcessingStrategy::BATCH_OFFLINE;
    }
}

static ProcessingStrategy convertStrategy(vha::ProcessingStrategy strategy) {
    switch (strategy) {
        case vha::ProcessingStrategy::STREAMING:
            return ProcessingStrategy::STREAMING;
        case vha::ProcessingStrategy::BATCH_ONLINE:
            return ProcessingStrategy::BATCH_ONLINE;
        case vha::ProcessingStrategy::BATCH_OFFLINE:
        default:
            return ProcessingStrategy::BATCH_OFFLINE;
    }
}

static vha::HearingAidConfig convertConfig(const HearingAidConfig& cfg) {
    vha::HearingAidConfig config = cfg.type == HearingAidType::BASELINE
        ? vha::HearingAidConfig::Baseline()
        : vha::HearingAidConfig::Sem();
    config.type = convertType(cfg.type);
    config.name = cfg.name;
    config.processing_strategy = convertStrategy(cfg.strategy);

    config.frontend.nbands = cfg.nbands;
    config.frontend.fs = static_cast<double>(cfg.sample_rate);
    config.frontend.buffer_size_s = cfg.buffer_size_s;
    config.frontend.apcoefficient = cfg.apcoefficient;
    config.frontend.spl_reference_db = cfg.spl_reference_db;
    config.frontend.spl_power_estimate_lower_bound_db = cfg.spl_lower_bound_db;

    config.backend.iterations = cfg.iterations;
    config.backend.free_energy = cfg.free_energy;
    config.backend.tau_speech_ms = cfg.tau_speech_ms;
    config.backend.tau_noise_ms = cfg.tau_noise_ms;
    config.backend.tau_xnr_ms = cfg.tau_xnr_ms;
    config.backend.speech_prior_mean = cfg.speech_prior_mean;
    config.backend.noise_prior_mean = cfg.noise_prior_mean;
    config.backend.gain_threshold_db = cfg.gain_threshold_db;
    config.backend.switch_threshold_db = cfg.switch_threshold_db;
    config.backend.smoothing = cfg.smooth_snr ? vha::SmoothingMode::XI_SMOOTH : vha::SmoothingMode::NONE;
    return config;
}

struct HearingAid::Impl {
    std::unique_ptr<vha::HearingAid> hearing_aid;
    std::string last_error;

    bool init(const vha::HearingAidConfig& cfg) {
        try {
            hearing_aid = std::make_unique<vha::HearingAid>(cfg);
        } catch (const vha::VhaError& e) {
            last_error = std::string(vha::errorCodeToString(e.code())) + ": " + e.what();
            vha::log::logError("Failed to create hearing aid: " + last_error);
            return false;
        } catch (const std::exception& e) {
            last_error = e.what();
            vha::log::logError("Failed to create hearing aid: " + last_error);
            return false;
        }
        last_error.clear();
        return true;
    }

    std::shared_ptr<ProcessResult> failure(vha::ErrorCode code, const std::string& message) const {
        auto result = std::make_shared<ProcessResult>();
        result->impl_->success = false;
        result->impl_->code = code;
        result->impl_->message = message;
        if (hearing_aid) {
            result->impl_->sample_rate = static_cast<int>(hearing_aid->getSampleRate());
        }
        return result;
    }

    // 在边界处把异常转换为失败结果
    template <typename Fn>
    std::shared_ptr<ProcessResult> run(const std::vector<double>& samples, int sample_rate, Fn&& fn) {
        if (!hearing_aid) {
            return failure(vha::ErrorCode::NOT_INITIALIZED, "Hearing aid not initialized: " + last_error);
        }

        auto input = vha::AudioBlock::fromSamples(samples, static_cast<double>(sample_rate));
        auto start = std::chrono::steady_clock::now();

        vha::AudioBlock output;
        try {
            output = fn(*hearing_aid, input);
        } catch (const vha::VhaError& e) {
            vha::log::logError(e.what());
            return failure(e.code(), e.what());
        } catch (const std::exception& e) {
            vha::log::logError(e.what());
            return failure(vha::ErrorCode::PROCESSING_FAILED, e.what());
        }

        auto end = std::chrono::steady_clock::now();

        auto result = std::make_shared<ProcessResult>();
        result->impl_->audio = std::move(output.samples);
        result->impl_->sample_rate = sample_rate;
        result->impl_->duration_ms = input.getDurationMs();
        result->impl_->processing_time_ms =
            std::chrono::duration<double, std::milli>(end - start).count();
        result->impl_->success = true;
        result->impl_->message = "OK";

        if (const vha::SemResults* sem = hearing_aid->getLastResults()) {
            if (hearing_aid->getProcessingStrategy() == vha::ProcessingStrategy::BATCH_OFFLINE) {
                for (size_t r = 0; r < sem->gains.rows; ++r) {
                    result->impl_->gains.push_back(sem->gains.row(r));
                }
            }
        }
        return result;
    }
};

HearingAid::HearingAid(const HearingAidConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->init(convertConfig(config));
}

HearingAid::HearingAid(const std::string& config_path)
    : impl_(std::make_unique<Impl>()) {
    vha::HearingAidConfig config;
    try {
        config = vha::config::loadHearingAidConfig(config_path);
    } catch (const vha::VhaError& e) {
        impl_->last_error = std::string(vha::errorCodeToString(e.code())) + ": " + e.what();
        vha::log::logError("Failed to load config: " + impl_->last_error);
        return;
    }
    impl_->init(config);
}

HearingAid::~HearingAid() = default;

std::shared_ptr<ProcessResult> HearingAid::Process(const std::vector<double>& samples, int sample_rate) {
    return impl_->run(samples, sample_rate, [](vha::HearingAid& ha, const vha::AudioBlock& input) {
        return ha.process(input);
    });
}

std::shared_ptr<ProcessResult> HearingAid::ProcessBlock(const std::vector<double>& block, int sample_rate) {
    return impl_->run(block, sample_rate, [](vha::HearingAid& ha, const vha::AudioBlock& input) {
        return ha.processStreaming(input);
    });
}

std::shared_ptr<ProcessResult> HearingAid::ProcessFile(const std::string& input_path,
                                                       const std::string& output_path) {
    if (!impl_->hearing_aid) {
        return impl_->failure(vha::ErrorCode::NOT_INITIALIZED, "Hearing aid not initialized: " + impl_->last_error);
    }

    const int fs = GetSampleRate();
    std::vector<double> samples;
    std::string error;
    if (!LoadAudio(input_path, fs, samples, &error)) {
        return impl_->failure(vha::ErrorCode::FILE_READ_ERROR, error);
    }

    auto result = Process(samples, fs);
    if (result->IsSuccess() && !output_path.empty() && !result->SaveToFile(output_path)) {
        return impl_->failure(vha::ErrorCode::FILE_WRITE_ERROR, "Failed to write " + output_path);
    }
    return result;
}

void HearingAid::SetProcessingStrategy(ProcessingStrategy strategy) {
    if (impl_->hearing_aid) {
        impl_->hearing_aid->setProcessingStrategy(convertStrategy(strategy));
    }
}

ProcessingStrategy HearingAid::GetProcessingStrategy() const {
    if (!impl_->hearing_aid) {
        return ProcessingStrategy::BATCH_OFFLINE;
    }
    return convertStrategy(impl_->hearing_aid->getProcessingStrategy());
}

void HearingAid::SetVerbose(bool verbose) {
    vha::log::setVerbose(verbose);
}

bool HearingAid::IsInitialized() const {
    return impl_->hearing_aid != nullptr;
}

std::string HearingAid::GetLastError() const {
    return impl_->last_error;
}

std::string HearingAid::GetName() const {
    return impl_->hearing_aid ? impl_->hearing_aid->getName() : "";
}

HearingAidType HearingAid::GetType() const {
    if (impl_->hearing_aid && impl_->hearing_aid->getType() == vha::HearingAidType::BASELINE) {
        return HearingAidType::BASELINE;
    }
    return HearingAidType::SEM;
}

int HearingAid::GetNumBands() const {
    return impl_->hearing_aid ? impl_->hearing_aid->getNbands() : 0;
}

int HearingAid::GetSampleRate() const {
    return impl_->hearing_aid ? static_cast<int>(impl_->hearing_aid->getSampleRate()) : 0;
}

int HearingAid::GetBufferSize() const {
    return impl_->hearing_aid ? impl_->hearing_aid->getBufferSize() : 0;
}

// =============================================================================
// 音频工具
// =============================================================================

bool LoadAudio(const std::string& path, int sample_rate, std::vector<double>& samples, std::string* error) {
    vha::AudioBlock input;
    try {
        input = vha::audio::readAudioFile(path);
    } catch (const vha::VhaError& e) {
        vha::log::logError(e.what());
        if (error) {
            *error = e.what();
        }
        return false;
    }

    const double fs = static_cast<double>(sample_rate);
    if (input.sample_rate != fs) {
        vha::log::logInfo("Resampling " + path + " from " + std::to_string(input.sample_rate) +
                          " Hz to " + std::to_string(fs) + " Hz");
        input.samples = vha::audio::resampleAudio(input.samples, input.sample_rate, fs);
    }
    samples = std::move(input.samples);
    return true;
}

bool SaveAudio(const std::vector<double>& samples, int sample_rate, const std::string& path) {
    auto err = vha::audio::writeWav(vha::AudioBlock::fromSamples(samples, sample_rate), path);
    if (!err.isOk()) {
        vha::log::logError(err.message);
        return false;
    }
    return true;
}

}  // namespace Vha
