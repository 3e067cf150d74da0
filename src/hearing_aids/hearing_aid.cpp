#include "internal/hearing_aids/hearing_aid.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/utils/logging.hpp"

namespace vha {

namespace {

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

HearingAid::HearingAid(const HearingAidConfig& config)
    : config_(config), strategy_(config.processing_strategy) {
    auto err = config_.validate();
    if (!err.isOk()) {
        throw ConfigError(err.code, err.message);
    }

    frontend_ = std::make_unique<frontend::WfbFrontend>(config_.frontend);

    backend_ = SpmBackendFactory::create(backendTypeFor(config_.type));
    if (!backend_) {
        throw ConfigError(std::string("No backend available for ") + hearingAidTypeToString(config_.type));
    }
    err = backend_->initialize(config_);
    if (!err.isOk()) {
        throw ConfigError(err.code, err.message);
    }

    last_gains_.assign(config_.frontend.nbands, 1.0);
    log::logHearingAidCreated(config_.name, processingStrategyToString(strategy_));
}

HearingAid::~HearingAid() = default;

// =============================================================================
// 输入校验
// =============================================================================

void HearingAid::validateSignal(const AudioBlock& signal) const {
    if (signal.isEmpty()) {
        throw InputValidationError("Input sound cannot be empty");
    }
    if (std::abs(signal.sample_rate - config_.frontend.fs) > 1e-9 * config_.frontend.fs) {
        throw InputValidationError("Sound samplerate (" + std::to_string(signal.sample_rate) +
            ") must match frontend samplerate (" + std::to_string(config_.frontend.fs) + ")");
    }
    for (size_t i = 0; i < signal.samples.size(); ++i) {
        if (!std::isfinite(signal.samples[i])) {
            throw InputValidationError("Input sound contains a non-finite sample at index " + std::to_string(i));
        }
    }
}

void HearingAid::validateSynthesisInputs(const std::vector<Matrix>& taps_history, const Matrix& gains) const {
    if (taps_history.empty()) {
        throw InputValidationError("Taps history cannot be empty");
    }
    if (gains.rows != taps_history.size()) {
        throw InputValidationError("Gains matrix rows (" + std::to_string(gains.rows) +
            ") must match number of blocks (" + std::to_string(taps_history.size()) + ")");
    }
    auto range = std::minmax_element(gains.data.begin(), gains.data.end());
    if (range.first != gains.data.end() && (*range.first < 0.0 || *range.second > 1.0)) {
        throw InputValidationError("All gains must be between 0 and 1, got range [" +
            std::to_string(*range.first) + ", " + std::to_string(*range.second) + "]");
    }
}

// =============================================================================
// 处理
// =============================================================================

AudioBlock HearingAid::process(const AudioBlock& signal) {
    switch (strategy_) {
        case ProcessingStrategy::STREAMING:
            return processStreaming(signal);
        case ProcessingStrategy::BATCH_ONLINE:
            return processOnline(signal);
        case ProcessingStrategy::BATCH_OFFLINE:
            return processOffline(signal);
        default:
            throw InternalInvariantError("Unknown processing strategy");
    }
}

AudioBlock HearingAid::processBlock(const AudioBlock& block) {
    std::vector<double> powerdb = frontend_->processFrontend(block);
    last_gains_ = backend_->computeGains(powerdb);
    frontend_->updateWeights(last_gains_);
    return frontend_->synthesize();
}

AudioBlock HearingAid::processStreaming(const AudioBlock& block) {
    validateSignal(block);
    const size_t buffer_size = static_cast<size_t>(getBufferSize());
    if (block.size() > buffer_size) {
        throw InputValidationError("Streaming block of " + std::to_string(block.size()) +
            " samples exceeds buffer_size (" + std::to_string(buffer_size) + ")");
    }
    AudioBlock output = processBlock(block);
    output.samples.resize(block.size());
    return output;
}

AudioBlock HearingAid::processOnline(const AudioBlock& signal) {
    validateSignal(signal);
    const size_t block_length = static_cast<size_t>(getBufferSize());
    if (signal.size() < block_length) {
        throw InputValidationError("Input sound length (" + std::to_string(signal.size()) +
            ") must be at least buffer_size (" + std::to_string(block_length) + ")");
    }

    std::vector<double> output(signal.size(), 0.0);
    for (size_t start = 0; start < signal.size(); start += block_length) {
        size_t count = std::min(block_length, signal.size() - start);
        AudioBlock block = AudioBlock::fromSamples(
            std::vector<double>(signal.samples.begin() + start, signal.samples.begin() + start + count),
            signal.sample_rate);

        AudioBlock processed = processBlock(block);
        std::copy(processed.samples.begin(), processed.samples.begin() + count, output.begin() + start);
    }
    return AudioBlock::fromSamples(std::move(output), signal.sample_rate);
}

AudioBlock HearingAid::processOffline(const AudioBlock& signal) {
    validateSignal(signal);
    const size_t block_length = static_cast<size_t>(getBufferSize());
    if (signal.size() < block_length) {
        throw InputValidationError("Input sound length (" + std::to_string(signal.size()) +
            ") must be at least buffer_size (" + std::to_string(block_length) + ")");
    }

    // 前端: 功率矩阵 + taps 快照
    const size_t num_blocks = (signal.size() + block_length - 1) / block_length;
    Matrix powerdb(num_blocks, getNbands());
    std::vector<Matrix> taps_history;
    taps_history.reserve(num_blocks);
    for (size_t b = 0; b < num_blocks; ++b) {
        size_t start = b * block_length;
        size_t count = std::min(block_length, signal.size() - start);
        std::vector<double> block(signal.samples.begin() + start, signal.samples.begin() + start + count);
        powerdb.setRow(b, frontend_->processFrontend(block));
        taps_history.push_back(frontend_->getTaps());
    }

    // 后端: 按频带整段推理
    auto backend_start = std::chrono::steady_clock::now();
    auto results = std::make_unique<SemResults>(backend_->runBackend(powerdb));
    const bool has_backend = config_.type == HearingAidType::SEM;
    if (has_backend) {
        log::logBackendProcessing(config_.name, static_cast<int>(num_blocks), secondsSince(backend_start));
    }

    // 合成
    validateSynthesisInputs(taps_history, results->gains);
    auto synthesis_start = std::chrono::steady_clock::now();
    std::vector<double> output;
    output.reserve(num_blocks * block_length);
    for (size_t b = 0; b < num_blocks; ++b) {
        std::vector<double> block = frontend::synthesizeBlock(taps_history[b],
            frontend_->getSynthesisMatrix(), results->gains.row(b), static_cast<int>(block_length));
        output.insert(output.end(), block.begin(), block.end());
    }
    if (has_backend) {
        log::logSynthesisMetrics(config_.name, static_cast<int>(num_blocks), secondsSince(synthesis_start));
    }

    // 最后一块只保留输入中实际存在的样本
    size_t last_count = signal.size() - (num_blocks - 1) * block_length;
    output.erase(output.begin() + (num_blocks - 1) * block_length + last_count, output.end());

    last_gains_ = results->gains.row(num_blocks - 1);
    frontend_->updateWeights(last_gains_);
    if (has_backend) {
        last_results_ = std::move(results);
    } else {
        last_results_.reset();
    }
    return AudioBlock::fromSamples(std::move(output), signal.sample_rate);
}

}  // namespace vha
