#include "internal/frontends/wfb_frontend.hpp"

#include <fftw3.h>

#include <cmath>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace vha {
namespace frontend {

namespace {

// DSP 约定的 Hann 窗: 0.5 (1 - cos(2πk/(n-1))), k = 0..n-1
std::vector<double> hanning(int length) {
    std::vector<double> window(length, 1.0);
    if (length == 1) return window;
    for (int k = 0; k < length; ++k) {
        window[k] = 0.5 * (1.0 - std::cos(2.0 * M_PI * k / (length - 1)));
    }
    return window;
}

}  // namespace

// =============================================================================
// SampleRingBuffer
// =============================================================================

SampleRingBuffer::SampleRingBuffer(size_t capacity) : data_(capacity, 0.0) {
    if (capacity == 0) {
        throw ConfigError("sample buffer capacity must be positive");
    }
}

void SampleRingBuffer::push(double sample) {
    data_[head_] = sample;
    head_ = (head_ + 1) % data_.size();
}

double SampleRingBuffer::operator[](size_t n) const {
    return data_[(head_ + n) % data_.size()];
}

// =============================================================================
// 窗口 / 校准 / 中心频率 / 合成矩阵
// =============================================================================

std::vector<double> calculateWindow(int nfft) {
    std::vector<double> window = hanning(nfft);
    double peak = *std::max_element(window.begin(), window.end());
    for (double& w : window) {
        w /= peak;
    }
    return window;
}

std::vector<double> calculateCalibrationDb(const std::vector<double>& window,
    int nbands,
    double spl_reference_db) {
    double window_sum = std::accumulate(window.begin(), window.end(), 0.0);
    double central_band_power = 0.25 * window_sum * window_sum;
    double offset = spl_reference_db - kPowerScaleFactor * std::log10(central_band_power);

    std::vector<double> calibration(nbands, offset);
    calibration.front() -= kEdgeBandAdjustmentDb;
    calibration.back() -= kEdgeBandAdjustmentDb;
    return calibration;
}

std::vector<double> calculateCenterFrequencies(double apcoefficient, int nfft, double fs) {
    const double a2 = apcoefficient * apcoefficient;
    std::vector<double> freqs(nfft / 2 + 1);
    for (int k = 0; k <= nfft / 2; ++k) {
        double f = k * 2.0 * M_PI / nfft;
        freqs[k] = std::atan2((1.0 - a2) * std::sin(f),
                              (1.0 + a2) * std::cos(f) + 2.0 * apcoefficient) * (fs / 2.0) / M_PI;
    }
    return freqs;
}

Matrix calculateSynthesisMatrix(int nbands, int nfft) {
    const int nhalf = nfft / 2;
    const std::vector<double> synthesis_window = hanning(nfft - 1);

    // 扩展矩阵把非边缘频带 b 同时映射到 bin b 与 bin nfft-b,
    // 因此 (F·E)[j, b] = c_b cos(2πjb/nfft)/nfft, 边缘频带 c_b = 1, 其余为 2
    Matrix synthesis(nhalf, nbands);
    for (int r = 0; r < nhalf; ++r) {
        const int j = nhalf - 1 - r;    // 行倒序
        for (int b = 0; b < nbands; ++b) {
            double multiplicity = (b == 0 || b == nbands - 1) ? 1.0 : 2.0;
            synthesis(r, b) = synthesis_window[r] * multiplicity *
                std::cos(2.0 * M_PI * j * b / nfft) / nfft;
        }
    }
    return synthesis;
}

std::vector<double> buildWeights(const Matrix& synthesis_matrix, const std::vector<double>& gains) {
    if (gains.size() != synthesis_matrix.cols) {
        throw InputValidationError("gain vector length " + std::to_string(gains.size()) +
            " does not match number of bands " + std::to_string(synthesis_matrix.cols));
    }
    const size_t n = synthesis_matrix.rows;
    std::vector<double> weights(2 * n, 0.0);
    for (size_t r = 0; r < n; ++r) {
        const double* row = synthesis_matrix.rowPtr(r);
        double acc = 0.0;
        for (size_t b = 0; b < gains.size(); ++b) {
            acc += row[b] * gains[b];
        }
        weights[r] = acc;
    }
    weights[n] = 0.0;
    for (size_t i = 1; i < n; ++i) {
        weights[n + i] = weights[n - 1 - i];
    }
    return weights;
}

std::vector<double> synthesizeBlock(const Matrix& taps,
    const Matrix& synthesis_matrix,
    const std::vector<double>& gains,
    int buffer_size) {
    std::vector<double> weights = buildWeights(synthesis_matrix, gains);
    if (taps.cols != weights.size()) {
        throw InputValidationError("taps width " + std::to_string(taps.cols) +
            " does not match weight length " + std::to_string(weights.size()));
    }

    std::vector<double> block(taps.rows, 0.0);
    for (size_t n = 0; n < taps.rows; ++n) {
        const double* row = taps.rowPtr(n);
        double acc = 0.0;
        for (size_t k = 0; k < weights.size(); ++k) {
            acc += row[k] * weights[k];
        }
        block[n] = acc;
    }

    size_t keep = std::min(block.size(), static_cast<size_t>(std::max(buffer_size, 0)));
    return std::vector<double>(block.end() - keep, block.end());
}

// =============================================================================
// WfbFrontend
// =============================================================================

WfbFrontend::WfbFrontend(const FrontendConfig& config)
    : config_(config),
      nfft_(config.nfft()),
      buffer_size_(config.bufferSize()),
      sample_buffer_(static_cast<size_t>(std::max(config.bufferSize(), 1))) {
    auto err = config.validate();
    if (!err.isOk()) {
        throw ConfigError(err.message);
    }

    taps_ = Matrix(buffer_size_, nfft_);
    temp_.assign(nfft_, 0.0);
    window_ = calculateWindow(nfft_);
    calibration_db_ = calculateCalibrationDb(window_, config_.nbands, config_.spl_reference_db);
    synthesis_matrix_ = calculateSynthesisMatrix(config_.nbands, nfft_);
    // 首次 updateWeights 之前: 只选中第 nfft/2 个全通级的单位脉冲
    weights_.assign(nfft_, 0.0);
    weights_[nfft_ / 2] = 1.0;

    fft_in_ = static_cast<double*>(fftw_malloc(sizeof(double) * nfft_));
    fft_out_ = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * (nfft_ / 2 + 1)));
    if (!fft_in_ || !fft_out_) {
        fftw_free(fft_in_);
        fftw_free(fft_out_);
        throw std::runtime_error("Failed to allocate FFT buffers");
    }
    plan_ = fftw_plan_dft_r2c_1d(nfft_, fft_in_, fft_out_, FFTW_ESTIMATE);
    if (!plan_) {
        fftw_free(fft_in_);
        fftw_free(fft_out_);
        throw std::runtime_error("Failed to create FFT plan");
    }
}

WfbFrontend::~WfbFrontend() {
    if (plan_) fftw_destroy_plan(plan_);
    fftw_free(fft_in_);
    fftw_free(fft_out_);
}

std::vector<double> WfbFrontend::processFrontend(const AudioBlock& block) {
    if (block.sample_rate > 0.0 && std::abs(block.sample_rate - config_.fs) > 1e-9 * config_.fs) {
        throw InputValidationError("block sample rate " + std::to_string(block.sample_rate) +
            " Hz does not match frontend sample rate " + std::to_string(config_.fs) + " Hz");
    }
    return processFrontend(block.samples);
}

std::vector<double> WfbFrontend::processFrontend(const std::vector<double>& samples) {
    if (samples.empty()) {
        throw InputValidationError("cannot process an empty audio block");
    }
    for (double sample : samples) {
        sample_buffer_.push(sample);
    }

    allpassFilter();
    return convertToDb(computePower());
}

void WfbFrontend::allpassFilter() {
    const double a = config_.apcoefficient;
    for (int n = 0; n < buffer_size_; ++n) {
        double* row = taps_.rowPtr(n);
        row[0] = sample_buffer_[n];
        for (int k = 1; k < nfft_; ++k) {
            row[k] = temp_[k] - a * row[k - 1];
            temp_[k] = a * row[k] + row[k - 1];
        }
    }
}

std::vector<double> WfbFrontend::computePower() {
    const int nbands = config_.nbands;
    const double* last = taps_.rowPtr(buffer_size_ - 1);
    for (int k = 0; k < nfft_; ++k) {
        fft_in_[k] = window_[k] * last[k];
    }

    fftw_execute(plan_);

    std::vector<double> power(nbands);
    for (int b = 0; b < nbands; ++b) {
        double re = fft_out_[b][0];
        double im = fft_out_[b][1];
        power[b] = re * re + im * im;
    }
    // 单边谱: 除 DC 和 Nyquist 外能量加倍
    for (int b = 1; b < nbands - 1; ++b) {
        power[b] *= 2.0;
    }
    return power;
}

std::vector<double> WfbFrontend::convertToDb(const std::vector<double>& power) const {
    std::vector<double> power_db(power.size());
    for (size_t b = 0; b < power.size(); ++b) {
        double db = kPowerScaleFactor * std::log10(power[b]) + calibration_db_[b];
        // 仅数字静音 (log10(0) = -inf) 取估计下限, 有限值原样输出
        if (power[b] <= 0.0 || !std::isfinite(db)) {
            db = config_.spl_power_estimate_lower_bound_db;
        }
        power_db[b] = db;
    }
    return power_db;
}

void WfbFrontend::updateWeights(const std::vector<double>& gains) {
    weights_ = buildWeights(synthesis_matrix_, gains);
}

AudioBlock WfbFrontend::synthesize() const {
    std::vector<double> output(buffer_size_, 0.0);
    for (int n = 0; n < buffer_size_; ++n) {
        const double* row = taps_.rowPtr(n);
        double acc = 0.0;
        for (int k = 0; k < nfft_; ++k) {
            acc += row[k] * weights_[k];
        }
        output[n] = acc;
    }
    return AudioBlock::fromSamples(std::move(output), config_.fs);
}

std::vector<double> WfbFrontend::getCenterFrequencies() const {
    return calculateCenterFrequencies(config_.apcoefficient, nfft_, config_.fs);
}

}  // namespace frontend
}  // namespace vha
