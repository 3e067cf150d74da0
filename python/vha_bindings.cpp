#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>
#include <vector>

#include "vha_api.hpp"

namespace py = pybind11;

// numpy 一维数组 -> std::vector<double>
static std::vector<double> toVector(const py::array_t<double, py::array::c_style | py::array::forcecast>& array) {
    if (array.ndim() != 1) {
        throw py::value_error("Expected a 1-D array of samples, got " + std::to_string(array.ndim()) + " dimensions");
    }
    return std::vector<double>(array.data(), array.data() + array.size());
}

// =============================================================================
// pybind11 模块定义
// =============================================================================

PYBIND11_MODULE(_vha, m) {
    m.doc() = "VHA - Virtual Hearing Aid Python bindings";

    // =========================================================================
    // 枚举类型
    // =========================================================================

    py::enum_<Vha::HearingAidType>(m, "HearingAidType", "Hearing aid types")
        .value("BASELINE", Vha::HearingAidType::BASELINE, "Unity gain (WFB analysis/synthesis only)")
        .value("SEM", Vha::HearingAidType::SEM, "SEM noise reduction")
        .export_values();

    py::enum_<Vha::ProcessingStrategy>(m, "ProcessingStrategy", "Processing strategies")
        .value("STREAMING", Vha::ProcessingStrategy::STREAMING, "One block per call")
        .value("BATCH_ONLINE", Vha::ProcessingStrategy::BATCH_ONLINE, "Whole signal, block by block")
        .value("BATCH_OFFLINE", Vha::ProcessingStrategy::BATCH_OFFLINE,
            "Whole signal, frontend then backend then synthesis")
        .export_values();

    // =========================================================================
    // HearingAidConfig - 配置结构
    // =========================================================================

    py::class_<Vha::HearingAidConfig>(m, "HearingAidConfig", "Hearing aid configuration")
        .def(py::init<>(), "Create default (SEM) configuration")

        .def_readwrite("type", &Vha::HearingAidConfig::type)
        .def_readwrite("strategy", &Vha::HearingAidConfig::strategy)
        .def_readwrite("name", &Vha::HearingAidConfig::name)
        .def_readwrite("nbands", &Vha::HearingAidConfig::nbands, "Number of bands (>= 2)")
        .def_readwrite("sample_rate", &Vha::HearingAidConfig::sample_rate, "Sample rate (Hz)")
        .def_readwrite("buffer_size_s", &Vha::HearingAidConfig::buffer_size_s, "Block length (seconds)")
        .def_readwrite("apcoefficient", &Vha::HearingAidConfig::apcoefficient, "All-pass coefficient")
        .def_readwrite("spl_reference_db", &Vha::HearingAidConfig::spl_reference_db)
        .def_readwrite("spl_lower_bound_db", &Vha::HearingAidConfig::spl_lower_bound_db)
        .def_readwrite("iterations", &Vha::HearingAidConfig::iterations)
        .def_readwrite("free_energy", &Vha::HearingAidConfig::free_energy)
        .def_readwrite("tau_speech_ms", &Vha::HearingAidConfig::tau_speech_ms)
        .def_readwrite("tau_noise_ms", &Vha::HearingAidConfig::tau_noise_ms)
        .def_readwrite("tau_xnr_ms", &Vha::HearingAidConfig::tau_xnr_ms)
        .def_readwrite("speech_prior_mean", &Vha::HearingAidConfig::speech_prior_mean)
        .def_readwrite("noise_prior_mean", &Vha::HearingAidConfig::noise_prior_mean)
        .def_readwrite("gain_threshold_db", &Vha::HearingAidConfig::gain_threshold_db, "Maximum attenuation (dB)")
        .def_readwrite("switch_threshold_db", &Vha::HearingAidConfig::switch_threshold_db, "VAD threshold (dB)")
        .def_readwrite("smooth_snr", &Vha::HearingAidConfig::smooth_snr)

        .def_static("Baseline", &Vha::HearingAidConfig::Baseline, "Unity gain configuration")
        .def_static("Sem", &Vha::HearingAidConfig::Sem, "SEM noise reduction configuration")

        .def("withStrategy", &Vha::HearingAidConfig::withStrategy, py::arg("strategy"))
        .def("withBands", &Vha::HearingAidConfig::withBands, py::arg("nbands"))
        .def("withGainThreshold", &Vha::HearingAidConfig::withGainThreshold, py::arg("threshold_db"))

        .def("__repr__", [](const Vha::HearingAidConfig& config) {
            return "<HearingAidConfig name='" + config.name + "'" +
                " nbands=" + std::to_string(config.nbands) +
                " sample_rate=" + std::to_string(config.sample_rate) + ">";
        });

    // =========================================================================
    // ProcessResult - 处理结果
    // =========================================================================

    py::class_<Vha::ProcessResult, std::shared_ptr<Vha::ProcessResult>>(
        m, "ProcessResult", "Hearing aid processing result")

        .def("get_audio", [](const Vha::ProcessResult& r) {
            const auto& audio = r.GetAudio();
            return py::array_t<double>(static_cast<py::ssize_t>(audio.size()), audio.data());
        }, "Get processed audio as float64 array")
        .def("get_audio_int16", &Vha::ProcessResult::GetAudioInt16, "Get processed audio as int16 PCM")
        .def("get_gains", &Vha::ProcessResult::GetGains,
            "Per-block gains [num_blocks][nbands] (offline SEM only)")

        .def("is_success", &Vha::ProcessResult::IsSuccess)
        .def("get_code", &Vha::ProcessResult::GetCode)
        .def("get_message", &Vha::ProcessResult::GetMessage)
        .def("is_empty", &Vha::ProcessResult::IsEmpty)

        .def("get_sample_rate", &Vha::ProcessResult::GetSampleRate)
        .def("get_duration_ms", &Vha::ProcessResult::GetDurationMs)
        .def("get_processing_time_ms", &Vha::ProcessResult::GetProcessingTimeMs)
        .def("get_rtf", &Vha::ProcessResult::GetRTF,
            "Get Real-Time Factor (processing_time / audio_duration)")

        .def("save_to_file", &Vha::ProcessResult::SaveToFile, py::arg("file_path"),
            "Save audio as 16-bit PCM WAV")

        .def("__bool__", [](const Vha::ProcessResult& r) {
            return r.IsSuccess() && !r.IsEmpty();
        })
        .def("__repr__", [](const Vha::ProcessResult& r) {
            return "<ProcessResult " +
                std::string(r.IsSuccess() ? "success" : "failed: " + r.GetMessage()) +
                " duration=" + std::to_string(r.GetDurationMs()) + "ms" +
                " rtf=" + std::to_string(r.GetRTF()) + ">";
        });

    // =========================================================================
    // HearingAid - 助听器
    // =========================================================================

    py::class_<Vha::HearingAid>(m, "HearingAid", "Hearing aid - WFB frontend with SEM noise reduction")
        .def(py::init<const Vha::HearingAidConfig&>(),
            py::arg("config") = Vha::HearingAidConfig::Sem(),
            "Create hearing aid from configuration")
        .def(py::init<const std::string&>(),
            py::arg("config_path"),
            "Create hearing aid from YAML config file")

        // 处理 - 释放 GIL
        .def("process", [](Vha::HearingAid& self,
            py::array_t<double, py::array::c_style | py::array::forcecast> samples,
            int sample_rate) {
            auto input = toVector(samples);
            py::gil_scoped_release release;
            return self.Process(input, sample_rate);
        }, py::arg("samples"), py::arg("sample_rate"),
            "Process a signal with the current strategy (releases GIL)")

        .def("process_block", [](Vha::HearingAid& self,
            py::array_t<double, py::array::c_style | py::array::forcecast> block,
            int sample_rate) {
            auto input = toVector(block);
            py::gil_scoped_release release;
            return self.ProcessBlock(input, sample_rate);
        }, py::arg("block"), py::arg("sample_rate"),
            "Process a single streaming block (releases GIL)")

        .def("process_file", [](Vha::HearingAid& self,
            const std::string& input_path,
            const std::string& output_path) {
            py::gil_scoped_release release;
            return self.ProcessFile(input_path, output_path);
        }, py::arg("input_path"), py::arg("output_path"),
            "Read, process and write an audio file (releases GIL)")

        .def("set_processing_strategy", &Vha::HearingAid::SetProcessingStrategy, py::arg("strategy"))
        .def("get_processing_strategy", &Vha::HearingAid::GetProcessingStrategy)
        .def_static("set_verbose", &Vha::HearingAid::SetVerbose, py::arg("verbose"))

        .def("is_initialized", &Vha::HearingAid::IsInitialized)
        .def("get_last_error", &Vha::HearingAid::GetLastError)
        .def("get_name", &Vha::HearingAid::GetName)
        .def("get_type", &Vha::HearingAid::GetType)
        .def("get_num_bands", &Vha::HearingAid::GetNumBands)
        .def("get_sample_rate", &Vha::HearingAid::GetSampleRate)
        .def("get_buffer_size", &Vha::HearingAid::GetBufferSize)

        .def("__repr__", [](const Vha::HearingAid& ha) {
            return "<HearingAid name='" + ha.GetName() + "'" +
                " sample_rate=" + std::to_string(ha.GetSampleRate()) + "Hz" +
                " initialized=" + (ha.IsInitialized() ? "true" : "false") + ">";
        });

    // =========================================================================
    // 模块级属性
    // =========================================================================

    m.attr("__version__") = "1.0.0";
}
