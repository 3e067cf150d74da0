#include <cmath>
#include <cstring>

#include <algorithm>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "vha_api.hpp"

void printUsage(const char* program) {
    std::cout << "用法: " << program << " [选项]\n"
        << "\n"
        << "选项:\n"
        << "  -i <file>      输入音频文件 (任意 libsndfile 支持的格式)\n"
        << "  -o <file>      输出文件 (默认: enhanced.wav)\n"
        << "  -c <file>      YAML 配置文件 (优先于 -t / -s)\n"
        << "  -t <type>      助听器类型: sem | baseline (默认: sem)\n"
        << "  -s <strategy>  处理策略: offline | online | streaming\n"
        << "  -g <db>        最大抑制量 (默认: 12)\n"
        << "  -q             关闭 Info 日志\n"
        << "  -h             显示帮助\n"
        << "\n"
        << "不带 -i 时生成 2 秒 1 kHz 正弦 + 白噪声测试信号。\n"
        << "\n"
        << "示例:\n"
        << "  " << program << " -i noisy.wav -o clean.wav\n"
        << "  " << program << " -c config/sem_config.yaml -i noisy.wav\n"
        << "  " << program << " -t baseline -s streaming\n"
        << std::endl;
}

bool parseStrategy(const std::string& name, Vha::ProcessingStrategy& strategy) {
    if (name == "offline") {
        strategy = Vha::ProcessingStrategy::BATCH_OFFLINE;
    } else if (name == "online") {
        strategy = Vha::ProcessingStrategy::BATCH_ONLINE;
    } else if (name == "streaming") {
        strategy = Vha::ProcessingStrategy::STREAMING;
    } else {
        return false;
    }
    return true;
}

std::vector<double> makeTestSignal(int sample_rate) {
    const double pi = std::acos(-1.0);
    std::mt19937 rng(42);
    std::normal_distribution<double> noise(0.0, 0.02);

    std::vector<double> signal(static_cast<size_t>(2 * sample_rate));
    for (size_t n = 0; n < signal.size(); ++n) {
        // 后一秒才有语音 (正弦), 前一秒只有噪声
        double tone = n >= signal.size() / 2 ? 0.3 * std::sin(2.0 * pi * 1000.0 * n / sample_rate) : 0.0;
        signal[n] = tone + noise(rng);
    }
    return signal;
}

// 逐块调用 ProcessBlock, 拼接输出
std::shared_ptr<Vha::ProcessResult> processStreaming(Vha::HearingAid& ha, const std::vector<double>& signal,
                                                     std::vector<double>& output) {
    const size_t block_size = static_cast<size_t>(ha.GetBufferSize());
    std::shared_ptr<Vha::ProcessResult> last;
    for (size_t start = 0; start < signal.size(); start += block_size) {
        size_t end = std::min(signal.size(), start + block_size);
        std::vector<double> block(signal.begin() + start, signal.begin() + end);
        last = ha.ProcessBlock(block, ha.GetSampleRate());
        if (!last->IsSuccess()) {
            return last;
        }
        const auto& out = last->GetAudio();
        output.insert(output.end(), out.begin(), out.end());
    }
    return last;
}

int main(int argc, char* argv[]) {
    std::string input_file;
    std::string output_file = "enhanced.wav";
    std::string config_file;
    std::string type = "sem";
    std::string strategy_name;
    double gain_threshold_db = 12.0;

    // 解析参数
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-i") == 0 && i + 1 < argc) {
            input_file = argv[++i];
        } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            type = argv[++i];
        } else if (strcmp(argv[i], "-s") == 0 && i + 1 < argc) {
            strategy_name = argv[++i];
        } else if (strcmp(argv[i], "-g") == 0 && i + 1 < argc) {
            gain_threshold_db = std::stod(argv[++i]);
        } else if (strcmp(argv[i], "-q") == 0) {
            Vha::HearingAid::SetVerbose(false);
        }
    }

    Vha::ProcessingStrategy strategy = Vha::ProcessingStrategy::BATCH_OFFLINE;
    if (!strategy_name.empty() && !parseStrategy(strategy_name, strategy)) {
        std::cerr << "错误: 未知处理策略 '" << strategy_name << "'\n"
            << "可用策略: offline, online, streaming\n";
        return 1;
    }

    // 创建助听器
    std::unique_ptr<Vha::HearingAid> ha;
    if (!config_file.empty()) {
        std::cout << "加载配置: " << config_file << std::endl;
        ha = std::make_unique<Vha::HearingAid>(config_file);
    } else {
        Vha::HearingAidConfig config;
        if (type == "sem") {
            config = Vha::HearingAidConfig::Sem();
        } else if (type == "baseline") {
            config = Vha::HearingAidConfig::Baseline();
        } else {
            std::cerr << "错误: 未知助听器类型 '" << type << "'\n"
                << "可用类型: sem, baseline\n";
            return 1;
        }
        config = config.withGainThreshold(gain_threshold_db);
        if (!strategy_name.empty()) {
            config = config.withStrategy(strategy);
        }
        ha = std::make_unique<Vha::HearingAid>(config);
    }

    if (!ha->IsInitialized()) {
        std::cerr << "助听器初始化失败: " << ha->GetLastError() << std::endl;
        return 1;
    }
    if (!config_file.empty() && !strategy_name.empty()) {
        ha->SetProcessingStrategy(strategy);
    }

    std::cout << "助听器: " << ha->GetName() << std::endl;
    std::cout << "采样率: " << ha->GetSampleRate() << " Hz" << std::endl;
    std::cout << "频带数: " << ha->GetNumBands() << std::endl;
    std::cout << "块长: " << ha->GetBufferSize() << " 样本" << std::endl;
    std::cout << std::endl;

    std::shared_ptr<Vha::ProcessResult> result;
    if (!input_file.empty() && ha->GetProcessingStrategy() != Vha::ProcessingStrategy::STREAMING) {
        std::cout << "处理文件: " << input_file << std::endl;
        result = ha->ProcessFile(input_file, output_file);
    } else {
        std::vector<double> signal;
        if (input_file.empty()) {
            std::cout << "生成测试信号..." << std::endl;
            signal = makeTestSignal(ha->GetSampleRate());
        } else if (!Vha::LoadAudio(input_file, ha->GetSampleRate(), signal)) {
            std::cerr << "读取失败: " << input_file << std::endl;
            return 1;
        }

        if (ha->GetProcessingStrategy() == Vha::ProcessingStrategy::STREAMING) {
            std::vector<double> output;
            auto last = processStreaming(*ha, signal, output);
            if (!last || !last->IsSuccess()) {
                std::cerr << "处理失败";
                if (last) {
                    std::cerr << " [" << last->GetCode() << "]: " << last->GetMessage();
                }
                std::cerr << std::endl;
                return 1;
            }
            std::cout << "流式处理完成: " << output.size() << " 样本" << std::endl;
            if (!Vha::SaveAudio(output, ha->GetSampleRate(), output_file)) {
                std::cerr << "保存失败: " << output_file << std::endl;
                return 1;
            }
            std::cout << "已保存: " << output_file << std::endl;
            return 0;
        }

        result = ha->Process(signal, ha->GetSampleRate());
        if (result && result->IsSuccess() && !result->SaveToFile(output_file)) {
            std::cerr << "保存失败: " << output_file << std::endl;
            return 1;
        }
    }

    if (!result || !result->IsSuccess()) {
        std::cerr << "处理失败";
        if (result) {
            std::cerr << " [" << result->GetCode() << "]: " << result->GetMessage();
        }
        std::cerr << std::endl;
        return 1;
    }

    // 显示信息
    std::cout << "时长: " << result->GetDurationMs() << " ms" << std::endl;
    std::cout << "处理时间: " << result->GetProcessingTimeMs() << " ms" << std::endl;
    std::cout << "RTF: " << result->GetRTF() << std::endl;
    if (!result->GetGains().empty()) {
        const auto& gains = result->GetGains();
        double min_gain = 1.0;
        for (const auto& row : gains) {
            for (double g : row) {
                min_gain = std::min(min_gain, g);
            }
        }
        std::cout << "块数: " << gains.size() << ", 最小增益: " << 20.0 * std::log10(min_gain) << " dB" << std::endl;
    }
    std::cout << "已保存: " << output_file << std::endl;
    return 0;
}
