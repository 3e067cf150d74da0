#include "internal/utils/logging.hpp"

#include <atomic>
#include <iostream>
#include <string>

namespace vha {
namespace log {

namespace {

std::atomic<bool> g_verbose{true};

double blocksPerSecond(int num_blocks, double seconds) {
    return seconds > 0.0 ? num_blocks / seconds : 0.0;
}

}  // namespace

void setVerbose(bool verbose) {
    g_verbose.store(verbose);
}

bool isVerbose() {
    return g_verbose.load();
}

void logInfo(const std::string& message) {
    if (g_verbose.load()) {
        std::cout << "Info: " << message << std::endl;
    }
}

void logWarning(const std::string& message) {
    std::cerr << "Warning: " << message << std::endl;
}

void logError(const std::string& message) {
    std::cerr << "Error: " << message << std::endl;
}

// =============================================================================
// 处理指标
// =============================================================================

void logBackendProcessing(const std::string& name, int num_blocks, double seconds) {
    if (!g_verbose.load()) return;
    std::cout << "Info: " << name << " backend processed " << num_blocks << " blocks in "
              << seconds * 1000.0 << "ms (" << blocksPerSecond(num_blocks, seconds)
              << " blocks/s)" << std::endl;
}

void logSynthesisMetrics(const std::string& name, int num_blocks, double seconds) {
    if (!g_verbose.load()) return;
    std::cout << "Info: " << name << " synthesized " << num_blocks << " blocks in "
              << seconds * 1000.0 << "ms (" << blocksPerSecond(num_blocks, seconds)
              << " blocks/s)" << std::endl;
}

void logHearingAidCreated(const std::string& name, const std::string& strategy) {
    logInfo(name + " initialized (strategy: " + strategy + ")");
}

}  // namespace log
}  // namespace vha
