/**
 * @file error_log.cpp
 * @brief Error log writing
 *
 * @date 2025
 */

#include "vmbench/orchestrator/error_log.hpp"
#include "vmbench/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace vmbench {
namespace orchestrator {

namespace {

std::string FormatNow(const char* format) {
    auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_local{};
    localtime_r(&time_t, &tm_local);

    std::ostringstream ss;
    ss << std::put_time(&tm_local, format);
    return ss.str();
}

void DescribeLevel(const std::exception& e, int depth, std::ostringstream& out) {
    out << std::string(depth * 2, ' ') << (depth == 0 ? "" : "caused by: ") << e.what() << "\n";

    if (const auto* exec = dynamic_cast<const core::ExecutionError*>(&e)) {
        out << exec->Traceback() << "\n";
    }
    else if (const auto* cmd = dynamic_cast<const core::RemoteCommandError*>(&e)) {
        if (!cmd->Stdout().empty()) {
            out << "Stdout:\n" << cmd->Stdout() << "\n";
        }
    }

    try {
        std::rethrow_if_nested(e);
    }
    catch (const std::exception& nested) {
        DescribeLevel(nested, depth + 1, out);
    }
}

std::string Write(const std::filesystem::path& result_dir, const std::string& uid,
                  const std::string& error_type, const std::string& message,
                  const std::string& details) {
    auto log_dir = result_dir / "logs";
    std::filesystem::create_directories(log_dir);

    std::string filename = uid + "_" + error_type + "_error_" + FormatNow("%Y%m%d_%H%M%S") + ".log";
    auto path = log_dir / filename;

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot write error log " + path.string());
    }
    file << "Error Type: " << error_type << "\n";
    file << "Timestamp: " << FormatNow("%Y-%m-%dT%H:%M:%S") << "\n";
    file << "Task UID: " << uid << "\n";
    file << "Exception: " << message << "\n\n";
    file << "Traceback:\n";
    file << details;

    auto relative = std::filesystem::path("logs") / filename;
    spdlog::error("[{}] {}: {} (details in {})", uid, error_type, message, relative.string());
    return relative.string();
}

} // namespace

std::string DescribeException(const std::exception& e) {
    std::ostringstream out;
    DescribeLevel(e, 0, out);
    return out.str();
}

std::string WriteErrorLog(const std::filesystem::path& result_dir, const std::string& uid,
                          const std::string& error_type, const std::exception& error) {
    return Write(result_dir, uid, error_type, error.what(), DescribeException(error));
}

std::string WriteErrorLog(const std::filesystem::path& result_dir, const std::string& uid,
                          const std::string& error_type, const std::string& message,
                          const std::string& details) {
    return Write(result_dir, uid, error_type, message, details);
}

} // namespace orchestrator
} // namespace vmbench
