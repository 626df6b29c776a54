/**
 * @file code_execution_channel.cpp
 * @brief Kernel session management and the execute_request read loop
 *
 * **Read loop**:
 * ```
 * send execute_request(msg_id)
 * loop:
 *   msg.parent_header.msg_id != msg_id   -> skip
 *   stream  -> RESULT_JSON:<b64> line    -> decode result, wait for idle
 *           -> other lines               -> output
 *   error   -> ExecutionError(traceback)
 *   status idle -> done (unless a result is still expected)
 * ```
 *
 * @date 2025
 */

#include "vmbench/core/code_execution_channel.hpp"
#include "vmbench/core/errors.hpp"
#include "vmbench/core/sandbox_manager.hpp"
#include "vmbench/utils/string_utils.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <spdlog/spdlog.h>

#include <ctime>
#include <iomanip>
#include <regex>
#include <set>
#include <sstream>
#include <thread>
#include <utility>

using json = nlohmann::json;

namespace vmbench {
namespace core {

using utils::StringUtils;

namespace {

std::string NewUuid() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string IsoNow() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string CleanTraceback(const json& traceback) {
    if (!traceback.is_array() || traceback.empty()) {
        return "No traceback information available.";
    }
    std::vector<std::string> lines;
    for (const auto& line : traceback) {
        lines.push_back(StringUtils::StripAnsi(line.get<std::string>()));
    }
    return StringUtils::Join(lines, "\n");
}

} // namespace

CodeExecutionChannel::CodeExecutionChannel(std::unique_ptr<KernelGateway> gateway,
                                           std::shared_ptr<SandboxManager> manager)
    : gateway_(std::move(gateway))
    , manager_(std::move(manager)) {}

CodeExecutionChannel::~CodeExecutionChannel() {
    Cleanup();
}

// ============================================================================
// SESSION
// ============================================================================

void CodeExecutionChannel::InitializeSession(int retries, std::chrono::duration<double> delay) {
    spdlog::info("Initializing kernel session...");

    std::vector<std::string> existing;
    try {
        existing = gateway_->ListKernels();
        spdlog::info("Found {} existing kernel(s)", existing.size());
    }
    catch (const VmbenchError& e) {
        spdlog::warn("Failed to fetch existing kernels: {}", e.what());
    }

    if (!existing.empty()) {
        kernel_id_ = existing.front();
        spdlog::info("Reusing existing kernel: {}", kernel_id_);
    } else {
        for (int attempt = 1; attempt <= retries && kernel_id_.empty(); ++attempt) {
            try {
                spdlog::debug("Creating kernel (attempt {}/{})", attempt, retries);
                kernel_id_ = gateway_->CreateKernel();
                spdlog::info("✓ Created kernel: {}", kernel_id_);
            }
            catch (const VmbenchError& e) {
                spdlog::warn("Kernel creation attempt {}/{} failed: {}", attempt, retries, e.what());
                if (attempt < retries) {
                    std::this_thread::sleep_for(delay);
                }
            }
        }
        if (kernel_id_.empty()) {
            throw KernelSetupError("Failed to create a kernel after " +
                                   std::to_string(retries) + " attempts");
        }
    }

    for (int attempt = 1; attempt <= retries; ++attempt) {
        try {
            socket_ = gateway_->OpenChannel(kernel_id_);
            spdlog::info("✓ Kernel channel connected");
            return;
        }
        catch (const VmbenchError& e) {
            spdlog::debug("Channel connection attempt {}/{} failed: {}", attempt, retries, e.what());
            if (attempt < retries) {
                std::this_thread::sleep_for(delay);
            }
        }
    }
    throw KernelSetupError("Failed to open a channel to kernel " + kernel_id_ +
                           " after " + std::to_string(retries) + " attempts");
}

// ============================================================================
// EXECUTION
// ============================================================================

FinalAnswerRewrite CodeExecutionChannel::RewriteFinalAnswer(const std::string& code) {
    static const std::regex pattern(R"(^final_answer\((.*)\)\s*$)");

    FinalAnswerRewrite rewrite;
    std::vector<std::string> kept;
    for (const auto& line : StringUtils::SplitLines(code)) {
        auto start = line.find_first_not_of(" \t");
        std::string stripped = start == std::string::npos ? "" : line.substr(start);

        std::smatch match;
        if (std::regex_match(stripped, match, pattern)) {
            rewrite.expression = match[1].str();
            continue;
        }
        kept.push_back(line);
    }

    if (!rewrite.expression) {
        rewrite.code = code;
        return rewrite;
    }

    rewrite.code = StringUtils::Join(kept, "\n");
    rewrite.code += "\nimport base64 as _vmb_b64, json as _vmb_json\n";
    rewrite.code += "_vmb_result = " + *rewrite.expression + "\n";
    rewrite.code += std::string("print(\"") + kResultSentinel +
                    "\" + _vmb_b64.b64encode(_vmb_json.dumps(_vmb_result, default=str)"
                    ".encode()).decode())\n";
    return rewrite;
}

json CodeExecutionChannel::BuildExecuteRequest(const std::string& code,
                                               const std::string& msg_id,
                                               const std::string& session_id) {
    return json{
        {"header", {
            {"msg_id", msg_id},
            {"username", "anonymous"},
            {"session", session_id},
            {"msg_type", "execute_request"},
            {"version", "5.0"},
            {"date", IsoNow()}
        }},
        {"parent_header", json::object()},
        {"metadata", json::object()},
        {"content", {
            {"code", code},
            {"silent", false},
            {"store_history", true},
            {"user_expressions", json::object()},
            {"allow_stdin", false}
        }}
    };
}

std::string CodeExecutionChannel::SendExecuteRequest(const std::string& code) {
    if (!socket_) {
        throw KernelSetupError("Kernel channel is not open");
    }
    auto msg_id = NewUuid();
    socket_->Send(BuildExecuteRequest(code, msg_id, NewUuid()).dump());
    return msg_id;
}

ExecutionResult CodeExecutionChannel::RunCode(const std::string& code, bool return_final_answer) {
    try {
        std::string wrapped = code;
        bool expect_result = false;
        if (return_final_answer) {
            auto rewrite = RewriteFinalAnswer(code);
            wrapped = rewrite.code;
            expect_result = rewrite.expression.has_value();
        }

        auto msg_id = SendExecuteRequest(wrapped);

        ExecutionResult run;
        bool waiting_for_idle = false;

        while (true) {
            json msg = json::parse(socket_->Receive());

            std::string parent_id;
            if (msg.contains("parent_header") && msg["parent_header"].is_object()) {
                parent_id = msg["parent_header"].value("msg_id", "");
            }
            if (parent_id != msg_id) {
                continue;
            }

            std::string msg_type = msg.value("msg_type", "");
            if (msg_type.empty() && msg.contains("header")) {
                msg_type = msg["header"].value("msg_type", "");
            }
            const json& content = msg.contains("content") ? msg["content"] : json::object();

            if (msg_type == "stream") {
                std::string text = content.value("text", "");
                std::string passthrough;
                size_t pos = 0;
                while (pos < text.size()) {
                    size_t eol = text.find('\n', pos);
                    size_t end = eol == std::string::npos ? text.size() : eol + 1;
                    std::string line = text.substr(pos, end - pos);
                    pos = end;

                    if (return_final_answer && StringUtils::StartsWith(line, kResultSentinel)) {
                        auto encoded = StringUtils::Trim(line.substr(std::string(kResultSentinel).size()));
                        run.result = json::parse(StringUtils::FromBase64(encoded));
                        waiting_for_idle = true;
                    } else {
                        passthrough += line;
                    }
                }
                run.output += passthrough;
            }
            else if (msg_type == "error") {
                std::string summary = content.value("ename", "Error") + ": " +
                                      content.value("evalue", "");
                throw ExecutionError(summary, CleanTraceback(content.value("traceback", json::array())));
            }
            else if (msg_type == "status" && content.value("execution_state", "") == "idle") {
                if (!expect_result || waiting_for_idle) {
                    break;
                }
            }
        }

        return run;
    }
    catch (const std::exception& e) {
        spdlog::error("Code execution failed: {}", e.what());
        throw;
    }
}

std::string CodeExecutionChannel::InstallPackages(const std::vector<std::string>& packages) {
    std::set<std::string> unique(packages.begin(), packages.end());
    if (unique.empty()) {
        return "";
    }
    std::vector<std::string> list(unique.begin(), unique.end());

    spdlog::info("Installing packages: {}", StringUtils::Join(list, " "));
    auto run = RunCode("!pip install " + StringUtils::Join(list, " "));
    spdlog::debug("{}", run.output);
    return run.output;
}

// ============================================================================
// CLEANUP
// ============================================================================

void CodeExecutionChannel::Cleanup() {
    if (exited_) {
        return;
    }
    exited_ = true;

    spdlog::info("Cleaning up code execution channel...");

    if (!kernel_id_.empty()) {
        try {
            gateway_->DeleteKernel(kernel_id_);
        }
        catch (const std::exception& e) {
            spdlog::warn("Failed to delete kernel {}: {}", kernel_id_, e.what());
        }
    }

    if (socket_) {
        try {
            socket_->Close();
        }
        catch (const std::exception& e) {
            spdlog::warn("Failed to close kernel channel: {}", e.what());
        }
        socket_.reset();
    }

    if (manager_) {
        try {
            manager_->Cleanup(true);
        }
        catch (const std::exception& e) {
            spdlog::warn("Sandbox cleanup failed: {}", e.what());
        }
    }

    spdlog::info("✓ Cleanup complete");
}

} // namespace core
} // namespace vmbench
