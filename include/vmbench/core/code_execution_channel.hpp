/**
 * @file code_execution_channel.hpp
 * @brief Runs Python code in a sandbox kernel and captures output and final answers
 *
 * A `final_answer(<expr>)` line in submitted code is rewritten so the value is
 * printed as JSON, base64-armored behind the `RESULT_JSON:` sentinel, and
 * decoded back into a json value on the host.
 *
 * @date 2025
 */

#pragma once

#include "vmbench/core/kernel_gateway.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vmbench {
namespace core {

class SandboxManager;

/// Stream-line prefix carrying the encoded final answer
inline constexpr const char* kResultSentinel = "RESULT_JSON:";

/**
 * @struct ExecutionResult
 * @brief Outcome of one RunCode call
 */
struct ExecutionResult {
    std::optional<nlohmann::json> result;   ///< Decoded final answer, if requested and produced
    std::string output;                     ///< Stream output with sentinel lines removed
};

/**
 * @struct FinalAnswerRewrite
 * @brief Code after final_answer() extraction
 */
struct FinalAnswerRewrite {
    std::string code;                        ///< Code to send to the kernel
    std::optional<std::string> expression;   ///< Captured expression (last occurrence)
};

/**
 * @class CodeExecutionChannel
 * @brief Session with one kernel of a sandbox
 *
 * **Usage Example**:
 * @code
 * CodeExecutionChannel channel(std::move(gateway), manager);
 * channel.InitializeSession();
 *
 * auto run = channel.RunCode("x = 2 + 3\nfinal_answer(x)", true);
 * // run.result == 5
 *
 * channel.Cleanup();   // also tears down the sandbox
 * @endcode
 */
class CodeExecutionChannel {
public:
    /**
     * @brief Construct channel
     * @param gateway Kernel gateway (owned)
     * @param manager Sandbox torn down by Cleanup(), may be null
     */
    explicit CodeExecutionChannel(std::unique_ptr<KernelGateway> gateway,
                                  std::shared_ptr<SandboxManager> manager = nullptr);

    ~CodeExecutionChannel();

    CodeExecutionChannel(const CodeExecutionChannel&) = delete;
    CodeExecutionChannel& operator=(const CodeExecutionChannel&) = delete;

    /**
     * @brief Reuse or create a kernel, then open its channel
     * @throws KernelSetupError when every attempt failed
     */
    void InitializeSession(int retries = 5,
                           std::chrono::duration<double> delay = std::chrono::seconds(5));

    /**
     * @brief Execute code and wait for the kernel to go idle
     * @param code Python source
     * @param return_final_answer Rewrite and capture a final_answer() call
     * @throws ExecutionError if the kernel reports an error
     */
    ExecutionResult RunCode(const std::string& code, bool return_final_answer = false);

    /**
     * @brief pip-install packages in the kernel
     * @return Installer output
     */
    std::string InstallPackages(const std::vector<std::string>& packages);

    /**
     * @brief Delete the kernel, close the socket and clean up the sandbox
     *
     * Runs once; each step is attempted even if an earlier one failed.
     */
    void Cleanup();

    const std::string& KernelId() const { return kernel_id_; }
    bool IsOpen() const { return socket_ != nullptr; }

    /// Extract final_answer(...) lines and append the encoding epilogue
    static FinalAnswerRewrite RewriteFinalAnswer(const std::string& code);

    /// Build a Jupyter execute_request message
    static nlohmann::json BuildExecuteRequest(const std::string& code,
                                              const std::string& msg_id,
                                              const std::string& session_id);

private:
    std::unique_ptr<KernelGateway> gateway_;
    std::shared_ptr<SandboxManager> manager_;
    std::unique_ptr<KernelSocket> socket_;
    std::string kernel_id_;
    bool exited_{false};

    std::string SendExecuteRequest(const std::string& code);
};

} // namespace core
} // namespace vmbench
