/**
 * @file observation_client.hpp
 * @brief HTTP client for the observation service running inside a sandbox
 *
 * The service exposes:
 * - GET /health      -> {"status": "ok", "observation_server": "reachable"}
 * - GET /screenshot  -> {"screenshot_path", "mouse_position", "screen_size"}
 * - GET /record      -> recording status payloads (mode=start|stop)
 *
 * @date 2025
 */

#pragma once

#include "vmbench/utils/http_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace vmbench {
namespace core {

/**
 * @struct ScreenshotInfo
 * @brief Screenshot taken by the observation service
 */
struct ScreenshotInfo {
    std::string relative_path;           ///< Path relative to the shared directory
    std::filesystem::path host_path;     ///< Same file seen from the host
    int mouse_x{0};                      ///< Pointer position
    int mouse_y{0};
    int screen_width{0};                 ///< Screen resolution
    int screen_height{0};
};

/**
 * @struct RecordingContext
 * @brief Recording state of one observation client
 *
 * Lives in the client instead of process-wide flags so several sandboxes
 * can record independently.
 */
struct RecordingContext {
    bool active{false};                                   ///< Recording in progress
    int fps{5};                                           ///< Frames per second requested
    std::string codec{"mp4v"};                            ///< Video codec requested
    std::optional<std::string> screen_recording_file;     ///< File reported by the service
    std::chrono::system_clock::time_point started_at;     ///< Start time
    nlohmann::json last_status;                           ///< Last /record payload
};

/**
 * @class ObservationClient
 * @brief Health polling, screenshots and recordings
 *
 * **Usage Example**:
 * @code
 * ObservationClient client(
 *     std::make_unique<utils::BeastHttpTransport>("localhost", 60002),
 *     descriptor.HostSharedDir());
 * client.WaitUntilHealthy();
 *
 * auto shot = client.TakeScreenshot("pillow", "step-3");
 * spdlog::info("Screenshot at {}", shot.host_path.string());
 * @endcode
 */
class ObservationClient {
public:
    /**
     * @brief Construct client
     * @param transport HTTP transport bound to the observation port (owned)
     * @param host_shared_dir Host side of the sandbox shared directory
     */
    ObservationClient(std::unique_ptr<utils::HttpTransport> transport,
                      std::filesystem::path host_shared_dir);

    ~ObservationClient();

    ObservationClient(const ObservationClient&) = delete;
    ObservationClient& operator=(const ObservationClient&) = delete;

    /**
     * @brief Poll /health until status == "ok"
     * @param retries Maximum attempts
     * @param delay Pause between attempts
     * @throws ServiceUnavailableError after the last failed attempt
     */
    void WaitUntilHealthy(int retries = 15,
                          std::chrono::duration<double> delay = std::chrono::seconds(10));

    /**
     * @brief Raw /health payload
     * @throws HttpTransportError, ServiceUnavailableError
     */
    nlohmann::json Health();

    /**
     * @brief Take a screenshot
     * @param method Capture backend ("pillow" or "pyautogui")
     * @param step Optional label prepended to the file name
     * @throws ServiceUnavailableError if the service reports an error
     */
    ScreenshotInfo TakeScreenshot(const std::string& method = "pillow",
                                  const std::optional<std::string>& step = std::nullopt);

    /**
     * @brief Start action and screen recording
     * @return Service status payload
     */
    nlohmann::json StartRecording(int fps = 5, const std::string& codec = "mp4v");

    /**
     * @brief Stop recording
     * @return Service status payload
     */
    nlohmann::json StopRecording();

    /**
     * @brief Stop an active recording; errors are logged, not thrown
     */
    void Shutdown();

    const RecordingContext& Recording() const { return recording_; }

private:
    std::unique_ptr<utils::HttpTransport> transport_;  ///< HTTP transport
    std::filesystem::path host_shared_dir_;            ///< Host shared directory
    RecordingContext recording_;                        ///< Recording state

    nlohmann::json GetJson(const std::string& target);
};

} // namespace core
} // namespace vmbench
