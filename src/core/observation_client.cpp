/**
 * @file observation_client.cpp
 * @brief Implementation of the observation service client
 *
 * @date 2025
 */

#include "vmbench/core/observation_client.hpp"
#include "vmbench/core/errors.hpp"
#include "vmbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <thread>
#include <utility>

using json = nlohmann::json;

namespace vmbench {
namespace core {

using utils::StringUtils;

ObservationClient::ObservationClient(std::unique_ptr<utils::HttpTransport> transport,
                                     std::filesystem::path host_shared_dir)
    : transport_(std::move(transport))
    , host_shared_dir_(std::move(host_shared_dir)) {}

ObservationClient::~ObservationClient() {
    Shutdown();
}

json ObservationClient::GetJson(const std::string& target) {
    utils::HttpRequest request;
    request.method = "GET";
    request.target = target;

    auto response = transport_->Send(request);
    if (response.status < 200 || response.status >= 300) {
        throw ServiceUnavailableError("GET " + target + " returned HTTP " +
                                      std::to_string(response.status));
    }

    try {
        return json::parse(response.body);
    }
    catch (const json::parse_error& e) {
        throw ServiceUnavailableError("GET " + target + " returned invalid JSON: " + e.what());
    }
}

// ============================================================================
// HEALTH
// ============================================================================

json ObservationClient::Health() {
    return GetJson("/health");
}

void ObservationClient::WaitUntilHealthy(int retries, std::chrono::duration<double> delay) {
    spdlog::info("Waiting for observation service at {}:{}...",
                 transport_->Host(), transport_->Port());

    for (int attempt = 1; attempt <= retries; ++attempt) {
        try {
            auto status = Health();
            if (status.value("status", "") == "ok") {
                spdlog::info("✓ Observation service healthy after {} attempt(s)", attempt);
                return;
            }
            spdlog::warn("Attempt {}/{}: service not healthy: {}", attempt, retries, status.dump());
        }
        catch (const VmbenchError& e) {
            spdlog::warn("Attempt {}/{}: {}", attempt, retries, e.what());
        }

        if (attempt < retries) {
            std::this_thread::sleep_for(delay);
        }
    }

    throw ServiceUnavailableError("Observation service at " + transport_->Host() + ":" +
                                  std::to_string(transport_->Port()) +
                                  " not healthy after " + std::to_string(retries) +
                                  " attempts");
}

// ============================================================================
// SCREENSHOTS
// ============================================================================

ScreenshotInfo ObservationClient::TakeScreenshot(const std::string& method,
                                                 const std::optional<std::string>& step) {
    std::map<std::string, std::string> params = {{"method", method}};
    if (step) {
        params["step"] = *step;
    }

    auto payload = GetJson("/screenshot" + StringUtils::BuildQuery(params));
    if (payload.value("status", "") == "error" || !payload.contains("screenshot_path")) {
        throw ServiceUnavailableError("Screenshot failed: " +
                                      payload.value("message", payload.dump()));
    }

    ScreenshotInfo info;
    info.relative_path = payload.at("screenshot_path").get<std::string>();
    info.host_path = host_shared_dir_ / info.relative_path;

    const auto& mouse = payload.at("mouse_position");
    info.mouse_x = mouse.at(0).get<int>();
    info.mouse_y = mouse.at(1).get<int>();

    const auto& screen = payload.at("screen_size");
    info.screen_width = screen.at(0).get<int>();
    info.screen_height = screen.at(1).get<int>();

    spdlog::debug("Screenshot {} ({}x{}, mouse {},{})", info.relative_path,
                  info.screen_width, info.screen_height, info.mouse_x, info.mouse_y);
    return info;
}

// ============================================================================
// RECORDING
// ============================================================================

json ObservationClient::StartRecording(int fps, const std::string& codec) {
    auto payload = GetJson("/record" + StringUtils::BuildQuery({
        {"mode", "start"}, {"fps", std::to_string(fps)}, {"codec", codec}}));

    recording_.active = true;
    recording_.fps = fps;
    recording_.codec = codec;
    recording_.started_at = std::chrono::system_clock::now();
    recording_.last_status = payload;
    if (payload.contains("screen_recording_file")) {
        recording_.screen_recording_file = payload["screen_recording_file"].get<std::string>();
    }

    spdlog::info("Recording started ({} fps, {})", fps, codec);
    return payload;
}

json ObservationClient::StopRecording() {
    auto payload = GetJson("/record" + StringUtils::BuildQuery({{"mode", "stop"}}));

    recording_.active = false;
    recording_.last_status = payload;

    spdlog::info("Recording stopped");
    return payload;
}

void ObservationClient::Shutdown() {
    if (!recording_.active) {
        return;
    }
    try {
        StopRecording();
    }
    catch (const std::exception& e) {
        spdlog::warn("Failed to stop recording: {}", e.what());
        recording_.active = false;
    }
}

} // namespace core
} // namespace vmbench
