#include "vmbench/core/observation_client.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "fakes.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "vmbench/core/errors.hpp"

namespace {

using ::testing::ElementsAre;
using vmbench::core::ObservationClient;
using vmbench::core::ServiceUnavailableError;
using vmbench::testing::FakeHttpTransport;
using vmbench::testing::HttpHandler;
using vmbench::utils::HttpRequest;
using vmbench::utils::HttpResponse;

constexpr std::chrono::duration<double> kNoDelay(0.001);

struct Client {
    std::shared_ptr<std::vector<std::string>> targets = std::make_shared<std::vector<std::string>>();
    std::unique_ptr<ObservationClient> client;

    explicit Client(HttpHandler handler) {
        client = std::make_unique<ObservationClient>(
            std::make_unique<FakeHttpTransport>("localhost", 61002, std::move(handler), targets),
            "/srv/shared");
    }
};

TEST(ObservationClientTest, HealthyAfterRetries) {
    int calls = 0;
    Client c([&calls](const HttpRequest&) -> HttpResponse {
        ++calls;
        if (calls < 3) {
            return {503, "starting"};
        }
        return {200, R"({"status": "ok"})"};
    });

    c.client->WaitUntilHealthy(5, kNoDelay);
    EXPECT_EQ(calls, 3);
    EXPECT_THAT(*c.targets, ElementsAre("/health", "/health", "/health"));
}

TEST(ObservationClientTest, UnhealthyAfterAllRetries) {
    int calls = 0;
    Client c([&calls](const HttpRequest&) -> HttpResponse {
        ++calls;
        return {200, R"({"status": "degraded"})"};
    });

    EXPECT_THROW(c.client->WaitUntilHealthy(3, kNoDelay), ServiceUnavailableError);
    EXPECT_EQ(calls, 3);
}

TEST(ObservationClientTest, InvalidJsonIsUnavailable) {
    Client c([](const HttpRequest&) -> HttpResponse { return {200, "<html>"}; });
    EXPECT_THROW(c.client->Health(), ServiceUnavailableError);
}

TEST(ObservationClientTest, Screenshot) {
    Client c([](const HttpRequest&) -> HttpResponse {
        return {200, R"({"screenshot_path": "screenshots/step_3.png",
                         "mouse_position": [10, 20], "screen_size": [1920, 1080]})"};
    });

    auto shot = c.client->TakeScreenshot("pillow", std::string("3"));
    EXPECT_EQ(shot.relative_path, "screenshots/step_3.png");
    EXPECT_EQ(shot.host_path, std::filesystem::path("/srv/shared/screenshots/step_3.png"));
    EXPECT_EQ(shot.mouse_x, 10);
    EXPECT_EQ(shot.mouse_y, 20);
    EXPECT_EQ(shot.screen_width, 1920);
    EXPECT_EQ(shot.screen_height, 1080);
    EXPECT_THAT(*c.targets, ElementsAre("/screenshot?method=pillow&step=3"));
}

TEST(ObservationClientTest, ScreenshotErrorStatus) {
    Client c([](const HttpRequest&) -> HttpResponse {
        return {200, R"({"status": "error", "message": "no display"})"};
    });
    EXPECT_THROW(c.client->TakeScreenshot(), ServiceUnavailableError);
}

TEST(ObservationClientTest, RecordingLifecycle) {
    Client c([](const HttpRequest& request) -> HttpResponse {
        if (request.target.find("mode=start") != std::string::npos) {
            return {200, R"({"status": "recording", "screen_recording_file": "recording.mp4"})"};
        }
        return {200, R"({"status": "stopped"})"};
    });

    c.client->StartRecording(10, "mp4v");
    EXPECT_TRUE(c.client->Recording().active);
    EXPECT_EQ(c.client->Recording().fps, 10);
    ASSERT_TRUE(c.client->Recording().screen_recording_file.has_value());
    EXPECT_EQ(*c.client->Recording().screen_recording_file, "recording.mp4");

    c.client->Shutdown();
    EXPECT_FALSE(c.client->Recording().active);
    EXPECT_EQ(c.client->Recording().last_status["status"], "stopped");

    // Nothing left to stop
    c.client->Shutdown();
    EXPECT_THAT(*c.targets, ElementsAre("/record?codec=mp4v&fps=10&mode=start", "/record?mode=stop"));
}

TEST(ObservationClientTest, ShutdownSurvivesStopFailure) {
    bool started = false;
    Client c([&started](const HttpRequest&) -> HttpResponse {
        if (!started) {
            started = true;
            return {200, R"({"status": "recording"})"};
        }
        return {500, ""};
    });

    c.client->StartRecording();
    c.client->Shutdown();
    EXPECT_FALSE(c.client->Recording().active);
}

}  // namespace
