#include "vmbench/core/shell_channel.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>
#include "fakes.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "vmbench/core/errors.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using vmbench::core::CommandTimeoutError;
using vmbench::core::FileTransferError;
using vmbench::core::PasswordPromptWatcher;
using vmbench::core::RemoteCommandError;
using vmbench::core::RemotePathTypeError;
using vmbench::core::ShellChannel;
using vmbench::testing::FakeShellState;
using vmbench::testing::FakeShellTransport;
using vmbench::testing::ListFiles;
using vmbench::testing::QuickShellConfig;
using vmbench::testing::ReadFile;
using vmbench::testing::ScriptedCommand;
using vmbench::testing::TempDir;
using vmbench::testing::WriteFile;

std::unique_ptr<ShellChannel> MakeChannel(const std::shared_ptr<FakeShellState>& state,
                                          vmbench::core::ShellConfig config = QuickShellConfig()) {
    return std::make_unique<ShellChannel>(std::make_unique<FakeShellTransport>(state), config);
}

TEST(ShellChannelTest, BuildCommandLine) {
    auto plain = ShellChannel::BuildCommandLine("ls", {}, false);
    EXPECT_EQ(plain.command, "ls");
    EXPECT_FALSE(plain.needs_pty);

    auto root = ShellChannel::BuildCommandLine("apt update", {}, true);
    EXPECT_EQ(root.command, "sudo -S apt update");
    EXPECT_TRUE(root.needs_pty);

    auto explicit_sudo = ShellChannel::BuildCommandLine("sudo reboot", {}, true);
    EXPECT_EQ(explicit_sudo.command, "sudo reboot");
    EXPECT_TRUE(explicit_sudo.needs_pty);

    auto with_env = ShellChannel::BuildCommandLine(
        "echo $A", {{"A", "x y"}, {"bad-name", "v"}, {"B", "1"}}, false);
    EXPECT_EQ(with_env.command, "A='x y' B=1 echo $A");
}

TEST(ShellChannelTest, PasswordPromptWatcher) {
    PasswordPromptWatcher watcher(true);
    EXPECT_EQ(watcher.Feed("[sudo] pass"), PasswordPromptWatcher::Action::NONE);
    EXPECT_EQ(watcher.Feed("word FOR user: "), PasswordPromptWatcher::Action::SEND_PASSWORD);
    EXPECT_TRUE(watcher.Injected());
    EXPECT_EQ(watcher.Feed("[sudo] password for user: "), PasswordPromptWatcher::Action::NONE);

    PasswordPromptWatcher without(false);
    EXPECT_EQ(without.Feed("password for user"), PasswordPromptWatcher::Action::MISSING_PASSWORD);
}

TEST(ShellChannelTest, ExecCommandCapturesOutput) {
    auto state = std::make_shared<FakeShellState>();
    state->handler = [](const std::string&) {
        ScriptedCommand cmd;
        cmd.stdout_text = "hello\n";
        cmd.stderr_text = "warning\n";
        return cmd;
    };
    auto channel = MakeChannel(state);

    auto out = channel->ExecCommand("echo hello");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, 0);
    EXPECT_EQ(out->stdout_output, "hello\n");
    EXPECT_EQ(out->stderr_output, "warning\n");
    EXPECT_EQ(state->connect_count.load(), 1);
    EXPECT_TRUE(channel->IsConnected());
}

TEST(ShellChannelTest, NonZeroExitRaises) {
    auto state = std::make_shared<FakeShellState>();
    state->handler = [](const std::string&) {
        ScriptedCommand cmd;
        cmd.stdout_text = "partial";
        cmd.stderr_text = "boom";
        cmd.exit_status = 3;
        return cmd;
    };
    auto channel = MakeChannel(state);

    try {
        channel->ExecCommand("false");
        FAIL() << "expected RemoteCommandError";
    } catch (const RemoteCommandError& e) {
        EXPECT_EQ(e.Status(), 3);
        EXPECT_EQ(e.Command(), "false");
        EXPECT_EQ(e.Stdout(), "partial");
        EXPECT_EQ(e.Stderr(), "boom");
    }
}

TEST(ShellChannelTest, SudoPasswordInjected) {
    auto state = std::make_shared<FakeShellState>();
    state->handler = [](const std::string&) {
        ScriptedCommand cmd;
        cmd.prompt_password = true;
        cmd.stdout_text = "installed\n";
        return cmd;
    };
    auto config = QuickShellConfig();
    config.password = "pw";
    auto channel = MakeChannel(state, config);

    auto out = channel->ExecCommand("apt install -y jq", {}, true);
    ASSERT_TRUE(out.has_value());
    EXPECT_THAT(out->stdout_output, HasSubstr("installed"));
    EXPECT_THAT(state->written, ElementsAre("pw\n"));
    ASSERT_EQ(state->executed.size(), 1u);
    EXPECT_EQ(state->executed[0].command, "sudo -S apt install -y jq");
    EXPECT_TRUE(state->executed[0].pty);

    // An explicit password wins over the configured one
    channel->ExecCommand("whoami", {}, true, true, std::string("other"));
    EXPECT_THAT(state->written, ElementsAre("pw\n", "other\n"));
}

TEST(ShellChannelTest, SudoWithoutPasswordFails) {
    auto state = std::make_shared<FakeShellState>();
    state->handler = [](const std::string&) {
        ScriptedCommand cmd;
        cmd.prompt_password = true;
        return cmd;
    };
    auto config = QuickShellConfig();
    config.password = std::nullopt;
    auto channel = MakeChannel(state, config);

    try {
        channel->ExecCommand("mount -a", {}, true);
        FAIL() << "expected RemoteCommandError";
    } catch (const RemoteCommandError& e) {
        EXPECT_EQ(e.Status(), -1);
        EXPECT_EQ(e.Stderr(), "Sudo password required but not provided.");
        EXPECT_THAT(e.Stdout(), HasSubstr("password for"));
    }
    EXPECT_THAT(state->written, IsEmpty());
}

TEST(ShellChannelTest, TimeoutKeepsPartialOutput) {
    auto state = std::make_shared<FakeShellState>();
    state->handler = [](const std::string&) {
        ScriptedCommand cmd;
        cmd.stdout_text = "step 1 done\n";
        cmd.hang = true;
        return cmd;
    };
    auto channel = MakeChannel(state);

    auto started = std::chrono::steady_clock::now();
    try {
        channel->ExecCommand("sleep 1000", {}, false, true, std::nullopt,
                             std::chrono::duration<double>(0.2));
        FAIL() << "expected CommandTimeoutError";
    } catch (const CommandTimeoutError& e) {
        EXPECT_EQ(e.Stdout(), "step 1 done\n");
        EXPECT_THAT(e.what(), HasSubstr("sleep 1000"));
    }
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(200));
}

TEST(ShellChannelTest, NonBlockingReturnsImmediately) {
    auto state = std::make_shared<FakeShellState>();
    state->handler = [](const std::string&) {
        ScriptedCommand cmd;
        cmd.hang = true;
        return cmd;
    };
    auto channel = MakeChannel(state);

    EXPECT_FALSE(channel->ExecCommand("python3 server.py", {}, false, false).has_value());
    EXPECT_THAT(state->Commands(), ElementsAre("python3 server.py"));
    EXPECT_EQ(channel->BackgroundCommands(), 1u);

    channel->Close();
    EXPECT_EQ(state->closed_streams.load(), 1);
}

TEST(ShellChannelTest, PlainOutputMentioningPasswordIsNotAPrompt) {
    auto state = std::make_shared<FakeShellState>();
    state->handler = [](const std::string&) {
        ScriptedCommand cmd;
        cmd.stdout_text = "Reset password for alice\n";
        return cmd;
    };
    auto config = QuickShellConfig();
    config.password = std::nullopt;
    auto channel = MakeChannel(state, config);

    auto out = channel->ExecCommand("cat notes.txt");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, 0);
    EXPECT_EQ(out->stdout_output, "Reset password for alice\n");

    config.password = "s3cret";
    auto with_password = MakeChannel(state, config);
    out = with_password->ExecCommand("cat notes.txt");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->stdout_output, "Reset password for alice\n");
    EXPECT_THAT(state->written, IsEmpty());
}

TEST(ShellChannelTest, BackgroundSudoPromptAnswered) {
    auto state = std::make_shared<FakeShellState>();
    state->handler = [](const std::string& command) {
        ScriptedCommand cmd;
        cmd.prompt_password = command.find("systemctl") != std::string::npos;
        cmd.hang = cmd.prompt_password;
        return cmd;
    };
    auto config = QuickShellConfig();
    config.password = "pw";
    auto channel = MakeChannel(state, config);

    EXPECT_FALSE(channel->ExecCommand("systemctl start app", {}, true, false).has_value());
    EXPECT_THAT(state->written, ElementsAre("pw\n"));
    EXPECT_EQ(channel->BackgroundCommands(), 1u);

    // Serviced again on the next call without a second answer
    channel->ExecCommand("true");
    EXPECT_THAT(state->written, ElementsAre("pw\n"));
    EXPECT_EQ(channel->BackgroundCommands(), 1u);
}

TEST(ShellChannelTest, BackgroundSudoWithoutPasswordDropped) {
    auto state = std::make_shared<FakeShellState>();
    state->handler = [](const std::string&) {
        ScriptedCommand cmd;
        cmd.prompt_password = true;
        cmd.hang = true;
        return cmd;
    };
    auto config = QuickShellConfig();
    config.password = std::nullopt;
    auto channel = MakeChannel(state, config);

    EXPECT_FALSE(channel->ExecCommand("systemctl start app", {}, true, false).has_value());
    EXPECT_THAT(state->written, IsEmpty());
    EXPECT_EQ(channel->BackgroundCommands(), 0u);
    EXPECT_EQ(state->closed_streams.load(), 1);
}

TEST(ShellChannelTest, FinishedBackgroundCommandsReleased) {
    auto state = std::make_shared<FakeShellState>();
    auto channel = MakeChannel(state);

    for (int i = 0; i < 3; ++i) {
        EXPECT_FALSE(channel->ExecCommand("touch /tmp/marker", {}, false, false).has_value());
    }
    channel->ExecCommand("true");
    EXPECT_EQ(channel->BackgroundCommands(), 0u);
    EXPECT_EQ(state->closed_streams.load(), 4);
}

TEST(ShellChannelTest, ReconnectsDroppedSession) {
    auto state = std::make_shared<FakeShellState>();
    auto channel = MakeChannel(state);

    channel->Connect();
    channel->Connect();
    EXPECT_EQ(state->connect_count.load(), 1);

    state->DropSessions();
    EXPECT_FALSE(channel->IsConnected());
    channel->ExecCommand("true");
    EXPECT_EQ(state->connect_count.load(), 2);
    EXPECT_TRUE(channel->IsConnected());

    channel->Close();
    EXPECT_FALSE(channel->IsConnected());
}

TEST(ShellChannelTest, KeepAliveProbesIdleSession) {
    auto state = std::make_shared<FakeShellState>();
    auto config = QuickShellConfig();
    config.keepalive_interval = std::chrono::seconds(1);
    auto channel = MakeChannel(state, config);

    channel->Connect();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (state->keepalives == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_GE(state->keepalives.load(), 1);
    channel->Close();
}

TEST(ShellChannelTest, FileRoundTrip) {
    TempDir tmp;
    auto state = std::make_shared<FakeShellState>();
    state->fs_root = tmp.Path() / "remote";
    std::filesystem::create_directories(state->fs_root);
    auto channel = MakeChannel(state);

    WriteFile(tmp.Path() / "local.txt", "payload");
    channel->PutFile(tmp.Path() / "local.txt", "/home/user/docs/file.txt");
    EXPECT_EQ(ReadFile(state->fs_root / "home/user/docs/file.txt"), "payload");

    EXPECT_THROW(channel->PutFile(tmp.Path() / "local.txt", "/home/user/docs/file.txt"),
                 FileTransferError);
    EXPECT_THROW(channel->PutFile(tmp.Path() / "missing.txt", "/home/user/x"), FileTransferError);

    channel->DownloadFile("/home/user/docs/file.txt", tmp.Path() / "back" / "file.txt");
    EXPECT_EQ(ReadFile(tmp.Path() / "back" / "file.txt"), "payload");
    EXPECT_THROW(channel->DownloadFile("/home/user/docs/file.txt", tmp.Path() / "back" / "file.txt"),
                 FileTransferError);

    EXPECT_THROW(channel->DownloadFile("/home/user/docs", tmp.Path() / "docs"), RemotePathTypeError);
    EXPECT_THROW(channel->DownloadFile("/home/user/none", tmp.Path() / "none"), FileTransferError);
}

TEST(ShellChannelTest, DirectoryRoundTripWithExclude) {
    TempDir tmp;
    auto state = std::make_shared<FakeShellState>();
    state->fs_root = tmp.Path() / "remote";
    std::filesystem::create_directories(state->fs_root);
    auto channel = MakeChannel(state);

    auto src = tmp.Path() / "project";
    WriteFile(src / "main.py", "print(1)");
    WriteFile(src / "data" / "input.csv", "a,b");
    WriteFile(src / "__pycache__" / "main.pyc", "junk");

    channel->PutDirectory(src, "/home/user/project", {"__pycache__"});
    EXPECT_EQ(ListFiles(state->fs_root / "home/user/project"),
              (std::vector<std::string>{"data/input.csv", "main.py"}));

    auto dst = tmp.Path() / "copy";
    channel->DownloadDirectory("/home/user/project", dst, {"data"});
    EXPECT_EQ(ListFiles(dst), (std::vector<std::string>{"main.py"}));
    EXPECT_EQ(ReadFile(dst / "main.py"), "print(1)");

    EXPECT_THROW(channel->DownloadDirectory("/home/user/project/main.py", tmp.Path() / "x"),
                 RemotePathTypeError);
}

}  // namespace
