/**
 * @file shell_channel.cpp
 * @brief Implementation of the persistent shell channel
 *
 * **Command Execution Workflow**:
 * 1. Build command line (inline env prefix, sudo -S elevation)
 * 2. Reconnect if the transport went stale
 * 3. Open exec stream, request pty when elevation is involved
 * 4. Poll stdout/stderr non-blocking in 4 KiB chunks
 * 5. Feed output of elevated commands to the password prompt watcher,
 *    inject password once
 * 6. Enforce the wall-clock deadline, attach partial output on timeout
 * 7. Drain remaining output, read exit status, raise on non-zero
 *
 * **Transfers** are layered on the session's SFTP sub-channel, opened on
 * first use and discarded whenever the session is re-established.
 *
 * @date 2025
 */

#include "vmbench/core/shell_channel.hpp"
#include "vmbench/core/errors.hpp"
#include "vmbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <utility>

namespace vmbench {
namespace core {

using utils::StringUtils;

namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr std::size_t kPromptScanLimit = 4096;
constexpr auto kPollInterval = std::chrono::milliseconds(10);

std::string JoinRemote(const std::string& base, const std::string& name) {
    if (base.empty() || base.back() == '/') {
        return base + name;
    }
    return base + "/" + name;
}

std::string RemoteParent(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return "";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

std::vector<std::filesystem::directory_entry> SortedEntries(const std::filesystem::path& dir) {
    std::vector<std::filesystem::directory_entry> entries;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path() < b.path(); });
    return entries;
}

} // anonymous namespace

// ============================================================================
// PASSWORD PROMPT WATCHER
// ============================================================================

PasswordPromptWatcher::Action PasswordPromptWatcher::Feed(const std::string& chunk) {
    if (injected_) {
        return Action::NONE;
    }

    buffer_ += StringUtils::ToLower(chunk);
    if (buffer_.size() > kPromptScanLimit) {
        buffer_.erase(0, buffer_.size() - kPromptScanLimit);
    }

    if (!StringUtils::Contains(buffer_, kMarker)) {
        return Action::NONE;
    }

    if (!password_available_) {
        return Action::MISSING_PASSWORD;
    }

    injected_ = true;
    buffer_.clear();
    return Action::SEND_PASSWORD;
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

ShellChannel::ShellChannel(std::unique_ptr<ShellTransport> transport, ShellConfig config)
    : transport_(std::move(transport))
    , config_(std::move(config)) {
    spdlog::debug("Shell channel for {}@{}:{}", config_.username, config_.host, config_.port);
}

ShellChannel::~ShellChannel() {
    Close();
}

// ============================================================================
// CONNECTION MANAGEMENT
// ============================================================================

void ShellChannel::Connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    ConnectLocked();
}

bool ShellChannel::IsConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_->IsActive();
}

void ShellChannel::ConnectLocked() {
    if (transport_->IsActive()) {
        return;
    }

    // Anything opened on a previous session is unusable now
    sftp_.reset();
    detached_.clear();
    transport_->Disconnect();

    spdlog::info("Connecting to {}:{} as {}...", config_.host, config_.port, config_.username);
    transport_->Connect(config_);

    if (config_.initial_delay.count() > 0) {
        spdlog::debug("Waiting {:.1f}s for the sandbox to settle", config_.initial_delay.count());
        std::this_thread::sleep_for(config_.initial_delay);
    }

    StartKeepAlive();
    spdlog::info("✓ Shell session established");
}

void ShellChannel::Close() {
    StopKeepAlive();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& background : detached_) {
        try {
            background.stream->Close();
        }
        catch (const std::exception& e) {
            spdlog::warn("Failed to close background command: {}", e.what());
        }
    }
    detached_.clear();
    sftp_.reset();

    try {
        transport_->Disconnect();
    }
    catch (const std::exception& e) {
        spdlog::warn("Error while closing shell session: {}", e.what());
    }
}

// ============================================================================
// KEEP-ALIVE
// ============================================================================

void ShellChannel::StartKeepAlive() {
    if (config_.keepalive_interval.count() <= 0 || keepalive_thread_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(keepalive_mutex_);
        keepalive_stop_ = false;
    }
    keepalive_thread_ = std::thread(&ShellChannel::KeepAliveLoop, this);
}

void ShellChannel::StopKeepAlive() {
    {
        std::lock_guard<std::mutex> lock(keepalive_mutex_);
        keepalive_stop_ = true;
    }
    keepalive_cv_.notify_all();
    if (keepalive_thread_.joinable()) {
        keepalive_thread_.join();
    }
}

void ShellChannel::KeepAliveLoop() {
    std::unique_lock<std::mutex> lock(keepalive_mutex_);
    while (!keepalive_cv_.wait_for(lock, config_.keepalive_interval,
                                   [this] { return keepalive_stop_; })) {
        // A busy session is already exchanging traffic
        std::unique_lock<std::mutex> session(mutex_, std::try_to_lock);
        if (!session.owns_lock()) {
            continue;
        }
        try {
            transport_->SendKeepAlive();
        }
        catch (const std::exception& e) {
            spdlog::warn("Keep-alive failed: {}", e.what());
        }
        PumpBackgroundLocked();
    }
}

// ============================================================================
// BACKGROUND COMMANDS
// ============================================================================

void ShellChannel::PumpBackgroundLocked() {
    std::array<char, kReadChunk> buffer;

    auto it = detached_.begin();
    while (it != detached_.end()) {
        auto& background = *it;
        bool finished = false;

        try {
            for (bool is_stderr : {false, true}) {
                std::size_t n = 0;
                while (!finished &&
                       (n = background.stream->Read(buffer.data(), buffer.size(), is_stderr)) > 0) {
                    if (!background.watcher) {
                        continue;
                    }
                    switch (background.watcher->Feed(std::string(buffer.data(), n))) {
                        case PasswordPromptWatcher::Action::SEND_PASSWORD:
                            spdlog::debug("Password prompt detected, sending password");
                            background.stream->Write(*background.password + "\n");
                            break;
                        case PasswordPromptWatcher::Action::MISSING_PASSWORD:
                            spdlog::warn("Background command needs a sudo password, dropping it: {}",
                                         background.command);
                            finished = true;
                            break;
                        case PasswordPromptWatcher::Action::NONE:
                            break;
                    }
                }
            }

            if (!finished && background.stream->IsEof()) {
                spdlog::debug("Background command exited with status {}: {}",
                              background.stream->ExitStatus(), background.command);
                finished = true;
            }
        }
        catch (const std::exception& e) {
            spdlog::warn("Background command failed: {}: {}", background.command, e.what());
            finished = true;
        }

        if (!finished) {
            ++it;
            continue;
        }

        try {
            background.stream->Close();
        }
        catch (const std::exception& e) {
            spdlog::warn("Failed to close background command: {}", e.what());
        }
        it = detached_.erase(it);
    }
}

std::size_t ShellChannel::BackgroundCommands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detached_.size();
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

CommandLine ShellChannel::BuildCommandLine(const std::string& command,
                                           const std::map<std::string, std::string>& env,
                                           bool as_root) {
    std::string effective = command;

    if (as_root && !StringUtils::StartsWith(StringUtils::Trim(command), "sudo")) {
        effective = "sudo -S " + effective;
    }

    if (!env.empty()) {
        std::vector<std::string> assignments;
        for (const auto& [key, value] : env) {
            if (!StringUtils::IsIdentifier(key)) {
                spdlog::warn("Skipping invalid environment variable name: '{}'", key);
                continue;
            }
            assignments.push_back(key + "=" + StringUtils::ShellQuote(value));
        }
        if (!assignments.empty()) {
            effective = StringUtils::Join(assignments, " ") + " " + effective;
        }
    }

    CommandLine line;
    line.command = effective;
    line.needs_pty = as_root ||
                     StringUtils::Contains(effective, "sudo -S") ||
                     StringUtils::StartsWith(StringUtils::Trim(command), "sudo");
    return line;
}

std::optional<CommandOutput> ShellChannel::ExecCommand(
    const std::string& command,
    const std::map<std::string, std::string>& env,
    bool as_root,
    bool block,
    const std::optional<std::string>& sudo_password,
    std::optional<std::chrono::duration<double>> timeout) {

    CommandLine line = BuildCommandLine(command, env, as_root);
    auto limit = timeout.value_or(config_.command_timeout);
    std::optional<std::string> password = sudo_password ? sudo_password : config_.password;

    std::lock_guard<std::mutex> lock(mutex_);
    ConnectLocked();
    PumpBackgroundLocked();

    spdlog::debug("Executing: {} (pty: {}, timeout: {:.0f}s)",
                  line.command, line.needs_pty, limit.count());

    auto stream = transport_->OpenExecStream();
    if (line.needs_pty) {
        stream->RequestPty();
    }
    stream->Execute(line.command);

    if (!block) {
        BackgroundCommand background;
        background.stream = std::move(stream);
        background.command = line.command;
        if (line.needs_pty) {
            background.watcher.emplace(password.has_value());
            background.password = password;
        }
        detached_.push_back(std::move(background));
        // Answers a prompt that is already waiting
        PumpBackgroundLocked();
        return std::nullopt;
    }

    std::string out;
    std::string err;
    // Only elevated commands can be asked for the sudo password
    std::optional<PasswordPromptWatcher> watcher;
    if (line.needs_pty) {
        watcher.emplace(password.has_value());
    }
    std::array<char, kReadChunk> buffer;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(limit);

    while (true) {
        bool received = false;

        for (bool is_stderr : {false, true}) {
            std::size_t n = stream->Read(buffer.data(), buffer.size(), is_stderr);
            if (n == 0) {
                continue;
            }
            received = true;
            std::string chunk(buffer.data(), n);
            (is_stderr ? err : out) += chunk;
            if (!watcher) {
                continue;
            }

            switch (watcher->Feed(chunk)) {
                case PasswordPromptWatcher::Action::SEND_PASSWORD:
                    spdlog::debug("Password prompt detected, sending password");
                    stream->Write(*password + "\n");
                    break;
                case PasswordPromptWatcher::Action::MISSING_PASSWORD:
                    stream->Close();
                    throw RemoteCommandError(line.command, -1, out,
                                             "Sudo password required but not provided.");
                case PasswordPromptWatcher::Action::NONE:
                    break;
            }
        }

        if (stream->IsEof()) {
            break;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("Command timed out after {:.0f}s: {}", limit.count(), line.command);
            stream->Close();
            throw CommandTimeoutError(line.command, limit.count(), out, err);
        }

        if (!received) {
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    // Drain whatever arrived together with EOF
    for (bool is_stderr : {false, true}) {
        std::size_t n = 0;
        while ((n = stream->Read(buffer.data(), buffer.size(), is_stderr)) > 0) {
            (is_stderr ? err : out).append(buffer.data(), n);
        }
    }

    int status = stream->ExitStatus();
    stream->Close();

    if (status != 0) {
        throw RemoteCommandError(line.command, status, out, err);
    }

    return CommandOutput{status, out, err};
}

// ============================================================================
// FILE TRANSFER
// ============================================================================

RemoteFileSystem& ShellChannel::SftpLocked() {
    ConnectLocked();
    if (!sftp_) {
        sftp_ = transport_->OpenFileSystem();
    }
    return *sftp_;
}

void ShellChannel::MakeRemoteDirsLocked(const std::string& path) {
    if (path.empty() || path == "/") {
        return;
    }

    auto& sftp = SftpLocked();
    if (auto entry = sftp.Stat(path)) {
        if (entry->type != RemoteFileType::DIRECTORY) {
            throw FileTransferError("Remote path exists and is not a directory: " + path);
        }
        return;
    }

    MakeRemoteDirsLocked(RemoteParent(path));
    sftp.MakeDirectory(path);
}

void ShellChannel::PutFile(const std::filesystem::path& local, const std::string& remote,
                           bool mkdir_parents, bool overwrite) {
    std::lock_guard<std::mutex> lock(mutex_);
    PutFileLocked(local, remote, mkdir_parents, overwrite);
}

void ShellChannel::PutFileLocked(const std::filesystem::path& local,
                                 const std::string& remote,
                                 bool mkdir_parents, bool overwrite) {
    if (!std::filesystem::is_regular_file(local)) {
        throw FileTransferError("Local file not found: " + local.string());
    }

    auto& sftp = SftpLocked();
    if (!overwrite && sftp.Stat(remote)) {
        throw FileTransferError("Remote path already exists: " + remote);
    }

    if (mkdir_parents) {
        MakeRemoteDirsLocked(RemoteParent(remote));
    }

    spdlog::debug("Uploading {} -> {}", local.string(), remote);
    sftp.Upload(local, remote);
}

void ShellChannel::PutDirectory(const std::filesystem::path& local, const std::string& remote,
                                const std::set<std::string>& exclude, bool overwrite) {
    std::lock_guard<std::mutex> lock(mutex_);
    PutDirectoryLocked(local, remote, exclude, overwrite);
}

void ShellChannel::PutDirectoryLocked(const std::filesystem::path& local,
                                      const std::string& remote,
                                      const std::set<std::string>& exclude,
                                      bool overwrite) {
    if (!std::filesystem::is_directory(local)) {
        throw FileTransferError("Local directory not found: " + local.string());
    }

    MakeRemoteDirsLocked(remote);

    for (const auto& entry : SortedEntries(local)) {
        std::string name = entry.path().filename().string();
        if (exclude.count(name)) {
            spdlog::debug("Excluded from upload: {}", entry.path().string());
            continue;
        }

        std::string target = JoinRemote(remote, name);
        if (entry.is_directory()) {
            PutDirectoryLocked(entry.path(), target, exclude, overwrite);
        } else if (entry.is_regular_file()) {
            PutFileLocked(entry.path(), target, false, overwrite);
        }
    }
}

void ShellChannel::DownloadFile(const std::string& remote, const std::filesystem::path& local,
                                bool overwrite) {
    std::lock_guard<std::mutex> lock(mutex_);
    DownloadFileLocked(remote, local, overwrite);
}

void ShellChannel::DownloadFileLocked(const std::string& remote,
                                      const std::filesystem::path& local,
                                      bool overwrite) {
    auto& sftp = SftpLocked();

    auto entry = sftp.Stat(remote);
    if (!entry) {
        throw FileTransferError("Remote file not found: " + remote);
    }
    if (entry->type != RemoteFileType::REGULAR) {
        throw RemotePathTypeError("Remote path is not a regular file: " + remote);
    }

    if (std::filesystem::is_directory(local)) {
        throw FileTransferError("Local path is a directory: " + local.string());
    }
    if (std::filesystem::exists(local) && !overwrite) {
        throw FileTransferError("Local file already exists: " + local.string());
    }

    if (local.has_parent_path()) {
        std::filesystem::create_directories(local.parent_path());
    }

    spdlog::debug("Downloading {} -> {}", remote, local.string());
    sftp.Download(remote, local);
}

void ShellChannel::DownloadDirectory(const std::string& remote,
                                     const std::filesystem::path& local,
                                     const std::set<std::string>& exclude,
                                     bool overwrite) {
    std::lock_guard<std::mutex> lock(mutex_);
    DownloadDirectoryLocked(remote, local, exclude, overwrite);
}

void ShellChannel::DownloadDirectoryLocked(const std::string& remote,
                                           const std::filesystem::path& local,
                                           const std::set<std::string>& exclude,
                                           bool overwrite) {
    auto& sftp = SftpLocked();

    auto entry = sftp.Stat(remote);
    if (!entry) {
        throw FileTransferError("Remote directory not found: " + remote);
    }
    if (entry->type != RemoteFileType::DIRECTORY) {
        throw RemotePathTypeError("Remote path is not a directory: " + remote);
    }

    std::filesystem::create_directories(local);

    auto children = sftp.ListDirectory(remote);
    std::sort(children.begin(), children.end(),
              [](const RemoteEntry& a, const RemoteEntry& b) { return a.name < b.name; });

    for (const auto& child : children) {
        if (exclude.count(child.name)) {
            continue;
        }

        std::string source = JoinRemote(remote, child.name);
        switch (child.type) {
            case RemoteFileType::DIRECTORY:
                DownloadDirectoryLocked(source, local / child.name, exclude, overwrite);
                break;
            case RemoteFileType::REGULAR:
                DownloadFileLocked(source, local / child.name, overwrite);
                break;
            default:
                spdlog::debug("Skipping non-regular remote entry: {}", source);
                break;
        }
    }
}

} // namespace core
} // namespace vmbench
