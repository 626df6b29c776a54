/**
 * @file shell_channel.hpp
 * @brief Reconnectable remote shell: commands, sudo prompts and file transfer
 *
 * @date 2025
 */

#pragma once

#include "vmbench/core/shell_transport.hpp"

#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace vmbench {
namespace core {

/**
 * @class PasswordPromptWatcher
 * @brief Detects the sudo password prompt in command output
 *
 * Contract: the prompt is recognized by the substring "password for",
 * compared case-insensitively (sudo prints "[sudo] password for <user>:").
 *
 * State machine:
 * ```
 * WATCHING --marker, password known--> SEND_PASSWORD (once) --> INJECTED
 * WATCHING --marker, no password-----> MISSING_PASSWORD
 * INJECTED --any output--------------> NONE
 * ```
 * The scan buffer is cleared after the password is injected so that the
 * echoed prompt cannot trigger a second injection.
 */
class PasswordPromptWatcher {
public:
    enum class Action {
        NONE,              ///< Keep reading
        SEND_PASSWORD,     ///< Write password + newline now
        MISSING_PASSWORD   ///< Prompt seen but no password available
    };

    static constexpr const char* kMarker = "password for";

    explicit PasswordPromptWatcher(bool password_available)
        : password_available_(password_available) {}

    /**
     * @brief Feed newly received output
     * @param chunk Raw output bytes
     * @return Action to take
     */
    Action Feed(const std::string& chunk);

    bool Injected() const { return injected_; }

private:
    std::string buffer_;              ///< Lowercased output since last reset
    bool password_available_;         ///< Whether a password can be sent
    bool injected_{false};            ///< Password already written
};

/**
 * @struct CommandOutput
 * @brief Result of a successful remote command
 */
struct CommandOutput {
    int status{0};              ///< Exit status (always 0 on success)
    std::string stdout_output;  ///< Captured stdout
    std::string stderr_output;  ///< Captured stderr (empty under a pty)
};

/**
 * @struct CommandLine
 * @brief Effective command line after env prefixing and elevation
 */
struct CommandLine {
    std::string command;   ///< Text sent to the remote shell
    bool needs_pty{false}; ///< Whether a pseudo-terminal must be allocated
};

/**
 * @struct BackgroundCommand
 * @brief Non-blocking command still attached to the session
 *
 * Serviced on every later call and keep-alive tick: an elevated command
 * gets its sudo prompt answered, a finished one is closed and dropped.
 */
struct BackgroundCommand {
    std::unique_ptr<ExecStream> stream;
    std::string command;
    std::optional<PasswordPromptWatcher> watcher;  ///< Set for elevated commands only
    std::optional<std::string> password;
};

/**
 * @class ShellChannel
 * @brief One persistent, reconnectable shell session to a sandbox
 *
 * Provides command execution (including `sudo -S` elevation with password
 * injection over the pseudo-terminal) and SFTP based file/directory
 * transfer. A stale session is reconnected transparently before use.
 *
 * **States**: disconnected --Connect()--> connected --Close()--> disconnected.
 * A dropped transport is detected on the next call and replaced; no
 * partially connected state is ever visible to callers.
 *
 * **Thread Safety**: calls are serialized internally; one command or
 * transfer is in flight at a time and runs to completion before the next.
 *
 * **Usage Example**:
 * @code
 * ShellConfig config;
 * config.port = descriptor.HostPort(port_keys::kShell);
 *
 * ShellChannel shell(std::make_unique<LibsshTransport>(), config);
 * shell.Connect();
 *
 * auto out = shell.ExecCommand("apt-get update", {}, true);
 * shell.PutFile("setup.sh", "/home/user/Desktop/setup.sh");
 * shell.DownloadDirectory("/home/user/output", "./output", {".cache"});
 * @endcode
 */
class ShellChannel {
public:
    /**
     * @brief Construct channel
     * @param transport Session implementation (owned)
     * @param config Connection parameters
     */
    ShellChannel(std::unique_ptr<ShellTransport> transport, ShellConfig config);

    ~ShellChannel();

    ShellChannel(const ShellChannel&) = delete;
    ShellChannel& operator=(const ShellChannel&) = delete;

    /**
     * @brief Ensure an authenticated session exists
     *
     * Returns immediately if the transport is active. Otherwise performs
     * a fresh handshake, sleeps the configured settle delay and starts the
     * keep-alive thread.
     *
     * @throws ShellConnectionError on handshake or authentication failure
     */
    void Connect();

    /**
     * @brief Execute a command
     *
     * Environment variables are prefixed inline (KEY=value cmd) since
     * login shells usually reject forwarded variables. With as_root the
     * command is prefixed by `sudo -S` and run on a pty; the password is
     * written once when the prompt appears.
     *
     * @param command Command text
     * @param env Inline environment; keys that are not identifiers are skipped
     * @param as_root Elevate with sudo -S
     * @param block Wait for completion; false returns nullopt after dispatch and
     *        leaves the command to the background servicing
     * @param sudo_password Overrides the configured password for the prompt
     * @param timeout Overrides the configured command timeout
     * @return Output on success, nullopt when block is false
     *
     * @throws CommandTimeoutError when the deadline passes (partial output attached)
     * @throws RemoteCommandError on non-zero exit or missing sudo password
     * @throws ShellConnectionError if the session cannot be (re)established
     */
    std::optional<CommandOutput> ExecCommand(
        const std::string& command,
        const std::map<std::string, std::string>& env = {},
        bool as_root = false,
        bool block = true,
        const std::optional<std::string>& sudo_password = std::nullopt,
        std::optional<std::chrono::duration<double>> timeout = std::nullopt);

    /**
     * @brief Upload one file
     * @param local Local regular file
     * @param remote Remote destination path
     * @param mkdir_parents Create missing remote parent directories
     * @param overwrite Allow replacing an existing remote path
     * @throws FileTransferError if local is missing or remote exists without overwrite
     */
    void PutFile(const std::filesystem::path& local, const std::string& remote,
                 bool mkdir_parents = true, bool overwrite = false);

    /**
     * @brief Upload a directory tree depth-first
     *
     * Remote directories are created before their contents. Entries whose
     * name is in exclude are skipped at every level.
     */
    void PutDirectory(const std::filesystem::path& local, const std::string& remote,
                      const std::set<std::string>& exclude = {}, bool overwrite = false);

    /**
     * @brief Download one regular file
     * @throws RemotePathTypeError if remote is not a regular file
     * @throws FileTransferError if local is a directory or exists without overwrite
     */
    void DownloadFile(const std::string& remote, const std::filesystem::path& local,
                      bool overwrite = false);

    /**
     * @brief Download a directory tree depth-first
     *
     * Entries that are neither regular files nor directories are skipped.
     *
     * @throws RemotePathTypeError if remote is not a directory
     */
    void DownloadDirectory(const std::string& remote, const std::filesystem::path& local,
                           const std::set<std::string>& exclude = {},
                           bool overwrite = false);

    /**
     * @brief Close SFTP and the session, stop keep-alives (idempotent)
     */
    void Close();

    /// True while the underlying transport reports an active session
    bool IsConnected() const;

    /// Non-blocking commands that have not finished yet
    std::size_t BackgroundCommands() const;

    const ShellConfig& GetConfig() const { return config_; }

    /**
     * @brief Build the effective command line
     * @param command Command text
     * @param env Inline environment
     * @param as_root Elevate with sudo -S
     */
    static CommandLine BuildCommandLine(const std::string& command,
                                        const std::map<std::string, std::string>& env,
                                        bool as_root);

private:
    std::unique_ptr<ShellTransport> transport_;     ///< Session implementation
    ShellConfig config_;                            ///< Connection parameters
    std::unique_ptr<RemoteFileSystem> sftp_;        ///< Lazily opened transfer channel
    std::vector<BackgroundCommand> detached_;       ///< Non-blocking commands still running

    mutable std::mutex mutex_;                      ///< Serializes session traffic

    std::thread keepalive_thread_;                  ///< Keep-alive worker
    std::mutex keepalive_mutex_;
    std::condition_variable keepalive_cv_;
    bool keepalive_stop_{false};

    void ConnectLocked();
    RemoteFileSystem& SftpLocked();
    void MakeRemoteDirsLocked(const std::string& path);
    void PutFileLocked(const std::filesystem::path& local, const std::string& remote,
                       bool mkdir_parents, bool overwrite);
    void PutDirectoryLocked(const std::filesystem::path& local, const std::string& remote,
                            const std::set<std::string>& exclude, bool overwrite);
    void DownloadFileLocked(const std::string& remote, const std::filesystem::path& local,
                            bool overwrite);
    void DownloadDirectoryLocked(const std::string& remote,
                                 const std::filesystem::path& local,
                                 const std::set<std::string>& exclude, bool overwrite);
    void PumpBackgroundLocked();
    void StartKeepAlive();
    void StopKeepAlive();
    void KeepAliveLoop();
};

} // namespace core
} // namespace vmbench
