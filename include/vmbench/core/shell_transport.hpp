/**
 * @file shell_transport.hpp
 * @brief Transport abstraction beneath the shell channel
 *
 * The shell channel implements command dispatch, password-prompt handling
 * and recursive transfers on top of three small interfaces:
 * - ShellTransport: one authenticated remote-login session
 * - ExecStream: one command channel with optional pseudo-terminal
 * - RemoteFileSystem: the session's file-transfer sub-channel
 *
 * The production implementation is LibsshTransport (ssh_transport.hpp).
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vmbench {
namespace core {

/**
 * @struct ShellConfig
 * @brief Connection parameters of a shell session
 */
struct ShellConfig {
    std::string host{"localhost"};                            ///< Remote host
    int port{2222};                                           ///< Remote port
    std::string username{"user"};                             ///< Login user
    std::optional<std::string> password{"password"};          ///< Login and sudo password
    std::optional<std::filesystem::path> key_file;            ///< Private key (tried first)
    std::chrono::seconds connect_timeout{60};                 ///< Handshake timeout
    std::chrono::duration<double> command_timeout{180.0};     ///< Default per-command timeout
    std::chrono::duration<double> initial_delay{15.0};        ///< Settle delay after connecting
    std::chrono::seconds banner_timeout{10};                  ///< Server banner timeout
    std::chrono::seconds keepalive_interval{10};              ///< Keep-alive period (0 disables)
};

/**
 * @enum RemoteFileType
 * @brief Kind of a remote filesystem entry
 */
enum class RemoteFileType {
    REGULAR,    ///< Regular file
    DIRECTORY,  ///< Directory
    SYMLINK,    ///< Symbolic link (from listings only)
    OTHER       ///< Device, socket, fifo, unknown
};

/**
 * @struct RemoteEntry
 * @brief Metadata of one remote path or directory entry
 */
struct RemoteEntry {
    std::string name;                          ///< Entry name (listings) or full path (stat)
    RemoteFileType type{RemoteFileType::OTHER};///< Entry kind
    std::uint64_t size{0};                     ///< Size in bytes
};

/**
 * @class RemoteFileSystem
 * @brief File-transfer sub-channel of a shell session
 */
class RemoteFileSystem {
public:
    virtual ~RemoteFileSystem() = default;

    /**
     * @brief Stat a remote path (symlinks followed)
     * @return Entry, or nullopt if the path does not exist
     * @throws FileTransferError on any other failure
     */
    virtual std::optional<RemoteEntry> Stat(const std::string& path) = 0;

    /// Create one directory (parent must exist)
    virtual void MakeDirectory(const std::string& path) = 0;

    /// List a directory without "." and ".."
    virtual std::vector<RemoteEntry> ListDirectory(const std::string& path) = 0;

    /// Copy a local regular file to a remote path (truncating)
    virtual void Upload(const std::filesystem::path& local, const std::string& remote) = 0;

    /// Copy a remote regular file to a local path (truncating)
    virtual void Download(const std::string& remote, const std::filesystem::path& local) = 0;
};

/**
 * @class ExecStream
 * @brief One remote command channel
 *
 * Call order: [RequestPty] -> Execute -> Read/Write until IsEof -> ExitStatus -> Close.
 */
class ExecStream {
public:
    virtual ~ExecStream() = default;

    virtual void RequestPty() = 0;
    virtual void Execute(const std::string& command) = 0;

    /**
     * @brief Non-blocking read
     * @return Bytes read; 0 when nothing is buffered right now
     */
    virtual std::size_t Read(char* buffer, std::size_t size, bool is_stderr) = 0;

    /// Write to the command's stdin
    virtual void Write(const std::string& data) = 0;

    /// True once the remote side has finished sending output
    virtual bool IsEof() = 0;

    /// Exit status, -1 if the remote did not report one
    virtual int ExitStatus() = 0;

    virtual void Close() = 0;
};

/**
 * @class ShellTransport
 * @brief One authenticated remote-login session
 */
class ShellTransport {
public:
    virtual ~ShellTransport() = default;

    /**
     * @brief Handshake and authenticate
     * @throws ShellConnectionError on failure
     */
    virtual void Connect(const ShellConfig& config) = 0;

    /// True while the underlying session is connected and authenticated
    virtual bool IsActive() const = 0;

    virtual std::unique_ptr<ExecStream> OpenExecStream() = 0;
    virtual std::unique_ptr<RemoteFileSystem> OpenFileSystem() = 0;

    /// Probe the connection so idle sessions are not dropped
    virtual void SendKeepAlive() = 0;

    /// Tear the session down; safe to call when not connected
    virtual void Disconnect() = 0;
};

} // namespace core
} // namespace vmbench
