/**
 * @file ssh_transport.cpp
 * @brief libssh session, exec channel and SFTP implementation
 *
 * **Authentication order**: private key (if configured and loadable), then
 * password. Either success is enough.
 *
 * **Exec channels** are read with ssh_channel_read_nonblocking so the shell
 * channel can interleave stdout/stderr polling with prompt detection and
 * its own wall-clock deadline.
 *
 * @date 2025
 */

#include "vmbench/core/ssh_transport.hpp"
#include "vmbench/core/errors.hpp"

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <spdlog/spdlog.h>

#include <array>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>

namespace vmbench {
namespace core {

namespace {

constexpr std::size_t kTransferChunk = 32 * 1024;

// ============================================================================
// EXEC CHANNEL
// ============================================================================

class LibsshExecStream : public ExecStream {
public:
    explicit LibsshExecStream(ssh_session session)
        : session_(session)
        , channel_(ssh_channel_new(session)) {
        if (!channel_) {
            throw ShellConnectionError(std::string("Failed to allocate channel: ") +
                                       ssh_get_error(session_));
        }
        if (ssh_channel_open_session(channel_) != SSH_OK) {
            std::string error = ssh_get_error(session_);
            ssh_channel_free(channel_);
            channel_ = nullptr;
            throw ShellConnectionError("Failed to open channel: " + error);
        }
    }

    ~LibsshExecStream() override {
        Close();
    }

    void RequestPty() override {
        if (ssh_channel_request_pty(channel_) != SSH_OK) {
            throw ShellConnectionError(std::string("Failed to allocate pty: ") +
                                       ssh_get_error(session_));
        }
    }

    void Execute(const std::string& command) override {
        if (ssh_channel_request_exec(channel_, command.c_str()) != SSH_OK) {
            throw ShellConnectionError(std::string("Failed to execute command: ") +
                                       ssh_get_error(session_));
        }
    }

    std::size_t Read(char* buffer, std::size_t size, bool is_stderr) override {
        int n = ssh_channel_read_nonblocking(channel_, buffer,
                                             static_cast<uint32_t>(size),
                                             is_stderr ? 1 : 0);
        if (n == SSH_ERROR) {
            throw ShellConnectionError(std::string("Channel read failed: ") +
                                       ssh_get_error(session_));
        }
        return n > 0 ? static_cast<std::size_t>(n) : 0;
    }

    void Write(const std::string& data) override {
        std::size_t written = 0;
        while (written < data.size()) {
            int n = ssh_channel_write(channel_, data.data() + written,
                                      static_cast<uint32_t>(data.size() - written));
            if (n == SSH_ERROR) {
                throw ShellConnectionError(std::string("Channel write failed: ") +
                                           ssh_get_error(session_));
            }
            written += static_cast<std::size_t>(n);
        }
    }

    bool IsEof() override {
        return ssh_channel_is_eof(channel_) != 0 || ssh_channel_is_closed(channel_) != 0;
    }

    int ExitStatus() override {
        return ssh_channel_get_exit_status(channel_);
    }

    void Close() override {
        if (!channel_) {
            return;
        }
        if (ssh_channel_is_open(channel_)) {
            ssh_channel_close(channel_);
        }
        ssh_channel_free(channel_);
        channel_ = nullptr;
    }

private:
    ssh_session session_;
    ssh_channel channel_;
};

// ============================================================================
// SFTP
// ============================================================================

RemoteFileType MapType(uint8_t type) {
    switch (type) {
        case SSH_FILEXFER_TYPE_REGULAR:   return RemoteFileType::REGULAR;
        case SSH_FILEXFER_TYPE_DIRECTORY: return RemoteFileType::DIRECTORY;
        case SSH_FILEXFER_TYPE_SYMLINK:   return RemoteFileType::SYMLINK;
        default:                          return RemoteFileType::OTHER;
    }
}

class LibsshFileSystem : public RemoteFileSystem {
public:
    explicit LibsshFileSystem(ssh_session session)
        : session_(session)
        , sftp_(sftp_new(session)) {
        if (!sftp_) {
            throw FileTransferError(std::string("Failed to allocate SFTP session: ") +
                                    ssh_get_error(session_));
        }
        if (sftp_init(sftp_) != SSH_OK) {
            int code = sftp_get_error(sftp_);
            sftp_free(sftp_);
            sftp_ = nullptr;
            throw FileTransferError("Failed to initialize SFTP (code " +
                                    std::to_string(code) + ")");
        }
    }

    ~LibsshFileSystem() override {
        if (sftp_) {
            sftp_free(sftp_);
        }
    }

    std::optional<RemoteEntry> Stat(const std::string& path) override {
        sftp_attributes attributes = sftp_stat(sftp_, path.c_str());
        if (!attributes) {
            int code = sftp_get_error(sftp_);
            if (code == SSH_FX_NO_SUCH_FILE || code == SSH_FX_NO_SUCH_PATH) {
                return std::nullopt;
            }
            throw FileTransferError("stat " + path + " failed: " + Describe(code));
        }

        RemoteEntry entry{path, MapType(attributes->type), attributes->size};
        sftp_attributes_free(attributes);
        return entry;
    }

    void MakeDirectory(const std::string& path) override {
        if (sftp_mkdir(sftp_, path.c_str(), 0755) != SSH_OK) {
            throw FileTransferError("mkdir " + path + " failed: " +
                                    Describe(sftp_get_error(sftp_)));
        }
    }

    std::vector<RemoteEntry> ListDirectory(const std::string& path) override {
        sftp_dir dir = sftp_opendir(sftp_, path.c_str());
        if (!dir) {
            throw FileTransferError("opendir " + path + " failed: " +
                                    Describe(sftp_get_error(sftp_)));
        }

        std::vector<RemoteEntry> entries;
        sftp_attributes attributes = nullptr;
        while ((attributes = sftp_readdir(sftp_, dir)) != nullptr) {
            std::string name = attributes->name ? attributes->name : "";
            if (name != "." && name != ".." && !name.empty()) {
                entries.push_back({name, MapType(attributes->type), attributes->size});
            }
            sftp_attributes_free(attributes);
        }

        bool complete = sftp_dir_eof(dir) != 0;
        sftp_closedir(dir);
        if (!complete) {
            throw FileTransferError("readdir " + path + " failed: " +
                                    Describe(sftp_get_error(sftp_)));
        }
        return entries;
    }

    void Upload(const std::filesystem::path& local, const std::string& remote) override {
        std::ifstream input(local, std::ios::binary);
        if (!input.is_open()) {
            throw FileTransferError("Cannot open local file: " + local.string());
        }

        sftp_file file = sftp_open(sftp_, remote.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
                                   S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
        if (!file) {
            throw FileTransferError("open " + remote + " for writing failed: " +
                                    Describe(sftp_get_error(sftp_)));
        }

        std::array<char, kTransferChunk> buffer;
        while (input) {
            input.read(buffer.data(), buffer.size());
            std::streamsize count = input.gcount();
            if (count <= 0) {
                break;
            }
            ssize_t written = sftp_write(file, buffer.data(), static_cast<size_t>(count));
            if (written != count) {
                sftp_close(file);
                throw FileTransferError("write " + remote + " failed: " +
                                        Describe(sftp_get_error(sftp_)));
            }
        }

        if (sftp_close(file) != SSH_OK) {
            throw FileTransferError("close " + remote + " failed");
        }
    }

    void Download(const std::string& remote, const std::filesystem::path& local) override {
        sftp_file file = sftp_open(sftp_, remote.c_str(), O_RDONLY, 0);
        if (!file) {
            throw FileTransferError("open " + remote + " for reading failed: " +
                                    Describe(sftp_get_error(sftp_)));
        }

        std::ofstream output(local, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            sftp_close(file);
            throw FileTransferError("Cannot open local file for writing: " + local.string());
        }

        std::array<char, kTransferChunk> buffer;
        while (true) {
            ssize_t count = sftp_read(file, buffer.data(), buffer.size());
            if (count < 0) {
                sftp_close(file);
                throw FileTransferError("read " + remote + " failed: " +
                                        Describe(sftp_get_error(sftp_)));
            }
            if (count == 0) {
                break;
            }
            output.write(buffer.data(), count);
        }

        sftp_close(file);
        if (!output) {
            throw FileTransferError("Failed writing local file: " + local.string());
        }
    }

private:
    std::string Describe(int sftp_code) const {
        return std::string(ssh_get_error(session_)) + " (sftp code " +
               std::to_string(sftp_code) + ")";
    }

    ssh_session session_;
    sftp_session sftp_;
};

} // anonymous namespace

// ============================================================================
// SESSION
// ============================================================================

LibsshTransport::~LibsshTransport() {
    Disconnect();
}

void LibsshTransport::Connect(const ShellConfig& config) {
    Disconnect();

    session_ = ssh_new();
    if (!session_) {
        throw ShellConnectionError("Failed to allocate SSH session");
    }

    unsigned int port = static_cast<unsigned int>(config.port);
    long timeout = static_cast<long>(config.connect_timeout.count());
    int strict_host_check = 0;

    ssh_options_set(session_, SSH_OPTIONS_HOST, config.host.c_str());
    ssh_options_set(session_, SSH_OPTIONS_PORT, &port);
    ssh_options_set(session_, SSH_OPTIONS_USER, config.username.c_str());
    ssh_options_set(session_, SSH_OPTIONS_TIMEOUT, &timeout);
    ssh_options_set(session_, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict_host_check);
    ssh_options_set(session_, SSH_OPTIONS_KNOWNHOSTS, "/dev/null");

    spdlog::debug("Connecting to {}@{}:{}", config.username, config.host, config.port);

    if (ssh_connect(session_) != SSH_OK) {
        std::string error = ssh_get_error(session_);
        Disconnect();
        throw ShellConnectionError("SSH connect to " + config.host + ":" +
                                   std::to_string(config.port) + " failed: " + error);
    }

    bool authenticated = false;

    if (config.key_file) {
        ssh_key key = nullptr;
        if (ssh_pki_import_privkey_file(config.key_file->string().c_str(),
                                        nullptr, nullptr, nullptr, &key) == SSH_OK) {
            authenticated = ssh_userauth_publickey(session_, nullptr, key) == SSH_AUTH_SUCCESS;
            ssh_key_free(key);
        } else {
            spdlog::warn("Could not load private key {}", config.key_file->string());
        }
    }

    if (!authenticated && config.password) {
        authenticated = ssh_userauth_password(session_, nullptr,
                                              config.password->c_str()) == SSH_AUTH_SUCCESS;
    }

    if (!authenticated) {
        std::string error = ssh_get_error(session_);
        Disconnect();
        throw ShellConnectionError("SSH authentication failed for " + config.username +
                                   ": " + error);
    }
}

bool LibsshTransport::IsActive() const {
    return session_ != nullptr && ssh_is_connected(session_) != 0;
}

std::unique_ptr<ExecStream> LibsshTransport::OpenExecStream() {
    if (!IsActive()) {
        throw ShellConnectionError("SSH session is not connected");
    }
    return std::make_unique<LibsshExecStream>(session_);
}

std::unique_ptr<RemoteFileSystem> LibsshTransport::OpenFileSystem() {
    if (!IsActive()) {
        throw ShellConnectionError("SSH session is not connected");
    }
    return std::make_unique<LibsshFileSystem>(session_);
}

void LibsshTransport::SendKeepAlive() {
    if (IsActive() && ssh_send_keepalive(session_) != SSH_OK) {
        spdlog::warn("SSH keep-alive failed: {}", ssh_get_error(session_));
    }
}

void LibsshTransport::Disconnect() {
    if (!session_) {
        return;
    }
    if (ssh_is_connected(session_)) {
        ssh_disconnect(session_);
    }
    ssh_free(session_);
    session_ = nullptr;
}

} // namespace core
} // namespace vmbench
