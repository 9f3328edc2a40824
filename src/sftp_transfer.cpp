#include "sftp_transfer.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <algorithm>
#include <format>
#include <vector>

namespace {

constexpr std::size_t kChunkSize = 16384;

TransferError connectError(ssh_session ssh, const std::string& what) {
    return {TransferErrorKind::Connect, std::format("{}: {}", what, ssh_get_error(ssh))};
}

} // namespace

SftpSession::SftpSession(ssh_session ssh, sftp_session sftp) : ssh_(ssh), sftp_(sftp) {}

SftpSession::~SftpSession() {
    close();
}

void SftpSession::close() {
    if (sftp_) {
        sftp_free(sftp_);
        sftp_ = nullptr;
    }
    if (ssh_) {
        ssh_disconnect(ssh_);
        ssh_free(ssh_);
        ssh_ = nullptr;
    }
}

TransferError SftpSession::lastError(const std::string& what, const std::string& path) const {
    int code = sftp_get_error(sftp_);
    TransferErrorKind kind = code == SSH_FX_NO_SUCH_FILE || code == SSH_FX_NO_SUCH_PATH
        ? TransferErrorKind::NotFound
        : TransferErrorKind::Transfer;
    return {kind, std::format("{} {} (sftp error {}: {})", what, path, code, ssh_get_error(ssh_))};
}

std::expected<std::vector<RemoteEntry>, TransferError> SftpSession::listFiles(const std::string& remoteDir) {
    if (!sftp_) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "SFTP session is closed"});
    }
    sftp_dir dir = sftp_opendir(sftp_, remoteDir.c_str());
    if (!dir) {
        return std::unexpected(lastError("Failed to open remote directory", remoteDir));
    }

    std::vector<RemoteEntry> entries;
    while (sftp_attributes attrs = sftp_readdir(sftp_, dir)) {
        std::string name = attrs->name ? attrs->name : "";
        if (name != "." && name != "..") {
            entries.push_back({name, attrs->type == SSH_FILEXFER_TYPE_DIRECTORY, attrs->size});
        }
        sftp_attributes_free(attrs);
    }
    bool complete = sftp_dir_eof(dir) == 1;
    sftp_closedir(dir);
    if (!complete) {
        return std::unexpected(lastError("Failed to read remote directory", remoteDir));
    }
    return entries;
}

std::expected<std::string, TransferError> SftpSession::download(const std::string& remotePath) {
    if (!sftp_) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "SFTP session is closed"});
    }
    sftp_file file = sftp_open(sftp_, remotePath.c_str(), O_RDONLY, 0);
    if (!file) {
        return std::unexpected(lastError("Failed to open remote file", remotePath));
    }

    std::string content;
    char buf[kChunkSize];
    for (;;) {
        ssize_t n = sftp_read(file, buf, sizeof(buf));
        if (n < 0) {
            auto error = lastError("Failed to read remote file", remotePath);
            sftp_close(file);
            return std::unexpected(error);
        }
        if (n == 0) {
            break;
        }
        content.append(buf, static_cast<std::size_t>(n));
    }
    sftp_close(file);
    return content;
}

std::expected<void, TransferError> SftpSession::makeParentDirectories(const std::string& remotePath) {
    auto slash = remotePath.rfind('/');
    if (slash == std::string::npos || slash == 0) {
        return {};
    }
    std::string parent = remotePath.substr(0, slash);

    std::size_t pos = 1;
    while (pos <= parent.size()) {
        auto next = parent.find('/', pos);
        std::string prefix = parent.substr(0, next);
        if (sftp_mkdir(sftp_, prefix.c_str(), 0755) != SSH_OK) {
            int code = sftp_get_error(sftp_);
            if (code != SSH_FX_FILE_ALREADY_EXISTS) {
                sftp_attributes attrs = sftp_stat(sftp_, prefix.c_str());
                if (!attrs) {
                    return std::unexpected(lastError("Failed to create remote directory", prefix));
                }
                sftp_attributes_free(attrs);
            }
        }
        if (next == std::string::npos) {
            break;
        }
        pos = next + 1;
    }
    return {};
}

std::expected<void, TransferError> SftpSession::upload(const std::string& remotePath, const std::string& bytes) {
    if (!sftp_) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "SFTP session is closed"});
    }
    auto dirs = makeParentDirectories(remotePath);
    if (!dirs) {
        return std::unexpected(dirs.error());
    }

    sftp_file file = sftp_open(sftp_, remotePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (!file) {
        auto error = lastError("Failed to open remote file for writing", remotePath);
        error.kind = TransferErrorKind::Transfer;
        return std::unexpected(error);
    }

    std::size_t offset = 0;
    while (offset < bytes.size()) {
        std::size_t chunk = std::min(kChunkSize, bytes.size() - offset);
        ssize_t written = sftp_write(file, bytes.data() + offset, chunk);
        if (written < 0) {
            auto error = lastError("Failed to write remote file", remotePath);
            error.kind = TransferErrorKind::Transfer;
            sftp_close(file);
            return std::unexpected(error);
        }
        offset += static_cast<std::size_t>(written);
    }

    if (sftp_close(file) != SSH_OK) {
        auto error = lastError("Failed to close remote file", remotePath);
        error.kind = TransferErrorKind::Transfer;
        return std::unexpected(error);
    }
    return {};
}

std::expected<void, TransferError> SftpSession::remove(const std::string& remotePath) {
    if (!sftp_) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "SFTP session is closed"});
    }
    if (sftp_unlink(sftp_, remotePath.c_str()) != SSH_OK) {
        return std::unexpected(lastError("Failed to delete remote file", remotePath));
    }
    return {};
}

std::expected<std::string, TransferError> SftpSession::workingDirectory() {
    if (!sftp_) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "SFTP session is closed"});
    }
    char* path = sftp_canonicalize_path(sftp_, ".");
    if (!path) {
        return std::unexpected(lastError("Failed to resolve working directory", "."));
    }
    std::string result(path);
    ssh_string_free_char(path);
    return result;
}

SftpTransferClient::SftpTransferClient(int timeoutSeconds) : timeoutSeconds_(timeoutSeconds) {}

std::expected<SftpTransferClient::HostKeyAction, TransferError>
SftpTransferClient::checkHostKey(ssh_known_hosts_e state, const Profile& profile) {
    switch (state) {
        case SSH_KNOWN_HOSTS_OK:
            return HostKeyAction::Accept;
        case SSH_KNOWN_HOSTS_UNKNOWN:
        case SSH_KNOWN_HOSTS_NOT_FOUND:
            if (profile.trustUnknownHost) {
                return HostKeyAction::Record;
            }
            return std::unexpected(TransferError{TransferErrorKind::Connect,
                std::format("Host key for {} is not in known_hosts; set trust_unknown_host on profile '{}' to accept it",
                            profile.host, profile.name)});
        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            return std::unexpected(TransferError{TransferErrorKind::Connect,
                std::format("Host key for {} does not match known_hosts", profile.host)});
        default:
            return std::unexpected(TransferError{TransferErrorKind::Connect,
                std::format("Host key verification failed for {}", profile.host)});
    }
}

std::expected<std::unique_ptr<TransferSession>, TransferError> SftpTransferClient::connect(const Profile& profile) {
    ssh_session ssh = ssh_new();
    if (!ssh) {
        return std::unexpected(TransferError{TransferErrorKind::Connect, "Failed to create SSH session"});
    }
    int port = profile.port;
    long timeout = timeoutSeconds_;
    ssh_options_set(ssh, SSH_OPTIONS_HOST, profile.host.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh, SSH_OPTIONS_USER, profile.credentials.username.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_TIMEOUT, &timeout);
    if (ssh_connect(ssh) != SSH_OK) {
        auto error = connectError(ssh, std::format("SSH connection to {}:{} failed", profile.host, profile.port));
        ssh_free(ssh);
        return std::unexpected(error);
    }

    auto hostKey = checkHostKey(ssh_session_is_known_server(ssh), profile);
    if (!hostKey) {
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return std::unexpected(hostKey.error());
    }
    if (*hostKey == HostKeyAction::Record && ssh_session_update_known_hosts(ssh) != SSH_OK) {
        auto error = connectError(ssh, std::format("Failed to record host key for {}", profile.host));
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return std::unexpected(error);
    }

    if (profile.credentials.password.empty()) {
        if (ssh_userauth_publickey_auto(ssh, nullptr, nullptr) != SSH_AUTH_SUCCESS) {
            auto error = connectError(ssh, "SSH public key authentication failed");
            ssh_disconnect(ssh);
            ssh_free(ssh);
            return std::unexpected(error);
        }
    } else {
        if (ssh_userauth_password(ssh, nullptr, profile.credentials.password.c_str()) != SSH_AUTH_SUCCESS) {
            auto error = connectError(ssh, "SSH password authentication failed");
            ssh_disconnect(ssh);
            ssh_free(ssh);
            return std::unexpected(error);
        }
    }

    sftp_session sftp = sftp_new(ssh);
    if (!sftp || sftp_init(sftp) != SSH_OK) {
        auto error = connectError(ssh, "SFTP initialization failed");
        if (sftp) {
            sftp_free(sftp);
        }
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return std::unexpected(error);
    }

    return std::make_unique<SftpSession>(ssh, sftp);
}
