/**
 * @file sftp_transfer.hpp
 * @brief SFTP transfer adapter for PresetDeploy.
 *
 * Implements the TransferClient/TransferSession capability over SFTP using libssh.
 *
 * @note Requires libssh. Install via vcpkg on Windows, Homebrew on macOS, or apt on Linux.
 */

#ifndef SFTP_TRANSFER_HPP
#define SFTP_TRANSFER_HPP

#include <string>
#include <expected>
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include "transfer_client.hpp"

/**
 * @brief SFTP session over one authenticated SSH connection.
 */
class SftpSession : public TransferSession {
public:
    /**
     * @brief Takes ownership of a connected SSH session and its SFTP channel.
     */
    SftpSession(ssh_session ssh, sftp_session sftp);
    ~SftpSession() override;

    SftpSession(const SftpSession&) = delete;
    SftpSession& operator=(const SftpSession&) = delete;

    std::expected<std::vector<RemoteEntry>, TransferError> listFiles(const std::string& remoteDir) override;

    /**
     * @brief Reads a remote file completely.
     *
     * @return NotFound when the server answers SSH_FX_NO_SUCH_FILE.
     */
    std::expected<std::string, TransferError> download(const std::string& remotePath) override;

    /**
     * @brief Writes a remote file, creating parent directories first.
     */
    std::expected<void, TransferError> upload(const std::string& remotePath, const std::string& bytes) override;

    std::expected<void, TransferError> remove(const std::string& remotePath) override;
    std::expected<std::string, TransferError> workingDirectory() override;
    void close() override;

private:
    std::expected<void, TransferError> makeParentDirectories(const std::string& remotePath);
    TransferError lastError(const std::string& what, const std::string& path) const;

    ssh_session ssh_;  ///< Owned SSH connection.
    sftp_session sftp_; ///< Owned SFTP subsystem channel.
};

/**
 * @brief SFTP transfer client.
 *
 * Connects with password authentication when the profile has a password, otherwise with
 * the default public keys / SSH agent.
 */
class SftpTransferClient : public TransferClient {
public:
    /**
     * @brief Constructs an SFTP client.
     *
     * @param timeoutSeconds Connection timeout in seconds.
     */
    explicit SftpTransferClient(int timeoutSeconds);

    /**
     * @brief Opens an SFTP session to the profile's host.
     *
     * @param profile Connection definition; transport must be Sftp.
     * @return std::expected<std::unique_ptr<TransferSession>, TransferError> Session or a Connect error.
     * @note Refuses hosts whose key changed against ~/.ssh/known_hosts, and hosts missing from
     * it unless the profile trusts unknown hosts.
     */
    std::expected<std::unique_ptr<TransferSession>, TransferError> connect(const Profile& profile) override;

    enum class HostKeyAction {
        Accept, ///< Key matches known_hosts.
        Record  ///< Key unknown but trusted by the profile; add it to known_hosts.
    };

    /**
     * @brief Decides whether to continue with a server whose host key has the given state.
     *
     * @return The action to take, or a Connect error before any credentials are sent.
     */
    static std::expected<HostKeyAction, TransferError> checkHostKey(ssh_known_hosts_e state, const Profile& profile);

private:
    int timeoutSeconds_; ///< Connection timeout.
};

#endif // SFTP_TRANSFER_HPP
