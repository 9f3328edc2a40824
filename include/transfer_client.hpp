/**
 * @file transfer_client.hpp
 * @brief Capability interface for remote file transfer sessions.
 *
 * The deployment engine reaches remote servers only through these interfaces. Concrete
 * implementations exist for FTP/FTPS (libcurl, ftp_transfer.hpp) and SFTP (libssh,
 * sftp_transfer.hpp); ProtocolTransferClient picks one by the profile's transport mode.
 *
 * @note All remote paths passed to a session are absolute server paths (see remoteFullPath()).
 */

#ifndef TRANSFER_CLIENT_HPP
#define TRANSFER_CLIENT_HPP

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>
#include "deploy_types.hpp"

/**
 * @brief Category of a transfer failure.
 */
enum class TransferErrorKind {
    Connect,  ///< Session could not be established or authenticated.
    NotFound, ///< The remote file or directory does not exist.
    Transfer  ///< Any other protocol, network or permission failure.
};

/**
 * @brief Failure reported by a transfer adapter.
 */
struct TransferError {
    TransferErrorKind kind = TransferErrorKind::Transfer;
    std::string message; ///< Adapter-supplied reason, surfaced verbatim in run reports.
};

/**
 * @brief One entry of a remote directory listing.
 */
struct RemoteEntry {
    std::string name;
    bool isDirectory = false;
    std::uint64_t size = 0;
};

/**
 * @brief An open, authenticated connection to one server.
 *
 * A session is owned by exactly one caller for its lifetime and is not thread-safe.
 */
class TransferSession {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     *
     * Implementations close the connection if close() was not called.
     */
    virtual ~TransferSession() = default;

    /**
     * @brief Lists the entries of a remote directory.
     *
     * @param remoteDir Absolute remote directory path.
     * @return std::expected<std::vector<RemoteEntry>, TransferError> Entries or an error.
     */
    virtual std::expected<std::vector<RemoteEntry>, TransferError> listFiles(const std::string& remoteDir) = 0;

    /**
     * @brief Downloads a remote file.
     *
     * @param remotePath Absolute remote file path.
     * @return std::expected<std::string, TransferError> File bytes, a NotFound error when the
     * file does not exist, or a Transfer error.
     */
    virtual std::expected<std::string, TransferError> download(const std::string& remotePath) = 0;

    /**
     * @brief Uploads bytes to a remote file, replacing it if present.
     *
     * Missing parent directories are created.
     *
     * @param remotePath Absolute remote file path.
     * @param bytes File content.
     * @return std::expected<void, TransferError> Success or an error.
     */
    virtual std::expected<void, TransferError> upload(const std::string& remotePath, const std::string& bytes) = 0;

    /**
     * @brief Deletes a remote file.
     */
    virtual std::expected<void, TransferError> remove(const std::string& remotePath) = 0;

    /**
     * @brief Returns the server-side working directory after login.
     */
    virtual std::expected<std::string, TransferError> workingDirectory() = 0;

    /**
     * @brief Closes the connection. Safe to call more than once.
     */
    virtual void close() = 0;
};

/**
 * @brief Factory for transfer sessions.
 */
class TransferClient {
public:
    virtual ~TransferClient() = default;

    /**
     * @brief Opens and authenticates a session for the given profile.
     *
     * @param profile Connection definition.
     * @return std::expected<std::unique_ptr<TransferSession>, TransferError> Session or a Connect error.
     */
    virtual std::expected<std::unique_ptr<TransferSession>, TransferError> connect(const Profile& profile) = 0;
};

/**
 * @brief Transfer client that dispatches on Profile::transport.
 *
 * Ftp and Ftps profiles go to FtpTransferClient, Sftp profiles to SftpTransferClient.
 */
class ProtocolTransferClient : public TransferClient {
public:
    /**
     * @brief Constructs the dispatcher.
     *
     * @param timeoutSeconds Connect and per-operation timeout handed to the concrete clients.
     */
    explicit ProtocolTransferClient(int timeoutSeconds);

    std::expected<std::unique_ptr<TransferSession>, TransferError> connect(const Profile& profile) override;

private:
    int timeoutSeconds_;
};

/**
 * @brief Closes a session when leaving scope.
 *
 * Holds the session for one run so that it is released on every exit path.
 */
class ScopedSession {
public:
    explicit ScopedSession(std::unique_ptr<TransferSession> session) : session_(std::move(session)) {}
    ~ScopedSession() {
        if (session_) {
            session_->close();
        }
    }

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

    TransferSession& operator*() const { return *session_; }
    TransferSession* operator->() const { return session_.get(); }

private:
    std::unique_ptr<TransferSession> session_;
};

#endif // TRANSFER_CLIENT_HPP
