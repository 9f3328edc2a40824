/**
 * @file ftp_transfer.hpp
 * @brief FTP and FTPS transfer adapter for PresetDeploy.
 *
 * Implements the TransferClient/TransferSession capability over FTP using libcurl.
 * FTPS profiles use explicit TLS (AUTH TLS) with a protected data channel.
 *
 * @note Requires libcurl built with FTP and TLS support.
 */

#ifndef FTP_TRANSFER_HPP
#define FTP_TRANSFER_HPP

#include <string>
#include <expected>
#include <curl/curl.h>
#include "transfer_client.hpp"

/**
 * @brief FTP session backed by one curl easy handle.
 *
 * The handle is reused for every request, so libcurl keeps the control connection
 * open between operations of a run.
 */
class FtpSession : public TransferSession {
public:
    /**
     * @brief Takes ownership of an easy handle that has already logged in.
     *
     * @param curl Easy handle.
     * @param profile Profile the handle was connected with.
     * @param timeoutSeconds Connect and stall timeout.
     */
    FtpSession(CURL* curl, const Profile& profile, int timeoutSeconds);
    ~FtpSession() override;

    FtpSession(const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    /**
     * @brief Lists a directory with MLSD, falling back to NLST when the server lacks MLSD.
     *
     * NLST results carry names only.
     */
    std::expected<std::vector<RemoteEntry>, TransferError> listFiles(const std::string& remoteDir) override;

    /**
     * @brief Retrieves a file with RETR on its full path.
     *
     * @return NotFound for a 550 reply.
     */
    std::expected<std::string, TransferError> download(const std::string& remotePath) override;

    /**
     * @brief Stores a file with STOR, creating missing directories.
     */
    std::expected<void, TransferError> upload(const std::string& remotePath, const std::string& bytes) override;

    std::expected<void, TransferError> remove(const std::string& remotePath) override;

    /**
     * @brief Returns the entry path reported by the server after login.
     */
    std::expected<std::string, TransferError> workingDirectory() override;

    void close() override;

    /**
     * @brief Resets the handle and applies login, TLS and timeout options.
     */
    void prepare();

    /**
     * @brief Builds a URL addressing an absolute server path.
     *
     * Path segments are percent-encoded; a trailing slash marks a directory.
     */
    std::string urlFor(const std::string& remotePath, bool directory = false) const;

    /**
     * @brief Runs the prepared request and converts a failure into a TransferError.
     */
    std::expected<void, TransferError> perform(const std::string& what, const std::string& remotePath);

private:
    CURL* curl_;            ///< Owned easy handle.
    Profile profile_;       ///< Connection definition.
    int timeoutSeconds_;    ///< Connect and stall timeout.
    char errorBuffer_[CURL_ERROR_SIZE]; ///< Detailed libcurl error text for the last request.
};

/**
 * @brief FTP/FTPS transfer client.
 */
class FtpTransferClient : public TransferClient {
public:
    /**
     * @brief Constructs an FTP client.
     *
     * @param timeoutSeconds Connect and stall timeout in seconds.
     */
    explicit FtpTransferClient(int timeoutSeconds);

    /**
     * @brief Connects and logs in to the profile's server.
     *
     * @param profile Connection definition; transport must be Ftp or Ftps.
     * @return std::expected<std::unique_ptr<TransferSession>, TransferError> Session or a Connect error.
     */
    std::expected<std::unique_ptr<TransferSession>, TransferError> connect(const Profile& profile) override;

private:
    int timeoutSeconds_; ///< Connect and stall timeout.
};

#endif // FTP_TRANSFER_HPP
