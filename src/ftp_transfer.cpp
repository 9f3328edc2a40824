#include "ftp_transfer.hpp"
#include "ftp_listing.hpp"
#include <algorithm>
#include <cstring>
#include <format>
#include <mutex>

namespace {

std::once_flag gCurlInit;

struct UploadCursor {
    const std::string* bytes;
    std::size_t offset;
};

size_t writeToString(char* data, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(data, size * nmemb);
    return size * nmemb;
}

size_t readFromString(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* cursor = static_cast<UploadCursor*>(userp);
    std::size_t remaining = cursor->bytes->size() - cursor->offset;
    std::size_t n = std::min(remaining, size * nitems);
    std::memcpy(buffer, cursor->bytes->data() + cursor->offset, n);
    cursor->offset += n;
    return n;
}

} // namespace

FtpSession::FtpSession(CURL* curl, const Profile& profile, int timeoutSeconds)
    : curl_(curl), profile_(profile), timeoutSeconds_(timeoutSeconds), errorBuffer_{} {}

FtpSession::~FtpSession() {
    close();
}

void FtpSession::close() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

void FtpSession::prepare() {
    // curl_easy_reset keeps live connections, so the login survives between requests.
    curl_easy_reset(curl_);
    errorBuffer_[0] = '\0';
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errorBuffer_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_USERNAME, profile_.credentials.username.c_str());
    curl_easy_setopt(curl_, CURLOPT_PASSWORD, profile_.credentials.password.c_str());
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeoutSeconds_));
    curl_easy_setopt(curl_, CURLOPT_FTP_RESPONSE_TIMEOUT, static_cast<long>(timeoutSeconds_));
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeoutSeconds_));
    if (profile_.transport == TransportMode::Ftps) {
        curl_easy_setopt(curl_, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    }
}

std::string FtpSession::urlFor(const std::string& remotePath, bool directory) const {
    return ftpUrl(profile_.host, profile_.port, remotePath, directory);
}

std::expected<void, TransferError> FtpSession::perform(const std::string& what, const std::string& remotePath) {
    CURLcode res = curl_easy_perform(curl_);
    if (res == CURLE_OK) {
        return {};
    }
    TransferErrorKind kind = res == CURLE_REMOTE_FILE_NOT_FOUND ? TransferErrorKind::NotFound : TransferErrorKind::Transfer;
    std::string detail = errorBuffer_[0] != '\0' ? errorBuffer_ : curl_easy_strerror(res);
    return std::unexpected(TransferError{kind, std::format("{} {}: {}", what, remotePath, detail)});
}

std::expected<std::vector<RemoteEntry>, TransferError> FtpSession::listFiles(const std::string& remoteDir) {
    if (!curl_) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "FTP session is closed"});
    }
    std::string listing;
    prepare();
    curl_easy_setopt(curl_, CURLOPT_URL, urlFor(remoteDir, true).c_str());
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "MLSD");
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &listing);
    auto mlsd = perform("Failed to list", remoteDir);
    if (mlsd) {
        std::vector<RemoteEntry> entries;
        for (const auto& line : splitLines(listing)) {
            if (auto entry = parseMlsdLine(line)) {
                entries.push_back(*entry);
            }
        }
        return entries;
    }
    if (mlsd.error().kind == TransferErrorKind::NotFound) {
        return std::unexpected(mlsd.error());
    }

    listing.clear();
    prepare();
    curl_easy_setopt(curl_, CURLOPT_URL, urlFor(remoteDir, true).c_str());
    curl_easy_setopt(curl_, CURLOPT_DIRLISTONLY, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &listing);
    auto nlst = perform("Failed to list", remoteDir);
    if (!nlst) {
        return std::unexpected(nlst.error());
    }
    std::vector<RemoteEntry> entries;
    for (const auto& line : splitLines(listing)) {
        if (auto entry = parseNlstLine(line)) {
            entries.push_back(*entry);
        }
    }
    return entries;
}

std::expected<std::string, TransferError> FtpSession::download(const std::string& remotePath) {
    if (!curl_) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "FTP session is closed"});
    }
    std::string content;
    prepare();
    curl_easy_setopt(curl_, CURLOPT_URL, urlFor(remotePath).c_str());
    // No CWD: a missing parent directory then reports 550 on RETR like a missing file.
    curl_easy_setopt(curl_, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_NOCWD));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &content);
    auto result = perform("Failed to download", remotePath);
    if (!result) {
        return std::unexpected(result.error());
    }
    return content;
}

std::expected<void, TransferError> FtpSession::upload(const std::string& remotePath, const std::string& bytes) {
    if (!curl_) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "FTP session is closed"});
    }
    UploadCursor cursor{&bytes, 0};
    prepare();
    curl_easy_setopt(curl_, CURLOPT_URL, urlFor(remotePath).c_str());
    curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl_, CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_RETRY));
    curl_easy_setopt(curl_, CURLOPT_READFUNCTION, readFromString);
    curl_easy_setopt(curl_, CURLOPT_READDATA, &cursor);
    curl_easy_setopt(curl_, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(bytes.size()));
    auto result = perform("Failed to upload", remotePath);
    if (!result) {
        auto error = result.error();
        error.kind = TransferErrorKind::Transfer;
        return std::unexpected(error);
    }
    return {};
}

std::expected<void, TransferError> FtpSession::remove(const std::string& remotePath) {
    if (!curl_) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "FTP session is closed"});
    }
    std::string command = "DELE " + remoteFullPath("/", remotePath);
    curl_slist* commands = curl_slist_append(nullptr, command.c_str());
    if (!commands) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "Failed to build DELE command"});
    }
    prepare();
    curl_easy_setopt(curl_, CURLOPT_URL, urlFor("/", true).c_str());
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl_, CURLOPT_QUOTE, commands);
    auto result = perform("Failed to delete", remotePath);
    curl_slist_free_all(commands);
    return result;
}

std::expected<std::string, TransferError> FtpSession::workingDirectory() {
    if (!curl_) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "FTP session is closed"});
    }
    char* entryPath = nullptr;
    if (curl_easy_getinfo(curl_, CURLINFO_FTP_ENTRY_PATH, &entryPath) != CURLE_OK || !entryPath) {
        return std::unexpected(TransferError{TransferErrorKind::Transfer, "Server did not report a working directory"});
    }
    return std::string(entryPath);
}

FtpTransferClient::FtpTransferClient(int timeoutSeconds) : timeoutSeconds_(timeoutSeconds) {
    std::call_once(gCurlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::expected<std::unique_ptr<TransferSession>, TransferError> FtpTransferClient::connect(const Profile& profile) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(TransferError{TransferErrorKind::Connect, "Failed to initialize CURL"});
    }
    auto session = std::make_unique<FtpSession>(curl, profile, timeoutSeconds_);

    // Log in and change to the root without transferring anything.
    session->prepare();
    curl_easy_setopt(curl, CURLOPT_URL, session->urlFor("/", true).c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    auto result = session->perform(std::format("Failed to connect to {}:{} as", profile.host, profile.port),
                                   profile.credentials.username);
    if (!result) {
        return std::unexpected(TransferError{TransferErrorKind::Connect, result.error().message});
    }
    return session;
}
