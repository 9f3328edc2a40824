#include "deploy_types.hpp"
#include <algorithm>

bool RunReport::succeeded() const {
    return !fatalError && failedCount() == 0;
}

std::size_t RunReport::failedCount() const {
    return static_cast<std::size_t>(std::ranges::count_if(entries, [](const OperationOutcome& e) {
        return e.status == OutcomeStatus::Failed;
    }));
}

std::string_view toString(TransportMode mode) {
    switch (mode) {
        case TransportMode::Ftp:  return "ftp";
        case TransportMode::Ftps: return "ftps";
        case TransportMode::Sftp: return "sftp";
    }
    return "unknown";
}

std::string_view toString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Succeeded: return "succeeded";
        case OutcomeStatus::Failed:    return "failed";
    }
    return "unknown";
}

std::string_view toString(FailureReason reason) {
    switch (reason) {
        case FailureReason::None:              return "";
        case FailureReason::MissingLocalFile:  return "missing-local-file";
        case FailureReason::InvalidRemotePath: return "invalid-remote-path";
        case FailureReason::LocalReadFailed:   return "local-read-failed";
        case FailureReason::BackupFailed:      return "backup-failed";
        case FailureReason::UploadFailed:      return "upload-failed";
        case FailureReason::VerifyFailed:      return "verify-failed";
    }
    return "unknown";
}

std::optional<TransportMode> parseTransportMode(std::string_view text) {
    if (text == "ftp") return TransportMode::Ftp;
    if (text == "ftps") return TransportMode::Ftps;
    if (text == "sftp") return TransportMode::Sftp;
    return std::nullopt;
}

std::string normalizeRemotePath(std::string_view path) {
    std::string out(path);
    std::ranges::replace(out, '\\', '/');
    auto first = out.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    return out.substr(first);
}

std::string remoteFullPath(std::string_view root, std::string_view remotePath) {
    std::string base = normalizeRemotePath(root);
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    std::string rel = normalizeRemotePath(remotePath);
    std::string joined = base.empty() ? rel : base + "/" + rel;
    while (!joined.empty() && joined.back() == '/') {
        joined.pop_back();
    }
    return "/" + joined;
}
