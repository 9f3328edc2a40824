/**
 * @file deploy_types.hpp
 * @brief Core records shared by the PresetDeploy engine.
 *
 * Profiles, presets and mappings arrive here already parsed and validated by the
 * configuration layer (see deploy_config.hpp). Operations, outcomes and run reports
 * are derived per run and never persisted.
 */

#ifndef DEPLOY_TYPES_HPP
#define DEPLOY_TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Transport used to reach a profile's server.
 *
 * Ftp is the plain transport; Ftps (explicit FTP over TLS) and Sftp are encrypted.
 */
enum class TransportMode {
    Ftp,
    Ftps,
    Sftp
};

/**
 * @brief Login material for a profile.
 *
 * An empty password on an SFTP profile selects public-key authentication.
 */
struct Credentials {
    std::string username;
    std::string password;
};

/**
 * @brief Remote server connection definition.
 */
struct Profile {
    std::string name;                           ///< Unique profile name.
    std::string host;                           ///< Server host name or address.
    int port = 21;                              ///< Server port.
    Credentials credentials;                    ///< Login material.
    TransportMode transport = TransportMode::Ftp; ///< Plain or encrypted transport.
    std::string root = "/";                     ///< Server root directory; mapping paths are relative to it.
    bool trustUnknownHost = false;              ///< SFTP: accept and record a host key missing from known_hosts.
};

/**
 * @brief Named local folder of candidate files.
 *
 * Only the folder is recorded; its contents are listed at resolution time.
 */
struct Preset {
    std::string name;   ///< Preset name (the folder name).
    std::string folder; ///< Absolute path of the preset folder.
};

/**
 * @brief Rule binding one local file of a preset to one remote target path.
 */
struct Mapping {
    std::string name;        ///< Display name.
    std::string localName;   ///< File path relative to the preset folder, matched exactly.
    std::string remotePath;  ///< Target path relative to the profile root.
    bool backup = true;      ///< Back up the remote file before overwriting it.
    bool enabled = true;     ///< Disabled mappings are ignored entirely.
};

/**
 * @brief One resolved unit of work for a run.
 */
struct Operation {
    std::size_t mappingIndex = 0; ///< Position of the source mapping in the mapping set.
    std::string mappingName;
    std::string localName;        ///< Mapping's local name, as matched.
    std::string localPath;        ///< Absolute path of the local file.
    std::string remotePath;       ///< Normalised path relative to the profile root.
    bool backup = false;
};

enum class OutcomeStatus {
    Succeeded,
    Failed
};

enum class FailureReason {
    None,
    MissingLocalFile,
    InvalidRemotePath,
    LocalReadFailed,
    BackupFailed,
    UploadFailed,
    VerifyFailed
};

/**
 * @brief Final state of one enabled mapping in a run.
 */
struct OperationOutcome {
    std::size_t mappingIndex = 0;
    std::string mappingName;
    std::string localName;
    std::string remotePath;
    OutcomeStatus status = OutcomeStatus::Failed;
    FailureReason reason = FailureReason::None;
    std::string detail;               ///< Adapter or filesystem message, verbatim.
    std::optional<std::string> backupPath; ///< Set when a backup file was written for this operation.
    bool rolledBack = false;          ///< Remote file restored after a failed upload or verification.
};

/**
 * @brief Ordered per-mapping outcomes of one run.
 */
struct RunReport {
    std::string profile;
    std::string preset;
    std::string runTimestamp;
    std::optional<std::string> fatalError; ///< Run-level failure (no session, unreadable preset).
    std::vector<OperationOutcome> entries;

    /**
     * @brief True when the run had no fatal error and every entry succeeded.
     */
    bool succeeded() const;

    std::size_t failedCount() const;
};

std::string_view toString(TransportMode mode);
std::string_view toString(OutcomeStatus status);
std::string_view toString(FailureReason reason);

/**
 * @brief Parses "ftp", "ftps" or "sftp".
 */
std::optional<TransportMode> parseTransportMode(std::string_view text);

/**
 * @brief Normalises a remote path the way mappings and profile roots are written.
 *
 * Backslashes become forward slashes and leading slashes are removed. Case is kept.
 */
std::string normalizeRemotePath(std::string_view path);

/**
 * @brief Joins a profile root and a relative remote path into an absolute server path.
 *
 * "/dayzstandalone" + "config/a.json" gives "/dayzstandalone/config/a.json".
 */
std::string remoteFullPath(std::string_view root, std::string_view remotePath);

#endif // DEPLOY_TYPES_HPP
