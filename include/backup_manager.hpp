/**
 * @file backup_manager.hpp
 * @brief Write-once backups of remote files taken before they are overwritten.
 *
 * Backups are stored as plain files under
 * <backupRoot>/<profile>/<preset>/<runTimestamp>/<remotePath>, with the remote path's
 * directory structure preserved. Every run gets its own timestamp directory, and a backup
 * file is never overwritten or deleted by PresetDeploy.
 */

#ifndef BACKUP_MANAGER_HPP
#define BACKUP_MANAGER_HPP

#include <filesystem>
#include <string>
#include "deploy_types.hpp"
#include "transfer_client.hpp"

enum class BackupStatus {
    BackedUp,            ///< Remote file fetched and stored.
    SkippedNoRemoteFile, ///< Nothing to back up; the target does not exist yet.
    AlreadyCaptured,     ///< A backup of this remote path already exists for this run.
    Failed               ///< Fetch or local write failed; the upload must not proceed.
};

struct BackupOutcome {
    BackupStatus status = BackupStatus::Failed;
    std::string path;   ///< Backup file path for BackedUp and AlreadyCaptured.
    std::string reason; ///< Failure detail for Failed.
};

class BackupManager {
public:
    /**
     * @brief Constructs a backup manager.
     *
     * @param backupRoot Directory under which all backups are stored.
     */
    explicit BackupManager(std::string backupRoot);

    /**
     * @brief Picks the timestamp shared by all backups of one run.
     *
     * Format is YYYYmmdd_HHMMSS in local time. When a run directory with that stamp already
     * exists for the profile and preset, "_1", "_2", ... is appended.
     */
    std::string allocateRunTimestamp(const std::string& profile, const std::string& preset) const;

    std::filesystem::path runDirectory(const std::string& profile, const std::string& preset,
                                       const std::string& runTimestamp) const;

    /**
     * @brief Location of the backup for one remote path in one run.
     *
     * @param remotePath Normalised path relative to the profile root.
     */
    std::filesystem::path backupPath(const std::string& profile, const std::string& preset,
                                     const std::string& runTimestamp, const std::string& remotePath) const;

    /**
     * @brief Backs up the current remote content of an operation's target.
     *
     * @param session Open transfer session.
     * @param profile Profile name.
     * @param preset Preset name.
     * @param runTimestamp Timestamp from allocateRunTimestamp().
     * @param operation Operation whose remote target is about to be overwritten.
     * @param remoteFullPath Absolute server path of the target.
     * @return BackupOutcome See BackupStatus.
     */
    BackupOutcome backup(TransferSession& session, const std::string& profile, const std::string& preset,
                         const std::string& runTimestamp, const Operation& operation,
                         const std::string& remoteFullPath) const;

    /**
     * @brief Makes a profile or preset name safe to use as one path component.
     */
    static std::string sanitizeComponent(const std::string& name);

private:
    /**
     * @brief Scratch directory for partially written backups of one run.
     *
     * Lives beside the run directory; its dot-prefixed name never matches a run timestamp.
     */
    std::filesystem::path stagingDirectory(const std::string& profile, const std::string& preset,
                                           const std::string& runTimestamp) const;

    std::string backupRoot; ///< Base directory for backups.
};

#endif // BACKUP_MANAGER_HPP
