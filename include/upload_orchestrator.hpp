/**
 * @file upload_orchestrator.hpp
 * @brief Runs one deployment of a preset to a profile.
 *
 * A run resolves the mapping set, opens one transfer session, and processes the resolved
 * operations one at a time in mapping order: read local file, back up the remote target if
 * requested, upload, verify. A failing operation is recorded and the run moves on; only a
 * session that cannot be opened (or a preset folder that cannot be read) ends a run early.
 */

#ifndef UPLOAD_ORCHESTRATOR_HPP
#define UPLOAD_ORCHESTRATOR_HPP

#include <string>
#include <vector>
#include "backup_manager.hpp"
#include "deploy_log.hpp"
#include "deploy_types.hpp"
#include "transfer_client.hpp"

class UploadOrchestrator {
public:
    /**
     * @brief Constructs an orchestrator.
     *
     * @param client Transfer client used to open the run's session.
     * @param backups Backup manager for mappings with backup enabled.
     * @param log Run log.
     * @param verifyUploads Read every uploaded file back and compare it with the local bytes.
     */
    UploadOrchestrator(TransferClient& client, const BackupManager& backups, const DeployLog& log,
                       bool verifyUploads = true);

    /**
     * @brief Uploads the files of a preset to a profile.
     *
     * Never throws. Every failure is reported in the returned RunReport, including exceptions
     * of any type thrown by the transfer client or session.
     *
     * @param profile Target server.
     * @param preset Source preset.
     * @param mappings Mapping set in its defined order.
     * @return RunReport One entry per enabled mapping in mapping order, unless fatalError is set.
     */
    RunReport run(const Profile& profile, const Preset& preset, const std::vector<Mapping>& mappings);

private:
    OperationOutcome execute(TransferSession& session, const Profile& profile, const Preset& preset,
                             const std::string& runTimestamp, const Operation& operation);

    /**
     * @brief Restores a remote target after a failed upload or verification.
     *
     * Re-uploads the backup captured for this operation, or deletes the target when the
     * backup found no remote file.
     */
    void rollback(TransferSession& session, const std::string& remotePath, const BackupOutcome& backup,
                  OperationOutcome& outcome);

    /**
     * @brief Records an exception thrown while executing an operation.
     *
     * The stage the exception interrupted becomes the failure reason. If the upload had
     * started and the mapping has backup enabled, the target is rolled back.
     */
    void abandon(TransferSession& session, const std::string& remotePath, const Operation& op, FailureReason stage,
                 const BackupOutcome& backup, OperationOutcome& outcome, const std::string& error);

    TransferClient& client;
    const BackupManager& backups;
    const DeployLog& log;
    bool verifyUploads;
};

#endif // UPLOAD_ORCHESTRATOR_HPP
