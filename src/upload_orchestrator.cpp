#include "upload_orchestrator.hpp"
#include "mapping_resolver.hpp"
#include <algorithm>
#include <expected>
#include <format>
#include <fstream>
#include <sstream>

namespace {

std::expected<std::string, std::string> readLocalFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(std::format("Failed to open local file: {}", path));
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(std::format("Failed to read local file: {}", path));
    }
    return content.str();
}

OperationOutcome outcomeFor(const Operation& op) {
    OperationOutcome outcome;
    outcome.mappingIndex = op.mappingIndex;
    outcome.mappingName = op.mappingName;
    outcome.localName = op.localName;
    outcome.remotePath = op.remotePath;
    return outcome;
}

void fail(OperationOutcome& outcome, FailureReason reason, std::string detail) {
    outcome.status = OutcomeStatus::Failed;
    outcome.reason = reason;
    outcome.detail = std::move(detail);
}

} // namespace

UploadOrchestrator::UploadOrchestrator(TransferClient& client, const BackupManager& backups, const DeployLog& log,
                                       bool verifyUploads)
    : client(client), backups(backups), log(log), verifyUploads(verifyUploads) {}

RunReport UploadOrchestrator::run(const Profile& profile, const Preset& preset, const std::vector<Mapping>& mappings) {
    RunReport report;
    report.profile = profile.name;
    report.preset = preset.name;

    log.logMessage(std::format("Upload of preset '{}' to profile '{}' ({} {}:{}) started",
                               preset.name, profile.name, toString(profile.transport), profile.host, profile.port));

    auto resolution = MappingResolver::resolve(preset, mappings);
    if (!resolution) {
        report.fatalError = resolution.error();
        log.logError(std::format("Resolution failed: {}", resolution.error()));
        return report;
    }

    try {
        report.runTimestamp = backups.allocateRunTimestamp(profile.name, preset.name);
    } catch (const std::exception& e) {
        report.fatalError = std::format("Failed to allocate backup directory: {}", e.what());
        log.logError(*report.fatalError);
        return report;
    }

    for (const auto& finding : resolution->findings) {
        OperationOutcome outcome;
        outcome.mappingIndex = finding.mappingIndex;
        outcome.mappingName = finding.mappingName;
        outcome.localName = finding.localName;
        outcome.remotePath = finding.remotePath;
        fail(outcome, finding.reason, finding.message);
        log.logError(std::format("Mapping '{}': {}", finding.mappingName, finding.message));
        report.entries.push_back(std::move(outcome));
    }

    if (!resolution->operations.empty()) {
        std::expected<std::unique_ptr<TransferSession>, TransferError> connected;
        try {
            connected = client.connect(profile);
        } catch (const std::exception& e) {
            connected = std::unexpected(TransferError{TransferErrorKind::Connect, e.what()});
        } catch (...) {
            connected = std::unexpected(TransferError{TransferErrorKind::Connect, "unknown error"});
        }

        if (!connected) {
            report.fatalError = std::format("connection failed: {}", connected.error().message);
            log.logError(std::format("Upload aborted, {}", *report.fatalError));
        } else {
            ScopedSession session(std::move(*connected));
            for (const auto& op : resolution->operations) {
                report.entries.push_back(execute(*session, profile, preset, report.runTimestamp, op));
            }
        }
    } else {
        log.logWarning("No operations to run; no connection opened");
    }

    std::ranges::stable_sort(report.entries, {}, &OperationOutcome::mappingIndex);

    if (report.fatalError) {
        log.logError(std::format("Upload of preset '{}' to profile '{}' failed: {}",
                                 preset.name, profile.name, *report.fatalError));
    } else {
        log.logMessage(std::format("Upload of preset '{}' to profile '{}' finished: {} succeeded, {} failed",
                                   preset.name, profile.name, report.entries.size() - report.failedCount(),
                                   report.failedCount()));
    }
    return report;
}

OperationOutcome UploadOrchestrator::execute(TransferSession& session, const Profile& profile, const Preset& preset,
                                             const std::string& runTimestamp, const Operation& op) {
    OperationOutcome outcome = outcomeFor(op);
    FailureReason stage = FailureReason::LocalReadFailed;
    std::string fullPath = remoteFullPath(profile.root, op.remotePath);
    BackupOutcome backup{BackupStatus::SkippedNoRemoteFile, {}, {}};

    try {
        auto local = readLocalFile(op.localPath);
        if (!local) {
            fail(outcome, FailureReason::LocalReadFailed, local.error());
            log.logError(std::format("{}: {}", fullPath, local.error()));
            return outcome;
        }

        if (op.backup) {
            stage = FailureReason::BackupFailed;
            backup = backups.backup(session, profile.name, preset.name, runTimestamp, op, fullPath);
            switch (backup.status) {
                case BackupStatus::Failed:
                    fail(outcome, FailureReason::BackupFailed, backup.reason);
                    log.logError(std::format("Backup failed for {}, upload skipped: {}", fullPath, backup.reason));
                    return outcome;
                case BackupStatus::BackedUp:
                    outcome.backupPath = backup.path;
                    log.logMessage(std::format("Backup OK: {} -> {}", fullPath, backup.path));
                    break;
                case BackupStatus::AlreadyCaptured:
                    outcome.backupPath = backup.path;
                    log.logMessage(std::format("Backup of {} already taken in this run: {}", fullPath, backup.path));
                    break;
                case BackupStatus::SkippedNoRemoteFile:
                    log.logMessage(std::format("Backup skipped, no remote file yet: {}", fullPath));
                    break;
            }
        }

        stage = FailureReason::UploadFailed;
        auto uploaded = session.upload(fullPath, *local);
        if (!uploaded) {
            fail(outcome, FailureReason::UploadFailed, uploaded.error().message);
            log.logError(std::format("Upload failed: {}", uploaded.error().message));
            if (op.backup) {
                rollback(session, fullPath, backup, outcome);
            }
            return outcome;
        }

        if (verifyUploads) {
            stage = FailureReason::VerifyFailed;
            auto readBack = session.download(fullPath);
            std::string problem;
            if (!readBack) {
                problem = std::format("read-back failed: {}", readBack.error().message);
            } else if (*readBack != *local) {
                problem = std::format("content mismatch: {} bytes on server, {} bytes local",
                                      readBack->size(), local->size());
            }
            if (!problem.empty()) {
                fail(outcome, FailureReason::VerifyFailed, problem);
                log.logError(std::format("Verification failed for {}: {}", fullPath, problem));
                if (op.backup) {
                    rollback(session, fullPath, backup, outcome);
                }
                return outcome;
            }
        }

        outcome.status = OutcomeStatus::Succeeded;
        outcome.reason = FailureReason::None;
        log.logMessage(std::format("Uploaded: {} -> {}", op.localPath, fullPath));
    } catch (const std::exception& e) {
        abandon(session, fullPath, op, stage, backup, outcome, e.what());
    } catch (...) {
        abandon(session, fullPath, op, stage, backup, outcome, "unknown error");
    }
    return outcome;
}

void UploadOrchestrator::abandon(TransferSession& session, const std::string& remotePath, const Operation& op,
                                 FailureReason stage, const BackupOutcome& backup, OperationOutcome& outcome,
                                 const std::string& error) {
    fail(outcome, stage, error);
    log.logError(std::format("{} failed: {}", remotePath, error));

    // The remote file may be half written once the upload has started.
    bool touchedRemote = stage == FailureReason::UploadFailed || stage == FailureReason::VerifyFailed;
    if (!op.backup || !touchedRemote) {
        return;
    }
    try {
        rollback(session, remotePath, backup, outcome);
    } catch (const std::exception& e) {
        outcome.detail += std::format("; rollback failed: {}", e.what());
        log.logError(std::format("Could not roll back {}: {}", remotePath, e.what()));
    } catch (...) {
        outcome.detail += "; rollback failed: unknown error";
        log.logError(std::format("Could not roll back {}: unknown error", remotePath));
    }
}

void UploadOrchestrator::rollback(TransferSession& session, const std::string& remotePath, const BackupOutcome& backup,
                                  OperationOutcome& outcome) {
    switch (backup.status) {
        case BackupStatus::BackedUp: {
            auto saved = readLocalFile(backup.path);
            if (!saved) {
                outcome.detail += std::format("; rollback failed: {}", saved.error());
                break;
            }
            auto restored = session.upload(remotePath, *saved);
            if (restored) {
                outcome.rolledBack = true;
                outcome.detail += "; previous content restored from backup";
            } else {
                outcome.detail += std::format("; rollback failed: {}", restored.error().message);
            }
            break;
        }
        case BackupStatus::SkippedNoRemoteFile: {
            auto removed = session.remove(remotePath);
            if (removed || removed.error().kind == TransferErrorKind::NotFound) {
                outcome.rolledBack = true;
                outcome.detail += "; new remote file removed";
            } else {
                outcome.detail += std::format("; rollback failed: {}", removed.error().message);
            }
            break;
        }
        case BackupStatus::AlreadyCaptured:
            outcome.detail += "; not rolled back, target was already written earlier in this run";
            break;
        case BackupStatus::Failed:
            break;
    }

    if (outcome.rolledBack) {
        log.logWarning(std::format("Rolled back {}", remotePath));
    } else {
        log.logError(std::format("Could not roll back {}", remotePath));
    }
}
