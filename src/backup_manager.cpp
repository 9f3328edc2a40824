/**
 * @file backup_manager.cpp
 * @brief Backup manager implementation for PresetDeploy.
 *
 * Backups are written to a ".part" file in a staging directory next to the run directory
 * and renamed into place, so a backup file is either complete or absent.
 */

#include "backup_manager.hpp"
#include "deploy_log.hpp"
#include <format>
#include <fstream>

namespace fs = std::filesystem;

BackupManager::BackupManager(std::string backupRoot) : backupRoot(std::move(backupRoot)) {}

std::string BackupManager::sanitizeComponent(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        if (c == '/' || c == '\\' || c == ':' || static_cast<unsigned char>(c) < 0x20) {
            c = '_';
        }
    }
    if (out.empty() || out == "." || out == "..") {
        out = "_" + out;
    }
    return out;
}

fs::path BackupManager::runDirectory(const std::string& profile, const std::string& preset,
                                     const std::string& runTimestamp) const {
    return fs::path(backupRoot) / sanitizeComponent(profile) / sanitizeComponent(preset) / runTimestamp;
}

fs::path BackupManager::stagingDirectory(const std::string& profile, const std::string& preset,
                                        const std::string& runTimestamp) const {
    return fs::path(backupRoot) / sanitizeComponent(profile) / sanitizeComponent(preset) / ("." + runTimestamp + ".staging");
}

fs::path BackupManager::backupPath(const std::string& profile, const std::string& preset,
                                   const std::string& runTimestamp, const std::string& remotePath) const {
    return runDirectory(profile, preset, runTimestamp) / fs::path(remotePath);
}

std::string BackupManager::allocateRunTimestamp(const std::string& profile, const std::string& preset) const {
    std::string base = formatLocalTime("%Y%m%d_%H%M%S");
    std::string candidate = base;
    std::error_code ec;
    for (int n = 1; fs::exists(runDirectory(profile, preset, candidate), ec); ++n) {
        candidate = std::format("{}_{}", base, n);
    }
    return candidate;
}

BackupOutcome BackupManager::backup(TransferSession& session, const std::string& profile, const std::string& preset,
                                    const std::string& runTimestamp, const Operation& operation,
                                    const std::string& remoteFullPath) const {
    fs::path target = backupPath(profile, preset, runTimestamp, operation.remotePath);

    std::error_code ec;
    if (fs::exists(target, ec)) {
        return {BackupStatus::AlreadyCaptured, target.string(), {}};
    }

    auto content = session.download(remoteFullPath);
    if (!content) {
        if (content.error().kind == TransferErrorKind::NotFound) {
            return {BackupStatus::SkippedNoRemoteFile, {}, {}};
        }
        return {BackupStatus::Failed, {}, content.error().message};
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return {BackupStatus::Failed, {}, std::format("Failed to create backup directory {}: {}",
                                                      target.parent_path().string(), ec.message())};
    }

    // Staged outside the run directory: no remote path can name a staging file.
    fs::path staging = stagingDirectory(profile, preset, runTimestamp);
    fs::create_directories(staging, ec);
    if (ec) {
        return {BackupStatus::Failed, {}, std::format("Failed to create staging directory {}: {}",
                                                      staging.string(), ec.message())};
    }
    fs::path partial;
    for (int n = 0;; ++n) {
        partial = staging / std::format("{}.part", n);
        if (!fs::exists(partial, ec)) break;
    }
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) {
            return {BackupStatus::Failed, {}, std::format("Failed to open backup file: {}", partial.string())};
        }
        out.write(content->data(), static_cast<std::streamsize>(content->size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(partial, ec);
            return {BackupStatus::Failed, {}, std::format("Failed to write backup file: {}", partial.string())};
        }
    }

    fs::rename(partial, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        return {BackupStatus::Failed, {}, std::format("Failed to finalize backup file {}: {}", target.string(), ec.message())};
    }
    // Only succeeds once the directory is empty.
    std::error_code notEmpty;
    fs::remove(staging, notEmpty);
    return {BackupStatus::BackedUp, target.string(), {}};
}
