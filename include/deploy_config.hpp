/**
 * @file deploy_config.hpp
 * @brief Configuration management for PresetDeploy.
 *
 * Loads profiles, mappings and application settings from JSON files under a base directory,
 * creating the directory layout and default files on first use:
 *
 *   <base>/config/profiles.json   profiles and the active profile
 *   <base>/config/mappings.json   ordered mapping set
 *   <base>/config/settings.json   timeouts and upload verification
 *   <base>/presets/<name>/        preset folders
 *   <base>/backups/               backups, see backup_manager.hpp
 *   <base>/logs/                  deploy.log and errors.log
 *
 * Records are validated here, so the deployment engine can assume well-formed input.
 */

#ifndef DEPLOY_CONFIG_HPP
#define DEPLOY_CONFIG_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <json/json.h>
#include "deploy_log.hpp"
#include "deploy_types.hpp"

/**
 * @brief Configuration class for PresetDeploy.
 */
class DeployConfig {
public:
    /**
     * @brief Loads the configuration below a base directory.
     *
     * Missing directories and configuration files are created with defaults.
     *
     * @param baseDir Base directory of the installation.
     * @throws std::runtime_error If a file cannot be read or parsed, or holds invalid records
     * (duplicate profile names, port outside 1..65535, unknown protocol).
     */
    explicit DeployConfig(const std::string& baseDir);

    /**
     * @brief Writes profiles and the active profile back to profiles.json.
     */
    std::expected<void, std::string> saveProfiles() const;

    /**
     * @brief Writes the mapping set back to mappings.json.
     */
    std::expected<void, std::string> saveMappings() const;

    /**
     * @brief Adds a profile, or replaces the profile with the same name, and saves profiles.json.
     *
     * The first profile added to an installation without an active profile becomes active.
     */
    std::expected<void, std::string> putProfile(const Profile& profile);

    /**
     * @brief Deletes a profile and saves profiles.json.
     *
     * Deleting the active profile makes the first remaining profile active.
     */
    std::expected<void, std::string> removeProfile(const std::string& name);

    /**
     * @brief Finds a profile by exact name.
     *
     * @return Pointer into profiles, or nullptr.
     */
    const Profile* findProfile(const std::string& name) const;

    /**
     * @brief Picks the profile for a run.
     *
     * An empty name selects the active profile, falling back to the first profile.
     */
    const Profile* selectProfile(const std::string& name) const;

    /**
     * @brief Creates the run log for this installation.
     */
    DeployLog makeLog(bool echo = true) const;

    /**
     * @brief Checks the invariants every stored profile satisfies: non-empty name, port in 1..65535.
     */
    static std::expected<void, std::string> validateProfile(const Profile& profile);

    static Profile parseProfile(const Json::Value& value);
    static Mapping parseMapping(const Json::Value& value);
    static Json::Value toJson(const Profile& profile);
    static Json::Value toJson(const Mapping& mapping);

    std::string baseDir;                    ///< Installation base directory.
    std::string configDir;                  ///< Directory holding the JSON files.
    std::string presetsDir;                 ///< Directory holding preset folders.
    std::string backupsDir;                 ///< Backup root.
    std::string logsDir;                    ///< Log directory.
    std::string profilesFile;               ///< Path to profiles.json.
    std::string mappingsFile;               ///< Path to mappings.json.
    std::string settingsFile;               ///< Path to settings.json.
    std::string logFile;                    ///< Path to the log file.
    std::string errorLogFile;               ///< Path to the error log file.
    std::vector<Profile> profiles;          ///< Connection profiles, unique by name.
    std::optional<std::string> activeProfile; ///< Profile selected when none is named.
    std::vector<Mapping> mappings;          ///< Mapping set in its defined order.
    int timeoutSeconds;                     ///< Connect and stall timeout for transfers.
    bool verifyUploads;                     ///< Read back and compare each uploaded file.
};

#endif // DEPLOY_CONFIG_HPP
