/**
 * @file deploy_api.hpp
 * @brief High-level API for interacting with PresetDeploy.
 *
 * Provides the operator actions (upload, preview, connection test, profile and mapping
 * editing) on top of a configuration base directory, abstracting configuration loading, logging and
 * transfer client selection.
 */

#ifndef DEPLOY_API_HPP
#define DEPLOY_API_HPP

#include <string>
#include <vector>
#include <expected>
#include "deploy_types.hpp"
#include "mapping_resolver.hpp"

/**
 * @brief API for managing deployments, serving as the entry point for front ends.
 */
class DeployAPI {
public:
    /**
     * @brief Uploads a preset to a profile.
     *
     * @param baseDir Installation base directory.
     * @param profileName Profile name; empty selects the active profile.
     * @param presetName Preset folder name.
     * @return std::expected<RunReport, std::string> Run report, or an error when the
     * configuration, profile or preset cannot be loaded.
     */
    static std::expected<RunReport, std::string> startUpload(const std::string& baseDir,
                                                            const std::string& profileName,
                                                            const std::string& presetName);

    /**
     * @brief Resolves the mapping set against a preset without connecting anywhere.
     */
    static std::expected<Resolution, std::string> preview(const std::string& baseDir, const std::string& presetName);

    /**
     * @brief Connects to a profile and reports the server working directory.
     */
    static std::expected<std::string, std::string> testConnection(const std::string& baseDir,
                                                                 const std::string& profileName);

    /**
     * @brief Marks a profile as active in profiles.json.
     */
    static std::expected<void, std::string> setActiveProfile(const std::string& baseDir, const std::string& profileName);

    /**
     * @brief Lists preset names, sorted.
     */
    static std::expected<std::vector<std::string>, std::string> listPresets(const std::string& baseDir);

    /**
     * @brief Lists configured profiles.
     *
     * @param activeProfile If given, receives the name of the profile an unnamed upload would use.
     */
    static std::expected<std::vector<Profile>, std::string> listProfiles(const std::string& baseDir,
                                                                        std::string* activeProfile = nullptr);

    /**
     * @brief Creates a profile, or replaces the one with the same name.
     */
    static std::expected<void, std::string> saveProfile(const std::string& baseDir, const Profile& profile);

    static std::expected<void, std::string> deleteProfile(const std::string& baseDir, const std::string& profileName);

    /**
     * @brief Lists the mapping set in its defined order.
     */
    static std::expected<std::vector<Mapping>, std::string> listMappings(const std::string& baseDir);

    /**
     * @brief Appends a mapping to the mapping set.
     *
     * @return Index of the new mapping.
     */
    static std::expected<std::size_t, std::string> addMapping(const std::string& baseDir, const Mapping& mapping);

    /**
     * @brief Replaces the mapping at an index, keeping its position in the order.
     */
    static std::expected<void, std::string> updateMapping(const std::string& baseDir, std::size_t index,
                                                          const Mapping& mapping);

    static std::expected<void, std::string> deleteMapping(const std::string& baseDir, std::size_t index);

    static std::expected<void, std::string> setMappingEnabled(const std::string& baseDir, std::size_t index,
                                                              bool enabled);
};

#endif // DEPLOY_API_HPP
