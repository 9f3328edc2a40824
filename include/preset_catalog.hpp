/**
 * @file preset_catalog.hpp
 * @brief Enumerates preset folders on disk.
 *
 * A preset is a direct subdirectory of the presets directory; its name is the folder name.
 */

#ifndef PRESET_CATALOG_HPP
#define PRESET_CATALOG_HPP

#include <string>
#include <vector>
#include <expected>
#include "deploy_types.hpp"

class PresetCatalog {
public:
    explicit PresetCatalog(std::string presetsDir);

    /**
     * @brief Lists preset names, sorted.
     *
     * @return std::vector<std::string> Empty when the presets directory does not exist.
     */
    std::vector<std::string> list() const;

    /**
     * @brief Looks up a preset by exact name.
     *
     * @param name Preset folder name.
     * @return std::expected<Preset, std::string> The preset or an error message.
     */
    std::expected<Preset, std::string> find(const std::string& name) const;

private:
    std::string presetsDir;
};

#endif // PRESET_CATALOG_HPP
