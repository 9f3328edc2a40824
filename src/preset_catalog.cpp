#include "preset_catalog.hpp"
#include <algorithm>
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

PresetCatalog::PresetCatalog(std::string presetsDir) : presetsDir(std::move(presetsDir)) {}

std::vector<std::string> PresetCatalog::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(presetsDir, ec)) {
        return names;
    }
    for (const auto& entry : fs::directory_iterator(presetsDir, fs::directory_options::skip_permission_denied, ec)) {
        if (entry.is_directory(ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::ranges::sort(names);
    return names;
}

std::expected<Preset, std::string> PresetCatalog::find(const std::string& name) const {
    if (name.empty() || name == "." || name == ".." || name.find_first_of("/\\") != std::string::npos) {
        return std::unexpected(std::format("Invalid preset name: '{}'", name));
    }
    // Compare against the listing so a case-insensitive filesystem cannot alias names.
    auto names = list();
    if (std::ranges::find(names, name) == names.end()) {
        return std::unexpected(std::format("Preset not found: {}", name));
    }
    return Preset{name, fs::absolute(fs::path(presetsDir) / name).string()};
}
