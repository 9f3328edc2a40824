#include "mapping_resolver.hpp"
#include <filesystem>
#include <format>
#include <sstream>

namespace fs = std::filesystem;

std::expected<std::set<std::string>, std::string> MappingResolver::listPresetFiles(const Preset& preset) {
    std::error_code ec;
    if (!fs::is_directory(preset.folder, ec)) {
        return std::unexpected(std::format("Preset folder does not exist: {}", preset.folder));
    }

    std::set<std::string> files;
    try {
        for (auto it = fs::recursive_directory_iterator(preset.folder, fs::directory_options::skip_permission_denied);
             it != fs::recursive_directory_iterator(); ++it) {
            if (it->is_regular_file()) {
                files.insert(fs::relative(it->path(), preset.folder).generic_string());
            }
        }
    } catch (const fs::filesystem_error& e) {
        return std::unexpected(std::format("Failed to read preset folder {}: {}", preset.folder, e.what()));
    }
    return files;
}

bool MappingResolver::isUsableRemotePath(const std::string& remotePath) {
    if (remotePath.empty() || remotePath.back() == '/') {
        return false;
    }
    std::istringstream segments(remotePath);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment == "." || segment == "..") {
            return false;
        }
    }
    return true;
}

std::expected<Resolution, std::string> MappingResolver::resolve(const Preset& preset, const std::vector<Mapping>& mappings) {
    auto files = listPresetFiles(preset);
    if (!files) {
        return std::unexpected(files.error());
    }

    Resolution resolution;
    for (std::size_t i = 0; i < mappings.size(); ++i) {
        const auto& mapping = mappings[i];
        if (!mapping.enabled) continue;

        std::string remotePath = normalizeRemotePath(mapping.remotePath);
        if (!isUsableRemotePath(remotePath)) {
            resolution.findings.push_back({i, mapping.name, mapping.localName, mapping.remotePath,
                                           FailureReason::InvalidRemotePath,
                                           std::format("invalid remote path for mapping '{}'", mapping.name)});
            continue;
        }

        if (!files->contains(mapping.localName)) {
            resolution.findings.push_back({i, mapping.name, mapping.localName, remotePath,
                                           FailureReason::MissingLocalFile,
                                           std::format("missing local file for mapping {}", remotePath)});
            continue;
        }

        Operation op;
        op.mappingIndex = i;
        op.mappingName = mapping.name;
        op.localName = mapping.localName;
        op.localPath = (fs::path(preset.folder) / fs::path(mapping.localName)).string();
        op.remotePath = remotePath;
        op.backup = mapping.backup;
        resolution.operations.push_back(std::move(op));
    }
    return resolution;
}
