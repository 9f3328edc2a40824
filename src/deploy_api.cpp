#include "deploy_api.hpp"
#include "backup_manager.hpp"
#include "deploy_config.hpp"
#include "preset_catalog.hpp"
#include "transfer_client.hpp"
#include "upload_orchestrator.hpp"
#include <format>

std::expected<RunReport, std::string> DeployAPI::startUpload(const std::string& baseDir,
                                                             const std::string& profileName,
                                                             const std::string& presetName) {
    try {
        DeployConfig config(baseDir);
        const Profile* profile = config.selectProfile(profileName);
        if (!profile) {
            return std::unexpected(profileName.empty() ? std::string("No profile configured")
                                                       : std::format("Profile not found: {}", profileName));
        }
        auto preset = PresetCatalog(config.presetsDir).find(presetName);
        if (!preset) {
            return std::unexpected(preset.error());
        }

        DeployLog log = config.makeLog();
        BackupManager backups(config.backupsDir);
        ProtocolTransferClient client(config.timeoutSeconds);
        UploadOrchestrator orchestrator(client, backups, log, config.verifyUploads);
        return orchestrator.run(*profile, *preset, config.mappings);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to start upload: {}", e.what()));
    }
}

std::expected<Resolution, std::string> DeployAPI::preview(const std::string& baseDir, const std::string& presetName) {
    try {
        DeployConfig config(baseDir);
        auto preset = PresetCatalog(config.presetsDir).find(presetName);
        if (!preset) {
            return std::unexpected(preset.error());
        }
        return MappingResolver::resolve(*preset, config.mappings);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to build preview: {}", e.what()));
    }
}

std::expected<std::string, std::string> DeployAPI::testConnection(const std::string& baseDir,
                                                                 const std::string& profileName) {
    try {
        DeployConfig config(baseDir);
        const Profile* profile = config.selectProfile(profileName);
        if (!profile) {
            return std::unexpected(profileName.empty() ? std::string("No profile configured")
                                                       : std::format("Profile not found: {}", profileName));
        }
        DeployLog log = config.makeLog();
        log.logMessage(std::format("Testing connection to {}:{} ({})", profile->host, profile->port,
                                   toString(profile->transport)));

        ProtocolTransferClient client(config.timeoutSeconds);
        auto connected = client.connect(*profile);
        if (!connected) {
            log.logError(std::format("Connection failed: {}", connected.error().message));
            return std::unexpected(connected.error().message);
        }
        ScopedSession session(std::move(*connected));
        auto pwd = session->workingDirectory();
        if (!pwd) {
            log.logError(std::format("Connected, but working directory unavailable: {}", pwd.error().message));
            return std::unexpected(pwd.error().message);
        }
        log.logMessage(std::format("Connected. PWD: {}", *pwd));
        return *pwd;
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to test connection: {}", e.what()));
    }
}

std::expected<void, std::string> DeployAPI::setActiveProfile(const std::string& baseDir, const std::string& profileName) {
    try {
        DeployConfig config(baseDir);
        if (!config.findProfile(profileName)) {
            return std::unexpected(std::format("Profile not found: {}", profileName));
        }
        config.activeProfile = profileName;
        return config.saveProfiles();
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to set active profile: {}", e.what()));
    }
}

std::expected<std::vector<std::string>, std::string> DeployAPI::listPresets(const std::string& baseDir) {
    try {
        DeployConfig config(baseDir);
        return PresetCatalog(config.presetsDir).list();
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to list presets: {}", e.what()));
    }
}

std::expected<std::vector<Profile>, std::string> DeployAPI::listProfiles(const std::string& baseDir,
                                                                         std::string* activeProfile) {
    try {
        DeployConfig config(baseDir);
        if (activeProfile) {
            const Profile* active = config.selectProfile("");
            *activeProfile = active ? active->name : std::string();
        }
        return config.profiles;
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to list profiles: {}", e.what()));
    }
}

std::expected<void, std::string> DeployAPI::saveProfile(const std::string& baseDir, const Profile& profile) {
    try {
        DeployConfig config(baseDir);
        return config.putProfile(profile);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to save profile: {}", e.what()));
    }
}

std::expected<void, std::string> DeployAPI::deleteProfile(const std::string& baseDir, const std::string& profileName) {
    try {
        DeployConfig config(baseDir);
        return config.removeProfile(profileName);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to delete profile: {}", e.what()));
    }
}

std::expected<std::vector<Mapping>, std::string> DeployAPI::listMappings(const std::string& baseDir) {
    try {
        DeployConfig config(baseDir);
        return config.mappings;
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to list mappings: {}", e.what()));
    }
}

std::expected<std::size_t, std::string> DeployAPI::addMapping(const std::string& baseDir, const Mapping& mapping) {
    try {
        DeployConfig config(baseDir);
        config.mappings.push_back(mapping);
        auto saved = config.saveMappings();
        if (!saved) {
            return std::unexpected(saved.error());
        }
        return config.mappings.size() - 1;
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to add mapping: {}", e.what()));
    }
}

std::expected<void, std::string> DeployAPI::updateMapping(const std::string& baseDir, std::size_t index,
                                                          const Mapping& mapping) {
    try {
        DeployConfig config(baseDir);
        if (index >= config.mappings.size()) {
            return std::unexpected(std::format("No mapping at position {}", index + 1));
        }
        config.mappings[index] = mapping;
        return config.saveMappings();
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to update mapping: {}", e.what()));
    }
}

std::expected<void, std::string> DeployAPI::deleteMapping(const std::string& baseDir, std::size_t index) {
    try {
        DeployConfig config(baseDir);
        if (index >= config.mappings.size()) {
            return std::unexpected(std::format("No mapping at position {}", index + 1));
        }
        config.mappings.erase(config.mappings.begin() + static_cast<std::ptrdiff_t>(index));
        return config.saveMappings();
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to delete mapping: {}", e.what()));
    }
}

std::expected<void, std::string> DeployAPI::setMappingEnabled(const std::string& baseDir, std::size_t index,
                                                              bool enabled) {
    try {
        DeployConfig config(baseDir);
        if (index >= config.mappings.size()) {
            return std::unexpected(std::format("No mapping at position {}", index + 1));
        }
        config.mappings[index].enabled = enabled;
        return config.saveMappings();
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to update mapping: {}", e.what()));
    }
}
