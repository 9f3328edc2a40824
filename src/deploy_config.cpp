#include "deploy_config.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

Json::Value defaultProfiles() {
    Json::Value root;
    root["profiles"] = Json::Value(Json::arrayValue);
    root["active_profile"] = Json::Value(Json::nullValue);
    return root;
}

Json::Value defaultMappings() {
    Json::Value root;
    root["mappings"] = Json::Value(Json::arrayValue);
    return root;
}

Json::Value defaultSettings() {
    Json::Value root;
    root["app"]["timeout_seconds"] = 20;
    root["app"]["verify_uploads"] = true;
    return root;
}

std::expected<void, std::string> writeJson(const std::string& path, const Json::Value& value) {
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    std::ofstream outFile(path);
    if (!outFile.is_open()) {
        return std::unexpected("Failed to open config file for writing: " + path);
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(value, &outFile);
    outFile << '\n';
    if (!outFile) {
        return std::unexpected("Failed to write config file: " + path);
    }
    return {};
}

// Reads a JSON file, creating it from the default when it does not exist.
Json::Value loadJson(const std::string& path, const Json::Value& defaultValue) {
    if (!fs::exists(path)) {
        auto written = writeJson(path, defaultValue);
        if (!written) {
            throw std::runtime_error(written.error());
        }
        return defaultValue;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", path));
    }
    Json::Value value;
    Json::CharReaderBuilder reader;
    std::string errors;
    if (!Json::parseFromStream(reader, file, &value, &errors)) {
        throw std::runtime_error(std::format("Failed to parse config file: {}: {}", path, errors));
    }
    return value;
}

} // namespace

Profile DeployConfig::parseProfile(const Json::Value& value) {
    Profile profile;
    profile.name = value.get("name", "Unnamed").asString();
    profile.host = value.get("host", "").asString();
    profile.credentials.username = value.get("username", "").asString();
    profile.credentials.password = value.get("password", "").asString();
    profile.root = value.get("root", "/").asString();
    if (profile.root.empty()) {
        profile.root = "/";
    }
    profile.trustUnknownHost = value.get("trust_unknown_host", false).asBool();

    if (value.isMember("protocol")) {
        std::string protocol = value["protocol"].asString();
        auto mode = parseTransportMode(protocol);
        if (!mode) {
            throw std::runtime_error(std::format("Profile '{}': unknown protocol '{}'", profile.name, protocol));
        }
        profile.transport = *mode;
    } else {
        profile.transport = value.get("tls", false).asBool() ? TransportMode::Ftps : TransportMode::Ftp;
    }

    int defaultPort = profile.transport == TransportMode::Sftp ? 22 : 21;
    const Json::Value& port = value["port"];
    if (port.isNull()) {
        profile.port = defaultPort;
    } else if (port.isIntegral()) {
        profile.port = port.asInt();
    } else if (port.isString()) {
        try {
            profile.port = std::stoi(port.asString());
        } catch (const std::exception&) {
            throw std::runtime_error(std::format("Profile '{}': port must be a number", profile.name));
        }
    } else {
        throw std::runtime_error(std::format("Profile '{}': port must be a number", profile.name));
    }
    if (auto valid = validateProfile(profile); !valid) {
        throw std::runtime_error(valid.error());
    }
    return profile;
}

std::expected<void, std::string> DeployConfig::validateProfile(const Profile& profile) {
    if (profile.name.empty()) {
        return std::unexpected("Profile name must not be empty");
    }
    if (profile.port < 1 || profile.port > 65535) {
        return std::unexpected(std::format("Profile '{}': port {} out of range", profile.name, profile.port));
    }
    return {};
}

Mapping DeployConfig::parseMapping(const Json::Value& value) {
    Mapping mapping;
    mapping.name = value.get("name", "Unnamed Mapping").asString();
    mapping.enabled = value.get("enabled", true).asBool();
    mapping.localName = value.get("local_relpath", "").asString();
    mapping.remotePath = value.get("remote_path", "").asString();
    mapping.backup = value.get("backup_before_overwrite", true).asBool();
    return mapping;
}

Json::Value DeployConfig::toJson(const Profile& profile) {
    Json::Value value;
    value["name"] = profile.name;
    value["host"] = profile.host;
    value["port"] = profile.port;
    value["username"] = profile.credentials.username;
    value["password"] = profile.credentials.password;
    value["tls"] = profile.transport == TransportMode::Ftps;
    value["protocol"] = std::string(toString(profile.transport));
    value["root"] = profile.root;
    value["trust_unknown_host"] = profile.trustUnknownHost;
    return value;
}

Json::Value DeployConfig::toJson(const Mapping& mapping) {
    Json::Value value;
    value["name"] = mapping.name;
    value["enabled"] = mapping.enabled;
    value["local_relpath"] = mapping.localName;
    value["remote_path"] = mapping.remotePath;
    value["backup_before_overwrite"] = mapping.backup;
    return value;
}

DeployConfig::DeployConfig(const std::string& baseDir) : baseDir(baseDir) {
    fs::path base(baseDir);
    configDir = (base / "config").string();
    presetsDir = (base / "presets").string();
    backupsDir = (base / "backups").string();
    logsDir = (base / "logs").string();
    profilesFile = (base / "config" / "profiles.json").string();
    mappingsFile = (base / "config" / "mappings.json").string();
    settingsFile = (base / "config" / "settings.json").string();
    logFile = (base / "logs" / "deploy.log").string();
    errorLogFile = (base / "logs" / "errors.log").string();

    for (const auto& dir : {configDir, presetsDir, backupsDir, logsDir}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error(std::format("Failed to create directory {}: {}", dir, ec.message()));
        }
    }

    try {
        Json::Value profilesJson = loadJson(profilesFile, defaultProfiles());
        std::set<std::string> names;
        for (const auto& p : profilesJson["profiles"]) {
            Profile profile = parseProfile(p);
            if (!names.insert(profile.name).second) {
                throw std::runtime_error(std::format("Duplicate profile name: {}", profile.name));
            }
            profiles.push_back(profile);
        }
        const Json::Value& active = profilesJson["active_profile"];
        if (active.isString() && !active.asString().empty()) {
            activeProfile = active.asString();
        }

        Json::Value mappingsJson = loadJson(mappingsFile, defaultMappings());
        for (const auto& m : mappingsJson["mappings"]) {
            mappings.push_back(parseMapping(m));
        }

        Json::Value settingsJson = loadJson(settingsFile, defaultSettings());
        const Json::Value& app = settingsJson["app"];
        timeoutSeconds = app.get("timeout_seconds", 20).asInt();
        verifyUploads = app.get("verify_uploads", true).asBool();
    } catch (const Json::Exception& e) {
        throw std::runtime_error(std::format("Invalid configuration in {}: {}", configDir, e.what()));
    }
    if (timeoutSeconds <= 0) {
        throw std::runtime_error(std::format("timeout_seconds must be positive, got {}", timeoutSeconds));
    }
}

std::expected<void, std::string> DeployConfig::saveProfiles() const {
    Json::Value root = defaultProfiles();
    for (const auto& profile : profiles) {
        root["profiles"].append(toJson(profile));
    }
    if (activeProfile) {
        root["active_profile"] = *activeProfile;
    }
    return writeJson(profilesFile, root);
}

std::expected<void, std::string> DeployConfig::saveMappings() const {
    Json::Value root = defaultMappings();
    for (const auto& mapping : mappings) {
        root["mappings"].append(toJson(mapping));
    }
    return writeJson(mappingsFile, root);
}

std::expected<void, std::string> DeployConfig::putProfile(const Profile& profile) {
    if (auto valid = validateProfile(profile); !valid) {
        return valid;
    }
    auto it = std::ranges::find(profiles, profile.name, &Profile::name);
    if (it != profiles.end()) {
        *it = profile;
    } else {
        profiles.push_back(profile);
        if (!activeProfile) {
            activeProfile = profile.name;
        }
    }
    return saveProfiles();
}

std::expected<void, std::string> DeployConfig::removeProfile(const std::string& name) {
    auto it = std::ranges::find(profiles, name, &Profile::name);
    if (it == profiles.end()) {
        return std::unexpected(std::format("Profile not found: {}", name));
    }
    profiles.erase(it);
    if (activeProfile == name) {
        activeProfile = profiles.empty() ? std::nullopt : std::optional<std::string>(profiles.front().name);
    }
    return saveProfiles();
}

const Profile* DeployConfig::findProfile(const std::string& name) const {
    for (const auto& profile : profiles) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

const Profile* DeployConfig::selectProfile(const std::string& name) const {
    if (!name.empty()) {
        return findProfile(name);
    }
    if (activeProfile) {
        if (const Profile* active = findProfile(*activeProfile)) {
            return active;
        }
    }
    return profiles.empty() ? nullptr : &profiles.front();
}

DeployLog DeployConfig::makeLog(bool echo) const {
    return DeployLog(logFile, errorLogFile, echo);
}
