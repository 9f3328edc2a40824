#include "deploy_api.hpp"
#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--base <dir>] [--yes] <command>\n"
              << "Commands:\n"
              << "  presets                    list preset folders\n"
              << "  profiles                   list connection profiles\n"
              << "  preview <preset>           show what an upload of <preset> would do\n"
              << "  test [profile]             connect and print the server working directory\n"
              << "  activate <profile>         make <profile> the default profile\n"
              << "  upload <preset> [profile]  upload <preset> to [profile] (default: active profile)\n"
              << "  profile-set <name> [key=value ...]\n"
              << "                             create or edit a profile; keys: host, port, username, password,\n"
              << "                             protocol (ftp|ftps|sftp), root, trust_unknown_host (true|false)\n"
              << "  profile-delete <name>      delete a profile\n"
              << "  mappings                   list mappings with their positions\n"
              << "  mapping-add <name> <local_relpath> <remote_path> [--no-backup]\n"
              << "                             append a mapping\n"
              << "  mapping-delete <n>         delete mapping at position <n>\n"
              << "  mapping-enable <n>         enable mapping at position <n>\n"
              << "  mapping-disable <n>        disable mapping at position <n>" << std::endl;
}

// 1-based position from the command line to a 0-based index.
std::optional<std::size_t> parsePosition(const std::string& text) {
    try {
        std::size_t used = 0;
        unsigned long value = std::stoul(text, &used);
        if (used != text.size() || value == 0) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(value - 1);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parseFlag(const std::string& text) {
    if (text == "true" || text == "yes" || text == "1") return true;
    if (text == "false" || text == "no" || text == "0") return false;
    return std::nullopt;
}

// Applies "key=value" arguments to a profile. Returns an error message for a bad argument.
std::optional<std::string> applyProfileFields(Profile& profile, const std::vector<std::string>& fields) {
    for (const auto& field : fields) {
        auto eq = field.find('=');
        if (eq == std::string::npos) {
            return "expected key=value, got '" + field + "'";
        }
        std::string key = field.substr(0, eq);
        std::string value = field.substr(eq + 1);
        if (key == "host") {
            profile.host = value;
        } else if (key == "port") {
            try {
                profile.port = std::stoi(value);
            } catch (const std::exception&) {
                return "port must be a number";
            }
        } else if (key == "username" || key == "user") {
            profile.credentials.username = value;
        } else if (key == "password") {
            profile.credentials.password = value;
        } else if (key == "protocol") {
            auto mode = parseTransportMode(value);
            if (!mode) {
                return "unknown protocol '" + value + "'";
            }
            profile.transport = *mode;
        } else if (key == "root") {
            profile.root = value.empty() ? "/" : value;
        } else if (key == "trust_unknown_host") {
            auto flag = parseFlag(value);
            if (!flag) {
                return "trust_unknown_host must be true or false";
            }
            profile.trustUnknownHost = *flag;
        } else {
            return "unknown profile key '" + key + "'";
        }
    }
    return std::nullopt;
}

int exitCode(const std::expected<void, std::string>& result) {
    if (!result) {
        std::cerr << "Error: " << result.error() << std::endl;
        return 1;
    }
    return 0;
}

bool confirm(const std::string& question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

void printPreview(const Resolution& resolution) {
    struct Line {
        std::size_t index;
        std::string text;
    };
    std::vector<Line> lines;
    for (const auto& op : resolution.operations) {
        lines.push_back({op.mappingIndex, op.mappingName + " | local: " + op.localName + " (OK) -> remote: " + op.remotePath
                                              + (op.backup ? " [backup]" : "")});
    }
    for (const auto& finding : resolution.findings) {
        std::string state = finding.reason == FailureReason::MissingLocalFile ? "MISSING" : std::string(toString(finding.reason));
        lines.push_back({finding.mappingIndex, finding.mappingName + " | local: " + finding.localName + " (" + state
                                                   + ") -> remote: " + finding.remotePath});
    }
    std::ranges::stable_sort(lines, {}, &Line::index);
    if (lines.empty()) {
        std::cout << "No enabled mappings." << std::endl;
    }
    for (const auto& line : lines) {
        std::cout << line.text << std::endl;
    }
}

void printReport(const RunReport& report) {
    std::cout << "\nRun " << report.runTimestamp << ": preset '" << report.preset << "' -> profile '" << report.profile << "'"
              << std::endl;
    for (const auto& entry : report.entries) {
        std::cout << "  [" << toString(entry.status) << "] " << entry.remotePath;
        if (entry.status == OutcomeStatus::Failed) {
            std::cout << " (" << toString(entry.reason) << ": " << entry.detail << ")";
        }
        if (entry.backupPath) {
            std::cout << " backup: " << *entry.backupPath;
        }
        std::cout << std::endl;
    }
    if (report.fatalError) {
        std::cout << "Run failed: " << *report.fatalError << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string baseDir = ".";
    bool assumeYes = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--base" && i + 1 < argc) {
            baseDir = argv[++i];
        } else if (arg == "--yes" || arg == "-y") {
            assumeYes = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string& command = args[0];
    if (command == "presets") {
        auto presets = DeployAPI::listPresets(baseDir);
        if (!presets) {
            std::cerr << "Error: " << presets.error() << std::endl;
            return 1;
        }
        for (const auto& name : *presets) {
            std::cout << name << std::endl;
        }
        return 0;
    }

    if (command == "profiles") {
        std::string active;
        auto profiles = DeployAPI::listProfiles(baseDir, &active);
        if (!profiles) {
            std::cerr << "Error: " << profiles.error() << std::endl;
            return 1;
        }
        for (const auto& p : *profiles) {
            std::cout << p.name << (p.name == active ? " (active)" : "") << "  " << toString(p.transport) << "://"
                      << p.host << ":" << p.port << p.root << std::endl;
        }
        return 0;
    }

    if (command == "preview" && args.size() == 2) {
        auto resolution = DeployAPI::preview(baseDir, args[1]);
        if (!resolution) {
            std::cerr << "Error: " << resolution.error() << std::endl;
            return 1;
        }
        printPreview(*resolution);
        return 0;
    }

    if (command == "test" && args.size() <= 2) {
        auto pwd = DeployAPI::testConnection(baseDir, args.size() == 2 ? args[1] : std::string());
        if (!pwd) {
            std::cerr << "Error: " << pwd.error() << std::endl;
            return 1;
        }
        std::cout << "Connected. PWD: " << *pwd << std::endl;
        return 0;
    }

    if (command == "activate" && args.size() == 2) {
        auto result = DeployAPI::setActiveProfile(baseDir, args[1]);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return 1;
        }
        return 0;
    }

    if (command == "upload" && (args.size() == 2 || args.size() == 3)) {
        const std::string& preset = args[1];
        std::string profile = args.size() == 3 ? args[2] : std::string();
        if (!assumeYes) {
            auto resolution = DeployAPI::preview(baseDir, preset);
            if (!resolution) {
                std::cerr << "Error: " << resolution.error() << std::endl;
                return 1;
            }
            printPreview(*resolution);
            std::string target = profile.empty() ? std::string("the active profile") : "profile '" + profile + "'";
            if (!confirm("Upload preset '" + preset + "' to " + target + "?")) {
                std::cout << "Cancelled." << std::endl;
                return 1;
            }
        }
        auto report = DeployAPI::startUpload(baseDir, profile, preset);
        if (!report) {
            std::cerr << "Error: " << report.error() << std::endl;
            return 1;
        }
        printReport(*report);
        return report->succeeded() ? 0 : 1;
    }

    if (command == "profile-set" && args.size() >= 2) {
        auto profiles = DeployAPI::listProfiles(baseDir);
        if (!profiles) {
            std::cerr << "Error: " << profiles.error() << std::endl;
            return 1;
        }
        Profile profile;
        profile.name = args[1];
        auto existing = std::ranges::find(*profiles, args[1], &Profile::name);
        if (existing != profiles->end()) {
            profile = *existing;
        }
        std::vector<std::string> fields(args.begin() + 2, args.end());
        if (auto problem = applyProfileFields(profile, fields)) {
            std::cerr << "Error: " << *problem << std::endl;
            return 1;
        }
        bool portGiven = std::ranges::any_of(fields, [](const std::string& f) { return f.starts_with("port="); });
        if (existing == profiles->end() && !portGiven && profile.transport == TransportMode::Sftp) {
            profile.port = 22;
        }
        return exitCode(DeployAPI::saveProfile(baseDir, profile));
    }

    if (command == "profile-delete" && args.size() == 2) {
        return exitCode(DeployAPI::deleteProfile(baseDir, args[1]));
    }

    if (command == "mappings" && args.size() == 1) {
        auto mappings = DeployAPI::listMappings(baseDir);
        if (!mappings) {
            std::cerr << "Error: " << mappings.error() << std::endl;
            return 1;
        }
        for (std::size_t i = 0; i < mappings->size(); ++i) {
            const Mapping& m = (*mappings)[i];
            std::cout << (i + 1) << ". " << (m.enabled ? "[on]  " : "[off] ") << m.name << " | " << m.localName
                      << " -> " << m.remotePath << (m.backup ? " [backup]" : "") << std::endl;
        }
        return 0;
    }

    if (command == "mapping-add" && (args.size() == 4 || (args.size() == 5 && args[4] == "--no-backup"))) {
        Mapping mapping;
        mapping.name = args[1];
        mapping.localName = args[2];
        mapping.remotePath = args[3];
        mapping.backup = args.size() == 4;
        auto index = DeployAPI::addMapping(baseDir, mapping);
        if (!index) {
            std::cerr << "Error: " << index.error() << std::endl;
            return 1;
        }
        std::cout << "Added mapping " << (*index + 1) << std::endl;
        return 0;
    }

    if ((command == "mapping-delete" || command == "mapping-enable" || command == "mapping-disable") && args.size() == 2) {
        auto index = parsePosition(args[1]);
        if (!index) {
            std::cerr << "Error: invalid mapping position '" << args[1] << "'" << std::endl;
            return 1;
        }
        if (command == "mapping-delete") {
            return exitCode(DeployAPI::deleteMapping(baseDir, *index));
        }
        return exitCode(DeployAPI::setMappingEnabled(baseDir, *index, command == "mapping-enable"));
    }

    printUsage(argv[0]);
    return 1;
}
