#include "ftp_listing.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <sstream>

std::optional<RemoteEntry> parseMlsdLine(const std::string& line) {
    auto space = line.find(' ');
    if (space == std::string::npos || space + 1 >= line.size()) {
        return std::nullopt;
    }
    RemoteEntry entry;
    entry.name = line.substr(space + 1);
    std::string type;
    std::istringstream facts(line.substr(0, space));
    std::string fact;
    while (std::getline(facts, fact, ';')) {
        auto eq = fact.find('=');
        if (eq == std::string::npos) continue;
        std::string key = fact.substr(0, eq);
        std::ranges::transform(key, key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::string value = fact.substr(eq + 1);
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (key == "type") {
            type = value;
        } else if (key == "size") {
            try {
                entry.size = std::stoull(value);
            } catch (const std::exception&) {
                entry.size = 0;
            }
        }
    }
    if (type == "cdir" || type == "pdir" || entry.name == "." || entry.name == "..") {
        return std::nullopt;
    }
    entry.isDirectory = type == "dir";
    return entry;
}

std::optional<RemoteEntry> parseNlstLine(const std::string& line) {
    auto slash = line.rfind('/');
    std::string name = slash == std::string::npos ? line : line.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return std::nullopt;
    }
    return RemoteEntry{name, false, 0};
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::string escapeSegment(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += std::format("%{:02X}", static_cast<unsigned>(c));
        }
    }
    return out;
}

std::string ftpUrl(const std::string& host, int port, const std::string& remotePath, bool directory) {
    std::string rel = normalizeRemotePath(remotePath);
    if (rel.empty()) {
        return std::format("ftp://{}:{}/", host, port);
    }
    std::string url = std::format("ftp://{}:{}/%2F", host, port);
    bool first = true;
    std::istringstream segments(rel);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty()) continue;
        if (!first) {
            url += "/";
        }
        url += escapeSegment(segment);
        first = false;
    }
    if (directory && !first) {
        url += "/";
    }
    return url;
}
