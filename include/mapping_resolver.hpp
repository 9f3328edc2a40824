/**
 * @file mapping_resolver.hpp
 * @brief Resolves a preset and a mapping set into concrete transfer operations.
 *
 * Resolution reads the preset folder fresh on every call and never touches the network.
 * Mappings whose local file is absent, or whose remote path is unusable, become findings
 * instead of operations; the remaining mappings still resolve.
 */

#ifndef MAPPING_RESOLVER_HPP
#define MAPPING_RESOLVER_HPP

#include <set>
#include <string>
#include <vector>
#include <expected>
#include "deploy_types.hpp"

/**
 * @brief A configuration problem attached to one enabled mapping.
 */
struct ResolutionFinding {
    std::size_t mappingIndex = 0;
    std::string mappingName;
    std::string localName;
    std::string remotePath;
    FailureReason reason = FailureReason::MissingLocalFile;
    std::string message;
};

/**
 * @brief Result of resolving one (preset, mapping set) pair.
 */
struct Resolution {
    std::vector<Operation> operations;       ///< In mapping-set order.
    std::vector<ResolutionFinding> findings; ///< In mapping-set order.
};

class MappingResolver {
public:
    /**
     * @brief Resolves enabled mappings against the preset's current files.
     *
     * A mapping matches only when its local name equals a listed file path exactly
     * (case-sensitive, no normalisation). Several mappings may target the same remote path.
     *
     * @param preset Preset whose folder is listed.
     * @param mappings Mapping set in its defined order.
     * @return std::expected<Resolution, std::string> Operations and findings, or an error when
     * the preset folder cannot be read.
     */
    static std::expected<Resolution, std::string> resolve(const Preset& preset, const std::vector<Mapping>& mappings);

    /**
     * @brief Lists every regular file under the preset folder.
     *
     * @return Paths relative to the folder, '/'-separated.
     */
    static std::expected<std::set<std::string>, std::string> listPresetFiles(const Preset& preset);

    /**
     * @brief Checks a normalised remote path for use under a server root and a backup directory.
     *
     * Rejects empty paths and paths with "." or ".." segments.
     */
    static bool isUsableRemotePath(const std::string& remotePath);
};

#endif // MAPPING_RESOLVER_HPP
