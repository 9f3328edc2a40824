/**
 * @file ftp_listing.hpp
 * @brief FTP reply parsing and URL construction used by the FTP adapter.
 *
 * Kept free of libcurl so the server-facing text handling can be tested on its own.
 */

#ifndef FTP_LISTING_HPP
#define FTP_LISTING_HPP

#include <optional>
#include <string>
#include <vector>
#include "transfer_client.hpp"

/**
 * @brief Parses one MLSD line, e.g. "type=file;size=42;modify=20240101000000; name".
 *
 * @return The entry, or std::nullopt for cdir/pdir entries and malformed lines.
 */
std::optional<RemoteEntry> parseMlsdLine(const std::string& line);

/**
 * @brief Parses one NLST line. Some servers return full paths; only the last component is kept.
 *
 * @return The entry, or std::nullopt for "." and "..".
 */
std::optional<RemoteEntry> parseNlstLine(const std::string& line);

/**
 * @brief Splits a listing into non-empty lines, accepting LF and CRLF endings.
 */
std::vector<std::string> splitLines(const std::string& text);

/**
 * @brief Percent-encodes one path segment (RFC 3986 unreserved characters stay as is).
 */
std::string escapeSegment(const std::string& segment);

/**
 * @brief Builds an ftp:// URL addressing an absolute server path.
 *
 * A non-empty path is prefixed with %2F so the server does not resolve it against the
 * login directory. An empty path (or "/") addresses the login directory itself.
 *
 * @param directory Append a trailing slash, as libcurl expects for directory requests.
 */
std::string ftpUrl(const std::string& host, int port, const std::string& remotePath, bool directory = false);

#endif // FTP_LISTING_HPP
