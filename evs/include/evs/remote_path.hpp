#pragma once

#include <string>
#include <string_view>

namespace Evs
{
    /**
     * @brief Decodes %XX escapes. Malformed escapes are kept as they are.
     */
    std::string percentDecode(std::string_view encoded);

    /**
     * @brief Turns the remote URL given to the program into the remote root directory.
     *
     * Scheme and authority are removed if present, the leading '/' is stripped, trailing whitespace is stripped and
     * percent escapes are decoded. "idrive:///backups/host%201" becomes "backups/host 1".
     */
    std::string remoteRootFromUrl(std::string_view url);

    /**
     * @brief Joins a remote directory and a name with a single '/'. An absolute name replaces the directory.
     */
    std::string joinRemotePath(std::string_view directory, std::string_view name);
}
