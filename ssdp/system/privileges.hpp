#pragma once

#include <string>

namespace ssdp
{

enum class PrivilegeDropResult
{
    not_privileged, ///< Not running as root, nothing to drop
    dropped
};

inline const char* to_string(PrivilegeDropResult result) noexcept
{
    switch (result)
    {
    case PrivilegeDropResult::not_privileged:
        return "not_privileged";
    case PrivilegeDropResult::dropped:
        return "dropped";
    }
    return "unknown";
}

/**
 * @brief Permanently switch from root to @p user / @p group.
 *
 * Clears supplementary groups, sets the group before the user, checks that root cannot be regained,
 * then sets the umask to 077. Does nothing when the process is not running as root.
 *
 * @throws boost::system::system_error for unknown names or a failing system call. Nothing has been
 *         changed yet if the name lookup fails.
 */
PrivilegeDropResult drop_privileges(const std::string& user, const std::string& group);

} // namespace ssdp
