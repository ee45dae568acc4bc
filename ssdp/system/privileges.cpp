#include "ssdp/system/privileges.hpp"

#include "ssdp/logging/ssdp_logging.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>

namespace ssdp
{

namespace
{

[[noreturn]] void throw_system_error(int error_number, const std::string& what)
{
    throw boost::system::system_error(boost::system::error_code(error_number, boost::system::system_category()), what);
}

[[noreturn]] void throw_unknown_name(const std::string& what)
{
    throw boost::system::system_error(boost::system::errc::make_error_code(boost::system::errc::invalid_argument), what);
}

} // namespace

PrivilegeDropResult drop_privileges(const std::string& user, const std::string& group)
{
    if (::getuid() != 0 && ::geteuid() != 0)
    {
        SSDP_LOG_INFO("Not running as root, keeping uid " << ::getuid());
        return PrivilegeDropResult::not_privileged;
    }

    const passwd* user_entry = ::getpwnam(user.c_str());
    if (user_entry == nullptr)
    {
        throw_unknown_name("Unknown user '" + user + "'");
    }
    const uid_t uid = user_entry->pw_uid;

    const struct group* group_entry = ::getgrnam(group.c_str());
    if (group_entry == nullptr)
    {
        throw_unknown_name("Unknown group '" + group + "'");
    }
    const gid_t gid = group_entry->gr_gid;

    if (::setgroups(0, nullptr) != 0)
    {
        const int error_number = errno;
        throw_system_error(error_number, "setgroups");
    }
    if (::setgid(gid) != 0)
    {
        const int error_number = errno;
        throw_system_error(error_number, "setgid " + group);
    }
    if (::setuid(uid) != 0)
    {
        const int error_number = errno;
        throw_system_error(error_number, "setuid " + user);
    }

    if (uid != 0 && ::setuid(0) == 0)
    {
        throw boost::system::system_error(boost::system::errc::make_error_code(boost::system::errc::operation_not_permitted),
                                          "Root privileges could be regained after dropping them");
    }

    ::umask(077);

    SSDP_LOG_INFO("Dropped privileges to " << user << ":" << group << " (uid " << uid << ", gid " << gid << ")");
    return PrivilegeDropResult::dropped;
}

} // namespace ssdp
