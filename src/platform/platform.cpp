#include "platform/platform.hpp"

#include <cstdlib>
#include <cstring>
#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace wdi {

namespace {

std::string CurrentUserName() {
    for (const char* var : {"USERNAME", "USER", "LOGNAME"}) {
        const char* v = std::getenv(var);
        if (v && *v) return v;
    }
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_name) {
        return pw->pw_name;
    }
    return {};
}

CpuArch ArchFromMachine(const char* machine) {
    if (std::strcmp(machine, "x86_64") == 0 || std::strcmp(machine, "amd64") == 0) return CpuArch::X64;
    if (std::strcmp(machine, "aarch64") == 0 || std::strcmp(machine, "arm64") == 0) return CpuArch::Arm64;
    return CpuArch::Other;
}

} // namespace

const char* OsFamilyName(OsFamily os) {
    switch (os) {
        case OsFamily::MacOS:       return "macos";
        case OsFamily::Linux:       return "linux";
        case OsFamily::Windows:     return "windows";
        case OsFamily::Unsupported: return "unsupported";
    }
    return "unsupported";
}

PlatformDescriptor PlatformDescriptor::For(OsFamily os,
                                           CpuArch arch,
                                           std::string user_name,
                                           std::string os_name) {
    PlatformDescriptor p;
    p.os = os;
    p.arch = arch;
    p.user_name = std::move(user_name);
    p.os_name = os_name.empty() ? OsFamilyName(os) : std::move(os_name);
    switch (os) {
        case OsFamily::MacOS:
            p.archive_tag = "mac64";
            break;
        case OsFamily::Linux:
            p.archive_tag = "linux64";
            break;
        case OsFamily::Windows:
            p.archive_tag = "win64";
            p.binary_suffix = ".exe";
            break;
        case OsFamily::Unsupported:
            break;
    }
    return p;
}

// POSIX hosts only. Windows descriptors come from PlatformDescriptor::For and drive
// archive and version-command selection, but the binary itself is not built for Windows.
PlatformDescriptor DetectHostPlatform() {
#if defined(__APPLE__)
    const OsFamily os = OsFamily::MacOS;
    const char* os_name = "darwin";
#elif defined(__linux__)
    const OsFamily os = OsFamily::Linux;
    const char* os_name = "linux";
#else
    const OsFamily os = OsFamily::Unsupported;
    const char* os_name = "unknown";
#endif

    CpuArch arch = CpuArch::Other;
    std::string name = os_name;
    utsname uts{};
    if (::uname(&uts) == 0) {
        arch = ArchFromMachine(uts.machine);
        if (os == OsFamily::Unsupported) name = uts.sysname;
    }
    return PlatformDescriptor::For(os, arch, CurrentUserName(), std::move(name));
}

} // namespace wdi
