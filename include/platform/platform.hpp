#pragma once

#include <string>
#include <string_view>

namespace wdi {

enum class OsFamily {
    MacOS,
    Linux,
    Windows,
    Unsupported,
};

enum class CpuArch {
    X64,
    Arm64,
    Other,
};

const char* OsFamilyName(OsFamily os);

// Host facts resolved once per run and passed to every installer.
struct PlatformDescriptor {
    OsFamily os = OsFamily::Unsupported;
    std::string os_name;        // raw host name ("linux", "darwin", "win32", "freebsd", ...)
    CpuArch arch = CpuArch::X64;
    std::string binary_suffix;  // ".exe" on Windows
    std::string archive_tag;    // "linux64", "mac64", "win64"; empty when unsupported
    std::string user_name;

    bool IsSupported() const { return os != OsFamily::Unsupported; }

    // Builds a descriptor with the suffix and archive tag derived from `os`.
    static PlatformDescriptor For(OsFamily os,
                                  CpuArch arch = CpuArch::X64,
                                  std::string user_name = {},
                                  std::string os_name = {});
};

PlatformDescriptor DetectHostPlatform();

} // namespace wdi
