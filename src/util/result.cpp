#include "util/result.hpp"

namespace wdi {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                        return "none";
        case ErrorKind::Io:                          return "io";
        case ErrorKind::InvalidArgument:             return "invalid-argument";
        case ErrorKind::UnsupportedPlatform:         return "unsupported-platform";
        case ErrorKind::RemoteResolutionFailure:     return "remote-resolution-failure";
        case ErrorKind::DownloadFailure:             return "download-failure";
        case ErrorKind::ArchiveFormatOrEntryMissing: return "archive-format-or-entry-missing";
        case ErrorKind::Timeout:                     return "timeout";
        case ErrorKind::Cancelled:                   return "cancelled";
    }
    return "unknown";
}

} // namespace wdi
