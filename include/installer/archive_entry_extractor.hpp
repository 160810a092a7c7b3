#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace wdi {

enum class ArchiveFormat {
    Zip,
    Tar,  // plain or compressed by any filter libarchive knows (gzip, xz, bzip2, ...)
};

class ArchiveEntryExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        std::uint64_t max_entry_bytes = 512ULL * 1024 * 1024;
    };

    ArchiveEntryExtractor() = default;
    explicit ArchiveEntryExtractor(const Options& opt) : opt_(opt) {}

    // Reads the regular-file entry whose normalized path equals `name_in_archive` into `out`.
    Result ExtractEntry(IReader& archive_stream,
                        ArchiveFormat format,
                        std::string_view name_in_archive,
                        std::vector<std::uint8_t>& out) const;

  private:
    Options opt_{};
};

} // namespace wdi
