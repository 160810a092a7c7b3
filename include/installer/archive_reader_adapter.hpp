#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <cstdint>
#include <string>
#include <vector>

namespace wdi {

// Feeds an IReader to libarchive. Must outlive the archive handle it was opened on.
class ArchiveReadSource {
  public:
    explicit ArchiveReadSource(IReader& reader, size_t buffer_size = 64 * 1024)
        : reader_(&reader), buffer_(buffer_size) {}

    ArchiveReadSource(const ArchiveReadSource&) = delete;
    ArchiveReadSource& operator=(const ArchiveReadSource&) = delete;

    int Open(struct archive* ar);

  private:
    static la_ssize_t ReadCb(struct archive* a, void* client_data, const void** out_buf);

    IReader* reader_ = nullptr;
    std::vector<std::uint8_t> buffer_;
};

std::string ArchiveErr(struct archive* ar);

} // namespace wdi
