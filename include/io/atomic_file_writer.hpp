#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <sys/types.h>

namespace wdi {

// Writes into a temporary sibling of the destination and renames it into place on Commit().
// An uncommitted writer removes its temporary file on destruction.
class AtomicFileWriter final : public IWriter {
  public:
    AtomicFileWriter() = default;
    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
    ~AtomicFileWriter() override;

    static Result Open(std::string path, AtomicFileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    // Applies mode, flushes and renames over the destination path.
    Result Commit(mode_t mode);

    const std::string& Path() const { return path_; }
    const std::string& TempPath() const { return tmp_path_; }

  private:
    void Discard();

    std::string path_;
    std::string tmp_path_;
    Fd fd_;
    bool committed_ = false;
};

} // namespace wdi
