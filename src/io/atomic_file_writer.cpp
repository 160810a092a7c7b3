// atomic_file_writer.cpp - temp file + rename writer for installed binaries.

#include "io/atomic_file_writer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace wdi {

AtomicFileWriter::~AtomicFileWriter() { Discard(); }

Result AtomicFileWriter::Open(std::string path, AtomicFileWriter& out) {
    out.Discard();
    out.path_ = std::move(path);
    out.committed_ = false;

    std::string tmpl = out.path_ + ".tmp-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(
            err, "Failed to open output: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);
    out.tmp_path_ = buf.data();
    return Result::Ok();
}

Result AtomicFileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(errno, "Write failed (" + std::string(std::strerror(errno)) + ")");
    }

    return Result::Ok();
}

Result AtomicFileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(errno, "fsync failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

Result AtomicFileWriter::Commit(mode_t mode) {
    if (!fd_.Valid()) return Result::Fail(ErrorKind::Io, "Commit on closed writer: " + path_);

    if (::fchmod(fd_.Get(), mode) != 0) {
        const int err = errno;
        return Result::Fail(err, "chmod failed: " + std::string(std::strerror(err)));
    }

    auto fr = FsyncNow();
    if (!fr.is_ok()) return fr;

    fd_.Close();

    if (::rename(tmp_path_.c_str(), path_.c_str()) != 0) {
        const int err = errno;
        return Result::Fail(err, "Atomic rename failed: " + std::string(std::strerror(err)));
    }

    committed_ = true;
    tmp_path_.clear();
    return Result::Ok();
}

void AtomicFileWriter::Discard() {
    fd_.Close();
    if (!committed_ && !tmp_path_.empty()) {
        ::unlink(tmp_path_.c_str());
    }
    tmp_path_.clear();
}

} // namespace wdi
