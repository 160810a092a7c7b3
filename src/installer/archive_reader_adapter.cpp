#include "installer/archive_reader_adapter.hpp"

#include "system/signals.hpp"

#include <cerrno>

namespace wdi {

la_ssize_t ArchiveReadSource::ReadCb(struct archive* a, void* client_data, const void** out_buf) {
    if (g_cancel.load(std::memory_order_relaxed)) {
        archive_set_error(a, EINTR, "cancelled");
        return -1;
    }

    auto* self = static_cast<ArchiveReadSource*>(client_data);
    const ssize_t n = self->reader_->Read(std::span<std::uint8_t>(self->buffer_.data(), self->buffer_.size()));
    if (n < 0) {
        archive_set_error(a, errno ? errno : EIO, "source read failed");
        return -1;
    }

    *out_buf = self->buffer_.data();
    return static_cast<la_ssize_t>(n);
}

int ArchiveReadSource::Open(struct archive* ar) {
    return archive_read_open2(ar, this, nullptr, ReadCb, nullptr, nullptr);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace wdi
