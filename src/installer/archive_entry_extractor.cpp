#include "installer/archive_entry_extractor.hpp"

#include "installer/archive_path_policy.hpp"
#include "installer/archive_reader_adapter.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstring>
#include <memory>
#include <string>

namespace wdi {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

constexpr size_t kListedEntries = 8;

std::string DescribeSeen(const std::vector<std::string>& seen, size_t total) {
    if (seen.empty()) return "archive has no entries";
    std::string out = "archive contains: ";
    for (size_t i = 0; i < seen.size(); ++i) {
        if (i) out += ", ";
        out += seen[i];
    }
    if (total > seen.size()) out += ", ... (" + std::to_string(total) + " entries)";
    return out;
}

// A read aborted by SIGINT/SIGTERM surfaces from libarchive as a generic failure.
Result ReadFailure(std::string msg) {
    if (g_cancel.load(std::memory_order_relaxed)) return Result::Fail(ErrorKind::Cancelled, "cancelled");
    return Result::Fail(ErrorKind::ArchiveFormatOrEntryMissing, std::move(msg));
}

} // namespace

Result ArchiveEntryExtractor::ExtractEntry(IReader& archive_stream,
                                           ArchiveFormat format,
                                           std::string_view name_in_archive,
                                           std::vector<std::uint8_t>& out) const {
    out.clear();

    ArchivePathPolicy path_policy(opt_.safe_paths_only);
    std::string wanted;
    auto wanted_res = path_policy.NormalizeEntryPath(std::string(name_in_archive).c_str(), wanted);
    if (!wanted_res.is_ok()) return wanted_res.As(ErrorKind::InvalidArgument);
    if (wanted.empty() || wanted == ".") {
        return Result::Fail(ErrorKind::InvalidArgument, "Empty entry name requested from archive");
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorKind::Io, "archive_read_new failed");

    if (format == ArchiveFormat::Zip) {
        archive_read_support_format_zip(ar.get());
    } else {
        archive_read_support_filter_all(ar.get());
        archive_read_support_format_tar(ar.get());
        archive_read_support_format_gnutar(ar.get());
    }

    ArchiveReadSource source(archive_stream);
    if (source.Open(ar.get()) != ARCHIVE_OK) {
        return ReadFailure("Unreadable archive while looking for '" + wanted + "': " + ArchiveErr(ar.get()));
    }

    std::vector<std::string> seen;
    size_t entry_count = 0;
    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogDebug("archive warning: %s", ArchiveErr(ar.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            return ReadFailure("Unreadable archive while looking for '" + wanted + "': " + ArchiveErr(ar.get()));
        }

        const char* raw = archive_entry_pathname(entry);
        const std::string rel = NormalizeArchivePath(raw ? std::string(raw) : std::string());
        ++entry_count;
        if (seen.size() < kListedEntries) seen.push_back(rel);

        if (rel != wanted) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        if (archive_entry_filetype(entry) != AE_IFREG) {
            return Result::Fail(ErrorKind::ArchiveFormatOrEntryMissing,
                                "Archive entry '" + wanted + "' is not a regular file");
        }

        if (archive_entry_size_is_set(entry)) {
            const la_int64_t declared = archive_entry_size(entry);
            if (declared > 0 && static_cast<std::uint64_t>(declared) > opt_.max_entry_bytes) {
                return Result::Fail(ErrorKind::ArchiveFormatOrEntryMissing,
                                    "Archive entry '" + wanted + "' is too large");
            }
            if (declared > 0) out.reserve(static_cast<size_t>(declared));
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK && rr != ARCHIVE_WARN) {
                out.clear();
                return ReadFailure("Failed to read '" + wanted + "' from archive: " + ArchiveErr(ar.get()));
            }

            const std::uint64_t end = static_cast<std::uint64_t>(offset) + size;
            if (end > opt_.max_entry_bytes) {
                out.clear();
                return Result::Fail(ErrorKind::ArchiveFormatOrEntryMissing,
                                    "Archive entry '" + wanted + "' is too large");
            }
            // Sparse regions read back as zeros.
            if (out.size() < end) out.resize(static_cast<size_t>(end));
            if (size > 0) std::memcpy(out.data() + offset, buff, size);
        }

        LogDebug("extracted '%s' (%zu bytes)", wanted.c_str(), out.size());
        return Result::Ok();
    }

    return Result::Fail(ErrorKind::ArchiveFormatOrEntryMissing,
                        "Entry '" + wanted + "' not found in archive (" + DescribeSeen(seen, entry_count) + ")");
}

} // namespace wdi
