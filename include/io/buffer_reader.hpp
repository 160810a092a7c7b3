#pragma once

#include "io/io.hpp"

#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>

namespace wdi {

// Reads from a byte buffer owned by the caller.
class BufferReader final : public IReader {
public:
    explicit BufferReader(std::span<const std::uint8_t> data) : data_(data) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size()) return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

private:
    std::span<const std::uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace wdi
