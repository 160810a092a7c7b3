#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <sys/types.h>

namespace wdi {

class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
};

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

} // namespace wdi
