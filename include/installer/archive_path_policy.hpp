#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace wdi {

class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;

    // The installed binary must land directly inside the output directory.
    static Result ValidateOutputName(std::string_view output_name);

  private:
    static bool IsSafeRelativePath(const std::string& p);

    bool safe_paths_only_ = true;
};

} // namespace wdi
