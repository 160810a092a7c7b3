#pragma once

#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace wdi {

struct CommandOutput {
    bool launched = false;   // false when the executable could not be found or started
    int exit_code = -1;      // 128 + signal number when the child was killed
    std::string stdout_text;

    bool Succeeded() const { return launched && exit_code == 0; }
};

class ICommandRunner {
  public:
    virtual ~ICommandRunner() = default;

    // Fails only on timeout or on local plumbing errors (pipe, poll, waitpid).
    // A missing executable or a non-zero exit is reported through `out`.
    virtual Result Run(const std::vector<std::string>& argv,
                       std::chrono::milliseconds timeout,
                       CommandOutput& out) const = 0;
};

class PosixCommandRunner final : public ICommandRunner {
  public:
    static constexpr size_t kMaxOutputBytes = 1024 * 1024;

    Result Run(const std::vector<std::string>& argv,
               std::chrono::milliseconds timeout,
               CommandOutput& out) const override;
};

std::shared_ptr<const ICommandRunner> DefaultCommandRunner();

} // namespace wdi
