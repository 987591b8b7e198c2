#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace daemon_runner {
namespace process {

// Executable plus arguments for spawning a daemon.
// `program` is resolved through PATH when it contains no '/'.
struct Command {
    std::string program;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // Added to (or overriding) the parent environment
    std::string working_dir;                 // Empty: inherit the parent's working directory

    Command() = default;
    explicit Command(std::string program_path, std::vector<std::string> arguments = {})
        : program(std::move(program_path)), args(std::move(arguments)) {}

    Command &arg(const std::string &value) {
        args.push_back(value);
        return *this;
    }

    // Shell-like rendering for log and error messages, e.g. `bitcoind "-conf=/a b/x.conf"`
    std::string to_string() const;
};

}  // namespace process
}  // namespace daemon_runner
