#include "command.hpp"

#include <sstream>

namespace daemon_runner {
namespace process {

namespace {

bool needs_quotes(const std::string &s) {
    if (s.empty()) {
        return true;
    }
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == '"' || c == '\'' || c == '\\' || c == '$') {
            return true;
        }
    }
    return false;
}

void append_word(std::ostringstream &out, const std::string &word) {
    if (!needs_quotes(word)) {
        out << word;
        return;
    }
    out << '"';
    for (char c : word) {
        if (c == '"' || c == '\\' || c == '$') {
            out << '\\';
        }
        out << c;
    }
    out << '"';
}

}  // namespace

std::string Command::to_string() const {
    std::ostringstream out;
    for (const auto &[key, value] : env) {
        out << key << '=';
        append_word(out, value);
        out << ' ';
    }
    append_word(out, program);
    for (const auto &a : args) {
        out << ' ';
        append_word(out, a);
    }
    if (!working_dir.empty()) {
        out << " (in " << working_dir << ")";
    }
    return out.str();
}

}  // namespace process
}  // namespace daemon_runner
