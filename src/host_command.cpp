#include "host_command.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace {
std::size_t skip_spaces(const std::string& s, std::size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        pos++;
    }
    return pos;
}

std::string next_word(const std::string& s, std::size_t& pos) {
    pos = skip_spaces(s, pos);
    const std::size_t start = pos;
    while (pos < s.size() && !std::isspace(static_cast<unsigned char>(s[pos]))) {
        pos++;
    }
    return s.substr(start, pos - start);
}

std::string rest_of_line(const std::string& s, std::size_t pos) {
    pos = skip_spaces(s, pos);
    std::size_t end = s.size();
    while (end > pos && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(pos, end - pos);
}

bool parse_timeout(const std::string& word, uint32_t& out) {
    if (word.empty() || !std::isdigit(static_cast<unsigned char>(word[0]))) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(word.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v > UINT32_MAX) {
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

void set_error(std::string* error, const std::string& msg) {
    if (error) {
        *error = msg;
    }
}
} // namespace

std::optional<HostCommand> parse_host_command(const std::string& line, std::string* error) {
    std::size_t pos = 0;
    const std::string verb = next_word(line, pos);
    if (verb.empty()) {
        set_error(error, "empty line");
        return std::nullopt;
    }

    HostCommand cmd{HostCommandType::Status, std::nullopt, std::string()};
    if (verb == "feed") {
        cmd.type = HostCommandType::Feed;
        std::size_t after = pos;
        const std::string arg = next_word(line, after);
        if (arg.empty()) {
            return cmd;
        }
        if (arg != "-") {
            uint32_t timeout = 0;
            if (!parse_timeout(arg, timeout)) {
                set_error(error, "invalid timeout '" + arg + "'");
                return std::nullopt;
            }
            cmd.timeout_ms = timeout;
        }
        cmd.info = rest_of_line(line, after);
        return cmd;
    }
    if (verb == "stop") {
        cmd.type = HostCommandType::Stop;
        cmd.info = rest_of_line(line, pos);
        return cmd;
    }
    if (verb == "status") {
        cmd.type = HostCommandType::Status;
        return cmd;
    }
    if (verb == "quit" || verb == "exit") {
        cmd.type = HostCommandType::Quit;
        return cmd;
    }
    set_error(error, "unknown command '" + verb + "'");
    return std::nullopt;
}
