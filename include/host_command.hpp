#pragma once

#include <cstdint>
#include <optional>
#include <string>

enum class HostCommandType : uint8_t {
    Feed,
    Stop,
    Status,
    Quit,
};

struct HostCommand {
    HostCommandType type;
    std::optional<uint32_t> timeout_ms;
    std::string info;
};

// Line protocol for the stdin shim:
//   feed [<timeout_ms>|-] [info...]
//   stop [info...]
//   status
//   quit
// Returns nullopt for blank lines, unknown verbs and malformed timeouts;
// error (if non-null) receives a short description.
std::optional<HostCommand> parse_host_command(const std::string& line, std::string* error = nullptr);
