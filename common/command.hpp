#pragma once

// ============================================================
// command.hpp -- Control-channel command parsing
// ============================================================

#include "platform.hpp"
#include <string>

enum class Verb : u8 {
    GET,
    PUT,
    LS,
    HELP,
    QUIT,
};

struct Command {
    Verb        verb;
    std::string arg;     // file name for get/put, empty otherwise
};

// Parse a control frame payload. The verb is matched case-insensitively.
// Throws UnknownCommand for an unknown verb, an empty line, or a known
// verb with the wrong number of arguments.
Command parse_command(const std::string& line);

// Wire form of a command, e.g. "get report.txt"
std::string format_command(const Command& cmd);

const char* verb_str(Verb v);
