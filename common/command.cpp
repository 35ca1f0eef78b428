// ============================================================
// command.cpp -- Control-channel command parsing
// ============================================================

#include "command.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <vector>

const char* verb_str(Verb v) {
    switch (v) {
        case Verb::GET:  return "get";
        case Verb::PUT:  return "put";
        case Verb::LS:   return "ls";
        case Verb::HELP: return "help";
        case Verb::QUIT: return "quit";
    }
    return "?";
}

static std::string lowercase(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }
    return s;
}

Command parse_command(const std::string& line) {
    std::vector<std::string> tokens = utils::split_ws(line);
    if (tokens.empty()) {
        throw UnknownCommand("empty command");
    }

    std::string verb = lowercase(tokens[0]);
    size_t nargs = tokens.size() - 1;

    if (verb == "get" || verb == "put") {
        if (nargs != 1) {
            throw UnknownCommand("usage: " + verb + " <file name>");
        }
        return Command{verb == "get" ? Verb::GET : Verb::PUT, tokens[1]};
    }
    if (verb == "ls") {
        if (nargs != 0) throw UnknownCommand("usage: ls");
        return Command{Verb::LS, ""};
    }
    if (verb == "help") {
        if (nargs != 0) throw UnknownCommand("usage: help");
        return Command{Verb::HELP, ""};
    }
    // quit always ends the session, trailing words or not
    if (verb == "quit") {
        return Command{Verb::QUIT, ""};
    }
    throw UnknownCommand("unknown command '" + line + "'");
}

std::string format_command(const Command& cmd) {
    std::string out = verb_str(cmd.verb);
    if (!cmd.arg.empty()) {
        out += ' ';
        out += cmd.arg;
    }
    return out;
}
