// ============================================================
// test_command.cpp -- Control-channel command parsing
// ============================================================

#include "common/command.hpp"
#include "common/errors.hpp"
#include <gtest/gtest.h>

TEST(ParseCommand, GetAndPutTakeOneFileName) {
    Command g = parse_command("get report.txt");
    EXPECT_EQ(g.verb, Verb::GET);
    EXPECT_EQ(g.arg, "report.txt");

    Command p = parse_command("put data.bin");
    EXPECT_EQ(p.verb, Verb::PUT);
    EXPECT_EQ(p.arg, "data.bin");
}

TEST(ParseCommand, NoArgumentVerbs) {
    EXPECT_EQ(parse_command("ls").verb, Verb::LS);
    EXPECT_EQ(parse_command("help").verb, Verb::HELP);
    EXPECT_EQ(parse_command("quit").verb, Verb::QUIT);
}

TEST(ParseCommand, VerbIsCaseInsensitive) {
    EXPECT_EQ(parse_command("LS").verb, Verb::LS);
    Command g = parse_command("Get Report.TXT");
    EXPECT_EQ(g.verb, Verb::GET);
    EXPECT_EQ(g.arg, "Report.TXT");
}

TEST(ParseCommand, ExtraWhitespaceIsIgnored) {
    Command g = parse_command("  get\t  a.txt  ");
    EXPECT_EQ(g.verb, Verb::GET);
    EXPECT_EQ(g.arg, "a.txt");
}

TEST(ParseCommand, QuitIgnoresTrailingWords) {
    EXPECT_EQ(parse_command("quit now please").verb, Verb::QUIT);
}

TEST(ParseCommand, WrongArgumentCountIsRejected) {
    EXPECT_THROW(parse_command("get"), UnknownCommand);
    EXPECT_THROW(parse_command("put"), UnknownCommand);
    EXPECT_THROW(parse_command("get a b"), UnknownCommand);
    EXPECT_THROW(parse_command("ls extra"), UnknownCommand);
    EXPECT_THROW(parse_command("help me"), UnknownCommand);
}

TEST(ParseCommand, UnknownAndEmptyLinesAreRejected) {
    EXPECT_THROW(parse_command("frobnicate"), UnknownCommand);
    EXPECT_THROW(parse_command(""), UnknownCommand);
    EXPECT_THROW(parse_command("   "), UnknownCommand);
}

TEST(ParseCommand, ErrorMessageNamesTheProblem) {
    try {
        parse_command("get");
        FAIL() << "expected UnknownCommand";
    } catch (const UnknownCommand& e) {
        EXPECT_EQ(std::string(e.what()), "usage: get <file name>");
    }
    try {
        parse_command("frobnicate x");
        FAIL() << "expected UnknownCommand";
    } catch (const UnknownCommand& e) {
        EXPECT_EQ(std::string(e.what()), "unknown command 'frobnicate x'");
    }
}

TEST(FormatCommand, ProducesWireForm) {
    EXPECT_EQ(format_command(Command{Verb::GET, "a.txt"}), "get a.txt");
    EXPECT_EQ(format_command(Command{Verb::LS, ""}), "ls");
    EXPECT_STREQ(verb_str(Verb::PUT), "put");
}
