#include "cli/cli_parser.hpp"

#include <gtest/gtest.h>

using rkpi2::CliParser;

namespace {

CliParser parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    static char prog[] = "rkpi2_mux";
    argv.push_back(prog);
    for (auto& a : args) argv.push_back(&a[0]);
    CliParser cli;
    cli.parse(static_cast<int>(argv.size()), argv.data());
    return cli;
}

}  // namespace

TEST(CliParser, KeyValueAndFlags) {
    auto cli = parse({"--in", "a.wav", "--raw", "--out=b.rkp", "--level", "5"});
    EXPECT_EQ(cli.get("in"), "a.wav");
    EXPECT_EQ(cli.get("out"), "b.rkp");
    EXPECT_EQ(cli.get("raw"), "true");
    EXPECT_TRUE(cli.has("level"));
    EXPECT_FALSE(cli.has("format"));
    EXPECT_EQ(cli.get("format", "int16"), "int16");
}

TEST(CliParser, TrailingFlag) {
    auto cli = parse({"--in", "x", "--info"});
    EXPECT_EQ(cli.get("info"), "true");
}

TEST(CliParser, IntegerRange) {
    auto cli = parse({"--level", "21", "--rate", "44k", "--channels", "0"});
    EXPECT_EQ(cli.get_int("level", 1, 21), 21);
    EXPECT_THROW(cli.get_int("rate", 1, 1000000), std::runtime_error);
    EXPECT_THROW(cli.get_int("channels", 1, 8), std::runtime_error);
    EXPECT_THROW(cli.get_int("missing", 0, 1), std::runtime_error);
}
