#include <gtest/gtest.h>
#include <command_args.h>
#include <string>
#include <vector>

namespace {
    // Keeps the argument strings alive for the duration of a parse
    class Argv {
    public:
        Argv(std::vector<std::string> args) : strs(args) {
            strs.insert(strs.begin(), "synthpp");
            for (auto& s : strs) { ptrs.push_back(&s[0]); }
        }

        int argc() { return ptrs.size(); }
        char** argv() { return ptrs.data(); }

    private:
        std::vector<std::string> strs;
        std::vector<char*> ptrs;
    };

    int parse(CommandArgsParser& parser, std::vector<std::string> args) {
        Argv a(args);
        return parser.parse(a.argc(), a.argv());
    }
}

TEST(CommandArgs, Defaults) {
    CommandArgsParser args;
    args.defineAll();
    ASSERT_EQ(parse(args, {}), 0);
    EXPECT_FALSE(args["help"].b());
    EXPECT_FALSE(args["ssc"].b());
    EXPECT_EQ(args["differential"].i(), 0);
    EXPECT_DOUBLE_EQ(args["amp"].d(), 0.015);
    EXPECT_EQ(args["mode"].s(), "DOWN");
    EXPECT_EQ(args["address"].i(), 0x60);
    EXPECT_FALSE(args["amp"].provided());
    EXPECT_FALSE(args.hasPositional("fout0"));
}

TEST(CommandArgs, FullCommandLine) {
    CommandArgsParser args;
    args.defineAll();
    ASSERT_EQ(parse(args, { "100", "12.288M", "-d", "1", "--ssc", "-a", "0.02", "-m", "center", "--address", "0x61" }), 0);
    EXPECT_EQ(args.positional("fout0"), "100");
    EXPECT_EQ(args.positional("fout2"), "12.288M");
    EXPECT_EQ(args["differential"].i(), 1);
    EXPECT_TRUE(args["ssc"].b());
    EXPECT_TRUE(args["amp"].provided());
    EXPECT_DOUBLE_EQ(args["amp"].d(), 0.02);
    EXPECT_EQ(args["mode"].s(), "center");
    EXPECT_EQ(args["address"].i(), 0x61);
}

TEST(CommandArgs, NegativeNumberIsPositional) {
    CommandArgsParser args;
    args.defineAll();
    ASSERT_EQ(parse(args, { "-5" }), 0);
    EXPECT_EQ(args.positional("fout0"), "-5");
}

TEST(CommandArgs, Errors) {
    CommandArgsParser args;
    args.defineAll();
    EXPECT_LT(parse(args, { "--foo" }), 0);
    EXPECT_LT(parse(args, { "-x" }), 0);
    EXPECT_LT(parse(args, { "-d" }), 0);
    EXPECT_LT(parse(args, { "-d", "one" }), 0);
    EXPECT_LT(parse(args, { "-a", "0.01x" }), 0);
    EXPECT_LT(parse(args, { "1", "2", "3" }), 0);
}

TEST(CommandArgs, Access) {
    CommandArgsParser args;
    args.defineAll();
    ASSERT_EQ(parse(args, { "10" }), 0);
    EXPECT_THROW(args["nope"], std::runtime_error);
    EXPECT_THROW(args["mode"].i(), std::runtime_error);
    EXPECT_THROW(args["differential"].s(), std::runtime_error);
    EXPECT_THROW(args.positional("fout2"), std::runtime_error);
}

TEST(CommandArgs, BoolValues) {
    CommandArgsParser args;
    args.define('x', "flag", "Test flag", false);
    ASSERT_EQ(parse(args, { "-x", "on" }), 0);
    EXPECT_TRUE(args["flag"].b());
    ASSERT_EQ(parse(args, { "--flag", "FALSE" }), 0);
    EXPECT_FALSE(args["flag"].b());
    EXPECT_LT(parse(args, { "--flag", "maybe" }), 0);
}
