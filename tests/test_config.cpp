/*
 * Config and command line tests - TPipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <tpipe/config.hpp>
#include <tpipe/error.hpp>
#include <tpipe/help.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tpipe;

TEST(ConfigFile, ReadsKnownKeys) {
    auto p = std::filesystem::temp_directory_path() / "tpipe_test_rc";
    {
        std::ofstream out(p);
        out << "# defaults\n nocase = true\nskip_err=on\ncolor=0\nunknown=1\nnoequals\n";
    }
    Config cfg;
    load_config_file(p.string(), cfg);
    EXPECT_TRUE(cfg.nocase);
    EXPECT_TRUE(cfg.skip_err);
    EXPECT_FALSE(cfg.color);
    EXPECT_FALSE(cfg.verbose);
    std::filesystem::remove(p);
}

TEST(ConfigFile, MissingFileKeepsDefaults) {
    Config cfg;
    load_config_file("/nonexistent/tpipe/rc", cfg);
    EXPECT_FALSE(cfg.nocase);
    EXPECT_TRUE(cfg.color);
}

TEST(CommandLine, OptionsThenPipeline) {
    auto cl = parse_command_line({"-v", "--nocase", "-s", ":gen", "-5,5", "-d"}, Config{});
    EXPECT_TRUE(cl.config.verbose);
    EXPECT_TRUE(cl.config.nocase);
    EXPECT_TRUE(cl.config.skip_err);
    EXPECT_FALSE(cl.config.dry_run); // options stop at the first pipeline word
    EXPECT_EQ(cl.pipeline_args, (std::vector<std::string>{":gen", "-5,5", "-d"}));
}

TEST(CommandLine, BaseConfigIsKept) {
    Config base;
    base.nocase = true;
    auto cl = parse_command_line({":in"}, base);
    EXPECT_TRUE(cl.config.nocase);
}

TEST(CommandLine, Eval) {
    auto cl = parse_command_line({"-e", ":gen 1,3 :join ,"}, Config{});
    ASSERT_TRUE(cl.eval);
    EXPECT_EQ(*cl.eval, ":gen 1,3 :join ,");
    EXPECT_TRUE(cl.pipeline_args.empty());
}

TEST(CommandLine, Errors) {
    try {
        parse_command_line({"--eval"}, Config{});
        FAIL();
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::MissingArg);
    }
    EXPECT_THROW(parse_command_line({"-e", ":in", ":upper"}, Config{}), Error);
    EXPECT_THROW(parse_command_line({"--bogus"}, Config{}), Error);
}

TEST(CommandLine, HelpAndVersion) {
    auto h = parse_command_line({"-h", "cond"}, Config{});
    EXPECT_TRUE(h.show_help);
    EXPECT_EQ(h.help_topic, "cond");
    EXPECT_TRUE(parse_command_line({"--version"}, Config{}).show_version);
}

TEST(Help, Topics) {
    std::ostringstream all, cond, bad;
    EXPECT_TRUE(print_help(all, ""));
    EXPECT_NE(all.str().find("<exit codes>"), std::string::npos);
    EXPECT_NE(all.str().find("InvalidPositiveIntArg"), std::string::npos);
    EXPECT_TRUE(print_help(cond, "COND"));
    EXPECT_NE(cond.str().find("<cond>"), std::string::npos);
    EXPECT_EQ(cond.str().find("<op_cmd>"), std::string::npos);
    EXPECT_FALSE(print_help(bad, "nope"));
    EXPECT_NE(bad.str().find("Usage: tpipe"), std::string::npos);
}
