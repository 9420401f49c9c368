#include <gtest/gtest.h>
#include <cli/cli_options.hpp>
#include <core/utils.hpp>

static Result<CliOptions> parse(std::vector<std::string> args) {
    return parse_cli_args(args);
}

TEST(CliOptions, CommandAndPositionals) {
    auto r = parse({"wait", "12", "13"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.command, "wait");
    EXPECT_EQ(r.value.positional, (std::vector<std::string>{"12", "13"}));
}

TEST(CliOptions, JobOptionsAndCommand) {
    auto r = parse({"submit", "-n", "align", "--time", "04:00:00", "-c", "8", "--mem=16G",
                    "-p", "normal", "-d", "out", "--module", "bwa", "--module=samtools",
                    "--", "bwa", "mem", "ref.fa", "r1.fq"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& o = r.value;

    EXPECT_EQ(o.command, "submit");
    EXPECT_EQ(o.name, "align");
    EXPECT_EQ(o.time, "04:00:00");
    EXPECT_EQ(o.cores, 8);
    EXPECT_EQ(o.memory, "16G");
    EXPECT_EQ(o.partition, "normal");
    EXPECT_EQ(o.dir, "out");
    EXPECT_EQ(o.modules, (std::vector<std::string>{"bwa", "samtools"}));
    EXPECT_EQ(o.job_command, "bwa mem ref.fa r1.fq");
}

TEST(CliOptions, OptionsAfterDoubleDashBelongToJob) {
    auto r = parse({"run", "-n", "x", "--", "ls", "-la", "--color"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.job_command, "ls -la --color");
}

TEST(CliOptions, JobCommandKeepsArgumentBoundaries) {
    auto r = parse({"run", "-n", "x", "--", "bash", "-c", "echo a; exit 3"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.job_command, "bash -c 'echo a; exit 3'");
}

TEST(CliOptions, SingleWordJobCommandIsVerbatim) {
    auto r = parse({"run", "-n", "x", "--", "sort reads.txt | uniq -c > counts.txt"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.job_command, "sort reads.txt | uniq -c > counts.txt");
}

TEST(CliOptions, AfterIsRepeatableAndCommaSeparated) {
    auto r = parse({"submit", "--after", "1,2", "--after=3", "--", "true"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.after, (std::vector<std::string>{"1", "2", "3"}));
}

TEST(CliOptions, GlobalOptions) {
    auto r = parse({"-b", "slurm", "--threads", "4", "--config-dir", "/proj", "detect"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.command, "detect");
    EXPECT_EQ(r.value.backend, "slurm");
    EXPECT_EQ(r.value.threads, 4);
    EXPECT_EQ(r.value.config_dir, "/proj");
}

TEST(CliOptions, Defaults) {
    auto r = parse({"script"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.threads, -1);
    EXPECT_EQ(r.value.cores, 0);
    EXPECT_TRUE(r.value.backend.empty());
    EXPECT_FALSE(r.value.help);
}

TEST(CliOptions, HelpAndVersion) {
    EXPECT_TRUE(parse({"--help"}).value.help);
    EXPECT_TRUE(parse({"-h"}).value.help);
    EXPECT_TRUE(parse({"--version"}).value.version);
}

TEST(CliOptions, Errors) {
    EXPECT_TRUE(parse({"submit", "--name"}).is_err());
    EXPECT_TRUE(parse({"submit", "--cores", "many"}).is_err());
    EXPECT_TRUE(parse({"submit", "--cores=-1"}).is_err());
    EXPECT_TRUE(parse({"submit", "--threads", "2x"}).is_err());
    EXPECT_TRUE(parse({"submit", "--frobnicate", "1"}).is_err());
}

// ── shell_quote ─────────────────────────────────────────────

TEST(ShellQuote, SafeWordsUnchanged) {
    EXPECT_EQ(shell_quote("ref.fa"), "ref.fa");
    EXPECT_EQ(shell_quote("/data/run-1/out_2"), "/data/run-1/out_2");
    EXPECT_EQ(shell_quote("--mem=4G"), "--mem=4G");
}

TEST(ShellQuote, OtherWordsSingleQuoted) {
    EXPECT_EQ(shell_quote(""), "''");
    EXPECT_EQ(shell_quote("my dir"), "'my dir'");
    EXPECT_EQ(shell_quote("$HOME"), "'$HOME'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}
