#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <backends/backend.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(ConfigTest, Defaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.backend(), "auto");
    EXPECT_EQ(c.threads(), 0);
    EXPECT_TRUE(c.log_file().empty());
    EXPECT_EQ(c.submit().max_attempts, 5);
    EXPECT_EQ(c.submit().retry_delay_ms, 1000);
    EXPECT_EQ(c.poll().interval_ms, 2000);
    EXPECT_EQ(c.poll().pbs_initial_delay_ms, 5000);
    EXPECT_EQ(c.poll().slurm_initial_delay_ms, 2000);
    EXPECT_FALSE(c.poll().pbs_missing_is_complete);
}

TEST(ConfigTest, FullDocument) {
    auto r = Config::parse(R"(
backend: slurm-style
threads: 6
log_file: /tmp/batchq.log
job:
  partition: normal
  time: "12:00:00"
  cores: 2
  memory: 8G
  modules: [gcc, samtools]
submit:
  max_attempts: 3
  retry_delay_ms: 250
poll:
  interval_ms: 500
  pbs_initial_delay_ms: 100
  slurm_initial_delay_ms: 50
  pbs_missing_is_complete: true
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.backend(), "slurm");
    EXPECT_EQ(c.threads(), 6);
    EXPECT_EQ(c.log_file(), "/tmp/batchq.log");
    EXPECT_EQ(c.job_defaults().partition, "normal");
    EXPECT_EQ(c.job_defaults().time, "12:00:00");
    EXPECT_EQ(c.job_defaults().cores, 2);
    EXPECT_EQ(c.job_defaults().memory, "8G");
    EXPECT_EQ(c.job_defaults().modules, (std::vector<std::string>{"gcc", "samtools"}));
    EXPECT_EQ(c.submit().max_attempts, 3);
    EXPECT_EQ(c.submit().retry_delay_ms, 250);
    EXPECT_EQ(c.poll().interval_ms, 500);
    EXPECT_TRUE(c.poll().pbs_missing_is_complete);
}

TEST(ConfigTest, BackendAliasesNormalize) {
    EXPECT_EQ(Config::parse("backend: normal").value.backend(), "local");
    EXPECT_EQ(Config::parse("backend: multiprocessing").value.backend(), "local");
    EXPECT_EQ(Config::parse("backend: torque").value.backend(), "pbs");
    EXPECT_EQ(Config::parse("backend: PBS").value.backend(), "pbs");
    EXPECT_EQ(Config::parse("backend: auto").value.backend(), "auto");
}

TEST(ConfigTest, SingleModuleString) {
    auto r = Config::parse("job:\n  modules: python/3.9\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.job_defaults().modules, (std::vector<std::string>{"python/3.9"}));
}

TEST(ConfigTest, InvalidValuesAreErrors) {
    EXPECT_TRUE(Config::parse("backend: sge").is_err());
    EXPECT_TRUE(Config::parse("threads: -2").is_err());
    EXPECT_TRUE(Config::parse("job:\n  memory: lots\n").is_err());
    EXPECT_TRUE(Config::parse("job:\n  time: soon\n").is_err());
    EXPECT_TRUE(Config::parse("submit:\n  max_attempts: 0\n").is_err());
    EXPECT_TRUE(Config::parse("- a\n- b\n").is_err());
    EXPECT_TRUE(Config::parse("backend: [unclosed").is_err());
}

TEST(ConfigTest, SetBackendValidates) {
    Config c;
    EXPECT_TRUE(c.set_backend("slurm").is_ok());
    EXPECT_EQ(c.backend(), "slurm");
    EXPECT_TRUE(c.set_backend("condor").is_err());
    EXPECT_EQ(c.backend(), "slurm");
}

TEST(ConfigTest, BackendOptionsFromConfig) {
    auto r = Config::parse("threads: 3\nsubmit:\n  max_attempts: 2\n  retry_delay_ms: 10\n"
                           "poll:\n  interval_ms: 20\n  pbs_initial_delay_ms: 30\n");
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto o = BackendOptions::from_config(r.value);
    EXPECT_EQ(o.threads, 3);
    EXPECT_EQ(o.submit_retry.max_attempts, 2);
    EXPECT_EQ(o.submit_retry.delay, std::chrono::milliseconds(10));
    EXPECT_EQ(o.pbs_poll.initial_delay, std::chrono::milliseconds(30));
    EXPECT_EQ(o.pbs_poll.interval, std::chrono::milliseconds(20));
    EXPECT_EQ(o.slurm_poll.initial_delay, std::chrono::milliseconds(2000));
    EXPECT_FALSE(o.runner);
}

class ProjectConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "batchq_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ProjectConfigTest, MissingFileGivesDefaults) {
    EXPECT_FALSE(project_config_exists(test_dir));
    auto r = Config::load_project(test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.backend(), "auto");
}

TEST_F(ProjectConfigTest, ReadsBatchqYaml) {
    std::ofstream(test_dir / "batchq.yaml") << "backend: pbs\njob:\n  partition: long\n";
    EXPECT_TRUE(project_config_exists(test_dir));

    auto r = Config::load_project(test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.backend(), "pbs");
    EXPECT_EQ(r.value.job_defaults().partition, "long");
}

TEST_F(ProjectConfigTest, ErrorNamesTheFile) {
    std::ofstream(test_dir / "batchq.yaml") << "backend: nope\n";
    auto r = Config::load_project(test_dir);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("batchq.yaml"), std::string::npos);
}
