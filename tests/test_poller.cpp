#include <gtest/gtest.h>
#include <backends/pbs_backend.hpp>
#include <backends/slurm_backend.hpp>
#include <core/errors.hpp>
#include "fake_runner.hpp"

using std::chrono::milliseconds;

static const std::string QSTAT_HEAD =
    "\n"
    "head.cluster.edu:\n"
    "                                                                                  Req'd       Req'd       Elap\n"
    "Job ID                  Username    Queue    Jobname          SessID  NDS   TSK   Memory      Time    S   Time\n"
    "----------------------- ----------- -------- ---------------- ------ ----- ------ --------- --------- - ---------\n";

static std::string qstat_row(const std::string& id, const std::string& state) {
    return id + ".head.cluster.edu     alice       batch    job" + id +
           "              12345     1      1       --   02:00:00 " + state + "  00:01:00\n";
}

class PollerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();
    std::shared_ptr<FakeSleeper> sleeper = std::make_shared<FakeSleeper>();

    BackendOptions options() { return fake_options<BackendOptions>(runner, sleeper); }

    static std::vector<JobHandle> handles(BackendKind kind, std::initializer_list<const char*> ids) {
        std::vector<JobHandle> out;
        for (const char* id : ids) out.push_back(JobHandle::scheduler(kind, id));
        return out;
    }
};

// ── Parsers ─────────────────────────────────────────────────

TEST(QstatParse, ReadsStateColumn) {
    auto states = parse_qstat_table(QSTAT_HEAD + qstat_row("11", "R") + qstat_row("12", "Q"));
    ASSERT_EQ(states.size(), 2u);
    EXPECT_EQ(states["11"], "R");
    EXPECT_EQ(states["12"], "Q");
}

TEST(QstatParse, EmptyOutputIsEmptyTable) {
    EXPECT_TRUE(parse_qstat_table("").empty());
    EXPECT_TRUE(parse_qstat_table("\n\n").empty());
}

TEST(QstatParse, HeaderOnlyIsEmptyTable) {
    EXPECT_TRUE(parse_qstat_table(QSTAT_HEAD).empty());
}

TEST(QstatParse, UnexpectedHeaderIsConfigError) {
    std::string bad =
        "\n"
        "head.cluster.edu:\n"
        "\n"
        "Job id            Name             User            Time Use S Queue\n"
        "----------------  ---------------- --------------- -------- - -----\n";
    EXPECT_THROW(parse_qstat_table(bad), ConfigError);
    EXPECT_THROW(parse_qstat_table("garbage\n"), ConfigError);
}

TEST(SqueueParse, IdAndState) {
    auto states = parse_squeue_states("1,R\n2,PD\n'3,CG'\n\n");
    ASSERT_EQ(states.size(), 3u);
    EXPECT_EQ(states["1"], "R");
    EXPECT_EQ(states["2"], "PD");
    EXPECT_EQ(states["3"], "CG");
}

// ── Slurm ───────────────────────────────────────────────────

TEST_F(PollerTest, SlurmWaitsUntilJobsLeaveQueue) {
    runner->push(0, "1,R\n2,PD\n");
    runner->push(0, "2,R\n");
    runner->push(0, "");
    SlurmBackend backend(options());

    backend.wait(handles(BackendKind::Slurm, {"1", "2"}));

    ASSERT_EQ(runner->calls.size(), 3u);
    EXPECT_EQ(runner->calls[0].program, "squeue");
    EXPECT_EQ(runner->calls[0].args, (std::vector<std::string>{"-h", "-o", "%A,%t"}));

    std::vector<milliseconds> expected = {milliseconds(2000), milliseconds(2000), milliseconds(2000)};
    EXPECT_EQ(sleeper->sleeps, expected);
}

TEST_F(PollerTest, SlurmTerminalStatesFinish) {
    runner->push(0, "5,CD\n6,F\n7,R\n");
    runner->push(0, "7,CD\n");
    SlurmBackend backend(options());

    backend.wait(handles(BackendKind::Slurm, {"5", "6", "7"}));
    EXPECT_EQ(runner->calls.size(), 2u);
}

TEST_F(PollerTest, SlurmIgnoresOtherUsersJobs) {
    runner->push(0, "900,R\n901,PD\n");
    SlurmBackend backend(options());

    backend.wait(handles(BackendKind::Slurm, {"4"}));
    EXPECT_EQ(runner->calls.size(), 1u);
}

TEST_F(PollerTest, SlurmQueryFailureIsQueryError) {
    runner->push(1, "", "slurm_load_jobs error: Unable to contact slurm controller");
    SlurmBackend backend(options());

    EXPECT_THROW(backend.wait(handles(BackendKind::Slurm, {"1"})), QueryError);
    EXPECT_EQ(runner->calls.size(), 1u);
}

TEST_F(PollerTest, EmptyHandleListReturnsImmediately) {
    SlurmBackend backend(options());
    backend.wait({});
    EXPECT_TRUE(runner->calls.empty());
    EXPECT_TRUE(sleeper->sleeps.empty());
}

TEST_F(PollerTest, WrongBackendHandleIsConfigError) {
    SlurmBackend backend(options());
    EXPECT_THROW(backend.wait(handles(BackendKind::PBS, {"1"})), ConfigError);
    EXPECT_TRUE(runner->calls.empty());
}

// ── PBS ─────────────────────────────────────────────────────

TEST_F(PollerTest, PbsWaitsForCompletedState) {
    runner->push(0, QSTAT_HEAD + qstat_row("10", "R") + qstat_row("11", "Q"));
    runner->push(0, QSTAT_HEAD + qstat_row("10", "C") + qstat_row("11", "R"));
    runner->push(0, QSTAT_HEAD + qstat_row("10", "C") + qstat_row("11", "C"));
    PBSBackend backend(options());

    backend.wait(handles(BackendKind::PBS, {"10", "11"}));

    ASSERT_EQ(runner->calls.size(), 3u);
    EXPECT_EQ(runner->calls[0].program, "qstat");
    EXPECT_EQ(runner->calls[0].args, (std::vector<std::string>{"-a"}));
    ASSERT_EQ(sleeper->sleeps.size(), 3u);
    EXPECT_EQ(sleeper->sleeps[0], milliseconds(5000));
}

TEST_F(PollerTest, PbsMissingJobStaysTracked) {
    runner->push(0, QSTAT_HEAD + qstat_row("10", "R"));
    runner->push(0, QSTAT_HEAD + qstat_row("10", "R"));
    runner->push(0, QSTAT_HEAD + qstat_row("10", "C") + qstat_row("20", "C"));
    PBSBackend backend(options());

    // 20 is absent from the first two listings and must not count as done
    backend.wait(handles(BackendKind::PBS, {"20"}));
    EXPECT_EQ(runner->calls.size(), 3u);
}

TEST_F(PollerTest, PbsMissingJobCanCountAsComplete) {
    runner->push(0, QSTAT_HEAD + qstat_row("10", "R"));
    auto o = options();
    o.pbs_missing_is_complete = true;
    PBSBackend backend(o);

    backend.wait(handles(BackendKind::PBS, {"20"}));
    EXPECT_EQ(runner->calls.size(), 1u);
}

TEST_F(PollerTest, PbsBadHeaderIsConfigErrorAfterOneQuery) {
    runner->push(0, "\nhead:\n\nJob id  Name  User  Time Use  S  Queue\n-----\n");
    PBSBackend backend(options());

    EXPECT_THROW(backend.wait(handles(BackendKind::PBS, {"1"})), ConfigError);
    EXPECT_EQ(runner->calls.size(), 1u);
}

TEST_F(PollerTest, PbsQueryFailureIsQueryError) {
    runner->push(2, "", "qstat: cannot connect to server");
    PBSBackend backend(options());

    EXPECT_THROW(backend.wait(handles(BackendKind::PBS, {"1"})), QueryError);
}

TEST_F(PollerTest, CustomPollPolicy) {
    runner->push(0, QSTAT_HEAD + qstat_row("3", "R"));
    runner->push(0, QSTAT_HEAD + qstat_row("3", "C"));
    auto o = options();
    o.pbs_poll = {milliseconds(0), milliseconds(50)};
    PBSBackend backend(o);

    backend.wait(handles(BackendKind::PBS, {"3"}));
    EXPECT_EQ(sleeper->sleeps, (std::vector<milliseconds>{milliseconds(0), milliseconds(50)}));
}
