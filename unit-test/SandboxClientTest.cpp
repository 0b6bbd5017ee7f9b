#include <thread>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "sandbox/client.hpp"
#include "test/fake_sandbox.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace judgecore;
using namespace judgecore::sandbox;

class SandboxClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = test::test_config().sandbox;
        client = make_unique<sandbox_client>(box, config);
        limits.cpu_time = 1000;
        limits.wall_time = 2000;
        limits.memory = 64 << 20;
        limits.output = 1 << 20;
        limits.processes = 1;
    }

    run_result run_echo(const string &input) {
        staged_file program = client->stage("echo", token);
        executable echo{{"foo"}, "foo", program.ref()};
        return client->execute(echo, {}, file_ref::memory(input), limits, {}, capture_options(), token);
    }

    test::fake_sandbox box;
    sandbox_config config;
    unique_ptr<sandbox_client> client;
    cancellation_token token;
    resource_limits limits;
};

TEST_F(SandboxClientTest, ExecuteEcho) {
    run_result result = run_echo("hello");
    EXPECT_EQ(result.status, sandbox_status::ACCEPTED);
    EXPECT_EQ(result.file("stdout"), "hello");
    ASSERT_EQ(box.requests().size(), 1u);

    run_request request = box.requests()[0];
    EXPECT_EQ(request.env, config.env);
    EXPECT_EQ(request.stderr_limit, config.stderr_limit);
    EXPECT_EQ(request.limits, limits);
    EXPECT_EQ(request.copy_in.count("foo"), 1u);
}

TEST_F(SandboxClientTest, RetriesUnavailableSandbox) {
    box.fail_next(make_exception_ptr(sandbox_unavailable("connection refused")), 2);
    run_result result = run_echo("hello");
    EXPECT_EQ(result.file("stdout"), "hello");
    EXPECT_EQ(box.executions(), 3u);
}

TEST_F(SandboxClientTest, GivesUpAfterMaxAttempts) {
    box.fail_next(make_exception_ptr(sandbox_unavailable("connection refused")), 3);
    EXPECT_THROW(run_echo("hello"), sandbox_unavailable);
    EXPECT_EQ(box.executions(), 3u);
}

TEST_F(SandboxClientTest, ExhaustedTimeoutPropagates) {
    box.fail_next(make_exception_ptr(sandbox_timeout("deadline exceeded")), 3);
    EXPECT_THROW(run_echo("hello"), sandbox_timeout);
    EXPECT_EQ(box.executions(), 3u);
}

TEST_F(SandboxClientTest, RejectedRequestIsNotRetried) {
    box.fail_next(make_exception_ptr(sandbox_rejected("bad request")), 1);
    EXPECT_THROW(run_echo("hello"), sandbox_rejected);
    EXPECT_EQ(box.executions(), 1u);
}

TEST_F(SandboxClientTest, UnresolvedLimitsAreRejectedLocally) {
    limits.memory = -1;
    EXPECT_THROW(run_echo("hello"), sandbox_rejected);
    EXPECT_EQ(box.executions(), 0u);
}

TEST_F(SandboxClientTest, ProgramMustBeStaged) {
    executable program{{"foo"}, "foo", file_ref::memory("echo")};
    EXPECT_THROW(client->execute(program, {}, nullopt, limits, {}, capture_options(), token), sandbox_rejected);
    EXPECT_EQ(box.executions(), 0u);
}

TEST_F(SandboxClientTest, CancelledTokenStopsBeforeDispatch) {
    token.cancel();
    staged_file program;
    EXPECT_THROW(program = client->stage("echo", token), cancelled_error);
    EXPECT_EQ(box.live_files(), 0u);
}

TEST_F(SandboxClientTest, CancellationInterruptsBackoff) {
    config.backoff = 60000;
    client = make_unique<sandbox_client>(box, config);
    staged_file program = client->stage("echo", token);
    executable echo{{"foo"}, "foo", program.ref()};
    box.fail_next(make_exception_ptr(sandbox_unavailable("connection refused")), 1);

    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(50));
        token.cancel();
    });
    auto begin = chrono::steady_clock::now();
    EXPECT_THROW(client->execute(echo, {}, nullopt, limits, {}, capture_options(), token), cancelled_error);
    canceller.join();
    EXPECT_LT(chrono::steady_clock::now() - begin, chrono::seconds(10));
    EXPECT_EQ(box.executions(), 1u);
}

TEST_F(SandboxClientTest, StagedFileIsDeletedOnDestruction) {
    {
        staged_file first = client->stage("a", token);
        staged_file second = client->stage("b", token);
        EXPECT_EQ(box.live_files(), 2u);
        EXPECT_EQ(client->fetch(first.id(), token), "a");

        staged_file moved = move(first);
        EXPECT_TRUE(first.empty());
        second.reset();
        EXPECT_EQ(box.live_files(), 1u);
    }
    EXPECT_EQ(box.live_files(), 0u);
}

TEST_F(SandboxClientTest, RemoveFailureIsNotFatal) {
    EXPECT_NO_THROW(client->remove("file-missing"));
}
