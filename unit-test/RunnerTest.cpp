#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/runner.hpp"
#include "test/fake_sandbox.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace judgecore;
using namespace judgecore::sandbox;

class RunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = test::test_config();
        client = make_unique<sandbox_client>(box, config.sandbox);
        limits.cpu_time = 1000;
        limits.wall_time = 2000;
        limits.memory = 64 << 20;
        limits.output = 1 << 20;
        limits.processes = 1;

        program_file = client->stage("echo", token);
        program = executable{{"foo"}, "foo", program_file.ref()};
        checker_file = client->stage("checker", token);
        checker = executable{{"foo"}, "foo", checker_file.ref()};
    }

    staged_test make_test(const string &input, const string &answer, bool special = false) {
        staged_test test;
        test.id = 0;
        test.input = client->stage(input, token);
        test.answer = answer;
        if (special) test.answer_file = client->stage(answer, token);
        test.limits = limits;
        return test;
    }

    test::fake_sandbox box;
    core_config config;
    unique_ptr<sandbox_client> client;
    cancellation_token token;
    resource_limits limits;
    staged_file program_file, checker_file;
    executable program, checker;
};

TEST_F(RunnerTest, ClassifyPrefersLimitsOverRuntimeError) {
    string message;
    run_result result;
    result.status = sandbox_status::SIGNALLED;
    result.exit_status = 9;
    result.cpu_time = 1500;
    EXPECT_EQ(test_case_runner::classify(result, limits, message), status::TIME_LIMIT_EXCEEDED);

    result.cpu_time = 10;
    result.memory = 128 << 20;
    EXPECT_EQ(test_case_runner::classify(result, limits, message), status::MEMORY_LIMIT_EXCEEDED);

    result.memory = 1 << 20;
    EXPECT_EQ(test_case_runner::classify(result, limits, message), status::RUNTIME_ERROR);
    EXPECT_EQ(message, "killed by signal 9");
}

TEST_F(RunnerTest, ClassifySandboxStatus) {
    string message;
    run_result result;
    result.status = sandbox_status::TIME_LIMIT_EXCEEDED;
    EXPECT_EQ(test_case_runner::classify(result, limits, message), status::TIME_LIMIT_EXCEEDED);
    result.status = sandbox_status::MEMORY_LIMIT_EXCEEDED;
    EXPECT_EQ(test_case_runner::classify(result, limits, message), status::MEMORY_LIMIT_EXCEEDED);
    result.status = sandbox_status::OUTPUT_LIMIT_EXCEEDED;
    EXPECT_EQ(test_case_runner::classify(result, limits, message), status::OUTPUT_LIMIT_EXCEEDED);
    result.status = sandbox_status::FILE_ERROR;
    EXPECT_EQ(test_case_runner::classify(result, limits, message), status::SYSTEM_ERROR);
    result.status = sandbox_status::DANGEROUS_SYSCALL;
    EXPECT_EQ(test_case_runner::classify(result, limits, message), status::RUNTIME_ERROR);
    result.status = sandbox_status::NONZERO_EXIT_STATUS;
    result.exit_status = 2;
    EXPECT_EQ(test_case_runner::classify(result, limits, message), status::RUNTIME_ERROR);
    EXPECT_EQ(message, "exit code 2");
    result.status = sandbox_status::ACCEPTED;
    EXPECT_EQ(test_case_runner::classify(result, limits, message), nullopt);
}

TEST_F(RunnerTest, ClassifyOversizedOutput) {
    string message;
    run_result result;
    result.status = sandbox_status::ACCEPTED;
    result.files["stdout"] = string(limits.output + 1, 'a');
    EXPECT_EQ(test_case_runner::classify(result, limits, message), status::OUTPUT_LIMIT_EXCEEDED);
}

TEST_F(RunnerTest, AcceptedAndWrongAnswer) {
    test_case_runner runner(*client, limits);
    staged_test accepted = make_test("1 2\n", "1 2\n");
    test_verdict verdict = runner.run(program, accepted, compare_mode::EXACT, nullptr, token);
    EXPECT_EQ(verdict.status, status::ACCEPTED);
    EXPECT_EQ(verdict.score, 1);
    EXPECT_EQ(verdict.cpu_time, 10);

    staged_test wrong = make_test("!wrong", "!wrong");
    EXPECT_EQ(runner.run(program, wrong, compare_mode::WHITESPACE, nullptr, token).status, status::WRONG_ANSWER);
}

TEST_F(RunnerTest, WhitespaceModeToleratesTrailingBlanks) {
    test_case_runner runner(*client, limits);
    staged_test test = make_test("1 2\n", "1 2   \n\n");
    EXPECT_EQ(runner.run(program, test, compare_mode::WHITESPACE, nullptr, token).status, status::ACCEPTED);
    EXPECT_EQ(runner.run(program, test, compare_mode::EXACT, nullptr, token).status, status::WRONG_ANSWER);
}

TEST_F(RunnerTest, LimitViolationsSkipComparison) {
    test_case_runner runner(*client, limits);
    EXPECT_EQ(runner.run(program, make_test("!tle", ""), compare_mode::EXACT, nullptr, token).status, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(runner.run(program, make_test("!mle", ""), compare_mode::EXACT, nullptr, token).status, status::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(runner.run(program, make_test("!ole", ""), compare_mode::EXACT, nullptr, token).status, status::OUTPUT_LIMIT_EXCEEDED);
    EXPECT_EQ(runner.run(program, make_test("!crash", ""), compare_mode::EXACT, nullptr, token).status, status::RUNTIME_ERROR);
    EXPECT_EQ(runner.run(program, make_test("!internal", ""), compare_mode::EXACT, nullptr, token).status, status::SYSTEM_ERROR);
}

TEST_F(RunnerTest, ExhaustedSandboxTimeoutIsSystemError) {
    box.fail_next(make_exception_ptr(sandbox_timeout("too slow")), config.sandbox.max_attempts);
    test_case_runner runner(*client, limits);
    test_verdict verdict = runner.run(program, make_test("1", "1"), compare_mode::EXACT, nullptr, token);
    EXPECT_EQ(verdict.status, status::SYSTEM_ERROR);
    EXPECT_EQ(verdict.message, "too slow");
}

TEST_F(RunnerTest, UnavailableSandboxPropagates) {
    box.fail_next(make_exception_ptr(sandbox_unavailable("connection refused")), config.sandbox.max_attempts);
    test_case_runner runner(*client, limits);
    staged_test test = make_test("1", "1");
    EXPECT_THROW(runner.run(program, test, compare_mode::EXACT, nullptr, token), sandbox_unavailable);
}

TEST_F(RunnerTest, SpecialJudge) {
    test_case_runner runner(*client, limits);
    staged_test accepted = make_test("42", "42", true);
    test_verdict verdict = runner.run(program, accepted, compare_mode::SPECIAL_JUDGE, &checker, token);
    EXPECT_EQ(verdict.status, status::ACCEPTED);
    EXPECT_EQ(verdict.message, "ok accepted");

    staged_test wrong = make_test("42", "43", true);
    EXPECT_EQ(runner.run(program, wrong, compare_mode::SPECIAL_JUDGE, &checker, token).status, status::WRONG_ANSWER);

    staged_test partial = make_test("42", "points 0.5", true);
    verdict = runner.run(program, partial, compare_mode::SPECIAL_JUDGE, &checker, token);
    EXPECT_EQ(verdict.status, status::PARTIAL_CORRECT);
    EXPECT_EQ(verdict.score, boost::rational<int>(1, 2));
}

TEST_F(RunnerTest, CapturedOutputIsDeletedAfterSpecialJudge) {
    test_case_runner runner(*client, limits);
    staged_test test = make_test("42", "42", true);
    size_t before = box.live_files();
    runner.run(program, test, compare_mode::SPECIAL_JUDGE, &checker, token);
    EXPECT_EQ(box.live_files(), before);
}
