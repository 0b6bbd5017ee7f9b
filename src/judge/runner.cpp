#include "judge/runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/io_utils.hpp"
#include "judge/checker.hpp"

namespace judgecore {
using namespace std;
using namespace judgecore::sandbox;

test_case_runner::test_case_runner(sandbox_client &client, const resource_limits &checker_limits)
    : client(client), checker_limits(checker_limits) {}

optional<status> test_case_runner::classify(const run_result &result, const resource_limits &limits, string &message) {
    switch (result.status) {
        case sandbox_status::TIME_LIMIT_EXCEEDED:
            return status::TIME_LIMIT_EXCEEDED;
        case sandbox_status::MEMORY_LIMIT_EXCEEDED:
            return status::MEMORY_LIMIT_EXCEEDED;
        case sandbox_status::OUTPUT_LIMIT_EXCEEDED:
            return status::OUTPUT_LIMIT_EXCEEDED;
        case sandbox_status::FILE_ERROR:
        case sandbox_status::INTERNAL_ERROR:
            message = fmt::format("sandbox error: {} {}", get_display_message(result.status), result.error);
            return status::SYSTEM_ERROR;
        default:
            break;
    }

    // 沙箱可能因为超出限制而杀死程序，此时报告的是 SIGNALLED，需要根据用量重新判断
    if (result.cpu_time > limits.cpu_time || result.wall_time > limits.wall_time)
        return status::TIME_LIMIT_EXCEEDED;
    if (result.memory > limits.memory)
        return status::MEMORY_LIMIT_EXCEEDED;
    auto stdout_it = result.files.find("stdout");
    if (stdout_it != result.files.end() && (int64_t)stdout_it->second.size() > limits.output)
        return status::OUTPUT_LIMIT_EXCEEDED;

    switch (result.status) {
        case sandbox_status::NONZERO_EXIT_STATUS:
            message = fmt::format("exit code {}", result.exit_status);
            return status::RUNTIME_ERROR;
        case sandbox_status::SIGNALLED:
            message = fmt::format("killed by signal {}", result.signal().value_or(0));
            return status::RUNTIME_ERROR;
        case sandbox_status::DANGEROUS_SYSCALL:
            message = "dangerous syscall";
            return status::RUNTIME_ERROR;
        default:
            return nullopt;
    }
}

test_verdict test_case_runner::run(const executable &program,
                                   const staged_test &test,
                                   compare_mode mode,
                                   const executable *checker,
                                   const cancellation_token &token) {
    test_verdict verdict(test.id, status::RUNNING);

    capture_options capture;
    if (mode == compare_mode::SPECIAL_JUDGE) {
        capture.copy_out = {"stderr"};
        capture.copy_out_cached = {"stdout"};
    }

    run_result result;
    try {
        result = client.execute(program, {}, test.input.ref(), test.limits, {}, capture, token);
    } catch (sandbox_timeout &ex) {
        verdict.status = status::SYSTEM_ERROR;
        verdict.message = ex.what();
        return verdict;
    }

    // 缓存在沙箱中的输出在本函数返回时删除
    staged_file output;
    auto cached = result.file_ids.find("stdout");
    if (cached != result.file_ids.end()) output = client.adopt(cached->second);

    verdict.cpu_time = result.cpu_time;
    verdict.wall_time = result.wall_time;
    verdict.memory = result.memory;

    if (auto failure = classify(result, test.limits, verdict.message)) {
        verdict.status = *failure;
        return verdict;
    }

    switch (mode) {
        case compare_mode::EXACT:
        case compare_mode::WHITESPACE: {
            string stdout_content = result.file("stdout");
            bool matched = mode == compare_mode::EXACT
                               ? compare_exact(stdout_content, test.answer)
                               : compare_whitespace(stdout_content, test.answer);
            verdict.status = matched ? status::ACCEPTED : status::WRONG_ANSWER;
            verdict.score = matched ? 1 : 0;
            break;
        }
        case compare_mode::SPECIAL_JUDGE:
            if (!checker) {
                verdict.status = status::SYSTEM_ERROR;
                verdict.message = "checker is not available";
            } else if (output.empty()) {
                verdict.status = status::SYSTEM_ERROR;
                verdict.message = "output of program is not captured";
            } else {
                judge_special(test, output, *checker, verdict, token);
            }
            break;
    }
    return verdict;
}

void test_case_runner::judge_special(const staged_test &test, const staged_file &output, const executable &checker, test_verdict &verdict, const cancellation_token &token) {
    map<string, file_ref> bindings = {
        {"input", test.input.ref()},
        {"output", output.ref()},
        {"answer", test.answer_file.ref()}};
    capture_options capture;
    capture.copy_out = {"stderr"};

    run_result result;
    try {
        result = client.execute(checker, {"input", "output", "answer"}, nullopt, checker_limits, bindings, capture, token);
    } catch (sandbox_timeout &ex) {
        verdict.status = status::SYSTEM_ERROR;
        verdict.message = ex.what();
        return;
    }

    // testlib 以退出码区分结果，非零退出码同样需要解析输出
    if (result.status != sandbox_status::ACCEPTED && result.status != sandbox_status::NONZERO_EXIT_STATUS) {
        verdict.status = status::SYSTEM_ERROR;
        verdict.message = fmt::format("checker failed: {} {}", get_display_message(result.status), limit_message(result.error));
        LOG(WARNING) << "Checker failed on test " << test.id << ": " << result;
        return;
    }

    checker_output parsed = checker_output::parse(result.file("stderr"));
    verdict.status = parsed.status;
    verdict.score = parsed.score;
    verdict.message = parsed.message;
}

}  // namespace judgecore
