#include "judge/pipeline.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace judgecore {
using namespace std;
using namespace judgecore::sandbox;

const char *get_display_message(pipeline_state state) {
    switch (state) {
        case pipeline_state::PENDING: return "Pending";
        case pipeline_state::FETCHING: return "Fetching";
        case pipeline_state::COMPILING: return "Compiling";
        case pipeline_state::RUNNING: return "Running";
        case pipeline_state::AGGREGATING: return "Aggregating";
        case pipeline_state::DONE: return "Done";
        case pipeline_state::FAILED: return "Failed";
    }
    return "Unknown";
}

bool judge_pipeline::can_transition(pipeline_state from, pipeline_state to) {
    if (from == pipeline_state::DONE || from == pipeline_state::FAILED) return false;
    if (to == pipeline_state::FAILED) return true;
    switch (from) {
        case pipeline_state::PENDING:
            return to == pipeline_state::FETCHING;
        case pipeline_state::FETCHING:
            return to == pipeline_state::COMPILING || to == pipeline_state::RUNNING;
        case pipeline_state::COMPILING:
            return to == pipeline_state::RUNNING || to == pipeline_state::AGGREGATING;
        case pipeline_state::RUNNING:
            return to == pipeline_state::RUNNING || to == pipeline_state::AGGREGATING;
        case pipeline_state::AGGREGATING:
            return to == pipeline_state::DONE;
        default:
            return false;
    }
}

judge_pipeline::judge_pipeline(const pipeline_context &context, const submission &submit, problem_policy_ptr problem, cancellation_token_ptr token)
    : context(context), submit(submit), problem(move(problem)), token(move(token)), aggregator(this->problem->test_cases.size()) {
    result.submission_id = submit.id;
    result.problem = submit.problem;
}

pipeline_state judge_pipeline::state() const {
    lock_guard<mutex> guard(mut);
    return current_state;
}

size_t judge_pipeline::current_test() const {
    lock_guard<mutex> guard(mut);
    return test_index;
}

void judge_pipeline::on_state_changed(state_listener listener) {
    this->listener = move(listener);
}

void judge_pipeline::transition(pipeline_state next, size_t test) {
    {
        lock_guard<mutex> guard(mut);
        if (!can_transition(current_state, next))
            throw internal_error(fmt::format("illegal transition from {} to {}", get_display_message(current_state), get_display_message(next)));
        if (current_state == pipeline_state::RUNNING && next == pipeline_state::RUNNING && test <= test_index)
            throw internal_error(fmt::format("illegal transition from Running({}) to Running({})", test_index, test));
        current_state = next;
        test_index = test;
    }
    DLOG(INFO) << submit << " -> " << get_display_message(next) << (next == pipeline_state::RUNNING ? fmt::format("({})", test) : "");
    if (listener) listener(next, test);
}

judge_result judge_pipeline::run() {
    {
        lock_guard<mutex> guard(mut);
        if (current_state != pipeline_state::PENDING)
            throw internal_error(fmt::format("pipeline of submission {} has already run", submit.id));
    }
    defer {
        release();
    };

    LOG(INFO) << "Judging " << submit;
    elapsed_time timer;
    try {
        transition(pipeline_state::FETCHING);
        fetch();

        if (language->requires_compilation() || problem->compare == compare_mode::SPECIAL_JUDGE) {
            transition(pipeline_state::COMPILING);
            if (!compile()) {
                transition(pipeline_state::AGGREGATING);
                result.status = status::COMPILATION_ERROR;
                result.score = 0;
                result.tests.clear();
                transition(pipeline_state::DONE);
                LOG(INFO) << submit << " finished in " << timer.duration<chrono::milliseconds>().count() << "ms: " << get_display_message(result.status);
                return result;
            }
        }

        transition(pipeline_state::RUNNING, 0);
        run_tests();

        transition(pipeline_state::AGGREGATING);
        vector<int> weights;
        for (auto &test_case : problem->test_cases) weights.push_back(test_case.weight);
        aggregator.summarize(weights, result);
        transition(pipeline_state::DONE);
    } catch (cancelled_error &ex) {
        LOG(INFO) << submit << " aborted: " << get_display_message(ex.reason);
        fail(ex.reason == cancel_reason::DEADLINE ? status::SYSTEM_ERROR : status::CANCELLED, get_display_message(ex.reason));
    } catch (judge_exception &ex) {
        LOG(ERROR) << submit << " failed: " << ex;
        fail(status::SYSTEM_ERROR, ex.what());
    } catch (exception &ex) {
        LOG(ERROR) << submit << " failed: " << boost::diagnostic_information(ex);
        fail(status::SYSTEM_ERROR, ex.what());
    }
    LOG(INFO) << submit << " finished in " << timer.duration<chrono::milliseconds>().count() << "ms: " << get_display_message(result.status) << ", score " << result.score;
    return result;
}

void judge_pipeline::fail(status value, const string &message) {
    aggregator.mark_unfinished(value == status::CANCELLED ? status::CANCELLED : status::SYSTEM_ERROR, message);
    result.tests = aggregator.verdicts();
    result.status = value;
    result.score = 0;
    result.message = limit_message(message);
    {
        lock_guard<mutex> guard(mut);
        current_state = pipeline_state::FAILED;
    }
    if (listener) listener(pipeline_state::FAILED, test_index);
}

void judge_pipeline::release() {
    tests.clear();
    program.reset();
    checker.reset();
    exec_file.reset();
    source_file.reset();
    checker_exec_file.reset();
    checker_source_file.reset();
}

void judge_pipeline::fetch() {
    auto &store = context.store;
    auto &client = context.client;

    language = &context.config.language(submit.source.language);
    source_file = client.stage(store.fetch(submit.source.artifact, *token), *token);

    if (problem->compare == compare_mode::SPECIAL_JUDGE) {
        if (!problem->checker)
            throw configuration_error(fmt::format("problem {} has no checker", problem->id));
        checker_language = &context.config.language(problem->checker->language);
        checker_source_file = client.stage(store.fetch(problem->checker->artifact, *token), *token);
    }

    for (size_t i = 0; i < problem->test_cases.size(); ++i) {
        auto &test_case = problem->test_cases[i];
        staged_test test;
        test.id = i;
        test.limits = context.limiter.resolve(*problem, test_case.override, *language);
        test.input = client.stage(store.fetch(test_case.input, *token), *token);
        test.answer = store.fetch(test_case.output, *token);
        if (problem->compare == compare_mode::SPECIAL_JUDGE)
            test.answer_file = client.stage(test.answer, *token);
        tests.push_back(move(test));
    }

    if (!language->requires_compilation())
        program = executable{language->run_command, language->source_name, source_file.ref()};
}

bool judge_pipeline::compile_program(const staged_file &source, const language_policy &lang, staged_file &output, string &message) {
    run_request request;
    request.args = lang.compile_command;
    request.env = context.client.config().env;
    request.limits = context.limiter.normalize(context.config.compile_limits);
    request.stderr_limit = context.client.config().stderr_limit;
    request.copy_in[lang.source_name] = source.ref();
    request.copy_out = {"stdout", "stderr"};
    request.copy_out_cached = {lang.exec_name};

    run_result compiled = context.client.execute(request, *token);
    if (&lang == language) {
        result.time = compiled.cpu_time;
        result.memory = compiled.memory;
    }
    auto it = compiled.file_ids.find(lang.exec_name);
    if (it != compiled.file_ids.end()) output = context.client.adopt(it->second);

    if (compiled.status == sandbox_status::ACCEPTED && !output.empty())
        return true;

    message = compiled.file("stdout") + compiled.file("stderr");
    if (compiled.status != sandbox_status::NONZERO_EXIT_STATUS)
        message += fmt::format("\n{} {}", get_display_message(compiled.status), compiled.error);
    message = limit_message(message);
    return false;
}

bool judge_pipeline::compile() {
    if (language->requires_compilation()) {
        string message;
        if (!compile_program(source_file, *language, exec_file, message)) {
            result.message = message;
            return false;
        }
        program = executable{language->run_command, language->exec_name, exec_file.ref()};
    }

    if (problem->compare == compare_mode::SPECIAL_JUDGE) {
        if (checker_language->requires_compilation()) {
            string message;
            if (!compile_program(checker_source_file, *checker_language, checker_exec_file, message))
                throw internal_error("checker compilation failed: " + message);
            checker = executable{checker_language->run_command, checker_language->exec_name, checker_exec_file.ref()};
        } else {
            checker = executable{checker_language->run_command, checker_language->source_name, checker_source_file.ref()};
        }
    }
    return true;
}

void judge_pipeline::run_test(test_case_runner &runner, size_t index) {
    test_verdict verdict = runner.run(*program, tests[index], problem->compare, checker ? &*checker : nullptr, *token);
    aggregator.record(verdict);
}

void judge_pipeline::run_tests() {
    test_case_runner runner(context.client, context.limiter.normalize(context.config.compile_limits));
    size_t count = tests.size();
    size_t parallelism = max<size_t>(1, context.config.test_parallelism);

    for (size_t next = 0; next < count;) {
        size_t batch_end = min(count, next + parallelism);
        if (next > 0) transition(pipeline_state::RUNNING, next);
        token->throw_if_cancelled();

        if (batch_end - next == 1) {
            run_test(runner, next);
        } else {
            vector<thread> workers;
            vector<exception_ptr> errors(batch_end - next);
            for (size_t i = next; i < batch_end; ++i) {
                workers.emplace_back([&, i] {
                    try {
                        run_test(runner, i);
                    } catch (...) {
                        errors[i - next] = current_exception();
                    }
                });
            }
            for (auto &worker : workers) worker.join();
            for (auto &error : errors)
                if (error) rethrow_exception(error);
        }

        if (context.config.fail_fast) {
            auto verdicts = aggregator.verdicts();
            for (size_t i = next; i < batch_end; ++i) {
                if (verdicts[i].status != status::ACCEPTED) {
                    aggregator.mark_unfinished(status::SKIPPED);
                    return;
                }
            }
        }
        next = batch_end;
    }
}

}  // namespace judgecore
