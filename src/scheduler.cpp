#include "scheduler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace judgecore {
using namespace std;

scheduler::scheduler(const core_config &config, sandbox::sandbox &box, store::artifact_store &store, server::problem_catalog &catalog, server::result_sink &sink)
    : config(config),
      client(box, config.sandbox),
      store(store),
      catalog(catalog),
      sink(sink),
      limiter(config.limits),
      context{config, client, store, limiter} {}

scheduler::~scheduler() {
    stop();
}

void scheduler::on_state_changed(function<void(const string &, pipeline_state, size_t)> listener) {
    this->listener = move(listener);
}

void scheduler::start() {
    lock_guard<mutex> guard(registry_mutex);
    if (!workers.empty() || !accepting) return;
    for (size_t i = 0; i < config.pool_size; ++i)
        workers.emplace_back(&scheduler::worker_loop, this, i);
    LOG(INFO) << "Started " << config.pool_size << " worker(s)";
}

submission_handle scheduler::submit(const submission &submit) {
    // 配置检查失败的提交不会进入注册表
    problem_policy_ptr problem = catalog.find(submit.problem);
    if (problem->test_cases.empty())
        throw configuration_error(fmt::format("problem {} has no test case", problem->id));
    const language_policy &language = config.language(submit.source.language);
    for (auto &test_case : problem->test_cases)
        limiter.resolve(*problem, test_case.override, language);
    if (problem->compare == compare_mode::SPECIAL_JUDGE) {
        if (!problem->checker)
            throw configuration_error(fmt::format("problem {} has no checker", problem->id));
        config.language(problem->checker->language);
    }

    lock_guard<mutex> guard(registry_mutex);
    if (!accepting)
        throw internal_error("scheduler is stopped");
    if (registry.count(submit.id))
        throw internal_error(fmt::format("submission {} is already being judged", submit.id));

    entry e;
    e.judge_id = next_judge_id++;
    e.submit = submit;
    e.problem = problem;
    e.token = make_shared<cancellation_token>();
    submission_handle handle{submit.id, e.judge_id};
    registry.emplace(submit.id, move(e));
    if (!queue.push(submit.id)) {
        registry.erase(submit.id);
        throw internal_error("scheduler is stopped");
    }

    LOG(INFO) << "Accepted " << submit << " as judge " << handle.judge_id;
    return handle;
}

judge_result scheduler::cancelled_result(const submission &submit) const {
    judge_result result;
    result.submission_id = submit.id;
    result.problem = submit.problem;
    result.status = status::CANCELLED;
    result.message = get_display_message(cancel_reason::CANCELLED);
    return result;
}

bool scheduler::cancel(const string &submission_id) {
    unique_lock<mutex> lock(registry_mutex);
    auto it = registry.find(submission_id);
    if (it == registry.end()) return false;

    auto &e = it->second;
    if (e.state == entry_state::QUEUED && queue.remove_first([&](const string &id) { return id == submission_id; })) {
        // 排队中的提交没有流水线，直接返回结果
        submission submit = e.submit;
        lock.unlock();
        LOG(INFO) << "Cancelled queued " << submit;
        finish(submission_id, cancelled_result(submit));
        return true;
    }

    // 正在评测，或者已经被 worker 取出但还没有开始评测
    if (e.token->cancel(cancel_reason::CANCELLED))
        LOG(INFO) << "Cancelling running " << e.submit;
    return true;
}

void scheduler::finish(const string &submission_id, const judge_result &result) {
    try {
        sink.deliver(result);
    } catch (exception &ex) {
        LOG(ERROR) << "Unable to deliver result of submission " << submission_id << ": " << boost::diagnostic_information(ex);
    }
    {
        lock_guard<mutex> guard(registry_mutex);
        registry.erase(submission_id);
    }
    idle_cond.notify_all();
}

void scheduler::worker_loop(size_t worker_id) {
    string submission_id;
    while (queue.pop(submission_id)) {
        submission submit;
        problem_policy_ptr problem;
        cancellation_token_ptr token;
        {
            lock_guard<mutex> guard(registry_mutex);
            auto it = registry.find(submission_id);
            if (it == registry.end()) {
                LOG(ERROR) << "Worker " << worker_id << " dequeued unknown submission " << submission_id;
                continue;
            }
            it->second.state = entry_state::RUNNING;
            submit = it->second.submit;
            problem = it->second.problem;
            token = it->second.token;
        }

        ++running;
        defer {
            --running;
        };

        judge_result result;
        if (token->cancelled()) {
            result = cancelled_result(submit);
        } else {
            token->set_deadline(cancellation_token::clock::now() + chrono::milliseconds(config.submission_deadline));
            try {
                judge_pipeline pipeline(context, submit, problem, token);
                if (listener) {
                    pipeline.on_state_changed([&](pipeline_state state, size_t test) {
                        listener(submit.id, state, test);
                    });
                }
                result = pipeline.run();
            } catch (exception &ex) {
                LOG(ERROR) << "Worker " << worker_id << " has crashed when judging " << submit << ": " << boost::diagnostic_information(ex);
                result.submission_id = submit.id;
                result.problem = submit.problem;
                result.status = status::SYSTEM_ERROR;
                result.message = ex.what();
            }
        }
        finish(submission_id, result);
    }
    DLOG(INFO) << "Worker " << worker_id << " exited";
}

void scheduler::wait_idle() {
    unique_lock<mutex> lock(registry_mutex);
    idle_cond.wait(lock, [this] { return registry.empty(); });
}

void scheduler::stop() {
    bool started;
    {
        lock_guard<mutex> guard(registry_mutex);
        accepting = false;
        started = !workers.empty();
    }

    if (started) {
        wait_idle();
    } else {
        // 没有 worker 时，排队中的提交不会被评测
        vector<string> queued;
        string id;
        while (queue.try_pop(id)) queued.push_back(id);
        for (auto &submission_id : queued) {
            submission submit;
            {
                lock_guard<mutex> guard(registry_mutex);
                auto it = registry.find(submission_id);
                if (it == registry.end()) continue;
                submit = it->second.submit;
            }
            finish(submission_id, cancelled_result(submit));
        }
    }

    queue.close();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
    workers.clear();
}

size_t scheduler::live() const {
    lock_guard<mutex> guard(registry_mutex);
    return registry.size();
}

size_t scheduler::active() const {
    return running;
}

}  // namespace judgecore
