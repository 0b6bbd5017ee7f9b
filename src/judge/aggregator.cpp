#include "judge/aggregator.hpp"
#include <fmt/core.h>
#include <algorithm>
#include "common/exceptions.hpp"

namespace judgecore {
using namespace std;

status aggregate_status(const vector<test_verdict> &verdicts) {
    for (auto &verdict : verdicts)
        if (!is_final(verdict.status))
            throw internal_error(fmt::format("test {} is not finished", verdict.id));

    auto has = [&](status value) {
        return any_of(verdicts.begin(), verdicts.end(), [value](const test_verdict &v) { return v.status == value; });
    };
    if (has(status::COMPILATION_ERROR)) return status::COMPILATION_ERROR;
    if (has(status::SYSTEM_ERROR)) return status::SYSTEM_ERROR;
    if (has(status::CANCELLED)) return status::CANCELLED;

    for (auto &verdict : verdicts)
        if (verdict.status != status::ACCEPTED && verdict.status != status::SKIPPED)
            return verdict.status;
    return status::ACCEPTED;
}

double aggregate_score(const vector<test_verdict> &verdicts, const vector<int> &weights) {
    boost::rational<int> total = 0, gained = 0;
    for (size_t i = 0; i < verdicts.size() && i < weights.size(); ++i) {
        total += weights[i];
        gained += verdicts[i].score * weights[i];
    }
    if (total == 0) return 0;
    return boost::rational_cast<double>(gained / total) * 100;
}

verdict_aggregator::verdict_aggregator(size_t test_count) {
    for (size_t i = 0; i < test_count; ++i)
        slots.emplace_back(i, status::PENDING);
}

void verdict_aggregator::record(const test_verdict &verdict) {
    lock_guard<mutex> guard(mut);
    if (verdict.id >= slots.size())
        throw internal_error(fmt::format("test {} out of range", verdict.id));
    if (is_final(slots[verdict.id].status))
        throw internal_error(fmt::format("test {} already has a verdict", verdict.id));
    slots[verdict.id] = verdict;
}

void verdict_aggregator::mark_unfinished(status value, const string &message) {
    lock_guard<mutex> guard(mut);
    for (auto &slot : slots) {
        if (!is_final(slot.status)) {
            slot.status = value;
            slot.score = 0;
            slot.message = message;
        }
    }
}

size_t verdict_aggregator::completed() const {
    lock_guard<mutex> guard(mut);
    return count_if(slots.begin(), slots.end(), [](const test_verdict &v) { return is_final(v.status); });
}

vector<test_verdict> verdict_aggregator::verdicts() const {
    lock_guard<mutex> guard(mut);
    return slots;
}

void verdict_aggregator::summarize(const vector<int> &weights, judge_result &result) const {
    result.tests = verdicts();
    result.status = aggregate_status(result.tests);
    result.score = aggregate_score(result.tests, weights);
    result.time = result.memory = 0;
    for (auto &verdict : result.tests) {
        result.time = max(result.time, verdict.cpu_time);
        result.memory = max(result.memory, verdict.memory);
    }
}

}  // namespace judgecore
