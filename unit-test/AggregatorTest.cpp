#include <thread>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/aggregator.hpp"

using namespace std;
using namespace judgecore;

static test_verdict verdict(size_t id, status value, boost::rational<int> score = 0) {
    test_verdict v(id, value);
    v.score = value == status::ACCEPTED ? 1 : score;
    return v;
}

TEST(AggregatorTest, AllAccepted) {
    vector<test_verdict> verdicts = {verdict(0, status::ACCEPTED), verdict(1, status::ACCEPTED)};
    EXPECT_EQ(aggregate_status(verdicts), status::ACCEPTED);
    EXPECT_DOUBLE_EQ(aggregate_score(verdicts, {1, 1}), 100);
}

TEST(AggregatorTest, FirstFailureInDeclaredOrderWins) {
    vector<test_verdict> verdicts = {
        verdict(0, status::ACCEPTED),
        verdict(1, status::TIME_LIMIT_EXCEEDED),
        verdict(2, status::WRONG_ANSWER)};
    EXPECT_EQ(aggregate_status(verdicts), status::TIME_LIMIT_EXCEEDED);
}

TEST(AggregatorTest, CompletionOrderDoesNotMatter) {
    verdict_aggregator forward(3), backward(3);
    forward.record(verdict(0, status::ACCEPTED));
    forward.record(verdict(1, status::WRONG_ANSWER));
    forward.record(verdict(2, status::RUNTIME_ERROR));
    backward.record(verdict(2, status::RUNTIME_ERROR));
    backward.record(verdict(1, status::WRONG_ANSWER));
    backward.record(verdict(0, status::ACCEPTED));

    judge_result a, b;
    forward.summarize({1, 1, 1}, a);
    backward.summarize({1, 1, 1}, b);
    EXPECT_EQ(a.status, status::WRONG_ANSWER);
    EXPECT_EQ(a.status, b.status);
    EXPECT_DOUBLE_EQ(a.score, b.score);
}

TEST(AggregatorTest, SystemErrorDominates) {
    vector<test_verdict> verdicts = {
        verdict(0, status::WRONG_ANSWER),
        verdict(1, status::CANCELLED),
        verdict(2, status::SYSTEM_ERROR)};
    EXPECT_EQ(aggregate_status(verdicts), status::SYSTEM_ERROR);
}

TEST(AggregatorTest, CompilationErrorDominates) {
    vector<test_verdict> verdicts = {verdict(0, status::SYSTEM_ERROR), verdict(1, status::COMPILATION_ERROR)};
    EXPECT_EQ(aggregate_status(verdicts), status::COMPILATION_ERROR);
}

TEST(AggregatorTest, CancelledBeatsOrdinaryFailures) {
    vector<test_verdict> verdicts = {verdict(0, status::WRONG_ANSWER), verdict(1, status::CANCELLED)};
    EXPECT_EQ(aggregate_status(verdicts), status::CANCELLED);
}

TEST(AggregatorTest, SkippedIsNeverSelected) {
    vector<test_verdict> verdicts = {
        verdict(0, status::ACCEPTED),
        verdict(1, status::SKIPPED),
        verdict(2, status::MEMORY_LIMIT_EXCEEDED)};
    EXPECT_EQ(aggregate_status(verdicts), status::MEMORY_LIMIT_EXCEEDED);
}

TEST(AggregatorTest, WeightedScore) {
    vector<test_verdict> verdicts = {
        verdict(0, status::ACCEPTED),
        verdict(1, status::PARTIAL_CORRECT, boost::rational<int>(1, 2)),
        verdict(2, status::WRONG_ANSWER)};
    EXPECT_DOUBLE_EQ(aggregate_score(verdicts, {2, 4, 4}), 40);
    EXPECT_DOUBLE_EQ(aggregate_score(verdicts, {0, 0, 0}), 0);
}

TEST(AggregatorTest, UnfinishedTestIsInternalError) {
    vector<test_verdict> verdicts = {verdict(0, status::ACCEPTED), verdict(1, status::RUNNING)};
    EXPECT_THROW(aggregate_status(verdicts), internal_error);
}

TEST(AggregatorTest, RecordRejectsDuplicateAndOutOfRange) {
    verdict_aggregator aggregator(2);
    aggregator.record(verdict(0, status::ACCEPTED));
    EXPECT_THROW(aggregator.record(verdict(0, status::WRONG_ANSWER)), internal_error);
    EXPECT_THROW(aggregator.record(verdict(5, status::ACCEPTED)), internal_error);
    EXPECT_EQ(aggregator.completed(), 1u);
}

TEST(AggregatorTest, MarkUnfinishedKeepsCompletedVerdicts) {
    verdict_aggregator aggregator(3);
    aggregator.record(verdict(0, status::WRONG_ANSWER));
    aggregator.mark_unfinished(status::SKIPPED);
    auto verdicts = aggregator.verdicts();
    EXPECT_EQ(verdicts[0].status, status::WRONG_ANSWER);
    EXPECT_EQ(verdicts[1].status, status::SKIPPED);
    EXPECT_EQ(verdicts[2].status, status::SKIPPED);
}

TEST(AggregatorTest, SummarizeReportsPeakUsage) {
    verdict_aggregator aggregator(2);
    test_verdict first = verdict(0, status::ACCEPTED);
    first.cpu_time = 30;
    first.memory = 4096;
    test_verdict second = verdict(1, status::ACCEPTED);
    second.cpu_time = 20;
    second.memory = 8192;
    aggregator.record(second);
    aggregator.record(first);

    judge_result result;
    aggregator.summarize({1, 1}, result);
    EXPECT_EQ(result.time, 30);
    EXPECT_EQ(result.memory, 8192);
    ASSERT_EQ(result.tests.size(), 2u);
    EXPECT_EQ(result.tests[0].id, 0u);
}

TEST(AggregatorTest, ConcurrentRecords) {
    const size_t count = 64;
    verdict_aggregator aggregator(count);
    vector<thread> threads;
    for (size_t t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (size_t i = t; i < count; i += 4)
                aggregator.record(verdict(i, status::ACCEPTED));
        });
    }
    for (auto &th : threads) th.join();
    EXPECT_EQ(aggregator.completed(), count);
}
