#include <chrono>
#include <filesystem>
#include <sstream>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "server/problem_catalog.hpp"
#include "server/protocol.hpp"
#include "server/result_sink.hpp"

using namespace std;
using namespace judgecore;
using namespace nlohmann;

TEST(ProtocolTest, ParseProblemPolicy) {
    json j = json::parse(R"({
        "id": "a+b",
        "time_limit": 1000,
        "memory_limit": 268435456,
        "compare": "special",
        "checker": {"language": "cpp", "source": "a+b/checker.cpp"},
        "test_cases": [
            {"input": "a+b/1.in", "output": "a+b/1.out"},
            {"input": "a+b/2.in", "output": "a+b/2.out", "weight": 3, "time_limit": 2000, "wall_time_limit": 5000}
        ]
    })");
    problem_policy problem = j.get<problem_policy>();
    EXPECT_EQ(problem.id, "a+b");
    EXPECT_EQ(problem.time_limit, 1000);
    EXPECT_EQ(problem.memory_limit, 268435456);
    EXPECT_EQ(problem.compare, compare_mode::SPECIAL_JUDGE);
    ASSERT_TRUE(problem.checker);
    EXPECT_EQ(problem.checker->language, "cpp");
    EXPECT_EQ(problem.checker->artifact, "a+b/checker.cpp");

    ASSERT_EQ(problem.test_cases.size(), 2u);
    EXPECT_EQ(problem.test_cases[0].weight, 1);
    EXPECT_FALSE(problem.test_cases[0].override.time_limit);
    EXPECT_EQ(problem.test_cases[1].weight, 3);
    EXPECT_EQ(problem.test_cases[1].override.time_limit.value_or(0), 2000);
    EXPECT_EQ(problem.test_cases[1].override.wall_time_limit.value_or(0), 5000);
    EXPECT_FALSE(problem.test_cases[1].override.memory_limit);
}

TEST(ProtocolTest, DefaultCompareMode) {
    problem_policy problem = json::parse(R"({"id": "p", "test_cases": []})").get<problem_policy>();
    EXPECT_EQ(problem.compare, compare_mode::WHITESPACE);
    EXPECT_EQ(json("exact").get<compare_mode>(), compare_mode::EXACT);
    EXPECT_THROW(json("fuzzy").get<compare_mode>(), invalid_argument);
}

TEST(ProtocolTest, NegativeWeightIsRejected) {
    json j = json::parse(R"({"input": "1.in", "output": "1.out", "weight": -1})");
    EXPECT_THROW(j.get<test_case>(), invalid_argument);
}

TEST(ProtocolTest, ParseSubmission) {
    json j = json::parse(R"({"id": "s1", "problem": "a+b", "language": "cpp", "source": "s1/main.cpp", "submit_time": 1700000000})");
    submission submit = j.get<submission>();
    EXPECT_EQ(submit.id, "s1");
    EXPECT_EQ(submit.problem, "a+b");
    EXPECT_EQ(submit.source.language, "cpp");
    EXPECT_EQ(submit.source.artifact, "s1/main.cpp");
    EXPECT_EQ(submit.submit_time, 1700000000);

    EXPECT_THROW(json::parse(R"({"id": "s1"})").get<submission>(), json::exception);
}

TEST(ProtocolTest, SerializeJudgeResult) {
    judge_result result;
    result.submission_id = "s1";
    result.problem = "a+b";
    result.status = status::PARTIAL_CORRECT;
    result.score = 50;
    result.time = 12;
    result.memory = 1024;
    test_verdict verdict(0, status::PARTIAL_CORRECT);
    verdict.score = boost::rational<int>(1, 2);
    verdict.message = "points 0.5";
    result.tests.push_back(verdict);
    result.tests.emplace_back(1, status::SKIPPED);

    json j = result;
    EXPECT_EQ(j["submission_id"].get<string>(), "s1");
    EXPECT_EQ(j["status"].get<string>(), get_display_message(status::PARTIAL_CORRECT));
    EXPECT_DOUBLE_EQ(j["score"].get<double>(), 50);
    EXPECT_FALSE(j.contains("message"));
    ASSERT_EQ(j["tests"].size(), 2u);
    EXPECT_DOUBLE_EQ(j["tests"][0]["score"].get<double>(), 0.5);
    EXPECT_EQ(j["tests"][0]["message"].get<string>(), "points 0.5");
    EXPECT_EQ(j["tests"][1]["status"].get<string>(), get_display_message(status::SKIPPED));
    EXPECT_FALSE(j["tests"][1].contains("message"));
}

TEST(ProtocolTest, JsonLinesSinkWritesOneLinePerResult) {
    stringstream ss;
    server::json_lines_sink sink(ss);
    judge_result first, second;
    first.submission_id = "s1";
    second.submission_id = "s2";
    // 编译器输出中的非法 UTF-8 会被替换而不是抛出异常
    second.message = "bad \xff byte";
    sink.deliver(first);
    sink.deliver(second);

    string line;
    ASSERT_TRUE(getline(ss, line));
    EXPECT_EQ(json::parse(line)["submission_id"].get<string>(), "s1");
    ASSERT_TRUE(getline(ss, line));
    EXPECT_EQ(json::parse(line)["submission_id"].get<string>(), "s2");
    EXPECT_FALSE(getline(ss, line));
}

class ProblemCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = filesystem::temp_directory_path() /
              ("judgecore-catalog-" + to_string(chrono::steady_clock::now().time_since_epoch().count()));
        filesystem::create_directories(dir);
    }

    void TearDown() override {
        filesystem::remove_all(dir);
    }

    filesystem::path dir;
};

TEST_F(ProblemCatalogTest, LoadAndCache) {
    write_file_content(dir / "a+b.json", R"({"id": "a+b", "time_limit": 1000, "test_cases": [{"input": "1.in", "output": "1.out"}]})");
    server::json_problem_catalog catalog(dir);
    problem_policy_ptr problem = catalog.find("a+b");
    EXPECT_EQ(problem->test_cases.size(), 1u);

    // 已经加载的题目不会重新读取文件
    filesystem::remove(dir / "a+b.json");
    EXPECT_EQ(catalog.find("a+b"), problem);
}

TEST_F(ProblemCatalogTest, MissingOrMalformedProblem) {
    write_file_content(dir / "broken.json", "{ not json");
    write_file_content(dir / "renamed.json", R"({"id": "other", "test_cases": []})");
    server::json_problem_catalog catalog(dir);

    EXPECT_THROW(catalog.find("missing"), configuration_error);
    EXPECT_THROW(catalog.find("broken"), configuration_error);
    EXPECT_THROW(catalog.find("renamed"), configuration_error);
    EXPECT_THROW(catalog.find("../etc/passwd"), configuration_error);
}

TEST_F(ProblemCatalogTest, OverlongProblemIdIsConfigurationError) {
    server::json_problem_catalog catalog(dir);
    EXPECT_THROW(catalog.find(string(5000, 'a')), configuration_error);
}
