#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/limits.hpp"
#include "judge/submission.hpp"

using namespace std;
using namespace judgecore;

class LimitsTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.time_granularity = 10;
        config.memory_floor = 16 << 20;
        config.wall_time_factor = 2;

        language.name = "cpp";
        language.time_limit = 2000;
        language.memory_limit = 512 << 20;
        language.output_limit = 64 << 20;
        language.process_limit = 8;

        problem.id = "1001";
    }

    limit_config config;
    language_policy language;
    problem_policy problem;
};

TEST_F(LimitsTest, LanguageDefaultsAreLowestPriority) {
    resource_limiter limiter(config);
    resource_limits limits = limiter.resolve(problem, limit_override(), language);
    EXPECT_EQ(limits.cpu_time, 2000);
    EXPECT_EQ(limits.wall_time, 4000);
    EXPECT_EQ(limits.memory, 512 << 20);
    EXPECT_EQ(limits.output, 64 << 20);
    EXPECT_EQ(limits.processes, 8);
    EXPECT_TRUE(limits.resolved());
}

TEST_F(LimitsTest, OverrideBeatsProblemBeatsLanguage) {
    problem.time_limit = 1000;
    problem.memory_limit = 128 << 20;
    limit_override override;
    override.time_limit = 3000;

    resource_limiter limiter(config);
    resource_limits limits = limiter.resolve(problem, override, language);
    EXPECT_EQ(limits.cpu_time, 3000);
    EXPECT_EQ(limits.memory, 128 << 20);
    EXPECT_EQ(limits.processes, 8);
}

TEST_F(LimitsTest, WallTimeFollowsCpuTimeUnlessSet) {
    problem.time_limit = 1000;
    resource_limiter limiter(config);
    EXPECT_EQ(limiter.resolve(problem, limit_override(), language).wall_time, 2000);

    problem.wall_time_limit = 5000;
    EXPECT_EQ(limiter.resolve(problem, limit_override(), language).wall_time, 5000);

    // 测试点覆盖了 CPU 时间时，题目的时钟时间不再适用
    limit_override override;
    override.time_limit = 4000;
    EXPECT_EQ(limiter.resolve(problem, override, language).wall_time, 8000);

    override.wall_time_limit = 6000;
    EXPECT_EQ(limiter.resolve(problem, override, language).wall_time, 6000);
}

TEST_F(LimitsTest, TimeIsRoundedUpToGranularity) {
    problem.time_limit = 1001;
    resource_limiter limiter(config);
    resource_limits limits = limiter.resolve(problem, limit_override(), language);
    EXPECT_EQ(limits.cpu_time, 1010);
    EXPECT_EQ(limits.wall_time, 2010);
}

TEST_F(LimitsTest, MemoryIsRaisedToFloor) {
    problem.memory_limit = 1 << 20;
    resource_limiter limiter(config);
    EXPECT_EQ(limiter.resolve(problem, limit_override(), language).memory, 16 << 20);
}

TEST_F(LimitsTest, UnresolvableLimitIsConfigurationError) {
    language.time_limit = 0;
    resource_limiter limiter(config);
    EXPECT_THROW(limiter.resolve(problem, limit_override(), language), configuration_error);

    problem.time_limit = 1000;
    EXPECT_NO_THROW(limiter.resolve(problem, limit_override(), language));
}

TEST_F(LimitsTest, ResolveIsDeterministic) {
    problem.time_limit = 777;
    limit_override override;
    override.memory_limit = 100 << 20;
    resource_limiter limiter(config);
    EXPECT_EQ(limiter.resolve(problem, override, language), limiter.resolve(problem, override, language));
}

TEST_F(LimitsTest, NormalizeKeepsWallTimeAboveCpuTime) {
    resource_limiter limiter(config);
    resource_limits limits;
    limits.cpu_time = 1005;
    limits.wall_time = 500;
    limits.memory = 1024;
    limits.output = 1024;
    limits.processes = 1;
    resource_limits normalized = limiter.normalize(limits);
    EXPECT_EQ(normalized.cpu_time, 1010);
    EXPECT_EQ(normalized.wall_time, 1010);
    EXPECT_EQ(normalized.memory, 16 << 20);
}
