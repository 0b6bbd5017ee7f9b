#include "judge/limits.hpp"
#include <fmt/core.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/submission.hpp"

namespace judgecore {
using namespace std;

bool resource_limits::resolved() const {
    return cpu_time > 0 && wall_time > 0 && memory > 0 && output > 0 && processes > 0;
}

bool resource_limits::operator==(const resource_limits &other) const {
    return cpu_time == other.cpu_time && wall_time == other.wall_time &&
           memory == other.memory && output == other.output && processes == other.processes;
}

bool resource_limits::operator!=(const resource_limits &other) const {
    return !(*this == other);
}

ostream &operator<<(ostream &os, const resource_limits &limits) {
    os << "Limits[cpu: " << limits.cpu_time << "ms, wall: " << limits.wall_time
       << "ms, memory: " << limits.memory << "B, output: " << limits.output
       << "B, processes: " << limits.processes << "]";
    return os;
}

bool language_policy::requires_compilation() const {
    return !compile_command.empty();
}

resource_limiter::resource_limiter(const limit_config &config)
    : cfg(config) {}

const limit_config &resource_limiter::config() const {
    return cfg;
}

/**
 * @brief 按优先级选取第一个设置了的值
 */
static int64_t pick(const optional<int64_t> &override, int64_t problem, int64_t language) {
    if (override && *override > 0) return *override;
    if (problem > 0) return problem;
    return language;
}

resource_limits resource_limiter::normalize(resource_limits limits) const {
    limits.cpu_time = round_up<int64_t>(limits.cpu_time, cfg.time_granularity);
    limits.wall_time = round_up<int64_t>(limits.wall_time, cfg.time_granularity);
    // 时钟时间不可能短于 CPU 时间（单进程时），否则 CPU 时间限制没有意义
    limits.wall_time = max(limits.wall_time, limits.cpu_time);
    limits.memory = max(limits.memory, cfg.memory_floor);
    return limits;
}

resource_limits resource_limiter::resolve(const problem_policy &problem, const limit_override &override, const language_policy &language) const {
    resource_limits limits;
    limits.cpu_time = pick(override.time_limit, problem.time_limit, language.time_limit);
    if (override.wall_time_limit && *override.wall_time_limit > 0)
        limits.wall_time = *override.wall_time_limit;
    else if (problem.wall_time_limit > 0 && !(override.time_limit && *override.time_limit > 0))
        limits.wall_time = problem.wall_time_limit;
    else
        limits.wall_time = limits.cpu_time * cfg.wall_time_factor;
    limits.memory = pick(override.memory_limit, problem.memory_limit, language.memory_limit);
    limits.output = pick(override.output_limit, problem.output_limit, language.output_limit);
    limits.processes = pick(override.process_limit, problem.process_limit, language.process_limit);

    if (limits.cpu_time <= 0 || limits.memory <= 0 || limits.output <= 0 || limits.processes <= 0)
        throw configuration_error(fmt::format("unable to resolve resource limits of problem {} for language {}", problem.id, language.name));

    return normalize(limits);
}

}  // namespace judgecore
