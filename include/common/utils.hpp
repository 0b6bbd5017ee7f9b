#pragma once

#include <chrono>
#include <string>

namespace judgecore {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 将 value 向上取整到 granularity 的整数倍
 */
template <typename T>
T round_up(T value, T granularity) {
    if (granularity <= 1) return value;
    return (value + granularity - 1) / granularity * granularity;
}

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace judgecore
