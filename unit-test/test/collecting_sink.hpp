#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <vector>
#include "server/result_sink.hpp"

namespace judgecore::test {

/**
 * @brief 测试用的结果接收方，记录所有收到的评测结果
 */
struct collecting_sink : public server::result_sink {
    void deliver(const judge_result &result) override {
        {
            std::lock_guard<std::mutex> guard(mut);
            results.push_back(result);
        }
        cond.notify_all();
    }

    /**
     * @brief 等待收到至少 count 个结果
     */
    bool wait_for(std::size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lock(mut);
        return cond.wait_for(lock, timeout, [&] { return results.size() >= count; });
    }

    std::vector<judge_result> snapshot() {
        std::lock_guard<std::mutex> guard(mut);
        return results;
    }

    /**
     * @brief 每个提交收到结果的次数
     */
    std::map<std::string, int> deliveries() {
        std::lock_guard<std::mutex> guard(mut);
        std::map<std::string, int> counts;
        for (auto &result : results) ++counts[result.submission_id];
        return counts;
    }

private:
    std::mutex mut;
    std::condition_variable cond;
    std::vector<judge_result> results;
};

}  // namespace judgecore::test
