#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include "common/exceptions.hpp"

namespace judgecore {

/**
 * @brief 提交的取消令牌
 * 调度器持有令牌并在取消提交时调用 cancel，评测流水线和沙箱客户端在每个
 * 挂起点检查令牌。令牌同时记录提交的端到端评测期限，超过期限视为被取消。
 */
struct cancellation_token {
    typedef std::chrono::steady_clock clock;

    cancellation_token();

    /**
     * @brief 取消提交
     * 重复取消时保留第一次的原因
     * @return 是否是第一次取消
     */
    bool cancel(cancel_reason reason = cancel_reason::CANCELLED);

    /**
     * @brief 设置端到端评测期限
     */
    void set_deadline(clock::time_point deadline);

    clock::time_point deadline() const;

    /**
     * @brief 当前的取消原因，若没有被取消则返回 NONE
     * 超过期限时会自动转为 DEADLINE
     */
    cancel_reason reason() const;

    bool cancelled() const;

    /**
     * @brief 如果已经被取消，抛出 cancelled_error
     */
    void throw_if_cancelled() const;

    /**
     * @brief 可被取消的等待，用于重试退避
     * @return 若等待期间被取消返回 false
     */
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<int> cancel_state;
    std::atomic<clock::rep> deadline_ticks;
    mutable std::mutex mut;
    mutable std::condition_variable cond;
};

typedef std::shared_ptr<cancellation_token> cancellation_token_ptr;

}  // namespace judgecore
