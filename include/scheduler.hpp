#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "common/cancellation.hpp"
#include "common/concurrent_queue.hpp"
#include "config.hpp"
#include "judge/pipeline.hpp"
#include "server/problem_catalog.hpp"
#include "server/result_sink.hpp"

/**
 * 提交调度器
 * 调度器接收提交，将提交放入先进先出的等待队列，由 pool_size 个 worker 线程
 * 取出并运行评测流水线。同时评测的提交数因此不会超过 pool_size。
 *
 * 调度器用一个注册表记录所有被接收但还没有返回结果的提交，注册表由一把锁保护，
 * 保证同一个提交 id 同时只会有一个评测流水线，并且每个提交恰好返回一次结果。
 */
namespace judgecore {

/**
 * @brief 被接收的提交的句柄
 */
struct submission_handle {
    std::string submission_id;

    /**
     * @brief 调度器内部分配的唯一 id
     */
    unsigned judge_id;
};

struct scheduler {
    /**
     * @param config 评测配置，必须在调度器的生命周期内有效
     * @param box 沙箱
     * @param store 文件存储
     * @param catalog 题目目录
     * @param sink 评测结果接收方
     */
    scheduler(const core_config &config, sandbox::sandbox &box, store::artifact_store &store, server::problem_catalog &catalog, server::result_sink &sink);

    ~scheduler();

    /**
     * @brief 启动 worker 线程
     */
    void start();

    /**
     * @brief 提交评测
     * 在创建流水线之前检查配置：题目必须存在且至少有一个测试点，语言必须存在，
     * 资源限制必须可以计算。
     * @throw configuration_error 若配置检查失败，提交不会被接收，也不会返回评测结果
     * @throw internal_error 若相同 id 的提交正在评测，或者调度器已经停止
     */
    submission_handle submit(const submission &submit);

    /**
     * @brief 取消提交
     * 排队中的提交直接返回 CANCELLED 结果；评测中的提交会中断正在进行的沙箱调用。
     * @return 若提交不存在（已经返回结果），返回 false
     */
    bool cancel(const std::string &submission_id);

    /**
     * @brief 等待所有被接收的提交返回结果
     */
    void wait_idle();

    /**
     * @brief 停止接收提交，等待已经接收的提交评测完成后停止 worker
     */
    void stop();

    /**
     * @brief 被接收但还没有返回结果的提交数
     */
    std::size_t live() const;

    /**
     * @brief 正在评测的提交数
     */
    std::size_t active() const;

    /**
     * @brief 设置流水线状态变化的回调，必须在 start 之前调用
     */
    void on_state_changed(std::function<void(const std::string &submission_id, pipeline_state state, std::size_t test)> listener);

private:
    enum class entry_state {
        QUEUED,
        RUNNING
    };

    struct entry {
        unsigned judge_id;
        submission submit;
        problem_policy_ptr problem;
        cancellation_token_ptr token;
        entry_state state = entry_state::QUEUED;
    };

    void worker_loop(std::size_t worker_id);

    /**
     * @brief 返回评测结果并从注册表中移除提交
     */
    void finish(const std::string &submission_id, const judge_result &result);

    judge_result cancelled_result(const submission &submit) const;

    const core_config &config;
    sandbox::sandbox_client client;
    store::artifact_store &store;
    server::problem_catalog &catalog;
    server::result_sink &sink;
    resource_limiter limiter;
    pipeline_context context;

    std::function<void(const std::string &, pipeline_state, std::size_t)> listener;

    mutable std::mutex registry_mutex;
    std::condition_variable idle_cond;
    std::map<std::string, entry> registry;
    unsigned next_judge_id = 0;
    bool accepting = true;

    concurrent_queue<std::string> queue;
    std::atomic<std::size_t> running{0};
    std::vector<std::thread> workers;
};

}  // namespace judgecore
