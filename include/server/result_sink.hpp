#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>
#include "judge/submission.hpp"

namespace judgecore::server {

/**
 * @brief 评测结果的接收方
 * 调度器保证每个被接收的提交恰好调用一次 deliver。
 * deliver 可能被多个 worker 线程同时调用。
 */
struct result_sink {
    virtual ~result_sink();

    virtual void deliver(const judge_result &result) = 0;
};

/**
 * @brief 每行输出一个 JSON 格式的评测结果
 */
struct json_lines_sink : public result_sink {
    /**
     * @brief 输出到已有的流，比如 std::cout
     */
    explicit json_lines_sink(std::ostream &os);

    /**
     * @brief 追加输出到文件
     */
    explicit json_lines_sink(const std::filesystem::path &path);

    void deliver(const judge_result &result) override;

private:
    std::ofstream file;
    std::ostream &os;
    std::mutex mut;
};

}  // namespace judgecore::server
