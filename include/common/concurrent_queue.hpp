#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace judgecore {

/**
 * @brief 并发队列，写者读者模型，先进先出
 * 调度器用它保存等待评测的提交，因此额外支持按条件移除元素（取消排队中的提交）
 * 以及关闭队列（停止调度器时唤醒所有等待的 worker）。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop_front();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @param element 保存队头元素
     * @return 若队列已经关闭且为空，返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop_front();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return 若队列已经关闭，则不插入并返回 false
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) return false;
        q.push_back(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 移除第一个满足条件的元素
     * @return 被移除的元素，若不存在返回空
     */
    template <typename Predicate>
    std::optional<T> remove_first(Predicate &&pred) {
        std::unique_lock<std::mutex> mlock(mut);
        for (auto it = q.begin(); it != q.end(); ++it) {
            if (pred(*it)) {
                std::optional<T> result(std::move(*it));
                q.erase(it);
                return result;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief 关闭队列，此后 push 失败，pop 在队列为空时立即返回
     */
    void close() {
        {
            std::unique_lock<std::mutex> mlock(mut);
            closed = true;
        }
        cond.notify_all();
    }

    std::size_t size() const {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::deque<T> q;
    bool closed = false;
    mutable std::mutex mut;
    std::condition_variable cond;
};

}  // namespace judgecore
