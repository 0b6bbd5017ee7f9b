#pragma once

#include <utility>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = judgecore::scoped_guard_maker() + [&]

namespace judgecore {

/**
 * @brief 在离开作用域时执行回调
 * 通常用于归还线程池名额、释放沙箱中暂存的文件，
 * 即使评测过程抛出异常也能保证回调被执行。
 */
template <typename F>
struct scoped_guard {
    explicit scoped_guard(F &&f) : f(std::move(f)), active(true) {}

    scoped_guard(scoped_guard &&other) : f(std::move(other.f)), active(other.active) {
        other.active = false;
    }

    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;

    ~scoped_guard() {
        if (active) f();
    }

private:
    F f;
    bool active;
};

struct scoped_guard_maker {
    template <typename F>
    scoped_guard<F> operator+(F &&f) const {
        return scoped_guard<F>(std::forward<F>(f));
    }
};

}  // namespace judgecore
