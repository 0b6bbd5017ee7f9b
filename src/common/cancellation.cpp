#include "common/cancellation.hpp"

namespace judgecore {
using namespace std;

cancellation_token::cancellation_token()
    : cancel_state((int)cancel_reason::NONE), deadline_ticks(clock::time_point::max().time_since_epoch().count()) {}

bool cancellation_token::cancel(cancel_reason reason) {
    int expected = (int)cancel_reason::NONE;
    bool first = cancel_state.compare_exchange_strong(expected, (int)reason);
    {
        // 持有锁再通知，避免 wait_for 在检查条件后、进入等待前错过通知
        lock_guard<mutex> guard(mut);
    }
    cond.notify_all();
    return first;
}

void cancellation_token::set_deadline(clock::time_point deadline) {
    deadline_ticks = deadline.time_since_epoch().count();
    {
        lock_guard<mutex> guard(mut);
    }
    cond.notify_all();
}

cancellation_token::clock::time_point cancellation_token::deadline() const {
    return clock::time_point(clock::duration(deadline_ticks.load()));
}

cancel_reason cancellation_token::reason() const {
    auto state = (cancel_reason)cancel_state.load();
    if (state != cancel_reason::NONE) return state;
    if (clock::now() >= deadline()) return cancel_reason::DEADLINE;
    return cancel_reason::NONE;
}

bool cancellation_token::cancelled() const {
    return reason() != cancel_reason::NONE;
}

void cancellation_token::throw_if_cancelled() const {
    cancel_reason r = reason();
    if (r != cancel_reason::NONE) throw cancelled_error(r);
}

bool cancellation_token::wait_for(chrono::milliseconds duration) const {
    auto until = min(clock::now() + duration, deadline());
    unique_lock<mutex> lock(mut);
    cond.wait_until(lock, until, [this] { return cancel_state.load() != (int)cancel_reason::NONE; });
    return !cancelled();
}

}  // namespace judgecore
