#include "judge/submission.hpp"

namespace judgecore {
using namespace std;

const char *get_display_message(compare_mode mode) {
    switch (mode) {
        case compare_mode::EXACT: return "exact";
        case compare_mode::WHITESPACE: return "whitespace";
        case compare_mode::SPECIAL_JUDGE: return "special";
    }
    return "unknown";
}

ostream &operator<<(ostream &os, const submission &submit) {
    os << "Submission[" << submit.problem << "-" << submit.id << ":" << submit.source.language << "]";
    return os;
}

test_verdict::test_verdict()
    : test_verdict(0) {}

test_verdict::test_verdict(size_t id, judgecore::status status)
    : id(id), status(status), score(0) {}

}  // namespace judgecore
