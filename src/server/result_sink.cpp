#include "server/result_sink.hpp"
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "server/protocol.hpp"

namespace judgecore::server {
using namespace std;
using namespace nlohmann;

result_sink::~result_sink() = default;

json_lines_sink::json_lines_sink(ostream &os)
    : os(os) {}

json_lines_sink::json_lines_sink(const filesystem::path &path)
    : file(path, ios::app), os(file) {
    if (!file) throw configuration_error("unable to open output file " + path.string());
}

void json_lines_sink::deliver(const judge_result &result) {
    json j = result;
    // 编译器输出和比较器输出不一定是合法的 UTF-8
    string line = j.dump(-1, ' ', false, json::error_handler_t::replace);
    lock_guard<mutex> guard(mut);
    os << line << endl;
}

}  // namespace judgecore::server
