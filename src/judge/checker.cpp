#include "judge/checker.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cmath>
#include <regex>
#include <sstream>
#include <unordered_map>
#include "common/io_utils.hpp"

namespace judgecore {
using namespace std;

bool compare_exact(const string &output, const string &answer) {
    return output == answer;
}

/**
 * @brief 拆分行并去掉行末空白和文末空行
 */
static vector<string> normalize_lines(const string &text) {
    vector<string> lines;
    istringstream stream(text);
    string line;
    while (getline(stream, line)) {
        boost::algorithm::trim_right_if(line, boost::algorithm::is_any_of(" \t\r"));
        lines.push_back(line);
    }
    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    return lines;
}

bool compare_whitespace(const string &output, const string &answer) {
    return normalize_lines(output) == normalize_lines(answer);
}

boost::rational<int> make_score(double value) {
    if (!(value > 0)) return 0;
    if (value >= 1) return 1;
    return boost::rational<int>((int)lround(value * 1000), 1000);
}

/**
 * @brief 若 text 以 prefix 开头，返回去掉前缀并去掉首尾空白的剩余部分
 */
static bool match_prefix(const string &text, const string &prefix, string &rest) {
    if (!boost::algorithm::starts_with(text, prefix)) return false;
    rest = boost::algorithm::trim_copy(text.substr(prefix.size()));
    return true;
}

static bool parse_points(const string &text, double &points, string &rest) {
    static const regex pattern(R"(^(?:partially correct|points) \(?([0-9]*\.?[0-9]*)\)?)");
    smatch match;
    if (!regex_search(text, match, pattern) || match[1].length() == 0) return false;
    if (!boost::conversion::try_lexical_convert(match[1].str(), points)) return false;
    rest = boost::algorithm::trim_copy(match.suffix().str());
    return true;
}

// 比较器只能给出这几种评测结果，编译错误、跳过等由评测流水线决定
// clang-format off
static const unordered_map<string, status> checker_status = boost::assign::map_list_of
    ("accepted", status::ACCEPTED)
    ("wrong_answer", status::WRONG_ANSWER)
    ("partially_correct", status::PARTIAL_CORRECT)
    ("presentation_error", status::PRESENTATION_ERROR)
    ("system_error", status::SYSTEM_ERROR);
// clang-format on

checker_output checker_output::parse(const string &output) {
    static const regex custom_pattern(R"(^[ \t]*(status|score)\(([\w\.]+)\))");

    checker_output result;
    result.score = 0;
    string rest;
    double points;
    if (match_prefix(output, "ok", rest)) {
        result.status = status::ACCEPTED;
        result.score = 1;
        result.message = "ok " + rest;
    } else if (match_prefix(output, "wrong answer", rest)) {
        result.status = status::WRONG_ANSWER;
        result.message = "wrong answer " + rest;
    } else if (match_prefix(output, "FAIL", rest)) {
        result.status = status::SYSTEM_ERROR;
        result.message = "checker failed " + rest;
    } else if (match_prefix(output, "wrong output format", rest)) {
        result.status = status::PRESENTATION_ERROR;
        result.message = "wrong output format " + rest;
    } else if (parse_points(output, points, rest)) {
        if (points >= 1) {
            result.status = status::ACCEPTED;
            result.score = 1;
        } else if (points <= 0) {
            result.status = status::WRONG_ANSWER;
        } else {
            result.status = status::PARTIAL_CORRECT;
            result.score = make_score(points);
        }
        result.message = "points " + rest;
    } else {
        result.message = output;
    }

    istringstream stream(output);
    string line;
    while (getline(stream, line)) {
        smatch match;
        if (!regex_search(line, match, custom_pattern)) continue;
        if (match[1] == "status") {
            auto it = checker_status.find(match[2].str());
            if (it != checker_status.end()) result.status = it->second;
        } else {
            double score;
            if (boost::conversion::try_lexical_convert(match[2].str(), score))
                result.score = make_score(score);
        }
    }

    boost::algorithm::trim(result.message);
    result.message = limit_message(result.message, 1024);
    return result;
}

}  // namespace judgecore
