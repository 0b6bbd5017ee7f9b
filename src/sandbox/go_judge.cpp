#include "sandbox/go_judge.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/http.hpp"
#include "common/json_utils.hpp"

namespace judgecore::sandbox {
using namespace std;
using namespace nlohmann;

static constexpr int64_t NS_PER_MS = 1000000;

go_judge_sandbox::go_judge_sandbox(const sandbox_config &config)
    : cfg(config) {}

static json encode_file(const file_ref &file) {
    if (file.kind == file_ref::type::CACHED)
        return {{"fileId", file.value}};
    else
        return {{"content", file.value}};
}

json encode_run_request(const run_request &request) {
    json cmd;
    cmd["args"] = request.args;
    cmd["env"] = request.env;
    cmd["files"] = {
        request.stdin_file ? encode_file(*request.stdin_file) : json{{"content", ""}},
        {{"name", "stdout"}, {"max", request.limits.output}},
        {{"name", "stderr"}, {"max", request.stderr_limit}}};
    cmd["cpuLimit"] = request.limits.cpu_time * NS_PER_MS;
    cmd["clockLimit"] = request.limits.wall_time * NS_PER_MS;
    cmd["memoryLimit"] = request.limits.memory;
    cmd["stackLimit"] = request.limits.memory;
    cmd["procLimit"] = request.limits.processes;

    json copy_in = json::object();
    for (auto &[name, file] : request.copy_in)
        copy_in[name] = encode_file(file);
    cmd["copyIn"] = copy_in;
    cmd["copyOut"] = request.copy_out;
    cmd["copyOutCached"] = request.copy_out_cached;

    return {{"cmd", json::array({cmd})}};
}

run_result decode_run_result(const json &j) {
    run_result result;
    string status = get_value<string>(j, "status");
    if (!parse_sandbox_status(status, result.status))
        throw sandbox_rejected("unknown sandbox status " + status);
    result.exit_status = get_value_def<int>(j, 0, "exitStatus");
    // 向上取整到毫秒，避免恰好超时的程序显示为未超时
    result.cpu_time = (get_value_def<int64_t>(j, 0, "time") + NS_PER_MS - 1) / NS_PER_MS;
    result.wall_time = (get_value_def<int64_t>(j, 0, "runTime") + NS_PER_MS - 1) / NS_PER_MS;
    result.memory = get_value_def<int64_t>(j, 0, "memory");
    result.error = get_value_def<string>(j, "", "error");
    if (exists(j, "files"))
        result.files = j.at("files").get<map<string, string>>();
    if (exists(j, "fileIds"))
        result.file_ids = j.at("fileIds").get<map<string, string>>();
    return result;
}

/**
 * @brief 将 HTTP 错误映射为沙箱错误
 */
static void check_response(const http_response &response, const string &method, const string &url, int64_t timeout, const cancellation_token *token) {
    if (response.aborted())
        throw cancelled_error(token ? token->reason() : cancel_reason::CANCELLED);
    if (response.timed_out())
        throw sandbox_timeout(fmt::format("{} {} timed out after {}ms", method, url, timeout));
    if (response.code != CURLE_OK)
        throw sandbox_unavailable(fmt::format("{} {}: {}", method, url, response.error));
    if (response.status >= 500)
        throw sandbox_unavailable(fmt::format("{} {} returned {}: {}", method, url, response.status, response.body));
    if (response.status >= 400)
        throw sandbox_rejected(fmt::format("{} {} returned {}: {}", method, url, response.status, response.body));
}

chrono::milliseconds run_timeout(const sandbox_config &config, const run_request &request) {
    return chrono::milliseconds(config.request_timeout + max<int64_t>(0, request.limits.wall_time));
}

string go_judge_sandbox::request(const string &method, const string &path, const string &body, chrono::milliseconds timeout, const cancellation_token *token) {
    string url = cfg.host + path;
    http_response response = http_perform(method, url, body, "application/json", timeout, token);
    check_response(response, method, url, timeout.count(), token);
    return response.body;
}

run_result go_judge_sandbox::execute(const run_request &req, const cancellation_token &token) {
    string body = request("POST", "/run", encode_run_request(req).dump(), run_timeout(cfg, req), &token);
    json results;
    try {
        results = json::parse(body);
    } catch (json::exception &ex) {
        throw sandbox_unavailable(fmt::format("malformed response from sandbox: {}", ex.what()));
    }
    if (!results.is_array() || results.size() != 1)
        throw sandbox_unavailable("sandbox returned unexpected number of results: " + body);

    try {
        return decode_run_result(results[0]);
    } catch (invalid_argument &ex) {
        throw sandbox_unavailable(fmt::format("malformed response from sandbox: {}", ex.what()));
    }
}

string go_judge_sandbox::add_file(const string &content, const cancellation_token &token) {
    string url = cfg.host + "/file";
    http_response response = http_upload(url, "file", "file", content, chrono::milliseconds(cfg.request_timeout), &token);
    check_response(response, "POST", url, cfg.request_timeout, &token);
    const string &body = response.body;
    // go-judge 返回 JSON 字符串形式的文件 id
    try {
        return json::parse(body).get<string>();
    } catch (json::exception &ex) {
        throw sandbox_unavailable(fmt::format("malformed file id from sandbox: {}", body));
    }
}

string go_judge_sandbox::get_file(const string &file_id, const cancellation_token &token) {
    return request("GET", "/file/" + url_escape(file_id), "", chrono::milliseconds(cfg.request_timeout), &token);
}

void go_judge_sandbox::delete_file(const string &file_id) {
    request("DELETE", "/file/" + url_escape(file_id), "", chrono::milliseconds(cfg.request_timeout), nullptr);
}

}  // namespace judgecore::sandbox
