#include "sandbox/client.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <sstream>

namespace judgecore::sandbox {
using namespace std;

staged_file::staged_file()
    : client(nullptr) {}

staged_file::staged_file(sandbox_client *client, const string &file_id)
    : client(client), file_id(file_id) {}

staged_file::staged_file(staged_file &&other)
    : client(other.client), file_id(move(other.file_id)) {
    other.client = nullptr;
    other.file_id.clear();
}

staged_file &staged_file::operator=(staged_file &&other) {
    if (this != &other) {
        reset();
        client = other.client;
        file_id = move(other.file_id);
        other.client = nullptr;
        other.file_id.clear();
    }
    return *this;
}

staged_file::~staged_file() {
    reset();
}

const string &staged_file::id() const {
    return file_id;
}

file_ref staged_file::ref() const {
    return file_ref::cached(file_id);
}

bool staged_file::empty() const {
    return file_id.empty();
}

void staged_file::reset() {
    if (client && !file_id.empty()) client->remove(file_id);
    client = nullptr;
    file_id.clear();
}

sandbox_client::sandbox_client(sandbox &box, const sandbox_config &config)
    : box(box), cfg(config) {}

const sandbox_config &sandbox_client::config() const {
    return cfg;
}

template <typename Func>
auto sandbox_client::with_retry(const char *operation, const cancellation_token &token, Func &&func) -> decltype(func()) {
    chrono::milliseconds backoff(cfg.backoff);
    for (int attempt = 1;; ++attempt) {
        token.throw_if_cancelled();
        try {
            return func();
        } catch (sandbox_error &ex) {
            if (!ex.retryable() || attempt >= cfg.max_attempts) {
                LOG(ERROR) << "Sandbox " << operation << " failed after " << attempt << " attempt(s): " << ex.what();
                throw;
            }
            LOG(WARNING) << "Sandbox " << operation << " failed (attempt " << attempt << "/" << cfg.max_attempts
                         << "), retrying in " << backoff.count() << "ms: " << ex.what();
        }
        if (!token.wait_for(backoff))
            throw cancelled_error(token.reason());
        backoff *= 2;
    }
}

static void validate_limits(const resource_limits &limits) {
    if (!limits.resolved()) {
        stringstream ss;
        ss << "resource limits are not fully resolved: " << limits;
        throw sandbox_rejected(ss.str());
    }
}

run_result sandbox_client::execute(const executable &program,
                                   const vector<string> &args,
                                   const optional<file_ref> &stdin_file,
                                   const resource_limits &limits,
                                   const map<string, file_ref> &bindings,
                                   const capture_options &capture,
                                   const cancellation_token &token) {
    if (program.file.kind != file_ref::type::CACHED || program.file.value.empty())
        throw sandbox_rejected(fmt::format("program {} is not staged in sandbox", program.name));
    if (program.command.empty())
        throw sandbox_rejected(fmt::format("program {} has empty command", program.name));

    run_request request;
    request.args = program.command;
    request.args.insert(request.args.end(), args.begin(), args.end());
    request.env = cfg.env;
    request.stdin_file = stdin_file;
    request.limits = limits;
    request.stderr_limit = cfg.stderr_limit;
    request.copy_in = bindings;
    request.copy_in[program.name] = program.file;
    request.copy_out = capture.copy_out;
    request.copy_out_cached = capture.copy_out_cached;
    return execute(request, token);
}

run_result sandbox_client::execute(const run_request &request, const cancellation_token &token) {
    validate_limits(request.limits);
    if (request.args.empty())
        throw sandbox_rejected("empty command");

    return with_retry("execute", token, [&] {
        run_result result = box.execute(request, token);
        if (DEBUG) LOG(INFO) << "Sandbox executed " << request.args[0] << ": " << result;
        return result;
    });
}

staged_file sandbox_client::stage(const string &content, const cancellation_token &token) {
    string file_id = with_retry("add_file", token, [&] {
        return box.add_file(content, token);
    });
    return staged_file(this, file_id);
}

staged_file sandbox_client::adopt(const string &file_id) {
    return staged_file(this, file_id);
}

string sandbox_client::fetch(const string &file_id, const cancellation_token &token) {
    return with_retry("get_file", token, [&] {
        return box.get_file(file_id, token);
    });
}

void sandbox_client::remove(const string &file_id) noexcept {
    try {
        box.delete_file(file_id);
    } catch (exception &ex) {
        LOG(WARNING) << "Unable to delete sandbox file " << file_id << ": " << boost::diagnostic_information(ex);
    }
}

}  // namespace judgecore::sandbox
