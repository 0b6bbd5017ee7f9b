#include "store/artifact_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "common/http.hpp"
#include "common/io_utils.hpp"

namespace judgecore::store {
using namespace std;

static string new_ref() {
    static mutex uuid_mutex;
    static boost::uuids::random_generator generator;
    lock_guard<mutex> guard(uuid_mutex);
    return boost::lexical_cast<string>(generator());
}

artifact_store::~artifact_store() = default;

local_store::local_store(const filesystem::path &root)
    : root(root) {}

string local_store::fetch(const string &ref, const cancellation_token &token) {
    token.throw_if_cancelled();
    filesystem::path path = root / assert_safe_path(ref);
    if (!filesystem::is_regular_file(path))
        throw artifact_error("artifact not found: " + ref);
    return read_file_content(path);
}

string local_store::store(const string &content) {
    string ref = new_ref();
    write_file_content(root / ref, content);
    return ref;
}

remote_store::remote_store(const store_config &config)
    : cfg(config) {
    if (!boost::algorithm::ends_with(cfg.url, "/")) cfg.url += "/";
}

string remote_store::fetch(const string &ref, const cancellation_token &token) {
    string url = cfg.url + assert_safe_path(ref);
    chrono::milliseconds backoff(200);
    for (int attempt = 1;; ++attempt) {
        token.throw_if_cancelled();
        http_response response = http_perform("GET", url, "", "", chrono::milliseconds(cfg.timeout), &token);
        if (response.aborted())
            throw cancelled_error(token.reason());
        if (response.code == CURLE_OK && response.status < 300)
            return response.body;
        if (response.code == CURLE_OK && response.status < 500)
            throw artifact_error(fmt::format("unable to download {}: HTTP {}", url, response.status));

        string reason = response.code == CURLE_OK ? fmt::format("HTTP {}", response.status) : response.error;
        if (attempt >= cfg.max_attempts)
            throw artifact_error(fmt::format("unable to download {} after {} attempt(s): {}", url, attempt, reason));
        LOG(WARNING) << "Unable to download " << url << " (attempt " << attempt << "), retrying: " << reason;
        if (!token.wait_for(backoff))
            throw cancelled_error(token.reason());
        backoff *= 2;
    }
}

string remote_store::store(const string &content) {
    http_response response = http_perform("POST", cfg.url, content, "application/octet-stream", chrono::milliseconds(cfg.timeout), nullptr);
    if (response.code != CURLE_OK)
        throw artifact_error(fmt::format("unable to upload to {}: {}", cfg.url, response.error));
    if (response.status >= 300)
        throw artifact_error(fmt::format("unable to upload to {}: HTTP {}", cfg.url, response.status));
    return boost::algorithm::trim_copy(response.body);
}

string memory_store::fetch(const string &ref, const cancellation_token &token) {
    token.throw_if_cancelled();
    lock_guard<mutex> guard(mut);
    auto it = files.find(ref);
    if (it == files.end())
        throw artifact_error("artifact not found: " + ref);
    return it->second;
}

string memory_store::store(const string &content) {
    string ref = new_ref();
    put(ref, content);
    return ref;
}

void memory_store::put(const string &ref, const string &content) {
    lock_guard<mutex> guard(mut);
    files[ref] = content;
}

unique_ptr<artifact_store> make_artifact_store(const store_config &config) {
    if (config.type == "local")
        return make_unique<local_store>(config.root);
    else if (config.type == "remote")
        return make_unique<remote_store>(config);
    else
        throw configuration_error("unknown store type " + config.type);
}

}  // namespace judgecore::store
