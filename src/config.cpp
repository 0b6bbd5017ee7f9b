#include "config.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace judgecore {
using namespace std;
using namespace nlohmann;

bool DEBUG = false;

static language_policy make_language(const string &name, const vector<string> &compile, const vector<string> &run, const string &source, const string &exec) {
    language_policy language;
    language.name = name;
    language.compile_command = compile;
    language.run_command = run;
    language.source_name = source;
    language.exec_name = exec;
    return language;
}

core_config::core_config() {
    compile_limits.cpu_time = 10000;         // 10s
    compile_limits.wall_time = 20000;        // 20s
    compile_limits.memory = 1ll << 30;       // 1G
    compile_limits.output = 512ll << 20;     // 512M
    compile_limits.processes = 16;

    languages["c"] = make_language("c", {"/usr/bin/gcc", "foo.c", "-o", "foo", "-O2", "-w", "-fmax-errors=3", "-DONLINE_JUDGE"}, {"foo"}, "foo.c", "foo");
    languages["cpp"] = make_language("cpp", {"/usr/bin/g++", "foo.cpp", "-o", "foo", "-O2", "-w", "-fmax-errors=3", "-DONLINE_JUDGE"}, {"foo"}, "foo.cpp", "foo");
    languages["python3"] = make_language("python3", {}, {"/usr/bin/python3", "foo.py"}, "foo.py", "foo.py");
}

const language_policy &core_config::language(const string &name) const {
    auto it = languages.find(name);
    if (it == languages.end())
        throw configuration_error("unsupported language " + name);
    return it->second;
}

void from_json(const json &j, sandbox_config &config) {
    assign_optional(j, config.host, "host");
    assign_optional(j, config.request_timeout, "request_timeout");
    assign_optional(j, config.max_attempts, "max_attempts");
    assign_optional(j, config.backoff, "backoff");
    assign_optional(j, config.env, "env");
    assign_optional(j, config.stderr_limit, "stderr_limit");
    if (config.max_attempts < 1)
        throw configuration_error("sandbox.max_attempts must be positive");
    if (config.request_timeout <= 0)
        throw configuration_error("sandbox.request_timeout must be positive");
}

void from_json(const json &j, store_config &config) {
    assign_optional(j, config.type, "type");
    string root = config.root.string();
    assign_optional(j, root, "root");
    config.root = root;
    assign_optional(j, config.url, "url");
    assign_optional(j, config.timeout, "timeout");
    assign_optional(j, config.max_attempts, "max_attempts");
    if (config.type != "local" && config.type != "remote")
        throw configuration_error("unknown store type " + config.type);
    if (config.type == "remote" && config.url.empty())
        throw configuration_error("store.url is required by remote store");
}

void from_json(const json &j, resource_limits &limits) {
    assign_optional(j, limits.cpu_time, "time_limit");
    assign_optional(j, limits.wall_time, "wall_time_limit");
    assign_optional(j, limits.memory, "memory_limit");
    assign_optional(j, limits.output, "output_limit");
    assign_optional(j, limits.processes, "process_limit");
}

void from_json(const json &j, limit_config &config) {
    assign_optional(j, config.time_granularity, "time_granularity");
    assign_optional(j, config.memory_floor, "memory_floor");
    assign_optional(j, config.wall_time_factor, "wall_time_factor");
    if (config.wall_time_factor < 1)
        throw configuration_error("limits.wall_time_factor must be at least 1");
}

void from_json(const json &j, language_policy &language) {
    assign_optional(j, language.compile_command, "compile_cmd");
    language.run_command = get_value<vector<string>>(j, "run_cmd");
    language.source_name = assert_safe_path(get_value<string>(j, "source"));
    language.exec_name = assert_safe_path(get_value_def<string>(j, language.source_name, "exec"));
    assign_optional(j, language.time_limit, "time_limit");
    assign_optional(j, language.memory_limit, "memory_limit");
    assign_optional(j, language.output_limit, "output_limit");
    assign_optional(j, language.process_limit, "process_limit");
    if (language.run_command.empty())
        throw configuration_error("run_cmd of language " + language.name + " is empty");
}

void from_json(const json &j, core_config &config) {
    assign_optional(j, config.pool_size, "pool_size");
    assign_optional(j, config.fail_fast, "fail_fast");
    assign_optional(j, config.test_parallelism, "test_parallelism");
    assign_optional(j, config.submission_deadline, "submission_deadline");
    if (exists(j, "sandbox")) from_json(j.at("sandbox"), config.sandbox);
    if (exists(j, "store")) from_json(j.at("store"), config.store);
    if (exists(j, "compile")) from_json(j.at("compile"), config.compile_limits);
    if (exists(j, "limits")) from_json(j.at("limits"), config.limits);
    if (exists(j, "languages")) {
        for (auto &[name, lang] : j.at("languages").items()) {
            language_policy language;
            language.name = name;
            from_json(lang, language);
            config.languages[name] = language;
        }
    }

    if (config.pool_size == 0)
        throw configuration_error("pool_size must be positive");
    if (config.test_parallelism == 0)
        throw configuration_error("test_parallelism must be positive");
    if (config.submission_deadline <= 0)
        throw configuration_error("submission_deadline must be positive");
    if (!config.compile_limits.resolved())
        throw configuration_error("compile limits must be positive");
}

core_config load_config(const filesystem::path &path) {
    core_config config;
    try {
        json j = json::parse(read_file_content(path));
        from_json(j, config);
    } catch (artifact_error &ex) {
        throw configuration_error(fmt::format("unable to read config file {}: {}", path.string(), ex.what()));
    } catch (json::exception &ex) {
        throw configuration_error(fmt::format("malformed config file {}: {}", path.string(), ex.what()));
    } catch (invalid_argument &ex) {
        throw configuration_error(fmt::format("malformed config file {}: {}", path.string(), ex.what()));
    }
    return config;
}

}  // namespace judgecore
