#include <curl/curl.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/go_judge.hpp"
#include "scheduler.hpp"
#include "server/problem_catalog.hpp"
#include "server/protocol.hpp"
#include "server/result_sink.hpp"
#include "store/artifact_store.hpp"
using namespace std;

static volatile sig_atomic_t interrupted = 0;

void sigintHandler(int /* signum */) {
    interrupted = 1;
}

/**
 * @brief 处理一个请求
 * 请求可以是评测请求，也可以是 {"cancel": "<submission id>"}
 */
static void handle_request(judgecore::scheduler &scheduler, const nlohmann::json &j) {
    if (j.count("cancel")) {
        string id = j.at("cancel").get<string>();
        if (!scheduler.cancel(id))
            LOG(WARNING) << "Submission " << id << " is not being judged";
        return;
    }

    judgecore::submission submit = j.get<judgecore::submission>();
    try {
        scheduler.submit(submit);
    } catch (judgecore::configuration_error &ex) {
        LOG(ERROR) << "Rejected " << submit << ": " << ex.what();
    } catch (judgecore::internal_error &ex) {
        LOG(ERROR) << "Rejected " << submit << ": " << ex.what();
    }
}

static void handle_line(judgecore::scheduler &scheduler, const string &line) {
    try {
        handle_request(scheduler, nlohmann::json::parse(line));
    } catch (nlohmann::json::exception &ex) {
        LOG(ERROR) << "Malformed request " << line << ": " << ex.what();
    } catch (invalid_argument &ex) {
        LOG(ERROR) << "Malformed request " << line << ": " << ex.what();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to handle request " << line << ": " << boost::diagnostic_information(ex);
    }
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    curl_global_init(CURL_GLOBAL_ALL);

    // 不设置 SA_RESTART，使阻塞在 stdin 上的读取被中断
    struct sigaction action {};
    action.sa_handler = sigintHandler;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    namespace po = boost::program_options;
    po::options_description desc("judge-core options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the configuration file. You can either pass it from environ JUDGECORE_CONFIG")
        ("problems", po::value<string>(), "set the directory with problem configurations named <id>.json. You can either pass it from environ JUDGECORE_PROBLEMS")
        ("output", po::value<string>(), "append judge results to the given file instead of stdout. You can either pass it from environ JUDGECORE_OUTPUT")
        ("submission", po::value<vector<string>>(), "judge submission requests in given files or directories with extension .json, read requests line by line from stdin if not specified")
        ("pool-size", po::value<size_t>(), "override the maximum number of submissions judged concurrently")
        ("fail-fast", "skip the remaining test cases after the first failed one")
        ("debug", "log every sandbox invocation")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "judge-core: Judge submissions in go-judge sandbox" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "judge-core 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) judgecore::DEBUG = true;

    judgecore::core_config config;
    string config_path = vm.count("config") ? vm.at("config").as<string>() : judgecore::get_env("JUDGECORE_CONFIG", "");
    if (!config_path.empty()) {
        try {
            config = judgecore::load_config(config_path);
        } catch (judgecore::configuration_error &ex) {
            LOG(FATAL) << ex.what();
        }
    }
    if (vm.count("pool-size")) config.pool_size = vm.at("pool-size").as<size_t>();
    if (vm.count("fail-fast")) config.fail_fast = true;
    CHECK(config.pool_size > 0) << "pool size must be positive";

    filesystem::path problems_dir = vm.count("problems") ? vm.at("problems").as<string>() : judgecore::get_env("JUDGECORE_PROBLEMS", "problems");
    CHECK(filesystem::is_directory(problems_dir))
        << "Problem directory " << problems_dir << " does not exist";

    string output_path = vm.count("output") ? vm.at("output").as<string>() : judgecore::get_env("JUDGECORE_OUTPUT", "");
    unique_ptr<judgecore::server::result_sink> sink;
    if (output_path.empty())
        sink = make_unique<judgecore::server::json_lines_sink>(cout);
    else
        sink = make_unique<judgecore::server::json_lines_sink>(filesystem::path(output_path));

    judgecore::sandbox::go_judge_sandbox sandbox(config.sandbox);
    unique_ptr<judgecore::store::artifact_store> store = judgecore::store::make_artifact_store(config.store);
    judgecore::server::json_problem_catalog catalog(problems_dir);

    judgecore::scheduler scheduler(config, sandbox, *store, catalog, *sink);
    scheduler.start();

    if (vm.count("submission")) {
        vector<filesystem::path> requests;
        for (auto &path : vm.at("submission").as<vector<string>>()) {
            if (filesystem::is_directory(path)) {
                for (const auto &p : filesystem::directory_iterator(path))
                    if (p.path().extension() == ".json")
                        requests.push_back(p.path());
            } else if (filesystem::is_regular_file(path)) {
                requests.emplace_back(path);
            } else {
                LOG(FATAL) << "Submission file " << path << " does not exist";
            }
        }

        for (const auto &p : requests) {
            if (interrupted) break;
            try {
                handle_request(scheduler, nlohmann::json::parse(judgecore::read_file_content(p)));
            } catch (std::exception &e) {
                LOG(ERROR) << "Submission file " << p << " is malformed: " << boost::diagnostic_information(e);
            }
        }
    } else {
        string line;
        while (!interrupted && getline(cin, line)) {
            if (line.empty()) continue;
            handle_line(scheduler, line);
        }
    }

    if (interrupted) LOG(WARNING) << "Received signal, draining " << scheduler.live() << " submission(s)";
    scheduler.stop();

    curl_global_cleanup();
    return 0;
}
