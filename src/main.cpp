#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "grading/grader.hpp"
#include "lab/generator.hpp"
#include "lab/workspace.hpp"
#include "progress/progress.hpp"
#include "runtime/registry.hpp"
using namespace std;

grader::cancellation_token interrupt;

void sigintHandler(int /* signum */) {
    interrupt.cancel();
}

/**
 * @brief 读取 JSON 配置文件，优先级最低，会被环境变量和命令行参数覆盖
 */
void load_config_file(const filesystem::path &path) {
    nlohmann::json j = nlohmann::json::parse(grader::read_file_content(path));
    grader::DATA_DIR = nlohmann::get_value_def<string>(j, grader::DATA_DIR.string(), "data_dir");
    grader::RUN_DIR = nlohmann::get_value_def<string>(j, grader::RUN_DIR.string(), "run_dir");
    grader::TOOLCHAIN_PATH = nlohmann::get_value_def<string>(j, grader::TOOLCHAIN_PATH, "toolchain_path");
    grader::DEFAULT_PASS_THRESHOLD = nlohmann::get_value_def<double>(j, grader::DEFAULT_PASS_THRESHOLD, "pass_threshold");
    grader::DEFAULT_TIME_LIMIT = nlohmann::get_value_def<double>(j, grader::DEFAULT_TIME_LIMIT, "time_limit");
    grader::DEFAULT_OUTPUT_LIMIT = nlohmann::get_value_def<size_t>(j, grader::DEFAULT_OUTPUT_LIMIT, "output_limit");
    grader::COMPILE_TIME_LIMIT = nlohmann::get_value_def<double>(j, grader::COMPILE_TIME_LIMIT, "compile_time_limit");
    grader::GENERATOR_TIME_LIMIT = nlohmann::get_value_def<double>(j, grader::GENERATOR_TIME_LIMIT, "generator_time_limit");
    grader::WORKER_COUNT = nlohmann::get_value_def<unsigned>(j, grader::WORKER_COUNT, "workers");
    grader::GRADE_LOCK_TIMEOUT = nlohmann::get_value_def<double>(j, grader::GRADE_LOCK_TIMEOUT, "grade_lock_timeout");
    grader::DEBUG = nlohmann::get_value_def<bool>(j, grader::DEBUG, "debug");
    if (nlohmann::exists(j, "env_allow_list"))
        grader::ENV_ALLOW_LIST = nlohmann::get_value<set<string>>(j, "env_allow_list");
}

nlohmann::json status_tree(const map<string, map<string, grader::lab_status>> &progress) {
    nlohmann::json j = nlohmann::json::object();
    for (auto &[unit, labs] : progress)
        for (auto &[lab, status] : labs)
            j[unit][lab] = grader::get_display_message(status);
    return j;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("lab-grader options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "one of create, submit, progress, touch, reset, show")
        ("course", po::value<string>(), "course id")
        ("unit", po::value<string>(), "unit id")
        ("lab", po::value<string>(), "lab id, required by submit, touch, reset and show")
        ("language", po::value<string>(), "language of the lab to create, e.g. python, cpp, sql")
        ("kind", po::value<string>()->default_value("full"), "kind of the lab to create: full, bugfix or fill")
        ("generator", po::value<vector<string>>()->multitoken(), "command producing lab content as JSON, the built-in template is used when absent or failing")
        ("resubmit", "allow a passed lab to be graded again")
        ("workers", po::value<unsigned>(), "number of test cases running concurrently. You can either pass it from environ LABGRADER_WORKERS")
        ("data-dir", po::value<string>(), "set the directory storing courses, units and labs. You can either pass it from environ LABGRADER_DATA_DIR")
        ("run-dir", po::value<string>(), "set the directory to stage and run submissions. You can either pass it from environ LABGRADER_RUN_DIR")
        ("toolchain-path", po::value<string>(), "set the search path of compilers and interpreters. You can either pass it from environ LABGRADER_TOOLCHAIN_PATH")
        ("pass-threshold", po::value<double>(), "set the default pass threshold of new labs. You can either pass it from environ LABGRADER_PASS_THRESHOLD")
        ("time-limit", po::value<double>(), "set the default time limit in seconds of a test case. You can either pass it from environ LABGRADER_TIME_LIMIT")
        ("config", po::value<string>(), "load configuration from a JSON file")
        ("debug", "turn on the debug mode to keep staging directories for inspection")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("command", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
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
        cout << "lab-grader: create labs, grade submissions and track progress" << endl
             << "Usage: " << argv[0] << " <command> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "lab-grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("command")) {
        cerr << "No command given" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    try {
        if (vm.count("config")) {
            load_config_file(vm.at("config").as<string>());
        }

        if (vm.count("debug")) {
            grader::DEBUG = true;
        } else if (getenv("LABGRADER_DEBUG")) {
            grader::DEBUG = true;
        }

        if (vm.count("data-dir")) {
            grader::DATA_DIR = filesystem::path(vm.at("data-dir").as<string>());
        } else if (getenv("LABGRADER_DATA_DIR")) {
            grader::DATA_DIR = filesystem::path(getenv("LABGRADER_DATA_DIR"));
        }

        if (vm.count("run-dir")) {
            grader::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
        } else if (getenv("LABGRADER_RUN_DIR")) {
            grader::RUN_DIR = filesystem::path(getenv("LABGRADER_RUN_DIR"));
        }

        if (vm.count("toolchain-path")) {
            grader::TOOLCHAIN_PATH = vm.at("toolchain-path").as<string>();
        } else if (getenv("LABGRADER_TOOLCHAIN_PATH")) {
            grader::TOOLCHAIN_PATH = getenv("LABGRADER_TOOLCHAIN_PATH");
        }

        if (vm.count("pass-threshold")) {
            grader::DEFAULT_PASS_THRESHOLD = vm["pass-threshold"].as<double>();
        } else if (getenv("LABGRADER_PASS_THRESHOLD")) {
            grader::DEFAULT_PASS_THRESHOLD = boost::lexical_cast<double>(getenv("LABGRADER_PASS_THRESHOLD"));
        }

        if (vm.count("time-limit")) {
            grader::DEFAULT_TIME_LIMIT = vm["time-limit"].as<double>();
        } else if (getenv("LABGRADER_TIME_LIMIT")) {
            grader::DEFAULT_TIME_LIMIT = boost::lexical_cast<double>(getenv("LABGRADER_TIME_LIMIT"));
        }

        if (vm.count("workers")) {
            grader::WORKER_COUNT = vm["workers"].as<unsigned>();
        } else if (getenv("LABGRADER_WORKERS")) {
            grader::WORKER_COUNT = boost::lexical_cast<unsigned>(getenv("LABGRADER_WORKERS"));
        }
    } catch (std::exception &e) {
        cerr << "Invalid configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    CHECK(!grader::DATA_DIR.empty())
        << "Data directory should be specified by --data-dir or LABGRADER_DATA_DIR";
    filesystem::create_directories(grader::DATA_DIR);
    CHECK(filesystem::is_directory(grader::DATA_DIR))
        << "Data directory " << grader::DATA_DIR << " does not exist";

    // 实验目录只允许当前用户写入
    umask(0022);
    signal(SIGINT, sigintHandler);

    string command = vm["command"].as<string>();
    auto require = [&](const char *name) {
        if (!vm.count(name))
            throw invalid_argument(string("--") + name + " is required by " + command);
        return vm[name].as<string>();
    };

    grader::workspace ws(grader::DATA_DIR);
    grader::adapter_registry registry;
    grader::progress_tracker progress(ws);
    grader::lab_grader lab_grader(ws, registry, progress);

    try {
        nlohmann::json output;
        if (command == "create") {
            grader::lab_context unit{require("course"), require("unit"), ""};
            string language = registry.canonical_name(require("language"));
            if (!registry.supports(language))
                throw invalid_argument("unsupported language " + language);
            grader::lab_kind kind = grader::parse_lab_kind(vm["kind"].as<string>());

            vector<string> generator;
            if (vm.count("generator")) {
                generator = vm["generator"].as<vector<string>>();
            } else if (getenv("LABGRADER_GENERATOR")) {
                string env = getenv("LABGRADER_GENERATOR");
                boost::split(generator, env, boost::is_any_of(" "), boost::token_compress_on);
                generator.erase(remove(generator.begin(), generator.end(), ""), generator.end());
            }
            grader::command_gateway gateway(generator);
            output = grader::generate_lab(ws, unit, language, kind, gateway);
        } else if (command == "submit") {
            grader::lab_context ctx{require("course"), require("unit"), require("lab")};
            grader::submit_options options;
            options.resubmit = vm.count("resubmit") > 0;
            output = lab_grader.submit(ctx, &interrupt, options);
        } else if (command == "progress") {
            output = status_tree(progress.get_progress(require("course")));
        } else if (command == "touch") {
            grader::lab_context ctx{require("course"), require("unit"), require("lab")};
            ws.load_lab(ctx);
            output = progress.touch(ctx);
        } else if (command == "reset") {
            grader::lab_context ctx{require("course"), require("unit"), require("lab")};
            ws.reset_submission(ws.load_lab(ctx));
            output = {{"lab", ctx.lab_id}, {"reset", true}};
        } else if (command == "show") {
            grader::lab_context ctx{require("course"), require("unit"), require("lab")};
            grader::lab lab = ws.load_lab(ctx);
            output["lab"] = lab;
            output["progress"] = progress.get(ctx);
            auto grade = ws.read_grade_record(lab);
            output["grade"] = grade ? nlohmann::json(*grade) : nlohmann::json();
            output["attempts"] = ws.grade_history(lab).size();
        } else {
            throw invalid_argument("unknown command " + command);
        }
        cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
    } catch (grader::submission_aborted &e) {
        LOG(ERROR) << e.what();
        cerr << e.what() << endl;
        return 130;
    } catch (grader::grader_exception &e) {
        LOG(ERROR) << e;
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    } catch (std::exception &e) {
        LOG(ERROR) << boost::diagnostic_information(e);
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
