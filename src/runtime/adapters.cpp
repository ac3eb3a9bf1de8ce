#include "runtime/adapters.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string compile_context::run_compiler(const vector<string> &argv) const {
    execution_request request;
    request.argv = argv;
    request.work_dir = dir;
    request.env = env;
    request.time_limit = COMPILE_TIME_LIMIT;
    request.output_limit = COMPILE_OUTPUT_LIMIT;
    request.expect_clean_exit = true;

    execution_result result = run_process(request, token);
    string diagnostics = result.output + result.error;
    switch (result.state) {
        case run_state::COMPLETED:
        case run_state::OUTPUT_TRUNCATED:
            return diagnostics;
        case run_state::CANCELLED:
            throw submission_aborted("compilation cancelled");
        case run_state::TIMED_OUT:
            throw build_failed("compilation timed out", diagnostics + fmt::format("\ncompilation exceeded {}s", COMPILE_TIME_LIMIT));
        case run_state::SYSTEM_ERROR:
            throw build_failed("unable to run compiler", result.system_error);
        default:
            throw build_failed(fmt::format("compiler exited with code {}", result.exit_code), diagnostics);
    }
}

vector<string> compile_context::sources(const string &extension) const {
    vector<string> files;
    for (auto &entry : fs::directory_iterator(dir))
        if (entry.is_regular_file() && entry.path().extension() == extension)
            files.push_back(entry.path().filename().string());
    sort(files.begin(), files.end());
    if (files.empty())
        throw build_failed("no source files", fmt::format("no {} source file found in submission", extension));
    return files;
}

void compile_context::require_entry_point() const {
    if (entry_point.empty() || !fs::is_regular_file(dir / entry_point))
        throw build_failed("entry point missing", fmt::format("entry point {} not found in submission", entry_point));
}

void interpreted_adapter::compile(compile_context &ctx) const {
    ctx.require_entry_point();
}

map<string, string> interpreted_adapter::environment(const fs::path &) const {
    return {};
}

vector<string> python_adapter::run_command(const compile_context &ctx) const {
    return {ctx.tools.at("python3").string(), ctx.entry_point};
}

map<string, string> python_adapter::environment(const fs::path &) const {
    return {{"PYTHONDONTWRITEBYTECODE", "1"}, {"PYTHONIOENCODING", "utf-8"}};
}

vector<string> javascript_adapter::run_command(const compile_context &ctx) const {
    return {ctx.tools.at("node").string(), ctx.entry_point};
}

void typescript_adapter::compile(compile_context &ctx) const {
    ctx.require_entry_point();
    vector<string> argv = {ctx.tools.at("tsc").string(), "--outDir", "build", "--target", "es2019", "--module", "commonjs"};
    append(argv, ctx.sources(".ts"));
    ctx.diagnostics += ctx.run_compiler(argv);
}

vector<string> typescript_adapter::run_command(const compile_context &ctx) const {
    fs::path compiled = fs::path("build") / fs::path(ctx.entry_point).replace_extension(".js");
    return {ctx.tools.at("node").string(), compiled.string()};
}

map<string, string> typescript_adapter::environment(const fs::path &) const {
    return {};
}

void c_adapter::compile(compile_context &ctx) const {
    vector<string> argv = {ctx.tools.at("gcc").string(), "-std=c11", "-O2", "-Wall", "-o", "program"};
    append(argv, ctx.sources(".c"));
    argv.push_back("-lm");
    ctx.diagnostics += ctx.run_compiler(argv);
}

vector<string> c_adapter::run_command(const compile_context &) const {
    return {"./program"};
}

map<string, string> c_adapter::environment(const fs::path &) const {
    return {};
}

void cpp_adapter::compile(compile_context &ctx) const {
    vector<string> argv = {ctx.tools.at("g++").string(), "-std=c++17", "-O2", "-Wall", "-o", "program"};
    vector<string> files;
    for (auto &extension : {".cpp", ".cc", ".cxx"})
        for (auto &entry : fs::directory_iterator(ctx.dir))
            if (entry.is_regular_file() && entry.path().extension() == extension)
                files.push_back(entry.path().filename().string());
    if (files.empty())
        throw build_failed("no source files", "no C++ source file found in submission");
    sort(files.begin(), files.end());
    append(argv, files);
    ctx.diagnostics += ctx.run_compiler(argv);
}

vector<string> cpp_adapter::run_command(const compile_context &) const {
    return {"./program"};
}

map<string, string> cpp_adapter::environment(const fs::path &) const {
    return {};
}

void go_adapter::compile(compile_context &ctx) const {
    vector<string> argv = {ctx.tools.at("go").string(), "build", "-o", "program"};
    append(argv, ctx.sources(".go"));
    ctx.diagnostics += ctx.run_compiler(argv);
}

vector<string> go_adapter::run_command(const compile_context &) const {
    return {"./program"};
}

map<string, string> go_adapter::environment(const fs::path &dir) const {
    return {{"GOCACHE", (dir / ".cache" / "go-build").string()},
            {"GOPATH", (dir / ".gopath").string()},
            {"GO111MODULE", "off"}};
}

void java_adapter::compile(compile_context &ctx) const {
    ctx.require_entry_point();
    vector<string> argv = {ctx.tools.at("javac").string(), "-encoding", "UTF-8", "-d", "classes"};
    append(argv, ctx.sources(".java"));
    ctx.diagnostics += ctx.run_compiler(argv);
}

vector<string> java_adapter::run_command(const compile_context &ctx) const {
    string main_class = fs::path(ctx.entry_point).stem().string();
    return {ctx.tools.at("java").string(), "-cp", "classes", main_class};
}

map<string, string> java_adapter::environment(const fs::path &) const {
    return {};
}

vector<string> sql_adapter::run_command(const compile_context &ctx) const {
    return {ctx.tools.at("sqlite3").string(), "-batch", "-bail", ":memory:"};
}

vector<string> bash_adapter::run_command(const compile_context &ctx) const {
    return {ctx.tools.at("bash").string(), ctx.entry_point};
}

language_adapter::language_adapter(adapter_variant impl) : impl(move(impl)) {}

string language_adapter::name() const {
    return visit([](auto &adapter) { return string(adapter.name()); }, impl);
}

vector<string> language_adapter::toolchain() const {
    return visit([](auto &adapter) { return adapter.toolchain(); }, impl);
}

map<string, fs::path> language_adapter::resolve_toolchain(const lab &lab) const {
    string search_path = toolchain_search_path();
    map<string, fs::path> tools;
    for (auto &binary : toolchain()) {
        auto found = find_executable(binary, search_path);
        if (!found) throw toolchain_missing(name(), binary);
        tools[binary] = *found;
    }

    // 测试点自定义命令使用的程序（不含 '/' 的才在 PATH 中查找）
    for (auto &test : lab.test_cases) {
        if (test.command.empty() || test.command[0].find('/') != string::npos) continue;
        if (tools.count(test.command[0])) continue;
        auto found = find_executable(test.command[0], search_path);
        if (!found) throw toolchain_missing(name(), test.command[0]);
        tools[test.command[0]] = *found;
    }
    return tools;
}

staged_program language_adapter::prepare(const lab &lab, const submission_snapshot &snapshot,
                                         const fs::path &dir, const cancellation_token *token) const {
    // 先检查 toolchain，缺失时不暂存也不启动任何进程
    auto tools = resolve_toolchain(lab);

    fs::create_directories(dir);
    for (auto &[path, content] : snapshot.files)
        write_file_content(dir / path, content);
    // 预期输出和检查程序只留在实验目录，学生程序读不到
    for (auto &fixture : lab.public_fixtures()) {
        fs::create_directories((dir / "tests" / fixture).parent_path());
        fs::copy_file(lab.tests_dir() / fixture, dir / "tests" / fixture, fs::copy_options::overwrite_existing);
    }
    make_writable(dir / "tests");

    string entry_point = lab.entry_point.empty()
                             ? visit([](auto &adapter) { return adapter.default_entry_point(); }, impl)
                             : lab.entry_point;

    compile_context ctx{lab, dir, entry_point, tools, {}, token, {}};
    ctx.env = visit([&](auto &adapter) { return adapter.environment(dir); }, impl);

    staged_program program;
    program.language = name();
    program.dir = dir;
    program.entry_point = entry_point;
    program.tools = tools;

    visit([&](auto &adapter) { adapter.compile(ctx); }, impl);
    program.run_command = visit([&](auto &adapter) { return adapter.run_command(ctx); }, impl);
    program.env = ctx.env;
    program.diagnostics = ctx.diagnostics;

    LOG(INFO) << "Prepared " << program.language << " submission of lab " << lab.id << " in " << dir;
    return program;
}

execution_request language_adapter::build_command(const staged_program &program, const test_case &test,
                                                  const fs::path &run_dir) const {
    execution_request request;
    if (!test.command.empty()) {
        request.argv = test.command;
        auto tool = program.tools.find(test.command[0]);
        if (tool != program.tools.end())
            request.argv[0] = tool->second.string();
    } else {
        request.argv = program.run_command;
    }

    if (program.language == "sql") {
        // sqlite3 依次执行测试数据脚本和学生脚本
        for (auto &arg : test.args)
            request.argv.push_back(".read " + (fs::path("tests") / assert_safe_path(arg)).string());
        request.argv.push_back(".read " + program.entry_point);
    } else {
        append(request.argv, test.args);
    }

    request.work_dir = run_dir;
    if (!test.stdin_file.empty())
        request.stdin_file = run_dir / "tests" / test.stdin_file;
    request.env = program.env;
    request.time_limit = test.time_limit;
    request.output_limit = test.output_limit;
    request.expect_clean_exit = test.expect_clean_exit;
    return request;
}

execution_request language_adapter::checker_command(const staged_program &program, const test_case &test,
                                                    const fs::path &expected, const fs::path &actual,
                                                    const fs::path &run_dir) const {
    execution_request request;
    request.argv = {(run_dir / "tests" / test.checker).string(), expected.string(), actual.string()};
    if (!test.stdin_file.empty())
        request.argv.push_back((run_dir / "tests" / test.stdin_file).string());
    request.work_dir = run_dir;
    request.env = program.env;
    request.time_limit = test.time_limit;
    request.output_limit = DEFAULT_OUTPUT_LIMIT;
    request.expect_clean_exit = false;
    return request;
}

void language_adapter::cleanup(const staged_program &program) const {
    if (DEBUG || program.dir.empty()) return;
    error_code ec;
    fs::remove_all(program.dir, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove staging directory " << program.dir << ": " << ec.message();
}

}  // namespace grader
