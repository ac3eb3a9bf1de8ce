#include "lab/generator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"
#include "runtime/execution.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

content_gateway::~content_gateway() = default;

command_gateway::command_gateway(vector<string> command, map<string, string> env)
    : command(move(command)), env(move(env)) {}

lab_artifacts command_gateway::generate_lab(const lab_context &unit, const string &language, lab_kind kind) {
    if (command.empty())
        throw generation_unavailable("no lab generator configured");

    execution_request request;
    request.argv = command;
    for (auto &arg : {"--course", unit.course_id.c_str(), "--unit", unit.unit_id.c_str(),
                      "--language", language.c_str(), "--kind", get_display_message(kind)})
        request.argv.push_back(arg);
    request.work_dir = fs::temp_directory_path();
    request.env = env;
    request.time_limit = GENERATOR_TIME_LIMIT;
    request.output_limit = 16 << 20;
    request.expect_clean_exit = true;

    LOG(INFO) << "Generating " << get_display_message(kind) << " " << language << " lab for "
              << unit.course_id << "/" << unit.unit_id << " with " << command[0];
    execution_result result = run_process(request);
    switch (result.state) {
        case run_state::COMPLETED:
            break;
        case run_state::SYSTEM_ERROR:
            throw generation_unavailable("unable to run lab generator: " + result.system_error);
        case run_state::TIMED_OUT:
            throw generation_unavailable(fmt::format("lab generator timed out after {}s", GENERATOR_TIME_LIMIT));
        case run_state::OUTPUT_TRUNCATED:
            throw generation_unavailable("lab generator output is too large");
        default:
            throw generation_unavailable(fmt::format("lab generator exited with code {}: {}", result.exit_code,
                                                     boost::trim_copy(result.error)));
    }
    return parse_artifacts(extract_json(result.output));
}

json extract_json(const string &text) {
    json j = json::parse(text, nullptr, false);
    if (!j.is_discarded()) return j;

    static const regex fenced(R"(```(?:json)?\s*(\{[\s\S]*\})\s*```)");
    for (sregex_iterator it(text.begin(), text.end(), fenced), end; it != end; ++it) {
        j = json::parse((*it)[1].str(), nullptr, false);
        if (!j.is_discarded()) return j;
    }

    // 最外层的花括号之间
    auto begin = text.find('{'), last = text.rfind('}');
    if (begin != string::npos && last != string::npos && begin < last) {
        j = json::parse(text.substr(begin, last - begin + 1), nullptr, false);
        if (!j.is_discarded()) return j;
    }
    throw generation_unavailable("lab generator did not produce valid JSON");
}

lab_artifacts parse_artifacts(const json &j) {
    lab_artifacts artifacts;
    try {
        if (!j.is_object()) throw invalid_argument("lab content must be a JSON object");
        artifacts.title = get_value_def<string>(j, "", "title");
        artifacts.statement = get_value_def<string>(j, "", "readme");
        if (artifacts.statement.empty())
            artifacts.statement = get_value_def<string>(j, "", "statement");
        artifacts.entry_point = get_value_def<string>(j, "", "entry_point");
        if (exists(j, "pass_threshold"))
            artifacts.pass_threshold = get_value<double>(j, "pass_threshold");
        artifacts.starter_files = get_value_def<map<string, string>>(j, {}, "starter_files");
        artifacts.test_files = get_value_def<map<string, string>>(j, {}, "test_files");
        artifacts.manifest = get_value_def<json>(j, json(), "manifest");
    } catch (invalid_argument &e) {
        throw generation_unavailable(string("lab generator produced malformed content: ") + e.what());
    }
    return artifacts;
}

namespace {

/**
 * @brief 一种语言的模板程序
 */
struct template_source {
    const char *file;

    /**
     * @brief 可以编译但没有输出的框架代码
     */
    const char *skeleton;

    /**
     * @brief 有错误的版本，输出 "Hello world"
     */
    const char *buggy;
};

// clang-format off
const map<string, template_source> templates = {
    {"python", {"main.py",
        "def main():\n    # TODO: print the greeting\n    pass\n\n\nif __name__ == \"__main__\":\n    main()\n",
        "def main():\n    print(\"Hello world\")\n\n\nif __name__ == \"__main__\":\n    main()\n"}},
    {"javascript", {"main.js",
        "function main() {\n  // TODO: print the greeting\n}\n\nmain();\n",
        "function main() {\n  console.log(\"Hello world\");\n}\n\nmain();\n"}},
    {"typescript", {"main.ts",
        "function main(): void {\n  // TODO: print the greeting\n}\n\nmain();\n",
        "function main(): void {\n  console.log(\"Hello world\");\n}\n\nmain();\n"}},
    {"c", {"main.c",
        "#include <stdio.h>\n\nint main(void) {\n    /* TODO: print the greeting */\n    return 0;\n}\n",
        "#include <stdio.h>\n\nint main(void) {\n    puts(\"Hello world\");\n    return 0;\n}\n"}},
    {"cpp", {"main.cpp",
        "#include <iostream>\n\nint main() {\n    // TODO: print the greeting\n    return 0;\n}\n",
        "#include <iostream>\n\nint main() {\n    std::cout << \"Hello world\" << std::endl;\n}\n"}},
    {"go", {"main.go",
        "package main\n\nfunc main() {\n\t// TODO: print the greeting\n}\n",
        "package main\n\nimport \"fmt\"\n\nfunc main() {\n\tfmt.Println(\"Hello world\")\n}\n"}},
    {"java", {"Main.java",
        "public class Main {\n    public static void main(String[] args) {\n        // TODO: print the greeting\n    }\n}\n",
        "public class Main {\n    public static void main(String[] args) {\n        System.out.println(\"Hello world\");\n    }\n}\n"}},
    {"sql", {"solution.sql",
        "-- TODO: select the greeting\nSELECT NULL WHERE 0;\n",
        "SELECT 'Hello world';\n"}},
    {"bash", {"main.sh",
        "#!/bin/bash\n# TODO: print the greeting\n",
        "#!/bin/bash\necho \"Hello world\"\n"}}
};
// clang-format on

string template_statement(const string &language, lab_kind kind, const string &file) {
    string task;
    switch (kind) {
        case lab_kind::BUGFIX:
            task = fmt::format("The program in `{}` is almost right, but its output is wrong. Find and fix the bug.", file);
            break;
        case lab_kind::FILL:
            task = fmt::format("Complete the TODO in `{}`.", file);
            break;
        default:
            task = fmt::format("Write the program in `{}`.", file);
            break;
    }
    return fmt::format("# Hello, world ({})\n\n{}\n\nThe program must print exactly:\n\n```\nHello, world!\n```\n", language, task);
}

}  // namespace

lab_artifacts static_template_gateway::generate_lab(const lab_context &, const string &language, lab_kind kind) {
    auto it = templates.find(language);
    if (it == templates.end())
        throw generation_unavailable("no built-in template for language " + language);
    const template_source &source = it->second;

    lab_artifacts artifacts;
    artifacts.title = fmt::format("Hello world {}", language);
    artifacts.statement = template_statement(language, kind, source.file);
    artifacts.entry_point = source.file;
    artifacts.starter_files[source.file] = kind == lab_kind::BUGFIX ? source.buggy : source.skeleton;
    artifacts.test_files["expected.txt"] = "Hello, world!\n";
    json test = {{"id", "prints-greeting"},
                 {"expected_file", "expected.txt"},
                 {"compare", "exact"},
                 {"weight", 1}};
    artifacts.manifest = {{"tests", json::array({test})}};
    return artifacts;
}

lab generate_lab(const workspace &ws, const lab_context &unit, const string &language, lab_kind kind, content_gateway &gateway) {
    lab_artifacts artifacts;
    try {
        artifacts = gateway.generate_lab(unit, language, kind);
    } catch (generation_unavailable &e) {
        LOG(WARNING) << "Lab generation unavailable (" << e.what() << "), falling back to the built-in template";
        static_template_gateway fallback;
        artifacts = fallback.generate_lab(unit, language, kind);
    }
    return ws.create_lab(unit, kind, language, artifacts);
}

}  // namespace grader
