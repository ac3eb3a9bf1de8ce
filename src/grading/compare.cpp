#include "grading/compare.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cctype>
#include <cmath>
#include <vector>
#include "common/stl_utils.hpp"

namespace grader {
using namespace std;

string trim_trailing_newline(const string &text) {
    if (!text.empty() && text.back() == '\n')
        return text.substr(0, text.size() - 1);
    return text;
}

string collapse_whitespace(const string &text) {
    string result;
    bool pending_space = false;
    for (char ch : text) {
        if (isspace((unsigned char)ch)) {
            pending_space = !result.empty();
        } else {
            if (pending_space) result += ' ';
            pending_space = false;
            result += ch;
        }
    }
    return result;
}

static string line_at(const vector<string> &lines, size_t i) {
    return i < lines.size() ? lines[i] : string();
}

/**
 * @brief 找到两组行中第一处不同
 */
static compare_result first_difference(const vector<string> &expected, const vector<string> &actual) {
    compare_result result;
    size_t n = max(expected.size(), actual.size());
    for (size_t i = 0; i < n; ++i) {
        if (i < expected.size() && i < actual.size() && expected[i] == actual[i]) continue;
        result.position = i + 1;
        result.expected = line_at(expected, i);
        result.actual = line_at(actual, i);
        if (i >= actual.size())
            result.reason = "output ended early";
        else if (i >= expected.size())
            result.reason = "unexpected extra output";
        else
            result.reason = "line differs";
        return result;
    }
    result.reason = "output differs";
    return result;
}

compare_result compare_exact(const string &expected, const string &actual) {
    string lhs = trim_trailing_newline(expected), rhs = trim_trailing_newline(actual);
    if (lhs == rhs) {
        compare_result result;
        result.passed = true;
        return result;
    }

    vector<string> expected_lines, actual_lines;
    boost::split(expected_lines, lhs, boost::is_any_of("\n"));
    boost::split(actual_lines, rhs, boost::is_any_of("\n"));
    if (lhs.empty()) expected_lines.clear();
    if (rhs.empty()) actual_lines.clear();
    return first_difference(expected_lines, actual_lines);
}

compare_result compare_normalized_whitespace(const string &expected, const string &actual) {
    if (collapse_whitespace(expected) == collapse_whitespace(actual)) {
        compare_result result;
        result.passed = true;
        return result;
    }

    // 逐行定位第一处不同，空行不参与比较
    auto normalize = [](const string &text) {
        vector<string> lines;
        for (auto &line : split_lines(text)) {
            string collapsed = collapse_whitespace(line);
            if (!collapsed.empty()) lines.push_back(collapsed);
        }
        return lines;
    };
    return first_difference(normalize(expected), normalize(actual));
}

static bool parse_number(const string &token, double &value) {
    try {
        value = boost::lexical_cast<double>(token);
        return !std::isnan(value);
    } catch (boost::bad_lexical_cast &) {
        return false;
    }
}

compare_result compare_tolerance(const string &expected, const string &actual, double epsilon) {
    vector<string> expected_tokens, actual_tokens;
    string lhs = boost::trim_copy(expected), rhs = boost::trim_copy(actual);
    if (!lhs.empty()) boost::split(expected_tokens, lhs, boost::is_space(), boost::token_compress_on);
    if (!rhs.empty()) boost::split(actual_tokens, rhs, boost::is_space(), boost::token_compress_on);

    compare_result result;
    size_t n = min(expected_tokens.size(), actual_tokens.size());
    for (size_t i = 0; i < n; ++i) {
        double a, b;
        result.position = i + 1;
        result.expected = expected_tokens[i];
        result.actual = actual_tokens[i];
        if (!parse_number(expected_tokens[i], a)) {
            result.reason = "expected token is not a number";
            return result;
        }
        if (!parse_number(actual_tokens[i], b)) {
            result.reason = "output token is not a number";
            return result;
        }
        if (!(fabs(a - b) < epsilon)) {
            result.reason = fmt::format("differs by more than {}", epsilon);
            return result;
        }
    }

    if (expected_tokens.size() != actual_tokens.size()) {
        result.position = n + 1;
        result.expected = line_at(expected_tokens, n);
        result.actual = line_at(actual_tokens, n);
        result.reason = fmt::format("expected {} numbers, got {}", expected_tokens.size(), actual_tokens.size());
        return result;
    }

    result = compare_result();
    result.passed = true;
    return result;
}

compare_result compare_output(const test_case &test, const string &expected, const string &actual) {
    switch (test.compare) {
        case compare_mode::EXACT:
            return compare_exact(expected, actual);
        case compare_mode::NORMALIZED_WHITESPACE:
            return compare_normalized_whitespace(expected, actual);
        case compare_mode::TOLERANCE:
            return compare_tolerance(expected, actual, test.epsilon);
        default:
            throw invalid_argument("custom checker comparison requires running the checker");
    }
}

string escape_output(const string &text, size_t limit) {
    string escaped;
    for (size_t i = 0; i < text.size();) {
        unsigned char ch = text[i];
        size_t length = utf8_char_length(text, i);
        if (ch == '\t')
            escaped += "\\t";
        else if (ch == '\r')
            escaped += "\\r";
        else if (ch < 0x20 || ch == 0x7f || length == 0)
            escaped += fmt::format("\\x{:02x}", ch);
        else {
            escaped.append(text, i, length);
            i += length;
            continue;
        }
        ++i;
    }
    return truncate(escaped, limit);
}

string describe_mismatch(const compare_result &result, bool reveal_expected, size_t limit) {
    if (result.passed) return "";
    string where = result.position ? fmt::format(" at {}", result.position) : "";
    if (reveal_expected)
        return fmt::format("{}{}: expected \"{}\", got \"{}\"", result.reason, where,
                           escape_output(result.expected, limit), escape_output(result.actual, limit));
    // 不泄露预期输出，只给出位置和实际输出
    string reason = boost::contains(result.reason, "expected") ? "output differs" : result.reason;
    return fmt::format("{}{}: got \"{}\"", reason, where, escape_output(result.actual, limit));
}

}  // namespace grader
