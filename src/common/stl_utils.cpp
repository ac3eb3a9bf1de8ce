#include "common/stl_utils.hpp"

namespace grader {
using namespace std;

vector<string> split_lines(const string &text) {
    vector<string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == string::npos) end = text.size();
        string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(move(line));
        start = end + 1;
    }
    return lines;
}

size_t utf8_char_length(const string &text, size_t pos) {
    auto byte = [&](size_t i) { return i < text.size() ? (unsigned char)text[i] : 0u; };
    auto continuation = [&](size_t i, unsigned lo = 0x80, unsigned hi = 0xBF) {
        return byte(i) >= lo && byte(i) <= hi;
    };

    unsigned lead = byte(pos);
    if (pos >= text.size()) return 0;
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF)
        return continuation(pos + 1) ? 2 : 0;
    if (lead >= 0xE0 && lead <= 0xEF) {
        // 排除过长编码和代理区
        unsigned lo = lead == 0xE0 ? 0xA0 : 0x80, hi = lead == 0xED ? 0x9F : 0xBF;
        return continuation(pos + 1, lo, hi) && continuation(pos + 2) ? 3 : 0;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        unsigned lo = lead == 0xF0 ? 0x90 : 0x80, hi = lead == 0xF4 ? 0x8F : 0xBF;
        return continuation(pos + 1, lo, hi) && continuation(pos + 2) && continuation(pos + 3) ? 4 : 0;
    }
    return 0;
}

string sanitize_utf8(const string &text) {
    string result;
    for (size_t i = 0; i < text.size();) {
        size_t length = utf8_char_length(text, i);
        if (length == 0) {
            result += "\xEF\xBF\xBD";
            ++i;
        } else {
            result.append(text, i, length);
            i += length;
        }
    }
    return result;
}

string truncate(const string &text, size_t limit) {
    if (text.size() <= limit) return text;
    // 不在多字节字符中间截断
    size_t end = limit;
    while (end > 0 && ((unsigned char)text[end] & 0xC0) == 0x80) --end;
    return text.substr(0, end) + "...";
}

}  // namespace grader
