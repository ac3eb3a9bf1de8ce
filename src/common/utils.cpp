#include "common/utils.hpp"
#include <fmt/core.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <ctime>
#include <vector>
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string toolchain_search_path() {
    if (!TOOLCHAIN_PATH.empty()) return TOOLCHAIN_PATH;
    return get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
}

static bool is_executable(const fs::path &path) {
    error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

optional<fs::path> find_executable(const string &name, const string &search_path) {
    if (name.empty()) return {};
    if (name.find('/') != string::npos) {
        if (is_executable(name)) return fs::absolute(name);
        return {};
    }

    vector<string> dirs;
    boost::split(dirs, search_path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        if (is_executable(candidate)) return candidate;
    }
    return {};
}

string current_timestamp() {
    auto now = chrono::system_clock::now();
    time_t seconds = chrono::system_clock::to_time_t(now);
    auto millis = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    struct tm utc;
    gmtime_r(&seconds, &utc);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    return fmt::format("{}.{:03d}Z", buf, millis);
}

string random_uuid() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

string slugify(const string &title) {
    string slug;
    for (char ch : title) {
        if (isalnum((unsigned char)ch)) {
            slug += (char)tolower((unsigned char)ch);
        } else if (!slug.empty() && slug.back() != '-') {
            slug += '-';
        }
    }
    boost::trim_right_if(slug, boost::is_any_of("-"));
    if (slug.size() > 40) {
        slug.resize(40);
        boost::trim_right_if(slug, boost::is_any_of("-"));
    }
    return slug.empty() ? "lab" : slug;
}

md5_digest &md5_digest::update(const string &data) {
    md5.process_bytes(data.data(), data.size());
    return *this;
}

string md5_digest::hex() {
    boost::uuids::detail::md5::digest_type digest;
    md5.get_digest(digest);
    const auto *bytes = reinterpret_cast<const unsigned char *>(&digest[0]);
    string result;
    for (size_t i = 0; i < sizeof(digest); ++i)
        result += fmt::format("{:02x}", bytes[i]);
    return result;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace grader
