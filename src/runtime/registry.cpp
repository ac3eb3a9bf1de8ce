#include "runtime/registry.hpp"
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

adapter_registry::adapter_registry() {
    for (adapter_variant impl : {adapter_variant(python_adapter()), adapter_variant(javascript_adapter()),
                                 adapter_variant(typescript_adapter()), adapter_variant(c_adapter()),
                                 adapter_variant(cpp_adapter()), adapter_variant(go_adapter()),
                                 adapter_variant(java_adapter()), adapter_variant(sql_adapter()),
                                 adapter_variant(bash_adapter())}) {
        language_adapter adapter(impl);
        adapters.emplace(adapter.name(), adapter);
    }

    // clang-format off
    aliases = {
        {"py", "python"}, {"python3", "python"},
        {"js", "javascript"}, {"node", "javascript"},
        {"ts", "typescript"},
        {"c++", "cpp"}, {"cxx", "cpp"},
        {"golang", "go"},
        {"sqlite", "sql"}, {"sqlite3", "sql"},
        {"sh", "bash"}, {"shell", "bash"}
    };
    // clang-format on
}

string adapter_registry::canonical_name(const string &language) const {
    string name = boost::to_lower_copy(boost::trim_copy(language));
    auto alias = aliases.find(name);
    return alias == aliases.end() ? name : alias->second;
}

bool adapter_registry::supports(const string &language) const {
    return adapters.count(canonical_name(language)) > 0;
}

const language_adapter &adapter_registry::find(const string &language) const {
    auto it = adapters.find(canonical_name(language));
    if (it == adapters.end())
        throw toolchain_missing(language, language);
    return it->second;
}

vector<string> adapter_registry::languages() const {
    vector<string> names;
    for (auto &[name, adapter] : adapters)
        names.push_back(name);
    return names;
}

}  // namespace grader
