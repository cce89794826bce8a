#include "ignore_utils.hpp"
#include <algorithm>
#include <cctype>
#include <fnmatch.h>

namespace {

void trim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

bool has_glob(const std::string& pat) { return pat.find_first_of("*?[") != std::string::npos; }

} // namespace

namespace ignore {

bool matches(const std::filesystem::path& path, const std::vector<std::string>& patterns) {
    const std::string full = path.generic_string();
    const std::string name = path.filename().generic_string();

    for (const auto& pat : patterns) {
        if (pat.empty())
            continue;
        const std::string& subject = pat.find('/') != std::string::npos ? full : name;
        if (!has_glob(pat)) {
            if (subject == pat)
                return true;
            continue;
        }
        if (fnmatch(pat.c_str(), subject.c_str(), 0) == 0)
            return true;
    }
    return false;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos)
            comma = value.size();
        std::string item = value.substr(start, comma - start);
        trim(item);
        if (!item.empty())
            out.push_back(item);
        start = comma + 1;
    }
    return out;
}

} // namespace ignore
