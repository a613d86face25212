#include "wiredoc/source_resolver.h"

#include <algorithm>
#include <filesystem>

#include <fnmatch.h>

#include "wiredoc/build_error.h"

namespace fs = std::filesystem;

namespace WireDoc {

std::string expand_tab_pattern(const std::string& pattern, const std::string& tab) {
    static const std::string PLACEHOLDER = "{tab}";
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t hit = pattern.find(PLACEHOLDER, pos);
        if (hit == std::string::npos) {
            out += pattern.substr(pos);
            break;
        }
        out += pattern.substr(pos, hit - pos);
        out += tab;
        pos = hit + PLACEHOLDER.size();
    }
    return out;
}

PatternSourceResolver::PatternSourceResolver(std::string directory, std::string pattern)
    : directory_(std::move(directory)), pattern_(std::move(pattern)) {}

std::vector<std::string> PatternSourceResolver::candidates(const std::string& tab) const {
    std::vector<std::string> names;
    std::string glob = expand_tab_pattern(pattern_, tab);

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) return names;

    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        std::string name = entry.path().filename().string();
        if (fnmatch(glob.c_str(), name.c_str(), 0) == 0) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string PatternSourceResolver::resolve(const std::string& tab) const {
    std::string glob = expand_tab_pattern(pattern_, tab);

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        throw BuildError(issue(ErrorCode::UNRESOLVED_SOURCE).in_tab(tab).at_path(directory_)
            .because("plan PDF directory does not exist"));
    }

    std::vector<std::string> names = candidates(tab);
    if (names.empty()) {
        throw BuildError(issue(ErrorCode::UNRESOLVED_SOURCE).in_tab(tab).at_path(directory_)
            .because("no file matches '" + glob + "'"));
    }
    if (names.size() > 1) {
        std::string list;
        for (const auto& n : names) {
            if (!list.empty()) list += ", ";
            list += n;
        }
        throw BuildError(issue(ErrorCode::UNRESOLVED_SOURCE).in_tab(tab).at_path(directory_)
            .because("several files match '" + glob + "': " + list));
    }

    return (fs::path(directory_) / names.front()).string();
}

} // namespace WireDoc
