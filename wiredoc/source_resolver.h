#ifndef WIREDOC_SOURCE_RESOLVER_H
#define WIREDOC_SOURCE_RESOLVER_H

#include <string>
#include <vector>

namespace WireDoc {

// Maps a tab name to the path of its plan PDF
class SourceResolver {
public:
    virtual ~SourceResolver() = default;

    // Throws BuildError(UnresolvedSource) when the tab has no single source
    virtual std::string resolve(const std::string& tab) const = 0;
};

// Resolves by file name: {tab} in the pattern is replaced by the tab name and
// the result is matched, shell-glob style, against the files in a directory.
// Exactly one file must match.
class PatternSourceResolver : public SourceResolver {
public:
    PatternSourceResolver(std::string directory, std::string pattern);

    std::string resolve(const std::string& tab) const override;

    // Sorted file names in directory matching the pattern for tab
    std::vector<std::string> candidates(const std::string& tab) const;

private:
    std::string directory_;
    std::string pattern_;
};

// Replaces every "{tab}" in pattern
std::string expand_tab_pattern(const std::string& pattern, const std::string& tab);

} // namespace WireDoc

#endif // WIREDOC_SOURCE_RESOLVER_H
