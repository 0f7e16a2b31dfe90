#include "registry/cache_port.h"

namespace tracescore::registry {

bool MatchesPattern(const std::string& pattern, const std::string& key) {
    size_t p = 0;
    size_t k = 0;
    size_t star = std::string::npos;
    size_t resume = 0;

    while (k < key.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = k;
        } else if (p < pattern.size() && pattern[p] == key[k]) {
            ++p;
            ++k;
        } else if (star != std::string::npos) {
            p = star + 1;
            k = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

}  // namespace tracescore::registry
