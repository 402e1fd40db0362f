#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace pj {
namespace cli_utils {

// Number of single-character insertions, deletions and substitutions turning
// `a` into `b`.
inline std::size_t edit_distance(const std::string& a, const std::string& b) {
    std::vector<std::size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (std::size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            std::size_t substitute = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, substitute});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// Closest known option to `arg`, or "" when nothing is close enough
// (3 edits, or 40% of the argument length when that is larger).
inline std::string closest_option(const std::string& arg, const std::vector<std::string>& options) {
    std::string best;
    std::size_t best_distance = 0;
    for (const auto& option : options) {
        std::size_t d = edit_distance(arg, option);
        if (best.empty() or d < best_distance) {
            best = option;
            best_distance = d;
        }
    }
    std::size_t threshold = std::max<std::size_t>(3, arg.size() * 2 / 5);
    return best_distance <= threshold ? best : std::string();
}

inline std::string unknown_argument_message(const std::string& arg,
                                            const std::vector<std::string>& options) {
    std::string msg = "Unknown argument: " + arg;
    std::string suggestion = closest_option(arg, options);
    if (not suggestion.empty()) msg += "\n  Did you mean '" + suggestion + "'?";
    return msg;
}

}  // namespace cli_utils
}  // namespace pj
