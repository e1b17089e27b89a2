/*
 * Copyright 2025 Headlamp Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// String Utilities - Option name normalization and fuzzy matching

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace headlamp::core {

/// Calculate Levenshtein distance between two strings
/// Returns the minimum number of single-character edits (insertions, deletions, substitutions)
/// required to change one string into the other
[[nodiscard]] inline size_t levenshtein_distance(std::string_view s1, std::string_view s2) {
    const size_t len1 = s1.length();
    const size_t len2 = s2.length();

    if (len1 == 0)
        return len2;
    if (len2 == 0)
        return len1;

    // Two rows are enough: row i only depends on row i-1
    std::vector<size_t> prev_row(len2 + 1);
    std::vector<size_t> curr_row(len2 + 1);

    for (size_t j = 0; j <= len2; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= len1; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= len2; ++j) {
            if (s1[i - 1] == s2[j - 1]) {
                curr_row[j] = prev_row[j - 1];
            } else {
                curr_row[j] = 1 + std::min({
                                      prev_row[j],      // delete
                                      curr_row[j - 1],  // insert
                                      prev_row[j - 1]   // substitute
                                  });
            }
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[len2];
}

/// Find option names close to a mistyped one, closest first
/// Exact matches are excluded (distance 0)
[[nodiscard]] inline std::vector<std::string> find_similar_strings(
    std::string_view target, const std::vector<std::string>& candidates, size_t max_distance = 3) {
    std::vector<std::pair<std::string, size_t>> matches;

    for (const auto& candidate : candidates) {
        size_t distance = levenshtein_distance(target, candidate);
        if (distance <= max_distance && distance > 0) {
            matches.emplace_back(candidate, distance);
        }
    }

    // Stable so that ties keep declaration order of the option table
    std::stable_sort(matches.begin(), matches.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    std::vector<std::string> result;
    result.reserve(matches.size());
    for (const auto& [str, _] : matches) {
        result.push_back(str);
    }

    return result;
}

/// ASCII lower-case copy
[[nodiscard]] inline std::string to_lower(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Strip leading and trailing ASCII whitespace
[[nodiscard]] inline std::string_view trim(std::string_view s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

/// Split a comma-separated list, trimming entries and dropping empty ones
[[nodiscard]] inline std::vector<std::string> split_list(std::string_view s, char delimiter = ',') {
    std::vector<std::string> result;
    while (true) {
        size_t pos = s.find(delimiter);
        std::string_view item = trim(s.substr(0, pos));
        if (!item.empty()) {
            result.emplace_back(item);
        }
        if (pos == std::string_view::npos) {
            break;
        }
        s.remove_prefix(pos + 1);
    }
    return result;
}

/// Map an environment variable suffix onto the kebab-case option naming scheme
/// e.g. "OIDC_CLIENT_ID" -> "oidc-client-id"
[[nodiscard]] inline std::string env_suffix_to_option_name(std::string_view suffix) {
    std::string name = to_lower(suffix);
    std::replace(name.begin(), name.end(), '_', '-');
    return name;
}

/// Inverse of env_suffix_to_option_name, used for help text and diagnostics
[[nodiscard]] inline std::string option_name_to_env_suffix(std::string_view name) {
    std::string suffix{name};
    std::transform(suffix.begin(), suffix.end(), suffix.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::toupper(c));
    });
    return suffix;
}

}  // namespace headlamp::core
