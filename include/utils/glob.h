// String and gitignore-style glob helpers used for snapshot file filtering.
#pragma once

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <vector>

namespace hubcache {

inline std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

inline std::string trimAscii(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

inline bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline std::vector<std::string> splitCsv(const std::string& csv) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : csv) {
        if (c == ',') {
            auto token = trimAscii(cur);
            if (!token.empty()) out.push_back(token);
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    auto token = trimAscii(cur);
    if (!token.empty()) out.push_back(token);
    return out;
}

// `**` matches across '/', `*` stays within one path segment, `?` is a single non-'/' character.
inline std::string globToRegex(const std::string& pattern) {
    std::string out;
    out.reserve(pattern.size() * 2);
    out.push_back('^');
    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        switch (c) {
            case '*':
                if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                    // "**/" also matches zero directories
                    if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                        out.append("(?:.*/)?");
                        i += 2;
                    } else {
                        out.append(".*");
                        ++i;
                    }
                } else {
                    out.append("[^/]*");
                }
                break;
            case '?':
                out.append("[^/]");
                break;
            case '.':
            case '\\':
            case '+':
            case '(':
            case ')':
            case '[':
            case ']':
            case '{':
            case '}':
            case '^':
            case '$':
            case '|':
                out.push_back('\\');
                out.push_back(c);
                break;
            default:
                out.push_back(c);
        }
    }
    out.push_back('$');
    return out;
}

inline bool globMatch(const std::string& pattern, const std::string& value) {
    if (pattern == "**") return true;
    try {
        std::regex re(globToRegex(pattern));
        return std::regex_match(value, re);
    } catch (const std::regex_error&) {
        return false;
    }
}

inline bool globMatchAny(const std::vector<std::string>& patterns, const std::string& value) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const std::string& p) { return globMatch(p, value); });
}

// Empty allow list admits everything; ignore list always wins.
inline bool passesPatternFilter(const std::string& path,
                                const std::vector<std::string>& allow_patterns,
                                const std::vector<std::string>& ignore_patterns) {
    if (!allow_patterns.empty() && !globMatchAny(allow_patterns, path)) return false;
    return !globMatchAny(ignore_patterns, path);
}

}  // namespace hubcache
