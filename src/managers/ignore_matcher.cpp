#include "ignore_matcher.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

std::vector<std::string> split_rel_path(const std::string& rel_path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : rel_path) {
        if (c == '/') {
            if (!current.empty() && current != ".") parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty() && current != ".") parts.push_back(current);
    return parts;
}

// ── Compilation ─────────────────────────────────────────────

// Checks one segment's wildcard syntax and reports whether it needs glob matching.
static Result<bool> scan_segment(const std::string& seg, const std::string& pattern) {
    bool has_wildcard = false;
    for (size_t i = 0; i < seg.size(); ++i) {
        char c = seg[i];
        if (c == '\\') {
            ++i;   // trailing backslashes are rejected before splitting
            continue;
        }
        if (c == '*') {
            if (i + 1 < seg.size() && seg[i + 1] == '*') {
                return Result<bool>::Err(ErrorKind::PATTERN_SYNTAX,
                    fmt::format("'{}': '**' must be a whole path segment", pattern));
            }
            has_wildcard = true;
        } else if (c == '?') {
            has_wildcard = true;
        } else if (c == '[') {
            size_t j = i + 1;
            if (j < seg.size() && (seg[j] == '!' || seg[j] == '^')) ++j;
            if (j < seg.size() && seg[j] == ']') ++j;   // literal ']' first in class
            while (j < seg.size() && seg[j] != ']') {
                if (seg[j] == '\\') ++j;
                ++j;
            }
            if (j >= seg.size()) {
                return Result<bool>::Err(ErrorKind::PATTERN_SYNTAX,
                    fmt::format("'{}': unterminated character class", pattern));
            }
            has_wildcard = true;
            i = j;
        }
    }
    return Result<bool>::Ok(has_wildcard);
}

static std::string unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) ++i;
        out += s[i];
    }
    return out;
}

Result<IgnoreMatcher::Rule> IgnoreMatcher::parse_rule(const std::string& pattern) {
    Rule rule;
    rule.source = pattern;
    std::string body = pattern;

    if (body[0] == '!') {
        return Result<Rule>::Err(ErrorKind::PATTERN_SYNTAX,
            fmt::format("'{}': negated patterns are not supported (escape a literal '!' as '\\!')",
                        pattern));
    }

    // Count trailing backslashes: an odd run escapes nothing
    size_t backslashes = 0;
    for (auto it = body.rbegin(); it != body.rend() && *it == '\\'; ++it) ++backslashes;
    if (backslashes % 2 == 1) {
        return Result<Rule>::Err(ErrorKind::PATTERN_SYNTAX,
            fmt::format("'{}': trailing escape character", pattern));
    }

    if (body[0] == '/') {
        rule.anchored = true;
        body.erase(0, 1);
    }
    if (!body.empty() && body.back() == '/') {
        rule.dir_only = true;
        body.pop_back();
    }
    if (body.empty()) {
        return Result<Rule>::Err(ErrorKind::PATTERN_SYNTAX,
            fmt::format("'{}': pattern has no path segments", pattern));
    }

    size_t start = 0;
    while (start <= body.size()) {
        size_t slash = body.find('/', start);
        if (slash == std::string::npos) slash = body.size();
        std::string seg = body.substr(start, slash - start);
        start = slash + 1;

        if (seg.empty()) {
            return Result<Rule>::Err(ErrorKind::PATTERN_SYNTAX,
                fmt::format("'{}': empty path segment", pattern));
        }
        if (seg == "." || seg == "..") {
            return Result<Rule>::Err(ErrorKind::PATTERN_SYNTAX,
                fmt::format("'{}': '{}' segments are not allowed", pattern, seg));
        }

        Segment s;
        if (seg == "**") {
            // Consecutive '**' segments collapse into one
            if (!rule.segments.empty() && rule.segments.back().kind == Segment::ANY_DEPTH) {
                continue;
            }
            s.kind = Segment::ANY_DEPTH;
        } else {
            auto scanned = scan_segment(seg, pattern);
            if (scanned.is_err()) return Result<Rule>::Err(scanned);
            if (scanned.value) {
                s.kind = Segment::GLOB;
                s.text = seg;
            } else {
                s.kind = Segment::LITERAL;
                s.text = unescape(seg);
            }
        }
        rule.segments.push_back(std::move(s));
    }

    return Result<Rule>::Ok(std::move(rule));
}

Result<IgnoreMatcher> IgnoreMatcher::compile(const std::vector<std::string>& patterns,
                                             const std::string& base) {
    IgnoreMatcher matcher;
    matcher.base_parts_ = split_rel_path(base);

    for (const auto& raw : patterns) {
        std::string line = raw;
        trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto rule = parse_rule(line);
        if (rule.is_err()) {
            return Result<IgnoreMatcher>::Err(rule);
        }
        matcher.rules_.push_back(std::move(rule.value));
    }

    return Result<IgnoreMatcher>::Ok(std::move(matcher));
}

std::vector<std::string> IgnoreMatcher::patterns() const {
    std::vector<std::string> out;
    out.reserve(rules_.size());
    for (const auto& r : rules_) out.push_back(r.source);
    return out;
}

// ── Matching ────────────────────────────────────────────────

bool IgnoreMatcher::match_class(const std::string& glob, size_t& gi, char ch) {
    // gi points at '['; on return it points past the closing ']'
    size_t i = gi + 1;
    bool negate = false;
    if (i < glob.size() && (glob[i] == '!' || glob[i] == '^')) {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (i < glob.size() && (glob[i] != ']' || first)) {
        first = false;
        char lo = glob[i];
        if (lo == '\\' && i + 1 < glob.size()) lo = glob[++i];

        if (i + 2 < glob.size() && glob[i + 1] == '-' && glob[i + 2] != ']') {
            char hi = glob[i + 2];
            if (lo <= ch && ch <= hi) matched = true;
            i += 3;
        } else {
            if (lo == ch) matched = true;
            ++i;
        }
    }
    gi = i + 1;
    return matched != negate;
}

bool IgnoreMatcher::match_glob(const std::string& glob, const std::string& text) {
    size_t g = 0, t = 0;
    size_t star_g = std::string::npos, star_t = 0;

    while (t < text.size()) {
        if (g < glob.size()) {
            char c = glob[g];
            if (c == '*') {
                star_g = g++;
                star_t = t;
                continue;
            }
            if (c == '?') {
                ++g;
                ++t;
                continue;
            }
            if (c == '[') {
                size_t next = g;
                if (match_class(glob, next, text[t])) {
                    g = next;
                    ++t;
                    continue;
                }
            } else if (c == '\\' && g + 1 < glob.size()) {
                if (glob[g + 1] == text[t]) {
                    g += 2;
                    ++t;
                    continue;
                }
            } else if (c == text[t]) {
                ++g;
                ++t;
                continue;
            }
        }

        // Mismatch: let the last '*' swallow one more character
        if (star_g != std::string::npos) {
            g = star_g + 1;
            t = ++star_t;
            continue;
        }
        return false;
    }

    while (g < glob.size() && glob[g] == '*') ++g;
    return g == glob.size();
}

bool IgnoreMatcher::match_segments(const std::vector<Segment>& segs, size_t si,
                                   const std::vector<std::string>& parts, size_t pi,
                                   size_t end) {
    if (si == segs.size()) return pi == end;

    const Segment& seg = segs[si];
    if (seg.kind == Segment::ANY_DEPTH) {
        for (size_t k = pi; k <= end; ++k) {
            if (match_segments(segs, si + 1, parts, k, end)) return true;
        }
        return false;
    }

    if (pi == end) return false;

    bool ok = (seg.kind == Segment::LITERAL) ? parts[pi] == seg.text
                                             : match_glob(seg.text, parts[pi]);
    return ok && match_segments(segs, si + 1, parts, pi + 1, end);
}

bool IgnoreMatcher::strip_base(std::vector<std::string>& parts) const {
    if (base_parts_.empty()) return true;
    if (parts.size() <= base_parts_.size()) return false;
    for (size_t i = 0; i < base_parts_.size(); ++i) {
        if (parts[i] != base_parts_[i]) return false;
    }
    parts.erase(parts.begin(), parts.begin() + base_parts_.size());
    return true;
}

bool IgnoreMatcher::any_rule_matches(const std::vector<std::string>& parts, size_t end,
                                     bool is_dir) const {
    for (const auto& rule : rules_) {
        if (rule.dir_only && !is_dir) continue;

        if (rule.anchored) {
            if (match_segments(rule.segments, 0, parts, 0, end)) return true;
            continue;
        }
        for (size_t start = 0; start < end; ++start) {
            if (match_segments(rule.segments, 0, parts, start, end)) return true;
        }
    }
    return false;
}

bool IgnoreMatcher::matches_entry(const std::string& rel_path, bool is_dir) const {
    if (rules_.empty()) return false;

    auto parts = split_rel_path(rel_path);
    if (parts.empty() || !strip_base(parts)) return false;
    return any_rule_matches(parts, parts.size(), is_dir);
}

bool IgnoreMatcher::is_excluded(const std::string& rel_path, bool is_dir) const {
    if (rules_.empty()) return false;

    auto parts = split_rel_path(rel_path);
    if (parts.empty() || !strip_base(parts)) return false;

    // Every proper prefix is a directory on the way down
    for (size_t end = 1; end <= parts.size(); ++end) {
        bool prefix_is_dir = end < parts.size() || is_dir;
        if (any_rule_matches(parts, end, prefix_is_dir)) return true;
    }
    return false;
}
