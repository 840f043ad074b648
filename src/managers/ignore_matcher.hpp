#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Compiled set of glob-like ignore patterns.
//
// Each pattern is split on '/' into segments of three kinds:
//   LITERAL    plain text, compared exactly
//   GLOB       text containing '*', '?' or '[...]', matched within one segment
//   ANY_DEPTH  "**", zero or more whole segments
//
// A pattern floats (may match any trailing run of a path's segments) unless it
// starts with '/', which anchors it to the matcher's base. A trailing '/' makes
// it match directories only. Patterns are OR-combined; order does not matter.
class IgnoreMatcher {
public:
    // An empty matcher excludes nothing.
    IgnoreMatcher() = default;

    // Compile patterns. Blank patterns and '#' comments are skipped. The first
    // malformed pattern fails the whole set with ErrorKind::PATTERN_SYNTAX.
    // A non-empty `base` scopes the matcher to paths below that directory.
    static Result<IgnoreMatcher> compile(const std::vector<std::string>& patterns,
                                         const std::string& base = "");

    // True if `rel_path` (relative to the walk root, '/'-separated) is
    // excluded, either itself or through an excluded ancestor directory.
    bool is_excluded(const std::string& rel_path, bool is_dir) const;

    // Tests only the entry itself, not its ancestors. For walkers that never
    // descend into excluded directories.
    bool matches_entry(const std::string& rel_path, bool is_dir) const;

    bool empty() const { return rules_.empty(); }
    size_t size() const { return rules_.size(); }

    // Text of every compiled pattern, as written
    std::vector<std::string> patterns() const;

private:
    struct Segment {
        enum Kind { LITERAL, GLOB, ANY_DEPTH } kind = LITERAL;
        std::string text;
    };

    struct Rule {
        std::string source;
        std::vector<Segment> segments;
        bool anchored = false;
        bool dir_only = false;
    };

    static Result<Rule> parse_rule(const std::string& pattern);
    static bool match_segments(const std::vector<Segment>& segs, size_t si,
                               const std::vector<std::string>& parts, size_t pi,
                               size_t end);
    static bool match_glob(const std::string& glob, const std::string& text);
    static bool match_class(const std::string& glob, size_t& gi, char ch);

    // Strip base_parts_ from the front of `parts`; false if not below base.
    bool strip_base(std::vector<std::string>& parts) const;
    bool any_rule_matches(const std::vector<std::string>& parts, size_t end,
                          bool is_dir) const;

    std::vector<std::string> base_parts_;
    std::vector<Rule> rules_;
};

// Split a relative path into its segments, dropping empty and "." parts.
std::vector<std::string> split_rel_path(const std::string& rel_path);
