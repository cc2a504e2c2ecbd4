#include "semver.hpp"
#include "utils.hpp"
#include <sstream>
#include <vector>
#include <cctype>

namespace {

// A version as written in a constraint: "1", "1.2", "1.2.x", "1.2.3".
// `given` counts the leading numeric components.
struct Partial {
    SemVer v;
    int given = 0;
};

struct Bound {
    SemVer v;
    bool inclusive = true;
};

struct Range {
    std::optional<Bound> lo;
    std::optional<Bound> hi;
};

bool is_wildcard(const std::string& part) {
    return part == "x" || part == "X" || part == "*";
}

std::optional<int> parse_component(const std::string& part) {
    if (part.empty()) return std::nullopt;
    for (char c : part) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    int n = safe_stoi(part, -1);
    if (n < 0) return std::nullopt;
    return n;
}

std::optional<Partial> parse_partial(std::string text) {
    if (!text.empty() && (text[0] == 'v' || text[0] == 'V')) text.erase(0, 1);
    if (text.empty() || is_wildcard(text)) return Partial{};

    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, '.')) parts.push_back(part);
    if (parts.empty() || parts.size() > 3) return std::nullopt;

    Partial p;
    int* slots[3] = {&p.v.major, &p.v.minor, &p.v.patch};
    bool wild = false;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (is_wildcard(parts[i])) {
            wild = true;
            continue;
        }
        if (wild) return std::nullopt;   // "1.x.3"
        auto n = parse_component(parts[i]);
        if (!n) return std::nullopt;
        *slots[i] = *n;
        p.given = static_cast<int>(i) + 1;
    }
    return p;
}

// Smallest version above every version matching the first `given` components.
SemVer bump(const Partial& p) {
    SemVer v = p.v;
    if (p.given <= 1) return {v.major + 1, 0, 0};
    if (p.given == 2) return {v.major, v.minor + 1, 0};
    return {v.major, v.minor, v.patch + 1};
}

Range exact_range(const Partial& p) {
    if (p.given == 0) return {};
    if (p.given == 3) return {Bound{p.v, true}, Bound{p.v, true}};
    return {Bound{p.v, true}, Bound{bump(p), false}};
}

Range caret_range(const Partial& p) {
    Range r{Bound{p.v, true}, std::nullopt};
    if (p.given == 0) return {};
    if (p.v.major > 0 || p.given == 1) {
        r.hi = Bound{{p.v.major + 1, 0, 0}, false};
    } else if (p.v.minor > 0 || p.given == 2) {
        r.hi = Bound{{0, p.v.minor + 1, 0}, false};
    } else {
        r.hi = Bound{{0, 0, p.v.patch + 1}, false};
    }
    return r;
}

Range tilde_range(const Partial& p) {
    if (p.given == 0) return {};
    if (p.given == 1) return {Bound{p.v, true}, Bound{{p.v.major + 1, 0, 0}, false}};
    return {Bound{p.v, true}, Bound{{p.v.major, p.v.minor + 1, 0}, false}};
}

using RangeFn = Range (*)(const Partial&);

struct OperatorRule {
    const char* prefix;
    RangeFn to_range;
};

// Longer prefixes first so ">=" wins over ">".
const OperatorRule kOperators[] = {
    {">=", [](const Partial& p) { return Range{Bound{p.v, true}, std::nullopt}; }},
    {"<=", [](const Partial& p) {
         if (p.given == 0) return Range{};
         if (p.given == 3) return Range{std::nullopt, Bound{p.v, true}};
         return Range{std::nullopt, Bound{bump(p), false}};
     }},
    {">", [](const Partial& p) {
         if (p.given == 3) return Range{Bound{p.v, false}, std::nullopt};
         if (p.given == 0) return Range{};
         return Range{Bound{bump(p), true}, std::nullopt};
     }},
    {"<", [](const Partial& p) { return Range{std::nullopt, Bound{p.v, false}}; }},
    {"^", caret_range},
    {"~", tilde_range},
    {"=", exact_range},
    {"",  exact_range},
};

std::optional<Range> parse_term(const std::string& term) {
    for (const auto& rule : kOperators) {
        std::string prefix(rule.prefix);
        if (term.compare(0, prefix.size(), prefix) != 0) continue;
        auto partial = parse_partial(term.substr(prefix.size()));
        if (!partial) return std::nullopt;
        return rule.to_range(*partial);
    }
    return std::nullopt;
}

bool in_range(const SemVer& v, const Range& r) {
    if (r.lo) {
        int c = compare_semver(v, r.lo->v);
        if (c < 0 || (c == 0 && !r.lo->inclusive)) return false;
    }
    if (r.hi) {
        int c = compare_semver(v, r.hi->v);
        if (c > 0 || (c == 0 && !r.hi->inclusive)) return false;
    }
    return true;
}

std::vector<std::string> split_terms(const std::string& constraint) {
    std::vector<std::string> terms;
    std::stringstream ss(constraint);
    std::string term;
    while (ss >> term) terms.push_back(term);
    return terms;
}

} // namespace

std::optional<SemVer> parse_semver(const std::string& text) {
    std::string s = text;
    trim(s);
    auto cut = s.find_first_of("-+");
    if (cut != std::string::npos) s.erase(cut);
    auto partial = parse_partial(s);
    if (!partial || partial->given == 0) return std::nullopt;
    return partial->v;
}

int compare_semver(const SemVer& a, const SemVer& b) {
    if (a.major != b.major) return a.major < b.major ? -1 : 1;
    if (a.minor != b.minor) return a.minor < b.minor ? -1 : 1;
    if (a.patch != b.patch) return a.patch < b.patch ? -1 : 1;
    return 0;
}

bool is_valid_constraint(const std::string& constraint) {
    for (const auto& term : split_terms(constraint)) {
        if (!parse_term(term)) return false;
    }
    return true;
}

bool satisfies(const std::string& version, const std::string& constraint) {
    auto terms = split_terms(constraint);
    if (terms.empty()) return true;

    auto v = parse_semver(version);
    if (!v) return false;

    for (const auto& term : terms) {
        auto range = parse_term(term);
        if (!range || !in_range(*v, *range)) return false;
    }
    return true;
}
