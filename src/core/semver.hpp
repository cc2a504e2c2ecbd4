#pragma once

#include <string>
#include <optional>

// major.minor.patch; a leading "v" and any pre-release/build suffix are ignored.
struct SemVer {
    int major = 0;
    int minor = 0;
    int patch = 0;
};

std::optional<SemVer> parse_semver(const std::string& text);

// -1, 0, 1
int compare_semver(const SemVer& a, const SemVer& b);

// Does `version` (usually the nearest git tag) satisfy `constraint`?
//   ""  "*"           anything
//   "1.2.3" "=1.2.3"  exact
//   ">=1.2" ">1" "<=2.0.0" "<2"
//   "^1.2"            >=1.2.0 <2.0.0   (^0.3 means >=0.3.0 <0.4.0)
//   "~1.2.3"          >=1.2.3 <1.3.0
//   "1.x" "1.2.x"     wildcard components
// Space-separated constraints must all hold. An unparsable version never
// satisfies a non-empty constraint.
bool satisfies(const std::string& version, const std::string& constraint);

// True if `constraint` is well formed (used to validate config up front).
bool is_valid_constraint(const std::string& constraint);
