#pragma once
// Redis glob -> SQL predicate.
//
// Patterns with a bracket class ("a[12]*") become an anchored POSIX regex
// for the ~ operator; everything else becomes a LIKE pattern. A backslash in
// the glob is always a literal character.
#include <string>
#include <string_view>

namespace cachex {

struct SqlPattern {
    std::string pattern;
    bool regex = false;

    [[nodiscard]] const char* op() const { return regex ? "~" : "LIKE"; }
};

SqlPattern glob_to_sql(std::string_view glob);

} // namespace cachex
