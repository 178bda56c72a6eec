#include "glob_pattern.hpp"

namespace cachex {

namespace {

bool is_regex_meta(char c) {
    switch (c) {
        case '\\': case '.': case '+': case '^': case '$':
        case '{': case '}': case '(': case ')': case '|': case ']':
            return true;
        default:
            return false;
    }
}

std::string to_regex(std::string_view glob) {
    std::string re = "^";
    for (size_t i = 0; i < glob.size(); i++) {
        char c = glob[i];
        if (c == '*') {
            re += ".*";
        } else if (c == '?') {
            re += '.';
        } else if (c == '[') {
            // "[]x]" keeps the leading ']' inside the class, as in POSIX
            size_t j = i + 1;
            if (j < glob.size() && glob[j] == '^') j++;
            if (j < glob.size() && glob[j] == ']') j++;
            size_t close = glob.find(']', j);
            if (close == std::string_view::npos) {
                re += "\\[";    // unterminated class matches a literal '['
            } else {
                re.append(glob.substr(i, close - i + 1));
                i = close;
            }
        } else {
            if (is_regex_meta(c)) re += '\\';
            re += c;
        }
    }
    re += '$';
    return re;
}

std::string to_like(std::string_view glob) {
    std::string like;
    like.reserve(glob.size() + 8);
    for (char c : glob) {
        switch (c) {
            case '%':  like += "\\%"; break;
            case '_':  like += "\\_"; break;
            case '*':  like += '%'; break;
            case '?':  like += '_'; break;
            case '\\': like += "\\\\"; break;
            default:   like += c; break;
        }
    }
    return like;
}

} // namespace

SqlPattern glob_to_sql(std::string_view glob) {
    if (glob.find('[') != std::string_view::npos) return {to_regex(glob), true};
    return {to_like(glob), false};
}

} // namespace cachex
