#ifndef OPLAWS_FORMAT_ERROR_HPP
#define OPLAWS_FORMAT_ERROR_HPP

#include <cstddef>
#include <string>

namespace oplaws {

// --- FormatError: a malformed operation reference in law text ---
//
// Produced by the law-text reader (e.g. an unclosed `name` quote) and
// collected rather than thrown, so one pass can report every bad law.

struct FormatError {
    std::string description;
    std::string context;
    std::size_t position{0};
    std::string focus;

    std::string to_string() const {
        return description + ".  At " + std::to_string(position) + " found " +
               focus + ".  In " + context;
    }

    bool operator==(const FormatError&) const = default;
};

} // namespace oplaws

#endif // OPLAWS_FORMAT_ERROR_HPP
