#include "parse_error.hpp"

namespace texpr {

namespace {
// Сообщение вида "<текст> (позиция N)"
std::string withPosition(const std::string& message, std::size_t position) {
    return message + " (позиция " + std::to_string(position) + ")";
}
}

ParseError::ParseError(ParseErrorKind kind, std::size_t position, const std::string& message)
    : std::runtime_error(withPosition(message, position)), errorKind(kind), errorPosition(position) {}

const char* toString(ParseErrorKind kind) {
    switch (kind) {
    case ParseErrorKind::ExpectedAtom:
        return "ExpectedAtom";
    case ParseErrorKind::UnmatchedParen:
        return "UnmatchedParen";
    case ParseErrorKind::UnexpectedToken:
        return "UnexpectedToken";
    case ParseErrorKind::InvalidFactorialPosition:
        return "InvalidFactorialPosition";
    case ParseErrorKind::NestingTooDeep:
        return "NestingTooDeep";
    }
    return "Unknown";
}

} // namespace texpr
