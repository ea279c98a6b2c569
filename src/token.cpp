#include "token.hpp"

namespace texpr {

const char* tokenTypeName(TokenType type) {
    switch (type) {
    case TokenType::Number:
        return "число";
    case TokenType::Variable:
        return "переменная";
    case TokenType::Plus:
        return "'+'";
    case TokenType::Minus:
        return "'-'";
    case TokenType::Star:
        return "'*'";
    case TokenType::Cdot:
        return "'\\cdot'";
    case TokenType::Slash:
        return "'/'";
    case TokenType::Caret:
        return "'^'";
    case TokenType::Bang:
        return "'!'";
    case TokenType::LParen:
        return "'('";
    case TokenType::RParen:
        return "')'";
    case TokenType::End:
        return "конец выражения";
    }
    return "?";
}

} // namespace texpr
