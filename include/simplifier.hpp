#pragma once

#include "ast.hpp"

namespace texpr {

// Свёртка констант: каждое поддерево без переменных, значение которого
// определено, заменяется числом (см. rationalToNode).
// Поддеревья с переменными и неопределённые операции (1/0, 0.5!) сохраняются,
// а их константные части сворачиваются: x(2 + 3) -> x \cdot 5, 2x + 1/0 без изменений.
// Исходное дерево не меняется.
AstNodePtr simplified(const AstNode& node);

} // namespace texpr
