#include "fine2d/graphics/matrix_stack.hpp"
#include "fine2d/core/logging.hpp"

namespace fine2d {

MatrixStack::MatrixStack()
    : stack_{Matrix4(1.0f)} {
}

void MatrixStack::push(std::optional<Matrix4> matrix) {
    stack_.push_back(matrix ? *matrix : stack_.back());
}

void MatrixStack::pop() {
    if (stack_.size() > 1) {
        stack_.pop_back();
    } else {
        FINE2D_TRACE(LogCategory::Render, "MatrixStack::pop at base ignored");
    }
}

} // namespace fine2d
