#pragma once

#include "fine2d/graphics/types.hpp"

#include <optional>
#include <vector>

namespace fine2d {

/**
 * @brief Stack of transforms that is never empty
 *
 * The base entry is the identity. Popping the base is a no-op.
 */
class MatrixStack {
public:
    MatrixStack();

    /// Push a matrix, or a copy of the top when none is given
    void push(std::optional<Matrix4> matrix = std::nullopt);

    void pop();

    const Matrix4& top() const { return stack_.back(); }

    /// Replace the top
    void set(const Matrix4& matrix) { stack_.back() = matrix; }

    /// Premultiply the top: top = matrix * top
    void apply(const Matrix4& matrix) { stack_.back() = matrix * stack_.back(); }

    /// Reset the top to identity
    void origin() { stack_.back() = Matrix4(1.0f); }

    size_t depth() const { return stack_.size(); }

private:
    std::vector<Matrix4> stack_;
};

} // namespace fine2d
