#pragma once

#include "cst/context.hpp"
#include "cst/utility.hpp"
#include "cst/value.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <string>

namespace construe {

/**
 * @brief Small expression language evaluated against a Context.
 *
 * Expressions built from fields, constants and operators are inspectable, so
 * the compiler can reason about them. `lambda_` wraps an opaque callback and
 * makes the enclosing node ineligible for compilation.
 */
class Expr {
public:
    using Fn = std::function<Result<Value>(const Context &ctx, const Value *obj)>;

    Expr();
    Expr(Value constant);
    template <std::integral T>
    Expr(T v) : Expr(Value(v)) {
    }
    Expr(double v) : Expr(Value(v)) {
    }
    Expr(const char *text) : Expr(Value(text)) {
    }

    /**
     * @brief Evaluates the expression.
     * @param ctx Context of the running construct.
     * @param obj The current object for `obj_()`, e.g. the element just parsed by a repeat.
     */
    Result<Value> eval(const Context &ctx, const Value *obj = nullptr) const;

    /** @brief True when no opaque callback appears anywhere in the tree. */
    bool is_static() const;

    /** @brief The value of a constant expression, or nullptr. */
    const Value *constant() const;

    /** @brief Member access on a container valued expression. */
    Expr operator[](std::string key) const;

    std::string str() const;

    struct Node;

private:
    explicit Expr(std::shared_ptr<const Node> node) : node_(std::move(node)) {
    }

    friend Expr this_(std::string name);
    friend Expr parent_(std::string name);
    friend Expr obj_();
    friend Expr index_();
    friend Expr len_(const Expr &of);
    friend Expr lambda_(Fn fn);
    friend Expr make_binary(int op, const Expr &lhs, const Expr &rhs);
    friend Expr make_unary(int op, const Expr &operand);

    std::shared_ptr<const Node> node_;
};

/** @brief Field of the current context, searched outward through enclosing frames. */
Expr this_(std::string name);
/** @brief Field looked up starting at the enclosing frame. */
Expr parent_(std::string name);
/** @brief The current object (repeat element, adapted value). */
Expr obj_();
/** @brief The nearest repetition index. */
Expr index_();
Expr len_(const Expr &of);
Expr lambda_(Expr::Fn fn);

Expr operator+(const Expr &lhs, const Expr &rhs);
Expr operator-(const Expr &lhs, const Expr &rhs);
Expr operator*(const Expr &lhs, const Expr &rhs);
Expr operator/(const Expr &lhs, const Expr &rhs);
Expr operator%(const Expr &lhs, const Expr &rhs);
Expr operator&(const Expr &lhs, const Expr &rhs);
Expr operator|(const Expr &lhs, const Expr &rhs);
Expr operator==(const Expr &lhs, const Expr &rhs);
Expr operator!=(const Expr &lhs, const Expr &rhs);
Expr operator<(const Expr &lhs, const Expr &rhs);
Expr operator<=(const Expr &lhs, const Expr &rhs);
Expr operator>(const Expr &lhs, const Expr &rhs);
Expr operator>=(const Expr &lhs, const Expr &rhs);
Expr operator&&(const Expr &lhs, const Expr &rhs);
Expr operator||(const Expr &lhs, const Expr &rhs);
Expr operator!(const Expr &operand);
Expr operator-(const Expr &operand);

} // namespace construe
