#include "cst/expr.hpp"

#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <variant>

namespace construe {

namespace {

enum class Op : int { Add, Sub, Mul, Div, Mod, BitAnd, BitOr, Eq, Ne, Lt, Le, Gt, Ge, And, Or, Not, Neg };

std::string_view symbol(Op op) {
    switch (op) {
    case Op::Add:
        return "+";
    case Op::Sub:
    case Op::Neg:
        return "-";
    case Op::Mul:
        return "*";
    case Op::Div:
        return "/";
    case Op::Mod:
        return "%";
    case Op::BitAnd:
        return "&";
    case Op::BitOr:
        return "|";
    case Op::Eq:
        return "==";
    case Op::Ne:
        return "!=";
    case Op::Lt:
        return "<";
    case Op::Le:
        return "<=";
    case Op::Gt:
        return ">";
    case Op::Ge:
        return ">=";
    case Op::And:
        return "&&";
    case Op::Or:
        return "||";
    case Op::Not:
        return "!";
    }
    return "?";
}

} // namespace

struct Expr::Node {
    struct Constant {
        Value value;
    };
    struct Field {
        std::string name;
        bool from_parent;
    };
    struct Obj {};
    struct Index {};
    struct Len {
        Expr of;
    };
    struct Member {
        Expr of;
        std::string key;
    };
    struct Unary {
        Op op;
        Expr operand;
    };
    struct Binary {
        Op op;
        Expr lhs;
        Expr rhs;
    };
    struct Lambda {
        Fn fn;
    };

    std::variant<Constant, Field, Obj, Index, Len, Member, Unary, Binary, Lambda> kind;
};

namespace {

std::optional<double> as_number(const Value &v) {
    if (const auto *i = v.get<int64_t>())
        return static_cast<double>(*i);
    if (const auto *d = v.get<double>())
        return *d;
    if (const auto *b = v.get<bool>())
        return *b ? 1.0 : 0.0;
    return std::nullopt;
}

std::optional<int64_t> as_integer(const Value &v) {
    if (const auto *i = v.get<int64_t>())
        return *i;
    if (const auto *b = v.get<bool>())
        return *b ? 1 : 0;
    return std::nullopt;
}

Result<Value> type_error(const Context &ctx, Op op, const Value &lhs, const Value &rhs) {
    return fail(ErrorKind::ArgumentError, ctx.path(),
                fmt::format("unsupported operands for '{}': {} and {}", symbol(op), lhs.type_name(), rhs.type_name()));
}

Result<Value> overflow_error(const Context &ctx, Op op, int64_t lhs, int64_t rhs) {
    return fail(ErrorKind::ArgumentError, ctx.path(),
                fmt::format("integer overflow in {} {} {}", lhs, symbol(op), rhs));
}

template <typename T>
Result<Value> compare(Op op, const T &a, const T &b) {
    switch (op) {
    case Op::Lt:
        return Value(a < b);
    case Op::Le:
        return Value(a <= b);
    case Op::Gt:
        return Value(a > b);
    default:
        return Value(a >= b);
    }
}

Result<Value> apply(Op op, const Value &lhs, const Value &rhs, const Context &ctx) {
    switch (op) {
    case Op::And:
        return Value(lhs.truthy() && rhs.truthy());
    case Op::Or:
        return Value(lhs.truthy() || rhs.truthy());
    case Op::Eq:
    case Op::Ne: {
        bool equal;
        auto a = as_number(lhs), b = as_number(rhs);
        if (a && b)
            equal = *a == *b;
        else
            equal = lhs == rhs;
        return Value(op == Op::Eq ? equal : !equal);
    }
    case Op::Lt:
    case Op::Le:
    case Op::Gt:
    case Op::Ge: {
        if (auto a = as_number(lhs), b = as_number(rhs); a && b)
            return compare(op, *a, *b);
        if (lhs.holds<std::string>() && rhs.holds<std::string>())
            return compare(op, *lhs.get<std::string>(), *rhs.get<std::string>());
        if (lhs.holds<Bytes>() && rhs.holds<Bytes>())
            return compare(op, *lhs.get<Bytes>(), *rhs.get<Bytes>());
        return type_error(ctx, op, lhs, rhs);
    }
    default:
        break;
    }

    if (op == Op::Add) {
        if (lhs.holds<std::string>() && rhs.holds<std::string>())
            return Value(*lhs.get<std::string>() + *rhs.get<std::string>());
        if (lhs.holds<Bytes>() && rhs.holds<Bytes>()) {
            Bytes out = *lhs.get<Bytes>();
            out.insert(out.end(), rhs.get<Bytes>()->begin(), rhs.get<Bytes>()->end());
            return Value(std::move(out));
        }
    }

    auto a = as_integer(lhs), b = as_integer(rhs);
    if (a && b) {
        int64_t out = 0;
        bool overflow = false;
        switch (op) {
        case Op::Add:
            overflow = __builtin_add_overflow(*a, *b, &out);
            break;
        case Op::Sub:
            overflow = __builtin_sub_overflow(*a, *b, &out);
            break;
        case Op::Mul:
            overflow = __builtin_mul_overflow(*a, *b, &out);
            break;
        case Op::BitAnd:
            return Value(*a & *b);
        case Op::BitOr:
            return Value(*a | *b);
        case Op::Div:
        case Op::Mod:
            if (*b == 0)
                return fail(ErrorKind::ArgumentError, ctx.path(), "division by zero");
            // The quotient of INT64_MIN / -1 does not fit; the remainder is 0.
            if (*b == -1) {
                if (op == Op::Mod)
                    return Value(int64_t{0});
                overflow = __builtin_sub_overflow(int64_t{0}, *a, &out);
                break;
            }
            return Value(op == Op::Div ? *a / *b : *a % *b);
        default:
            return type_error(ctx, op, lhs, rhs);
        }
        if (overflow)
            return overflow_error(ctx, op, *a, *b);
        return Value(out);
    }

    auto x = as_number(lhs), y = as_number(rhs);
    if (x && y) {
        switch (op) {
        case Op::Add:
            return Value(*x + *y);
        case Op::Sub:
            return Value(*x - *y);
        case Op::Mul:
            return Value(*x * *y);
        case Op::Div:
            if (*y == 0.0)
                return fail(ErrorKind::ArgumentError, ctx.path(), "division by zero");
            return Value(*x / *y);
        case Op::Mod:
            if (*y == 0.0)
                return fail(ErrorKind::ArgumentError, ctx.path(), "division by zero");
            return Value(std::fmod(*x, *y));
        default:
            break;
        }
    }
    return type_error(ctx, op, lhs, rhs);
}

} // namespace

Expr::Expr() : Expr(Value()) {
}

Expr::Expr(Value constant) : node_(std::make_shared<const Node>(Node{Node::Constant{std::move(constant)}})) {
}

Result<Value> Expr::eval(const Context &ctx, const Value *obj) const {
    return std::visit(
        [&](const auto &n) -> Result<Value> {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, Node::Constant>) {
                return n.value;
            } else if constexpr (std::is_same_v<T, Node::Field>) {
                if (!n.from_parent)
                    return ctx.get(n.name);
                auto up = ctx.parent();
                if (!up)
                    return fail(ErrorKind::MissingFieldError, ctx.path(),
                                fmt::format("no enclosing context for '{}'", n.name));
                return up->get(n.name);
            } else if constexpr (std::is_same_v<T, Node::Obj>) {
                if (!obj)
                    return fail(ErrorKind::ArgumentError, ctx.path(), "no current object in this position");
                return *obj;
            } else if constexpr (std::is_same_v<T, Node::Index>) {
                auto idx = ctx.index();
                if (!idx)
                    return fail(ErrorKind::ArgumentError, ctx.path(), "index used outside of a repetition");
                return Value(*idx);
            } else if constexpr (std::is_same_v<T, Node::Len>) {
                auto v = n.of.eval(ctx, obj);
                if (!v)
                    return v;
                if (const auto *b = v->template get<Bytes>())
                    return Value(b->size());
                if (const auto *s = v->template get<std::string>())
                    return Value(s->size());
                if (const auto *l = v->template get<List>())
                    return Value(l->size());
                if (const auto *c = v->template get<Container>())
                    return Value(c->size());
                return fail(ErrorKind::ArgumentError, ctx.path(),
                            fmt::format("len of {} is undefined", v->type_name()));
            } else if constexpr (std::is_same_v<T, Node::Member>) {
                auto v = n.of.eval(ctx, obj);
                if (!v)
                    return v;
                const auto *c = v->template get<Container>();
                if (!c)
                    return fail(ErrorKind::ArgumentError, ctx.path(),
                                fmt::format("cannot take '{}' of {}", n.key, v->type_name()));
                const Value *member = c->find(n.key);
                if (!member)
                    return fail(ErrorKind::MissingFieldError, ctx.path(), fmt::format("no member named '{}'", n.key));
                return *member;
            } else if constexpr (std::is_same_v<T, Node::Unary>) {
                auto v = n.operand.eval(ctx, obj);
                if (!v)
                    return v;
                if (n.op == Op::Not)
                    return Value(!v->truthy());
                if (const auto *i = v->template get<int64_t>()) {
                    if (*i == std::numeric_limits<int64_t>::min())
                        return fail(ErrorKind::ArgumentError, ctx.path(), fmt::format("integer overflow in -({})", *i));
                    return Value(-*i);
                }
                if (const auto *d = v->template get<double>())
                    return Value(-*d);
                return fail(ErrorKind::ArgumentError, ctx.path(), fmt::format("cannot negate {}", v->type_name()));
            } else if constexpr (std::is_same_v<T, Node::Binary>) {
                auto lhs = n.lhs.eval(ctx, obj);
                if (!lhs)
                    return lhs;
                auto rhs = n.rhs.eval(ctx, obj);
                if (!rhs)
                    return rhs;
                return apply(n.op, *lhs, *rhs, ctx);
            } else {
                auto v = n.fn(ctx, obj);
                if (!v)
                    return std::unexpected(v.error().located(ctx.path()));
                return v;
            }
        },
        node_->kind);
}

bool Expr::is_static() const {
    return std::visit(
        [](const auto &n) -> bool {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, Node::Lambda>) {
                return false;
            } else if constexpr (std::is_same_v<T, Node::Len> || std::is_same_v<T, Node::Member>) {
                return n.of.is_static();
            } else if constexpr (std::is_same_v<T, Node::Unary>) {
                return n.operand.is_static();
            } else if constexpr (std::is_same_v<T, Node::Binary>) {
                return n.lhs.is_static() && n.rhs.is_static();
            } else {
                return true;
            }
        },
        node_->kind);
}

const Value *Expr::constant() const {
    if (const auto *c = std::get_if<Node::Constant>(&node_->kind))
        return &c->value;
    return nullptr;
}

Expr Expr::operator[](std::string key) const {
    return Expr(std::make_shared<const Node>(Node{Node::Member{*this, std::move(key)}}));
}

std::string Expr::str() const {
    return std::visit(
        [](const auto &n) -> std::string {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, Node::Constant>) {
                return n.value.dump();
            } else if constexpr (std::is_same_v<T, Node::Field>) {
                return fmt::format("{}.{}", n.from_parent ? "parent" : "this", n.name);
            } else if constexpr (std::is_same_v<T, Node::Obj>) {
                return "obj";
            } else if constexpr (std::is_same_v<T, Node::Index>) {
                return "index";
            } else if constexpr (std::is_same_v<T, Node::Len>) {
                return fmt::format("len({})", n.of.str());
            } else if constexpr (std::is_same_v<T, Node::Member>) {
                return fmt::format("{}[\"{}\"]", n.of.str(), n.key);
            } else if constexpr (std::is_same_v<T, Node::Unary>) {
                return fmt::format("{}({})", symbol(n.op), n.operand.str());
            } else if constexpr (std::is_same_v<T, Node::Binary>) {
                return fmt::format("({} {} {})", n.lhs.str(), symbol(n.op), n.rhs.str());
            } else {
                return "<lambda>";
            }
        },
        node_->kind);
}

Expr this_(std::string name) {
    return Expr(std::make_shared<const Expr::Node>(Expr::Node{Expr::Node::Field{std::move(name), false}}));
}

Expr parent_(std::string name) {
    return Expr(std::make_shared<const Expr::Node>(Expr::Node{Expr::Node::Field{std::move(name), true}}));
}

Expr obj_() {
    return Expr(std::make_shared<const Expr::Node>(Expr::Node{Expr::Node::Obj{}}));
}

Expr index_() {
    return Expr(std::make_shared<const Expr::Node>(Expr::Node{Expr::Node::Index{}}));
}

Expr len_(const Expr &of) {
    return Expr(std::make_shared<const Expr::Node>(Expr::Node{Expr::Node::Len{of}}));
}

Expr lambda_(Expr::Fn fn) {
    return Expr(std::make_shared<const Expr::Node>(Expr::Node{Expr::Node::Lambda{std::move(fn)}}));
}

Expr make_binary(int op, const Expr &lhs, const Expr &rhs) {
    return Expr(std::make_shared<const Expr::Node>(Expr::Node{Expr::Node::Binary{static_cast<Op>(op), lhs, rhs}}));
}

Expr make_unary(int op, const Expr &operand) {
    return Expr(std::make_shared<const Expr::Node>(Expr::Node{Expr::Node::Unary{static_cast<Op>(op), operand}}));
}

Expr operator+(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Add), lhs, rhs);
}

Expr operator-(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Sub), lhs, rhs);
}

Expr operator*(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Mul), lhs, rhs);
}

Expr operator/(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Div), lhs, rhs);
}

Expr operator%(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Mod), lhs, rhs);
}

Expr operator&(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::BitAnd), lhs, rhs);
}

Expr operator|(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::BitOr), lhs, rhs);
}

Expr operator==(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Eq), lhs, rhs);
}

Expr operator!=(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Ne), lhs, rhs);
}

Expr operator<(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Lt), lhs, rhs);
}

Expr operator<=(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Le), lhs, rhs);
}

Expr operator>(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Gt), lhs, rhs);
}

Expr operator>=(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Ge), lhs, rhs);
}

Expr operator&&(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::And), lhs, rhs);
}

Expr operator||(const Expr &lhs, const Expr &rhs) {
    return make_binary(static_cast<int>(Op::Or), lhs, rhs);
}

Expr operator!(const Expr &operand) {
    return make_unary(static_cast<int>(Op::Not), operand);
}

Expr operator-(const Expr &operand) {
    return make_unary(static_cast<int>(Op::Neg), operand);
}

} // namespace construe
