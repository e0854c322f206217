#pragma once

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace scalargrad {

struct ValueData;

/**
 * Propagation rule of a non-leaf node. Reads the node's own grad and its
 * operands' data, and adds into the operands' grad. Leaves carry nullptr.
 */
using BackwardFn = void (*)(ValueData&);

/**
 * Returns a fresh node identity. Identities are never reused within a process.
 */
inline std::uint64_t next_value_id() {
    static std::uint64_t counter = 0;
    return ++counter;
}

/**
 * Handle to a single scalar node in a computation graph.
 *
 * Copying a Value aliases the same node; the node lives as long as any handle
 * to it (including the handles held as operands by downstream nodes). Node
 * fields are reached through operator->, e.g. v->data and v->grad.
 */
class Value {
public:
    Value(double data = 0.0);  // leaf
    explicit Value(std::shared_ptr<ValueData> node) : node_(std::move(node)) {
        assert(node_ != nullptr && "Value constructed from null node");
    }

    ValueData* operator->() const { return node_.get(); }
    ValueData& operator*() const { return *node_; }

    std::uint64_t id() const;

    Value pow(double exponent) const;
    Value relu() const;

    // Seeds this node's grad with 1.0 and propagates to everything reachable.
    void backward() const;

    // Compound assignment rebinds the handle to a new node; the old node is untouched.
    Value& operator+=(const Value& other);
    Value& operator-=(const Value& other);
    Value& operator*=(const Value& other);
    Value& operator/=(const Value& other);

    friend bool operator==(const Value& lhs, const Value& rhs) { return lhs.node_ == rhs.node_; }
    friend bool operator!=(const Value& lhs, const Value& rhs) { return lhs.node_ != rhs.node_; }

private:
    std::shared_ptr<ValueData> node_;
};

/**
 * Storage of one graph node.
 *
 * data and prev are fixed once the node is built. grad is written only by
 * backward(); optimizers may overwrite data of leaf parameters between passes.
 */
struct ValueData {
    double data;                // forward result, or the literal for leaves
    double grad;                // d(root)/d(this), accumulated by backward()
    std::uint64_t id;
    std::vector<Value> prev;    // operands, left/base operand first
    BackwardFn backward_fn;
    std::string op;             // label of the producing operation, empty for leaves

    explicit ValueData(double data)
        : data(data), grad(0.0), id(next_value_id()), prev(), backward_fn(nullptr), op() {}
};

inline Value::Value(double data) : node_(std::make_shared<ValueData>(data)) {}

inline std::uint64_t Value::id() const {
    return node_->id;
}

namespace detail {

inline Value make_result(double data, std::vector<Value> prev, BackwardFn fn, const char* op) {
    auto node = std::make_shared<ValueData>(data);
    node->prev = std::move(prev);
    node->backward_fn = fn;
    node->op = op;
    return Value(std::move(node));
}

inline void add_backward(ValueData& out) {
    assert(out.prev.size() == 2 && "add expects two operands");
    out.prev[0]->grad += out.grad;
    out.prev[1]->grad += out.grad;
}

inline void mul_backward(ValueData& out) {
    assert(out.prev.size() == 2 && "mul expects two operands");
    const double a = out.prev[0]->data;
    const double b = out.prev[1]->data;
    out.prev[0]->grad += b * out.grad;
    out.prev[1]->grad += a * out.grad;
}

// prev[1] holds the exponent as a constant leaf; it receives no gradient.
inline void pow_backward(ValueData& out) {
    assert(out.prev.size() == 2 && "pow expects base and exponent");
    const double base = out.prev[0]->data;
    const double exponent = out.prev[1]->data;
    out.prev[0]->grad += exponent * std::pow(base, exponent - 1.0) * out.grad;
}

inline void relu_backward(ValueData& out) {
    assert(out.prev.size() == 1 && "relu expects one operand");
    if (out.prev[0]->data > 0.0) {
        out.prev[0]->grad += out.grad;
    }
}

inline void build_topo(const Value& v, std::vector<Value>& topo, std::unordered_set<std::uint64_t>& visited) {
    if (!visited.insert(v.id()).second) {
        return;
    }
    for (const Value& child : v->prev) {
        build_topo(child, topo, visited);
    }
    topo.push_back(v);
}

}  // namespace detail

// ============================================================================
// Primitive operations. These are the only nodes that carry a gradient rule.
// ============================================================================

inline Value constant(double data) {
    return Value(data);
}

inline Value add(const Value& a, const Value& b) {
    return detail::make_result(a->data + b->data, {a, b}, &detail::add_backward, "+");
}

inline Value mul(const Value& a, const Value& b) {
    return detail::make_result(a->data * b->data, {a, b}, &detail::mul_backward, "*");
}

/**
 * base^exponent. The exponent is a constant and is not differentiated.
 * Domain violations (0^-1, negative base with fractional exponent) follow
 * std::pow and yield inf/NaN rather than throwing.
 */
inline Value pow(const Value& base, double exponent) {
    return detail::make_result(std::pow(base->data, exponent), {base, constant(exponent)},
                               &detail::pow_backward, "^");
}

// Propagates zero gradient at exactly 0.
inline Value relu(const Value& a) {
    return detail::make_result(std::max(0.0, a->data), {a}, &detail::relu_backward, "ReLU");
}

// ============================================================================
// Composite operations, built only from the primitives above.
// ============================================================================

inline Value add(const Value& a, double b) { return add(a, constant(b)); }
inline Value add(double a, const Value& b) { return add(constant(a), b); }

inline Value mul(const Value& a, double b) { return mul(a, constant(b)); }
inline Value mul(double a, const Value& b) { return mul(constant(a), b); }

inline Value neg(const Value& a) {
    return mul(a, constant(-1.0));
}

inline Value sub(const Value& a, const Value& b) {
    return add(a, neg(b));
}

inline Value sub(const Value& a, double b) { return sub(a, constant(b)); }
inline Value sub(double a, const Value& b) { return sub(constant(a), b); }

inline Value div(const Value& a, const Value& b) {
    return mul(a, pow(b, -1.0));
}

inline Value div(const Value& a, double b) { return div(a, constant(b)); }
inline Value div(double a, const Value& b) { return div(constant(a), b); }

/**
 * Left fold of add over values. Throws std::invalid_argument when empty.
 */
inline Value sum(const std::vector<Value>& values) {
    if (values.empty()) {
        throw std::invalid_argument("sum: must contain at least one Value");
    }
    Value total = values.front();
    for (size_t i = 1; i < values.size(); ++i) {
        total = add(total, values[i]);
    }
    return total;
}

// ============================================================================
// Backward pass
// ============================================================================

/**
 * Every node reachable from root, each exactly once, ordered so that a node
 * always comes after all of its operands. root is last.
 */
inline std::vector<Value> build_topo(const Value& root) {
    std::vector<Value> topo;
    std::unordered_set<std::uint64_t> visited;
    detail::build_topo(root, topo, visited);
    return topo;
}

/**
 * Sets root->grad to 1.0 and runs every reachable node's gradient rule once,
 * consumers before the operands they read from.
 *
 * Gradients are not reset first: running backward twice over overlapping
 * graphs accumulates. Call zero_grad() in between when that is not wanted.
 */
inline void backward(const Value& root) {
    std::vector<Value> topo = build_topo(root);
    std::reverse(topo.begin(), topo.end());

    root->grad = 1.0;
    for (const Value& v : topo) {
        if (v->backward_fn != nullptr) {
            v->backward_fn(*v);
        }
    }
}

inline void zero_grad(const std::vector<Value>& values) {
    for (const Value& v : values) {
        v->grad = 0.0;
    }
}

// ============================================================================
// Member and operator sugar
// ============================================================================

inline Value Value::pow(double exponent) const {
    return scalargrad::pow(*this, exponent);
}

inline Value Value::relu() const {
    return scalargrad::relu(*this);
}

inline void Value::backward() const {
    scalargrad::backward(*this);
}

inline Value operator+(const Value& a, const Value& b) { return add(a, b); }
inline Value operator+(const Value& a, double b) { return add(a, b); }
inline Value operator+(double a, const Value& b) { return add(a, b); }

inline Value operator*(const Value& a, const Value& b) { return mul(a, b); }
inline Value operator*(const Value& a, double b) { return mul(a, b); }
inline Value operator*(double a, const Value& b) { return mul(a, b); }

inline Value operator-(const Value& a) { return neg(a); }

inline Value operator-(const Value& a, const Value& b) { return sub(a, b); }
inline Value operator-(const Value& a, double b) { return sub(a, b); }
inline Value operator-(double a, const Value& b) { return sub(a, b); }

inline Value operator/(const Value& a, const Value& b) { return div(a, b); }
inline Value operator/(const Value& a, double b) { return div(a, b); }
inline Value operator/(double a, const Value& b) { return div(a, b); }

inline Value& Value::operator+=(const Value& other) {
    *this = add(*this, other);
    return *this;
}

inline Value& Value::operator-=(const Value& other) {
    *this = sub(*this, other);
    return *this;
}

inline Value& Value::operator*=(const Value& other) {
    *this = mul(*this, other);
    return *this;
}

inline Value& Value::operator/=(const Value& other) {
    *this = div(*this, other);
    return *this;
}

inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    return os << "Value(data=" << v->data << ", grad=" << v->grad << ")";
}

}  // namespace scalargrad
