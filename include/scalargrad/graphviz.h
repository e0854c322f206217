#pragma once

#include "value.h"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace scalargrad {

/**
 * Render the graph reachable from root as Graphviz DOT, laid out left to
 * right. One box per node labelled with its data and grad; edges run from
 * operand to result and carry the result's op label.
 */
inline std::string to_dot(const Value& root) {
    const std::vector<Value> topo = build_topo(root);

    std::ostringstream out;
    out << std::fixed << std::setprecision(4);
    out << "digraph {\n";
    out << "    rankdir=LR\n";
    out << "    node [shape=box]\n";

    for (const Value& v : topo) {
        out << "    n" << v.id() << " [label=\"data=" << v->data << " grad=" << v->grad << "\"]\n";
    }
    for (const Value& v : topo) {
        for (const Value& child : v->prev) {
            out << "    n" << child.id() << " -> n" << v.id() << " [label=\"" << v->op << "\"]\n";
        }
    }
    out << "}\n";
    return out.str();
}

inline void write_dot(const Value& root, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open " + filename + " for writing");
    }
    file << to_dot(root);
    if (!file) {
        throw std::runtime_error("Failed writing " + filename);
    }
}

}  // namespace scalargrad
