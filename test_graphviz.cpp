#include <scalargrad/scalargrad.h>
#include "test_common.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace scalargrad;
using namespace scalargrad_test;

namespace {

size_t count(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

}  // namespace

int main() {
    Value a(1.0);
    Value b(2.0);
    Value c = a + b;
    Value d = c * c;
    d.backward();

    const std::string dot = to_dot(d);
    std::cout << dot;

    expect_true(dot.rfind("digraph {", 0) == 0, "starts a digraph");
    expect_true(dot.find("rankdir=LR") != std::string::npos, "left to right");
    expect_true(dot.find("node [shape=box]") != std::string::npos, "box nodes");
    expect_true(count(dot, "[label=\"data=") == 4, "one box per reachable node");
    expect_true(count(dot, " -> ") == 4, "one edge per operand slot");

    std::ostringstream edge;
    edge << "    n" << c.id() << " -> n" << d.id() << " [label=\"*\"]";
    expect_true(count(dot, edge.str()) == 2, "c feeds d twice");

    std::ostringstream node;
    node << "    n" << a.id() << " [label=\"data=1.0000 grad=6.0000\"]";
    expect_true(dot.find(node.str()) != std::string::npos, "a shows data and grad");

    const auto path = (std::filesystem::temp_directory_path() / "scalargrad_graph.dot").string();
    write_dot(d, path);
    std::ifstream in(path);
    std::stringstream written;
    written << in.rdbuf();
    expect_true(written.str() == dot, "file matches to_dot");
    std::filesystem::remove(path);

    expect_throws<std::runtime_error>([&] { write_dot(d, "/nonexistent/dir/graph.dot"); }, "unwritable path throws");

    return finish("test_graphviz");
}
