/**
 * Write DOT renderings of a few graphs after running backward on them.
 * Usage: graphviz [output_dir]
 * Render with e.g. `dot -Tsvg value.dot -o value.svg`.
 */

#include <scalargrad/scalargrad.h>
#include <iostream>
#include <string>

using namespace scalargrad;

namespace {

void create_graphviz(const Value& g, const std::string& filename) {
    g.backward();
    write_dot(g, filename);
    std::cout << to_dot(g) << std::endl;
    std::cout << "wrote " << filename << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string out_dir = argc > 1 ? argv[1] : ".";

    try {
        Value a(1.0);
        Value b(2.0);
        Value c(3.0);
        Value d(4.0);
        create_graphviz(((a + b) * (c + d)).pow(2.0), out_dir + "/value.dot");

        // 1 input weight + bias, with ReLU
        Neuron neuron(1);
        create_graphviz(neuron({Value(7.0)}), out_dir + "/neuron.dot");

        // 2 inputs -> 2 hidden -> 1 output
        MLP model(2, {2, 1});
        std::vector<Value> x = {Value(7.0), Value(8.0)};
        create_graphviz(model(x)[0], out_dir + "/mlp.dot");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
