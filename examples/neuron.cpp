/**
 * Evaluate a single randomly initialised ReLU neuron on a fixed input
 */

#include <scalargrad/scalargrad.h>
#include <iostream>

using namespace scalargrad;

int main() {
    Neuron n(2);
    std::vector<Value> x = {Value(1.0), Value(-2.0)};

    std::cout << "n = " << n.describe() << std::endl;
    Value y = n(x);
    std::cout << y << std::endl;

    return 0;
}
