#include <scalargrad/scalargrad.h>
#include "test_common.h"
#include <iostream>

using namespace scalargrad;
using namespace scalargrad_test;

int main() {
    std::cout << "1. second backward accumulates:" << std::endl;
    {
        Value a(2.0);
        Value b(3.0);
        Value y = a * b;
        y.backward();
        expect_near(a->grad, 3.0, "after first pass");
        y.backward();
        expect_near(a->grad, 6.0, "after second pass");
        expect_near(b->grad, 4.0, "b after second pass");
        expect_near(y->grad, 1.0, "root is reseeded, not accumulated");
    }

    std::cout << "2. zero_grad between passes:" << std::endl;
    {
        Value a(2.0);
        Value b(3.0);
        Value y = a * b + a;
        y.backward();
        expect_near(a->grad, 4.0, "first pass");

        zero_grad(build_topo(y));
        expect_near(a->grad, 0.0, "cleared");
        y.backward();
        expect_near(a->grad, 4.0, "second pass matches the first");
        expect_near(b->grad, 2.0, "b.grad");
    }

    std::cout << "3. overlapping graphs share leaves:" << std::endl;
    {
        Value x(3.0);
        Value y1 = x * 2.0;
        Value y2 = x.pow(2.0);
        y1.backward();
        y2.backward();
        expect_near(x->grad, 2.0 + 6.0, "contributions from both roots add up");
    }

    return finish("test_accumulate");
}
