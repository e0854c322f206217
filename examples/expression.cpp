/**
 * Forward and backward pass over a small hand-built expression.
 * Prints g = 24.7041, dg/da = 138.8338, dg/db = 645.5773.
 */

#include <scalargrad/scalargrad.h>
#include <iostream>
#include <iomanip>

using namespace scalargrad;

int main() {
    Value a(-4.0);
    Value b(2.0);

    Value c = a + b;
    Value d = a * b + b.pow(3);
    c += c + 1;
    c += 1 + c + (-a);
    d += d * 2 + (b + a).relu();
    d += 3 * d + (b - a).relu();
    Value e = c - d;
    Value f = e.pow(2);
    Value g = f / 2.0;
    g += 10.0 / f;

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "g.data = " << g->data << std::endl;

    g.backward();

    std::cout << "a.grad = " << a->grad << std::endl;
    std::cout << "b.grad = " << b->grad << std::endl;

    std::cout << std::defaultfloat;
    std::cout << "a is " << a << std::endl;
    std::cout << "b is " << b << std::endl;
    std::cout << "c is " << c << std::endl;
    std::cout << "d is " << d << std::endl;
    std::cout << "e is " << e << std::endl;
    std::cout << "f is " << f << std::endl;
    std::cout << "g is " << g << std::endl;

    return 0;
}
