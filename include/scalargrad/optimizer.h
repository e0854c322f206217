#pragma once

#include "value.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace scalargrad {

/**
 * Plain stochastic gradient descent with a linearly decaying learning rate.
 *
 * At step k of num_steps the rate is
 *     learning_rate * (1 - (1 - final_fraction) * k / num_steps)
 * so it starts at learning_rate and approaches final_fraction * learning_rate.
 */
class SGD {
public:
    double learning_rate;
    double final_fraction;

    SGD(double lr = 1.0, double final_frac = 0.1)
        : learning_rate(lr), final_fraction(final_frac) {}

    double learning_rate_at(int k, int num_steps) const {
        if (num_steps <= 0) {
            throw std::invalid_argument("SGD: num_steps must be positive, got " + std::to_string(num_steps));
        }
        const double progress = static_cast<double>(k) / static_cast<double>(num_steps);
        return learning_rate * (1.0 - (1.0 - final_fraction) * progress);
    }

    /**
     * Move every parameter against its gradient. Overwrites data in place,
     * which is the one mutation of a node's data outside of its construction.
     * Gradients are left as they are.
     */
    void step(const std::vector<Value>& params, int k, int num_steps) const {
        const double lr_t = learning_rate_at(k, num_steps);
        for (const Value& p : params) {
            p->data -= lr_t * p->grad;
        }
    }

    void zero_grad(const std::vector<Value>& params) const {
        scalargrad::zero_grad(params);
    }
};

}  // namespace scalargrad
