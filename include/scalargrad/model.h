#pragma once

#include "nn.h"
#include "optimizer.h"
#include "utils.h"
#include "value.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace scalargrad {

/**
 * Training configuration
 */
struct Config {
    std::vector<int> hidden = {16, 16};
    int num_steps = 100;
    double learning_rate = 1.0;
    double alpha = 1e-4;  // L2 regularization strength
};

struct LossResult {
    Value total;
    double accuracy;
};

/**
 * SVM max-margin loss over the whole dataset plus L2 regularization:
 *     mean(relu(1 - y_i * score_i)) + alpha * sum(p^2)
 * Labels are expected in {-1, +1}. Also reports the fraction of samples whose
 * score has the same sign as the label.
 */
inline LossResult compute_loss(const MLP& model, const Dataset& data, double alpha) {
    if (data.xs.empty()) {
        throw std::invalid_argument("compute_loss: empty dataset");
    }
    if (data.xs.size() != data.ys.size()) {
        throw std::invalid_argument("compute_loss: " + std::to_string(data.xs.size()) + " inputs but " +
                                    std::to_string(data.ys.size()) + " labels");
    }

    std::vector<Value> losses;
    losses.reserve(data.size());
    size_t correct = 0;

    for (size_t i = 0; i < data.xs.size(); ++i) {
        const Value score = model(data.xs[i]).front();
        const double yi = data.ys[i];
        losses.push_back(relu(add(1.0, mul(-yi, score))));
        if ((yi > 0.0) == (score->data > 0.0)) {
            ++correct;
        }
    }
    const double n = static_cast<double>(losses.size());
    Value data_loss = div(sum(losses), n);

    std::vector<Value> squares;
    for (const Value& p : model.parameters()) {
        squares.push_back(mul(p, p));
    }
    Value reg_loss = mul(alpha, sum(squares));

    return {add(data_loss, reg_loss), static_cast<double>(correct) / n};
}

/**
 * One full-batch optimization step. The returned loss is the one measured
 * before the parameter update.
 */
inline LossResult train_step(const MLP& model, const Dataset& data, const SGD& optimizer,
                             int step, int num_steps, double alpha) {
    LossResult result = compute_loss(model, data, alpha);

    const auto params = model.parameters();
    optimizer.zero_grad(params);
    result.total.backward();
    optimizer.step(params, step, num_steps);

    return result;
}

/**
 * ASCII view of the decision boundary over [-2, 2] x [-2, 2] using a
 * 2*bound by 2*bound grid: '*' where the score is positive, '.' elsewhere.
 * Rows run from top (y = 2) to bottom.
 */
inline std::string decision_boundary(const MLP& model, int bound = 20) {
    if (bound <= 0) {
        throw std::invalid_argument("decision_boundary: bound must be positive");
    }
    std::string grid;
    for (int y = -bound; y < bound; ++y) {
        for (int x = -bound; x < bound; ++x) {
            const std::vector<double> input = {
                static_cast<double>(x) / bound * 2.0,
                static_cast<double>(-y) / bound * 2.0,
            };
            grid += model(input).front()->data > 0.0 ? "* " : ". ";
        }
        grid += '\n';
    }
    return grid;
}

}  // namespace scalargrad
