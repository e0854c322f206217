#pragma once

#include "utils.h"
#include "value.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace scalargrad {

/**
 * Single neuron: relu(w . x + b), or w . x + b when nonlin is false.
 * Weights start uniform in [-1, 1), bias at zero.
 */
class Neuron {
public:
    Neuron(int nin, bool nonlin = true) : b_(0.0), nonlin_(nonlin) {
        if (nin <= 0) {
            throw std::invalid_argument("Neuron: nin must be positive, got " + std::to_string(nin));
        }
        w_.reserve(nin);
        for (int i = 0; i < nin; ++i) {
            w_.emplace_back(uniform(-1.0, 1.0));
        }
    }

    Value operator()(const std::vector<Value>& x) const {
        if (x.size() != w_.size()) {
            throw std::invalid_argument("Neuron: expected " + std::to_string(w_.size()) +
                                        " inputs, got " + std::to_string(x.size()));
        }
        std::vector<Value> products;
        products.reserve(w_.size());
        for (size_t i = 0; i < w_.size(); ++i) {
            products.push_back(mul(w_[i], x[i]));
        }
        Value act = add(sum(products), b_);
        return nonlin_ ? relu(act) : act;
    }

    // Bias first, then weights in input order.
    std::vector<Value> parameters() const {
        std::vector<Value> params;
        params.reserve(w_.size() + 1);
        params.push_back(b_);
        params.insert(params.end(), w_.begin(), w_.end());
        return params;
    }

    size_t nin() const { return w_.size(); }
    bool nonlin() const { return nonlin_; }

    std::string describe() const {
        return std::string(nonlin_ ? "ReLU" : "Linear") + "Neuron(" + std::to_string(w_.size()) + ")";
    }

private:
    std::vector<Value> w_;
    Value b_;
    bool nonlin_;
};

/**
 * Fully connected layer of independent neurons sharing the same input
 */
class Layer {
public:
    Layer(int nin, int nout, bool nonlin = true) {
        if (nout <= 0) {
            throw std::invalid_argument("Layer: nout must be positive, got " + std::to_string(nout));
        }
        neurons_.reserve(nout);
        for (int i = 0; i < nout; ++i) {
            neurons_.emplace_back(nin, nonlin);
        }
    }

    std::vector<Value> operator()(const std::vector<Value>& x) const {
        std::vector<Value> out;
        out.reserve(neurons_.size());
        for (const auto& n : neurons_) {
            out.push_back(n(x));
        }
        return out;
    }

    std::vector<Value> parameters() const {
        std::vector<Value> params;
        for (const auto& n : neurons_) {
            auto p = n.parameters();
            params.insert(params.end(), p.begin(), p.end());
        }
        return params;
    }

    const std::vector<Neuron>& neurons() const { return neurons_; }

    std::string describe() const {
        std::string s = "Layer of [";
        for (size_t i = 0; i < neurons_.size(); ++i) {
            if (i > 0) {
                s += ", ";
            }
            s += neurons_[i].describe();
        }
        return s + "]";
    }

private:
    std::vector<Neuron> neurons_;
};

/**
 * Multilayer perceptron. Every layer but the last applies ReLU.
 */
class MLP {
public:
    MLP(int nin, const std::vector<int>& nouts) {
        if (nouts.empty()) {
            throw std::invalid_argument("MLP: at least one layer size is required");
        }
        std::vector<int> sizes;
        sizes.reserve(nouts.size() + 1);
        sizes.push_back(nin);
        sizes.insert(sizes.end(), nouts.begin(), nouts.end());

        const size_t n = nouts.size();
        layers_.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            layers_.emplace_back(sizes[i], sizes[i + 1], i != n - 1);
        }
    }

    std::vector<Value> operator()(std::vector<Value> x) const {
        for (const auto& layer : layers_) {
            x = layer(x);
        }
        return x;
    }

    std::vector<Value> operator()(const std::vector<double>& x) const {
        return (*this)(std::vector<Value>(x.begin(), x.end()));
    }

    std::vector<Value> parameters() const {
        std::vector<Value> params;
        for (const auto& layer : layers_) {
            auto p = layer.parameters();
            params.insert(params.end(), p.begin(), p.end());
        }
        return params;
    }

    void zero_grad() const {
        scalargrad::zero_grad(parameters());
    }

    const std::vector<Layer>& layers() const { return layers_; }

    std::string describe() const {
        std::string s = "MLP of [";
        for (size_t i = 0; i < layers_.size(); ++i) {
            if (i > 0) {
                s += ", ";
            }
            s += layers_[i].describe();
        }
        return s + "]";
    }

private:
    std::vector<Layer> layers_;
};

}  // namespace scalargrad
