#pragma once

/**
 * scalargrad: a small reverse-mode autodiff engine over scalar values,
 * with just enough neural-net scaffolding on top to train an MLP.
 *
 * Scalars only. No tensors, no SIMD, no higher-order derivatives.
 */

#include "value.h"
#include "nn.h"
#include "optimizer.h"
#include "utils.h"
#include "graphviz.h"
#include "model.h"
