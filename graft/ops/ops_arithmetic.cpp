// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "ops_arithmetic.hpp"

#include "graft/model.hpp"
#include "model/model_buffer.hpp"
#include "model/model_graph_impl.hpp"
#include "ops_common.hpp"

namespace graft {

static bool broadcasts_last_axis(const Dims &vec, const Dims &other) {
    return vec.ndims() == 1 && other.ndims() >= 1 &&
           dim_match(vec[0], other[-1]);
}

Dims ModelOpAdd::infer_shape(const std::vector<Dims> &input_shapes) const {
    check_arity("Add", input_shapes, 2);
    const Dims &a = input_shapes[0];
    const Dims &b = input_shapes[1];
    if (shape_match(a, b)) {
        std::vector<DimType> merged;
        for (int i = 0; i < a.ndims(); ++i) {
            merged.push_back(dim_merge(a[i], b[i]));
        }
        return Dims(merged);
    }
    if (a.ndims() > b.ndims() && broadcasts_last_axis(b, a)) {
        return a;
    }
    if (b.ndims() > a.ndims() && broadcasts_last_axis(a, b)) {
        return b;
    }
    ERR(ShapeMismatchError, "Add operands cannot be broadcast: ", a, " and ",
        b);
    return Dims();
}

Dims ModelOpMul::infer_shape(const std::vector<Dims> &input_shapes) const {
    check_arity("Mul", input_shapes, 2);
    const Dims &factor = input_shapes[1];
    if (!factor.is_no_dim() &&
        (factor.has_dynamic() || factor.nelems() != 1)) {
        ERR(ShapeMismatchError,
            "Mul expects a scalar second operand. Given: ", factor);
    }
    return input_shapes[0];
}

Tensor Model::add(Tensor input, Tensor other, const std::string &name) {
    return append_one("Add", {input, other}, {}, name);
}

Tensor Model::mul(Tensor input, Tensor factor, const std::string &name) {
    return append_one("Mul", {input, factor}, {}, name);
}

Tensor Model::scale(Tensor input, float factor, const std::string &name) {
    // The factor constant is only declared once the multiply cannot fail.
    if (resolve(input).data_type() != FP32) {
        ERR(ModelError, "scale expects an FP32 input. Given: ",
            input.name(), " of ", input.data_type().name());
    }
    Tensor scalar = impl_->add_constant(
        name.empty() ? "scale" : name + "_factor", FP32.ref(), Dims(),
        ModelBuffer::from_floats({factor}), false);
    return mul(input, scalar, name);
}

}  // namespace graft
