// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_MODEL_HPP
#define GRAFT_MODEL_HPP

#include <graft/data_type.hpp>
#include <graft/dims.hpp>
#include <graft/graph.hpp>
#include <graft/model_graph.hpp>
#include <graft/model_ref.hpp>
#include <graft/partition.hpp>
#include <graft/tensor.hpp>
#include <map>
#include <string>
#include <vector>

namespace graft {

/// Integer attributes of an operator, such as `Start`, `End` or `Axis`.
using OpAttributes = std::map<std::string, int64_t>;

/// Return the result shape of an operator of type `op_type` applied to
/// inputs of `input_shapes`. Throws a ShapeError if the shapes are not
/// compatible with the operator, or InvalidUsageError on an arity mismatch.
Dims propagate_shape(const std::string &op_type,
                     const std::vector<Dims> &input_shapes,
                     const OpAttributes &attributes = {});

/// Builder of one graph. Every operator function below checks its inputs
/// before the graph is touched, so a call that throws leaves the model as it
/// was.
class Model : public ModelGraph {
   public:
    Model() = default;

    Model(const Model &other) = default;

    ~Model() {}

    Model &operator=(const Model &other) = default;

    /// Declare a graph input.
    ///
    /// @param shape Shape of the input. A zero extent is dynamic.
    /// @param data_type Element type of the input.
    /// @param name Name of the input. A non-empty name is declared exactly
    /// and throws DuplicateDeclarationError if it is taken. An empty name
    /// is generated from `input`.
    /// @return The declared input.
    ///
    Tensor tensor(const Dims &shape, const DataType &data_type = FP32,
                  const std::string &name = "");

    /// Declare an FP32 constant. `values` must hold `shape.nelems()` values.
    Tensor constant(const std::vector<float> &values, const Dims &shape,
                    const std::string &name = "");

    /// Declare an INT64 constant.
    Tensor constant(const std::vector<int64_t> &values, const Dims &shape,
                    const std::string &name = "");

    /// Declare an FP32 scalar constant of rank 0.
    Tensor constant(float value, const std::string &name = "");

    /// Return the tensor declared as `name`. Throws UnknownTensorError.
    Tensor lookup(const std::string &name) const;

    /// Append one operator node that consumes tensors by name.
    ///
    /// Inputs are resolved and the result shape is checked before anything
    /// is declared. Implicit constants of the operator are declared next,
    /// then the result under a unique name derived from @p name (or from the
    /// snake-case operator type), then the node is appended.
    ///
    /// @param op_type Registered operator type, e.g. `Matmul` or `Slice`.
    /// @param input_names Names of the consumed tensors, in order.
    /// @param attributes Integer attributes of the operator.
    /// @param name Base name of the node and its result.
    /// @return Names of the result tensors.
    ///
    std::vector<std::string> append(const std::string &op_type,
                                    const std::vector<std::string> &input_names,
                                    const OpAttributes &attributes = {},
                                    const std::string &name = "");

    // Matrix multiplication of rank-2 tensors, `input[M,K] @ other[K,N]`.
    Tensor matmul(Tensor input, Tensor other, const std::string &name = "");

    // Element-wise add. `other` is either of the same shape or a rank-1
    // tensor matching the last axis of `input`.
    Tensor add(Tensor input, Tensor other, const std::string &name = "");

    // `input @ weight + bias`. The bias add takes @p name.
    Tensor linear(Tensor input, Tensor weight, Tensor bias,
                  const std::string &name = "");

    Tensor sigmoid(Tensor input, const std::string &name = "");

    Tensor relu(Tensor input, const std::string &name = "");

    Tensor tanh(Tensor input, const std::string &name = "");

    // Multiply by a scalar tensor.
    Tensor mul(Tensor input, Tensor factor, const std::string &name = "");

    // Multiply by a scalar FP32 constant that is declared for the purpose.
    Tensor scale(Tensor input, float factor, const std::string &name = "");

    // Range `[start, end)` of `input` along `axis`.
    Tensor slice(Tensor input, DimType start, DimType end, int axis = -1,
                 const std::string &name = "");

    // Join `inputs` along `axis`.
    Tensor concat(const std::vector<Tensor> &inputs, int axis = -1,
                  const std::string &name = "");

    /// Split the last axis of `source` into `regions`, apply each region's
    /// policy and concatenate the results in region order.
    ///
    /// Throws PartitionWidthError before any node is appended if the region
    /// widths do not add up to the last extent of @p source.
    ///
    /// @param source Tensor to partition.
    /// @param regions Regions in the order they appear on the last axis.
    /// @param name Base name of the final concat. Defaults to `partition`.
    /// @return The concatenated result, of the shape of @p source.
    ///
    Tensor partition(Tensor source, const std::vector<Region> &regions,
                     const std::string &name = "");

    /// Freeze the model into a @ref Graph whose outputs are @p outputs.
    Graph assemble(const std::vector<Tensor> &outputs,
                   const GraphInfo &info) const;

    /// Freeze the model into a @ref Graph named @p name. Throws
    /// UnresolvedOutputError if an output name was never declared.
    Graph assemble(const std::string &name,
                   const std::vector<std::string> &output_names,
                   const GraphInfo &info = GraphInfo()) const;

   private:
    /// Check that @p tensor was declared by this model.
    Tensor resolve(const Tensor &tensor) const;

    Tensor append_one(const std::string &op_type,
                      const std::vector<Tensor> &inputs,
                      const OpAttributes &attributes, const std::string &name);
};

}  // namespace graft

#endif  // GRAFT_MODEL_HPP
