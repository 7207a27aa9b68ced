// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_ERROR_HPP
#define GRAFT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace graft {

/// Base class for all GRAFT errors.
class BaseError : public std::exception {
   private:
    std::string msg_;

   public:
    BaseError(const std::string &msg) : msg_(msg) {}
    const char *what() const noexcept override { return msg_.c_str(); }
};

#define REGISTER_ERROR_TYPE(_name, _base)               \
    class _name : public _base {                        \
       public:                                          \
        _name(const std::string &msg) : _base(msg) {}   \
    };

/// Internal error in GRAFT, likely a bug.
REGISTER_ERROR_TYPE(InternalError, BaseError)
/// Invalid usage of GRAFT API.
REGISTER_ERROR_TYPE(InvalidUsageError, BaseError)
/// Invalid graph definition. Base of all construction-time errors.
REGISTER_ERROR_TYPE(ModelError, BaseError)
/// Reference to a tensor name that was never declared.
REGISTER_ERROR_TYPE(UnknownTensorError, ModelError)
/// Direct redeclaration of an already issued tensor name.
REGISTER_ERROR_TYPE(DuplicateDeclarationError, ModelError)
/// Operator inputs are not shape-compatible with the operator.
REGISTER_ERROR_TYPE(ShapeError, ModelError)
/// Operand shapes of add, mul or matmul do not agree.
REGISTER_ERROR_TYPE(ShapeMismatchError, ShapeError)
/// Slice range is out of the input extent.
REGISTER_ERROR_TYPE(SliceRangeError, ShapeError)
/// Concat inputs differ outside of the concat axis.
REGISTER_ERROR_TYPE(ConcatShapeError, ShapeError)
/// Partition region widths do not add up to the source width.
REGISTER_ERROR_TYPE(PartitionWidthError, ModelError)
/// A requested graph output was never produced.
REGISTER_ERROR_TYPE(UnresolvedOutputError, ModelError)
/// A serialized model failed structural validation.
REGISTER_ERROR_TYPE(ValidationError, BaseError)
/// Error from invalid system state such as a failed file operation.
REGISTER_ERROR_TYPE(SystemError, BaseError)
/// Error from a unit test.
REGISTER_ERROR_TYPE(UnitTestError, BaseError)

}  // namespace graft

#endif  // GRAFT_ERROR_HPP
