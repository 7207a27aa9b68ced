// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/model.hpp"
#include "unittest/unittest_utils.hpp"

using graft::Dims;
using graft::propagate_shape;

graft::unittest::State test_shape_matmul() {
    UNITTEST_EQ(propagate_shape("Matmul", {Dims(1, 269), Dims(269, 7)}),
                Dims(1, 7));
    UNITTEST_EQ(propagate_shape("Matmul", {Dims(0, 1024), Dims(1024, 128)}),
                Dims(0, 128));
    UNITTEST_THROW(propagate_shape("Matmul", {Dims(1, 268), Dims(269, 7)}),
                   graft::ShapeMismatchError);
    UNITTEST_THROW(propagate_shape("Matmul", {Dims(269), Dims(269, 7)}),
                   graft::ShapeMismatchError);
    UNITTEST_THROW(propagate_shape("Matmul", {Dims(1, 269)}),
                   graft::InvalidUsageError);
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_shape_add() {
    UNITTEST_EQ(propagate_shape("Add", {Dims(1, 7), Dims(1, 7)}), Dims(1, 7));
    UNITTEST_EQ(propagate_shape("Add", {Dims(1, 7), Dims(7)}), Dims(1, 7));
    UNITTEST_EQ(propagate_shape("Add", {Dims(7), Dims(1, 7)}), Dims(1, 7));
    UNITTEST_EQ(propagate_shape("Add", {Dims(0, 7), Dims(1, 7)}), Dims(1, 7));
    UNITTEST_THROW(propagate_shape("Add", {Dims(1, 7), Dims(6)}),
                   graft::ShapeMismatchError);
    UNITTEST_THROW(propagate_shape("Add", {Dims(1, 7), Dims(7, 1)}),
                   graft::ShapeMismatchError);
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_shape_unary_and_mul() {
    for (auto type : {"Sigmoid", "Relu", "Tanh"}) {
        UNITTEST_EQ(propagate_shape(type, {Dims(1, 128)}), Dims(1, 128));
        UNITTEST_THROW(propagate_shape(type, {Dims(1), Dims(1)}),
                       graft::InvalidUsageError);
    }
    UNITTEST_EQ(propagate_shape("Mul", {Dims(1, 3), Dims()}), Dims(1, 3));
    UNITTEST_EQ(propagate_shape("Mul", {Dims(1, 3), Dims(1)}), Dims(1, 3));
    UNITTEST_THROW(propagate_shape("Mul", {Dims(1, 3), Dims(3)}),
                   graft::ShapeMismatchError);
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_shape_slice() {
    UNITTEST_EQ(propagate_shape("Slice", {Dims(1, 7)},
                                {{"Start", 0}, {"End", 4}, {"Axis", 1}}),
                Dims(1, 4));
    UNITTEST_EQ(propagate_shape("Slice", {Dims(1, 7)},
                                {{"Start", 4}, {"End", 7}, {"Axis", -1}}),
                Dims(1, 3));
    // Every valid range has extent end - start.
    for (int start = 0; start < 7; ++start) {
        for (int end = start + 1; end <= 7; ++end) {
            Dims out = propagate_shape(
                "Slice", {Dims(1, 7)},
                {{"Start", start}, {"End", end}, {"Axis", 1}});
            UNITTEST_EQ(out[1], end - start);
        }
    }
    UNITTEST_THROW(propagate_shape("Slice", {Dims(1, 7)},
                                   {{"Start", -1}, {"End", 4}, {"Axis", 1}}),
                   graft::SliceRangeError);
    UNITTEST_THROW(propagate_shape("Slice", {Dims(1, 7)},
                                   {{"Start", 4}, {"End", 4}, {"Axis", 1}}),
                   graft::SliceRangeError);
    UNITTEST_THROW(propagate_shape("Slice", {Dims(1, 7)},
                                   {{"Start", 4}, {"End", 8}, {"Axis", 1}}),
                   graft::SliceRangeError);
    UNITTEST_THROW(propagate_shape("Slice", {Dims(1, 7)},
                                   {{"Start", 0}, {"End", 1}, {"Axis", 2}}),
                   graft::ShapeError);
    // Only the ordering of the bounds is checked on a dynamic axis.
    UNITTEST_EQ(propagate_shape("Slice", {Dims(graft::DYNAMIC_DIM, 7)},
                                {{"Start", 0}, {"End", 100}, {"Axis", 0}}),
                Dims(100, 7));
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_shape_concat() {
    UNITTEST_EQ(propagate_shape("Concat", {Dims(1, 4), Dims(1, 3)},
                                {{"Axis", 1}}),
                Dims(1, 7));
    UNITTEST_EQ(propagate_shape("Concat", {Dims(1, 4)}, {{"Axis", -1}}),
                Dims(1, 4));
    UNITTEST_EQ(propagate_shape("Concat", {Dims(1, 4), Dims(1, 0)},
                                {{"Axis", 1}}),
                Dims(1, 0));
    UNITTEST_THROW(propagate_shape("Concat", {Dims(1, 4), Dims(2, 3)},
                                   {{"Axis", 1}}),
                   graft::ConcatShapeError);
    UNITTEST_THROW(propagate_shape("Concat", {Dims(1, 4), Dims(4)},
                                   {{"Axis", -1}}),
                   graft::ConcatShapeError);
    UNITTEST_THROW(propagate_shape("Concat", {}, {{"Axis", 1}}),
                   graft::InvalidUsageError);

    // Nested concats have the same shape as a flat one.
    Dims a(1, 2), b(1, 3), c(1, 5);
    Dims ab = propagate_shape("Concat", {a, b}, {{"Axis", 1}});
    UNITTEST_EQ(propagate_shape("Concat", {ab, c}, {{"Axis", 1}}),
                propagate_shape("Concat", {a, b, c}, {{"Axis", 1}}));
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_shape_unknown_op() {
    UNITTEST_THROW(propagate_shape("Conv", {Dims(1, 3)}),
                   graft::InvalidUsageError);
    return graft::unittest::SUCCESS;
}

int main() {
    UNITTEST(test_shape_matmul);
    UNITTEST(test_shape_add);
    UNITTEST(test_shape_unary_and_mul);
    UNITTEST(test_shape_slice);
    UNITTEST(test_shape_concat);
    UNITTEST(test_shape_unknown_op);
    return 0;
}
