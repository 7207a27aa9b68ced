// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/dims.hpp"

#include <sstream>

#include "unittest/unittest_utils.hpp"

graft::unittest::State test_dims_basics() {
    graft::Dims scalar;
    UNITTEST_EQ(scalar.ndims(), 0);
    UNITTEST_TRUE(scalar.is_no_dim());
    UNITTEST_EQ(scalar.nelems(), 1);

    graft::Dims dims(1, 269);
    UNITTEST_EQ(dims.ndims(), 2);
    UNITTEST_EQ(dims.nelems(), 269);
    UNITTEST_EQ(dims[0], 1);
    UNITTEST_EQ(dims[-1], 269);
    UNITTEST_FALSE(dims.has_dynamic());
    UNITTEST_EQ(dims, graft::Dims(std::vector<graft::DimType>{1, 269}));
    UNITTEST_NE(dims, graft::Dims(269, 1));
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_dims_dynamic() {
    graft::Dims dims(graft::DYNAMIC_DIM, 7);
    UNITTEST_TRUE(dims.has_dynamic());
    UNITTEST_EQ(dims.nelems(), 0);
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_dims_invalid() {
    UNITTEST_THROW(graft::Dims(std::vector<graft::DimType>{1, 2, 3, 4, 5}),
                   graft::InvalidUsageError);
    UNITTEST_THROW(graft::Dims(1, -2), graft::InvalidUsageError);

    graft::Dims dims(4, 3);
    UNITTEST_THROW(dims[2], graft::InvalidUsageError);
    UNITTEST_THROW(dims[-3], graft::InvalidUsageError);
    return graft::unittest::SUCCESS;
}

graft::unittest::State test_dims_print() {
    std::stringstream ss;
    ss << graft::Dims(1, 5, 9);
    UNITTEST_EQ(ss.str(), "<1, 5, 9>");
    return graft::unittest::SUCCESS;
}

int main() {
    UNITTEST(test_dims_basics);
    UNITTEST(test_dims_dynamic);
    UNITTEST(test_dims_invalid);
    UNITTEST(test_dims_print);
    return 0;
}
