// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/support/error_types.hpp"
#include <sstream>

using namespace gridfn;

// ===========================================================================
// error_code
// ===========================================================================

TEST(ErrorTypesTest, ValidationErrorCodeIsExposed) {
    GridError err = ValidationError(ValidationErrorCode::UnsortedAxis, "lon", 10.0, 3);
    EXPECT_EQ(error_code(err), static_cast<int>(ValidationErrorCode::UnsortedAxis));
}

TEST(ErrorTypesTest, SerializationErrorCodeIsExposed) {
    GridError err = SerializationError{SerializationErrorCode::ChecksumMismatch, "T"};
    EXPECT_EQ(error_code(err), static_cast<int>(SerializationErrorCode::ChecksumMismatch));
}

TEST(ErrorTypesTest, CodelessErrorsReportMinusOne) {
    EXPECT_EQ(error_code(GridError{NotFoundError{"T"}}), -1);
    EXPECT_EQ(error_code(GridError{OutOfRangeError{"time", 30.0, 0.0, 24.0}}), -1);
    EXPECT_EQ(error_code(GridError{ShapeMismatchError{"T", {25, 12}, {12, 25}}}), -1);
}

TEST(ErrorTypesTest, ValidationErrorDefaults) {
    ValidationError err(ValidationErrorCode::EmptyName);
    EXPECT_TRUE(err.name.empty());
    EXPECT_EQ(err.value, 0.0);
    EXPECT_EQ(err.index, 0u);
}

// ===========================================================================
// describe / operator<<
// ===========================================================================

TEST(ErrorTypesTest, DescribeShapeMismatch) {
    GridError err = ShapeMismatchError{"T", {25, 12}, {12, 25}};
    EXPECT_EQ(describe(err), "ShapeMismatchError{dataset=T, expected=(25, 12), actual=(12, 25)}");
}

TEST(ErrorTypesTest, DescribeOneDimensionalShape) {
    GridError err = ShapeMismatchError{"rho", {10}, {9}};
    EXPECT_EQ(describe(err), "ShapeMismatchError{dataset=rho, expected=(10,), actual=(9,)}");
}

TEST(ErrorTypesTest, DescribeNotFound) {
    EXPECT_EQ(describe(GridError{NotFoundError{"rho"}}), "NotFoundError{name=rho}");
}

TEST(ErrorTypesTest, DescribeOutOfRange) {
    GridError err = OutOfRangeError{"time", 30, 0, 24};
    EXPECT_EQ(describe(err), "OutOfRangeError{axis=time, value=30, range=[0, 24]}");
}

TEST(ErrorTypesTest, StreamValidationErrorIncludesName) {
    std::ostringstream oss;
    oss << ValidationError(ValidationErrorCode::DuplicateAxisName, "lon", 0.0, 1);
    EXPECT_NE(oss.str().find("name=lon"), std::string::npos);
    EXPECT_NE(oss.str().find("index=1"), std::string::npos);
}

TEST(ErrorTypesTest, StreamSerializationErrorOmitsEmptyDetail) {
    std::ostringstream oss;
    oss << SerializationError{SerializationErrorCode::OpenFailed, ""};
    EXPECT_EQ(oss.str().find("detail"), std::string::npos);
}
