// SPDX-License-Identifier: MIT
/**
 * @file flythrough_test.cc
 * @brief Tests for the synthetic orbit and sampling functions along it
 */

#include "src/flythrough/flythrough.hpp"
#include "src/grid/functionalize.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <variant>
#include <vector>

namespace gridfn {
namespace {

// ============================================================================
// Sample trajectory
// ============================================================================

TEST(SampleTrajectoryTest, DefaultOrbitShape) {
    auto traj = sample_trajectory();
    ASSERT_TRUE(traj.has_value());

    EXPECT_EQ(traj->size(), 43200u);
    EXPECT_TRUE(traj->consistent());
    EXPECT_EQ(traj->coordinate_system,
              (CoordinateSystem{CoordinateFrame::GDZ, CoordinateGrid::SPHERICAL}));

    EXPECT_EQ(traj->time.front(), 0.0);
    EXPECT_EQ(traj->time.back(), 86400.0);
    EXPECT_TRUE(std::is_sorted(traj->time.begin(), traj->time.end()));

    auto [lat_min, lat_max] = std::minmax_element(traj->c2.begin(), traj->c2.end());
    EXPECT_GE(*lat_min, -65.0 - 1e-9);
    EXPECT_LE(*lat_max, 65.0 + 1e-9);
    EXPECT_NEAR(traj->c2.front(), 65.0, 1e-12);

    for (double lon : traj->c1) {
        ASSERT_GE(lon, -180.0);
        ASSERT_LE(lon, 180.0);
    }

    auto [h_min, h_max] = std::minmax_element(traj->c3.begin(), traj->c3.end());
    EXPECT_LE(*h_max, 450.0 + 1e-9);
    // Bottom of the orbit minus the full decay of 1% of 400 km
    EXPECT_GE(*h_min, 396.0 - 1e-9);
    EXPECT_NEAR(traj->c3.front(), 425.0, 1e-12);
}

TEST(SampleTrajectoryTest, ShortWindow) {
    SampleTrajectoryConfig config;
    config.start_time = 1000.0;
    config.stop_time = 1600.0;
    config.cadence = 60.0;

    auto traj = sample_trajectory(config);
    ASSERT_TRUE(traj.has_value());
    EXPECT_EQ(traj->size(), 10u);
    EXPECT_EQ(traj->time.front(), 1000.0);
    EXPECT_EQ(traj->time.back(), 1600.0);
    EXPECT_EQ(traj->c1.front(), -180.0);
}

TEST(SampleTrajectoryTest, RejectsInvalidConfiguration) {
    SampleTrajectoryConfig zero_cadence;
    zero_cadence.cadence = 0.0;
    EXPECT_FALSE(sample_trajectory(zero_cadence).has_value());

    SampleTrajectoryConfig reversed;
    reversed.start_time = 10.0;
    reversed.stop_time = 0.0;
    auto r = sample_trajectory(reversed);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ValidationErrorCode::InvalidConfiguration);

    SampleTrajectoryConfig coarse;
    coarse.cadence = 4000.0;
    coarse.stop_time = 1e6;
    EXPECT_FALSE(sample_trajectory(coarse).has_value());
}

TEST(SampleTrajectoryTest, RejectsUnboundedSampleCounts) {
    SampleTrajectoryConfig far_stop;
    far_stop.stop_time = 1e30;
    auto r = sample_trajectory(far_stop);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ValidationErrorCode::InvalidConfiguration);
    EXPECT_EQ(r.error().name, "stop_time");

    // 5400 / cadence overflows to infinity
    SampleTrajectoryConfig denormal;
    denormal.cadence = 1e-320;
    denormal.stop_time = 1e-300;
    r = sample_trajectory(denormal);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ValidationErrorCode::InvalidConfiguration);

    // Short span but far more samples per orbit than allowed
    SampleTrajectoryConfig dense;
    dense.cadence = 1e-5;
    dense.stop_time = 1e-4;
    r = sample_trajectory(dense);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().name, "cadence");

    SampleTrajectoryConfig at_limit;
    at_limit.cadence = 1.0;
    at_limit.stop_time = static_cast<double>(kMaxTrajectorySamples);
    EXPECT_FALSE(sample_trajectory(at_limit).has_value());
}

// ============================================================================
// Bindings
// ============================================================================

TEST(FlythroughTest, DefaultBindings) {
    auto gdz = default_bindings({CoordinateFrame::GDZ, CoordinateGrid::SPHERICAL});
    EXPECT_EQ(gdz.at("time"), TrajectoryComponent::TIME);
    EXPECT_EQ(gdz.at("lon"), TrajectoryComponent::C1);
    EXPECT_EQ(gdz.at("lat"), TrajectoryComponent::C2);
    EXPECT_EQ(gdz.at("height"), TrajectoryComponent::C3);

    auto geo = default_bindings({CoordinateFrame::GEO, CoordinateGrid::SPHERICAL});
    EXPECT_EQ(geo.at("radius"), TrajectoryComponent::C3);
    EXPECT_FALSE(geo.contains("height"));

    auto car = default_bindings({CoordinateFrame::SM, CoordinateGrid::CARTESIAN});
    EXPECT_EQ(car.size(), 4u);
    EXPECT_EQ(car.at("z"), TrajectoryComponent::C3);
}

// ============================================================================
// Sampling
// ============================================================================

/// lon/lat/height grid where f = lon + 10 lat + 100 height
FunctionRegistry make_registry() {
    std::vector<double> lon = {-180.0, 0.0, 180.0};
    std::vector<double> lat = {-90.0, 90.0};
    std::vector<double> height = {300.0, 500.0};
    std::vector<double> values;
    for (double a : lon)
        for (double b : lat)
            for (double c : height)
                values.push_back(a + 10.0 * b + 100.0 * c);

    auto registry = functionalize(
        {{"lon", "deg", NdArray::vector(lon)},
         {"lat", "deg", NdArray::vector(lat)},
         {"height", "km", NdArray::vector(height)}},
        {{"f", "K", NdArray{{3, 2, 2}, values}}});
    EXPECT_TRUE(registry.has_value());

    auto clock = functionalize(
        {{"time", "s", NdArray::vector({0.0, 100.0})}},
        {{"g", "1", NdArray::vector({0.0, 1.0})}}).value();
    registry->register_function(clock.get("g").value());
    return std::move(registry.value());
}

Trajectory make_trajectory() {
    Trajectory traj;
    traj.time = {0.0, 50.0, 100.0, 150.0};
    traj.c1 = {0.0, 90.0, -90.0, 10.0};
    traj.c2 = {0.0, 45.0, 0.0, 0.0};
    traj.c3 = {400.0, 350.0, 600.0, 400.0};
    return traj;
}

TEST(FlythroughTest, SamplesInsideDomain) {
    auto registry = make_registry();
    auto result = fly_through(registry, {"f"}, make_trajectory());
    ASSERT_TRUE(result.has_value()) << describe(result.error());

    // Point 2 is above the height grid
    EXPECT_EQ(result->net_idx, (std::vector<size_t>{0, 1, 3}));
    EXPECT_EQ(result->size(), 3u);
    EXPECT_EQ(result->time, (std::vector<double>{0.0, 50.0, 150.0}));

    const auto& f = result->variables.at("f");
    ASSERT_EQ(f.size(), 3u);
    EXPECT_NEAR(f[0], 40000.0, 1e-9);
    EXPECT_NEAR(f[1], 90.0 + 450.0 + 35000.0, 1e-9);
    EXPECT_NEAR(f[2], 10.0 + 40000.0, 1e-9);

    EXPECT_EQ(result->units.at("f"), "K");
    EXPECT_EQ(result->units.at("time"), "s");
    EXPECT_EQ(result->units.at("c3"), "km");
}

TEST(FlythroughTest, PointMustBeInsideEveryDomain) {
    auto registry = make_registry();
    auto result = fly_through(registry, {"f", "g"}, make_trajectory());
    ASSERT_TRUE(result.has_value());

    // Point 3 is past the end of the time grid of g
    EXPECT_EQ(result->net_idx, (std::vector<size_t>{0, 1}));
    EXPECT_EQ(result->variables.at("g"), (std::vector<double>{0.0, 0.5}));
    EXPECT_EQ(result->variables.at("f").size(), 2u);
}

TEST(FlythroughTest, NaNCoordinatesAreDropped) {
    auto registry = make_registry();
    auto traj = make_trajectory();
    traj.c2[0] = std::numeric_limits<double>::quiet_NaN();

    auto result = fly_through(registry, {"f"}, traj);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->net_idx, (std::vector<size_t>{1, 3}));
}

TEST(FlythroughTest, ExplicitBindings) {
    auto registry = make_registry();
    auto traj = make_trajectory();

    AxisBindings bindings = {
        {"lon", TrajectoryComponent::C1},
        {"lat", TrajectoryComponent::C2},
        {"height", TrajectoryComponent::C1},
    };
    traj.c1 = {350.0, 400.0, 450.0, 500.0};
    auto result = fly_through(registry, {"f"}, traj, bindings);
    ASSERT_TRUE(result.has_value());
    // Longitudes above 180 fall outside the lon grid
    EXPECT_TRUE(result->net_idx.empty());
    EXPECT_TRUE(result->variables.at("f").empty());
}

TEST(FlythroughTest, UnknownFunctionIsNotFound) {
    auto registry = make_registry();
    auto result = fly_through(registry, {"f", "missing"}, make_trajectory());
    ASSERT_FALSE(result.has_value());

    const auto* err = std::get_if<NotFoundError>(&result.error());
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->name, "missing");
}

TEST(FlythroughTest, UnboundAxisRejected) {
    auto registry = make_registry();
    auto traj = make_trajectory();
    traj.coordinate_system = {CoordinateFrame::GEO, CoordinateGrid::SPHERICAL};

    auto result = fly_through(registry, {"f"}, traj);
    ASSERT_FALSE(result.has_value());

    const auto* err = std::get_if<ValidationError>(&result.error());
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->code, ValidationErrorCode::UnboundAxis);
    EXPECT_EQ(err->name, "height");
    EXPECT_EQ(err->index, 2u);
}

TEST(FlythroughTest, RaggedTrajectoryRejected) {
    auto registry = make_registry();
    auto traj = make_trajectory();
    traj.c3.pop_back();

    auto result = fly_through(registry, {"f"}, traj);
    ASSERT_FALSE(result.has_value());

    const auto* err = std::get_if<ValidationError>(&result.error());
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->code, ValidationErrorCode::RaggedTrajectory);
}

TEST(FlythroughTest, EmptyNameListRejected) {
    auto registry = make_registry();
    auto result = fly_through(registry, {}, make_trajectory());
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<ValidationError>(result.error()));
}

TEST(FlythroughTest, SampleOrbitThroughGlobalGrid) {
    auto traj = sample_trajectory({.stop_time = 5400.0, .cadence = 30.0});
    ASSERT_TRUE(traj.has_value());

    auto registry = make_registry();
    auto result = fly_through(registry, {"f"}, traj.value());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), traj->size());

    for (size_t k = 0; k < result->size(); ++k) {
        const size_t i = result->net_idx[k];
        const double expected = traj->c1[i] + 10.0 * traj->c2[i] + 100.0 * traj->c3[i];
        EXPECT_NEAR(result->variables.at("f")[k], expected, 1e-8);
    }
}

}  // namespace
}  // namespace gridfn
