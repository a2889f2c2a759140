// SPDX-License-Identifier: MIT

// Parquet persistence tests: functionalize -> write_parquet -> read_parquet -> evaluate
// Covers metadata preservation, checksum verification and malformed files.

#include <gtest/gtest.h>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "src/grid/functionalize.hpp"
#include "src/grid/parquet/parquet_io.hpp"

namespace gridfn {
namespace {

// ===========================================================================
// Test fixture: manages temp file creation and cleanup
// ===========================================================================

class ParquetIOTest : public ::testing::Test {
protected:
    std::filesystem::path temp_path_;

    void SetUp() override {
        temp_path_ = std::filesystem::temp_directory_path() /
                     ("gridfn_parquet_test_" +
                      std::to_string(::testing::UnitTest::GetInstance()
                                         ->current_test_info()->line()) +
                      ".parquet");
        std::filesystem::remove(temp_path_);
    }

    void TearDown() override {
        std::filesystem::remove(temp_path_);
    }

    /// Read the file as an Arrow table, apply `edit`, write it back in place
    void rewrite(const std::function<std::shared_ptr<arrow::Table>(
                     const std::shared_ptr<arrow::Table>&)>& edit) {
        auto pool = arrow::default_memory_pool();
        auto infile_res = arrow::io::ReadableFile::Open(temp_path_.string());
        ASSERT_TRUE(infile_res.ok());
        auto reader_res = parquet::arrow::OpenFile(*infile_res, pool);
        ASSERT_TRUE(reader_res.ok());
        std::shared_ptr<arrow::Table> table;
        ASSERT_TRUE((*reader_res)->ReadTable(&table).ok());
        ASSERT_TRUE((*infile_res)->Close().ok());

        auto edited = edit(table);
        ASSERT_NE(edited, nullptr);

        auto outfile_res = arrow::io::FileOutputStream::Open(temp_path_.string());
        ASSERT_TRUE(outfile_res.ok());
        ASSERT_TRUE(parquet::arrow::WriteTable(*edited, pool, *outfile_res, 1024).ok());
        ASSERT_TRUE((*outfile_res)->Close().ok());
    }
};

std::vector<double> linspace(double a, double b, size_t n) {
    std::vector<double> v(n);
    for (size_t i = 0; i < n; ++i) {
        v[i] = a + (b - a) * static_cast<double>(i) / static_cast<double>(n - 1);
    }
    return v;
}

/// T(time, lon) on the 25 × 12 grid plus a 1-D density profile
FunctionRegistry make_registry(InterpolationMethod method = InterpolationMethod::LINEAR,
                               bool with_fill = true) {
    std::vector<double> t;
    for (size_t i = 0; i < 25; ++i) {
        for (size_t j = 0; j < 12; ++j) {
            t.push_back(100.0 + static_cast<double>(i) + 0.5 * std::sin(static_cast<double>(j)));
        }
    }
    if (with_fill) {
        t[7] = std::numeric_limits<double>::quiet_NaN();
    }

    FunctionRegistry registry;
    FunctionalizeOptions options;
    options.interpolation.method = method;
    options.coordinate_system = "GDZ-sph";
    auto ok = functionalize(registry,
        {{"time", "hr", NdArray::vector(linspace(0.0, 24.0, 25))},
         {"lon", "deg", NdArray::vector(linspace(-180.0, 180.0, 12))}},
        {{"T", "S", NdArray{{25, 12}, t}}},
        options);
    EXPECT_TRUE(ok.has_value());

    ok = functionalize(registry,
        {{"height", "km", NdArray::vector({100.0, 200.0, 400.0, 800.0})}},
        {{"rho", "kg/m^3", NdArray::vector({5e-7, 2e-10, 3e-12, 1e-14})}});
    EXPECT_TRUE(ok.has_value());
    return registry;
}

std::shared_ptr<arrow::Array> int64_column(int64_t rows, int64_t value) {
    arrow::Int64Builder builder;
    for (int64_t row = 0; row < rows; ++row) {
        EXPECT_TRUE(builder.Append(value).ok());
    }
    std::shared_ptr<arrow::Array> arr;
    EXPECT_TRUE(builder.Finish(&arr).ok());
    return arr;
}

// ===========================================================================
// Registry round trip
// ===========================================================================

TEST_F(ParquetIOTest, RegistryRoundTrip) {
    for (auto method : {InterpolationMethod::LINEAR, InterpolationMethod::CUBIC_SPLINE}) {
        auto original = make_registry(method);
        std::filesystem::remove(temp_path_);
        ASSERT_TRUE(write_parquet(original, temp_path_).has_value());

        auto restored = read_parquet(temp_path_);
        ASSERT_TRUE(restored.has_value()) << restored.error().detail;
        EXPECT_EQ(restored->names(), original.names());

        auto t0 = original.get("T").value();
        auto t1 = restored->get("T").value();
        EXPECT_EQ(t1.symbol(), "T(time, lon)");
        EXPECT_EQ(t1.config().method, method);
        EXPECT_EQ(t1.metadata()->arg_units(), t0.metadata()->arg_units());

        for (double time : {0.0, 3.3, 12.0, 23.9}) {
            for (double lon : {-170.0, -1.0, 45.0, 180.0}) {
                std::vector<double> q = {time, lon};
                const double a = t0.eval(q).value();
                const double b = t1.eval(q).value();
                if (std::isnan(a)) {
                    EXPECT_TRUE(std::isnan(b));
                } else {
                    EXPECT_EQ(a, b) << "at (" << time << ", " << lon << ")";
                }
            }
        }

        std::vector<double> h = {300.0};
        EXPECT_EQ(restored->get("rho")->eval(h).value(), original.get("rho")->eval(h).value());
    }
}

TEST_F(ParquetIOTest, MetadataPreservation) {
    auto registry = make_registry();
    auto meta = registry.get_metadata("T").value();
    meta->set_citation("Author et al. 2020");
    meta->set_equation("T_0 + \xCE\x94T");
    meta->set_hidden_args({"lon"});
    meta->set_extra("source", "CTIPe");
    meta->set_extra("run", "42");

    ASSERT_TRUE(write_parquet(registry, temp_path_).has_value());
    auto restored = read_parquet(temp_path_);
    ASSERT_TRUE(restored.has_value());

    auto t = restored->get_metadata("T").value();
    EXPECT_EQ(t->citation(), "Author et al. 2020");
    EXPECT_EQ(t->equation(), "T_0 + \xCE\x94T");
    EXPECT_FALSE(t->description().has_value());
    EXPECT_EQ(t->coordinate_system(), "GDZ-sph");
    EXPECT_EQ(t->hidden_args(), (std::vector<std::string>{"lon"}));
    EXPECT_EQ(t->extra().size(), 2u);
    EXPECT_EQ(t->extra().at("run"), "42");

    auto rho = restored->get_metadata("rho").value();
    EXPECT_FALSE(rho->citation().has_value());
    EXPECT_FALSE(rho->coordinate_system().has_value());
    EXPECT_TRUE(rho->extra().empty());
}

TEST_F(ParquetIOTest, RestrictedFunctionRoundTrip) {
    auto registry = make_registry(InterpolationMethod::CUBIC_SPLINE, /*with_fill=*/false);
    auto slice = registry.get("T")->restrict("time", 6.5).value();
    FunctionRegistry sliced;
    sliced.register_function(slice);

    ASSERT_TRUE(write_parquet(sliced, temp_path_).has_value());
    auto restored = read_parquet(temp_path_);
    ASSERT_TRUE(restored.has_value());

    auto fn = restored->get("T").value();
    EXPECT_EQ(fn.arg_names(), (std::vector<std::string>{"lon"}));
    for (double lon : {-150.0, 10.0, 170.0}) {
        std::vector<double> q = {lon};
        EXPECT_NEAR(fn.eval(q).value(), slice.eval(q).value(), 1e-12);
    }
}

TEST_F(ParquetIOTest, ScalarFunctionRejected) {
    auto registry = make_registry();
    auto point = registry.get("rho")->restrict("height", 150.0).value();
    FunctionRegistry scalars;
    scalars.register_function(point);

    auto result = write_parquet(scalars, temp_path_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SerializationErrorCode::SchemaMismatch);
    EXPECT_FALSE(std::filesystem::exists(temp_path_));
}

TEST_F(ParquetIOTest, CompressionVariants) {
    auto registry = make_registry();
    for (auto compression : {ParquetCompression::NONE, ParquetCompression::SNAPPY,
                             ParquetCompression::ZSTD}) {
        auto path = std::filesystem::temp_directory_path() /
                    ("gridfn_parquet_compression_" +
                     std::to_string(static_cast<int>(compression)) + ".parquet");
        std::filesystem::remove(path);

        ParquetWriteOptions opts;
        opts.compression = compression;
        ASSERT_TRUE(write_parquet(registry, path, opts).has_value());

        auto restored = read_parquet(path);
        ASSERT_TRUE(restored.has_value());
        EXPECT_EQ(restored->size(), 2u);
        std::filesystem::remove(path);
    }
}

TEST_F(ParquetIOTest, ExistingFileNotOverwritten) {
    auto registry = make_registry();
    ASSERT_TRUE(write_parquet(registry, temp_path_).has_value());

    auto again = write_parquet(registry, temp_path_);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, SerializationErrorCode::FileExists);

    ParquetWriteOptions opts;
    opts.overwrite = true;
    EXPECT_TRUE(write_parquet(registry, temp_path_, opts).has_value());
}

// ===========================================================================
// Malformed files
// ===========================================================================

TEST_F(ParquetIOTest, MissingFileFails) {
    auto result = read_parquet(temp_path_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SerializationErrorCode::OpenFailed);
}

TEST_F(ParquetIOTest, ChecksumCorruptionDetected) {
    ASSERT_TRUE(write_parquet(make_registry(), temp_path_).has_value());
    ASSERT_TRUE(read_parquet(temp_path_).has_value()) << "valid file should read fine";

    rewrite([](const std::shared_ptr<arrow::Table>& table) -> std::shared_ptr<arrow::Table> {
        int crc_idx = table->schema()->GetFieldIndex("checksum_values");
        if (crc_idx < 0) return nullptr;
        auto edited = table->SetColumn(
            crc_idx, table->schema()->field(crc_idx),
            std::make_shared<arrow::ChunkedArray>(int64_column(table->num_rows(), 0)));
        return edited.ok() ? *edited : nullptr;
    });

    auto corrupt = read_parquet(temp_path_);
    ASSERT_FALSE(corrupt.has_value());
    EXPECT_EQ(corrupt.error().code, SerializationErrorCode::ChecksumMismatch);
}

TEST_F(ParquetIOTest, TypeMismatchRejected) {
    ASSERT_TRUE(write_parquet(make_registry(), temp_path_).has_value());

    // ndim stored as int64 instead of int32
    rewrite([](const std::shared_ptr<arrow::Table>& table) -> std::shared_ptr<arrow::Table> {
        int idx = table->schema()->GetFieldIndex("ndim");
        if (idx < 0) return nullptr;
        auto edited = table->SetColumn(
            idx, arrow::field("ndim", arrow::int64()),
            std::make_shared<arrow::ChunkedArray>(int64_column(table->num_rows(), 2)));
        return edited.ok() ? *edited : nullptr;
    });

    auto result = read_parquet(temp_path_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SerializationErrorCode::SchemaMismatch);
}

TEST_F(ParquetIOTest, MissingColumnRejected) {
    ASSERT_TRUE(write_parquet(make_registry(), temp_path_).has_value());

    rewrite([](const std::shared_ptr<arrow::Table>& table) -> std::shared_ptr<arrow::Table> {
        int idx = table->schema()->GetFieldIndex("axis_units");
        if (idx < 0) return nullptr;
        auto edited = table->RemoveColumn(idx);
        return edited.ok() ? *edited : nullptr;
    });

    auto result = read_parquet(temp_path_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SerializationErrorCode::SchemaMismatch);
    EXPECT_EQ(result.error().detail, "axis_units");
}

TEST_F(ParquetIOTest, WrongFileKindRejected) {
    FlythroughResult result;
    result.time = {0.0, 1.0};
    result.c1 = {0.0, 0.0};
    result.c2 = {0.0, 0.0};
    result.c3 = {400.0, 400.0};
    result.net_idx = {0, 1};
    ASSERT_TRUE(write_parquet(result, temp_path_).has_value());

    auto registry = read_parquet(temp_path_);
    ASSERT_FALSE(registry.has_value());
    EXPECT_EQ(registry.error().code, SerializationErrorCode::SchemaMismatch);
}

// ===========================================================================
// Flythrough output
// ===========================================================================

TEST_F(ParquetIOTest, FlythroughColumnsAndUnits) {
    auto registry = make_registry();
    Trajectory traj;
    traj.time = {0.0, 1.0, 2.0};
    traj.c1 = {0.0, 0.0, 0.0};
    traj.c2 = {0.0, 0.0, 0.0};
    traj.c3 = {150.0, 900.0, 300.0};
    auto flown = fly_through(registry, {"rho"}, traj);
    ASSERT_TRUE(flown.has_value());
    ASSERT_EQ(flown->size(), 2u);

    ASSERT_TRUE(write_parquet(*flown, temp_path_).has_value());

    auto pool = arrow::default_memory_pool();
    auto infile = arrow::io::ReadableFile::Open(temp_path_.string());
    ASSERT_TRUE(infile.ok());
    auto reader = parquet::arrow::OpenFile(*infile, pool);
    ASSERT_TRUE(reader.ok());
    std::shared_ptr<arrow::Table> table;
    ASSERT_TRUE((*reader)->ReadTable(&table).ok());

    EXPECT_EQ(table->num_rows(), 2);
    for (const char* name : {"time", "c1", "c2", "c3", "net_idx", "rho"}) {
        EXPECT_GE(table->schema()->GetFieldIndex(name), 0) << name;
    }

    auto net_idx = std::static_pointer_cast<arrow::Int64Array>(
        table->GetColumnByName("net_idx")->chunk(0));
    EXPECT_EQ(net_idx->Value(0), 0);
    EXPECT_EQ(net_idx->Value(1), 2);

    auto kv = table->schema()->metadata();
    ASSERT_NE(kv, nullptr);
    auto kind = kv->Get("gridfn.kind");
    ASSERT_TRUE(kind.ok());
    EXPECT_EQ(*kind, "flythrough");
    auto rho_unit = kv->Get("gridfn.units.rho");
    ASSERT_TRUE(rho_unit.ok());
    EXPECT_EQ(*rho_unit, "kg/m^3");

    auto again = write_parquet(*flown, temp_path_);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, SerializationErrorCode::FileExists);
}

}  // namespace
}  // namespace gridfn
