// SPDX-License-Identifier: MIT
#include "src/grid/parquet/parquet_io.hpp"
#include "src/grid/coordinate_registry.hpp"
#include "src/grid/dataset_binder.hpp"
#include "src/grid/gridded_function_builder.hpp"
#include "src/support/crc64.hpp"
#include "src/support/trace.h"

#include <arrow/api.h>
#include <arrow/builder.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <charconv>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace gridfn {

namespace {

// ============================================================================
// Constants
// ============================================================================

constexpr const char* FORMAT_VERSION = "1.0";
constexpr const char* KIND_REGISTRY = "registry";
constexpr const char* KIND_FLYTHROUGH = "flythrough";

// ============================================================================
// Helpers
// ============================================================================

SerializationError make_error(SerializationErrorCode code, std::string detail = {}) {
    GRIDFN_TRACE_SERIALIZATION_ERROR(static_cast<int>(code), 0);
    return SerializationError{code, std::move(detail)};
}

/// Check an Arrow Status; return SerializationError with `code` on failure.
#define GRIDFN_ARROW_CHECK(expr, code)                           \
    do {                                                         \
        auto _s = (expr);                                        \
        if (!_s.ok()) {                                          \
            return std::unexpected(make_error(code, _s.ToString())); \
        }                                                        \
    } while (0)

/// Check an Arrow Result and assign; return SerializationError on failure.
#define GRIDFN_ARROW_ASSIGN(var, expr, code)                     \
    auto _result_##var = (expr);                                 \
    if (!_result_##var.ok()) {                                   \
        return std::unexpected(                                  \
            make_error(code, _result_##var.status().ToString())); \
    }                                                            \
    auto var = std::move(_result_##var).ValueUnsafe()

std::expected<size_t, SerializationError> parse_size_t(const std::string& s) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::unexpected(make_error(SerializationErrorCode::CorruptedData, s));
    }
    return value;
}

std::shared_ptr<arrow::Field> unit_field(const std::string& name, const std::string& unit) {
    auto meta = arrow::key_value_metadata({"unit"}, {unit});
    return arrow::field(name, arrow::float64())->WithMetadata(meta);
}

/// Samples and grids of a gridded function in argument order
struct FunctionRecord {
    std::vector<const std::vector<double>*> grids;
    const std::vector<double>* values = nullptr;
};

FunctionRecord record_of(const AnyGriddedFunction& fn) {
    return std::visit([](const auto& f) {
        FunctionRecord rec;
        for (const auto& axis : f.axes()) {
            rec.grids.push_back(&axis->values);
        }
        rec.values = &f.interpolant().values();
        return rec;
    }, fn.variant());
}

// ============================================================================
// Schema
// ============================================================================

std::vector<std::string> grid_column_names() {
    std::vector<std::string> names;
    for (size_t d = 0; d < kMaxDimensions; ++d) {
        names.push_back("grid_" + std::to_string(d));
    }
    return names;
}

std::shared_ptr<arrow::Schema> make_registry_schema(
    const std::shared_ptr<arrow::KeyValueMetadata>& metadata) {

    auto list_double = arrow::list(arrow::float64());
    auto list_utf8 = arrow::list(arrow::utf8());

    arrow::FieldVector fields{
        arrow::field("name", arrow::utf8()),
        arrow::field("unit", arrow::utf8()),
        arrow::field("method", arrow::utf8()),
        arrow::field("bounds", arrow::utf8()),
        arrow::field("ndim", arrow::int32()),
        arrow::field("axis_names", list_utf8),
        arrow::field("axis_units", list_utf8),
    };
    for (const auto& name : grid_column_names()) {
        fields.push_back(arrow::field(name, list_double));
    }
    fields.push_back(arrow::field("values", list_double));
    fields.push_back(arrow::field("checksum_values", arrow::int64()));
    fields.push_back(arrow::field("citation", arrow::utf8(), /*nullable=*/true));
    fields.push_back(arrow::field("equation", arrow::utf8(), /*nullable=*/true));
    fields.push_back(arrow::field("description", arrow::utf8(), /*nullable=*/true));
    fields.push_back(arrow::field("coordinate_system", arrow::utf8(), /*nullable=*/true));
    fields.push_back(arrow::field("hidden_args", list_utf8));
    fields.push_back(arrow::field("extra_keys", list_utf8));
    fields.push_back(arrow::field("extra_values", list_utf8));

    return arrow::schema(fields, metadata);
}

// ============================================================================
// Write helpers
// ============================================================================

arrow::Status append_double_list(arrow::ListBuilder& list_builder,
                                 const std::vector<double>& vec) {
    ARROW_RETURN_NOT_OK(list_builder.Append());
    auto& value_builder =
        static_cast<arrow::DoubleBuilder&>(*list_builder.value_builder());
    return value_builder.AppendValues(vec);
}

arrow::Status append_string_list(arrow::ListBuilder& list_builder,
                                 const std::vector<std::string>& vec) {
    ARROW_RETURN_NOT_OK(list_builder.Append());
    auto& value_builder =
        static_cast<arrow::StringBuilder&>(*list_builder.value_builder());
    for (const auto& s : vec) {
        ARROW_RETURN_NOT_OK(value_builder.Append(s));
    }
    return arrow::Status::OK();
}

arrow::Status append_optional(arrow::StringBuilder& builder,
                              const std::optional<std::string>& value) {
    if (value.has_value()) {
        return builder.Append(*value);
    }
    return builder.AppendNull();
}

std::shared_ptr<parquet::WriterProperties> writer_properties(const ParquetWriteOptions& opts) {
    auto props_builder = parquet::WriterProperties::Builder();
    switch (opts.compression) {
        case ParquetCompression::NONE:
            props_builder.compression(arrow::Compression::UNCOMPRESSED);
            break;
        case ParquetCompression::SNAPPY:
            props_builder.compression(arrow::Compression::SNAPPY);
            break;
        case ParquetCompression::ZSTD:
            props_builder.compression(arrow::Compression::ZSTD);
            break;
    }
    return props_builder.build();
}

std::expected<void, SerializationError>
write_table(const arrow::Table& table,
            const std::filesystem::path& path,
            const ParquetWriteOptions& opts) {
    std::error_code ec;
    if (!opts.overwrite && std::filesystem::exists(path, ec)) {
        return std::unexpected(make_error(SerializationErrorCode::FileExists, path.string()));
    }

    auto arrow_props = parquet::ArrowWriterProperties::Builder()
        .store_schema()->build();

    GRIDFN_ARROW_ASSIGN(outfile,
        arrow::io::FileOutputStream::Open(path.string()),
        SerializationErrorCode::OpenFailed);

    GRIDFN_ARROW_CHECK(parquet::arrow::WriteTable(
        table, arrow::default_memory_pool(), outfile, /*chunk_size=*/1024,
        writer_properties(opts), arrow_props),
        SerializationErrorCode::WriteFailed);

    GRIDFN_ARROW_CHECK(outfile->Close(), SerializationErrorCode::WriteFailed);
    return {};
}

// ============================================================================
// Read helpers
// ============================================================================

std::vector<double> read_double_list(const std::shared_ptr<arrow::Array>& col, int64_t row) {
    auto list_arr = std::static_pointer_cast<arrow::ListArray>(col);
    auto values_arr = std::static_pointer_cast<arrow::DoubleArray>(list_arr->values());

    const int32_t start = list_arr->value_offset(row);
    const int32_t end = list_arr->value_offset(row + 1);

    std::vector<double> result;
    result.reserve(static_cast<size_t>(end - start));
    for (int32_t j = start; j < end; ++j) {
        result.push_back(values_arr->Value(j));
    }
    return result;
}

std::vector<std::string> read_string_list(const std::shared_ptr<arrow::Array>& col, int64_t row) {
    auto list_arr = std::static_pointer_cast<arrow::ListArray>(col);
    auto values_arr = std::static_pointer_cast<arrow::StringArray>(list_arr->values());

    const int32_t start = list_arr->value_offset(row);
    const int32_t end = list_arr->value_offset(row + 1);

    std::vector<std::string> result;
    result.reserve(static_cast<size_t>(end - start));
    for (int32_t j = start; j < end; ++j) {
        result.push_back(values_arr->GetString(j));
    }
    return result;
}

std::optional<std::string> read_optional(const std::shared_ptr<arrow::StringArray>& col, int64_t row) {
    if (col->IsNull(row)) {
        return std::nullopt;
    }
    return col->GetString(row);
}

/// Columns of a table read back from disk, one combined array per column
class ColumnSet {
public:
    explicit ColumnSet(std::shared_ptr<arrow::Table> table) : table_(std::move(table)) {}

    /// Column `name` of the given type; nulls only where `nullable`
    std::expected<std::shared_ptr<arrow::Array>, SerializationError>
    get(const std::string& name, arrow::Type::type type, bool nullable = false) const {
        auto col = table_->GetColumnByName(name);
        if (!col) {
            return std::unexpected(make_error(SerializationErrorCode::SchemaMismatch, name));
        }

        std::shared_ptr<arrow::Array> arr;
        if (col->num_chunks() == 1) {
            arr = col->chunk(0);
        } else {
            auto combined = arrow::Concatenate(col->chunks(), arrow::default_memory_pool());
            if (!combined.ok()) {
                return std::unexpected(make_error(SerializationErrorCode::ReadFailed, name));
            }
            arr = *combined;
        }

        if (arr->type_id() != type) {
            return std::unexpected(make_error(SerializationErrorCode::SchemaMismatch, name));
        }
        if (!nullable && arr->null_count() > 0) {
            return std::unexpected(make_error(SerializationErrorCode::CorruptedData, name));
        }
        return arr;
    }

    /// List column whose elements have type `child`
    std::expected<std::shared_ptr<arrow::Array>, SerializationError>
    get_list(const std::string& name, arrow::Type::type child) const {
        auto arr = get(name, arrow::Type::LIST);
        if (!arr) return arr;
        const auto& list_type = static_cast<const arrow::ListType&>(*(*arr)->type());
        if (list_type.value_type()->id() != child) {
            return std::unexpected(make_error(SerializationErrorCode::SchemaMismatch, name));
        }
        auto values = std::static_pointer_cast<arrow::ListArray>(*arr)->values();
        if (values->null_count() > 0) {
            return std::unexpected(make_error(SerializationErrorCode::CorruptedData, name));
        }
        return arr;
    }

private:
    std::shared_ptr<arrow::Table> table_;
};

std::expected<std::shared_ptr<arrow::Table>, SerializationError>
read_table(const std::filesystem::path& path) {
    auto pool = arrow::default_memory_pool();

    GRIDFN_ARROW_ASSIGN(infile,
        arrow::io::ReadableFile::Open(path.string()),
        SerializationErrorCode::OpenFailed);

    GRIDFN_ARROW_ASSIGN(reader,
        parquet::arrow::OpenFile(infile, pool),
        SerializationErrorCode::ReadFailed);

    std::shared_ptr<arrow::Table> table;
    GRIDFN_ARROW_CHECK(reader->ReadTable(&table), SerializationErrorCode::ReadFailed);
    return table;
}

}  // anonymous namespace

// ============================================================================
// write_parquet (registry)
// ============================================================================

std::expected<void, SerializationError>
write_parquet(const FunctionRegistry& registry,
              const std::filesystem::path& path,
              const ParquetWriteOptions& opts) {

    auto pool = arrow::default_memory_pool();

    // ---- File-level metadata ----
    auto metadata = std::make_shared<arrow::KeyValueMetadata>();
    metadata->Append("gridfn.format_version", FORMAT_VERSION);
    metadata->Append("gridfn.kind", KIND_REGISTRY);
    metadata->Append("gridfn.n_functions", std::to_string(registry.size()));

    auto schema = make_registry_schema(metadata);
    GRIDFN_TRACE_ALGO_START(GRIDFN_MODULE_SERIALIZATION, registry.size(), 1);

    // ---- Column builders ----
    arrow::StringBuilder name_b(pool);
    arrow::StringBuilder unit_b(pool);
    arrow::StringBuilder method_b(pool);
    arrow::StringBuilder bounds_b(pool);
    arrow::Int32Builder ndim_b(pool);
    arrow::ListBuilder axis_names_b(pool, std::make_shared<arrow::StringBuilder>(pool));
    arrow::ListBuilder axis_units_b(pool, std::make_shared<arrow::StringBuilder>(pool));

    std::vector<std::unique_ptr<arrow::ListBuilder>> grid_b;
    for (size_t d = 0; d < kMaxDimensions; ++d) {
        grid_b.push_back(std::make_unique<arrow::ListBuilder>(
            pool, std::make_shared<arrow::DoubleBuilder>(pool)));
    }

    arrow::ListBuilder values_b(pool, std::make_shared<arrow::DoubleBuilder>(pool));
    arrow::Int64Builder checksum_b(pool);
    arrow::StringBuilder citation_b(pool);
    arrow::StringBuilder equation_b(pool);
    arrow::StringBuilder description_b(pool);
    arrow::StringBuilder coord_sys_b(pool);
    arrow::ListBuilder hidden_b(pool, std::make_shared<arrow::StringBuilder>(pool));
    arrow::ListBuilder extra_keys_b(pool, std::make_shared<arrow::StringBuilder>(pool));
    arrow::ListBuilder extra_values_b(pool, std::make_shared<arrow::StringBuilder>(pool));

    constexpr auto WRITE = SerializationErrorCode::WriteFailed;

    // ---- Populate rows ----
    for (const auto& [name, fn] : registry) {
        if (fn.dimensions() == 0) {
            return std::unexpected(make_error(SerializationErrorCode::SchemaMismatch, name));
        }
        const auto& meta = *fn.metadata();
        const auto rec = record_of(fn);

        GRIDFN_ARROW_CHECK(name_b.Append(name), WRITE);
        GRIDFN_ARROW_CHECK(unit_b.Append(fn.unit()), WRITE);
        GRIDFN_ARROW_CHECK(method_b.Append(std::string(to_string(fn.config().method))), WRITE);
        GRIDFN_ARROW_CHECK(bounds_b.Append(std::string(to_string(fn.config().bounds))), WRITE);
        GRIDFN_ARROW_CHECK(ndim_b.Append(static_cast<int32_t>(fn.dimensions())), WRITE);

        std::vector<std::string> axis_names;
        std::vector<std::string> axis_units;
        for (const auto& [arg, unit] : meta.arg_units()) {
            axis_names.push_back(arg);
            axis_units.push_back(unit);
        }
        GRIDFN_ARROW_CHECK(append_string_list(axis_names_b, axis_names), WRITE);
        GRIDFN_ARROW_CHECK(append_string_list(axis_units_b, axis_units), WRITE);

        // grids: pad unused axes with empty lists
        for (size_t d = 0; d < kMaxDimensions; ++d) {
            if (d < rec.grids.size()) {
                GRIDFN_ARROW_CHECK(append_double_list(*grid_b[d], *rec.grids[d]), WRITE);
            } else {
                GRIDFN_ARROW_CHECK(grid_b[d]->Append(), WRITE);
            }
        }

        GRIDFN_ARROW_CHECK(append_double_list(values_b, *rec.values), WRITE);
        const uint64_t crc = CRC64::compute(std::span<const double>(*rec.values));
        GRIDFN_ARROW_CHECK(checksum_b.Append(static_cast<int64_t>(crc)), WRITE);

        GRIDFN_ARROW_CHECK(append_optional(citation_b, meta.citation()), WRITE);
        GRIDFN_ARROW_CHECK(append_optional(equation_b, meta.equation()), WRITE);
        GRIDFN_ARROW_CHECK(append_optional(description_b, meta.description()), WRITE);
        GRIDFN_ARROW_CHECK(append_optional(coord_sys_b, meta.coordinate_system()), WRITE);
        GRIDFN_ARROW_CHECK(append_string_list(hidden_b, meta.hidden_args()), WRITE);

        std::vector<std::string> keys;
        std::vector<std::string> values;
        for (const auto& [k, v] : meta.extra()) {
            keys.push_back(k);
            values.push_back(v);
        }
        GRIDFN_ARROW_CHECK(append_string_list(extra_keys_b, keys), WRITE);
        GRIDFN_ARROW_CHECK(append_string_list(extra_values_b, values), WRITE);
    }

    // ---- Finalize arrays ----
    std::vector<std::shared_ptr<arrow::Array>> columns;
    auto finish = [&columns](arrow::ArrayBuilder& b) {
        std::shared_ptr<arrow::Array> arr;
        auto status = b.Finish(&arr);
        columns.push_back(std::move(arr));
        return status;
    };

    GRIDFN_ARROW_CHECK(finish(name_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(unit_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(method_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(bounds_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(ndim_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(axis_names_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(axis_units_b), WRITE);
    for (auto& b : grid_b) {
        GRIDFN_ARROW_CHECK(finish(*b), WRITE);
    }
    GRIDFN_ARROW_CHECK(finish(values_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(checksum_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(citation_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(equation_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(description_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(coord_sys_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(hidden_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(extra_keys_b), WRITE);
    GRIDFN_ARROW_CHECK(finish(extra_values_b), WRITE);

    auto table = arrow::Table::Make(schema, columns);
    auto written = write_table(*table, path, opts);
    if (written) {
        GRIDFN_TRACE_ALGO_COMPLETE(GRIDFN_MODULE_SERIALIZATION, registry.size());
    }
    return written;
}

// ============================================================================
// read_parquet (registry)
// ============================================================================

std::expected<FunctionRegistry, SerializationError>
read_parquet(const std::filesystem::path& path) {

    auto table_res = read_table(path);
    if (!table_res) return std::unexpected(table_res.error());
    auto table = *table_res;

    // ---- File-level metadata ----
    auto kv = table->schema()->metadata();
    if (!kv) {
        return std::unexpected(make_error(SerializationErrorCode::SchemaMismatch, "metadata"));
    }
    auto get_meta = [&](const std::string& key)
        -> std::expected<std::string, SerializationError> {
        auto idx = kv->FindKey(key);
        if (idx < 0) {
            return std::unexpected(make_error(SerializationErrorCode::SchemaMismatch, key));
        }
        return kv->value(idx);
    };

    {
        auto v = get_meta("gridfn.format_version");
        if (!v) return std::unexpected(v.error());
        if (*v != FORMAT_VERSION) {
            return std::unexpected(make_error(SerializationErrorCode::SchemaMismatch, *v));
        }
    }
    {
        auto v = get_meta("gridfn.kind");
        if (!v) return std::unexpected(v.error());
        if (*v != KIND_REGISTRY) {
            return std::unexpected(make_error(SerializationErrorCode::SchemaMismatch, *v));
        }
    }
    size_t n_functions = 0;
    {
        auto v = get_meta("gridfn.n_functions");
        if (!v) return std::unexpected(v.error());
        auto parsed = parse_size_t(*v);
        if (!parsed) return std::unexpected(parsed.error());
        n_functions = *parsed;
    }
    if (static_cast<int64_t>(n_functions) != table->num_rows()) {
        return std::unexpected(make_error(SerializationErrorCode::CorruptedData, "row count"));
    }

    GRIDFN_TRACE_ALGO_START(GRIDFN_MODULE_SERIALIZATION, n_functions, 0);

    // ---- Columns ----
    ColumnSet cols(table);
    auto name_res = cols.get("name", arrow::Type::STRING);
    auto unit_res = cols.get("unit", arrow::Type::STRING);
    auto method_res = cols.get("method", arrow::Type::STRING);
    auto bounds_res = cols.get("bounds", arrow::Type::STRING);
    auto ndim_res = cols.get("ndim", arrow::Type::INT32);
    auto axis_names_res = cols.get_list("axis_names", arrow::Type::STRING);
    auto axis_units_res = cols.get_list("axis_units", arrow::Type::STRING);
    auto values_res = cols.get_list("values", arrow::Type::DOUBLE);
    auto checksum_res = cols.get("checksum_values", arrow::Type::INT64);
    auto citation_res = cols.get("citation", arrow::Type::STRING, true);
    auto equation_res = cols.get("equation", arrow::Type::STRING, true);
    auto description_res = cols.get("description", arrow::Type::STRING, true);
    auto coord_sys_res = cols.get("coordinate_system", arrow::Type::STRING, true);
    auto hidden_res = cols.get_list("hidden_args", arrow::Type::STRING);
    auto extra_keys_res = cols.get_list("extra_keys", arrow::Type::STRING);
    auto extra_values_res = cols.get_list("extra_values", arrow::Type::STRING);

    for (const auto* res : {&name_res, &unit_res, &method_res, &bounds_res, &ndim_res,
                            &axis_names_res, &axis_units_res, &values_res, &checksum_res,
                            &citation_res, &equation_res, &description_res, &coord_sys_res,
                            &hidden_res, &extra_keys_res, &extra_values_res}) {
        if (!*res) return std::unexpected(res->error());
    }

    std::vector<std::shared_ptr<arrow::Array>> grid_cols;
    for (const auto& grid_name : grid_column_names()) {
        auto res = cols.get_list(grid_name, arrow::Type::DOUBLE);
        if (!res) return std::unexpected(res.error());
        grid_cols.push_back(*res);
    }

    auto name_a = std::static_pointer_cast<arrow::StringArray>(*name_res);
    auto unit_a = std::static_pointer_cast<arrow::StringArray>(*unit_res);
    auto method_a = std::static_pointer_cast<arrow::StringArray>(*method_res);
    auto bounds_a = std::static_pointer_cast<arrow::StringArray>(*bounds_res);
    auto ndim_a = std::static_pointer_cast<arrow::Int32Array>(*ndim_res);
    auto checksum_a = std::static_pointer_cast<arrow::Int64Array>(*checksum_res);
    auto citation_a = std::static_pointer_cast<arrow::StringArray>(*citation_res);
    auto equation_a = std::static_pointer_cast<arrow::StringArray>(*equation_res);
    auto description_a = std::static_pointer_cast<arrow::StringArray>(*description_res);
    auto coord_sys_a = std::static_pointer_cast<arrow::StringArray>(*coord_sys_res);

    std::vector<AnyGriddedFunction> functions;
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        const auto corrupted = [i](std::string what) {
            GRIDFN_TRACE_SERIALIZATION_ERROR(
                static_cast<int>(SerializationErrorCode::CorruptedData), i);
            return std::unexpected(SerializationError{
                SerializationErrorCode::CorruptedData, std::move(what)});
        };

        const std::string name = name_a->GetString(i);
        const auto method = parse_interpolation_method(method_a->GetString(i));
        const auto bounds = parse_out_of_bounds_policy(bounds_a->GetString(i));
        if (!method || !bounds) {
            return corrupted(name + ": interpolation settings");
        }

        const auto ndim = static_cast<size_t>(ndim_a->Value(i));
        const auto axis_names = read_string_list(*axis_names_res, i);
        const auto axis_units = read_string_list(*axis_units_res, i);
        if (ndim == 0 || ndim > kMaxDimensions ||
            axis_names.size() != ndim || axis_units.size() != ndim) {
            return corrupted(name + ": axes");
        }

        auto values = read_double_list(*values_res, i);
        const uint64_t stored_crc = static_cast<uint64_t>(checksum_a->Value(i));
        if (stored_crc != CRC64::compute(std::span<const double>(values))) {
            GRIDFN_TRACE_SERIALIZATION_ERROR(
                static_cast<int>(SerializationErrorCode::ChecksumMismatch), i);
            return std::unexpected(SerializationError{
                SerializationErrorCode::ChecksumMismatch, name});
        }

        // Rebuild through the same validation path as fresh input
        std::vector<CoordinateSpec> coord_specs;
        std::vector<size_t> shape;
        for (size_t d = 0; d < ndim; ++d) {
            auto grid = read_double_list(grid_cols[d], i);
            shape.push_back(grid.size());
            coord_specs.push_back({axis_names[d], axis_units[d], NdArray::vector(std::move(grid))});
        }
        auto coords = CoordinateRegistry::create(std::move(coord_specs));
        if (!coords) {
            return corrupted(name + ": invalid axis");
        }

        std::vector<DatasetSpec> datasets;
        datasets.push_back({name, unit_a->GetString(i), NdArray{std::move(shape), std::move(values)}});
        auto bound = DatasetBinder(*coords).bind(std::move(datasets));
        if (!bound) {
            return corrupted(name + ": shape");
        }

        auto fn = GriddedFunctionBuilder(InterpolationConfig{*method, *bounds}).build(bound->front());
        if (!fn) {
            return corrupted(name + ": build");
        }

        auto& meta = *fn->metadata();
        if (auto v = read_optional(citation_a, i)) meta.set_citation(std::move(*v));
        if (auto v = read_optional(equation_a, i)) meta.set_equation(std::move(*v));
        if (auto v = read_optional(description_a, i)) meta.set_description(std::move(*v));
        if (auto v = read_optional(coord_sys_a, i)) meta.set_coordinate_system(std::move(*v));
        meta.set_hidden_args(read_string_list(*hidden_res, i));

        const auto keys = read_string_list(*extra_keys_res, i);
        const auto extra_values = read_string_list(*extra_values_res, i);
        if (keys.size() != extra_values.size()) {
            return corrupted(name + ": extra metadata");
        }
        for (size_t k = 0; k < keys.size(); ++k) {
            meta.set_extra(keys[k], extra_values[k]);
        }

        functions.push_back(std::move(*fn));
    }

    FunctionRegistry registry;
    auto inserted = registry.register_batch(std::move(functions));
    if (!inserted) {
        return std::unexpected(make_error(SerializationErrorCode::CorruptedData, inserted.error().name));
    }

    GRIDFN_TRACE_ALGO_COMPLETE(GRIDFN_MODULE_SERIALIZATION, registry.size());
    return registry;
}

// ============================================================================
// write_parquet (flythrough)
// ============================================================================

std::expected<void, SerializationError>
write_parquet(const FlythroughResult& result,
              const std::filesystem::path& path,
              const ParquetWriteOptions& opts) {

    auto pool = arrow::default_memory_pool();
    constexpr auto WRITE = SerializationErrorCode::WriteFailed;

    auto unit_of = [&result](const std::string& key) {
        auto it = result.units.find(key);
        return it == result.units.end() ? std::string{} : it->second;
    };

    auto metadata = std::make_shared<arrow::KeyValueMetadata>();
    metadata->Append("gridfn.format_version", FORMAT_VERSION);
    metadata->Append("gridfn.kind", KIND_FLYTHROUGH);
    metadata->Append("gridfn.coordinate_system", to_string(result.coordinate_system));
    for (const auto& [key, unit] : result.units) {
        metadata->Append("gridfn.units." + key, unit);
    }

    arrow::FieldVector fields;
    std::vector<std::shared_ptr<arrow::Array>> columns;

    auto add_double_column = [&](const std::string& name, const std::vector<double>& data)
        -> arrow::Status {
        if (data.size() != result.size()) {
            return arrow::Status::Invalid("ragged column ", name);
        }
        arrow::DoubleBuilder b(pool);
        ARROW_RETURN_NOT_OK(b.AppendValues(data));
        std::shared_ptr<arrow::Array> arr;
        ARROW_RETURN_NOT_OK(b.Finish(&arr));
        fields.push_back(unit_field(name, unit_of(name)));
        columns.push_back(std::move(arr));
        return arrow::Status::OK();
    };

    GRIDFN_ARROW_CHECK(add_double_column("time", result.time), WRITE);
    GRIDFN_ARROW_CHECK(add_double_column("c1", result.c1), WRITE);
    GRIDFN_ARROW_CHECK(add_double_column("c2", result.c2), WRITE);
    GRIDFN_ARROW_CHECK(add_double_column("c3", result.c3), WRITE);

    {
        if (result.net_idx.size() != result.size()) {
            return std::unexpected(make_error(WRITE, "net_idx"));
        }
        arrow::Int64Builder b(pool);
        for (size_t idx : result.net_idx) {
            GRIDFN_ARROW_CHECK(b.Append(static_cast<int64_t>(idx)), WRITE);
        }
        std::shared_ptr<arrow::Array> arr;
        GRIDFN_ARROW_CHECK(b.Finish(&arr), WRITE);
        fields.push_back(arrow::field("net_idx", arrow::int64()));
        columns.push_back(std::move(arr));
    }

    for (const auto& [name, values] : result.variables) {
        GRIDFN_ARROW_CHECK(add_double_column(name, values), WRITE);
    }

    auto table = arrow::Table::Make(arrow::schema(fields, metadata), columns);
    return write_table(*table, path, opts);
}

}  // namespace gridfn
