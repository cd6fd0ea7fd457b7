/// @file src/store/arrow_codec.cpp
/// @brief StoreSnapshot ⇄ Arrow IPC file bytes.
///
/// One record batch, one row per SymbolRecord, rows in (exchange, symbol)
/// order. The nested `daily` column is a list of structs so that each row
/// carries its whole series.

#include "datahub/store.hpp"
#include "datahub/constants.hpp"
#include "datahub/errors.hpp"
#include "datahub/merge.hpp"

#include <arrow/api.h>
#include <arrow/io/memory.h>
#include <arrow/ipc/api.h>

#include <fmt/format.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace datahub::store {

namespace {

// ─── Schema ───────────────────────────────────────────────────────────────────

std::shared_ptr<arrow::DataType> daily_struct_type() {
    return arrow::struct_({
        arrow::field("date",   arrow::int32(),   false),
        arrow::field("open",   arrow::float64(), false),
        arrow::field("high",   arrow::float64(), false),
        arrow::field("low",    arrow::float64(), false),
        arrow::field("close",  arrow::float64(), false),
        arrow::field("volume", arrow::int64(),   false),
        arrow::field("amount", arrow::float64(), false),
    });
}

std::shared_ptr<arrow::DataType> daily_list_type() {
    return arrow::list(arrow::field("item", daily_struct_type(), false));
}

std::shared_ptr<arrow::Schema> store_schema() {
    auto metadata = arrow::key_value_metadata(
        {std::string(constants::SCHEMA_VERSION_KEY)},
        {std::string(constants::SCHEMA_VERSION)});

    return arrow::schema({
        arrow::field("exchange", arrow::utf8(),      false),
        arrow::field("symbol",   arrow::utf8(),      false),
        arrow::field("name",     arrow::utf8(),      false),
        arrow::field("daily",    daily_list_type(),  true),
    }, std::move(metadata));
}

// ─── Error translation ────────────────────────────────────────────────────────

void check(const arrow::Status& status, std::string_view what) {
    if (!status.ok()) {
        throw SchemaError(fmt::format("{}: {}", what, status.ToString()));
    }
}

template <typename T>
T unwrap(arrow::Result<T> result, std::string_view what) {
    check(result.status(), what);
    return std::move(result).ValueOrDie();
}

// ─── Encoding ─────────────────────────────────────────────────────────────────

arrow::Result<std::shared_ptr<arrow::Buffer>>
write_ipc(const StoreSnapshot& snapshot) {
    auto* pool = arrow::default_memory_pool();

    arrow::StringBuilder exchange_b(pool);
    arrow::StringBuilder symbol_b(pool);
    arrow::StringBuilder name_b(pool);

    auto date_b   = std::make_shared<arrow::Int32Builder>(pool);
    auto open_b   = std::make_shared<arrow::DoubleBuilder>(pool);
    auto high_b   = std::make_shared<arrow::DoubleBuilder>(pool);
    auto low_b    = std::make_shared<arrow::DoubleBuilder>(pool);
    auto close_b  = std::make_shared<arrow::DoubleBuilder>(pool);
    auto volume_b = std::make_shared<arrow::Int64Builder>(pool);
    auto amount_b = std::make_shared<arrow::DoubleBuilder>(pool);

    auto item_b = std::make_shared<arrow::StructBuilder>(
        daily_struct_type(), pool,
        std::vector<std::shared_ptr<arrow::ArrayBuilder>>{
            date_b, open_b, high_b, low_b, close_b, volume_b, amount_b});
    arrow::ListBuilder daily_b(pool, item_b, daily_list_type());

    for (const auto& [key, record] : snapshot) {
        ARROW_RETURN_NOT_OK(exchange_b.Append(key.exchange));
        ARROW_RETURN_NOT_OK(symbol_b.Append(key.symbol));
        ARROW_RETURN_NOT_OK(name_b.Append(record.name));

        ARROW_RETURN_NOT_OK(daily_b.Append());
        for (const auto& bar : record.daily) {
            ARROW_RETURN_NOT_OK(item_b->Append());
            ARROW_RETURN_NOT_OK(date_b->Append(bar.date));
            ARROW_RETURN_NOT_OK(open_b->Append(bar.open));
            ARROW_RETURN_NOT_OK(high_b->Append(bar.high));
            ARROW_RETURN_NOT_OK(low_b->Append(bar.low));
            ARROW_RETURN_NOT_OK(close_b->Append(bar.close));
            ARROW_RETURN_NOT_OK(volume_b->Append(bar.volume));
            ARROW_RETURN_NOT_OK(amount_b->Append(bar.amount));
        }
    }

    std::shared_ptr<arrow::Array> exchange_arr;
    std::shared_ptr<arrow::Array> symbol_arr;
    std::shared_ptr<arrow::Array> name_arr;
    std::shared_ptr<arrow::Array> daily_arr;
    ARROW_RETURN_NOT_OK(exchange_b.Finish(&exchange_arr));
    ARROW_RETURN_NOT_OK(symbol_b.Finish(&symbol_arr));
    ARROW_RETURN_NOT_OK(name_b.Finish(&name_arr));
    ARROW_RETURN_NOT_OK(daily_b.Finish(&daily_arr));

    auto schema = store_schema();
    auto batch  = arrow::RecordBatch::Make(
        schema, static_cast<std::int64_t>(snapshot.size()),
        {exchange_arr, symbol_arr, name_arr, daily_arr});

    ARROW_ASSIGN_OR_RAISE(auto sink, arrow::io::BufferOutputStream::Create(4096, pool));
    ARROW_ASSIGN_OR_RAISE(auto writer, arrow::ipc::MakeFileWriter(sink, schema));
    ARROW_RETURN_NOT_OK(writer->WriteRecordBatch(*batch));
    ARROW_RETURN_NOT_OK(writer->Close());
    return sink->Finish();
}

// ─── Decoding ─────────────────────────────────────────────────────────────────

void validate_schema(const arrow::Schema& schema) {
    const auto& metadata = schema.metadata();
    const std::string key(constants::SCHEMA_VERSION_KEY);
    const int idx = metadata ? metadata->FindKey(key) : -1;
    if (idx < 0) {
        throw SchemaError(fmt::format(
            "store schema has no '{}' metadata; not a datahub store", key));
    }
    if (metadata->value(idx) != constants::SCHEMA_VERSION) {
        throw SchemaError(fmt::format(
            "store schema version '{}' is not supported (expected '{}')",
            metadata->value(idx), constants::SCHEMA_VERSION));
    }
    if (!schema.Equals(*store_schema(), /*check_metadata=*/false)) {
        throw SchemaError(fmt::format(
            "store columns do not match schema version {}: {}",
            constants::SCHEMA_VERSION, schema.ToString()));
    }
}

/// Append one SymbolRecord per row of `batch`. The schema is already
/// validated, so the column casts are safe.
void append_records(const arrow::RecordBatch& batch,
                    std::vector<SymbolRecord>& out) {
    auto exchange = std::static_pointer_cast<arrow::StringArray>(batch.column(0));
    auto symbol   = std::static_pointer_cast<arrow::StringArray>(batch.column(1));
    auto name     = std::static_pointer_cast<arrow::StringArray>(batch.column(2));
    auto daily    = std::static_pointer_cast<arrow::ListArray>(batch.column(3));

    auto items  = std::static_pointer_cast<arrow::StructArray>(daily->values());
    auto date   = std::static_pointer_cast<arrow::Int32Array>(items->field(0));
    auto open   = std::static_pointer_cast<arrow::DoubleArray>(items->field(1));
    auto high   = std::static_pointer_cast<arrow::DoubleArray>(items->field(2));
    auto low    = std::static_pointer_cast<arrow::DoubleArray>(items->field(3));
    auto close  = std::static_pointer_cast<arrow::DoubleArray>(items->field(4));
    auto volume = std::static_pointer_cast<arrow::Int64Array>(items->field(5));
    auto amount = std::static_pointer_cast<arrow::DoubleArray>(items->field(6));

    if (exchange->null_count() > 0 || symbol->null_count() > 0 || name->null_count() > 0) {
        throw SchemaError("store has null exchange, symbol or name values");
    }
    if (items->null_count() > 0 || date->null_count() > 0 || open->null_count() > 0 ||
        high->null_count() > 0  || low->null_count() > 0  || close->null_count() > 0 ||
        volume->null_count() > 0 || amount->null_count() > 0) {
        throw SchemaError("store has null values inside daily series");
    }

    for (std::int64_t row = 0; row < batch.num_rows(); ++row) {
        SymbolRecord record{
            .key  = SymbolKey{
                .exchange = exchange->GetString(row),
                .symbol   = symbol->GetString(row),
            },
            .name = name->GetString(row),
        };

        if (!daily->IsNull(row)) {
            const auto first = daily->value_offset(row);
            const auto count = daily->value_length(row);
            record.daily.reserve(static_cast<std::size_t>(count));
            for (auto j = first; j < first + count; ++j) {
                record.daily.push_back(Bar{
                    .date   = date->Value(j),
                    .open   = open->Value(j),
                    .high   = high->Value(j),
                    .low    = low->Value(j),
                    .close  = close->Value(j),
                    .volume = volume->Value(j),
                    .amount = amount->Value(j),
                });
            }
        }

        if (!merge::is_strictly_ascending(record.daily)) {
            throw SchemaError(fmt::format(
                "daily series of {} is not strictly ascending by date",
                to_string(record.key)));
        }
        out.push_back(std::move(record));
    }
}

}  // anonymous namespace

// ─── encode ───────────────────────────────────────────────────────────────────

std::string encode(const StoreSnapshot& snapshot) {
    auto result = write_ipc(snapshot);
    if (!result.ok()) {
        throw StoreError(fmt::format("encoding store failed: {}",
                                     result.status().ToString()));
    }
    const auto& buffer = *result;
    return std::string(reinterpret_cast<const char*>(buffer->data()),
                       static_cast<std::size_t>(buffer->size()));
}

// ─── decode ───────────────────────────────────────────────────────────────────

StoreSnapshot decode(std::string_view bytes) {
    auto buffer = std::make_shared<arrow::Buffer>(
        reinterpret_cast<const std::uint8_t*>(bytes.data()),
        static_cast<std::int64_t>(bytes.size()));
    auto input = std::make_shared<arrow::io::BufferReader>(buffer);

    auto reader = unwrap(arrow::ipc::RecordBatchFileReader::Open(input),
                         "not an Arrow IPC file");
    validate_schema(*reader->schema());

    std::vector<SymbolRecord> records;
    for (int i = 0; i < reader->num_record_batches(); ++i) {
        auto batch = unwrap(reader->ReadRecordBatch(i), "cannot read record batch");
        check(batch->ValidateFull(), "record batch is malformed");
        append_records(*batch, records);
    }

    auto snapshot = StoreSnapshot::from_records(std::move(records));
    if (!snapshot) {
        throw SchemaError("store holds more than one record for the same (exchange, symbol)");
    }
    return std::move(*snapshot);
}

}  // namespace datahub::store
