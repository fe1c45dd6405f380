#pragma once

/// @file trace_writers.hpp
/// @brief TraceWriter implementations for placement decision logs.
/// @ingroup io_writers

#include <vmplace/core/trace_writer.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace vmplace::io {

/// @brief Value of a trace field.
/// @ingroup io_writers
using TraceValue = std::variant<double, uint64_t, std::string>;

/// @brief One decision record, with its fields in the order they were written.
/// @ingroup io_writers
struct TraceRecord {
    uint64_t sequence{0}; ///< Placement decision the record belongs to.
    std::string type;     ///< "vm_placed", "vm_rejected" or "host_scored".
    std::vector<std::pair<std::string, TraceValue>> fields;

    /// @brief Value of field @p key.
    /// @throws std::out_of_range if the record has no such field.
    [[nodiscard]] const TraceValue& at(std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const noexcept;
};

/// @brief Trace writer that discards everything.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(uint64_t /*sequence*/) override {}
    void type(std::string_view /*name*/) override {}
    void field(std::string_view /*key*/, double /*value*/) override {}
    void field(std::string_view /*key*/, uint64_t /*value*/) override {}
    void field(std::string_view /*key*/, std::string_view /*value*/) override {}
    void end() override {}
};

/// @brief Base for writers that handle a record once it is complete.
///
/// begin(), type() and field() fill a TraceRecord; end() hands it to
/// write_record() and starts over.
///
/// @ingroup io_writers
class RecordTraceWriter : public core::TraceWriter {
public:
    void begin(uint64_t sequence) final;
    void type(std::string_view name) final;
    void field(std::string_view key, double value) final;
    void field(std::string_view key, uint64_t value) final;
    void field(std::string_view key, std::string_view value) final;
    void end() final;

protected:
    /// @brief Consume a complete record. The writer may move from it.
    virtual void write_record(TraceRecord& record) = 0;

private:
    TraceRecord current_;
};

/// @brief Streams the records as a JSON array, one record per line.
///
/// The opening bracket is written on construction and the closing one by
/// finalize() (or the destructor). Each record is an object with
/// "sequence", "type" and its fields.
///
/// @ingroup io_writers
class JsonTraceWriter : public RecordTraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    /// @brief Close the array. Later calls do nothing.
    void finalize();

protected:
    void write_record(TraceRecord& record) override;

private:
    std::ostream& output_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool first_record_{true};
    bool finalized_{false};
};

/// @brief Keeps every record in memory.
///
/// Used by the unit tests to inspect engine decisions.
///
/// @ingroup io_writers
class MemoryTraceWriter : public RecordTraceWriter {
public:
    [[nodiscard]] const std::vector<TraceRecord>& records() const noexcept { return records_; }

    /// @brief Number of stored records of type @p type.
    [[nodiscard]] std::size_t count(std::string_view type) const noexcept;

    void clear() noexcept { records_.clear(); }

protected:
    void write_record(TraceRecord& record) override;

private:
    std::vector<TraceRecord> records_;
};

/// @brief One line per record for terminals.
///
/// `#<seq> <type> key=value key=value`, with the sequence and the type
/// padded so that decisions line up. With colour enabled, placements are
/// green, rejections red and per-host scores dimmed.
///
/// @ingroup io_writers
class TextualTraceWriter : public RecordTraceWriter {
public:
    /// @param output         Destination stream (must outlive this writer).
    /// @param color_enabled  If true, emit ANSI escape codes.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

protected:
    void write_record(TraceRecord& record) override;

private:
    std::ostream& output_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
};

} // namespace vmplace::io
