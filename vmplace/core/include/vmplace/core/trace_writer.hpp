#pragma once

#include <cstdint>
#include <string_view>

namespace vmplace::core {

/// @brief Abstract interface for recording placement decisions.
/// @ingroup core
///
/// Implementations of TraceWriter serialise decision records to a
/// specific format (JSON, text, memory buffer, etc.).
/// Each record is built incrementally:
///   1. begin() -- opens a new record for a decision sequence number
///   2. type()  -- sets the record type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// The PlacementEngine holds an optional pointer to a TraceWriter. When no
/// writer is installed the overhead is a single null-pointer check.
///
/// @see algo::PlacementEngine::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Begin a new record.
    /// @param sequence Index of the placement decision the record belongs to.
    virtual void begin(uint64_t sequence) = 0;

    /// @brief Set the record type name (e.g. `"vm_placed"`, `"host_scored"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add an unsigned integer field to the current record.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace vmplace::core
