#include <vmplace/io/trace_writers.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace vmplace::io {

namespace {

constexpr const char* ANSI_GREEN = "\033[32m";
constexpr const char* ANSI_RED = "\033[31m";
constexpr const char* ANSI_DIM = "\033[2m";
constexpr const char* ANSI_RESET = "\033[0m";

constexpr int TYPE_WIDTH = 12;

const char* color_of(std::string_view type) {
    if (type == "vm_placed") {
        return ANSI_GREEN;
    }
    if (type == "vm_rejected") {
        return ANSI_RED;
    }
    return ANSI_DIM;
}

std::string format_value(const TraceValue& value) {
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss << std::setprecision(10) << *d;
        return oss.str();
    }
    if (const auto* u = std::get_if<uint64_t>(&value)) {
        return std::to_string(*u);
    }
    return std::get<std::string>(value);
}

} // anonymous namespace

// =============================================================================
// TraceRecord
// =============================================================================

const TraceValue& TraceRecord::at(std::string_view key) const {
    auto it = std::find_if(fields.begin(), fields.end(), [&](const auto& f) { return f.first == key; });
    if (it == fields.end()) {
        throw std::out_of_range("trace record '" + type + "' has no field '" + std::string(key) + "'");
    }
    return it->second;
}

bool TraceRecord::has(std::string_view key) const noexcept {
    return std::any_of(fields.begin(), fields.end(), [&](const auto& f) { return f.first == key; });
}

// =============================================================================
// RecordTraceWriter
// =============================================================================

void RecordTraceWriter::begin(uint64_t sequence) {
    current_ = TraceRecord{};
    current_.sequence = sequence;
}

void RecordTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void RecordTraceWriter::field(std::string_view key, double value) {
    current_.fields.emplace_back(std::string(key), value);
}

void RecordTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields.emplace_back(std::string(key), value);
}

void RecordTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields.emplace_back(std::string(key), std::string(value));
}

void RecordTraceWriter::end() {
    write_record(current_);
    current_ = TraceRecord{};
}

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output) {
    output_ << "[";
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::write_record(TraceRecord& record) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("sequence");
    writer.Uint64(record.sequence);
    writer.Key("type");
    writer.String(record.type.c_str(), static_cast<rapidjson::SizeType>(record.type.size()));

    for (const auto& [key, value] : record.fields) {
        writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
        if (const auto* d = std::get_if<double>(&value)) {
            writer.Double(*d);
        } else if (const auto* u = std::get_if<uint64_t>(&value)) {
            writer.Uint64(*u);
        } else {
            const auto& s = std::get<std::string>(value);
            writer.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
        }
    }
    writer.EndObject();

    output_ << (first_record_ ? "\n" : ",\n") << buffer.GetString();
    first_record_ = false;
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    output_ << "\n]\n";
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::write_record(TraceRecord& record) {
    records_.push_back(std::move(record));
}

std::size_t MemoryTraceWriter::count(std::string_view type) const noexcept {
    return static_cast<std::size_t>(
        std::count_if(records_.begin(), records_.end(), [&](const TraceRecord& r) { return r.type == type; }));
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::write_record(TraceRecord& record) {
    std::ostringstream line;
    line << "#" << std::left << std::setw(6) << record.sequence << " ";

    if (color_enabled_) {
        line << color_of(record.type);
    }
    line << std::left << std::setw(TYPE_WIDTH) << record.type;
    if (color_enabled_) {
        line << ANSI_RESET;
    }

    for (const auto& [key, value] : record.fields) {
        line << " " << key << "=" << format_value(value);
    }
    output_ << line.str() << "\n";
}

} // namespace vmplace::io
