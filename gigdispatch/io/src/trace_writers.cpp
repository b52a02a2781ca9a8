#include <gigdispatch/io/trace_writers.hpp>

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace gigdispatch::io {

namespace {

constexpr std::string_view ANSI_RESET = "\033[0m";
constexpr std::string_view ANSI_RED = "\033[31m";
constexpr std::string_view ANSI_GREEN = "\033[32m";
constexpr std::string_view ANSI_YELLOW = "\033[33m";

bool ends_with(std::string_view str, std::string_view suffix) noexcept {
    return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
}

} // anonymous namespace

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(core::TimePoint /*time*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output) {
    output_ << "[\n";
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::begin(core::TimePoint time) {
    if (!first_record_) {
        output_ << ",\n";
    }
    first_record_ = false;
    output_ << "  {\"time\": " << std::setprecision(15) << core::time_to_seconds(time);
}

void JsonTraceWriter::type(std::string_view name) {
    output_ << ", \"type\": \"" << escape(name) << "\"";
}

std::string JsonTraceWriter::escape(std::string_view str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void JsonTraceWriter::field(std::string_view key, double value) {
    output_ << ", \"" << escape(key) << "\": " << std::setprecision(15) << value;
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    output_ << ", \"" << escape(key) << "\": " << value;
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    output_ << ", \"" << escape(key) << "\": \"" << escape(value) << "\"";
}

void JsonTraceWriter::end() {
    output_ << "}";
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    if (!first_record_) {
        output_ << "\n";
    }
    output_ << "]\n";
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// TeeTraceWriter
// =============================================================================

TeeTraceWriter::TeeTraceWriter(core::TraceWriter& first, core::TraceWriter& second) noexcept
    : first_(first)
    , second_(second) {}

void TeeTraceWriter::begin(core::TimePoint time) {
    first_.begin(time);
    second_.begin(time);
}

void TeeTraceWriter::type(std::string_view name) {
    first_.type(name);
    second_.type(name);
}

void TeeTraceWriter::field(std::string_view key, double value) {
    first_.field(key, value);
    second_.field(key, value);
}

void TeeTraceWriter::field(std::string_view key, uint64_t value) {
    first_.field(key, value);
    second_.field(key, value);
}

void TeeTraceWriter::field(std::string_view key, std::string_view value) {
    first_.field(key, value);
    second_.field(key, value);
}

void TeeTraceWriter::end() {
    first_.end();
    second_.end();
}

// =============================================================================
// TraceRecord
// =============================================================================

std::optional<uint64_t> TraceRecord::get_uint(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<uint64_t>(&it->second)) {
        return *value;
    }
    if (const auto* value = std::get_if<double>(&it->second)) {
        return static_cast<uint64_t>(*value);
    }
    return std::nullopt;
}

std::optional<double> TraceRecord::get_double(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<double>(&it->second)) {
        return *value;
    }
    if (const auto* value = std::get_if<uint64_t>(&it->second)) {
        return static_cast<double>(*value);
    }
    return std::nullopt;
}

std::optional<std::string> TraceRecord::get_string(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<std::string>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time = core::time_to_seconds(time);
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields[std::string(key)] = std::string(value);
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

std::vector<TraceRecord> MemoryTraceWriter::of_type(std::string_view type) const {
    std::vector<TraceRecord> result;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(result),
                 [type](const TraceRecord& r) { return r.type == type; });
    return result;
}

std::size_t MemoryTraceWriter::count(std::string_view type) const {
    return static_cast<std::size_t>(
        std::count_if(records_.begin(), records_.end(),
                      [type](const TraceRecord& r) { return r.type == type; }));
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(core::TimePoint time) {
    current_time_ = core::time_to_seconds(time);
    current_type_.clear();
    current_fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    current_fields_.push_back({std::string(key), oss.str()});
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.push_back({std::string(key), std::to_string(value)});
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.push_back({std::string(key), std::string(value)});
}

std::string_view TextualTraceWriter::color_for(std::string_view type) const noexcept {
    if (!color_enabled_) {
        return {};
    }
    if (ends_with(type, "_failed") || type == "candidate_rejected") {
        return ANSI_RED;
    }
    if (type == "offer_accepted" || type == "allocation_completed") {
        return ANSI_GREEN;
    }
    if (type.starts_with("reallocation") || type == "offer_expired") {
        return ANSI_YELLOW;
    }
    return {};
}

void TextualTraceWriter::end() {
    output_ << "[" << std::setw(12) << std::fixed << std::setprecision(5) << current_time_ << "] ";

    if (prev_time_ && current_time_ != *prev_time_) {
        output_ << "(+" << std::setw(10) << std::fixed << std::setprecision(5)
                << (current_time_ - *prev_time_) << ") ";
    } else {
        output_ << "(           ) ";
    }

    std::string_view color = color_for(current_type_);
    output_ << color << std::setw(30) << std::right << current_type_;
    if (!color.empty()) {
        output_ << ANSI_RESET;
    }
    output_ << ":";

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " " << current_fields_[i].key << " = " << current_fields_[i].value;
    }

    output_ << "\n";
    prev_time_ = current_time_;
}

} // namespace gigdispatch::io
