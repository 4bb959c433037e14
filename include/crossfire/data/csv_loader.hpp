#pragma once
#include <crossfire/core/market_data.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace crossfire::data {

// Column positions resolved from a CSV header; -1 marks a missing column
struct CsvColumns {
    int timestamp = -1;
    int open = -1;
    int high = -1;
    int low = -1;
    int close = -1;
    int volume = -1;

    bool valid() const { return timestamp >= 0 && open >= 0 && high >= 0 && low >= 0 && close >= 0; }
};

struct LoadStats {
    size_t lines = 0;
    size_t skipped = 0;     // malformed rows
    size_t duplicates = 0;  // repeated timestamps, first occurrence kept
};

class CsvLoader {
public:
    // Missing file, bad header or no valid rows all give an empty table
    static core::OhlcvTable load(const std::string& path, const std::string& symbol,
                                 LoadStats* stats = nullptr);

    static core::OhlcvTable parse(std::istream& in, const std::string& symbol,
                                  LoadStats* stats = nullptr);

    // Header names are matched case-insensitively; the timestamp column may be
    // named timestamp, date, datetime or time
    static CsvColumns resolve_columns(const std::string& header);

    static std::optional<core::Bar> parse_line(const std::string& line, const CsvColumns& columns);

    // Integer epoch values, or "YYYY-MM-DD" / "YYYY-MM-DD HH:MM:SS" read as UTC seconds
    static std::optional<core::Timestamp> parse_timestamp(const std::string& text);
};

} // namespace crossfire::data
