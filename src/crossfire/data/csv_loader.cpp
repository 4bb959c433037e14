#include <crossfire/data/csv_loader.hpp>
#include <crossfire/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace crossfire::data {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\"");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\"");
    return text.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    // A trailing comma means one more, empty, field
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

std::optional<double> parse_number(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

CsvColumns CsvLoader::resolve_columns(const std::string& header) {
    CsvColumns columns;
    const auto names = split(header);

    for (size_t i = 0; i < names.size(); ++i) {
        std::string name = names[i];
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const int pos = static_cast<int>(i);

        if (name == "timestamp" || name == "date" || name == "datetime" || name == "time") {
            if (columns.timestamp < 0) columns.timestamp = pos;
        } else if (name == "open") {
            columns.open = pos;
        } else if (name == "high") {
            columns.high = pos;
        } else if (name == "low") {
            columns.low = pos;
        } else if (name == "close") {
            columns.close = pos;
        } else if (name == "volume") {
            columns.volume = pos;
        }
    }
    return columns;
}

std::optional<core::Timestamp> CsvLoader::parse_timestamp(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    const bool numeric = std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '-';
    }) && text.find('-', 1) == std::string::npos;

    if (numeric) {
        try {
            return static_cast<core::Timestamp>(std::stoll(text));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::tm tm{};
    std::istringstream in(text);
    if (text.size() > 10) {
        in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    } else {
        in >> std::get_time(&tm, "%Y-%m-%d");
    }
    if (in.fail()) {
        return std::nullopt;
    }
    return static_cast<core::Timestamp>(timegm(&tm));
}

std::optional<core::Bar> CsvLoader::parse_line(const std::string& line, const CsvColumns& columns) {
    const auto fields = split(line);
    auto field = [&fields](int pos) -> std::string {
        return pos >= 0 && static_cast<size_t>(pos) < fields.size() ? fields[pos] : std::string();
    };

    const auto ts = parse_timestamp(field(columns.timestamp));
    const auto open = parse_number(field(columns.open));
    const auto high = parse_number(field(columns.high));
    const auto low = parse_number(field(columns.low));
    const auto close = parse_number(field(columns.close));

    if (!ts || !open || !high || !low || !close) {
        return std::nullopt;
    }
    if (*open <= 0.0 || *high <= 0.0 || *low <= 0.0 || *close <= 0.0) {
        return std::nullopt;
    }

    std::optional<double> volume;
    if (columns.volume >= 0) {
        volume = parse_number(field(columns.volume));
        if (volume && *volume < 0.0) {
            volume.reset();
        }
    }

    return core::Bar(*ts, *open, *high, *low, *close, volume);
}

core::OhlcvTable CsvLoader::parse(std::istream& in, const std::string& symbol, LoadStats* stats) {
    LoadStats local;
    core::OhlcvTable table(symbol);

    std::string header;
    if (!std::getline(in, header)) {
        utils::Logger::warn() << "CSV input for " << symbol << " is empty" << utils::Logger::endl;
        if (stats) *stats = local;
        return table;
    }

    const auto columns = resolve_columns(header);
    if (!columns.valid()) {
        utils::Logger::error() << "CSV header for " << symbol
                               << " lacks timestamp/open/high/low/close columns: " << header
                               << utils::Logger::endl;
        if (stats) *stats = local;
        return table;
    }

    std::vector<core::Bar> bars;
    std::string line;
    while (std::getline(in, line)) {
        if (trim(line).empty()) {
            continue;
        }
        ++local.lines;
        auto bar = parse_line(line, columns);
        if (!bar) {
            ++local.skipped;
            continue;
        }
        bars.push_back(*bar);
    }

    // Sort data by timestamp to ensure chronological order
    std::stable_sort(bars.begin(), bars.end(),
                     [](const core::Bar& a, const core::Bar& b) { return a.timestamp < b.timestamp; });

    for (const auto& bar : bars) {
        if (!table.empty() && bar.timestamp == table.bars().back().timestamp) {
            ++local.duplicates;
            continue;
        }
        table.append(bar);
    }

    if (local.skipped > 0 || local.duplicates > 0) {
        utils::Logger::warn() << symbol << ": skipped " << local.skipped << " malformed and "
                              << local.duplicates << " duplicate rows" << utils::Logger::endl;
    }

    if (stats) *stats = local;
    return table;
}

core::OhlcvTable CsvLoader::load(const std::string& path, const std::string& symbol, LoadStats* stats) {
    auto start_time = std::chrono::steady_clock::now();

    if (!std::filesystem::exists(path)) {
        utils::Logger::error() << "CSV file does not exist: " << path << utils::Logger::endl;
        if (stats) *stats = LoadStats();
        return core::OhlcvTable(symbol);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to open CSV file: " << path << utils::Logger::endl;
        if (stats) *stats = LoadStats();
        return core::OhlcvTable(symbol);
    }

    auto table = parse(file, symbol, stats);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    utils::Logger::info() << "Loaded " << table.size() << " bars for " << symbol << " from "
                          << path << " (" << duration << "ms)" << utils::Logger::endl;
    return table;
}

} // namespace crossfire::data
