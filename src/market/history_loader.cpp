// ============================================================================
// AURUM - Historical Data Loader Implementation
// ============================================================================

#include "aurum/market/history_loader.hpp"
#include "aurum/core/error.hpp"
#include "aurum/utils/logger.hpp"

#include <csv.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace aurum::market {

namespace {

// Whitespace around fields is trimmed; '#' lines and blank lines are skipped
using CsvReader = io::CSVReader<8,
                                io::trim_chars<' ', '\t'>,
                                io::no_quote_escape<','>,
                                io::throw_on_overflow,
                                io::single_and_empty_line_comment<'#'>>;

bool is_comment(const std::string& line) {
    const auto first = line.find_first_not_of(" \t\r");
    return first == std::string::npos || line[first] == '#';
}

/// Whether the first content line is a header. Leaves the stream where it was
bool has_header(std::istream& in) {
    const auto start = in.tellg();
    std::string line;
    bool header = false;
    while (std::getline(in, line)) {
        if (is_comment(line)) continue;
        header = line.compare(line.find_first_not_of(" \t"), 9, "timestamp") == 0;
        break;
    }
    in.clear();
    in.seekg(start);
    return header;
}

/// Next data row, or false at end of input. Throws io::error::base on
/// malformed fields and DataError on a bad instrument
bool read_snapshot(CsvReader& reader, MarketSnapshot& out) {
    int64_t timestamp_ns = 0;
    std::string instrument;
    MarketSnapshot s;
    if (!reader.read_row(timestamp_ns, instrument, s.bid, s.ask, s.last,
                         s.volume, s.volatility, s.spread)) {
        return false;
    }
    if (instrument.empty() || instrument.size() > Symbol::MAX_LENGTH) {
        throw DataError("bad instrument '" + instrument + "'");
    }
    s.timestamp = from_epoch_ns(timestamp_ns);
    s.instrument = Symbol(instrument);
    out = s;
    return true;
}

}  // namespace

size_t HistoricalData::snapshot_count() const {
    size_t n = 0;
    for (const auto& [symbol, snapshots] : series) {
        n += snapshots.size();
    }
    return n;
}

MarketSnapshot parse_csv_row(std::string_view line) {
    std::istringstream in{std::string(line)};
    CsvReader reader("row", in);
    MarketSnapshot s;
    try {
        if (!read_snapshot(reader, s)) {
            throw DataError("empty row");
        }
    } catch (const io::error::base& e) {
        throw DataError(e.what());
    }
    return s;
}

std::vector<MarketSnapshot> read_csv(std::istream& in) {
    const bool header = has_header(in);
    CsvReader reader("history", in);

    std::vector<MarketSnapshot> out;
    try {
        if (header) {
            reader.read_header(io::ignore_no_column, "timestamp_ns", "instrument", "bid", "ask",
                               "last", "volume", "volatility", "spread");
        }
        MarketSnapshot s;
        while (read_snapshot(reader, s)) {
            out.push_back(s);
        }
    } catch (const io::error::base& e) {
        throw DataError("line " + std::to_string(reader.get_file_line()) + ": " + e.what());
    } catch (const DataError& e) {
        throw DataError("line " + std::to_string(reader.get_file_line()) + ": " + e.what());
    }
    return out;
}

std::map<Symbol, std::vector<MarketSnapshot>>
group_by_instrument(const std::vector<MarketSnapshot>& snapshots) {
    std::map<Symbol, std::vector<MarketSnapshot>> grouped;
    for (const auto& s : snapshots) {
        grouped[s.instrument].push_back(s);
    }
    for (auto& [symbol, series] : grouped) {
        std::stable_sort(series.begin(), series.end(),
                         [](const MarketSnapshot& a, const MarketSnapshot& b) {
                             return a.timestamp < b.timestamp;
                         });
    }
    return grouped;
}

HistoricalData load_history(std::istream& in, ValidationMode mode) {
    const auto rows = read_csv(in);

    HistoricalData data;
    data.rows = rows.size();

    SnapshotValidator validator(mode);
    for (auto& [symbol, series] : group_by_instrument(rows)) {
        auto kept = validator.filter(series);
        if (!kept.empty()) {
            data.series.emplace(symbol, std::move(kept));
        }
    }
    data.validation = validator.report();

    LOG_INFO("Loaded {} rows for {} instruments ({} rejected)", data.rows, data.series.size(),
             data.validation.rejected);
    return data;
}

HistoricalData load_history(const std::filesystem::path& path, ValidationMode mode) {
    std::ifstream in(path);
    if (!in) {
        throw DataError("cannot open history file " + path.string());
    }
    SCOPED_TIMER("load_history");
    return load_history(in, mode);
}

}  // namespace aurum::market
