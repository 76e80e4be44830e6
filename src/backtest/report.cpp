// ============================================================================
// AURUM - Backtest Report Implementation
// ============================================================================

#include "aurum/backtest/report.hpp"
#include "aurum/api/json_writer.hpp"
#include "aurum/core/error.hpp"
#include "aurum/utils/logger.hpp"

#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <iterator>
#include <memory>

namespace aurum::backtest {

using api::append_number;
using api::append_string;

std::string summary_json(const BacktestStats& stats) {
    std::string out;
    out += "{\"total_return\":";
    append_number(out, stats.total_return);
    out += ",\"sharpe\":";
    append_number(out, stats.sharpe);
    out += ",\"max_drawdown\":";
    append_number(out, stats.max_drawdown);
    out += ",\"win_rate\":";
    append_number(out, stats.win_rate);
    out += ",\"profit_factor\":";
    append_number(out, stats.profit_factor);
    fmt::format_to(std::back_inserter(out),
                   ",\"trade_count\":{},\"decision_count\":{},\"skipped_ticks\":{}}}",
                   stats.trade_count, stats.decision_count, stats.skipped_ticks);
    return out;
}

std::string report_json(const BacktestResult& result) {
    std::string out;
    out.reserve(256 + result.events.size() * 400);
    auto it = std::back_inserter(out);

    out += "{\"summary\":";
    out += summary_json(result.stats);

    out += ",\"instruments\":{";
    bool first = true;
    for (const auto& [symbol, s] : result.sessions) {
        if (!first) out += ',';
        first = false;
        append_string(out, symbol.view());
        fmt::format_to(it,
                       ":{{\"ticks\":{},\"decisions\":{},\"skipped\":{},\"degraded\":{},"
                       "\"vetoes\":{},\"scaled\":{}}}",
                       s.ticks, s.decisions, s.skipped, s.degraded, s.vetoes, s.scaled);
    }
    out += '}';

    out += ",\"events\":[";
    for (size_t i = 0; i < result.events.size(); ++i) {
        const auto& e = result.events[i];
        if (i > 0) out += ',';
        fmt::format_to(it, "{{\"timestamp\":{},\"signal\":", to_epoch_ns(e.timestamp));
        api::append_signal(out, e.signal);
        out += ",\"pnl\":";
        append_number(out, e.pnl);
        out += '}';
    }
    out += "]}";
    return out;
}

std::string sha256_hex(std::string_view text) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw Error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), text.data(), text.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        throw Error("SHA-256 digest failed");
    }

    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        fmt::format_to(std::back_inserter(hex), "{:02x}", digest[i]);
    }
    return hex;
}

std::string fingerprint(const BacktestResult& result) {
    return sha256_hex(report_json(result));
}

std::string write_report(const BacktestResult& result, const std::filesystem::path& path) {
    const auto text = report_json(result);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw Error("cannot write report " + path.string());
    }
    out << text << '\n';
    out.close();
    if (!out) {
        throw Error("failed writing report " + path.string());
    }

    LOG_INFO("Report written to {} ({} events)", path.string(), result.events.size());
    return sha256_hex(text);
}

}  // namespace aurum::backtest
