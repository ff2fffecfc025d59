/**
 * Kline Fetcher
 *
 * Downloads recent candlestick data through the public exchange endpoints
 * and saves it to CSV.
 *
 * Usage:
 *   ./autotrade_fetch_klines BTC_USDT 5m 500 btc_5m.csv
 *   ./autotrade_fetch_klines ETH_USDT 1h
 */

#include "../include/autotrade/exchange/exchange_client.hpp"
#include "../include/autotrade/exchange/http_transport.hpp"
#include "../include/autotrade/logging/async_logger.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>

using namespace autotrade;
using namespace autotrade::exchange;

namespace {

constexpr int MAX_LIMIT = 500;

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " SYMBOL INTERVAL [LIMIT] [OUTPUT_FILE]\n"
              << "\n"
              << "Arguments:\n"
              << "  SYMBOL      Trading pair (e.g., BTC_USDT, ETHUSDT)\n"
              << "  INTERVAL    Kline interval: 1m, 5m, 15m, 30m, 1h, 4h, 8h, 12h, 1d\n"
              << "  LIMIT       Number of klines, 1-" << MAX_LIMIT << ", default: 100\n"
              << "  OUTPUT_FILE Output CSV file, default: SYMBOL_INTERVAL.csv\n"
              << "\n"
              << "Examples:\n"
              << "  " << prog << " BTC_USDT 5m 500 btc_5m.csv\n"
              << "  " << prog << " ETH_USDT 1h\n";
}

std::string format_timestamp(TimestampMs ts) {
    time_t t = static_cast<time_t>(ts / 1000);
    struct tm tm;
    gmtime_r(&t, &tm);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

bool save_klines_csv(const std::string& path, const std::vector<Kline>& klines) {
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    out << "open_time,open,high,low,close,volume\n";
    out << std::setprecision(10);
    for (const auto& k : klines) {
        out << k.open_time << ',' << k.open << ',' << k.high << ',' << k.low << ',' << k.close << ',' << k.volume
            << '\n';
    }
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string symbol = ExchangeProtocolClient::normalize_symbol(argv[1]);
    std::string interval = argv[2];
    int limit = 100;
    std::string output_file;

    const char* valid_intervals[] = {"1m", "5m", "15m", "30m", "1h", "4h", "8h", "12h", "1d"};
    bool valid = false;
    for (const char* v : valid_intervals) {
        if (interval == v) {
            valid = true;
            break;
        }
    }
    if (!valid) {
        std::cerr << "Error: Invalid interval '" << interval << "'\n";
        std::cerr << "Valid intervals: 1m, 5m, 15m, 30m, 1h, 4h, 8h, 12h, 1d\n";
        return 1;
    }

    if (argc >= 4) {
        try {
            limit = std::stoi(argv[3]);
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid limit '" << argv[3] << "'\n";
            return 1;
        }
        if (limit < 1 || limit > MAX_LIMIT) {
            std::cerr << "Error: limit must be between 1 and " << MAX_LIMIT << "\n";
            return 1;
        }
    }
    output_file = argc >= 5 ? argv[4] : symbol + "_" + interval + ".csv";

    logging::AsyncLogger logger;
    logger.set_min_level(logging::LogLevel::Warn);
    logger.start();

    int rc = 0;
    try {
        // Public endpoints only: no credentials needed
        ExchangeProtocolClient client(ClientConfig{}, std::make_shared<CurlTransport>(), logger);

        std::cout << "Fetching " << limit << " " << symbol << " " << interval << " klines\n";
        std::cout << "Server time: " << format_timestamp(client.get_server_time()) << " UTC\n";

        auto ticker = client.get_ticker(symbol);
        std::cout << "Current " << symbol << " price: $" << std::fixed << std::setprecision(2) << ticker.close
                  << "\n\n";

        auto klines = client.get_klines(symbol, interval, limit);
        if (klines.empty()) {
            std::cerr << "No data returned.\n";
            rc = 1;
        } else {
            double low = klines.front().low;
            double high = klines.front().high;
            double volume = 0.0;
            for (const auto& k : klines) {
                low = std::min(low, k.low);
                high = std::max(high, k.high);
                volume += k.volume;
            }

            std::cout << "Downloaded " << klines.size() << " klines\n";
            std::cout << "  First: " << format_timestamp(klines.front().open_time) << "\n";
            std::cout << "  Last:  " << format_timestamp(klines.back().open_time) << "\n";
            std::cout << "  Low:   $" << low << "\n";
            std::cout << "  High:  $" << high << "\n";
            std::cout << "  Volume: " << std::setprecision(4) << volume << "\n";

            std::cout << "\nSaving to " << output_file << "... ";
            if (save_klines_csv(output_file, klines)) {
                std::cout << "done!\n";
            } else {
                std::cout << "failed\n";
                rc = 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    logger.stop();
    return rc;
}
