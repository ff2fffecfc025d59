#pragma once

#include <cstdint>

/**
 * Centralized configuration defaults for the trading engine.
 *
 * All default values are defined here to avoid duplication across:
 * - TradingConfig
 * - ClientConfig / FeedConfig
 * - Strategy, exit and risk parameters
 * - WatchdogConfig
 *
 * Naming:
 * - _PCT suffix: percentage in percent units (2.5 = 2.5%)
 * - _FRAC suffix: fraction (0.05 = 5%)
 * - _S / _MS suffix: seconds / milliseconds
 */

namespace autotrade::config {

// =============================================================================
// Exchange client
// =============================================================================
namespace client {
constexpr const char* BASE_URL = "https://api.pionex.com";

constexpr int RETRY_ATTEMPTS = 3;
constexpr double BACKOFF_FACTOR = 1.5;     // sleep backoff^attempt seconds
constexpr double TIMEOUT_S = 30.0;
constexpr double RATE_LIMIT_DELAY_S = 0.1; // minimum gap between requests
constexpr double DEFAULT_RETRY_AFTER_S = 60.0;
constexpr int MAX_RATE_LIMIT_WAITS = 5;    // 429 waits before RateLimited
constexpr int KLINE_LIMIT_MAX = 500;
} // namespace client

// =============================================================================
// Market data feed
// =============================================================================
namespace feed {
constexpr double RECONNECT_DELAY_S = 5.0;
constexpr int MAX_RECONNECT_ATTEMPTS = 10;
constexpr int POLL_TIMEOUT_MS = 100;
constexpr uint64_t PRICE_MAX_AGE_MS = 30000; // older cached prices fall back to REST
} // namespace feed

// =============================================================================
// Strategy parameters
// =============================================================================
namespace strategy {
constexpr int RSI_PERIOD = 14;
constexpr double RSI_OVERSOLD = 30.0;
constexpr double RSI_OVERBOUGHT = 70.0;

constexpr int MACD_FAST = 12;
constexpr int MACD_SLOW = 26;
constexpr int MACD_SIGNAL = 9;

constexpr int EMA_TREND_PERIOD = 20;

constexpr int BOLLINGER_PERIOD = 20;
constexpr double BOLLINGER_STDDEV = 2.0;

constexpr int VOLUME_EMA_PERIOD = 20;
constexpr double VOLUME_MULTIPLIER = 1.5;

constexpr int GRID_LEVELS = 10;
constexpr double GRID_SPACING = 0.01;      // 1% between levels
constexpr double GRID_POSITION_SIZE = 0.1; // fraction of balance

constexpr double DCA_AMOUNT = 100.0;       // quote currency per buy

constexpr double POSITION_SIZE = 0.5;      // fraction of balance
constexpr double TRADING_AMOUNT = 100.0;
constexpr int LEVERAGE = 10;
constexpr double STOP_LOSS_PCT = 1.5;
constexpr double TAKE_PROFIT_PCT = 2.5;

constexpr const char* KLINE_INTERVAL = "5m";
constexpr const char* TREND_INTERVAL = "1h";
constexpr int KLINE_LIMIT = 100;

// Confidence attached to directional signals
constexpr double BASE_CONFIDENCE = 0.6;
constexpr double FLAT_CONFIDENCE = 0.7; // grid and DCA
} // namespace strategy

// =============================================================================
// RSI confirmation filter
// =============================================================================
namespace rsi_filter {
constexpr double LONG_5M = 30.0;  // 5m RSI must be below for longs
constexpr double LONG_1H = 50.0;  // 1h RSI must be below for longs
constexpr double SHORT_5M = 70.0; // 5m RSI must be above for shorts
constexpr double SHORT_1H = 50.0; // 1h RSI must be above for shorts
} // namespace rsi_filter

// =============================================================================
// Position exits
// =============================================================================
namespace exits {
constexpr double TP1_PCT = 2.5;
constexpr double TP2_PCT = 5.0;
constexpr double BREAKEVEN_PCT = 1.0;
constexpr bool TRAILING_ENABLED = true;
constexpr double TRAILING_STEP_PCT = 0.5;
constexpr double TRAILING_DISTANCE_PCT = 1.0;
} // namespace exits

// =============================================================================
// Risk Management
// =============================================================================
namespace risk {
constexpr double MAX_DAILY_LOSS = 500.0; // absolute quote currency
constexpr int MAX_DAILY_TRADES = 20;
constexpr double MIN_CONFIDENCE = 0.6;
constexpr double MARGIN_BUFFER = 1.2;
constexpr double MAX_CONCENTRATION = 0.8;
constexpr double MAINTENANCE_MARGIN = 0.05;
constexpr int MAX_POSITIONS_TO_REDUCE = 2;
constexpr bool AUTO_REDUCE = false; // advised reductions are reported, not executed

// Liquidation distance levels (fraction of mark price)
constexpr double LIQ_DISTANCE_LOW = 0.2;
constexpr double LIQ_DISTANCE_MEDIUM = 0.1;
} // namespace risk

// =============================================================================
// Execution harness
// =============================================================================
namespace execution {
constexpr double MIN_BALANCE = 10.0;
constexpr double EVALUATION_TIMEOUT_S = 30.0;
constexpr double CYCLE_INTERVAL_S = 60.0;
constexpr double STOP_JOIN_TIMEOUT_S = 5.0;

constexpr const char* HOURS_START = "19:30";
constexpr const char* HOURS_END = "01:30";
constexpr const char* HOURS_TIMEZONE = "UTC-5";
} // namespace execution

// =============================================================================
// Watchdog
// =============================================================================
namespace watchdog {
constexpr double HEARTBEAT_INTERVAL_S = 60.0;
constexpr int MAX_FAILURES = 3;
constexpr bool AUTO_RESTART = true;
constexpr double MEMORY_THRESHOLD_MB = 256.0;
constexpr double CPU_THRESHOLD_PCT = 80.0;
constexpr int RESTART_SANITY_THRESHOLD = 10;
constexpr int MAX_RESTART_CYCLES = 3;
} // namespace watchdog

} // namespace autotrade::config
