#pragma once

#include <zmq.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace sigexec {

// One bid/ask update as published by the quote source.
struct QuoteTick {
  std::string symbol;
  double bid{0.0};
  double ask{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// QuoteFeed — ZeroMQ SUB client for paper-mode prices
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON quotes from an external publisher and hands them to a
//         sink (in paper mode: SimulatedVenue::setQuote).
//
// @details
// Message format (one ZeroMQ frame):
//
//   {"symbol": "XAUUSD", "bid": 2401.0, "ask": 2401.3, "timestamp_ms": ...}
//
// There is no receive thread. drain() is called on the tick thread right
// before each tick and pulls every queued message without blocking, so the
// simulated venue is only ever touched by the tick thread and the tick
// always sees the latest price.
//
// Malformed messages are logged and skipped.
//
// Ownership: owns its ZMQ context and socket.
// -----------------------------------------------------------------------------
class QuoteFeed {
 public:
  using QuoteSink = std::function<void(const QuoteTick&)>;

  // @throws zmq::error_t if the endpoint is malformed.
  QuoteFeed(QuoteSink sink, const std::string& endpoint);

  QuoteFeed(const QuoteFeed&) = delete;
  QuoteFeed& operator=(const QuoteFeed&) = delete;
  QuoteFeed(QuoteFeed&&) = delete;
  QuoteFeed& operator=(QuoteFeed&&) = delete;

  // @brief  Delivers every message currently queued. Never blocks.
  // @return Number of quotes delivered to the sink.
  std::size_t drain();

  // @brief  Parses one payload; std::nullopt if it is not a valid quote.
  static std::optional<QuoteTick> parse(const std::string& payload);

 private:
  QuoteSink sink_;
  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};
};

}  // namespace sigexec
