#include "sigexec/venue/quote_feed.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace sigexec {

QuoteFeed::QuoteFeed(QuoteSink sink, const std::string& endpoint)
    : sink_(std::move(sink)) {
  // Empty filter: accept every symbol the publisher sends.
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::linger, 0);
  socket_.connect(endpoint);
  std::cout << "[QuoteFeed] subscribed to " << endpoint << "\n";
}

std::size_t QuoteFeed::drain() {
  std::size_t delivered = 0;
  while (true) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::dontwait);
    if (!result.has_value()) {
      break;  // queue empty
    }

    const std::string payload = msg.to_string();
    auto tick = parse(payload);
    if (!tick) {
      std::cerr << "[QuoteFeed] skipping malformed quote: " << payload << "\n";
      continue;
    }
    sink_(*tick);
    ++delivered;
  }
  return delivered;
}

std::optional<QuoteTick> QuoteFeed::parse(const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);
    QuoteTick tick;
    tick.symbol = json.at("symbol").get<std::string>();
    tick.bid = json.at("bid").get<double>();
    tick.ask = json.at("ask").get<double>();
    tick.timestamp_ms = json.value("timestamp_ms", std::int64_t{0});
    if (tick.symbol.empty() || tick.bid <= 0.0 || tick.ask < tick.bid) {
      return std::nullopt;
    }
    return tick;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

}  // namespace sigexec
