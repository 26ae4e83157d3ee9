#include "sigexec/venue/zmq_venue.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace sigexec {

namespace {

using nlohmann::json;

domain::Side sideFromWire(const std::string& text) {
  if (text == "BUY") {
    return domain::Side::Buy;
  }
  if (text == "SELL") {
    return domain::Side::Sell;
  }
  throw std::invalid_argument("unknown side '" + text + "'");
}

domain::DealEntry entryFromWire(const std::string& text) {
  if (text == "in") return domain::DealEntry::In;
  if (text == "out") return domain::DealEntry::Out;
  if (text == "inout") return domain::DealEntry::InOut;
  if (text == "out_by") return domain::DealEntry::OutBy;
  throw std::invalid_argument("unknown deal entry '" + text + "'");
}

domain::VenuePosition positionFromWire(const json& j) {
  domain::VenuePosition p;
  p.ticket = j.at("ticket").get<domain::Ticket>();
  p.symbol = j.at("symbol").get<std::string>();
  p.side = sideFromWire(j.at("side").get<std::string>());
  p.volume = j.at("volume").get<double>();
  p.open_price = j.at("open_price").get<double>();
  p.current_price = j.at("current_price").get<double>();
  p.stop_loss = j.value("sl", 0.0);
  p.take_profit = j.value("tp", 0.0);
  p.profit = j.at("profit").get<double>();
  p.swap = j.value("swap", 0.0);
  p.magic = j.at("magic").get<domain::Magic>();
  p.open_time_ms = j.at("open_time_ms").get<std::int64_t>();
  p.comment = j.value("comment", std::string{});
  return p;
}

domain::Deal dealFromWire(const json& j) {
  domain::Deal d;
  d.ticket = j.at("ticket").get<domain::Ticket>();
  d.position_id = j.at("position_id").get<domain::Ticket>();
  d.symbol = j.at("symbol").get<std::string>();
  d.side = sideFromWire(j.at("side").get<std::string>());
  d.entry = entryFromWire(j.at("entry").get<std::string>());
  d.volume = j.at("volume").get<double>();
  d.price = j.at("price").get<double>();
  d.profit = j.value("profit", 0.0);
  d.commission = j.value("commission", 0.0);
  d.swap = j.value("swap", 0.0);
  d.magic = j.value("magic", domain::Magic{0});
  d.time_ms = j.at("time_ms").get<std::int64_t>();
  d.comment = j.value("comment", std::string{});
  return d;
}

// Runs fn(reply) and turns a malformed reply into std::nullopt.
template <typename Fn>
auto decode(const char* cmd, const json& reply, Fn&& fn)
    -> std::optional<decltype(fn(reply))> {
  try {
    return fn(reply);
  } catch (const json::exception& e) {
    std::cerr << "[ZmqVenue] malformed '" << cmd << "' reply: " << e.what()
              << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[ZmqVenue] malformed '" << cmd << "' reply: " << e.what()
              << "\n";
  }
  return std::nullopt;
}

}  // namespace

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------
ZmqVenue::ZmqVenue(std::string endpoint, int timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {
  connect();
  std::cout << "[ZmqVenue] connected to bridge at " << endpoint_ << "\n";
}

ZmqVenue::~ZmqVenue() { socket_.reset(); }

void ZmqVenue::connect() {
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::rcvtimeo, timeout_ms_);
  socket_->set(zmq::sockopt::sndtimeo, timeout_ms_);
  // Do not keep unsent requests around when the socket is replaced.
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);
}

// -----------------------------------------------------------------------------
// reconnect(): replace a REQ socket stuck awaiting a reply
// -----------------------------------------------------------------------------
bool ZmqVenue::reconnect(const std::string& cmd) {
  try {
    connect();
    return true;
  } catch (const zmq::error_t& e) {
    std::cerr << "[ZmqVenue] '" << cmd << "' reconnect to " << endpoint_
              << " failed: " << e.what() << "\n";
    socket_.reset();
    return false;
  }
}

// -----------------------------------------------------------------------------
// checkReply(): parse and validate the reply envelope
// -----------------------------------------------------------------------------
std::optional<nlohmann::json> ZmqVenue::checkReply(const std::string& cmd,
                                                   const std::string& text) {
  try {
    json j = json::parse(text);
    if (!j.is_object()) {
      std::cerr << "[ZmqVenue] '" << cmd << "' failed: reply is not an object\n";
      return std::nullopt;
    }
    auto ok = j.find("ok");
    if (ok == j.end() || !ok->is_boolean()) {
      std::cerr << "[ZmqVenue] '" << cmd
                << "' failed: reply carries no boolean \"ok\"\n";
      return std::nullopt;
    }
    if (!ok->get<bool>()) {
      auto error = j.find("error");
      std::cerr << "[ZmqVenue] '" << cmd << "' failed: "
                << (error != j.end() && error->is_string()
                        ? error->get<std::string>()
                        : std::string{"no reason"})
                << "\n";
      return std::nullopt;
    }
    return j;
  } catch (const json::exception& e) {
    std::cerr << "[ZmqVenue] '" << cmd << "' reply is not JSON: " << e.what()
              << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// request(): one REQ/REP round trip
// -----------------------------------------------------------------------------
std::optional<nlohmann::json> ZmqVenue::request(const nlohmann::json& payload) {
  const std::string cmd = payload.at("cmd").get<std::string>();
  const std::string body = payload.dump();

  if (!socket_ && !reconnect(cmd)) {
    return std::nullopt;
  }

  zmq::message_t reply;
  try {
    auto sent = socket_->send(zmq::buffer(body), zmq::send_flags::none);
    if (!sent.has_value()) {
      std::cerr << "[ZmqVenue] '" << cmd << "' send timed out\n";
      reconnect(cmd);
      return std::nullopt;
    }
    auto received = socket_->recv(reply, zmq::recv_flags::none);
    if (!received.has_value()) {
      std::cerr << "[ZmqVenue] '" << cmd << "' timed out after "
                << timeout_ms_ << " ms; reconnecting\n";
      reconnect(cmd);
      return std::nullopt;
    }
  } catch (const zmq::error_t& e) {
    std::cerr << "[ZmqVenue] '" << cmd << "' transport error: " << e.what()
              << "\n";
    reconnect(cmd);
    return std::nullopt;
  }

  return checkReply(cmd, reply.to_string());
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::InstrumentSpec> ZmqVenue::instrument(
    const std::string& symbol) {
  auto reply = request({{"cmd", "instrument"}, {"symbol", symbol}});
  if (!reply) {
    return std::nullopt;
  }
  return decode("instrument", *reply, [&symbol](const json& j) {
    domain::InstrumentSpec spec;
    spec.symbol = symbol;
    spec.point = j.at("point").get<double>();
    spec.digits = j.at("digits").get<int>();
    spec.volume_min = j.at("volume_min").get<double>();
    spec.volume_max = j.at("volume_max").get<double>();
    spec.volume_step = j.at("volume_step").get<double>();
    spec.contract_size = j.value("contract_size", 100.0);
    return spec;
  });
}

std::optional<domain::Quote> ZmqVenue::quote(const std::string& symbol) {
  auto reply = request({{"cmd", "quote"}, {"symbol", symbol}});
  if (!reply) {
    return std::nullopt;
  }
  return decode("quote", *reply, [](const json& j) {
    domain::Quote q;
    q.bid = j.at("bid").get<double>();
    q.ask = j.at("ask").get<double>();
    q.time_ms = j.value("time_ms", std::int64_t{0});
    return q;
  });
}

std::optional<double> ZmqVenue::accountEquity() {
  auto reply = request({{"cmd", "equity"}});
  if (!reply) {
    return std::nullopt;
  }
  return decode("equity", *reply,
                [](const json& j) { return j.at("equity").get<double>(); });
}

std::optional<std::vector<domain::VenuePosition>> ZmqVenue::openPositions(
    std::optional<domain::Magic> magic) {
  json req = {{"cmd", "positions"}};
  if (magic) {
    req["magic"] = *magic;
  }
  auto reply = request(req);
  if (!reply) {
    return std::nullopt;
  }
  return decode("positions", *reply, [](const json& j) {
    std::vector<domain::VenuePosition> out;
    for (const auto& item : j.at("positions")) {
      out.push_back(positionFromWire(item));
    }
    return out;
  });
}

std::optional<std::vector<domain::PendingOrder>> ZmqVenue::pendingOrders(
    std::optional<domain::Magic> magic) {
  json req = {{"cmd", "orders"}};
  if (magic) {
    req["magic"] = *magic;
  }
  auto reply = request(req);
  if (!reply) {
    return std::nullopt;
  }
  return decode("orders", *reply, [](const json& j) {
    std::vector<domain::PendingOrder> out;
    for (const auto& item : j.at("orders")) {
      domain::PendingOrder o;
      o.ticket = item.at("ticket").get<domain::Ticket>();
      o.symbol = item.at("symbol").get<std::string>();
      o.magic = item.at("magic").get<domain::Magic>();
      o.comment = item.value("comment", std::string{});
      out.push_back(std::move(o));
    }
    return out;
  });
}

std::optional<std::vector<domain::Deal>> ZmqVenue::historyDeals(
    std::int64_t from_ms, std::int64_t to_ms) {
  auto reply =
      request({{"cmd", "deals"}, {"from_ms", from_ms}, {"to_ms", to_ms}});
  if (!reply) {
    return std::nullopt;
  }
  return decode("deals", *reply, [](const json& j) {
    std::vector<domain::Deal> out;
    for (const auto& item : j.at("deals")) {
      out.push_back(dealFromWire(item));
    }
    return out;
  });
}

std::optional<double> ZmqVenue::priceAt(const std::string& symbol,
                                        std::int64_t time_ms) {
  auto reply =
      request({{"cmd", "price_at"}, {"symbol", symbol}, {"time_ms", time_ms}});
  if (!reply) {
    return std::nullopt;
  }
  return decode("price_at", *reply,
                [](const json& j) { return j.at("price").get<double>(); });
}

std::optional<double> ZmqVenue::calcProfit(const std::string& symbol,
                                           domain::Side side, double volume,
                                           double open_price,
                                           double close_price) {
  auto reply = request({{"cmd", "calc_profit"},
                        {"symbol", symbol},
                        {"side", domain::sideToString(side)},
                        {"volume", volume},
                        {"open", open_price},
                        {"close", close_price}});
  if (!reply) {
    return std::nullopt;
  }
  return decode("calc_profit", *reply,
                [](const json& j) { return j.at("profit").get<double>(); });
}

// -----------------------------------------------------------------------------
// Mutations
// -----------------------------------------------------------------------------
domain::OrderResult ZmqVenue::placeMarketOrder(
    const domain::MarketOrderRequest& request_args) {
  auto reply = request({{"cmd", "place"},
                        {"symbol", request_args.symbol},
                        {"side", domain::sideToString(request_args.side)},
                        {"volume", request_args.volume},
                        {"sl", request_args.stop_loss},
                        {"tp", request_args.take_profit},
                        {"magic", request_args.magic},
                        {"comment", request_args.comment}});
  domain::OrderResult result;
  if (!reply) {
    result.message = "bridge rejected or unreachable";
    return result;
  }
  auto filled = decode("place", *reply, [](const json& j) {
    return std::make_pair(j.at("ticket").get<domain::Ticket>(),
                          j.value("price", 0.0));
  });
  if (!filled) {
    result.message = "malformed reply";
    return result;
  }
  result.ok = true;
  result.ticket = filled->first;
  result.price = filled->second;
  return result;
}

bool ZmqVenue::modifyPosition(domain::Ticket ticket, double stop_loss,
                              double take_profit) {
  return request({{"cmd", "modify"},
                  {"ticket", ticket},
                  {"sl", stop_loss},
                  {"tp", take_profit}})
      .has_value();
}

bool ZmqVenue::closePosition(domain::Ticket ticket) {
  return request({{"cmd", "close"}, {"ticket", ticket}}).has_value();
}

bool ZmqVenue::cancelOrder(domain::Ticket ticket) {
  return request({{"cmd", "cancel"}, {"ticket", ticket}}).has_value();
}

}  // namespace sigexec
