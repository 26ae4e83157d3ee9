#pragma once

#include "sigexec/venue/i_venue.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <memory>
#include <string>

namespace sigexec {

// -----------------------------------------------------------------------------
// ZmqVenue — IVenue over the terminal bridge's ZeroMQ REQ/REP protocol
// -----------------------------------------------------------------------------
//
// @brief  Translates each IVenue call into one JSON request and waits for
//         the bridge's JSON reply.
//
// @details
// Wire format (one ZeroMQ message each way):
//
//   request:  {"cmd": "<name>", ...arguments}
//   reply:    {"ok": true, ...results}
//             {"ok": false, "error": "<text>"}
//
// Commands: instrument, quote, equity, place, modify, close, cancel,
// positions, orders, deals, price_at, calc_profit. Sides travel as
// "BUY" / "SELL", deal entries as "in" / "out" / "inout" / "out_by", times
// as UTC epoch milliseconds.
//
// Timeouts:
//   Both send and receive use timeout_ms. A REQ socket whose reply never
//   arrived is stuck in the "awaiting reply" state and cannot send again,
//   so after a timeout the socket is closed and a fresh one connected. The
//   call itself reports failure; the next tick retries naturally.
//
// Errors (transport, {"ok": false}, malformed JSON, missing fields) are
// logged to std::cerr with the command name and reported as failure.
//
// Thread model: tick thread only.
// -----------------------------------------------------------------------------
class ZmqVenue final : public IVenue {
 public:
  // @throws zmq::error_t if the endpoint is malformed.
  ZmqVenue(std::string endpoint, int timeout_ms);

  ~ZmqVenue() override;

  ZmqVenue(const ZmqVenue&) = delete;
  ZmqVenue& operator=(const ZmqVenue&) = delete;
  ZmqVenue(ZmqVenue&&) = delete;
  ZmqVenue& operator=(ZmqVenue&&) = delete;

  std::optional<domain::InstrumentSpec> instrument(
      const std::string& symbol) override;
  std::optional<domain::Quote> quote(const std::string& symbol) override;
  std::optional<double> accountEquity() override;
  domain::OrderResult placeMarketOrder(
      const domain::MarketOrderRequest& request) override;
  bool modifyPosition(domain::Ticket ticket, double stop_loss,
                      double take_profit) override;
  bool closePosition(domain::Ticket ticket) override;
  bool cancelOrder(domain::Ticket ticket) override;
  std::optional<std::vector<domain::VenuePosition>> openPositions(
      std::optional<domain::Magic> magic) override;
  std::optional<std::vector<domain::PendingOrder>> pendingOrders(
      std::optional<domain::Magic> magic) override;
  std::optional<std::vector<domain::Deal>> historyDeals(
      std::int64_t from_ms, std::int64_t to_ms) override;
  std::optional<double> priceAt(const std::string& symbol,
                                std::int64_t time_ms) override;
  std::optional<double> calcProfit(const std::string& symbol, domain::Side side,
                                   double volume, double open_price,
                                   double close_price) override;

  // -------------------------------------------------------------------------
  // checkReply(cmd, text)
  // -------------------------------------------------------------------------
  // @brief  Parses one bridge reply and checks its envelope.
  //
  // @return The reply object when text is a JSON object whose "ok" is the
  //         boolean true; std::nullopt otherwise (already logged). Never
  //         throws on malformed input.
  // -------------------------------------------------------------------------
  static std::optional<nlohmann::json> checkReply(const std::string& cmd,
                                                  const std::string& text);

 private:
  // -------------------------------------------------------------------------
  // request(payload)
  // -------------------------------------------------------------------------
  // @brief  Sends payload, waits for the reply.
  //
  // @return The reply object when it parsed and carried "ok": true;
  //         std::nullopt otherwise (already logged).
  // -------------------------------------------------------------------------
  std::optional<nlohmann::json> request(const nlohmann::json& payload);

  // @throws zmq::error_t when the socket cannot be created or connected.
  void connect();

  // connect() with the error logged; false when the socket is still unusable.
  bool reconnect(const std::string& cmd);

  std::string endpoint_;
  int timeout_ms_;
  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace sigexec
