#include "simex/portfolio/portfolio.hpp"

#include <cmath>
#include <iostream>

namespace simex {

Portfolio::Portfolio(double initial_cash) { state_.cash = initial_cash; }

// -----------------------------------------------------------------------------
// updatePosition: long-only fill accounting
// -----------------------------------------------------------------------------
void Portfolio::updatePosition(const std::string& symbol, domain::Side side,
                               double qty, double price) {
  domain::Position& pos = state_.positions[symbol];
  if (pos.symbol.empty()) {
    pos.symbol = symbol;
    pos.average_price = price;
  }

  if (side == domain::Side::Buy) {
    double new_qty = pos.quantity + qty;
    if (new_qty > 0.0) {
      pos.average_price =
          (pos.average_price * pos.quantity + qty * price) / new_qty;
    }
    pos.quantity = new_qty;
    state_.cash -= qty * price;
    return;
  }

  // Sell: the whole sale is credited even when it exceeds the holding.
  pos.quantity -= qty;
  state_.cash += qty * price;
  if (pos.quantity < 0.0) {
    std::cerr << "[Portfolio] oversell on " << symbol << ": sold " << qty
              << ", holding floored at 0.\n";
    pos.quantity = 0.0;
  }
}

// -----------------------------------------------------------------------------
// applyTrade: the one mutation path used by both drivers
// -----------------------------------------------------------------------------
void Portfolio::applyTrade(const domain::Trade& trade) {
  updatePosition(trade.symbol, trade.side, std::abs(trade.quantity),
                 trade.price);
  state_.cash -= trade.fee;
}

bool Portfolio::wouldOversell(const std::string& symbol, domain::Side side,
                              double qty) const {
  if (side != domain::Side::Sell) {
    return false;
  }
  const domain::Position* pos = position(symbol);
  double held = pos ? pos->quantity : 0.0;
  return std::abs(qty) > held;
}

double Portfolio::markToMarket(const domain::MarkPrices& marks) const {
  return state_.totalValue(marks);
}

bool Portfolio::acceptsTimestamp(Timestamp timestamp) const {
  return state_.equity_curve.empty() ||
         timestamp > state_.equity_curve.back().timestamp;
}

bool Portfolio::recordEquity(Timestamp timestamp, double equity) {
  if (!acceptsTimestamp(timestamp)) {
    return false;
  }
  state_.equity_curve.push_back(domain::EquityPoint{timestamp, equity});
  return true;
}

}  // namespace simex
