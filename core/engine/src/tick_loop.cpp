#include "perpsim/engine/tick_loop.hpp"

#include "perpsim/events/event.hpp"
#include "perpsim/network/json_codec.hpp"
#include "perpsim/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace perpsim {

namespace {

// Quantity text without trailing zeros: "1", "0.25".
std::string quantityText(const Decimal& quantity) {
  std::string text = formatDecimal(quantity, 8);
  if (text.find('.') != std::string::npos) {
    text.erase(text.find_last_not_of('0') + 1);
    if (text.back() == '.') {
      text.pop_back();
    }
  }
  return text;
}

nlohmann::json okResponse() {
  nlohmann::json response;
  response["status"] = "ok";
  return response;
}

std::string errorResponse(const std::string& reason) {
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = reason;
  return response.dump();
}

}  // namespace

const char* toString(TickLoop::State state) {
  switch (state) {
    case TickLoop::State::Idle:       return "Idle";
    case TickLoop::State::Processing: return "Processing";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TickLoop::TickLoop(EngineConfig config, IPriceSource& source,
                   CommandChannel& channel, const ITimeProvider& clock)
    : config_(std::move(config)),
      source_(source),
      channel_(channel),
      clock_(clock) {
  config_.validate();

  account_.balance = Decimal(config_.starting_balance);
  account_.fee_rate = config_.fee_rate;
  account_.min_notional = config_.min_notional;
  desired_leverage_ = position_.setLeverage(config_.default_leverage);

  std::transform(config_.symbol.begin(), config_.symbol.end(),
                 config_.symbol.begin(),
                 [](unsigned char c) { return std::toupper(c); });
}

void TickLoop::addSnapshotSink(ISnapshotSink& sink) {
  sinks_.push_back(&sink);
}

// -----------------------------------------------------------------------------
// run(): throttled loop until stop()
// -----------------------------------------------------------------------------
void TickLoop::run() {
  std::cout << "[TickLoop] Started for " << config_.symbol
            << " balance=" << config_.starting_balance
            << " fee=" << formatDecimal(config_.fee_rate, kFeeRatePlaces)
            << "\n";

  while (!stop_requested_.load()) {
    runOnce();

    if (config_.tick_interval_ms > 0) {
      std::unique_lock<std::mutex> lock(throttle_mutex_);
      throttle_cv_.wait_for(lock,
                            std::chrono::milliseconds(config_.tick_interval_ms),
                            [this] { return stop_requested_.load(); });
    }
  }

  std::cout << "[TickLoop] Stopped after " << tick_count_.load()
            << " tick(s).\n";
}

void TickLoop::stop() {
  stop_requested_.store(true);
  source_.stop();
  throttle_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// runOnce(): one full tick
// -----------------------------------------------------------------------------
bool TickLoop::runOnce() {
  const std::optional<Decimal> price = source_.nextPrice();
  if (!price.has_value()) {
    return false;
  }

  state_.store(State::Processing);

  const std::int64_t now_ms = clock_.now_ms();
  const Timestamp ts = ms_to_timestamp(now_ms);
  const std::uint64_t seq = tick_count_.load() + 1;

  TickEvent tick;
  tick.symbol = config_.symbol;
  tick.price = *price;
  tick.timestamp = ts;
  tick.sequence_id = seq;
  bus_.publish(tick);

  ingestCommands(*price, ts);
  checkLiquidation(*price, ts);
  runMatching(*price, ts);

  tick_count_.store(seq);
  publishSnapshot(*price, now_ms);
  logStatus(*price);
  channel_.publishOpenOrders(queue_.ids());

  state_.store(State::Idle);
  return true;
}

// -----------------------------------------------------------------------------
// ingestCommands: cancels, leverage, then at most one new order
// -----------------------------------------------------------------------------
void TickLoop::ingestCommands(const Decimal& price, Timestamp ts) {
  for (domain::OrderId id : channel_.takeCancelRequests()) {
    auto removed = queue_.remove(id);
    if (!removed) {
      continue;  // filled or rejected on an earlier tick
    }
    removed->status = domain::OrderStatus::Canceled;

    OrderUpdateEvent update;
    update.order = *removed;
    update.leverage = desired_leverage_;
    update.timestamp = ts;
    update.sequence_id = tick_count_.load() + 1;
    bus_.publish(update);

    std::cout << "[TickLoop] " << priceText(price) << " - Order " << id
              << " canceled\n";
  }

  if (auto leverage = channel_.getLeverageRequest()) {
    desired_leverage_ = *leverage;
    std::cout << "[TickLoop] " << priceText(price) << " - Leverage set to "
              << desired_leverage_ << "X"
              << (position_.isFlat() ? "" : " (applies once flat)") << "\n";
  }

  if (auto request = channel_.getPendingOrder()) {
    const domain::OrderId id = ids_.next_id();

    OrderUpdateEvent update;
    update.order = queue_.enqueue(id, *request);
    update.leverage = desired_leverage_;
    update.timestamp = ts;
    update.sequence_id = tick_count_.load() + 1;
    bus_.publish(update);

    std::cout << "[TickLoop] " << priceText(price) << " - Order submitted: #"
              << id << " " << domain::toString(request->side) << " "
              << quantityText(request->quantity)
              << (request->limit_price
                      ? " @ " + priceText(*request->limit_price)
                      : std::string(" @ market"))
              << "\n";
  }
}

// -----------------------------------------------------------------------------
// checkLiquidation
// -----------------------------------------------------------------------------
void TickLoop::checkLiquidation(const Decimal& price, Timestamp ts) {
  auto result = liquidation_.check(price, position_, account_.fee_rate);
  if (!result) {
    return;
  }

  LiquidationEvent event;
  event.side = result->side;
  event.quantity = result->quantity;
  event.entry_price = result->entry_price;
  event.liquidation_price = result->liquidation_price;
  event.price = result->price;
  event.forfeited = result->forfeited;
  event.timestamp = ts;
  event.sequence_id = tick_count_.load() + 1;
  bus_.publish(event);

  std::cout << "[TickLoop] " << priceText(price) << " - Position liquidated: "
            << domain::toString(result->side) << " "
            << quantityText(result->quantity) << " @ "
            << formatDecimal(result->entry_price, kReportPlaces)
            << "$ liq:" << formatDecimal(result->liquidation_price, kReportPlaces)
            << "$\n";

  publishPositionUpdate(price, ts);
}

// -----------------------------------------------------------------------------
// runMatching: at most one order per tick
// -----------------------------------------------------------------------------
void TickLoop::runMatching(const Decimal& price, Timestamp ts) {
  auto result = matcher_.process(price, queue_, position_, account_,
                                 desired_leverage_);
  if (!result) {
    return;
  }

  OrderUpdateEvent update;
  update.order = result->order;
  update.reason = result->reason;
  update.leverage = result->leverage;
  update.timestamp = ts;
  update.sequence_id = tick_count_.load() + 1;

  const std::string at = priceText(result->execution_price);

  if (result->order.status == domain::OrderStatus::Filled) {
    update.fill_price = result->execution_price;
    bus_.publish(update);

    std::cout << "[TickLoop] " << at << " - Order processed: "
              << domain::toString(result->order.side) << " : "
              << quantityText(result->order.quantity) << " @ " << at << " ("
              << toString(result->kind) << ", " << result->leverage
              << "X)\n";

    publishPositionUpdate(price, ts);
    return;
  }

  bus_.publish(update);
  std::cerr << "[TickLoop] " << at << " - Order not processed: #"
            << result->order.id << " " << domain::toString(result->reason)
            << "\n";
}

void TickLoop::publishPositionUpdate(const Decimal& price, Timestamp ts) {
  PositionUpdateEvent event;
  event.position = positionSnapshot(price);
  event.balance = account_.balance;
  event.price = price;
  event.timestamp = ts;
  event.sequence_id = tick_count_.load() + 1;
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// Snapshot
// -----------------------------------------------------------------------------
std::optional<domain::PositionSnapshot> TickLoop::positionSnapshot(
    const Decimal& price) const {
  if (position_.isFlat()) {
    return std::nullopt;
  }
  domain::PositionSnapshot snap;
  snap.side = position_.side();
  snap.quantity = position_.quantity();
  snap.entry_price = position_.entryPrice();
  snap.leverage = position_.leverage();
  snap.liquidation_price = position_.liquidationPrice(account_.fee_rate);
  snap.pnl = position_.pnl(price);
  snap.margin = position_.margin(price);
  return snap;
}

domain::AccountSnapshot TickLoop::buildSnapshot(const Decimal& price,
                                                std::int64_t now_ms) const {
  domain::AccountSnapshot snapshot;
  snapshot.sequence_id = tick_count_.load();
  snapshot.timestamp_ms = now_ms;
  snapshot.time = format_clock(now_ms);
  snapshot.symbol = config_.symbol;
  snapshot.price = price;
  snapshot.balance = account_.balance;
  snapshot.total_value =
      account_.balance + position_.value(price, account_.fee_rate);
  snapshot.leverage = desired_leverage_;
  snapshot.position = positionSnapshot(price);
  snapshot.open_orders = queue_.orders();
  return snapshot;
}

void TickLoop::publishSnapshot(const Decimal& price, std::int64_t now_ms) {
  const domain::AccountSnapshot snapshot = buildSnapshot(price, now_ms);

  store_.publish(snapshot);
  bus_.publish(SnapshotEvent{snapshot});

  for (ISnapshotSink* sink : sinks_) {
    try {
      sink->publish(snapshot);
    } catch (const std::exception& e) {
      std::cerr << "[TickLoop] Snapshot sink failed: " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// logStatus: one line per tick
// -----------------------------------------------------------------------------
void TickLoop::logStatus(const Decimal& price) const {
  if (position_.isFlat()) {
    std::cout << "[TickLoop] " << priceText(price) << "\n";
    return;
  }
  std::cout << "[TickLoop] " << priceText(price) << " - Position: "
            << domain::toString(position_.side()) << " "
            << quantityText(position_.quantity()) << " @ "
            << formatDecimal(position_.entryPrice(), kReportPlaces) << "$"
            << " lev:" << position_.leverage() << "X"
            << " liq:"
            << formatDecimal(position_.liquidationPrice(account_.fee_rate),
                             kReportPlaces)
            << "$ pnl:" << formatDecimal(position_.pnl(price), kReportPlaces)
            << "$ margin:"
            << formatDecimal(position_.margin(price), kReportPlaces) << "\n";
}

std::string TickLoop::priceText(const Decimal& price) const {
  return formatDecimal(price, config_.price_precision);
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC thread
// -----------------------------------------------------------------------------
std::string TickLoop::executeCommand(const std::string& cmd) {
  nlohmann::json request;
  std::string name;

  try {
    request = nlohmann::json::parse(cmd);
  } catch (const nlohmann::json::parse_error&) {
    request = nlohmann::json::object();
    name = cmd;
  }

  if (name.empty()) {
    if (!request.is_object() || !request.contains("command") ||
        !request["command"].is_string()) {
      return errorResponse("request needs a string 'command'");
    }
    name = request["command"].get<std::string>();
  }
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  const auto latest = store_.latest();
  nlohmann::json response = okResponse();

  try {
    if (name == "ping") {
      response["response"] = "PONG";
    } else if (name == "status") {
      response["state"] = toString(state_.load());
      response["ticks"] = tick_count_.load();
      response["symbol"] = config_.symbol;
      response["snapshot"] =
          latest ? toJson(*latest) : nlohmann::json(nullptr);
    } else if (name == "get_price") {
      if (!latest) {
        return errorResponse("no tick received yet");
      }
      response["price"] = toDouble(latest->price);
    } else if (name == "get_account") {
      if (!latest) {
        return errorResponse("no tick received yet");
      }
      response["balance"] = roundForReport(latest->balance, kReportPlaces);
      response["value"] = roundForReport(latest->total_value, kReportPlaces);
      response["leverage"] = latest->leverage;
    } else if (name == "get_position") {
      if (!latest) {
        return errorResponse("no tick received yet");
      }
      response["position"] = latest->position ? toJson(*latest->position)
                                              : nlohmann::json::object();
    } else if (name == "get_orders") {
      if (!latest) {
        return errorResponse("no tick received yet");
      }
      response["orders"] = toJson(*latest)["open_orders"];
    } else if (name == "submit_order") {
      channel_.submitOrder(orderRequestFromJson(request));
      response["response"] = "Order submitted";
    } else if (name == "set_leverage") {
      if (!request.contains("leverage") ||
          !request["leverage"].is_number_integer()) {
        return errorResponse("set_leverage needs an integer 'leverage'");
      }
      const auto& leverage = request["leverage"];
      if (leverage.is_number_unsigned()
              ? leverage.get<std::uint64_t>() >
                    static_cast<std::uint64_t>(std::numeric_limits<int>::max())
              : leverage.get<std::int64_t>() < 1) {
        return errorResponse("leverage out of range");
      }
      channel_.requestLeverage(leverage.get<int>());
      response["response"] = "Leverage requested";
    } else if (name == "cancel_order") {
      if (!request.contains("id") || !request["id"].is_number_unsigned()) {
        return errorResponse("cancel_order needs a non-negative integer 'id'");
      }
      const auto id = request["id"].get<domain::OrderId>();
      if (!channel_.cancelOrder(id)) {
        return errorResponse("order " + std::to_string(id) + " is not open");
      }
      response["response"] = "Cancel requested";
    } else if (name == "close_position") {
      if (!latest || !latest->position) {
        return errorResponse("no open position");
      }
      domain::OrderRequest close;
      close.side = latest->position->side == domain::PositionSide::Long
                       ? domain::Side::Sell
                       : domain::Side::Buy;
      close.quantity = latest->position->quantity;
      if (request.contains("price") && !request["price"].is_null()) {
        close.limit_price = decimalFromJson(request["price"]);
      }
      channel_.submitOrder(close);
      response["response"] = "Close order submitted";
    } else {
      return errorResponse("Unknown command: " + name);
    }
  } catch (const std::invalid_argument& e) {
    return errorResponse(e.what());
  } catch (const nlohmann::json::exception& e) {
    return errorResponse(e.what());
  }

  return response.dump();
}

}  // namespace perpsim
