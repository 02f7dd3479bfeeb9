// -----------------------------------------------------------------------------
// perpsim - leveraged perpetual-futures account simulator.
//
//   perpsim -s BTCUSDT -b 1000 -f 0.0004 [-c config.json]
//
// Startup:
//   1) Build EngineConfig: defaults, then --config file, then flags.
//   2) Connect the price source (Binance miniTicker or a ZeroMQ feed).
//   3) Create the TickLoop and subscribe logging callbacks to its EventBus.
//   4) Start the IpcServer (commands from perpsim_ctl, telemetry PUB) and
//      bridge engine events into its telemetry queue.
//   5) Run the tick loop on the main thread until Ctrl-C or a feed failure.
//
// Thread layout:
//   main thread   TickLoop::run()  (price fetch, matching, snapshots)
//   ipc thread    IpcServer        (commands -> CommandChannel)
//   watcher       turns SIGINT into TickLoop::stop()
// -----------------------------------------------------------------------------

#include "perpsim/concurrent/command_channel.hpp"
#include "perpsim/config/engine_config.hpp"
#include "perpsim/engine/tick_loop.hpp"
#include "perpsim/events/event.hpp"
#include "perpsim/gateway/binance_ticker_stream.hpp"
#include "perpsim/gateway/zmq_price_feed.hpp"
#include "perpsim/network/ipc_server.hpp"
#include "perpsim/snapshot/json_file_snapshot_writer.hpp"
#include "perpsim/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// The handler only stores this flag; a watcher thread turns it into
// TickLoop::stop(), which takes locks and is not async-signal-safe.
static std::atomic<bool> g_interrupted{false};

static void sigint_handler(int /*signum*/) { g_interrupted.store(true); }

int main(int argc, char** argv) {
  const std::string program = argc > 0 ? argv[0] : "perpsim";

  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  perpsim::EngineConfig config;
  try {
    const perpsim::CommandLine cli = perpsim::parseCommandLine(
        std::vector<std::string>(argv + 1, argv + argc));
    if (cli.help) {
      std::cout << perpsim::usage(program);
      return 0;
    }
    if (cli.config_path) {
      config = perpsim::loadConfigFile(*cli.config_path, config);
    }
    perpsim::applyCommandLine(config, cli);
    config.validate();
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n" << perpsim::usage(program);
    return 2;
  }

  // -------------------------------------------------------------------------
  // 2) Price source
  // -------------------------------------------------------------------------
  std::unique_ptr<perpsim::IPriceSource> source;
  perpsim::BinanceTickerStream* binance = nullptr;
  try {
    if (config.feed == perpsim::FeedKind::Binance) {
      auto stream = std::make_unique<perpsim::BinanceTickerStream>(
          config.symbol, config.price_precision);
      stream->connect();
      binance = stream.get();
      source = std::move(stream);
    } else {
      source = std::make_unique<perpsim::ZmqPriceFeed>(
          config.zmq_feed_endpoint, config.price_precision);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] Price feed unavailable: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Engine and logging subscribers
  // -------------------------------------------------------------------------
  perpsim::LiveTimeProvider clock;
  perpsim::CommandChannel channel;
  perpsim::TickLoop loop(config, *source, channel, clock);

  std::unique_ptr<perpsim::JsonFileSnapshotWriter> state_file;
  if (!config.snapshot_path.empty()) {
    state_file =
        std::make_unique<perpsim::JsonFileSnapshotWriter>(config.snapshot_path);
    loop.addSnapshotSink(*state_file);
  }

  loop.eventBus().subscribe<perpsim::LiquidationEvent>(
      [](const perpsim::LiquidationEvent& e) {
        std::cout << "[Liquidation] " << perpsim::domain::toString(e.side)
                  << " qty=" << perpsim::formatDecimal(e.quantity, 8)
                  << " forfeited="
                  << perpsim::formatDecimal(e.forfeited, 2) << "\n";
      });

  // -------------------------------------------------------------------------
  // 4) IPC server and telemetry bridges
  // -------------------------------------------------------------------------
  std::unique_ptr<perpsim::IpcServer> ipc;
  if (!config.ipc_cmd_endpoint.empty() && !config.ipc_pub_endpoint.empty()) {
    ipc = std::make_unique<perpsim::IpcServer>(
        [&loop](const std::string& cmd) { return loop.executeCommand(cmd); },
        config.ipc_cmd_endpoint, config.ipc_pub_endpoint);
    try {
      ipc->start();
    } catch (const zmq::error_t& e) {
      std::cerr << "[main] IPC disabled: " << e.what() << "\n";
      ipc.reset();
    }
  }
  if (ipc) {
    perpsim::IpcServer* server = ipc.get();
    loop.eventBus().subscribe([server](const perpsim::Event& event) {
      server->pushTelemetry(event);
    });
  }

  // -------------------------------------------------------------------------
  // 5) Run until Ctrl-C or the feed dies
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::thread interrupt_watcher([&loop] {
    while (!loop.stopRequested()) {
      if (g_interrupted.load()) {
        std::cout << "\n[main] SIGINT received, stopping...\n";
        loop.stop();
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  int exit_code = 0;
  try {
    loop.run();
  } catch (const perpsim::FeedError& e) {
    std::cerr << "[main] Feed lost: " << e.what() << "\n";
    exit_code = 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] Tick loop failed: " << e.what() << "\n";
    exit_code = 1;
  }

  loop.stop();
  interrupt_watcher.join();
  std::signal(SIGINT, SIG_DFL);

  if (binance != nullptr) {
    binance->unsubscribe();
  }
  ipc.reset();

  std::cout << "[main] Shutdown complete.\n";
  return exit_code;
}
