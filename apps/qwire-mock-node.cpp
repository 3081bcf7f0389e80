#include "qwire/errors.hpp"
#include "qwire/framing.hpp"
#include "qwire/identity.hpp"
#include "qwire/messages.hpp"
#include "qwire/signer.hpp"
#include "qwire/transaction.hpp"
#include "qwire/transport.hpp"
#include "qwire/util.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <string>

using namespace qwire;

static const auto kIdleTimeout = std::chrono::hours(24);
static const auto kWriteTimeout = std::chrono::seconds(10);

static void reply(ITransport& t, const WireMessage& msg) {
  send_msg(t, msg, deadline_after(kWriteTimeout));
}

static void print_transaction(const Transaction& tx) {
  std::cout << "transaction\n";
  std::cout << "  source:      " << public_key_to_identity(tx.source()) << "\n";
  std::cout << "  destination: " << public_key_to_identity(tx.destination()) << "\n";
  std::cout << "  amount:      " << tx.amount() << "\n";
  std::cout << "  tick:        " << tx.tick() << "\n";
  std::cout << "  input type:  " << tx.input_type() << " (" << tx.input_size() << " bytes)\n";
  std::cout << "  signature:   " << (verify_transaction(tx) ? "valid" : "INVALID") << std::endl;
}

// Serves one client until it disconnects.
static void serve(ITransport& t, const TickInfo& tick_info, const SystemInfo& system_info) {
  PublicPeers peers;
  peers.peers[0] = {127, 0, 0, 1};
  reply(t, make_message(0, peers));

  for (;;) {
    WireMessage req;
    try {
      req = recv_msg(t, deadline_after(kIdleTimeout));
    } catch (const ConnectionClosed&) {
      std::cerr << "[node] client disconnected\n";
      return;
    }

    switch (req.type()) {
      case MessageType::RequestCurrentTickInfo:
        reply(t, make_message(req.dejavu(), tick_info));
        break;
      case MessageType::RequestSystemInfo:
        reply(t, make_message(req.dejavu(), system_info));
        break;
      case MessageType::BroadcastTransaction:
        try {
          print_transaction(parse<Transaction>(req.body));
        } catch (const ProtocolError& e) {
          std::cerr << "[node] rejected transaction: " << e.what() << "\n";
        }
        break;
      default:
        spdlog::debug("[node] no data for {}", message_type_name(req.type()));
        reply(t, make_message(MessageType::EndResponse, req.dejavu(), {}));
        break;
    }
  }
}

int main(int argc, char** argv) {
  if (argc != 5) {
    std::cerr << "Usage: qwire-mock-node <bind_host> <port> <tick> <epoch>\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  qwire-mock-node 127.0.0.1 21841 12345678 150\n";
    return 1;
  }

  const std::string bind_host = argv[1];
  const std::uint16_t port = (std::uint16_t)std::stoi(argv[2]);

  try {
    TickInfo tick_info;
    tick_info.tick_duration = 1;
    tick_info.tick = (std::uint32_t)std::stoul(argv[3]);
    tick_info.epoch = (std::uint16_t)std::stoi(argv[4]);
    tick_info.initial_tick = tick_info.tick;

    SystemInfo system_info;
    system_info.version = 1;
    system_info.epoch = tick_info.epoch;
    system_info.tick = tick_info.tick;
    system_info.initial_tick = tick_info.initial_tick;
    system_info.latest_created_tick = tick_info.tick;

    for (;;) {
      TcpTransport t;
      const std::uint16_t bound = t.listen(bind_host, port);
      std::cerr << "[node] listening on " << bind_host << ":" << bound << "\n";
      t.accept_one(deadline_after(kIdleTimeout));
      std::cerr << "[node] accepted connection\n";
      serve(t, tick_info, system_info);
    }

  } catch (const std::exception& e) {
    std::cerr << "[node] error: " << e.what() << "\n";
    return 1;
  }
}
