#include "qwire/engine.hpp"
#include "qwire/errors.hpp"
#include "qwire/identity.hpp"
#include "qwire/signer.hpp"
#include "qwire/transaction.hpp"
#include "qwire/util.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <iostream>
#include <string>
#include <vector>

using namespace qwire;

static void usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  qwire-client [-v] <host> <port> <command> [args...]\n\n";
  std::cerr << "Commands:\n";
  std::cerr << "  tick-info\n";
  std::cerr << "  system-info\n";
  std::cerr << "  assets <identity>\n";
  std::cerr << "  entity <identity>\n";
  std::cerr << "  computors\n";
  std::cerr << "  tick-data <tick>\n";
  std::cerr << "  send <key_file> <destination_identity> <amount> <tick_offset>\n\n";
  std::cerr << "key_file holds a hex-encoded 32-byte Ed25519 private key.\n\n";
  std::cerr << "Example:\n";
  std::cerr << "  qwire-client 127.0.0.1 21841 tick-info\n";
}

static SecureBytes load_private_key(const std::string& path) {
  SecureBytes raw(read_file(path));
  std::string hex;
  for (std::uint8_t c : raw.b) {
    if (!std::isspace(c)) hex.push_back((char)c);
  }
  SecureBytes key(from_hex(hex));
  secure_bzero(&hex[0], hex.size());
  return key;
}

static void print_tick_info(const TickInfo& ti) {
  std::cout << "tick:            " << ti.tick << "\n";
  std::cout << "epoch:           " << ti.epoch << "\n";
  std::cout << "tick duration:   " << ti.tick_duration << "\n";
  std::cout << "aligned votes:   " << ti.number_of_aligned_votes << "\n";
  std::cout << "misaligned votes:" << ti.number_of_misaligned_votes << "\n";
  std::cout << "initial tick:    " << ti.initial_tick << "\n";
}

static void print_system_info(const SystemInfo& si) {
  std::cout << "version:         " << si.version << "\n";
  std::cout << "epoch:           " << si.epoch << "\n";
  std::cout << "tick:            " << si.tick << "\n";
  std::cout << "initial tick:    " << si.initial_tick << "\n";
  std::cout << "latest created:  " << si.latest_created_tick << "\n";
  std::cout << "entities:        " << si.number_of_entities << "\n";
  std::cout << "transactions:    " << si.number_of_transactions << "\n";
  std::cout << "solution thresh: " << si.solution_threshold << "\n";
  std::cout << "total spectrum:  " << si.total_spectrum_amount << "\n";
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  spdlog::set_level(spdlog::level::info);
  if (!args.empty() && args[0] == "-v") {
    spdlog::set_level(spdlog::level::debug);
    args.erase(args.begin());
  }
  if (args.size() < 3) {
    usage();
    return 1;
  }

  try {
    ClientConfig config;
    config.host = args[0];
    config.port = (std::uint16_t)std::stoi(args[1]);
    const std::string command = args[2];
    const std::vector<std::string> rest(args.begin() + 3, args.end());

    auto need = [&](std::size_t n) {
      ensure<PreconditionError>(rest.size() == n, command + " takes " + std::to_string(n) +
                                                      " argument(s)");
    };

    auto engine = ProtocolEngine::connect(config);
    std::cerr << "[client] connected to " << config.host << ":" << config.port << "\n";

    if (command == "tick-info") {
      need(0);
      print_tick_info(engine->get_tick_info());
    } else if (command == "system-info") {
      need(0);
      print_system_info(engine->get_system_info());
    } else if (command == "assets") {
      need(1);
      const auto assets = engine->get_assets(identity_to_public_key(rest[0]));
      for (const auto& a : assets) {
        std::cout << a.asset_name() << " issuer=" << public_key_to_identity(a.issuer())
                  << " units=" << a.quantity()
                  << " contract=" << a.ownership.managing_contract_index << "\n";
      }
      std::cout << assets.size() << " asset(s)\n";
    } else if (command == "entity") {
      need(1);
      const auto info = engine->get_entity(identity_to_public_key(rest[0]));
      if (!info) {
        std::cout << "no entity record\n";
      } else {
        std::cout << "balance:         " << info->entity.balance() << "\n";
        std::cout << "incoming:        " << info->entity.incoming_amount << " in "
                  << info->entity.number_of_incoming_transfers << " transfer(s)\n";
        std::cout << "outgoing:        " << info->entity.outgoing_amount << " in "
                  << info->entity.number_of_outgoing_transfers << " transfer(s)\n";
        std::cout << "tick:            " << info->tick << "\n";
        std::cout << "spectrum index:  " << info->spectrum_index << "\n";
      }
    } else if (command == "computors") {
      need(0);
      const Computors c = engine->get_computors();
      std::cout << "epoch " << c.epoch << "\n";
      for (std::size_t i = 0; i < c.public_keys.size(); ++i)
        std::cout << i << " " << public_key_to_identity(c.public_keys[i]) << "\n";
    } else if (command == "tick-data") {
      need(1);
      const auto td = engine->get_tick_data((std::uint32_t)std::stoul(rest[0]));
      if (!td) {
        std::cout << "tick is empty\n";
      } else {
        std::cout << "tick " << td->tick << " epoch " << td->epoch << " computor "
                  << td->computor_index << "\n";
        std::cout << td->transaction_count() << " transaction(s)\n";
        for (const auto& d : td->transaction_digests) {
          if (!is_zero(d)) std::cout << "  " << to_hex(d) << "\n";
        }
      }
    } else if (command == "send") {
      need(4);
      SecureBytes key_bytes = load_private_key(rest[0]);
      Ed25519KeyPair key(key_bytes);
      const PublicKey destination = identity_to_public_key(rest[1]);
      const std::int64_t amount = std::stoll(rest[2]);
      const std::uint32_t offset = (std::uint32_t)std::stoul(rest[3]);

      const TickInfo ti = engine->get_tick_info();
      Transaction tx = TransactionBuilder()
                           .source(key.public_identity())
                           .destination(destination)
                           .amount(amount)
                           .tick(ti.tick + offset)
                           .build();
      sign_transaction(tx, key);
      engine->broadcast_transaction(tx);
      std::cout << "sent " << amount << " from " << public_key_to_identity(tx.source())
                << " to " << rest[1] << " for tick " << tx.tick() << "\n";
    } else {
      usage();
      return 1;
    }

    engine->close();
    return 0;

  } catch (const std::exception& e) {
    std::cerr << "[client] error: " << e.what() << "\n";
    return 1;
  }
}
