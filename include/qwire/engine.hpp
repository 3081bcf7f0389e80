#pragma once
#include "qwire.hpp"
#include "connection.hpp"
#include "framing.hpp"
#include "messages.hpp"
#include "transaction.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace qwire {

static constexpr std::uint16_t kDefaultNodePort = 21841;

struct ClientConfig {
  std::string host;
  std::uint16_t port{kDefaultNodePort};
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds read_timeout{std::chrono::seconds(30)};
};

enum class ResponseMode {
  None,    // fire-and-forget, sent with dejavu 0
  Single,  // first correlated message completes the exchange
  Stream   // correlated messages until END_RESPONSE
};

// Called once the exchange that received the message has released the
// request slot. Exceptions it throws propagate to that request's caller.
using UnsolicitedHandler = std::function<void(const WireMessage&)>;

// Owner filter for ownership/possession queries. An empty identity or a zero
// contract index matches any.
struct AssetHolderFilter {
  std::optional<PublicKey> identity;
  std::uint16_t managing_contract{0};
};

struct AssetFilter {
  PublicKey issuer{};
  std::string asset_name;  // up to 8 bytes
  AssetHolderFilter owner;
  AssetHolderFilter possessor;
};

class ProtocolEngine {
public:
  ProtocolEngine(std::unique_ptr<Connection> conn, std::chrono::milliseconds read_timeout);
  ~ProtocolEngine();

  ProtocolEngine(const ProtocolEngine&) = delete;
  ProtocolEngine& operator=(const ProtocolEngine&) = delete;

  // TCP connection to config.host:config.port.
  static std::unique_ptr<ProtocolEngine> connect(const ClientConfig& config);

  // One exchange under the request slot. Callers are serialized; a caller
  // whose deadline passes while waiting for the slot gets Timeout.
  std::vector<WireMessage> request(MessageType type, const Bytes& payload, ResponseMode mode);
  std::vector<WireMessage> request(MessageType type, const Bytes& payload, ResponseMode mode,
                                   std::chrono::milliseconds timeout);

  TickInfo get_tick_info();
  SystemInfo get_system_info();
  Computors get_computors();

  std::vector<OwnedAsset> get_assets(const PublicKey& owner);
  std::vector<IssuedAsset> get_issued_assets(const PublicKey& issuer);
  std::vector<PossessedAsset> get_possessed_assets(const PublicKey& possessor);

  std::optional<EntityInfo> get_entity(const PublicKey& id);

  // PreconditionError when `tick` is after the node's current tick.
  std::optional<TickData> get_tick_data(std::uint32_t tick);
  std::vector<Transaction> get_tick_transactions(std::uint32_t tick);
  std::vector<QuorumTickVote> get_quorum_votes(std::uint32_t tick);
  std::optional<TransactionStatus> get_transaction_status(std::uint32_t tick);

  std::optional<Bytes> query_smart_contract(std::uint32_t contract_index, std::uint16_t input_type,
                                            const Bytes& input);

  // Empty issuer / name match any.
  std::vector<AssetIssuance> get_asset_issuances(const std::optional<PublicKey>& issuer,
                                                 const std::string& asset_name);
  // Issuer and asset name are required (PreconditionError).
  std::vector<AssetOwnership> get_asset_ownerships(const AssetFilter& filter);
  std::vector<AssetPossession> get_asset_possessions(const AssetFilter& filter);

  std::vector<AssetIssuance> get_asset_issuances_by_universe_index(std::uint32_t index);
  std::vector<AssetOwnership> get_asset_ownerships_by_universe_index(std::uint32_t index);
  std::vector<AssetPossession> get_asset_possessions_by_universe_index(std::uint32_t index);

  // Signed, non-negative amount, input within 1024 bytes; otherwise
  // PreconditionError before anything is written.
  void broadcast_transaction(const Transaction& tx);
  void send_raw_transaction(const Bytes& raw);

  void set_unsolicited_handler(UnsolicitedHandler handler);
  std::uint64_t unsolicited_count() const { return unsolicited_count_.load(); }
  std::vector<std::string> known_peers() const;

  void close() noexcept;
  bool is_open() const { return conn_->is_open(); }

private:
  // Holds the request slot for the whole exchange. Messages carrying another
  // dejavu are appended to `unsolicited`.
  std::vector<WireMessage> exchange(MessageType type, const Bytes& payload, ResponseMode mode,
                                    std::chrono::milliseconds timeout,
                                    std::vector<WireMessage>& unsolicited);
  std::uint32_t next_token();
  void on_unsolicited(const WireMessage& msg);
  void deliver_unsolicited(const std::vector<WireMessage>& msgs);
  void check_past_tick(std::uint32_t tick);
  std::vector<WireMessage> request_assets(const AssetsByFilterRequest& req);

  std::unique_ptr<Connection> conn_;
  std::chrono::milliseconds read_timeout_;

  std::timed_mutex slot_mutex_;
  std::deque<std::uint32_t> retired_;  // guarded by slot_mutex_

  mutable std::mutex side_mutex_;
  UnsolicitedHandler handler_;
  std::vector<std::string> peers_;
  std::atomic<std::uint64_t> unsolicited_count_{0};
};

} // namespace qwire
