#include "qwire/engine.hpp"
#include "qwire/errors.hpp"
#include "qwire/transport.hpp"
#include "qwire/util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace qwire {

// Recently used dejavu values that a new request must not reuse.
static constexpr std::size_t kRetiredTokens = 64;

// ------------------------------ Response decoding ------------------------------

static const WireMessage& only(const std::vector<WireMessage>& msgs) {
  ensure<MalformedMessage>(msgs.size() == 1, "expected exactly one response");
  return msgs.front();
}

static void expect_type(const WireMessage& msg, MessageType type) {
  if (msg.type() != type)
    throw MalformedMessage(std::string("expected ") + message_type_name(type) + ", got " +
                           message_type_name(msg.type()));
}

template <typename T>
static std::optional<T> decode_optional(const WireMessage& msg) {
  if (msg.type() == MessageType::EndResponse) return std::nullopt;
  return decode_body<T>(msg);
}

template <typename T>
static std::vector<T> decode_all(const std::vector<WireMessage>& msgs) {
  std::vector<T> out;
  out.reserve(msgs.size());
  for (const auto& m : msgs) out.push_back(decode_body<T>(m));
  return out;
}

static Bytes key_payload(const PublicKey& pk) { return Bytes(pk.begin(), pk.end()); }

// ------------------------------ Engine ------------------------------

ProtocolEngine::ProtocolEngine(std::unique_ptr<Connection> conn,
                               std::chrono::milliseconds read_timeout)
  : conn_(std::move(conn)), read_timeout_(read_timeout) {
  ensure<PreconditionError>(conn_ != nullptr, "engine needs a connection");
}

ProtocolEngine::~ProtocolEngine() { close(); }

std::unique_ptr<ProtocolEngine> ProtocolEngine::connect(const ClientConfig& config) {
  ensure<PreconditionError>(!config.host.empty(), "node host is empty");
  auto conn = std::make_unique<Connection>(std::make_unique<TcpTransport>());
  conn->connect(config.host, config.port, config.connect_timeout);
  return std::make_unique<ProtocolEngine>(std::move(conn), config.read_timeout);
}

std::uint32_t ProtocolEngine::next_token() {
  std::uint32_t token = 0;
  do {
    token = rand_u32();
  } while (token == 0 || std::find(retired_.begin(), retired_.end(), token) != retired_.end());
  retired_.push_back(token);
  if (retired_.size() > kRetiredTokens) retired_.pop_front();
  return token;
}

void ProtocolEngine::on_unsolicited(const WireMessage& msg) {
  unsolicited_count_.fetch_add(1);
  spdlog::debug("[engine] unsolicited {} (dejavu {:#010x}, {} bytes)",
                message_type_name(msg.type()), msg.dejavu(), msg.body.size());

  std::lock_guard<std::mutex> lk(side_mutex_);
  if (msg.type() == MessageType::ExchangePublicPeers && msg.body.size() == PublicPeers::kSize) {
    for (const auto& addr : parse<PublicPeers>(msg.body).addresses()) {
      if (std::find(peers_.begin(), peers_.end(), addr) == peers_.end()) peers_.push_back(addr);
    }
  }
}

// Runs with no engine lock held, so the handler may issue requests itself.
void ProtocolEngine::deliver_unsolicited(const std::vector<WireMessage>& msgs) {
  if (msgs.empty()) return;
  UnsolicitedHandler handler;
  {
    std::lock_guard<std::mutex> lk(side_mutex_);
    handler = handler_;
  }
  if (!handler) return;
  for (const auto& msg : msgs) handler(msg);
}

std::vector<WireMessage> ProtocolEngine::request(MessageType type, const Bytes& payload,
                                                 ResponseMode mode) {
  return request(type, payload, mode, read_timeout_);
}

std::vector<WireMessage> ProtocolEngine::request(MessageType type, const Bytes& payload,
                                                 ResponseMode mode,
                                                 std::chrono::milliseconds timeout) {
  std::vector<WireMessage> unsolicited;
  std::vector<WireMessage> out;
  std::exception_ptr failure;
  try {
    out = exchange(type, payload, mode, timeout, unsolicited);
  } catch (const Error&) {
    failure = std::current_exception();
  }
  deliver_unsolicited(unsolicited);
  if (failure) std::rethrow_exception(failure);
  return out;
}

std::vector<WireMessage> ProtocolEngine::exchange(MessageType type, const Bytes& payload,
                                                  ResponseMode mode,
                                                  std::chrono::milliseconds timeout,
                                                  std::vector<WireMessage>& unsolicited) {
  const Deadline deadline = deadline_after(timeout);
  std::unique_lock<std::timed_mutex> slot(slot_mutex_, std::defer_lock);
  if (!slot.try_lock_until(deadline)) {
    spdlog::warn("[engine] {} gave up waiting for the request slot", message_type_name(type));
    throw Timeout(std::string("request slot busy: ") + message_type_name(type));
  }

  if (mode == ResponseMode::None) {
    conn_->send(make_message(type, 0, payload), deadline);
    return {};
  }

  const std::uint32_t token = next_token();
  std::vector<WireMessage> out;
  try {
    conn_->send(make_message(type, token, payload), deadline);
    for (;;) {
      WireMessage msg = conn_->receive_one_message(deadline);
      if (msg.dejavu() != token) {
        on_unsolicited(msg);
        unsolicited.push_back(std::move(msg));
        continue;
      }
      if (mode == ResponseMode::Single) {
        out.push_back(std::move(msg));
        break;
      }
      if (msg.type() == MessageType::EndResponse) break;
      out.push_back(std::move(msg));
    }
  } catch (const Timeout& e) {
    spdlog::warn("[engine] {} timed out: {}", message_type_name(type), e.what());
    throw;
  }
  return out;
}

// ------------------------------ Node state ------------------------------

TickInfo ProtocolEngine::get_tick_info() {
  auto msgs = request(MessageType::RequestCurrentTickInfo, {}, ResponseMode::Single);
  return decode_body<TickInfo>(only(msgs));
}

SystemInfo ProtocolEngine::get_system_info() {
  auto msgs = request(MessageType::RequestSystemInfo, {}, ResponseMode::Single);
  return decode_body<SystemInfo>(only(msgs));
}

Computors ProtocolEngine::get_computors() {
  auto msgs = request(MessageType::RequestComputors, {}, ResponseMode::Single);
  return decode_body<Computors>(only(msgs));
}

std::optional<EntityInfo> ProtocolEngine::get_entity(const PublicKey& id) {
  auto msgs = request(MessageType::RequestEntity, key_payload(id), ResponseMode::Single);
  return decode_optional<EntityInfo>(only(msgs));
}

// ------------------------------ Assets ------------------------------

std::vector<OwnedAsset> ProtocolEngine::get_assets(const PublicKey& owner) {
  return decode_all<OwnedAsset>(
      request(MessageType::RequestOwnedAssets, key_payload(owner), ResponseMode::Stream));
}

std::vector<IssuedAsset> ProtocolEngine::get_issued_assets(const PublicKey& issuer) {
  return decode_all<IssuedAsset>(
      request(MessageType::RequestIssuedAssets, key_payload(issuer), ResponseMode::Stream));
}

std::vector<PossessedAsset> ProtocolEngine::get_possessed_assets(const PublicKey& possessor) {
  return decode_all<PossessedAsset>(
      request(MessageType::RequestPossessedAssets, key_payload(possessor), ResponseMode::Stream));
}

std::vector<WireMessage> ProtocolEngine::request_assets(const AssetsByFilterRequest& req) {
  return request(MessageType::RequestAssets, serialize(req), ResponseMode::Stream);
}

static AssetsByFilterRequest holder_request(AssetRecordKind kind, const AssetFilter& f) {
  ensure<PreconditionError>(!is_zero(f.issuer), "asset issuer is required");
  ensure<PreconditionError>(!f.asset_name.empty(), "asset name is required");

  AssetsByFilterRequest req;
  req.kind = kind;
  req.issuer = f.issuer;
  req.asset_name = f.asset_name;
  if (f.owner.identity) req.owner = *f.owner.identity;
  else req.flags |= asset_flags::kAnyOwner;
  if (f.owner.managing_contract) req.ownership_managing_contract = f.owner.managing_contract;
  else req.flags |= asset_flags::kAnyOwnerContract;
  if (f.possessor.identity) req.possessor = *f.possessor.identity;
  else req.flags |= asset_flags::kAnyPossessor;
  if (f.possessor.managing_contract) req.possession_managing_contract = f.possessor.managing_contract;
  else req.flags |= asset_flags::kAnyPossessorContract;
  return req;
}

std::vector<AssetIssuance> ProtocolEngine::get_asset_issuances(
    const std::optional<PublicKey>& issuer, const std::string& asset_name) {
  AssetsByFilterRequest req;
  req.kind = AssetRecordKind::Issuance;
  if (issuer) req.issuer = *issuer;
  else req.flags |= asset_flags::kAnyIssuer;
  if (!asset_name.empty()) req.asset_name = asset_name;
  else req.flags |= asset_flags::kAnyAssetName;
  return decode_all<AssetIssuance>(request_assets(req));
}

std::vector<AssetOwnership> ProtocolEngine::get_asset_ownerships(const AssetFilter& filter) {
  AssetFilter f = filter;
  f.possessor = AssetHolderFilter{};
  return decode_all<AssetOwnership>(request_assets(holder_request(AssetRecordKind::Ownership, f)));
}

std::vector<AssetPossession> ProtocolEngine::get_asset_possessions(const AssetFilter& filter) {
  return decode_all<AssetPossession>(
      request_assets(holder_request(AssetRecordKind::Possession, filter)));
}

std::vector<AssetIssuance> ProtocolEngine::get_asset_issuances_by_universe_index(std::uint32_t index) {
  return decode_all<AssetIssuance>(request(MessageType::RequestAssets,
                                           serialize(AssetsByUniverseIndexRequest{index}),
                                           ResponseMode::Stream));
}

std::vector<AssetOwnership> ProtocolEngine::get_asset_ownerships_by_universe_index(std::uint32_t index) {
  return decode_all<AssetOwnership>(request(MessageType::RequestAssets,
                                            serialize(AssetsByUniverseIndexRequest{index}),
                                            ResponseMode::Stream));
}

std::vector<AssetPossession> ProtocolEngine::get_asset_possessions_by_universe_index(
    std::uint32_t index) {
  return decode_all<AssetPossession>(request(MessageType::RequestAssets,
                                             serialize(AssetsByUniverseIndexRequest{index}),
                                             ResponseMode::Stream));
}

// ------------------------------ Ticks ------------------------------

void ProtocolEngine::check_past_tick(std::uint32_t tick) {
  const TickInfo info = get_tick_info();
  ensure<PreconditionError>(tick <= info.tick, "requested tick " + std::to_string(tick) +
                                                   " is in the future, latest tick is " +
                                                   std::to_string(info.tick));
}

std::optional<TickData> ProtocolEngine::get_tick_data(std::uint32_t tick) {
  check_past_tick(tick);
  auto msgs = request(MessageType::RequestTickData, serialize(TickRequest{tick}),
                      ResponseMode::Single);
  return decode_optional<TickData>(only(msgs));
}

std::vector<Transaction> ProtocolEngine::get_tick_transactions(std::uint32_t tick) {
  const std::optional<TickData> data = get_tick_data(tick);
  if (!data || data->transaction_count() == 0) return {};

  TickTransactionsRequest req;
  req.tick = tick;
  for (std::size_t i = 0; i < kNumberOfTransactionsPerTick; ++i) {
    if (is_zero(data->transaction_digests[i]))
      req.transaction_flags[i / 8] |= (std::uint8_t)(1u << (i % 8));
  }

  std::vector<Transaction> out;
  for (const auto& msg : request(MessageType::RequestTickTransactions, serialize(req),
                                 ResponseMode::Stream)) {
    expect_type(msg, Transaction::kType);
    out.push_back(parse<Transaction>(msg.body));
  }
  return out;
}

std::vector<QuorumTickVote> ProtocolEngine::get_quorum_votes(std::uint32_t tick) {
  check_past_tick(tick);
  QuorumTickRequest req;
  req.tick = tick;
  return decode_all<QuorumTickVote>(
      request(MessageType::RequestQuorumTick, serialize(req), ResponseMode::Stream));
}

std::optional<TransactionStatus> ProtocolEngine::get_transaction_status(std::uint32_t tick) {
  auto msgs = request(MessageType::RequestTxStatus, serialize(TickRequest{tick}),
                      ResponseMode::Single);
  const WireMessage& msg = only(msgs);
  if (msg.type() == MessageType::EndResponse) return std::nullopt;
  expect_type(msg, TransactionStatus::kType);
  return parse<TransactionStatus>(msg.body);
}

// ------------------------------ Contracts ------------------------------

std::optional<Bytes> ProtocolEngine::query_smart_contract(std::uint32_t contract_index,
                                                          std::uint16_t input_type,
                                                          const Bytes& input) {
  ContractFunctionRequest req;
  req.contract_index = contract_index;
  req.input_type = input_type;
  req.input = input;
  auto msgs = request(MessageType::RequestContractFunction, serialize(req), ResponseMode::Single);
  const WireMessage& msg = only(msgs);
  if (msg.type() == MessageType::EndResponse) return std::nullopt;
  expect_type(msg, MessageType::RespondContractFunction);
  return msg.body;
}

// ------------------------------ Transactions ------------------------------

static void check_broadcastable(const Transaction& tx) {
  ensure<PreconditionError>(tx.is_signed(), "transaction must be signed before broadcast");
  ensure<PreconditionError>(tx.amount() >= 0, "transaction amount must be non-negative");
  ensure<PreconditionError>(tx.input().size() <= kMaxInputSize,
                            "transaction input exceeds 1024 bytes");
}

void ProtocolEngine::broadcast_transaction(const Transaction& tx) {
  check_broadcastable(tx);
  request(MessageType::BroadcastTransaction, serialize(tx), ResponseMode::None);
}

void ProtocolEngine::send_raw_transaction(const Bytes& raw) {
  check_broadcastable(parse<Transaction>(raw));
  request(MessageType::BroadcastTransaction, raw, ResponseMode::None);
}

// ------------------------------ Side channel ------------------------------

void ProtocolEngine::set_unsolicited_handler(UnsolicitedHandler handler) {
  std::lock_guard<std::mutex> lk(side_mutex_);
  handler_ = std::move(handler);
}

std::vector<std::string> ProtocolEngine::known_peers() const {
  std::lock_guard<std::mutex> lk(side_mutex_);
  return peers_;
}

void ProtocolEngine::close() noexcept { conn_->close(); }

} // namespace qwire
