#pragma once
#include "qwire.hpp"
#include "codec.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace qwire {

static constexpr std::size_t kNumberOfTransactionsPerTick = 1024;
static constexpr std::size_t kNumberOfComputors = 676;
static constexpr std::size_t kAssetsDepth = 24;
static constexpr std::size_t kSpectrumDepth = 24;
static constexpr std::size_t kNumberOfExchangedPeers = 4;
static constexpr std::size_t kMaxInputSize = 1024;

static constexpr std::size_t kAssetNameLen = 7;
static constexpr std::size_t kFilterAssetNameLen = 8;

enum class MessageType : std::uint8_t {
  ExchangePublicPeers = 0,
  BroadcastComputors = 2,
  RespondQuorumTick = 3,
  BroadcastFutureTickData = 8,
  RequestComputors = 11,
  RequestQuorumTick = 14,
  RequestTickData = 16,
  BroadcastTransaction = 24,
  RequestCurrentTickInfo = 27,
  RespondCurrentTickInfo = 28,
  RequestTickTransactions = 29,
  RequestEntity = 31,
  RespondEntity = 32,
  EndResponse = 35,
  RequestIssuedAssets = 36,
  RespondIssuedAssets = 37,
  RequestOwnedAssets = 38,
  RespondOwnedAssets = 39,
  RequestPossessedAssets = 40,
  RespondPossessedAssets = 41,
  RequestContractFunction = 42,
  RespondContractFunction = 43,
  RequestSystemInfo = 46,
  RespondSystemInfo = 47,
  RequestAssets = 52,
  RespondAssets = 53,
  RequestTxStatus = 201,
  RespondTxStatus = 202
};

const char* message_type_name(MessageType type);
bool is_known_message_type(std::uint8_t raw);

// ------------------------------ Node state ------------------------------

struct PublicPeers {
  static constexpr MessageType kType = MessageType::ExchangePublicPeers;
  static constexpr std::size_t kSize = kNumberOfExchangedPeers * 4;

  std::array<std::array<std::uint8_t, 4>, kNumberOfExchangedPeers> peers{};

  // Dotted IPv4 addresses of the non-zero entries.
  std::vector<std::string> addresses() const;

  void write(ByteWriter& w) const;
  static PublicPeers read(ByteReader& r);
};

struct TickInfo {
  static constexpr MessageType kType = MessageType::RespondCurrentTickInfo;
  static constexpr std::size_t kSize = 16;

  std::uint16_t tick_duration{0};
  std::uint16_t epoch{0};
  std::uint32_t tick{0};
  std::uint16_t number_of_aligned_votes{0};
  std::uint16_t number_of_misaligned_votes{0};
  std::uint32_t initial_tick{0};

  bool operator==(const TickInfo& o) const;
  bool operator!=(const TickInfo& o) const { return !(*this == o); }

  void write(ByteWriter& w) const;
  static TickInfo read(ByteReader& r);
};

struct SystemInfo {
  static constexpr MessageType kType = MessageType::RespondSystemInfo;
  static constexpr std::size_t kSize = 128;

  std::int16_t version{0};
  std::uint16_t epoch{0};
  std::uint32_t tick{0};
  std::uint32_t initial_tick{0};
  std::uint32_t latest_created_tick{0};

  std::uint16_t initial_millisecond{0};
  std::uint8_t initial_second{0};
  std::uint8_t initial_minute{0};
  std::uint8_t initial_hour{0};
  std::uint8_t initial_day{0};
  std::uint8_t initial_month{0};
  std::uint8_t initial_year{0};

  std::uint32_t number_of_entities{0};
  std::uint32_t number_of_transactions{0};

  Digest random_mining_seed{};
  std::int32_t solution_threshold{0};

  std::uint64_t total_spectrum_amount{0};
  std::uint64_t current_entity_balance_dust_threshold{0};
  std::uint32_t target_tick_vote_signature{0};

  std::array<std::uint64_t, 5> reserve{};

  void write(ByteWriter& w) const;
  static SystemInfo read(ByteReader& r);
};

// ------------------------------ Assets ------------------------------

struct IssuanceRecord {
  static constexpr std::size_t kSize = 48;

  PublicKey public_key{};
  std::uint8_t type{0};
  std::string name;                 // up to 7 bytes
  std::int8_t number_of_decimal_places{0};
  std::string unit_of_measurement;  // up to 7 bytes

  void write(ByteWriter& w) const;
  static IssuanceRecord read(ByteReader& r);
};

struct OwnershipRecord {
  static constexpr std::size_t kSize = 48;

  PublicKey public_key{};
  std::uint8_t type{0};
  std::uint16_t managing_contract_index{0};
  std::uint32_t issuance_index{0};
  std::int64_t number_of_units{0};

  void write(ByteWriter& w) const;
  static OwnershipRecord read(ByteReader& r);
};

struct PossessionRecord {
  static constexpr std::size_t kSize = 48;

  PublicKey public_key{};
  std::uint8_t type{0};
  std::uint16_t managing_contract_index{0};
  std::uint32_t ownership_index{0};
  std::int64_t number_of_units{0};

  void write(ByteWriter& w) const;
  static PossessionRecord read(ByteReader& r);
};

// Spectrum/universe proof position of a record.
struct AssetInfo {
  static constexpr std::size_t kSize = 8 + kAssetsDepth * kDigestLen;

  std::uint32_t tick{0};
  std::uint32_t universe_index{0};
  std::array<Digest, kAssetsDepth> siblings{};

  void write(ByteWriter& w) const;
  static AssetInfo read(ByteReader& r);
};

struct IssuedAsset {
  static constexpr MessageType kType = MessageType::RespondIssuedAssets;
  static constexpr std::size_t kSize = IssuanceRecord::kSize + AssetInfo::kSize;

  IssuanceRecord issuance;
  AssetInfo info;

  void write(ByteWriter& w) const;
  static IssuedAsset read(ByteReader& r);
};

struct OwnedAsset {
  static constexpr MessageType kType = MessageType::RespondOwnedAssets;
  static constexpr std::size_t kSize =
      OwnershipRecord::kSize + IssuanceRecord::kSize + AssetInfo::kSize;

  OwnershipRecord ownership;
  IssuanceRecord issuance;
  AssetInfo info;

  const PublicKey& owner() const { return ownership.public_key; }
  const PublicKey& issuer() const { return issuance.public_key; }
  const std::string& asset_name() const { return issuance.name; }
  std::int64_t quantity() const { return ownership.number_of_units; }

  void write(ByteWriter& w) const;
  static OwnedAsset read(ByteReader& r);
};

struct PossessedAsset {
  static constexpr MessageType kType = MessageType::RespondPossessedAssets;
  static constexpr std::size_t kSize = PossessionRecord::kSize + OwnershipRecord::kSize +
                                       IssuanceRecord::kSize + AssetInfo::kSize;

  PossessionRecord possession;
  OwnershipRecord ownership;
  IssuanceRecord issuance;
  AssetInfo info;

  void write(ByteWriter& w) const;
  static PossessedAsset read(ByteReader& r);
};

// One RESPOND_ASSETS record. The 48-byte record is interpreted according to
// the kind of records that was requested.
template <typename Record>
struct UniverseEntry {
  static constexpr MessageType kType = MessageType::RespondAssets;
  static constexpr std::size_t kSize = Record::kSize + 8;

  Record asset;
  std::uint32_t tick{0};
  std::uint32_t universe_index{0};

  void write(ByteWriter& w) const {
    asset.write(w);
    w.u32(tick);
    w.u32(universe_index);
  }
  static UniverseEntry read(ByteReader& r) {
    UniverseEntry e;
    e.asset = Record::read(r);
    e.tick = r.u32();
    e.universe_index = r.u32();
    return e;
  }
};

using AssetIssuance = UniverseEntry<IssuanceRecord>;
using AssetOwnership = UniverseEntry<OwnershipRecord>;
using AssetPossession = UniverseEntry<PossessionRecord>;

enum class AssetRecordKind : std::uint16_t {
  Issuance = 0,
  Ownership = 1,
  Possession = 2,
  ByUniverseIndex = 3
};

namespace asset_flags {
static constexpr std::uint16_t kAnyIssuer = 0x02;
static constexpr std::uint16_t kAnyAssetName = 0x04;
static constexpr std::uint16_t kAnyOwner = 0x08;
static constexpr std::uint16_t kAnyOwnerContract = 0x10;
static constexpr std::uint16_t kAnyPossessor = 0x20;
static constexpr std::uint16_t kAnyPossessorContract = 0x40;
} // namespace asset_flags

struct AssetsByFilterRequest {
  static constexpr std::size_t kSize = 112;

  AssetRecordKind kind{AssetRecordKind::Issuance};
  std::uint16_t flags{0};
  std::uint16_t ownership_managing_contract{0};
  std::uint16_t possession_managing_contract{0};
  PublicKey issuer{};
  std::string asset_name;  // up to 8 bytes
  PublicKey owner{};
  PublicKey possessor{};

  void write(ByteWriter& w) const;
  static AssetsByFilterRequest read(ByteReader& r);
};

struct AssetsByUniverseIndexRequest {
  static constexpr std::size_t kSize = 112;

  std::uint32_t universe_index{0};

  void write(ByteWriter& w) const;
  static AssetsByUniverseIndexRequest read(ByteReader& r);
};

// ------------------------------ Entities ------------------------------

struct EntityRecord {
  static constexpr std::size_t kSize = 64;

  PublicKey public_key{};
  std::int64_t incoming_amount{0};
  std::int64_t outgoing_amount{0};
  std::uint32_t number_of_incoming_transfers{0};
  std::uint32_t number_of_outgoing_transfers{0};
  std::uint32_t latest_incoming_transfer_tick{0};
  std::uint32_t latest_outgoing_transfer_tick{0};

  std::int64_t balance() const { return incoming_amount - outgoing_amount; }

  void write(ByteWriter& w) const;
  static EntityRecord read(ByteReader& r);
};

struct EntityInfo {
  static constexpr MessageType kType = MessageType::RespondEntity;
  static constexpr std::size_t kSize = EntityRecord::kSize + 8 + kSpectrumDepth * kDigestLen;

  EntityRecord entity;
  std::uint32_t tick{0};
  std::int32_t spectrum_index{0};
  std::array<Digest, kSpectrumDepth> siblings{};

  void write(ByteWriter& w) const;
  static EntityInfo read(ByteReader& r);
};

// ------------------------------ Ticks ------------------------------

struct TickRequest {
  static constexpr std::size_t kSize = 4;

  std::uint32_t tick{0};

  void write(ByteWriter& w) const { w.u32(tick); }
  static TickRequest read(ByteReader& r) { return TickRequest{r.u32()}; }
};

// A set bit asks the node NOT to send the transaction at that index.
struct TickTransactionsRequest {
  static constexpr std::size_t kSize = 4 + kNumberOfTransactionsPerTick / 8;

  std::uint32_t tick{0};
  std::array<std::uint8_t, kNumberOfTransactionsPerTick / 8> transaction_flags{};

  void write(ByteWriter& w) const;
  static TickTransactionsRequest read(ByteReader& r);
};

struct QuorumTickRequest {
  static constexpr std::size_t kSize = 4 + (kNumberOfComputors + 7) / 8;

  std::uint32_t tick{0};
  std::array<std::uint8_t, (kNumberOfComputors + 7) / 8> vote_flags{};

  void write(ByteWriter& w) const;
  static QuorumTickRequest read(ByteReader& r);
};

struct TickData {
  static constexpr MessageType kType = MessageType::BroadcastFutureTickData;
  static constexpr std::size_t kSize = 16 + kDigestLen +
                                       kNumberOfTransactionsPerTick * kDigestLen +
                                       kNumberOfTransactionsPerTick * 8 + kSignatureLen;

  std::uint16_t computor_index{0};
  std::uint16_t epoch{0};
  std::uint32_t tick{0};
  std::uint16_t millisecond{0};
  std::uint8_t second{0};
  std::uint8_t minute{0};
  std::uint8_t hour{0};
  std::uint8_t day{0};
  std::uint8_t month{0};
  std::uint8_t year{0};
  Digest timelock{};
  std::vector<Digest> transaction_digests = std::vector<Digest>(kNumberOfTransactionsPerTick);
  std::vector<std::int64_t> contract_fees = std::vector<std::int64_t>(kNumberOfTransactionsPerTick);
  Signature signature{};

  std::size_t transaction_count() const;

  void write(ByteWriter& w) const;
  static TickData read(ByteReader& r);
};

struct QuorumTickVote {
  static constexpr MessageType kType = MessageType::RespondQuorumTick;
  static constexpr std::size_t kSize = 16 + 16 + 8 * kDigestLen + kSignatureLen;

  std::uint16_t computor_index{0};
  std::uint16_t epoch{0};
  std::uint32_t tick{0};
  std::uint16_t millisecond{0};
  std::uint8_t second{0};
  std::uint8_t minute{0};
  std::uint8_t hour{0};
  std::uint8_t day{0};
  std::uint8_t month{0};
  std::uint8_t year{0};

  std::uint32_t previous_resource_testing_digest{0};
  std::uint32_t salted_resource_testing_digest{0};
  std::uint32_t previous_transaction_body_digest{0};
  std::uint32_t salted_transaction_body_digest{0};

  Digest previous_spectrum_digest{};
  Digest previous_universe_digest{};
  Digest previous_computer_digest{};
  Digest salted_spectrum_digest{};
  Digest salted_universe_digest{};
  Digest salted_computer_digest{};
  Digest transaction_digest{};
  Digest expected_next_tick_transaction_digest{};

  Signature signature{};

  void write(ByteWriter& w) const;
  static QuorumTickVote read(ByteReader& r);
};

struct Computors {
  static constexpr MessageType kType = MessageType::BroadcastComputors;
  static constexpr std::size_t kSize = 2 + kNumberOfComputors * kPublicKeyLen + kSignatureLen;

  std::uint16_t epoch{0};
  std::vector<PublicKey> public_keys = std::vector<PublicKey>(kNumberOfComputors);
  Signature signature{};

  void write(ByteWriter& w) const;
  static Computors read(ByteReader& r);
};

// Variable size: the digest list length is carried in tx_count.
struct TransactionStatus {
  static constexpr MessageType kType = MessageType::RespondTxStatus;
  static constexpr std::size_t kMinSize = 12 + (kNumberOfTransactionsPerTick + 7) / 8;

  std::uint32_t current_tick_of_node{0};
  std::uint32_t tick{0};
  std::array<std::uint8_t, (kNumberOfTransactionsPerTick + 7) / 8> money_flew{};
  std::vector<Digest> transaction_digests;

  void write(ByteWriter& w) const;
  static TransactionStatus read(ByteReader& r);
};

// ------------------------------ Contracts ------------------------------

struct ContractFunctionRequest {
  static constexpr std::size_t kHeaderSize = 8;

  std::uint32_t contract_index{0};
  std::uint16_t input_type{0};
  Bytes input;

  void write(ByteWriter& w) const;
  static ContractFunctionRequest read(ByteReader& r);
};

} // namespace qwire
