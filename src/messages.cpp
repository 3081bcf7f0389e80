#include "qwire/messages.hpp"
#include "qwire/errors.hpp"
#include "qwire/util.hpp"

#include <string>

namespace qwire {

const char* message_type_name(MessageType type) {
  switch (type) {
    case MessageType::ExchangePublicPeers: return "EXCHANGE_PUBLIC_PEERS";
    case MessageType::BroadcastComputors: return "BROADCAST_COMPUTORS";
    case MessageType::RespondQuorumTick: return "RESPOND_QUORUM_TICK";
    case MessageType::BroadcastFutureTickData: return "BROADCAST_FUTURE_TICK_DATA";
    case MessageType::RequestComputors: return "REQUEST_COMPUTORS";
    case MessageType::RequestQuorumTick: return "REQUEST_QUORUM_TICK";
    case MessageType::RequestTickData: return "REQUEST_TICK_DATA";
    case MessageType::BroadcastTransaction: return "BROADCAST_TRANSACTION";
    case MessageType::RequestCurrentTickInfo: return "REQUEST_CURRENT_TICK_INFO";
    case MessageType::RespondCurrentTickInfo: return "RESPOND_CURRENT_TICK_INFO";
    case MessageType::RequestTickTransactions: return "REQUEST_TICK_TRANSACTIONS";
    case MessageType::RequestEntity: return "REQUEST_ENTITY";
    case MessageType::RespondEntity: return "RESPOND_ENTITY";
    case MessageType::EndResponse: return "END_RESPONSE";
    case MessageType::RequestIssuedAssets: return "REQUEST_ISSUED_ASSETS";
    case MessageType::RespondIssuedAssets: return "RESPOND_ISSUED_ASSETS";
    case MessageType::RequestOwnedAssets: return "REQUEST_OWNED_ASSETS";
    case MessageType::RespondOwnedAssets: return "RESPOND_OWNED_ASSETS";
    case MessageType::RequestPossessedAssets: return "REQUEST_POSSESSED_ASSETS";
    case MessageType::RespondPossessedAssets: return "RESPOND_POSSESSED_ASSETS";
    case MessageType::RequestContractFunction: return "REQUEST_CONTRACT_FUNCTION";
    case MessageType::RespondContractFunction: return "RESPOND_CONTRACT_FUNCTION";
    case MessageType::RequestSystemInfo: return "REQUEST_SYSTEM_INFO";
    case MessageType::RespondSystemInfo: return "RESPOND_SYSTEM_INFO";
    case MessageType::RequestAssets: return "REQUEST_ASSETS";
    case MessageType::RespondAssets: return "RESPOND_ASSETS";
    case MessageType::RequestTxStatus: return "REQUEST_TX_STATUS";
    case MessageType::RespondTxStatus: return "RESPOND_TX_STATUS";
  }
  return "UNKNOWN";
}

bool is_known_message_type(std::uint8_t raw) {
  return std::string(message_type_name((MessageType)raw)) != "UNKNOWN";
}

// ------------------------------ Node state ------------------------------

std::vector<std::string> PublicPeers::addresses() const {
  std::vector<std::string> out;
  for (const auto& p : peers) {
    if (is_zero(p)) continue;
    out.push_back(std::to_string(p[0]) + "." + std::to_string(p[1]) + "." +
                  std::to_string(p[2]) + "." + std::to_string(p[3]));
  }
  return out;
}

void PublicPeers::write(ByteWriter& w) const {
  for (const auto& p : peers) w.fixed(p);
}

PublicPeers PublicPeers::read(ByteReader& r) {
  PublicPeers pp;
  for (auto& p : pp.peers) p = r.fixed<4>();
  return pp;
}

bool TickInfo::operator==(const TickInfo& o) const {
  return tick_duration == o.tick_duration && epoch == o.epoch && tick == o.tick &&
         number_of_aligned_votes == o.number_of_aligned_votes &&
         number_of_misaligned_votes == o.number_of_misaligned_votes &&
         initial_tick == o.initial_tick;
}

void TickInfo::write(ByteWriter& w) const {
  w.u16(tick_duration);
  w.u16(epoch);
  w.u32(tick);
  w.u16(number_of_aligned_votes);
  w.u16(number_of_misaligned_votes);
  w.u32(initial_tick);
}

TickInfo TickInfo::read(ByteReader& r) {
  TickInfo ti;
  ti.tick_duration = r.u16();
  ti.epoch = r.u16();
  ti.tick = r.u32();
  ti.number_of_aligned_votes = r.u16();
  ti.number_of_misaligned_votes = r.u16();
  ti.initial_tick = r.u32();
  return ti;
}

void SystemInfo::write(ByteWriter& w) const {
  w.i16(version);
  w.u16(epoch);
  w.u32(tick);
  w.u32(initial_tick);
  w.u32(latest_created_tick);
  w.u16(initial_millisecond);
  w.u8(initial_second);
  w.u8(initial_minute);
  w.u8(initial_hour);
  w.u8(initial_day);
  w.u8(initial_month);
  w.u8(initial_year);
  w.u32(number_of_entities);
  w.u32(number_of_transactions);
  w.fixed(random_mining_seed);
  w.i32(solution_threshold);
  w.u64(total_spectrum_amount);
  w.u64(current_entity_balance_dust_threshold);
  w.u32(target_tick_vote_signature);
  for (std::uint64_t v : reserve) w.u64(v);
}

SystemInfo SystemInfo::read(ByteReader& r) {
  SystemInfo si;
  si.version = r.i16();
  si.epoch = r.u16();
  si.tick = r.u32();
  si.initial_tick = r.u32();
  si.latest_created_tick = r.u32();
  si.initial_millisecond = r.u16();
  si.initial_second = r.u8();
  si.initial_minute = r.u8();
  si.initial_hour = r.u8();
  si.initial_day = r.u8();
  si.initial_month = r.u8();
  si.initial_year = r.u8();
  si.number_of_entities = r.u32();
  si.number_of_transactions = r.u32();
  si.random_mining_seed = r.fixed<kDigestLen>();
  si.solution_threshold = r.i32();
  si.total_spectrum_amount = r.u64();
  si.current_entity_balance_dust_threshold = r.u64();
  si.target_tick_vote_signature = r.u32();
  for (auto& v : si.reserve) v = r.u64();
  return si;
}

// ------------------------------ Assets ------------------------------

void IssuanceRecord::write(ByteWriter& w) const {
  w.fixed(public_key);
  w.u8(type);
  w.text(name, kAssetNameLen, "asset name");
  w.i8(number_of_decimal_places);
  w.text(unit_of_measurement, 7, "unit of measurement");
}

IssuanceRecord IssuanceRecord::read(ByteReader& r) {
  IssuanceRecord rec;
  rec.public_key = r.fixed<kPublicKeyLen>();
  rec.type = r.u8();
  rec.name = r.text(kAssetNameLen);
  rec.number_of_decimal_places = r.i8();
  rec.unit_of_measurement = r.text(7);
  return rec;
}

void OwnershipRecord::write(ByteWriter& w) const {
  w.fixed(public_key);
  w.u8(type);
  w.zeros(1);
  w.u16(managing_contract_index);
  w.u32(issuance_index);
  w.i64(number_of_units);
}

OwnershipRecord OwnershipRecord::read(ByteReader& r) {
  OwnershipRecord rec;
  rec.public_key = r.fixed<kPublicKeyLen>();
  rec.type = r.u8();
  r.skip(1);
  rec.managing_contract_index = r.u16();
  rec.issuance_index = r.u32();
  rec.number_of_units = r.i64();
  return rec;
}

void PossessionRecord::write(ByteWriter& w) const {
  w.fixed(public_key);
  w.u8(type);
  w.zeros(1);
  w.u16(managing_contract_index);
  w.u32(ownership_index);
  w.i64(number_of_units);
}

PossessionRecord PossessionRecord::read(ByteReader& r) {
  PossessionRecord rec;
  rec.public_key = r.fixed<kPublicKeyLen>();
  rec.type = r.u8();
  r.skip(1);
  rec.managing_contract_index = r.u16();
  rec.ownership_index = r.u32();
  rec.number_of_units = r.i64();
  return rec;
}

void AssetInfo::write(ByteWriter& w) const {
  w.u32(tick);
  w.u32(universe_index);
  for (const auto& s : siblings) w.fixed(s);
}

AssetInfo AssetInfo::read(ByteReader& r) {
  AssetInfo ai;
  ai.tick = r.u32();
  ai.universe_index = r.u32();
  for (auto& s : ai.siblings) s = r.fixed<kDigestLen>();
  return ai;
}

void IssuedAsset::write(ByteWriter& w) const {
  issuance.write(w);
  info.write(w);
}

IssuedAsset IssuedAsset::read(ByteReader& r) {
  IssuedAsset a;
  a.issuance = IssuanceRecord::read(r);
  a.info = AssetInfo::read(r);
  return a;
}

void OwnedAsset::write(ByteWriter& w) const {
  ownership.write(w);
  issuance.write(w);
  info.write(w);
}

OwnedAsset OwnedAsset::read(ByteReader& r) {
  OwnedAsset a;
  a.ownership = OwnershipRecord::read(r);
  a.issuance = IssuanceRecord::read(r);
  a.info = AssetInfo::read(r);
  return a;
}

void PossessedAsset::write(ByteWriter& w) const {
  possession.write(w);
  ownership.write(w);
  issuance.write(w);
  info.write(w);
}

PossessedAsset PossessedAsset::read(ByteReader& r) {
  PossessedAsset a;
  a.possession = PossessionRecord::read(r);
  a.ownership = OwnershipRecord::read(r);
  a.issuance = IssuanceRecord::read(r);
  a.info = AssetInfo::read(r);
  return a;
}

void AssetsByFilterRequest::write(ByteWriter& w) const {
  w.u16((std::uint16_t)kind);
  w.u16(flags);
  w.u16(ownership_managing_contract);
  w.u16(possession_managing_contract);
  w.fixed(issuer);
  w.text(asset_name, kFilterAssetNameLen, "asset name");
  w.fixed(owner);
  w.fixed(possessor);
}

AssetsByFilterRequest AssetsByFilterRequest::read(ByteReader& r) {
  AssetsByFilterRequest req;
  req.kind = (AssetRecordKind)r.u16();
  req.flags = r.u16();
  req.ownership_managing_contract = r.u16();
  req.possession_managing_contract = r.u16();
  req.issuer = r.fixed<kPublicKeyLen>();
  req.asset_name = r.text(kFilterAssetNameLen);
  req.owner = r.fixed<kPublicKeyLen>();
  req.possessor = r.fixed<kPublicKeyLen>();
  return req;
}

void AssetsByUniverseIndexRequest::write(ByteWriter& w) const {
  w.u16((std::uint16_t)AssetRecordKind::ByUniverseIndex);
  w.u16(0);
  w.u32(universe_index);
  w.zeros(kSize - 8);
}

AssetsByUniverseIndexRequest AssetsByUniverseIndexRequest::read(ByteReader& r) {
  ensure<MalformedMessage>(r.u16() == (std::uint16_t)AssetRecordKind::ByUniverseIndex,
                           "not a universe index request");
  r.skip(2);
  AssetsByUniverseIndexRequest req;
  req.universe_index = r.u32();
  r.skip(kSize - 8);
  return req;
}

// ------------------------------ Entities ------------------------------

void EntityRecord::write(ByteWriter& w) const {
  w.fixed(public_key);
  w.i64(incoming_amount);
  w.i64(outgoing_amount);
  w.u32(number_of_incoming_transfers);
  w.u32(number_of_outgoing_transfers);
  w.u32(latest_incoming_transfer_tick);
  w.u32(latest_outgoing_transfer_tick);
}

EntityRecord EntityRecord::read(ByteReader& r) {
  EntityRecord e;
  e.public_key = r.fixed<kPublicKeyLen>();
  e.incoming_amount = r.i64();
  e.outgoing_amount = r.i64();
  e.number_of_incoming_transfers = r.u32();
  e.number_of_outgoing_transfers = r.u32();
  e.latest_incoming_transfer_tick = r.u32();
  e.latest_outgoing_transfer_tick = r.u32();
  return e;
}

void EntityInfo::write(ByteWriter& w) const {
  entity.write(w);
  w.u32(tick);
  w.i32(spectrum_index);
  for (const auto& s : siblings) w.fixed(s);
}

EntityInfo EntityInfo::read(ByteReader& r) {
  EntityInfo ei;
  ei.entity = EntityRecord::read(r);
  ei.tick = r.u32();
  ei.spectrum_index = r.i32();
  for (auto& s : ei.siblings) s = r.fixed<kDigestLen>();
  return ei;
}

// ------------------------------ Ticks ------------------------------

void TickTransactionsRequest::write(ByteWriter& w) const {
  w.u32(tick);
  w.fixed(transaction_flags);
}

TickTransactionsRequest TickTransactionsRequest::read(ByteReader& r) {
  TickTransactionsRequest req;
  req.tick = r.u32();
  req.transaction_flags = r.fixed<kNumberOfTransactionsPerTick / 8>();
  return req;
}

void QuorumTickRequest::write(ByteWriter& w) const {
  w.u32(tick);
  w.fixed(vote_flags);
}

QuorumTickRequest QuorumTickRequest::read(ByteReader& r) {
  QuorumTickRequest req;
  req.tick = r.u32();
  req.vote_flags = r.fixed<(kNumberOfComputors + 7) / 8>();
  return req;
}

std::size_t TickData::transaction_count() const {
  std::size_t n = 0;
  for (const auto& d : transaction_digests) {
    if (!is_zero(d)) ++n;
  }
  return n;
}

void TickData::write(ByteWriter& w) const {
  ensure<FieldOverflow>(transaction_digests.size() == kNumberOfTransactionsPerTick,
                        "tick data needs exactly 1024 transaction digests");
  ensure<FieldOverflow>(contract_fees.size() == kNumberOfTransactionsPerTick,
                        "tick data needs exactly 1024 contract fees");
  w.u16(computor_index);
  w.u16(epoch);
  w.u32(tick);
  w.u16(millisecond);
  w.u8(second);
  w.u8(minute);
  w.u8(hour);
  w.u8(day);
  w.u8(month);
  w.u8(year);
  w.fixed(timelock);
  for (const auto& d : transaction_digests) w.fixed(d);
  for (std::int64_t fee : contract_fees) w.i64(fee);
  w.fixed(signature);
}

TickData TickData::read(ByteReader& r) {
  TickData td;
  td.computor_index = r.u16();
  td.epoch = r.u16();
  td.tick = r.u32();
  td.millisecond = r.u16();
  td.second = r.u8();
  td.minute = r.u8();
  td.hour = r.u8();
  td.day = r.u8();
  td.month = r.u8();
  td.year = r.u8();
  td.timelock = r.fixed<kDigestLen>();
  for (auto& d : td.transaction_digests) d = r.fixed<kDigestLen>();
  for (auto& fee : td.contract_fees) fee = r.i64();
  td.signature = r.fixed<kSignatureLen>();
  return td;
}

void QuorumTickVote::write(ByteWriter& w) const {
  w.u16(computor_index);
  w.u16(epoch);
  w.u32(tick);
  w.u16(millisecond);
  w.u8(second);
  w.u8(minute);
  w.u8(hour);
  w.u8(day);
  w.u8(month);
  w.u8(year);
  w.u32(previous_resource_testing_digest);
  w.u32(salted_resource_testing_digest);
  w.u32(previous_transaction_body_digest);
  w.u32(salted_transaction_body_digest);
  w.fixed(previous_spectrum_digest);
  w.fixed(previous_universe_digest);
  w.fixed(previous_computer_digest);
  w.fixed(salted_spectrum_digest);
  w.fixed(salted_universe_digest);
  w.fixed(salted_computer_digest);
  w.fixed(transaction_digest);
  w.fixed(expected_next_tick_transaction_digest);
  w.fixed(signature);
}

QuorumTickVote QuorumTickVote::read(ByteReader& r) {
  QuorumTickVote v;
  v.computor_index = r.u16();
  v.epoch = r.u16();
  v.tick = r.u32();
  v.millisecond = r.u16();
  v.second = r.u8();
  v.minute = r.u8();
  v.hour = r.u8();
  v.day = r.u8();
  v.month = r.u8();
  v.year = r.u8();
  v.previous_resource_testing_digest = r.u32();
  v.salted_resource_testing_digest = r.u32();
  v.previous_transaction_body_digest = r.u32();
  v.salted_transaction_body_digest = r.u32();
  v.previous_spectrum_digest = r.fixed<kDigestLen>();
  v.previous_universe_digest = r.fixed<kDigestLen>();
  v.previous_computer_digest = r.fixed<kDigestLen>();
  v.salted_spectrum_digest = r.fixed<kDigestLen>();
  v.salted_universe_digest = r.fixed<kDigestLen>();
  v.salted_computer_digest = r.fixed<kDigestLen>();
  v.transaction_digest = r.fixed<kDigestLen>();
  v.expected_next_tick_transaction_digest = r.fixed<kDigestLen>();
  v.signature = r.fixed<kSignatureLen>();
  return v;
}

void Computors::write(ByteWriter& w) const {
  ensure<FieldOverflow>(public_keys.size() == kNumberOfComputors,
                        "computor list needs exactly 676 public keys");
  w.u16(epoch);
  for (const auto& pk : public_keys) w.fixed(pk);
  w.fixed(signature);
}

Computors Computors::read(ByteReader& r) {
  Computors c;
  c.epoch = r.u16();
  for (auto& pk : c.public_keys) pk = r.fixed<kPublicKeyLen>();
  c.signature = r.fixed<kSignatureLen>();
  return c;
}

void TransactionStatus::write(ByteWriter& w) const {
  ensure<FieldOverflow>(transaction_digests.size() <= kNumberOfTransactionsPerTick,
                        "too many transaction digests");
  w.u32(current_tick_of_node);
  w.u32(tick);
  w.u32((std::uint32_t)transaction_digests.size());
  w.fixed(money_flew);
  for (const auto& d : transaction_digests) w.fixed(d);
}

TransactionStatus TransactionStatus::read(ByteReader& r) {
  TransactionStatus ts;
  ts.current_tick_of_node = r.u32();
  ts.tick = r.u32();
  const std::uint32_t count = r.u32();
  ts.money_flew = r.fixed<(kNumberOfTransactionsPerTick + 7) / 8>();
  ensure<MalformedMessage>(count <= kNumberOfTransactionsPerTick &&
                               r.remaining() == (std::size_t)count * kDigestLen,
                           "tx status digest count disagrees with body length");
  ts.transaction_digests.resize(count);
  for (auto& d : ts.transaction_digests) d = r.fixed<kDigestLen>();
  return ts;
}

// ------------------------------ Contracts ------------------------------

void ContractFunctionRequest::write(ByteWriter& w) const {
  ensure<FieldOverflow>(input.size() <= 0xFFFF, "contract function input exceeds 65535 bytes");
  w.u32(contract_index);
  w.u16(input_type);
  w.u16((std::uint16_t)input.size());
  w.raw(input);
}

ContractFunctionRequest ContractFunctionRequest::read(ByteReader& r) {
  ContractFunctionRequest req;
  req.contract_index = r.u32();
  req.input_type = r.u16();
  const std::uint16_t size = r.u16();
  ensure<MalformedMessage>(r.remaining() == size,
                           "contract function input size disagrees with body length");
  req.input = r.raw(size);
  return req;
}

} // namespace qwire
