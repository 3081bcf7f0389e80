#include <catch2/catch.hpp>

#include "qwire/engine.hpp"
#include "qwire/errors.hpp"
#include "qwire/signer.hpp"
#include "qwire/util.hpp"

#include "test_util.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace qwire {

using namespace std::chrono_literals;

static constexpr int kWorkers = 2;
static constexpr int kRequestsPerWorker = 20;

static void reply_tick(ITransport& t, std::uint32_t tick) {
  WireMessage req = test::expect_request(t, MessageType::RequestCurrentTickInfo);
  TickInfo ti;
  ti.tick = tick;
  send_msg(t, make_message(req.dejavu(), ti), test::soon());
}

static Transaction signed_transfer(const KeyPair& key, std::int64_t amount, std::uint32_t tick) {
  PublicKey dst{};
  dst.fill(0x33);
  Transaction tx = TransactionBuilder()
                       .source(key.public_identity())
                       .destination(dst)
                       .amount(amount)
                       .tick(tick)
                       .build();
  sign_transaction(tx, key);
  return tx;
}

TEST_CASE("Tick info from a stub node") {
  std::uint32_t seen_dejavu = 0;
  test::StubNode node([&seen_dejavu](TcpTransport& t) {
    WireMessage req = test::expect_request(t, MessageType::RequestCurrentTickInfo);
    seen_dejavu = req.dejavu();
    TickInfo ti;
    ti.tick = 12345678;
    ti.epoch = 150;
    send_msg(t, make_message(req.dejavu(), ti), test::soon());
    test::drain_until_closed(t);
  });

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 2s));
  const TickInfo ti = engine->get_tick_info();
  engine->close();
  node.join();

  TickInfo expected;
  expected.tick = 12345678;
  expected.epoch = 150;
  CHECK(ti == expected);
  CHECK(seen_dejavu != 0);
}

TEST_CASE("Broadcast sends the signed transaction with dejavu 0") {
  WireMessage recorded;
  test::StubNode node([&recorded](TcpTransport& t) {
    recorded = recv_msg(t, test::soon());
    test::drain_until_closed(t);
  });

  auto key = Ed25519KeyPair::generate();
  const Transaction tx = signed_transfer(*key, 1000, 999);

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 2s));
  engine->broadcast_transaction(tx);
  engine->close();
  node.join();

  CHECK(recorded.type() == MessageType::BroadcastTransaction);
  CHECK(recorded.dejavu() == 0);
  CHECK(recorded.header.size == kHeaderSize + tx.wire_size());

  const Transaction back = parse<Transaction>(recorded.body);
  CHECK(back.state() == Transaction::State::Signed);
  CHECK(back.source() == tx.source());
  CHECK(back.destination() == tx.destination());
  CHECK(back.amount() == 1000);
  CHECK(back.tick() == 999);
  CHECK(back.signature() == tx.signature());
  CHECK(verify_transaction(back));
}

TEST_CASE("Broadcast preconditions are checked before any write") {
  auto wire = std::make_shared<test::FakeWire>();
  ProtocolEngine engine(test::fake_connection(wire), 1s);
  auto key = Ed25519KeyPair::generate();

  SECTION("unsigned") {
    const Transaction tx = TransactionBuilder().amount(1000).tick(999).build();
    CHECK_THROWS_AS(engine.broadcast_transaction(tx), PreconditionError);
    CHECK_THROWS_AS(engine.send_raw_transaction(serialize(tx)), PreconditionError);
  }

  SECTION("negative amount") {
    CHECK_THROWS_AS(engine.broadcast_transaction(signed_transfer(*key, -1, 5)), PreconditionError);
  }

  SECTION("garbage raw bytes") {
    CHECK_THROWS_AS(engine.send_raw_transaction(Bytes(10, 0x01)), MalformedMessage);
  }

  CHECK(wire->writes == 0);
  CHECK(engine.is_open());
}

TEST_CASE("Raw transactions are sent unchanged") {
  auto wire = std::make_shared<test::FakeWire>();
  ProtocolEngine engine(test::fake_connection(wire), 1s);
  auto key = Ed25519KeyPair::generate();
  const Bytes raw = serialize(signed_transfer(*key, 7, 8));

  engine.send_raw_transaction(raw);
  REQUIRE(wire->writes == 1);
  CHECK(Bytes(wire->sent.begin() + kHeaderSize, wire->sent.end()) == raw);
  CHECK(to_hex(Bytes(wire->sent.begin() + 3, wire->sent.begin() + 8)) == "1800000000");
}

TEST_CASE("Request timeout keeps the connection usable") {
  test::StubNode node([](TcpTransport& t) {
    test::expect_request(t, MessageType::RequestSystemInfo);
    reply_tick(t, 9);
    test::drain_until_closed(t);
  });

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 300ms));
  const auto start = Clock::now();
  CHECK_THROWS_AS(engine->get_system_info(), Timeout);
  const auto elapsed = Clock::now() - start;
  CHECK(elapsed >= 250ms);
  CHECK(elapsed < 2s);

  CHECK(engine->is_open());
  CHECK(engine->get_tick_info().tick == 9);
  engine->close();
  node.join();
}

TEST_CASE("Late responses go to the side channel") {
  test::StubNode node([](TcpTransport& t) {
    WireMessage late = test::expect_request(t, MessageType::RequestSystemInfo);
    std::this_thread::sleep_for(300ms);
    send_msg(t, make_message(late.dejavu(), SystemInfo{}), test::soon());
    reply_tick(t, 11);
    test::drain_until_closed(t);
  });

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 2s));
  std::vector<MessageType> side;
  engine->set_unsolicited_handler([&side](const WireMessage& msg) { side.push_back(msg.type()); });

  CHECK_THROWS_AS(engine->request(MessageType::RequestSystemInfo, {}, ResponseMode::Single, 100ms),
                  Timeout);
  CHECK(engine->get_tick_info().tick == 11);
  CHECK(engine->unsolicited_count() == 1);
  REQUIRE(side.size() == 1);
  CHECK(side[0] == MessageType::RespondSystemInfo);
  engine->close();
  node.join();
}

TEST_CASE("Peer lists learned from unsolicited messages") {
  test::StubNode node([](TcpTransport& t) {
    WireMessage req = test::expect_request(t, MessageType::RequestCurrentTickInfo);
    PublicPeers peers;
    peers.peers[0] = {10, 0, 0, 1};
    peers.peers[1] = {10, 0, 0, 2};
    send_msg(t, make_message(0, peers), test::soon());
    TickInfo ti;
    ti.tick = 3;
    send_msg(t, make_message(req.dejavu(), ti), test::soon());
    test::drain_until_closed(t);
  });

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 2s));
  CHECK(engine->get_tick_info().tick == 3);
  CHECK(engine->unsolicited_count() == 1);
  CHECK(engine->known_peers() == std::vector<std::string>{"10.0.0.1", "10.0.0.2"});
  engine->close();
  node.join();
}

TEST_CASE("Unsolicited handler may issue requests") {
  test::StubNode node([](TcpTransport& t) {
    WireMessage req = test::expect_request(t, MessageType::RequestCurrentTickInfo);
    PublicPeers peers;
    peers.peers[0] = {10, 0, 0, 7};
    send_msg(t, make_message(0, peers), test::soon());
    TickInfo ti;
    ti.tick = 3;
    send_msg(t, make_message(req.dejavu(), ti), test::soon());
    reply_tick(t, 4);
    test::drain_until_closed(t);
  });

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 300ms));
  std::vector<std::uint32_t> nested;
  engine->set_unsolicited_handler([&](const WireMessage& msg) {
    if (msg.type() == MessageType::ExchangePublicPeers)
      nested.push_back(engine->get_tick_info().tick);
  });

  CHECK(engine->get_tick_info().tick == 3);
  REQUIRE(nested.size() == 1);
  CHECK(nested[0] == 4);
  CHECK(engine->known_peers() == std::vector<std::string>{"10.0.0.7"});
  engine->close();
  node.join();
}

TEST_CASE("Concurrent callers receive their own responses") {
  test::StubNode node([](TcpTransport& t) {
    for (int i = 0; i < kWorkers * kRequestsPerWorker; ++i) {
      WireMessage req = test::expect_request(t, MessageType::RequestContractFunction);
      const ContractFunctionRequest cf = parse<ContractFunctionRequest>(req.body);
      std::uint32_t other = req.dejavu() ^ 0x5A5A5A5Au;
      if (other == 0) other = 1;
      send_msg(t, make_message(MessageType::RespondContractFunction, other, Bytes{0xFF}),
               test::soon());
      send_msg(t, make_message(MessageType::RespondContractFunction, req.dejavu(), cf.input),
               test::soon());
    }
    test::drain_until_closed(t);
  });

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 5s));
  std::atomic<int> mismatches{0};
  std::atomic<int> failures{0};
  auto worker = [&](std::uint8_t id) {
    for (int i = 0; i < kRequestsPerWorker; ++i) {
      const Bytes input{id, (std::uint8_t)i, 0x5A};
      try {
        const auto out = engine->query_smart_contract(1, 7, input);
        if (!out || *out != input) ++mismatches;
      } catch (const Error&) {
        ++failures;
      }
    }
  };

  std::thread a(worker, (std::uint8_t)1);
  std::thread b(worker, (std::uint8_t)2);
  a.join();
  b.join();
  engine->close();
  node.join();

  CHECK(mismatches.load() == 0);
  CHECK(failures.load() == 0);
  CHECK(engine->unsolicited_count() == (std::uint64_t)(kWorkers * kRequestsPerWorker));
}

TEST_CASE("Waiting for a busy request slot times out") {
  test::StubNode node([](TcpTransport& t) {
    WireMessage req = test::expect_request(t, MessageType::RequestSystemInfo);
    std::this_thread::sleep_for(600ms);
    send_msg(t, make_message(req.dejavu(), SystemInfo{}), test::soon());
    test::drain_until_closed(t);
  });

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 3s));
  std::atomic<bool> first_ok{false};
  std::thread first([&] {
    try {
      engine->get_system_info();
      first_ok = true;
    } catch (const Error&) {
    }
  });

  std::this_thread::sleep_for(100ms);
  const auto start = Clock::now();
  CHECK_THROWS_AS(
      engine->request(MessageType::RequestCurrentTickInfo, {}, ResponseMode::Single, 100ms),
      Timeout);
  CHECK(Clock::now() - start < 450ms);

  first.join();
  CHECK(first_ok.load());
  engine->close();
  node.join();
}

TEST_CASE("Owned assets stream until END_RESPONSE") {
  PublicKey owner{};
  owner.fill(0x07);
  Bytes request_body;
  test::StubNode node([&request_body](TcpTransport& t) {
    WireMessage req = test::expect_request(t, MessageType::RequestOwnedAssets);
    request_body = req.body;

    OwnedAsset qx;
    qx.issuance.name = "QX";
    qx.ownership.number_of_units = 10;
    OwnedAsset random;
    random.issuance.name = "RANDOM";
    random.ownership.number_of_units = 20;

    send_msg(t, make_message(req.dejavu(), qx), test::soon());
    send_msg(t, make_message(0, PublicPeers{}), test::soon());
    send_msg(t, make_message(req.dejavu(), random), test::soon());
    send_msg(t, make_message(MessageType::EndResponse, req.dejavu(), {}), test::soon());
    test::drain_until_closed(t);
  });

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 2s));
  const std::vector<OwnedAsset> assets = engine->get_assets(owner);
  engine->close();
  node.join();

  CHECK(request_body == Bytes(owner.begin(), owner.end()));
  REQUIRE(assets.size() == 2);
  CHECK(assets[0].asset_name() == "QX");
  CHECK(assets[0].quantity() == 10);
  CHECK(assets[1].asset_name() == "RANDOM");
  CHECK(assets[1].quantity() == 20);
  CHECK(engine->unsolicited_count() == 1);
}

TEST_CASE("Future ticks are rejected") {
  std::vector<MessageType> seen;
  test::StubNode node([&seen](TcpTransport& t) {
    reply_tick(t, 100);
    reply_tick(t, 100);
    try {
      for (;;) seen.push_back(recv_msg(t, test::soon()).type());
    } catch (const ConnectionClosed&) {
    }
  });

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 2s));
  CHECK_THROWS_AS(engine->get_tick_data(101), PreconditionError);
  CHECK_THROWS_AS(engine->get_quorum_votes(101), PreconditionError);
  CHECK(engine->is_open());
  engine->close();
  node.join();
  CHECK(seen.empty());
}

TEST_CASE("Tick transactions skip empty digest slots") {
  auto key = Ed25519KeyPair::generate();
  const Transaction tx1 = signed_transfer(*key, 1, 50);
  const Transaction tx2 = signed_transfer(*key, 2, 50);

  Bytes flags_request;
  test::StubNode node([&](TcpTransport& t) {
    reply_tick(t, 100);

    WireMessage req = test::expect_request(t, MessageType::RequestTickData);
    TickData td;
    td.tick = parse<TickRequest>(req.body).tick;
    td.transaction_digests[0].fill(0x11);
    td.transaction_digests[1].fill(0x22);
    send_msg(t, make_message(req.dejavu(), td), test::soon());

    req = test::expect_request(t, MessageType::RequestTickTransactions);
    flags_request = req.body;
    send_msg(t, make_message(req.dejavu(), tx1), test::soon());
    send_msg(t, make_message(req.dejavu(), tx2), test::soon());
    send_msg(t, make_message(MessageType::EndResponse, req.dejavu(), {}), test::soon());
    test::drain_until_closed(t);
  });

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 2s));
  const std::vector<Transaction> txs = engine->get_tick_transactions(50);
  engine->close();
  node.join();

  REQUIRE(txs.size() == 2);
  CHECK(txs[0].amount() == 1);
  CHECK(txs[1].amount() == 2);
  CHECK(verify_transaction(txs[1]));

  const TickTransactionsRequest sent = parse<TickTransactionsRequest>(flags_request);
  CHECK(sent.tick == 50);
  CHECK(sent.transaction_flags[0] == 0xFC);
  for (std::size_t i = 1; i < sent.transaction_flags.size(); ++i)
    CHECK(sent.transaction_flags[i] == 0xFF);
}

TEST_CASE("Empty and unexpected responses") {
  test::StubNode node([](TcpTransport& t) {
    WireMessage req = test::expect_request(t, MessageType::RequestEntity);
    send_msg(t, make_message(MessageType::EndResponse, req.dejavu(), {}), test::soon());

    req = test::expect_request(t, MessageType::RequestCurrentTickInfo);
    send_msg(t, make_message(req.dejavu(), SystemInfo{}), test::soon());

    req = test::expect_request(t, MessageType::RequestTxStatus);
    TransactionStatus ts;
    ts.tick = 42;
    ts.transaction_digests.resize(3);
    send_msg(t, make_message(TransactionStatus::kType, req.dejavu(), serialize(ts)),
             test::soon());
    test::drain_until_closed(t);
  });

  auto engine = ProtocolEngine::connect(test::loopback(node.port(), 2s));
  CHECK_FALSE(engine->get_entity(PublicKey{}).has_value());
  CHECK_THROWS_AS(engine->get_tick_info(), MalformedMessage);
  CHECK(engine->is_open());

  const auto status = engine->get_transaction_status(42);
  REQUIRE(status.has_value());
  CHECK(status->tick == 42);
  CHECK(status->transaction_digests.size() == 3);
  engine->close();
  node.join();
}

TEST_CASE("Asset filter requests") {
  auto wire = std::make_shared<test::FakeWire>();
  ProtocolEngine engine(test::fake_connection(wire), 10ms);

  SECTION("issuer and name are required for ownerships") {
    AssetFilter filter;
    filter.asset_name = "QX";
    CHECK_THROWS_AS(engine.get_asset_ownerships(filter), PreconditionError);
    filter.issuer.fill(1);
    filter.asset_name.clear();
    CHECK_THROWS_AS(engine.get_asset_possessions(filter), PreconditionError);
    CHECK(wire->writes == 0);
  }

  SECTION("issuance wildcard flags") {
    CHECK_THROWS_AS(engine.get_asset_issuances(std::nullopt, ""), Timeout);
    REQUIRE(wire->sent.size() == kHeaderSize + AssetsByFilterRequest::kSize);
    CHECK(wire->sent[3] == (std::uint8_t)MessageType::RequestAssets);
    const auto req = parse<AssetsByFilterRequest>(Bytes(wire->sent.begin() + kHeaderSize,
                                                        wire->sent.end()));
    CHECK(req.kind == AssetRecordKind::Issuance);
    CHECK(req.flags == (asset_flags::kAnyIssuer | asset_flags::kAnyAssetName));
  }

  SECTION("ownership filter flags") {
    AssetFilter filter;
    filter.issuer.fill(1);
    filter.asset_name = "QX";
    filter.owner.managing_contract = 1;
    filter.possessor.managing_contract = 5;
    CHECK_THROWS_AS(engine.get_asset_ownerships(filter), Timeout);
    const auto req = parse<AssetsByFilterRequest>(Bytes(wire->sent.begin() + kHeaderSize,
                                                        wire->sent.end()));
    CHECK(req.kind == AssetRecordKind::Ownership);
    CHECK(req.flags == (asset_flags::kAnyOwner | asset_flags::kAnyPossessor |
                        asset_flags::kAnyPossessorContract));
    CHECK(req.ownership_managing_contract == 1);
    CHECK(req.possession_managing_contract == 0);
    CHECK(req.asset_name == "QX");
  }

  SECTION("universe index") {
    CHECK_THROWS_AS(engine.get_asset_possessions_by_universe_index(12), Timeout);
    const auto req = parse<AssetsByUniverseIndexRequest>(
        Bytes(wire->sent.begin() + kHeaderSize, wire->sent.end()));
    CHECK(req.universe_index == 12);
  }
}

TEST_CASE("Requests after close fail") {
  auto wire = std::make_shared<test::FakeWire>();
  ProtocolEngine engine(test::fake_connection(wire), 1s);
  engine.close();
  CHECK_FALSE(engine.is_open());
  CHECK_THROWS_AS(engine.get_tick_info(), ConnectionClosed);
  CHECK(wire->writes == 0);
}

} // namespace qwire
