#include <catch2/catch.hpp>

#include "qwire/connection.hpp"
#include "qwire/errors.hpp"

#include "test_util.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace qwire {

using namespace std::chrono_literals;

TEST_CASE("Connection lifecycle") {
  auto wire = std::make_shared<test::FakeWire>();
  Connection conn(std::make_unique<test::FakeTransport>(wire));

  CHECK_FALSE(conn.is_open());
  CHECK_THROWS_AS(conn.send(make_message(MessageType::RequestSystemInfo, 1, {}), test::soon()),
                  PreconditionError);

  conn.connect("fake", 1, 1s);
  CHECK(conn.is_open());
  CHECK_THROWS_AS(conn.connect("fake", 1, 1s), PreconditionError);

  conn.send(make_message(MessageType::RequestSystemInfo, 1, {}), test::soon());
  CHECK(wire->writes == 1);
  CHECK(wire->sent.size() == kHeaderSize);

  conn.close();
  conn.close();
  CHECK_FALSE(conn.is_open());
  CHECK(wire->closes == 1);
  CHECK_THROWS_AS(conn.send(make_message(MessageType::RequestSystemInfo, 2, {}), test::soon()),
                  ConnectionClosed);
  CHECK_THROWS_AS(conn.receive_one_message(test::soon()), ConnectionClosed);
}

TEST_CASE("Socket is released once on teardown") {
  auto wire = std::make_shared<test::FakeWire>();
  {
    auto conn = test::fake_connection(wire);
    conn->close();
  }
  CHECK(wire->closes == 1);

  auto wire2 = std::make_shared<test::FakeWire>();
  { auto conn = test::fake_connection(wire2); }
  CHECK(wire2->closes == 1);
}

TEST_CASE("Timeout before the first byte keeps the connection") {
  auto wire = std::make_shared<test::FakeWire>();
  auto conn = test::fake_connection(wire);

  CHECK_THROWS_AS(conn->receive_one_message(deadline_after(10ms)), Timeout);
  CHECK(conn->is_open());
  CHECK(wire->closes == 0);

  wire->push(make_message(MessageType::EndResponse, 4, {}));
  CHECK(conn->receive_one_message(test::soon()).dejavu() == 4);
}

TEST_CASE("Failures mid-frame release the socket") {
  auto wire = std::make_shared<test::FakeWire>();
  auto conn = test::fake_connection(wire);

  SECTION("truncated body") {
    Bytes frame = encode_message(make_message(MessageType::RespondEntity, 1, Bytes(16, 1)));
    frame.resize(frame.size() - 4);
    wire->inbound = frame;
    CHECK_THROWS_AS(conn->receive_one_message(test::soon()), Timeout);
  }

  SECTION("header below its own size") {
    wire->inbound = {0x04, 0x00, 0x00, 0x23, 0x01, 0x00, 0x00, 0x00};
    CHECK_THROWS_AS(conn->receive_one_message(test::soon()), MalformedMessage);
  }

  CHECK_FALSE(conn->is_open());
  CHECK(wire->closes == 1);
  CHECK_THROWS_AS(conn->receive_one_message(test::soon()), ConnectionClosed);
  conn->close();
  CHECK(wire->closes == 1);
}

TEST_CASE("Connect failures") {
  std::uint16_t port = 0;
  {
    TcpTransport listener;
    port = listener.listen("127.0.0.1", 0);
  }
  Connection conn(std::make_unique<TcpTransport>());
  CHECK_THROWS_AS(conn.connect("127.0.0.1", port, 2s), ConnectionError);
  CHECK_FALSE(conn.is_open());
  CHECK_THROWS_AS(conn.receive_one_message(test::soon()), ConnectionClosed);
}

TEST_CASE("Peer close surfaces as ConnectionClosed") {
  test::StubNode node([](TcpTransport& t) {
    test::expect_request(t, MessageType::RequestCurrentTickInfo);
    t.close();
  });

  Connection conn(std::make_unique<TcpTransport>());
  conn.connect("127.0.0.1", node.port(), 2s);
  conn.send(make_message(MessageType::RequestCurrentTickInfo, 1, {}), test::soon());
  CHECK_THROWS_AS(conn.receive_one_message(test::soon()), ConnectionClosed);
  CHECK_FALSE(conn.is_open());
  node.join();
}

TEST_CASE("Round trip over loopback") {
  test::StubNode node([](TcpTransport& t) {
    WireMessage req = test::expect_request(t, MessageType::RequestCurrentTickInfo);
    TickInfo ti;
    ti.tick = 321;
    send_msg(t, make_message(req.dejavu(), ti), test::soon());
    test::drain_until_closed(t);
  });

  Connection conn(std::make_unique<TcpTransport>());
  conn.connect("127.0.0.1", node.port(), 2s);
  conn.send(make_message(MessageType::RequestCurrentTickInfo, 77, {}), test::soon());
  const WireMessage reply = conn.receive_one_message(test::soon());
  CHECK(reply.dejavu() == 77);
  CHECK(decode_body<TickInfo>(reply).tick == 321);
  conn.close();
  node.join();
}

TEST_CASE("Concurrent close wakes a blocked reader") {
  test::StubNode node([](TcpTransport& t) { test::drain_until_closed(t); });

  Connection conn(std::make_unique<TcpTransport>());
  conn.connect("127.0.0.1", node.port(), 2s);

  std::atomic<bool> closed_error{false};
  std::atomic<bool> other_error{false};
  const auto start = Clock::now();
  std::thread reader([&] {
    try {
      conn.receive_one_message(test::soon());
    } catch (const ConnectionClosed&) {
      closed_error = true;
    } catch (const Error&) {
      other_error = true;
    }
  });

  std::this_thread::sleep_for(100ms);
  conn.close();
  reader.join();

  CHECK(closed_error.load());
  CHECK_FALSE(other_error.load());
  CHECK(Clock::now() - start < 4s);
  node.join();
}

TEST_CASE("Close racing a peer disconnect releases the socket once") {
  for (int round = 0; round < 50; ++round) {
    test::StubNode node([](TcpTransport& t) { t.close(); });

    Connection conn(std::make_unique<TcpTransport>());
    conn.connect("127.0.0.1", node.port(), 2s);

    std::atomic<bool> closed_error{false};
    std::atomic<bool> other_error{false};
    std::thread reader([&] {
      try {
        conn.receive_one_message(test::soon());
      } catch (const ConnectionClosed&) {
        closed_error = true;
      } catch (const Error&) {
        other_error = true;
      }
    });

    if (round % 2) std::this_thread::yield();
    conn.close();
    reader.join();
    node.join();

    CHECK(closed_error.load());
    CHECK_FALSE(other_error.load());
    CHECK_FALSE(conn.is_open());
  }
}

TEST_CASE("Transport shutdown after close is a no-op") {
  test::StubNode node([](TcpTransport& t) { test::drain_until_closed(t); });

  TcpTransport t;
  t.connect("127.0.0.1", node.port(), test::soon());
  t.close();
  t.shutdown();
  t.close();
  CHECK_THROWS_AS(t.recv_all(nullptr, 1, test::soon()), ConnectionClosed);
  node.join();
}

} // namespace qwire
