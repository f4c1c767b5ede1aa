// tests/connection_test.cpp
// Synchronous-mode Connection against a loopback fake remote.

#include <gtest/gtest.h>
#include "fake_remote.hpp"
#include "stk/connection.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace stk {
namespace {

using testing::FakeRemote;
using testing::Peer;
using testing::sync_frame;

ConnectConfigBuilder test_config(uint16_t port) {
    return ConnectConfig::builder()
        .host("127.0.0.1")
        .port(port)
        .connect_attempts(3)
        .connect_retry_delay(std::chrono::milliseconds(10))
        .read_timeout(std::chrono::milliseconds(100));
}

// ACK every command until the client hangs up.
void ack_everything(Peer& peer) {
    while (peer.read_line()) peer.write("ACK");
}

// ==================== Lifecycle ====================

TEST(ConnectionTest, ConnectAndClose) {
    FakeRemote remote(ack_everything);
    auto conn = Connection::create(test_config(remote.port()).build());
    EXPECT_FALSE(conn->is_connected());
    EXPECT_EQ(conn->mode(), MessagingMode::Sync);

    conn->connect();
    EXPECT_TRUE(conn->is_connected());
    EXPECT_EQ(conn->connect_attempts_used(), 1u);

    conn->close();
    conn->close();
    EXPECT_FALSE(conn->is_connected());
    remote.join();

    // Synchronous mode sends no handshake with acks enabled.
    EXPECT_TRUE(remote.commands().empty());
}

TEST(ConnectionTest, ConnectTwiceIsNoOp) {
    FakeRemote remote(ack_everything);
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();
    conn->connect();
    EXPECT_TRUE(conn->is_connected());
    conn->disconnect();
}

TEST(ConnectionTest, DestructorClosesSocket) {
    FakeRemote remote(ack_everything);
    {
        auto conn = Connection::create(test_config(remote.port()).build());
        conn->connect();
        conn->send("Unload / *");
    }
    // The remote sees EOF only if the socket was released.
    remote.join();
    EXPECT_EQ(remote.commands().size(), 1u);
}

TEST(ConnectionTest, ConnectFailsWithConnectError) {
    auto conn = Connection::create(test_config(testing::unused_port()).connect_attempts(2).build());
    try {
        conn->connect();
        FAIL() << "expected StkError";
    } catch (const StkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Connect);
    }
    EXPECT_FALSE(conn->is_connected());
}

TEST(ConnectionTest, AckOffHandshake) {
    FakeRemote remote([](Peer& peer) {
        while (peer.read_line()) {
        }
    });
    auto conn = Connection::create(test_config(remote.port()).ack(false).build());
    conn->connect();
    conn->send("New / Scenario Demo");
    conn->close();
    remote.join();

    auto commands = remote.commands();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0], "ConControl / AckOff");
    EXPECT_EQ(commands[1], "New / Scenario Demo");
}

TEST(ConnectionTest, SetEndpointWhileConnectedRejected) {
    FakeRemote remote(ack_everything);
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();
    Endpoint other;
    other.host = "127.0.0.1";
    other.port = 6001;
    EXPECT_THROW(conn->set_endpoint(other), StkError);
    conn->close();
    conn->set_endpoint(other);
    EXPECT_EQ(conn->endpoint(), other);
}

TEST(ConnectionTest, SendWhenClosed) {
    auto conn = Connection::create(test_config(5001).build());
    try {
        conn->send("Unload / *");
        FAIL() << "expected StkError";
    } catch (const StkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Closed);
    }
}

// ==================== Send / ACK ====================

TEST(ConnectionTest, SendAcknowledged) {
    FakeRemote remote(ack_everything);
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();
    EXPECT_NO_THROW(conn->send("New / Scenario Demo"));
    conn->close();
    remote.join();

    auto commands = remote.commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], "New / Scenario Demo");
}

TEST(ConnectionTest, SingleNackRaisesWithoutResend) {
    FakeRemote remote([](Peer& peer) {
        while (peer.read_line()) peer.write("NAC1");
    });
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();

    try {
        conn->send("Bogus / Command");
        FAIL() << "expected StkError";
    } catch (const StkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Nack);
        EXPECT_EQ(e.command(), "Bogus / Command");
    }
    conn->close();
    remote.join();
    EXPECT_EQ(remote.commands().size(), 1u);
}

TEST(ConnectionTest, NackThenAckWithinBudget) {
    FakeRemote remote([](Peer& peer) {
        int seen = 0;
        while (peer.read_line()) {
            peer.write(++seen < 3 ? "NAC1" : "ACK");
        }
    });
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();
    EXPECT_NO_THROW(conn->send("Flaky / Command", 5));
    conn->close();
    remote.join();
    EXPECT_EQ(remote.commands().size(), 3u);
}

TEST(ConnectionTest, NackBudgetExhausted) {
    FakeRemote remote([](Peer& peer) {
        while (peer.read_line()) peer.write("NAC0");
    });
    auto conn = Connection::create(test_config(remote.port()).send_attempts(3).build());
    conn->connect();

    try {
        conn->send("Bogus / Command");
        FAIL() << "expected StkError";
    } catch (const StkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Nack);
    }
    conn->close();
    remote.join();

    auto commands = remote.commands();
    ASSERT_EQ(commands.size(), 3u);
    for (const auto& c : commands) EXPECT_EQ(c, "Bogus / Command");
}

TEST(ConnectionTest, NackStatusByteConsumed) {
    FakeRemote remote([](Peer& peer) {
        if (peer.read_line()) peer.write("NAC7");
        while (peer.read_line()) peer.write("ACK");
    });
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();
    EXPECT_THROW(conn->send("First"), StkError);
    // The stream stays aligned for the next exchange.
    EXPECT_NO_THROW(conn->send("Second"));
    conn->close();
}

TEST(ConnectionTest, GarbageAckIsMalformed) {
    FakeRemote remote([](Peer& peer) {
        while (peer.read_line()) peer.write("HUH");
    });
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();
    try {
        conn->send("Unload / *");
        FAIL() << "expected StkError";
    } catch (const StkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedHeader);
    }
    conn->close();
}

TEST(ConnectionTest, CommandWithNewlineRejected) {
    FakeRemote remote(ack_everything);
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();
    try {
        conn->send("Unload / *\nNew / Scenario X");
        FAIL() << "expected StkError";
    } catch (const StkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }
    conn->close();
    remote.join();
    EXPECT_TRUE(remote.commands().empty());
}

// ==================== Messages ====================

TEST(ConnectionTest, ReadSingleMessage) {
    FakeRemote remote([](Peer& peer) {
        if (peer.read_line()) {
            peer.write("ACK");
            peer.write(sync_frame("GetTimePeriod", "\"1 Jan 2020\", \"2 Jan 2020\""));
        }
        while (peer.read_line()) {
        }
    });
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();
    conn->send("GetTimePeriod *");
    auto msg = conn->read_single_message();
    EXPECT_EQ(msg.name, "GetTimePeriod");
    EXPECT_EQ(msg.data, "\"1 Jan 2020\", \"2 Jan 2020\"");
    EXPECT_FALSE(msg.header.has_value());
    conn->close();
}

TEST(ConnectionTest, ReadMultiMessage) {
    FakeRemote remote([](Peer& peer) {
        if (peer.read_line()) {
            peer.write("ACK");
            peer.write(sync_frame("AllInstanceNames", "3"));
            peer.write(sync_frame("AllInstanceNames", "Sat1"));
            peer.write(sync_frame("AllInstanceNames", "Sat2"));
            peer.write(sync_frame("AllInstanceNames", "Fac1"));
        }
        while (peer.read_line()) {
        }
    });
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();
    conn->send("AllInstanceNames /");
    auto messages = conn->read_multi_message();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].data, "Sat1");
    EXPECT_EQ(messages[1].data, "Sat2");
    EXPECT_EQ(messages[2].data, "Fac1");
    conn->close();
}

TEST(ConnectionTest, MultiMessageCountOutOfRange) {
    FakeRemote remote([](Peer& peer) {
        if (peer.read_line()) {
            peer.write("ACK");
            peer.write(sync_frame("AllInstanceNames", "99999999999999999999999"));
        }
        while (peer.read_line()) {
        }
    });
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();
    conn->send("AllInstanceNames /");
    try {
        conn->read_multi_message();
        FAIL() << "expected StkError";
    } catch (const StkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedHeader);
    }
    conn->close();
}

TEST(ConnectionTest, ReadRawBuffer) {
    FakeRemote remote([](Peer& peer) {
        if (peer.read_line()) {
            peer.write("ACK");
            peer.write("free form text");
        }
        while (peer.read_line()) {
        }
    });
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();
    conn->send("ShowSomething /");
    EXPECT_EQ(conn->read(), "free form text");
    conn->close();
}

// ==================== Reports ====================

TEST(ConnectionTest, ReportSendsReportCreate) {
    FakeRemote remote(ack_everything);
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();

    ReportRequest req;
    req.object_path = "Satellite/Sat1";
    req.style = "LLA Position";
    req.type = "Export";
    req.file_path = "/tmp/lla.txt";
    req.time_step = "60";
    conn->report(req);
    conn->close();
    remote.join();

    auto commands = remote.commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0],
              "ReportCreate */Satellite/Sat1 Style \"LLA Position\" Type Export"
              " File \"/tmp/lla.txt\" TimeStep 60");
}

TEST(ConnectionTest, ReportRmDecodesFrames) {
    FakeRemote remote([](Peer& peer) {
        if (peer.read_line()) {
            peer.write("ACK");
            peer.write(sync_frame("Report_RM", "2") +
                       sync_frame("Report_RM", "Time,Lat,Lon") +
                       sync_frame("Report_RM", "0,1.5,2.5"));
        }
        while (peer.read_line()) {
        }
    });
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();

    ReportRequest req;
    req.object_path = "Satellite/Sat1";
    req.style = "LLA Position";
    auto rows = conn->report_rm(req);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], "Time,Lat,Lon");
    EXPECT_EQ(rows[1], "0,1.5,2.5");
    conn->close();
    remote.join();
    EXPECT_EQ(remote.commands()[0], "Report_RM */Satellite/Sat1 Style \"LLA Position\"");
}

TEST(ConnectionTest, ReportRmKeepsRowsBeforePause) {
    const std::string report = sync_frame("Report_RM", "3") +
                               sync_frame("Report_RM", "Time,Lat,Lon") +
                               sync_frame("Report_RM", "0,1.5,2.5") +
                               sync_frame("Report_RM", "60,1.6,2.6");
    // Count frame, first row and part of the next header, then a pause
    // longer than the idle timeout.
    const size_t first_part = 41 + 52 + 10;
    FakeRemote remote([&](Peer& peer) {
        if (peer.read_line()) {
            peer.write("ACK");
            peer.write(report.substr(0, first_part));
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            peer.write(report.substr(first_part));
        }
        while (peer.read_line()) {
        }
    });
    std::vector<std::string> warnings;
    auto conn = Connection::create(test_config(remote.port())
        .on_log([&](LogLevel level, const std::string& msg) {
            if (level == LogLevel::Warning) warnings.push_back(msg);
        })
        .build());
    conn->connect();

    ReportRequest req;
    req.object_path = "Satellite/Sat1";
    req.style = "LLA Position";
    auto rows = conn->report_rm(req, std::chrono::milliseconds(100));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], "Time,Lat,Lon");
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("10 trailing byte(s)"), std::string::npos);
    conn->close();
}

TEST(ConnectionTest, ReportRmEmptyWhenNothingArrives) {
    FakeRemote remote(ack_everything);
    auto conn = Connection::create(test_config(remote.port()).build());
    conn->connect();

    ReportRequest req;
    req.object_path = "Satellite/Sat1";
    req.style = "LLA Position";
    auto start = std::chrono::steady_clock::now();
    auto rows = conn->report_rm(req, std::chrono::milliseconds(100));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(rows.empty());
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    conn->close();
}

TEST(ConnectionTest, LogCallbackReceivesSendTrace) {
    FakeRemote remote(ack_everything);
    std::vector<std::string> lines;
    auto conn = Connection::create(test_config(remote.port())
        .on_log([&](LogLevel, const std::string& msg) { lines.push_back(msg); })
        .build());
    conn->connect();
    conn->send("Unload / *");
    conn->close();

    bool found = false;
    for (const auto& l : lines) {
        if (l.find("Unload / *") != std::string::npos) found = true;
    }
    EXPECT_TRUE(found);
}

} // namespace
} // namespace stk
