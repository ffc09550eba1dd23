#include <gtest/gtest.h>
#include "mcpsrv/session.hpp"
#include <thread>
#include <vector>

using namespace mcpsrv;

namespace {

InitializeParams make_params(const std::string& name = "test-client") {
    InitializeParams p;
    p.protocol_version = "2024-11-05";
    p.client_info = {name, "1.0"};
    p.capabilities.roots = nlohmann::json{{"listChanged", true}};
    return p;
}

} // anonymous namespace

TEST(Session, StartsFresh) {
    Session s;
    EXPECT_EQ(s.state(), SessionState::Fresh);
    EXPECT_FALSE(s.is_ready());
    EXPECT_FALSE(s.client_info().has_value());
}

TEST(Session, MarkReadyRecordsClient) {
    Session s;
    EXPECT_TRUE(s.mark_ready(make_params()));
    EXPECT_EQ(s.state(), SessionState::Ready);
    EXPECT_TRUE(s.is_ready());
    ASSERT_TRUE(s.client_info().has_value());
    EXPECT_EQ(s.client_info()->name, "test-client");
    EXPECT_EQ(s.client_protocol_version(), "2024-11-05");
    EXPECT_TRUE(s.client_capabilities().roots.has_value());
}

TEST(Session, RepeatedInitializeRefreshesClient) {
    Session s;
    ASSERT_TRUE(s.mark_ready(make_params("first")));
    ASSERT_TRUE(s.mark_ready(make_params("second")));
    EXPECT_EQ(s.state(), SessionState::Ready);
    EXPECT_EQ(s.client_info()->name, "second");
}

TEST(Session, CloseIsFinal) {
    Session s;
    ASSERT_TRUE(s.mark_ready(make_params()));
    s.close();
    EXPECT_EQ(s.state(), SessionState::Closed);
    EXPECT_FALSE(s.is_ready());
    EXPECT_FALSE(s.mark_ready(make_params()));
    EXPECT_EQ(s.state(), SessionState::Closed);
}

TEST(Session, CloseFromFresh) {
    Session s;
    s.close();
    EXPECT_EQ(s.state(), SessionState::Closed);
}

TEST(Session, StateNames) {
    EXPECT_EQ(session_state_name(SessionState::Fresh), "fresh");
    EXPECT_EQ(session_state_name(SessionState::Ready), "ready");
    EXPECT_EQ(session_state_name(SessionState::Closed), "closed");
}

TEST(Session, ConcurrentReadersSeeReady) {
    Session s;
    std::vector<std::thread> readers;
    std::atomic<int> saw_ready{0};
    ASSERT_TRUE(s.mark_ready(make_params()));
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            for (int k = 0; k < 1000; ++k) {
                if (s.is_ready()) ++saw_ready;
                (void)s.client_info();
            }
        });
    }
    for (auto& t : readers) t.join();
    EXPECT_EQ(saw_ready.load(), 4000);
}
