#include <gtest/gtest.h>

#include "RecordingSink.hpp"
#include "relay/ConnectionMultiplexer.h"
#include "relay/Events.h"
#include "relay/RelayHandler.h"
#include "relay/SessionRegistry.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace photorelay::relay;
using photorelay::test::RecordingSink;

namespace {

std::string frame(std::string_view event, const json::object& data) {
    return encode(event, data);
}

std::string upload(const std::string& session, const std::string& mime, std::int64_t size,
                   const std::string& photo = "iVBORw0KGgoAAAANSUhEUg==") {
    return frame(events::kUploadPhoto, json::object{{"session_id", session},
                                                    {"photo", photo},
                                                    {"mime_type", mime},
                                                    {"file_size", size}});
}

std::string message_of(const Envelope& env) {
    return json::value_to<std::string>(env.data.at("message"));
}

Connection unregistered(ClientId id = 1) {
    Connection c;
    c.id = id;
    return c;
}

} // namespace

class RelayHandlerTest : public ::testing::Test {
protected:
    void connect(ClientId id) { handler.on_connect(id); }

    void register_desktop(ClientId id, const std::string& session) {
        handler.on_message(id, frame(events::kRegisterDesktop, json::object{{"session_id", session}}));
    }

    void register_mobile(ClientId id, const std::string& session) {
        handler.on_message(id, frame(events::kRegisterMobile, json::object{{"session_id", session}}));
    }

    SessionRegistry registry;
    RecordingSink sink;
    ConnectionMultiplexer mux{registry, sink};
    RelayHandler handler{registry, mux};
};

// ---- pure transitions ----

TEST_F(RelayHandlerTest, DesktopRegistrationTransition) {
    auto t = handler.handle(unregistered(), Envelope{"register_desktop", json::object{{"session_id", "abc"}}});
    EXPECT_EQ(t.next, Role::Desktop);
    EXPECT_TRUE(t.claim_session);
    EXPECT_EQ(t.session_id, "abc");
    EXPECT_EQ(t.joins, (std::vector<std::string>{"desktop:abc"}));
    ASSERT_EQ(t.events.size(), 1u);
    EXPECT_EQ(t.events[0].name, "registration_success");
    EXPECT_FALSE(t.error);

    // Nothing happens until the transition is applied.
    EXPECT_FALSE(registry.lookup("abc"));
}

TEST_F(RelayHandlerTest, MobileRegistrationWithoutDesktopStillRegisters) {
    auto t = handler.handle(unregistered(), Envelope{"register_mobile", json::object{{"session_id", "abc"}}});
    EXPECT_EQ(t.next, Role::Mobile);
    EXPECT_FALSE(t.claim_session);
    EXPECT_EQ(t.joins, (std::vector<std::string>{"mobile:abc"}));
    ASSERT_EQ(t.events.size(), 1u);
    EXPECT_EQ(t.events[0].name, "registration_error");
    EXPECT_EQ(t.error, RelayError::InvalidSession);
}

TEST_F(RelayHandlerTest, RegistrationWithoutIdKeepsState) {
    for (auto event : {"register_desktop", "register_mobile"}) {
        for (const json::object& data : {json::object{}, json::object{{"session_id", ""}},
                                          json::object{{"session_id", 42}}}) {
            Connection mobile = unregistered();
            mobile.role = Role::Mobile;
            auto t = handler.handle(mobile, Envelope{event, data});
            EXPECT_EQ(t.next, Role::Mobile);
            EXPECT_EQ(t.error, RelayError::RegistrationFailure);
            ASSERT_EQ(t.events.size(), 1u);
            EXPECT_EQ(t.events[0].name, "registration_error");
            EXPECT_EQ(json::value_to<std::string>(t.events[0].payload.at("message")), "No session ID provided");
        }
    }
}

TEST_F(RelayHandlerTest, RegistrationIsOneShot) {
    Connection desktop = unregistered();
    desktop.role = Role::Desktop;
    auto t = handler.handle(desktop, Envelope{"register_mobile", json::object{{"session_id", "x"}}});
    EXPECT_EQ(t.next, Role::Desktop);
    EXPECT_EQ(t.error, RelayError::RegistrationFailure);
    EXPECT_TRUE(t.joins.empty());
}

TEST_F(RelayHandlerTest, UnknownEventIsReported) {
    auto t = handler.handle(unregistered(), Envelope{"dance", json::object{}});
    EXPECT_EQ(t.error, RelayError::MalformedMessage);
    ASSERT_EQ(t.events.size(), 1u);
    EXPECT_EQ(t.events[0].name, "error");
}

TEST_F(RelayHandlerTest, UploadTransitionForwardsThenAcknowledges) {
    registry.register_session("s1", 9);
    auto t = handler.handle(unregistered(2), *decode(upload("s1", "image/png", 2048)));
    EXPECT_FALSE(t.error);
    ASSERT_EQ(t.events.size(), 2u);
    EXPECT_EQ(t.events[0].target, OutboundEvent::Target::Room);
    EXPECT_EQ(t.events[0].room, "desktop:s1");
    EXPECT_EQ(t.events[0].name, "photo_received");
    EXPECT_EQ(t.events[1].target, OutboundEvent::Target::Self);
    EXPECT_EQ(t.events[1].name, "upload_success");
    ASSERT_TRUE(t.on_forward_failure);
    EXPECT_EQ(t.on_forward_failure->name, "upload_error");
}

// ---- scenarios through the multiplexer ----

TEST_F(RelayHandlerTest, DesktopRegistrationBindsSession) {
    connect(1);
    register_desktop(1, "s1");

    EXPECT_EQ(*registry.lookup("s1"), 1u);
    EXPECT_EQ(mux.connection(1)->role, Role::Desktop);
    EXPECT_EQ(mux.room_members("desktop:s1"), (std::vector<ClientId>{1}));
    auto reply = sink.last_to(1);
    ASSERT_TRUE(reply);
    EXPECT_EQ(reply->event, "registration_success");
    EXPECT_EQ(message_of(*reply), "Desktop registered successfully");
}

TEST_F(RelayHandlerTest, SecondDesktopTakesOverSession) {
    connect(1);
    connect(2);
    connect(3);
    register_desktop(1, "s");
    register_desktop(2, "s");

    EXPECT_EQ(*registry.lookup("s"), 2u);
    EXPECT_EQ(mux.room_members("desktop:s"), (std::vector<ClientId>{2}));

    handler.on_message(3, upload("s", "image/jpeg", 10));
    EXPECT_EQ(sink.to(2).back().event, "photo_received");
    for (auto& env : sink.to(1)) EXPECT_NE(env.event, "photo_received");

    // The replaced desktop leaving does not end the new owner's session.
    handler.on_disconnect(1);
    EXPECT_EQ(*registry.lookup("s"), 2u);
}

TEST_F(RelayHandlerTest, ScenarioA_UploadIsRelayedUnmodified) {
    connect(1);
    connect(2);
    register_desktop(1, "s1");
    register_mobile(2, "s1");
    EXPECT_EQ(sink.last_to(2)->event, "registration_success");
    EXPECT_EQ(message_of(*sink.last_to(2)), "Connected to desktop");

    handler.on_message(2, upload("s1", "image/png", 2048, "QUJDRA=="));

    auto photo = sink.last_to(1);
    ASSERT_TRUE(photo);
    EXPECT_EQ(photo->event, "photo_received");
    EXPECT_EQ(photo->data.at("photo").as_string(), "QUJDRA==");
    EXPECT_EQ(photo->data.at("mime_type").as_string(), "image/png");
    EXPECT_EQ(photo->data.at("file_size").as_int64(), 2048);
    EXPECT_EQ(photo->data.size(), 3u);

    auto ack = sink.last_to(2);
    EXPECT_EQ(ack->event, "upload_success");
    EXPECT_EQ(message_of(*ack), "Photo sent successfully");
}

TEST_F(RelayHandlerTest, ScenarioB_InvalidTypeIsRejected) {
    connect(1);
    connect(2);
    register_desktop(1, "s1");
    handler.on_message(2, upload("s1", "image/gif", 100));

    auto reply = sink.last_to(2);
    EXPECT_EQ(reply->event, "upload_error");
    EXPECT_NE(message_of(*reply).find("Invalid file type"), std::string::npos);
    EXPECT_EQ(sink.count_event("photo_received"), 0u);
}

TEST_F(RelayHandlerTest, ScenarioC_OversizedDeclarationIsRejected) {
    connect(1);
    connect(2);
    register_desktop(1, "s1");
    handler.on_message(2, upload("s1", "image/jpeg", 11 * 1024 * 1024));

    auto reply = sink.last_to(2);
    EXPECT_EQ(reply->event, "upload_error");
    EXPECT_NE(message_of(*reply).find("max 10MB"), std::string::npos);
    EXPECT_EQ(sink.count_event("photo_received"), 0u);
}

TEST_F(RelayHandlerTest, ScenarioD_MobileBeforeDesktop) {
    connect(2);
    register_mobile(2, "s2");
    auto reply = sink.last_to(2);
    EXPECT_EQ(reply->event, "registration_error");
    EXPECT_EQ(message_of(*reply), "Desktop not found. Please check if the app is running.");
    EXPECT_EQ(mux.connection(2)->role, Role::Mobile);

    connect(1);
    register_desktop(1, "s2");
    handler.on_message(2, upload("s2", "image/webp", 4096));

    EXPECT_EQ(sink.last_to(2)->event, "upload_success");
    EXPECT_EQ(sink.last_to(1)->event, "photo_received");
}

TEST_F(RelayHandlerTest, UploadAfterDesktopDisconnectFails) {
    connect(1);
    connect(2);
    register_desktop(1, "s1");
    handler.on_disconnect(1);
    EXPECT_FALSE(registry.lookup("s1"));

    handler.on_message(2, upload("s1", "image/png", 10));
    auto reply = sink.last_to(2);
    EXPECT_EQ(reply->event, "upload_error");
    EXPECT_EQ(message_of(*reply), "Desktop not connected. Please ensure the desktop app is running.");
    EXPECT_EQ(sink.count_event("photo_received"), 0u);
}

TEST_F(RelayHandlerTest, UploadForUnknownSessionNeverForwards) {
    connect(1);
    connect(2);
    register_desktop(1, "real");
    handler.on_message(2, upload("fake", "image/png", 10));
    handler.on_message(2, upload("", "image/png", 10));

    EXPECT_EQ(sink.count_event("photo_received"), 0u);
    EXPECT_EQ(sink.count_event("upload_error"), 2u);
}

TEST_F(RelayHandlerTest, UploadWithoutPhotoData) {
    connect(1);
    connect(2);
    register_desktop(1, "s");

    handler.on_message(2, upload("s", "image/png", 10, ""));
    EXPECT_EQ(message_of(*sink.last_to(2)), "No photo data received");

    handler.on_message(2, frame(events::kUploadPhoto, json::object{{"session_id", "s"}}));
    EXPECT_EQ(message_of(*sink.last_to(2)), "No photo data received");
    EXPECT_EQ(sink.count_event("photo_received"), 0u);
}

TEST_F(RelayHandlerTest, UploadDefaultsMimeTypeAndSize) {
    connect(1);
    connect(2);
    register_desktop(1, "s");
    handler.on_message(2, frame(events::kUploadPhoto, json::object{{"session_id", "s"}, {"photo", "AAAA"}}));

    auto photo = sink.last_to(1);
    ASSERT_TRUE(photo);
    EXPECT_EQ(photo->event, "photo_received");
    EXPECT_EQ(photo->data.at("mime_type").as_string(), "image/jpeg");
    EXPECT_EQ(photo->data.at("file_size").as_int64(), 0);
}

TEST_F(RelayHandlerTest, UploadWithNonNumericSizeIsRejected) {
    connect(1);
    connect(2);
    register_desktop(1, "s");
    handler.on_message(2, frame(events::kUploadPhoto, json::object{{"session_id", "s"},
                                                                  {"photo", "AAAA"},
                                                                  {"mime_type", "image/png"},
                                                                  {"file_size", "big"}}));
    EXPECT_EQ(sink.last_to(2)->event, "upload_error");
    EXPECT_EQ(sink.count_event("photo_received"), 0u);
}

TEST_F(RelayHandlerTest, TypeErrorWinsOverUnreadableSize) {
    connect(1);
    connect(2);
    register_desktop(1, "s");
    handler.on_message(2, frame(events::kUploadPhoto, json::object{{"session_id", "s"},
                                                                  {"photo", "AAAA"},
                                                                  {"mime_type", "image/gif"},
                                                                  {"file_size", "big"}}));
    auto reply = sink.last_to(2);
    EXPECT_EQ(reply->event, "upload_error");
    EXPECT_EQ(message_of(*reply), "Invalid file type: image/gif");
}

TEST_F(RelayHandlerTest, UploadFromUnregisteredConnectionIsAllowed) {
    connect(1);
    connect(2);
    register_desktop(1, "s");
    handler.on_message(2, upload("s", "image/jpg", 1));
    EXPECT_EQ(sink.last_to(2)->event, "upload_success");
    EXPECT_EQ(mux.connection(2)->role, Role::Unregistered);
}

TEST_F(RelayHandlerTest, ForwardFailureReplacesAcknowledgement) {
    connect(1);
    connect(2);
    register_desktop(1, "s");
    sink.failing.insert(1);

    handler.on_message(2, upload("s", "image/png", 10));
    auto reply = sink.last_to(2);
    EXPECT_EQ(reply->event, "upload_error");
    EXPECT_EQ(message_of(*reply), "Failed to send photo to desktop");
    EXPECT_EQ(sink.count_event("upload_success"), 0u);
}

TEST_F(RelayHandlerTest, MalformedFramesKeepConnectionUsable) {
    connect(1);
    handler.on_message(1, "not json");
    EXPECT_EQ(sink.last_to(1)->event, "error");
    handler.on_message(1, R"({"data":{}})");
    EXPECT_EQ(sink.last_to(1)->event, "error");
    handler.on_message(1, R"({"event":"nope"})");
    EXPECT_EQ(message_of(*sink.last_to(1)), "unknown event: nope");

    register_desktop(1, "s");
    EXPECT_EQ(sink.last_to(1)->event, "registration_success");
}

TEST_F(RelayHandlerTest, EventsAfterDisconnectAreDropped) {
    connect(1);
    handler.on_disconnect(1);
    handler.on_disconnect(1);
    register_desktop(1, "s");

    EXPECT_FALSE(registry.lookup("s"));
    EXPECT_TRUE(sink.sent().empty());
}

TEST_F(RelayHandlerTest, MessagesRefreshLastSeen) {
    connect(1);
    auto before = mux.connection(1)->last_seen;
    handler.on_message(1, "not json");
    EXPECT_GE(mux.connection(1)->last_seen, before);

    Connection c;
    auto now = Connection::Clock::now();
    c.connected_at = now - std::chrono::seconds(30);
    c.last_seen = now - std::chrono::seconds(5);
    EXPECT_EQ(c.open_for(now), std::chrono::seconds(30));
    EXPECT_EQ(c.idle_for(now), std::chrono::seconds(5));
}

// ---- concurrency ----

// Each thread owns its connections, as each socket owns a strand.
TEST_F(RelayHandlerTest, RacingDesktopsLeaveOneRoomMember) {
    constexpr ClientId kThreads = 8;
    constexpr int kRounds = 200;

    for (ClientId i = 1; i <= kThreads * kRounds; ++i) connect(i);

    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (ClientId t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            while (!go) std::this_thread::yield();
            for (int r = 0; r < kRounds; ++r) {
                register_desktop(1 + r * kThreads + t, "s" + std::to_string(r));
            }
        });
    }
    go = true;
    for (auto& th : threads) th.join();

    for (int r = 0; r < kRounds; ++r) {
        std::string session = "s" + std::to_string(r);
        auto owner = registry.lookup(session);
        ASSERT_TRUE(owner);
        EXPECT_EQ(mux.room_members("desktop:" + session), (std::vector<ClientId>{*owner})) << session;
    }
    EXPECT_EQ(registry.size(), static_cast<std::size_t>(kRounds));
}

TEST_F(RelayHandlerTest, RegisterUploadDisconnectStayConsistent) {
    constexpr ClientId kDesktops = 6;
    constexpr ClientId kMobiles = 4;
    constexpr int kRounds = 100;
    const std::string session = "shared";

    std::atomic<bool> go{false};
    std::atomic<ClientId> next_id{1};
    std::atomic<int> uploads{0};
    std::vector<std::thread> threads;

    for (ClientId d = 0; d < kDesktops; ++d) {
        threads.emplace_back([&] {
            while (!go) std::this_thread::yield();
            for (int r = 0; r < kRounds; ++r) {
                ClientId id = next_id++;
                connect(id);
                register_desktop(id, session);
                if (r % 2 == 0) handler.on_disconnect(id);
            }
        });
    }
    for (ClientId m = 0; m < kMobiles; ++m) {
        threads.emplace_back([&] {
            ClientId id = next_id++;
            connect(id);
            while (!go) std::this_thread::yield();
            for (int r = 0; r < kRounds; ++r) {
                handler.on_message(id, upload(session, "image/png", 10));
                ++uploads;
            }
        });
    }
    go = true;
    for (auto& th : threads) th.join();

    auto members = mux.room_members("desktop:" + session);
    ASSERT_LE(members.size(), 1u);
    if (auto owner = registry.lookup(session)) {
        EXPECT_EQ(members, (std::vector<ClientId>{*owner}));
        EXPECT_EQ(mux.connection(*owner)->role, Role::Desktop);
    } else {
        EXPECT_TRUE(members.empty());
    }

    // No upload was fanned out to more than one desktop.
    EXPECT_LE(sink.count_event("photo_received"), static_cast<std::size_t>(uploads.load()));
    EXPECT_EQ(sink.count_event("upload_success") + sink.count_event("upload_error"),
              static_cast<std::size_t>(uploads.load()));
}
