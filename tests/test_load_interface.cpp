#include "qlink/load/LoadInterface.hpp"

#include "support/Check.hpp"
#include "support/FakeController.hpp"

#include <chrono>
#include <string>

using namespace std::chrono_literals;
using namespace qlink;
using qlink::load::LoadInterface;
using qlink::test::FakeController;
using qlink::test::Reply;

namespace {

Reply loadScript(const std::string& request) {
    if (request == "VGL 12") return Reply{{"R:GVL 67"}};
    if (request == "VGL 13") return Reply{{"R:GVL 13 42"}};
    if (request == "VGL 14") return Reply{{"R:GVL dim"}};
    if (request == "VGL 15") return Reply{{"R:GVL"}};
    if (request == "VGL 99") return Reply{{"257"}};
    if (request == "VGL \"kitchen light\"") return Reply{{"R:GVL 5"}};
    return qlink::test::echo(request);
}

protocol::SessionOptions optionsFor(const FakeController& server) {
    protocol::SessionOptions options;
    options.host = "127.0.0.1";
    options.port = server.port();
    options.connectTimeout = 2000ms;
    options.readTimeout = 2000ms;
    return options;
}

std::string lastRequest(const FakeController& server) {
    auto lines = server.received();
    return lines.empty() ? std::string() : lines.back().text;
}

} // namespace

static void testGetLevel() {
    FakeController server(loadScript);
    protocol::CommandSession session(optionsFor(server));
    LoadInterface loads(session);

    auto level = loads.getLevel(12);
    ASSERT_TRUE(level.has_value(), "getLevel succeeds");
    ASSERT_EQ(level.value_or(-1), 67, "level from reply");
    ASSERT_EQ(lastRequest(server), std::string("VGL 12"), "VGL request");

    ASSERT_EQ(loads.getLevel(13).value_or(-1), 42, "level is the last argument");

    auto named = loads.getLevel("kitchen light");
    ASSERT_EQ(named.value_or(-1), 5, "string contractor number is quoted");
}

static void testGetLevelRejectsBadReplies() {
    FakeController server(loadScript);
    protocol::CommandSession session(optionsFor(server));
    LoadInterface loads(session);

    auto word = loads.getLevel(14);
    ASSERT_TRUE(!word && word.error().is(ErrorKind::Malformed), "non-integer level");

    auto missing = loads.getLevel(15);
    ASSERT_TRUE(!missing && missing.error().is(ErrorKind::Malformed), "missing level");

    auto rejected = loads.getLevel(99);
    ASSERT_TRUE(!rejected && rejected.error().is(ErrorKind::Protocol), "protocol error passes through");
    if (!rejected) {
        ASSERT_EQ(rejected.error().protocolCode(), 257, "error code unchanged");
    }
}

static void testSetLevelClamps() {
    FakeController server(loadScript);
    protocol::CommandSession session(optionsFor(server));
    LoadInterface loads(session);

    ASSERT_TRUE(loads.setLevel(5, 150).has_value(), "setLevel above range");
    ASSERT_EQ(lastRequest(server), std::string("VLO 5 100 0"), "clamped to 100");

    ASSERT_TRUE(loads.setLevel(5, -5).has_value(), "setLevel below range");
    ASSERT_EQ(lastRequest(server), std::string("VLO 5 0 0"), "clamped to 0");

    ASSERT_TRUE(loads.setLevel(5, 35).has_value(), "setLevel in range");
    ASSERT_EQ(lastRequest(server), std::string("VLO 5 35 0"), "sent unchanged");
}

static void testRamp() {
    FakeController server(loadScript);
    protocol::CommandSession session(optionsFor(server));
    LoadInterface loads(session);

    ASSERT_TRUE(loads.ramp(7, 40, 2.5).has_value(), "ramp");
    ASSERT_EQ(lastRequest(server), std::string("VLO 7 40 2.5"), "fade time sent");

    ASSERT_TRUE(loads.ramp(7, 400, 3).has_value(), "ramp above range");
    ASSERT_EQ(lastRequest(server), std::string("VLO 7 100 3"), "ramp clamps too");
}

static void testTurnOnOff() {
    FakeController server(loadScript);
    protocol::CommandSession session(optionsFor(server));
    LoadInterface loads(session);

    ASSERT_TRUE(loads.turnOn(3).has_value(), "turnOn");
    ASSERT_EQ(lastRequest(server), std::string("VLO 3 100 0"), "default on level is 100");

    ASSERT_TRUE(loads.turnOn(3, 1.5, 60).has_value(), "turnOn with transition");
    ASSERT_EQ(lastRequest(server), std::string("VLO 3 60 1.5"), "ramp to chosen level");

    ASSERT_TRUE(loads.turnOn(3, std::nullopt, 20).has_value(), "turnOn with level only");
    ASSERT_EQ(lastRequest(server), std::string("VLO 3 20 0"), "immediate set");

    ASSERT_TRUE(loads.turnOff(3).has_value(), "turnOff");
    ASSERT_EQ(lastRequest(server), std::string("VLO 3 0 0"), "immediate off");

    ASSERT_TRUE(loads.turnOff(3, 4.0).has_value(), "turnOff with transition");
    ASSERT_EQ(lastRequest(server), std::string("VLO 3 0 4"), "ramp down");
}

static void testFailuresPropagate() {
    protocol::SessionOptions options;
    options.host = "127.0.0.1";
    options.port = FakeController::unusedPort();
    protocol::CommandSession session(options);
    LoadInterface loads(session);

    auto level = loads.getLevel(1);
    ASSERT_TRUE(!level && level.error().is(ErrorKind::Connection), "connection error unchanged");

    auto set = loads.setLevel(1, 50);
    ASSERT_TRUE(!set && set.error().is(ErrorKind::Connection), "connection error from setLevel");
}

int main() {
    testGetLevel();
    testGetLevelRejectsBadReplies();
    testSetLevelClamps();
    testRamp();
    testTurnOnOff();
    testFailuresPropagate();
    return finish("LoadInterface");
}
