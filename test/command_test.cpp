#include <doctest/doctest.h>
#include <nmeabridge/control/command_channel.hpp>
#include <nmeabridge/control/error_injector.hpp>
#include <nmeabridge/net/tcp_server.hpp>

#include <chrono>
#include <future>
#include <thread>

using namespace nmeabridge;
using namespace nmeabridge::control;

namespace {
    scenario::ScenarioDefinition heading_90() {
        return scenario::parse_scenario_text(R"({
          "name": "steady",
          "duration": 60,
          "events": [ { "at": 0, "patterns": { "HDG": 90.0 } } ]
        })")
            .value();
    }

    // One line from the socket; empty when nothing arrives in time
    dp::String read_line(const net::Socket &s, int timeout_ms = 2000) {
        dp::String got;
        u8 c = 0;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            auto r = s.recv(&c, 1, 20);
            if (r.is_err()) {
                if (r.error().code == ErrorCode::Timeout)
                    continue;
                break;
            }
            got += static_cast<char>(c);
            if (c == '\n')
                break;
        }
        return c == '\n' ? got : dp::String();
    }
} // namespace

TEST_CASE("Command frame decoding") {
    SUBCASE("set heading") {
        auto f = decode_command(nmea::build("PNBAP,1,7,HDG,123.5"));
        REQUIRE(f.ok());
        CHECK(f.version == 1);
        CHECK(f.seq == 7);
        CHECK(f.command->kind == CommandKind::SetHeading);
        CHECK(f.command->value == doctest::Approx(123.5));
    }

    SUBCASE("mode, adjust and disengage") {
        auto mode = decode_command(nmea::build("PNBAP,1,1,MODE,wind"));
        REQUIRE(mode.ok());
        CHECK(mode.command->kind == CommandKind::SetMode);
        CHECK(mode.command->mode == AutopilotMode::Wind);

        auto adj = decode_command(nmea::build("PNBAP,1,2,ADJ,-10"));
        REQUIRE(adj.ok());
        CHECK(adj.command->kind == CommandKind::AdjustHeading);
        CHECK(adj.command->value == doctest::Approx(-10.0));

        auto off = decode_command(nmea::build("PNBAP,1,3,DISENGAGE"));
        REQUIRE(off.ok());
        CHECK(off.command->kind == CommandKind::Disengage);
    }

    SUBCASE("legacy encapsulation") {
        auto toggle = decode_command(nmea::build("PCDIN,01F112,000C8000,02,01"));
        REQUIRE(toggle.ok());
        CHECK(toggle.version == 0);
        CHECK(toggle.command->kind == CommandKind::ToggleEngage);

        auto plus = decode_command(nmea::build("PCDIN,01F113,000C8000,02,01"));
        REQUIRE(plus.ok());
        CHECK(plus.command->kind == CommandKind::AdjustHeading);
        CHECK(plus.command->value == doctest::Approx(1.0));

        CHECK(decode_command(nmea::build("PCDIN,01F114,0")).error == "unknown command");
    }

    SUBCASE("rejections keep the sequence number") {
        auto bad_cs = nmea::build("PNBAP,1,9,HDG,100.0");
        bad_cs = nmea::corrupt_checksum(bad_cs);
        auto f = decode_command(bad_cs);
        CHECK_FALSE(f.ok());
        CHECK(f.error == "checksum mismatch");
        CHECK(f.seq == 9);

        auto range = decode_command(nmea::build("PNBAP,1,4,HDG,360"));
        CHECK(range.error == "heading out of range");
        CHECK(range.seq == 4);

        CHECK(decode_command(nmea::build("PNBAP,2,5,HDG,10")).error == "unsupported version");
        CHECK(decode_command(nmea::build("PNBAP,1,6,JUMP")).error == "unknown command");
        CHECK(decode_command(nmea::build("PNBAP,1,6,MODE,fast")).error == "unknown mode");
        CHECK(decode_command(nmea::build("PNBAP,1,6,HDG")).error == "malformed command");
        CHECK(decode_command(nmea::build("PNBAP,1,x,DISENGAGE")).error == "malformed command");
        CHECK(decode_command("$PNBAP,1,6,DISENGAGE").error == "malformed command");
    }

    SUBCASE("sequence numbers must fit in 32 bits") {
        CHECK(decode_command(nmea::build("PNBAP,1,4294967295,DISENGAGE")).seq == 4294967295u);
        CHECK(decode_command(nmea::build("PNBAP,1,4294967296,DISENGAGE")).error == "malformed command");
        CHECK(decode_command(nmea::build("PNBAP,1,1e12,DISENGAGE")).error == "malformed command");
        CHECK(decode_command(nmea::build("PNBAP,1,2.5,DISENGAGE")).error == "malformed command");
        CHECK(decode_command(nmea::build("PNBAP,1,-1,DISENGAGE")).error == "malformed command");

        auto huge = decode_command(nmea::corrupt_checksum(nmea::build("PNBAP,1,1e12,DISENGAGE")));
        CHECK(huge.error == "checksum mismatch");
        CHECK(huge.seq == 0);
    }

    SUBCASE("accepted format is enforced") {
        CHECK(decode_command(nmea::build("PCDIN,01F112,0"), CommandFormat::V1).error == "unsupported version");
        CHECK(decode_command(nmea::build("PNBAP,1,1,DISENGAGE"), CommandFormat::Legacy).error ==
              "unsupported version");
        CHECK(decode_command(nmea::build("PNBAP,1,1,DISENGAGE"), CommandFormat::V1).ok());
    }

    SUBCASE("only command tags are command lines") {
        CHECK(is_command_line(nmea::build("PNBAP,1,1,DISENGAGE")));
        CHECK(is_command_line(nmea::build("PCDIN,01F112,0")));
        CHECK_FALSE(is_command_line(nmea::build("IIHDT,90.0,T")));
    }
}

TEST_CASE("Command replies and encoding") {
    auto ack = encode_reply(1, 12, CommandOutcome::ack());
    CHECK(ack == nmea::build("PNBAK,1,12,ACK"));
    CHECK(nmea::has_valid_checksum(ack));

    auto nak = encode_reply(1, 13, CommandOutcome::nak("bad, really*"));
    CHECK(nak == nmea::build("PNBAK,1,13,NAK,bad  really "));

    auto hdg = encode_command(3, AutopilotCommand::set_heading(45.0));
    CHECK(hdg == nmea::build("PNBAP,1,3,HDG,45.0"));
    auto back = decode_command(hdg);
    REQUIRE(back.ok());
    CHECK(back.command->value == doctest::Approx(45.0));

    CHECK(encode_command(4, AutopilotCommand::adjust(5.0)) == nmea::build("PNBAP,1,4,ADJ,+5.0"));
    CHECK(encode_command(0, AutopilotCommand::toggle()) == nmea::build("PCDIN,01F112"));
}

TEST_CASE("Command words") {
    CHECK(parse_command_word("ENGAGE").value().mode == AutopilotMode::Auto);
    CHECK(parse_command_word("standby").value().kind == CommandKind::Disengage);
    CHECK(parse_command_word("track").value().mode == AutopilotMode::Track);
    CHECK(parse_command_word("+10").value().kind == CommandKind::AdjustHeading);
    CHECK(parse_command_word("-1").value().value == doctest::Approx(-1.0));
    CHECK(parse_command_word("heading 270").value().value == doctest::Approx(270.0));
    CHECK(parse_command_word("15").value().kind == CommandKind::SetHeading);
    CHECK(parse_command_word("heading 400").error().message == "heading out of range");
    CHECK(parse_command_word("dance").is_err());
}

TEST_CASE("Autopilot controller") {
    AutopilotController ap(10, 100);

    SUBCASE("engaging seeds the target from the current heading") {
        CHECK(ap.apply(AutopilotCommand::set_mode(AutopilotMode::Auto), 0, 271.4).accepted);
        CHECK(ap.state().engaged());
        CHECK(ap.state().target_heading_deg == doctest::Approx(271.4));
    }

    SUBCASE("adjust wraps around north") {
        CHECK(ap.apply(AutopilotCommand::set_heading(355.0), 0, 0.0).accepted);
        CHECK(ap.apply(AutopilotCommand::adjust(10.0), 0, 0.0).accepted);
        CHECK(ap.state().target_heading_deg == doctest::Approx(5.0));
    }

    SUBCASE("toggle flips engagement") {
        ap.apply(AutopilotCommand::toggle(), 0, 90.0);
        CHECK(ap.state().mode == AutopilotMode::Auto);
        ap.apply(AutopilotCommand::toggle(), 0, 90.0);
        CHECK(ap.state().mode == AutopilotMode::Standby);
    }

    SUBCASE("invalid values are refused without a token") {
        CHECK(ap.apply(AutopilotCommand::set_heading(-1.0), 0, 0.0).reason == "heading out of range");
        CHECK(ap.apply(AutopilotCommand::adjust(181.0), 0, 0.0).reason == "heading out of range");
        CHECK(ap.state().rejected_commands == 2);
        CHECK(ap.state().accepted_commands == 0);
    }

    SUBCASE("reset restores defaults") {
        ap.apply(AutopilotCommand::set_heading(10.0), 0, 0.0);
        ap.reset();
        CHECK(ap.state().mode == AutopilotMode::Standby);
        CHECK(ap.state().accepted_commands == 0);
    }
}

TEST_CASE("Command channel") {
    scenario::ScenarioEngine engine;
    u64 now = 10'000;
    engine.set_clock([&] { return now; });
    REQUIRE(engine.load(heading_90()).is_ok());
    engine.update(100);
    CommandChannel channel(engine);

    SUBCASE("frames are acknowledged and applied") {
        auto reply = channel.handle_frame(nmea::build("PNBAP,1,21,HDG,120.0"));
        REQUIRE(reply.has_value());
        CHECK(*reply == nmea::build("PNBAK,1,21,ACK"));
        CHECK(engine.autopilot().target_heading_deg == doctest::Approx(120.0));
        CHECK(engine.autopilot().engaged());
    }

    SUBCASE("second command inside the refill period is rate limited") {
        REQUIRE(channel.handle_frame(nmea::build("PNBAP,1,1,HDG,100.0")).has_value());
        auto reply = channel.handle_frame(nmea::build("PNBAP,1,2,ADJ,+5"));
        REQUIRE(reply.has_value());
        CHECK(*reply == nmea::build("PNBAK,1,2,NAK,rate limited"));

        now += COMMAND_REFILL_MS;
        CHECK(*channel.handle_frame(nmea::build("PNBAP,1,3,ADJ,+5")) == nmea::build("PNBAK,1,3,ACK"));
        CHECK(engine.autopilot().target_heading_deg == doctest::Approx(105.0));

        auto s = channel.stats();
        CHECK(s.received == 3);
        CHECK(s.acked == 2);
        CHECK(s.naked == 1);
    }

    SUBCASE("invalid frames are answered without touching state") {
        auto reply = channel.handle_frame(nmea::build("PNBAP,1,8,HDG,999"));
        REQUIRE(reply.has_value());
        CHECK(*reply == nmea::build("PNBAK,1,8,NAK,heading out of range"));
        CHECK_FALSE(engine.autopilot().engaged());
    }

    SUBCASE("non-command lines are ignored") {
        CHECK_FALSE(channel.handle_frame(nmea::build("IIHDT,90.0,T")).has_value());
        CHECK(channel.stats().ignored == 1);
    }

    SUBCASE("json commands") {
        auto reply = channel.handle_json(R"({"type":"autopilot-command","id":4,"command":"heading 200"})");
        REQUIRE(reply.has_value());
        auto j = nlohmann::json::parse(reply->c_str());
        CHECK(j["type"] == "autopilot-ack");
        CHECK(j["id"] == 4);
        CHECK(j["accepted"] == true);
        CHECK(engine.autopilot().target_heading_deg == doctest::Approx(200.0));

        now += COMMAND_REFILL_MS;
        auto bad = channel.handle_json(R"({"type":"autopilot-command","command":"sideways"})");
        REQUIRE(bad.has_value());
        auto jb = nlohmann::json::parse(bad->c_str());
        CHECK(jb["accepted"] == false);
        CHECK(jb["reason"] == "unknown command");

        CHECK_FALSE(channel.handle_json(R"({"type":"subscribe"})").has_value());
        CHECK_FALSE(channel.handle_json("not json").has_value());
    }

    SUBCASE("disengage is never rate limited") {
        REQUIRE(channel.handle_frame(nmea::build("PNBAP,1,1,MODE,auto")).has_value());
        CHECK(*channel.handle_frame(nmea::build("PNBAP,1,2,DISENGAGE")) == nmea::build("PNBAK,1,2,ACK"));
        CHECK_FALSE(engine.autopilot().engaged());
    }
}

TEST_CASE("Command not applied once the engine is too busy to take it") {
    scenario::ScenarioEngine engine;
    REQUIRE(engine.load(heading_90()).is_ok());
    auto before = engine.status().autopilot;
    engine.start();
    CommandChannel channel(engine, CommandConfig{}.timeout(50));

    engine.post([](scenario::ScenarioEngine &) { std::this_thread::sleep_for(std::chrono::milliseconds(300)); });
    auto reply = channel.handle_frame(nmea::build("PNBAP,1,30,HDG,120.0"));
    REQUIRE(reply.has_value());
    CHECK(*reply == nmea::build("PNBAK,1,30,NAK,engine busy"));

    // The engine has drained everything queued before this call
    REQUIRE(engine.call([](scenario::ScenarioEngine &) {}).wait_for(std::chrono::seconds(2)) ==
            std::future_status::ready);
    auto after = engine.status().autopilot;
    CHECK(after.mode == before.mode);
    CHECK(after.target_heading_deg == doctest::Approx(before.target_heading_deg));
    CHECK(after.accepted_commands == 0);
    CHECK(channel.stats().naked == 1);

    // Once idle again the same command goes through
    auto ok = channel.handle_frame(nmea::build("PNBAP,1,31,HDG,120.0"));
    REQUIRE(ok.has_value());
    CHECK(*ok == nmea::build("PNBAK,1,31,ACK"));
    CHECK(engine.status().autopilot.target_heading_deg == doctest::Approx(120.0));
    engine.shutdown();
}

TEST_CASE("Error injection") {
    net::Broadcast broadcast;
    net::TcpServer tcp(net::ServerConfig{}.bind("127.0.0.1").listen_on(0), broadcast);
    REQUIRE(tcp.start().is_ok());
    auto a = net::Socket::connect("127.0.0.1", tcp.port());
    auto b = net::Socket::connect("127.0.0.1", tcp.port());
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    for (int i = 0; i < 200 && tcp.connection_count() < 2; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    REQUIRE(tcp.connection_count() == 2);
    for (int i = 0; i < 200 && !(tcp.connections()[0]->ready() && tcp.connections()[1]->ready()); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    ErrorInjector injector(&tcp, nullptr);
    auto sentence = nmea::build("IIMTW,18.5,C");

    SUBCASE("checksum corruption on every connection") {
        FaultRequest req;
        req.kind = FaultKind::Checksum;
        req.duration_ms = 1000;
        auto r = injector.inject(req);
        REQUIRE(r.is_ok());
        CHECK(r.value().affected == 2);
        CHECK(r.value().until_ms > epoch_ms());
        CHECK(injector.injected() == 1);

        broadcast.publish(make_packet(Packet::text(sentence)));
        auto got = read_line(a.value());
        REQUIRE_FALSE(got.empty());
        CHECK(nmea::validate(got).is_err());
        CHECK(got == nmea::corrupt_checksum(sentence));
    }

    SUBCASE("timeout silences output until it expires") {
        FaultRequest req;
        req.kind = FaultKind::Timeout;
        req.duration_ms = 400;
        REQUIRE(injector.inject(req).is_ok());

        broadcast.publish(make_packet(Packet::text(sentence)));
        CHECK(read_line(a.value(), 250).empty());

        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        broadcast.publish(make_packet(Packet::text(sentence)));
        auto got = read_line(a.value());
        CHECK(got == sentence);
        CHECK(nmea::validate(got).is_ok());
    }

    SUBCASE("high latency holds output back") {
        FaultRequest req;
        req.kind = FaultKind::HighLatency;
        req.duration_ms = 2000;
        req.latency_ms = 300;
        auto r = injector.inject(req);
        REQUIRE(r.is_ok());
        CHECK(r.value().affected == 2);

        auto sent_at = std::chrono::steady_clock::now();
        broadcast.publish(make_packet(Packet::text(sentence)));
        auto got = read_line(b.value());
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - sent_at);
        CHECK(got == sentence);
        CHECK(waited.count() >= 250);

        req.latency_ms = 0;
        CHECK(injector.inject(req).is_err());
    }

    SUBCASE("disconnect a single connection") {
        auto id = tcp.connection_info()[0].id;
        FaultRequest req;
        req.kind = FaultKind::Disconnect;
        req.target = dp::String(std::to_string(id));
        auto r = injector.inject(req);
        REQUIRE(r.is_ok());
        CHECK(r.value().affected == 1);
        for (int i = 0; i < 200 && tcp.connection_count() != 1; ++i)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        CHECK(tcp.connection_count() == 1);
    }

    SUBCASE("websocket target with no server affects nothing") {
        FaultRequest req;
        req.kind = FaultKind::Timeout;
        req.target = dp::String("websocket");
        auto r = injector.inject(req);
        REQUIRE(r.is_ok());
        CHECK(r.value().affected == 0);
    }

    SUBCASE("bad requests") {
        FaultRequest unknown;
        unknown.target = dp::String("serial");
        auto r1 = injector.inject(unknown);
        REQUIRE(r1.is_err());
        CHECK(r1.error().code == ErrorCode::InvalidArgument);

        FaultRequest missing;
        missing.target = dp::String("9999");
        auto r2 = injector.inject(missing);
        REQUIRE(r2.is_err());
        CHECK(r2.error().code == ErrorCode::NotFound);

        FaultRequest zero;
        zero.duration_ms = 0;
        CHECK(injector.inject(zero).is_err());
        CHECK(injector.injected() == 0);
    }

    SUBCASE("fault names") {
        CHECK(*fault_from_string("Malformed") == FaultKind::Checksum);
        CHECK(*fault_from_string("delay") == FaultKind::Timeout);
        CHECK(*fault_from_string("connection") == FaultKind::Disconnect);
        CHECK(*fault_from_string("slow") == FaultKind::HighLatency);
        CHECK(*fault_from_string("latency") == FaultKind::HighLatency);
        CHECK_FALSE(fault_from_string("flood").has_value());
    }

    tcp.stop();
}
