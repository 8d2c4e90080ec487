#include <doctest/doctest.h>
#include "command_dispatch.hpp"

using namespace dgtlink;

TEST_CASE("Canonical names resolve") {
    Command c;
    std::string err;
    REQUIRE(name_to_command("board", c, err));
    CHECK(c == Command::RequestBoard);
    REQUIRE(name_to_command("update-board", c, err));
    CHECK(c == Command::RequestUpdate);
    REQUIRE(name_to_command("update", c, err));
    CHECK(c == Command::EnableUpdate);
    REQUIRE(name_to_command("update-nice", c, err));
    CHECK(c == Command::RequestNiceUpdate);
    REQUIRE(name_to_command("ee-moves", c, err));
    CHECK(c == Command::RequestEEMoves);
}

TEST_CASE("Every canonical CLI name round-trips") {
    for (Command c : ALL_COMMANDS) {
        Command out;
        std::string err;
        REQUIRE(name_to_command(command_cli_name(c), out, err));
        CHECK(out == c);
    }
}

TEST_CASE("Matching ignores case and accepts underscores") {
    Command c;
    std::string err;
    REQUIRE(name_to_command("Bus_Address", c, err));
    CHECK(c == Command::RequestBusAddress);
    REQUIRE(name_to_command("VERSION", c, err));
    CHECK(c == Command::RequestVersion);
    REQUIRE(name_to_command("sn", c, err));
    CHECK(c == Command::RequestSerialNumber);
}

TEST_CASE("Unknown names fail with a stable reason") {
    Command c;
    std::string err;
    CHECK_FALSE(name_to_command("Castle", c, err));
    CHECK(err == "unknown_command:Castle");
}

TEST_CASE("names_to_commands keeps order and stops at the first unknown") {
    std::vector<Command> out;
    std::string err;
    REQUIRE(names_to_commands({"reset", "board", "clock"}, out, err));
    REQUIRE(out.size() == 3);
    CHECK(out[0] == Command::Reset);
    CHECK(out[2] == Command::RequestClock);

    CHECK_FALSE(names_to_commands({"version", "nope", "clock"}, out, err));
    CHECK(out.size() == 1);
    CHECK(err == "unknown_command:nope");
}
