// Unit tests for command-line flag parsing
#include <catch2/catch_test_macros.hpp>
#include "cli_options.hpp"

using namespace agentmesh::app;

namespace {

bool Parse(std::vector<std::string> args, CommandLine& cmd, std::string& error) {
    return ParseCommandLine(args, cmd, error);
}

} // namespace

TEST_CASE("ParseCommandLine applies flags over defaults", "[app][cli]") {
    CommandLine cmd;
    std::string error;
    REQUIRE(Parse({"--name=Anna", "--port=47100", "--range=3", "--timeout=250",
                   "--noinput", "--loglevel=debug", "--debug=network,mesh"},
                  cmd, error));

    CHECK(cmd.config.mesh.agent_name == "Anna");
    CHECK(cmd.config.mesh.port == 47100);
    CHECK(cmd.config.mesh.discovery_range == 3);
    CHECK(cmd.config.mesh.connect_timeout == std::chrono::milliseconds(250));
    CHECK_FALSE(cmd.config.interactive);
    CHECK(cmd.log_level == "debug");
    CHECK(cmd.debug_components == std::vector<std::string>{"network", "mesh"});
    CHECK_FALSE(cmd.show_help);
}

TEST_CASE("ParseCommandLine with no flags keeps defaults", "[app][cli]") {
    CommandLine cmd;
    std::string error;
    REQUIRE(Parse({}, cmd, error));
    CHECK(cmd.config.mesh.port == 54321);
    CHECK(cmd.config.mesh.discovery_range == 5);
    CHECK(cmd.config.interactive);
    CHECK(cmd.log_level == "info");
}

TEST_CASE("ParseCommandLine rejects out-of-range values", "[app][cli]") {
    CommandLine cmd;
    std::string error;

    SECTION("port zero") {
        CHECK_FALSE(Parse({"--port=0"}, cmd, error));
        CHECK(error.find("Invalid port number") != std::string::npos);
    }

    SECTION("port above 65535") {
        CHECK_FALSE(Parse({"--port=65536"}, cmd, error));
        CHECK(error.find("Invalid port number") != std::string::npos);
    }

    SECTION("range above 100") {
        CHECK_FALSE(Parse({"--range=101"}, cmd, error));
        CHECK(error.find("Invalid discovery range") != std::string::npos);
    }

    SECTION("range zero") {
        CHECK_FALSE(Parse({"--range=0"}, cmd, error));
    }

    SECTION("non-numeric timeout") {
        CHECK_FALSE(Parse({"--timeout=soon"}, cmd, error));
        CHECK(error.find("Invalid connect timeout") != std::string::npos);
    }

    SECTION("zero timeout") {
        CHECK_FALSE(Parse({"--timeout=0"}, cmd, error));
    }

    SECTION("blank name") {
        CHECK_FALSE(Parse({"--name=   "}, cmd, error));
    }

    CHECK_FALSE(cmd.unknown_option);
}

TEST_CASE("ParseCommandLine rejects unknown flags", "[app][cli]") {
    CommandLine cmd;
    std::string error;
    CHECK_FALSE(Parse({"--port=47100", "--bogus"}, cmd, error));
    CHECK(error == "Unknown option: --bogus");
    CHECK(cmd.unknown_option);
}

TEST_CASE("ParseCommandLine stops at --help and --version", "[app][cli]") {
    CommandLine cmd;
    std::string error;

    SECTION("help") {
        REQUIRE(Parse({"--help", "--bogus"}, cmd, error));
        CHECK(cmd.show_help);
    }

    SECTION("version") {
        REQUIRE(Parse({"--version"}, cmd, error));
        CHECK(cmd.show_version);
    }
}

TEST_CASE("ParseCommandLine reports a missing config file", "[app][cli]") {
    CommandLine cmd;
    std::string error;
    CHECK_FALSE(Parse({"--config=/nonexistent/agentmesh.json"}, cmd, error));
    CHECK_FALSE(error.empty());
    CHECK_FALSE(cmd.unknown_option);
}
