#include <hini/config/ini.hpp>

#include <catch2/catch.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace
{
  struct Server
  {
    std::string host = "localhost";
    uint16_t port = 80;
    bool tls = false;
    double timeout = 1.5;
    int retries = -1;
  };

  hini::Siphon<Server>
  server_siphon()
  {
    hini::Siphon<Server> siphon{"server"};
    siphon.field("host", &Server::host)
        .field("port", &Server::port)
        .field("tls", &Server::tls)
        .field("timeout", &Server::timeout)
        .field("retries", &Server::retries);
    return siphon;
  }
}  // namespace

TEST_CASE("Siphon a section into a struct", "[siphon]")
{
  struct Section
  {
    int var = 0;
  };

  auto doc = hini::Document::from_string("[Section]\nvar=3");
  auto s = hini::Siphon<Section>{"Section"}.field("var", &Section::var)(doc);
  CHECK(s.var == 3);
}

TEST_CASE("Siphon field conversions", "[siphon]")
{
  auto doc = hini::Document::from_string(R"(
[server]
host = " example.com "
port = 8080
tls = On
timeout = 2.25
retries = -3
unmapped = ignored
)");

  auto server = server_siphon()(doc);
  CHECK(server.host == " example.com ");
  CHECK(server.port == 8080);
  CHECK(server.tls);
  CHECK(server.timeout == Approx(2.25));
  CHECK(server.retries == -3);
}

TEST_CASE("Siphon keeps defaults for what is missing", "[siphon]")
{
  const auto siphon = server_siphon();
  CHECK(siphon.section() == "server");

  SECTION("missing section")
  {
    auto doc = hini::Document::from_string("[client]\nport = 1\n");
    auto server = siphon(doc);
    CHECK(server.host == "localhost");
    CHECK(server.port == 80);
    CHECK_FALSE(server.tls);
  }

  SECTION("missing keys")
  {
    auto doc = hini::Document::from_string("[server]\ntls = yes\n");
    auto server = siphon(doc);
    CHECK(server.tls);
    CHECK(server.port == 80);
    CHECK(server.timeout == Approx(1.5));
  }

  SECTION("fill only overwrites present keys")
  {
    auto doc = hini::Document::from_string("[server]\nport = 443\n");
    Server server;
    server.host = "preset";
    siphon.fill(doc.root(), server);
    CHECK(server.host == "preset");
    CHECK(server.port == 443);
  }
}

TEST_CASE("Siphon rejects bad values", "[siphon]")
{
  const auto siphon = server_siphon();

  auto bad = GENERATE(
      as<std::string>{},
      "port = 8080x",
      "port = 70000",
      "port = -1",
      "tls = maybe",
      "timeout = 2.5s",
      "timeout = ",
      "retries = 1.5");
  auto doc = hini::Document::from_string("[server]\n" + bad);
  CHECK_THROWS_AS(siphon(doc), std::invalid_argument);
}

TEST_CASE("Siphon error names the key and value", "[siphon]")
{
  auto doc = hini::Document::from_string("[server]\ntls = maybe\n");
  try
  {
    server_siphon()(doc);
    FAIL("expected invalid_argument");
  }
  catch (const std::invalid_argument& e)
  {
    CHECK(std::string{e.what()} == "[server]:tls = 'maybe' is not a valid bool");
  }
}

TEST_CASE("Siphon error names the expected type", "[siphon]")
{
  auto message = [](std::string line) -> std::string {
    auto doc = hini::Document::from_string("[server]\n" + line);
    try
    {
      server_siphon()(doc);
    }
    catch (const std::invalid_argument& e)
    {
      return e.what();
    }
    return "";
  };

  CHECK(message("port = x") == "[server]:port = 'x' is not a valid unsigned integer");
  CHECK(message("retries = x") == "[server]:retries = 'x' is not a valid integer");
  CHECK(message("timeout = x") == "[server]:timeout = 'x' is not a valid number");
}

TEST_CASE("Siphon values after inheritance and lookups", "[siphon]")
{
  auto doc = hini::Document::from_string(R"(
[defaults]
port = 8080
[server : defaults]
host = %port%.example
)");
  auto server = server_siphon()(doc);
  CHECK(server.port == 8080);
  CHECK(server.host == "8080.example");
}
