#include <doctest/doctest.h>

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "omni/environment.hpp"
#include "options.hpp"

namespace omni = xpto::omni;

namespace {

struct parsed {
  std::optional<int> exit_code;
  omni::environment env;
};

parsed parse(std::initializer_list<std::string> args) {
  std::vector<std::string> storage{"omni"};
  storage.insert(storage.end(), args);
  std::vector<char*> argv;
  for (auto& a : storage) argv.push_back(a.data());

  parsed p{};
  p.exit_code = omni::parse_options(argv, p.env);
  return p;
}

}  // namespace

TEST_CASE("options-defaults") {
  auto p = parse({});
  REQUIRE_FALSE(p.exit_code);
  CHECK(p.env.port == 2000);
  CHECK(p.env.log_level == 3);
  CHECK(p.env.transport == omni::transport_kind::http);
  CHECK_FALSE(p.env.host_pid);
  CHECK_FALSE(p.env.encoding);
}

TEST_CASE("options-loglevel-names") {
  CHECK(parse({"--loglevel", "Information"}).env.log_level == 3);
  CHECK(parse({"-l", "debug"}).env.log_level == 4);
  CHECK(parse({"-l", "TRACE"}).env.log_level == 5);
  CHECK(parse({"-l", "Warning"}).env.log_level == 2);
  CHECK(parse({"-l", "Critical"}).env.log_level == 0);
}

TEST_CASE("options-loglevel-numbers") {
  // 0 is the most verbose.
  CHECK(parse({"-l", "0"}).env.log_level == 5);
  CHECK(parse({"-l", "2"}).env.log_level == 3);
  CHECK(parse({"-l", "5"}).env.log_level == 0);
}

TEST_CASE("options-loglevel-rejects-unknown") {
  auto p = parse({"-l", "chatty"});
  REQUIRE(p.exit_code);
  CHECK(*p.exit_code != 0);
}

TEST_CASE("options-stdio-host") {
  auto p = parse(
      {"-stdio", "-hpid", "1234", "-e", "iso-8859-1", "-pl", "echo", "-z"});
  REQUIRE_FALSE(p.exit_code);
  CHECK(p.env.transport == omni::transport_kind::stdio);
  CHECK(p.env.host_pid == 1234);
  CHECK(p.env.encoding == "iso-8859-1");
  REQUIRE(p.env.plugins.size() == 1);
  CHECK(p.env.plugins[0] == "echo");
  CHECK(p.env.zero_based_indices);
}
