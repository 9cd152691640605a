#include <gtest/gtest.h>
#include <waypoint/common/error.hpp>
#include <waypoint/config/config.hpp>
#include <waypoint/testing/common.hpp>

#include <cstdlib>
#include <sstream>

namespace {

constexpr auto kConfig = std::string_view{R"([relay]
url = https://relay.example/api/

[keys]
user = env:WAYPOINT_TEST_USER_KEY
solver = 0x59c6995e998f97a5a0044966f0945389dc9e86dae88c7a8412f4603b6b78690d

[solver]
poll-interval-ms = 500
watermark-timeout-ms = 60000

[log]
level = debug

[chain.sepolia]
id = 11155111
rpc = https://sepolia.example
delegate = 0xdededededededededededededededededededede
prefund-value = 0x64

[chain.rise]
id = 123420001114
rpc = http://127.0.0.1:8545
delegate = 0xdfdfdfdfdfdfdfdfdfdfdfdfdfdfdfdfdfdfdfdf
)"};

waypoint::config::config_t parse(const std::string_view& text) {
  auto input = std::istringstream{std::string{text}};
  return waypoint::config::parse_config(input);
}

}  // namespace

TEST(config, parses_sections_and_chains_in_order) {
  auto config = parse(kConfig);
  EXPECT_EQ(config.relay_url, "https://relay.example/api/");
  EXPECT_EQ(config.user_key, "env:WAYPOINT_TEST_USER_KEY");
  EXPECT_EQ(config.poll_interval, std::chrono::milliseconds{500});
  EXPECT_EQ(config.watermark_timeout, std::chrono::milliseconds{60000});
  EXPECT_EQ(config.receipt_poll_interval, std::chrono::milliseconds{3000});
  EXPECT_EQ(config.log_level, "debug");

  ASSERT_EQ(config.chains.size(), 2u);
  EXPECT_EQ(config.chains[0].name, "sepolia");
  EXPECT_EQ(config.chains[0].id, waypoint::testing::kChainA);
  EXPECT_EQ(config.chains[0].delegate, waypoint::testing::make_address(0xde));
  EXPECT_EQ(config.chains[0].prefund_value, 100);
  EXPECT_EQ(config.chains[1].name, "rise");
  EXPECT_EQ(config.chains[1].rpc_url, "http://127.0.0.1:8545");
  EXPECT_EQ(config.chains[1].prefund_value, 0);
}

TEST(config, finds_chains_by_id) {
  auto config = parse(kConfig);
  EXPECT_EQ(waypoint::config::find_chain(config, waypoint::testing::kChainB).name,
            "rise");
  EXPECT_THROW(waypoint::config::find_chain(config, 1),
               waypoint::common::error);
}

TEST(config, rejects_bad_chain_sections) {
  EXPECT_THROW(parse("[chain.x]\nid = 1\n"), waypoint::common::error);
  EXPECT_THROW(parse("[chain.x]\nid = one\nrpc = http://x\n"),
               waypoint::common::error);
  EXPECT_THROW(parse("[chain.x]\nrpc = http://x\ncolour = red\n"),
               waypoint::common::error);
  EXPECT_THROW(parse("[chain.x]\nrpc = http://x\ndelegate = 0x12\n"),
               waypoint::common::error);
}

TEST(config, chains_require_id_and_delegate) {
  auto code_of = [](const std::string_view& text) {
    try {
      parse(text);
    } catch (const waypoint::common::error& e) {
      return e.code();
    }
    ADD_FAILURE() << "accepted " << text;
    return waypoint::common::error_code::rpc;
  };

  EXPECT_EQ(code_of("[chain.sepolia]\nrpc = http://localhost:8545\n"),
            waypoint::common::error_code::validation);
  EXPECT_EQ(code_of("[chain.sepolia]\nrpc = http://localhost:8545\n"
                    "delegate = 0xdededededededededededededededededededede\n"),
            waypoint::common::error_code::validation);
  EXPECT_EQ(code_of("[chain.sepolia]\nid = 11155111\n"
                    "rpc = http://localhost:8545\n"),
            waypoint::common::error_code::validation);
  EXPECT_EQ(code_of("[chain.sepolia]\nid = 11155111\n"
                    "rpc = http://localhost:8545\n"
                    "delegate = 0x0000000000000000000000000000000000000000\n"),
            waypoint::common::error_code::validation);
}

TEST(config, malformed_values_raise_validation) {
  try {
    parse("[solver]\npoll-interval-ms = abc\n");
    FAIL() << "accepted a non-numeric poll interval";
  } catch (const waypoint::common::error& e) {
    EXPECT_EQ(e.code(), waypoint::common::error_code::validation);
  }
}

TEST(config, command_line_overrides_file_values) {
  auto description = waypoint::config::make_options_description();
  const char* argv[] = {"waypoint", "--log.level=warn",
                        "--solver.watermark-timeout-ms=5"};
  auto vm = boost::program_options::variables_map{};
  boost::program_options::store(
      boost::program_options::parse_command_line(3, argv, description), vm);
  boost::program_options::notify(vm);

  auto config = waypoint::config::apply_overrides(parse(kConfig), vm);
  EXPECT_EQ(config.log_level, "warn");
  EXPECT_EQ(config.watermark_timeout, std::chrono::milliseconds{5});
  EXPECT_EQ(config.poll_interval, std::chrono::milliseconds{500});
}

TEST(config, resolves_secrets_from_environment) {
  ::setenv("WAYPOINT_TEST_USER_KEY", waypoint::testing::kUserKey.data(), 1);
  auto config = parse(kConfig);
  auto user = waypoint::config::load_signer(config.user_key, "user");
  EXPECT_EQ(user.address(),
            waypoint::schema::make_address(waypoint::testing::kUserAddress));

  auto solver = waypoint::config::load_signer(config.solver_key, "solver");
  EXPECT_EQ(solver.address(),
            waypoint::schema::make_address(waypoint::testing::kSolverAddress));

  ::unsetenv("WAYPOINT_TEST_USER_KEY");
  EXPECT_THROW(waypoint::config::resolve_secret("env:WAYPOINT_TEST_USER_KEY"),
               waypoint::common::error);
  EXPECT_THROW(waypoint::config::load_signer("", "user"),
               waypoint::common::error);
  EXPECT_EQ(waypoint::config::resolve_secret("plain"), "plain");
}

TEST(config, parses_log_levels) {
  EXPECT_EQ(waypoint::config::parse_log_level("debug"), spdlog::level::debug);
  EXPECT_EQ(waypoint::config::parse_log_level("off"), spdlog::level::off);
  EXPECT_THROW(waypoint::config::parse_log_level("verbose"),
               waypoint::common::error);
}
