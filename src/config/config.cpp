#include <waypoint/common/error.hpp>
#include <waypoint/config/config.hpp>

#include <algorithm>
#include <cstdlib>
#include <map>

namespace waypoint::config {

namespace {

namespace po = boost::program_options;

constexpr auto kChainPrefix = std::string_view{"chain."};
constexpr auto kEnvPrefix = std::string_view{"env:"};

waypoint::schema::uint256_t parse_uint256(const std::string& value,
                                          const std::string& key) {
  auto parsed = waypoint::schema::try_parse_uint256(value);
  if (!parsed) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            key + " is not a non-negative integer: " + value);
  }
  return *parsed;
}

void set_chain_field(chain_config_t& chain,
                     const std::string& field,
                     const std::string& value,
                     const std::string& key) {
  if (field == "id") {
    chain.id = parse_uint256(value, key);
  } else if (field == "rpc") {
    chain.rpc_url = value;
  } else if (field == "delegate") {
    chain.delegate = waypoint::schema::make_address(value);
  } else if (field == "prefund-value") {
    chain.prefund_value = parse_uint256(value, key);
  } else {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "unknown chain setting " + key);
  }
}

void read_values(config_t& config, const po::variables_map& vm) {
  if (vm.contains("relay.url")) {
    config.relay_url = vm["relay.url"].as<std::string>();
  }
  if (vm.contains("keys.user")) {
    config.user_key = vm["keys.user"].as<std::string>();
  }
  if (vm.contains("keys.solver")) {
    config.solver_key = vm["keys.solver"].as<std::string>();
  }
  if (vm.contains("solver.poll-interval-ms")) {
    config.poll_interval = std::chrono::milliseconds{
        vm["solver.poll-interval-ms"].as<uint64_t>()};
  }
  if (vm.contains("solver.watermark-timeout-ms")) {
    config.watermark_timeout = std::chrono::milliseconds{
        vm["solver.watermark-timeout-ms"].as<uint64_t>()};
  }
  if (vm.contains("solver.receipt-poll-interval-ms")) {
    config.receipt_poll_interval = std::chrono::milliseconds{
        vm["solver.receipt-poll-interval-ms"].as<uint64_t>()};
  }
  if (vm.contains("log.level")) {
    config.log_level = vm["log.level"].as<std::string>();
  }
  if (vm.contains("log.file")) {
    config.log_file = vm["log.file"].as<std::string>();
  }
}

}  // namespace

po::options_description make_options_description() {
  auto description = po::options_description{"waypoint settings"};
  description.add_options()("relay.url", po::value<std::string>(),
                            "relay base URL")(
      "keys.user", po::value<std::string>(),
      "user private key (hex or env:NAME)")(
      "keys.solver", po::value<std::string>(),
      "solver private key (hex or env:NAME)")(
      "solver.poll-interval-ms", po::value<uint64_t>(),
      "watermark poll interval")("solver.watermark-timeout-ms",
                                 po::value<uint64_t>(),
                                 "watermark deadline, 0 waits forever")(
      "solver.receipt-poll-interval-ms", po::value<uint64_t>(),
      "receipt poll interval")("log.level", po::value<std::string>(),
                               "trace|debug|info|warn|error|critical|off")(
      "log.file", po::value<std::string>(), "also log to this file");
  return description;
}

config_t parse_config(std::istream& input) {
  auto description = make_options_description();
  auto parsed = po::parsed_options{&description};
  auto vm = po::variables_map{};
  try {
    parsed = po::parse_config_file(input, description, true);
    po::store(parsed, vm);
    po::notify(vm);
  } catch (const po::error& e) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            std::string{"invalid config: "} + e.what());
  }

  auto config = config_t{};
  read_values(config, vm);

  // Sections keep their first-seen order.
  auto index = std::map<std::string, std::size_t>{};
  for (const auto& option : parsed.options) {
    if (!option.unregistered ||
        !std::string_view{option.string_key}.starts_with(kChainPrefix)) {
      continue;
    }
    auto rest = option.string_key.substr(kChainPrefix.size());
    auto dot = rest.find('.');
    if (dot == std::string::npos || dot == 0 || option.value.empty()) {
      waypoint::common::raise(waypoint::common::error_code::validation,
                              "malformed chain setting " + option.string_key);
    }
    auto name = rest.substr(0, dot);
    auto [it, inserted] = index.emplace(name, config.chains.size());
    if (inserted) {
      config.chains.push_back(chain_config_t{.name = name});
    }
    set_chain_field(config.chains[it->second], rest.substr(dot + 1),
                    option.value.front(), option.string_key);
  }

  for (const auto& chain : config.chains) {
    if (chain.rpc_url.empty()) {
      waypoint::common::raise(waypoint::common::error_code::validation,
                              "chain." + chain.name + ".rpc is required");
    }
    if (chain.id == 0) {
      waypoint::common::raise(waypoint::common::error_code::validation,
                              "chain." + chain.name + ".id is required");
    }
    // A zero delegate clears the accounts' code instead of delegating.
    if (chain.delegate == waypoint::schema::address_t{}) {
      waypoint::common::raise(waypoint::common::error_code::validation,
                              "chain." + chain.name + ".delegate is required");
    }
  }
  return config;
}

config_t apply_overrides(config_t base, const po::variables_map& vm) {
  read_values(base, vm);
  return base;
}

std::string resolve_secret(const std::string& secret) {
  if (!std::string_view{secret}.starts_with(kEnvPrefix)) {
    return secret;
  }
  auto name = secret.substr(kEnvPrefix.size());
  const auto* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "environment variable " + name + " is not set");
  }
  return value;
}

waypoint::crypto::signer load_signer(const std::string& secret,
                                     const std::string_view& role) {
  if (secret.empty()) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "keys." + std::string{role} + " is not configured");
  }
  return waypoint::crypto::signer::from_hex(resolve_secret(secret));
}

spdlog::level::level_enum parse_log_level(const std::string& level) {
  auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "unknown log level " + level);
  }
  return parsed;
}

const chain_config_t& find_chain(const config_t& config,
                                 const waypoint::schema::chain_id_t& chain_id) {
  auto it = std::find_if(
      std::begin(config.chains), std::end(config.chains),
      [&](const auto& chain) { return chain.id == chain_id; });
  if (it == std::end(config.chains)) {
    waypoint::common::raise(
        waypoint::common::error_code::validation,
        "no chain section configures id " +
            waypoint::schema::to_decimal(chain_id));
  }
  return *it;
}

}  // namespace waypoint::config
