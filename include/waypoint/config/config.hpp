#pragma once

#include <waypoint/crypto/signer.hpp>
#include <waypoint/schema/primitives.hpp>

#include <boost/program_options.hpp>
#include <spdlog/common.h>

#include <chrono>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint::config {

/// One `[chain.<name>]` section.
struct chain_config_t final {
  std::string name;
  waypoint::schema::chain_id_t id;
  std::string rpc_url;
  waypoint::schema::address_t delegate;
  // Native value the solver forwards to the user ahead of `execute`.
  waypoint::schema::uint256_t prefund_value;
};

struct config_t final {
  std::string relay_url;
  // Hex private key or `env:NAME`.
  std::string user_key;
  std::string solver_key;
  std::vector<chain_config_t> chains;
  std::chrono::milliseconds poll_interval{3000};
  std::chrono::milliseconds watermark_timeout{0};
  std::chrono::milliseconds receipt_poll_interval{3000};
  std::string log_level{"info"};
  std::string log_file;
};

/// Options shared by the command line and the config file.
boost::program_options::options_description make_options_description();

/// Read an INI document. Unknown keys outside `chain.*` are ignored.
config_t parse_config(std::istream& input);

/// Overlay command-line values on `base`.
config_t apply_overrides(config_t base,
                         const boost::program_options::variables_map& vm);

/// `env:NAME` reads the environment variable, anything else is returned
/// as-is. Raises error_code::validation for unset variables.
std::string resolve_secret(const std::string& secret);

waypoint::crypto::signer load_signer(const std::string& secret,
                                     const std::string_view& role);

spdlog::level::level_enum parse_log_level(const std::string& level);

/// Raises error_code::validation when no section configures `chain_id`.
const chain_config_t& find_chain(const config_t& config,
                                 const waypoint::schema::chain_id_t& chain_id);

}  // namespace waypoint::config
