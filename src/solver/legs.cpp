#include <waypoint/common/error.hpp>
#include <waypoint/solver/legs.hpp>

#include <algorithm>

namespace waypoint::solver {

const waypoint::schema::authorization_t& find_user_authorization(
    const waypoint::schema::authorizations_t& authorizations,
    const waypoint::schema::chain_id_t& chain_id) {
  auto it = std::find_if(
      std::begin(authorizations), std::end(authorizations),
      [&](const auto& value) { return value.chain_id == chain_id; });
  if (it == std::end(authorizations)) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "signed intent has no user authorization for chain " +
                                waypoint::schema::to_decimal(chain_id));
  }
  return *it;
}

leg_t make_leg(std::shared_ptr<waypoint::chain::client> chain,
               const waypoint::config::chain_config_t& config,
               const waypoint::schema::address_t& user,
               const waypoint::schema::authorization_t& user_authorization) {
  auto leg = leg_t{.chain = std::move(chain),
                   .delegate = config.delegate,
                   .user_authorization = user_authorization,
                   .prefund_calls = {}};
  if (config.prefund_value > 0) {
    leg.prefund_calls.push_back(waypoint::schema::call_t{
        .to = user, .value = config.prefund_value, .data = {}});
  }
  return leg;
}

}  // namespace waypoint::solver
