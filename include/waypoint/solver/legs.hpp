#pragma once

#include <waypoint/chain/client.hpp>
#include <waypoint/config/config.hpp>
#include <waypoint/schema/authorization.hpp>
#include <waypoint/solver/orchestrator.hpp>

#include <memory>

namespace waypoint::solver {

/// The user's authorization for `chain_id` in a signed package. Raises
/// error_code::validation when the package has none.
const waypoint::schema::authorization_t& find_user_authorization(
    const waypoint::schema::authorizations_t& authorizations,
    const waypoint::schema::chain_id_t& chain_id);

/// Leg for a configured chain. A non-zero `prefund-value` becomes a native
/// transfer to `user` ahead of `execute`.
leg_t make_leg(std::shared_ptr<waypoint::chain::client> chain,
               const waypoint::config::chain_config_t& config,
               const waypoint::schema::address_t& user,
               const waypoint::schema::authorization_t& user_authorization);

}  // namespace waypoint::solver
