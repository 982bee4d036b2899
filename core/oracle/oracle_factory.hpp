#pragma once

#include "oracle/subgoal_oracle.hpp"
#include "oracle/oracle_config.hpp"

#include <memory>

namespace gamemind {

/// Pick the oracle variant once, at construction time:
///   subgoal generation off → FallbackOracle with the basic rules
///   oracle disabled        → FallbackOracle with the generator rules
///   otherwise              → RemoteOracle over HttpOracleBackend
/// Throws ConfigError if an enabled oracle config is invalid.
std::shared_ptr<const SubgoalOracle> makeSubgoalOracle(const OracleConfig& config,
                                                       bool subgoal_generation_enabled);

} // namespace gamemind
