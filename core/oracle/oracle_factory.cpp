#include "oracle/oracle_factory.hpp"
#include "oracle/fallback_oracle.hpp"
#include "oracle/http_backend.hpp"
#include "oracle/remote_oracle.hpp"
#include "common/logging.hpp"

namespace gamemind {

std::shared_ptr<const SubgoalOracle> makeSubgoalOracle(const OracleConfig& config,
                                                       bool subgoal_generation_enabled) {
    if (!subgoal_generation_enabled) {
        logger()->info("oracle: subgoal generation disabled, using basic rules");
        return std::make_shared<FallbackOracle>(RuleTable::basicRules());
    }
    if (!config.enabled) {
        logger()->info("oracle: remote oracle disabled, using fallback rules");
        return std::make_shared<FallbackOracle>(RuleTable::generatorRules());
    }

    config.validate();
    auto backend = std::make_shared<HttpOracleBackend>(config);
    return std::make_shared<RemoteOracle>(backend, config);
}

} // namespace gamemind
