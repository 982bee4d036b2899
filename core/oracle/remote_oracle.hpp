#pragma once

#include "oracle/subgoal_oracle.hpp"
#include "oracle/fallback_oracle.hpp"
#include "oracle/oracle_backend.hpp"
#include "oracle/oracle_config.hpp"

#include <memory>
#include <optional>

namespace gamemind {

// ─── Remote Oracle ─────────────────────────────────────────────
// Asks an OracleBackend for a decomposition and parses the free text.
// Any failure (unreachable backend, timeout, empty or unparseable
// answer) is answered by the embedded FallbackOracle instead.
//
// If the construction-time probe fails the oracle disables itself and
// every later call goes straight to the fallback.
//
// Safe for concurrent use when the backend is (HttpOracleBackend is).

class RemoteOracle : public SubgoalOracle {
public:
    RemoteOracle(std::shared_ptr<const OracleBackend> backend,
                 OracleConfig config,
                 FallbackOracle fallback = FallbackOracle());

    std::vector<std::string> generateSubgoals(
        const std::string& goal, const Observation* current_state) const override;

    TaskAnalysis analyzeTask(const std::string& task) const override;

    std::string name() const override { return "remote"; }

    /// False once the startup probe failed.
    bool available() const { return available_; }

private:
    std::shared_ptr<const OracleBackend> backend_;
    OracleConfig config_;
    FallbackOracle fallback_;
    bool available_ = true;

    void probe();

    /// Backend call with exceptions mapped to std::nullopt.
    std::optional<std::string> ask(const GenerateRequest& request) const;
};

} // namespace gamemind
