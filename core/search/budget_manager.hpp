#pragma once

#include <chrono>

namespace gamemind {

/// Fixed simulation budget for one search run.
/// Counts iterations against the limit and times the run; it never
/// stops a search early on wall-clock time.
class BudgetManager {
public:
    explicit BudgetManager(int max_simulations)
        : max_simulations_(max_simulations) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        simulations_ = 0;
    }

    void recordSimulation() { simulations_++; }

    bool canContinue() const { return simulations_ < max_simulations_; }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int simulations() const { return simulations_; }

private:
    int max_simulations_;
    int simulations_ = 0;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace gamemind
