#pragma once

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <utility>

/**
 * @brief A double constrained to [Lo, Hi] at construction.
 * @details Out-of-range inputs are clamped and NaN collapses to Lo, so a weighted sum of
 *          these values can never leave the range implied by its weights.
 */
template <int Lo, int Hi>
class BoundedScore {
    static_assert(Lo < Hi, "BoundedScore requires a non-empty range");

public:
    static constexpr double kMin = static_cast<double>(Lo);
    static constexpr double kMax = static_cast<double>(Hi);

    constexpr BoundedScore() noexcept : value_(kMin) {}
    explicit BoundedScore(double raw) noexcept : value_(clamp(raw)) {}

    double value() const noexcept { return value_; }

    friend bool operator==(BoundedScore a, BoundedScore b) noexcept { return a.value_ == b.value_; }
    friend bool operator!=(BoundedScore a, BoundedScore b) noexcept { return a.value_ != b.value_; }
    friend bool operator<(BoundedScore a, BoundedScore b) noexcept { return a.value_ < b.value_; }
    friend bool operator>(BoundedScore a, BoundedScore b) noexcept { return a.value_ > b.value_; }

private:
    static double clamp(double raw) noexcept {
        if (std::isnan(raw)) return kMin;
        return std::min(kMax, std::max(kMin, raw));
    }

    double value_;
};

// Sub-scores feeding a weighted total.
using UnitScore = BoundedScore<0, 1>;
// Percent-scale scores exposed to callers (confidence, action).
using PercentScore = BoundedScore<0, 100>;
using ConfidenceScore = PercentScore;

/**
 * @brief Combines weighted unit scores into a percent score.
 * @pre weights are non-negative and sum to at most 1 (EngineConfig::validate enforces this).
 */
inline PercentScore weightedPercent(std::initializer_list<std::pair<double, UnitScore>> terms) {
    double total = 0.0;
    for (const auto& [weight, score] : terms) {
        total += std::max(0.0, weight) * score.value();
    }
    return PercentScore(100.0 * total);
}
