#include "Records.h"
#include "CommonUtils.h"
#include "NegatorExceptions.h"

#include <cmath>
#include <initializer_list>

MatchType parseMatchType(const std::string& raw) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(raw));
    if (v == "exact") return MatchType::EXACT;
    if (v == "phrase") return MatchType::PHRASE;
    if (v == "broad") return MatchType::BROAD;
    throw Negator::InvalidRuleException("unrecognized match type '" + raw + "' (expected exact|phrase|broad)");
}

std::string matchTypeName(MatchType type) {
    switch (type) {
        case MatchType::EXACT: return "EXACT";
        case MatchType::PHRASE: return "PHRASE";
        case MatchType::BROAD: return "BROAD";
    }
    return "BROAD";
}

std::string impactRatingName(ImpactRating rating) {
    switch (rating) {
        case ImpactRating::CRITICAL: return "CRITICAL";
        case ImpactRating::HIGH: return "HIGH";
        case ImpactRating::MEDIUM: return "MEDIUM";
        case ImpactRating::LOW: return "LOW";
    }
    return "LOW";
}

namespace RecordMetrics {

double clickThroughRate(const SearchTermRecord& r) {
    return CommonUtils::safeRatio(clicks(r), impressions(r)) * 100.0;
}

double costPerClick(const SearchTermRecord& r) {
    return CommonUtils::safeRatio(cost(r), clicks(r));
}

bool isWastedSpend(const SearchTermRecord& r) {
    return cost(r) > 0.0 && conversions(r) == 0.0;
}

PoorPerformerPredicate defaultPoorPerformer() {
    return [](const SearchTermRecord& r) { return isWastedSpend(r); };
}

size_t repairNumericFields(SearchTermRecord& r) {
    size_t repaired = 0;
    for (std::optional<double>* field : {&r.impressions, &r.clicks, &r.cost, &r.conversions}) {
        if (field->has_value() && !std::isfinite(**field)) {
            field->reset();
            ++repaired;
        }
    }
    return repaired;
}

} // namespace RecordMetrics
