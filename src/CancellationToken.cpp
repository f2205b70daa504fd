#include "CancellationToken.h"
#include "NegatorExceptions.h"

CancellationToken::CancellationToken(std::chrono::milliseconds budget)
    : deadline_(budget.count() > 0 ? std::optional<Clock::time_point>(Clock::now() + budget) : std::nullopt),
      budget_(budget) {}

bool CancellationToken::expired() const {
    if (isCancelled()) return true;
    return deadline_.has_value() && Clock::now() >= *deadline_;
}

void CancellationToken::checkpoint(const char* stage) {
    if (!expired()) return;
    cancel();
    throw Negator::ComputationTimeoutException(
        std::string("unit exceeded its ") + std::to_string(budget_.count()) +
        " ms budget during " + (stage ? stage : "processing"));
}

void CancellationToken::checkpointEvery(size_t stride, const char* stage) {
    if (isCancelled() || stride <= 1 || ++ticks_ % stride == 0) {
        checkpoint(stage);
    }
}
