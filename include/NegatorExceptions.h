#ifndef NEGATOR_EXCEPTIONS_H
#define NEGATOR_EXCEPTIONS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Negator {

class NegatorException : public std::runtime_error {
public:
    explicit NegatorException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public NegatorException {
public:
    explicit IOException(const std::string& message) : NegatorException("IO Error: " + message) {}
};

class ConfigurationException : public NegatorException {
public:
    explicit ConfigurationException(const std::string& message) : NegatorException("Configuration Error: " + message) {}
};

class InvalidRuleException : public NegatorException {
public:
    explicit InvalidRuleException(const std::string& message) : NegatorException("Invalid Rule: " + message) {}
};

class InvalidRecordException : public NegatorException {
public:
    explicit InvalidRecordException(const std::string& message) : NegatorException("Invalid Record: " + message) {}
};

class ComputationTimeoutException : public NegatorException {
public:
    explicit ComputationTimeoutException(const std::string& message) : NegatorException("Timeout: " + message) {}
};

class PartialBatchFailure : public NegatorException {
public:
    PartialBatchFailure(size_t failedUnits, size_t totalUnits, const std::string& detail)
        : NegatorException("Batch Failure: " + std::to_string(failedUnits) + " of " +
                           std::to_string(totalUnits) + " unit(s) failed" +
                           (detail.empty() ? std::string() : " (" + detail + ")")),
          failedUnits_(failedUnits),
          totalUnits_(totalUnits) {}

    size_t failedUnits() const noexcept { return failedUnits_; }
    size_t totalUnits() const noexcept { return totalUnits_; }

private:
    size_t failedUnits_;
    size_t totalUnits_;
};

} // namespace Negator

#endif // NEGATOR_EXCEPTIONS_H
