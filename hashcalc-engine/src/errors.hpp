#ifndef HASHCALC_ERRORS_HPP
#define HASHCALC_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace hashcalc {

// Base class for all engine failures that abort a simulation call.
// Soft conditions (capacity, deficit months, trend warnings) are never thrown;
// they are returned in the result's warning/flag list.
class HashCalcError : public std::runtime_error {
public:
    explicit HashCalcError(const std::string& message)
        : std::runtime_error(message) {}
};

// Input rejected before simulation begins (allocation mismatch, bad enum value, ...)
class ValidationError : public HashCalcError {
public:
    explicit ValidationError(const std::string& message)
        : HashCalcError("Validation failed: " + message) {}
};

// Forecast requested on too short a history
class DataInsufficiencyError : public HashCalcError {
public:
    DataInsufficiencyError(size_t available, size_t required)
        : HashCalcError("Insufficient history: " + std::to_string(available) +
                        " months available, at least " + std::to_string(required) +
                        " required"),
          available_(available), required_(required) {}

    size_t available() const { return available_; }
    size_t required() const { return required_; }

private:
    size_t available_;
    size_t required_;
};

// No candidate model could be fitted
class ModelFitError : public HashCalcError {
public:
    ModelFitError(const std::string& message, std::vector<std::string> attempted)
        : HashCalcError(message + build_suffix(attempted)),
          attempted_(std::move(attempted)) {}

    const std::vector<std::string>& attempted() const { return attempted_; }

private:
    std::vector<std::string> attempted_;

    static std::string build_suffix(const std::vector<std::string>& attempted) {
        if (attempted.empty()) return "";
        std::string s = " (attempted: ";
        for (size_t i = 0; i < attempted.size(); ++i) {
            if (i > 0) s += ", ";
            s += attempted[i];
        }
        return s + ")";
    }
};

// Historical series could not be fetched or decoded
class DataUnavailableError : public HashCalcError {
public:
    explicit DataUnavailableError(const std::string& message)
        : HashCalcError(message) {}
};

} // namespace hashcalc

#endif // HASHCALC_ERRORS_HPP
