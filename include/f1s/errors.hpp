#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace f1s {

// Base of every error the engine reports to callers.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// A required feature key is missing (training data or request payload).
class SchemaError : public Error {
public:
  explicit SchemaError(std::string field)
    : Error("missing required field: " + field), field_(std::move(field)) {}
  SchemaError(std::string field, const std::string& detail)
    : Error(detail), field_(std::move(field)) {}

  const std::string& field() const { return field_; }

private:
  std::string field_;
};

// Invalid settings, e.g. negative blend weights.
class ConfigError : public Error {
public:
  explicit ConfigError(const std::string& what) : Error(what) {}
};

// Prediction against a domain with no servable artifact.
class NotReadyError : public Error {
public:
  explicit NotReadyError(const std::string& model)
    : Error("model not ready: " + model) {}
};

// Unknown model name or missing artifact on lookup.
class NotFoundError : public Error {
public:
  explicit NotFoundError(const std::string& what) : Error(what) {}
};

// Fitting failed; the previously published artifact stays servable.
class TrainingFailure : public Error {
public:
  explicit TrainingFailure(const std::string& what) : Error(what) {}
};

} // namespace f1s
