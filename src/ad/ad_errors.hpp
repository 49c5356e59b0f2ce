/// \file ad_errors.hpp
/// \brief Exception hierarchy for the differentiation engine.
/// \ingroup ad

#pragma once

#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace fwdiff
{

/// \brief Base class for all errors raised by the engine.
class ad_error : public std::runtime_error {
  public:
    explicit ad_error(std::string message) : std::runtime_error(std::move(message)) {}
};

/// \brief Base class for errors that concern a particular operation.
class operation_error : public ad_error {
  public:
    operation_error(std::string operation, std::string message)
        : ad_error(std::move(message)), operation_(std::move(operation))
    {}

    /// \brief Name of the operation that caused the error.
    std::string const& operation() const noexcept { return operation_; }

  private:
    std::string operation_;
};

/// \brief Raised when a rule is registered for an operation that already has one.
class duplicate_rule : public operation_error {
  public:
    explicit duplicate_rule(std::string const& op)
        : operation_error(op, "a differentiation rule for operation '" + op + "' is already registered")
    {}
};

/// \brief Raised when a rule is registered after the registry has been frozen.
class registry_frozen : public operation_error {
  public:
    explicit registry_frozen(std::string const& op)
        : operation_error(op, "cannot register a rule for operation '" + op +
                                  "': the rule registry is frozen once evaluation has begun")
    {}
};

/// \brief Raised when an operation has no registered rule, or is applied to operands it cannot accept.
class unsupported_operation : public operation_error {
  public:
    explicit unsupported_operation(std::string const& op)
        : operation_error(op, "no differentiation rule is registered for operation '" + op + "'")
    {}

    unsupported_operation(std::string const& op, std::string const& reason)
        : operation_error(op, "operation '" + op + "': " + reason)
    {}
};

/// \brief Raised when a statement list contains a statement that cannot be rewritten.
class unsupported_expression : public ad_error {
  public:
    explicit unsupported_expression(std::string message, std::string operation = {})
        : ad_error(std::move(message)), operation_(std::move(operation))
    {}

    /// \brief Name of the offending operation, or empty if the failure is not about an operation.
    std::string const& operation() const noexcept { return operation_; }

  private:
    std::string operation_;
};

/// \brief Raised when a function cannot be evaluated over Dual operands.
class incompatible_function_signature : public ad_error {
  public:
    explicit incompatible_function_signature(std::string const& function, std::string const& reason)
        : ad_error("function of type '" + function + "' " + reason)
    {}
};

/// \brief Raised when a value or tangent becomes NaN or infinite.
class numerical_instability : public operation_error {
  public:
    numerical_instability(std::string const& op, double value, double tangent)
        : operation_error(op, fmt::format("operation '{}' produced a non-finite result (value {}, tangent {})", op,
                                          value, tangent)),
          value_(value), tangent_(tangent)
    {}

    double value() const noexcept { return value_; }
    double tangent() const noexcept { return tangent_; }

  private:
    double value_;
    double tangent_;
};

} // namespace fwdiff
