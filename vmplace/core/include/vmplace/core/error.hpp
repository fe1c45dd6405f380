#pragma once

#include <stdexcept>
#include <string>

namespace vmplace::core {

/// @brief Base exception for all placement errors.
///
/// All exceptions thrown by the vmplace libraries (except I/O loaders)
/// derive from this class, allowing callers to catch placement-specific
/// errors separately from other `std::runtime_error` exceptions.
///
/// @see InvalidInputError, CapacityError, UnknownCategoryError, PredictorUnavailableError
/// @ingroup core
class PlacementError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when input data fails validation at construction time.
///
/// For example, a host with a negative capacity, a VM with a zero demand,
/// or a telemetry sample carrying a NaN. Raised by the code building the
/// input, never from inside scoring.
///
/// @see make_vm_demand, make_telemetry_sample, HostPool::add_host
/// @ingroup core
class InvalidInputError : public PlacementError {
public:
    using PlacementError::PlacementError;
};

/// @brief Thrown when a host id is added twice to the same pool.
/// @see HostPool::add_host
/// @ingroup core
class DuplicateHostError : public InvalidInputError {
public:
    explicit DuplicateHostError(const std::string& host_id)
        : InvalidInputError("duplicate host id '" + host_id + "'")
        , host_id_(host_id) {}

    /// @brief The id that was already present.
    [[nodiscard]] const std::string& host_id() const noexcept { return host_id_; }

private:
    std::string host_id_;
};

/// @brief Thrown when a debit would drive a host capacity below zero.
///
/// Indicates a caller or ordering bug: the placement engine only debits
/// hosts it has checked for feasibility. The pool is left untouched.
///
/// @see HostPool::debit
/// @ingroup core
class CapacityError : public PlacementError {
public:
    /// @brief Construct a CapacityError with the offending amounts.
    ///
    /// @param host_id    Host that was debited.
    /// @param resource   Resource name ("cpu" or "ram").
    /// @param requested  Amount requested by the debit.
    /// @param available  Remaining capacity at the time of the debit.
    CapacityError(const std::string& host_id, const std::string& resource,
                  double requested, double available)
        : PlacementError(
              "Cannot debit host '" + host_id + "': requested " + resource + " " +
              std::to_string(requested) + " exceeds remaining capacity " +
              std::to_string(available))
        , host_id_(host_id)
        , resource_(resource)
        , requested_(requested)
        , available_(available) {}

    [[nodiscard]] const std::string& host_id() const noexcept { return host_id_; }
    [[nodiscard]] const std::string& resource() const noexcept { return resource_; }
    [[nodiscard]] double requested() const noexcept { return requested_; }
    [[nodiscard]] double available() const noexcept { return available_; }

private:
    std::string host_id_;
    std::string resource_;
    double requested_;
    double available_;
};

/// @brief Thrown when a host id is not part of the pool.
/// @ingroup core
class UnknownHostError : public PlacementError {
public:
    using PlacementError::PlacementError;
};

/// @brief Thrown when an index is outside its valid range.
/// @ingroup core
class OutOfRangeError : public PlacementError {
public:
    using PlacementError::PlacementError;
};

/// @brief Thrown when a categorical label is not in the trained vocabulary.
///
/// Recoverable at the request boundary: the caller should reject the
/// request and can offer the list of known labels.
///
/// @see algo::LabelVocabulary::transform
/// @ingroup core
class UnknownCategoryError : public PlacementError {
public:
    explicit UnknownCategoryError(const std::string& label)
        : PlacementError("label '" + label + "' is not in the vocabulary")
        , label_(label) {}

    /// @brief The label that was rejected.
    [[nodiscard]] const std::string& label() const noexcept { return label_; }

private:
    std::string label_;
};

/// @brief Thrown when the model-assisted path is used before any model is loaded.
/// @see algo::ModelService::recommend
/// @ingroup core
class PredictorUnavailableError : public PlacementError {
public:
    using PlacementError::PlacementError;
};

} // namespace vmplace::core
