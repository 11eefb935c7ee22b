#pragma once

#include <stdexcept>
#include <string>

namespace pv_watch {

/**
 * @brief Not enough samples to build a baseline or train a model
 *
 * Non-fatal during detection: the dependent method is skipped.
 */
class InsufficientDataError : public std::runtime_error {
public:
    InsufficientDataError(const std::string& what, size_t available, size_t required)
        : std::runtime_error(what), available_(available), required_(required) {}

    size_t available() const { return available_; }
    size_t required() const { return required_; }

private:
    size_t available_;
    size_t required_;
};

/**
 * @brief Prediction requested before the model was trained
 */
class ModelNotTrainedError : public std::logic_error {
public:
    explicit ModelNotTrainedError(const std::string& what)
        : std::logic_error(what) {}
};

/**
 * @brief Malformed or out-of-range input, rejected before computation
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Historical or weather data retrieval failed
 */
class UpstreamFetchError : public std::runtime_error {
public:
    explicit UpstreamFetchError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Lifecycle operation on a missing or terminal anomaly
 *
 * NOT_FOUND maps to a 404 at the API layer, CONFLICT to a 409.
 */
class InvalidStateTransitionError : public std::runtime_error {
public:
    enum class Reason {
        NOT_FOUND,
        CONFLICT
    };

    InvalidStateTransitionError(Reason reason, const std::string& anomaly_id,
                                const std::string& what)
        : std::runtime_error(what), reason_(reason), anomaly_id_(anomaly_id) {}

    Reason reason() const { return reason_; }
    const std::string& anomalyId() const { return anomaly_id_; }

private:
    Reason reason_;
    std::string anomaly_id_;
};

} // namespace pv_watch
