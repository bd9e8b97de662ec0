#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "datatypes.hpp"

namespace core {

    class CascadeException : public std::runtime_error {
    public:
        explicit CascadeException(const std::string& message)
            : std::runtime_error(message) {}

        explicit CascadeException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public CascadeException {
    public: using CascadeException::CascadeException; };

    class DataLoadException : public CascadeException {
    public: using CascadeException::CascadeException; };

    class IndicatorCalculationException : public CascadeException {
    public: using CascadeException::CascadeException; };

    class StageException : public CascadeException {
    public: using CascadeException::CascadeException; };

    class BacktestException : public CascadeException {
    public: using CascadeException::CascadeException; };

    // Illegal lifecycle transition on a position
    class PositionStateException : public CascadeException {
    public: using CascadeException::CascadeException; };

    // Performance statistics requested from too few equity points
    class InsufficientDataException : public CascadeException {
    public: using CascadeException::CascadeException; };

    // Post-step accounting check failed. Carries enough state to reproduce.
    class InvariantViolationException : public CascadeException {
    public:
        InvariantViolationException(const std::string& message,
                                    std::size_t step_index,
                                    Timestamp step_time,
                                    std::string state_snapshot)
            : CascadeException(message),
              step_index_(step_index),
              step_time_(step_time),
              state_snapshot_(std::move(state_snapshot)) {}

        std::size_t stepIndex() const { return step_index_; }
        Timestamp stepTime() const { return step_time_; }
        // JSON dump of the staged portfolio that failed the check
        const std::string& stateSnapshot() const { return state_snapshot_; }

    private:
        std::size_t step_index_;
        Timestamp step_time_;
        std::string state_snapshot_;
    };

} // namespace core
