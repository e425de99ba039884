/**
 * @file errors.hpp
 * @brief Typed error conditions raised by the portfolio engine.
 *
 * Each condition derives from the standard exception that best matches its
 * meaning (so existing catch sites for std::invalid_argument or
 * std::runtime_error keep working) and from the EngineError marker, so a
 * caller can handle every engine failure as one family:
 *
 * @code
 * try {
 *     auto point = calculator.metrics(table, weights);
 * } catch (const explorer::EngineError &e) {
 *     std::cerr << "Engine error: " << e.message() << "\n";
 * }
 * @endcode
 */

#ifndef EXPLORER_CORE_ERRORS_HPP
#define EXPLORER_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace explorer
{
    /**
     * @class EngineError
     * @brief Marker base for every error condition raised by the engine.
     */
    class EngineError
    {
    public:
        virtual ~EngineError() = default;

        /**
         * @brief Human readable description of the failure.
         */
        virtual const char *message() const noexcept = 0;
    };

    /**
     * @class InsufficientDataError
     * @brief Too little price history to compute the requested statistics.
     *
     * Recoverable by the caller re-fetching a longer window or dropping the asset.
     */
    class InsufficientDataError : public std::runtime_error, public EngineError
    {
    public:
        explicit InsufficientDataError(const std::string &what)
            : std::runtime_error(what) {}

        const char *message() const noexcept override { return what(); }
    };

    /**
     * @class InvalidWeightsError
     * @brief Caller supplied weights are malformed (wrong length, non-positive sum, ...).
     */
    class InvalidWeightsError : public std::invalid_argument, public EngineError
    {
    public:
        explicit InvalidWeightsError(const std::string &what)
            : std::invalid_argument(what) {}

        const char *message() const noexcept override { return what(); }
    };

    /**
     * @class DegenerateRiskError
     * @brief Portfolio risk is numerically zero, so the Sharpe ratio is undefined.
     */
    class DegenerateRiskError : public std::runtime_error, public EngineError
    {
    public:
        explicit DegenerateRiskError(const std::string &what)
            : std::runtime_error(what) {}

        const char *message() const noexcept override { return what(); }
    };

    /**
     * @class EmptyPopulationError
     * @brief A selector was invoked on a population with no sampled portfolios.
     */
    class EmptyPopulationError : public std::logic_error, public EngineError
    {
    public:
        explicit EmptyPopulationError(const std::string &what)
            : std::logic_error(what) {}

        const char *message() const noexcept override { return what(); }
    };

    /**
     * @class IndexOutOfRangeError
     * @brief A stale or adversarial index was passed to the selection resolver.
     */
    class IndexOutOfRangeError : public std::out_of_range, public EngineError
    {
    public:
        explicit IndexOutOfRangeError(const std::string &what)
            : std::out_of_range(what) {}

        const char *message() const noexcept override { return what(); }
    };

} // namespace explorer

#endif // EXPLORER_CORE_ERRORS_HPP
