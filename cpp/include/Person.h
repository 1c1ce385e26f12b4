#pragma once
/**
 * @file Person.h
 * @brief One participant of a sweep: a name plus candidate dose rates and injection intervals.
 */
#include <string>
#include <stdexcept>
#include <vector>

namespace vialsim {
    /**
     * @brief Build a half-open range [start, stop) with numpy `arange` semantics.
     *
     * The count is ceil((stop - start) / step) and element i is start + i * step, so floating-point
     * error can add one element close to `stop` (0.038..0.042 step 0.001 yields 5 values).
     *
     * @throws std::invalid_argument if step <= 0 or any bound is not finite
     */
    std::vector<double> doseRange(double start, double stop, double step);

    /** @brief True if `name` is usable as an expression variable prefix. */
    bool isIdentifier(const std::string& name) noexcept;

    /**
     * @brief One person's configured search space.
     */
    struct Person {
        const std::string name; /**< unique within a sweep */
        const std::vector<double> doseRates; /**< candidate mL/day values */
        const std::vector<int> frequencies; /**< candidate days between injections */

        /**
         * @param name_         identifier ([A-Za-z][A-Za-z0-9_]*)
         * @param doseRates_    non-empty list of finite rates
         * @param frequencies_  non-empty list of intervals, each >= 1
         * @throws std::invalid_argument on any violation
         */
        Person(const std::string& name_, const std::vector<double>& doseRates_, const std::vector<int>& frequencies_);

        /** @brief Number of (rate, frequency) combinations this person contributes. */
        size_t combinations() const noexcept { return doseRates.size() * frequencies.size(); }
    };

    /**
     * @brief Collect names in input order.
     * @throws std::invalid_argument if a name repeats or the list is empty
     */
    std::vector<std::string> uniqueNames(const std::vector<Person>& people);
}
