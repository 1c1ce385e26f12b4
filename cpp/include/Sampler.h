#pragma once
/**
 * @file Sampler.h
 * @brief Abstract and concrete enumerators of dose/frequency combinations.
 */
#include <cstdint>
#include <memory>
#include <vector>
#include "Person.h"

namespace vialsim {
    /**
     * @brief One concrete combination: a dose rate and an interval per person, in input order.
     */
    struct Draw {
        uint64_t ordinal; /**< position in the full enumeration, used for stable ranking */
        std::vector<double> doseRates;
        std::vector<int> frequencies;
    };


    /**
     * @brief Abstract base class for all combination samplers.
     *
     * Defines a uniform interface so Sweep can fork off N thread-local samplers from a single prototype.
     */
    class Sampler {
    public:
        virtual ~Sampler() = default;

        /**
         * @brief Fork this prototype into `numThreads` independent samplers over disjoint segments.
         * @param numThreads  Number of worker threads to spawn.
         * @return            A vector of `numThreads` unique_ptrs to new Sampler instances.
         */
        virtual std::vector<std::unique_ptr<Sampler>> split(int numThreads) const = 0;

        /**
         * @brief Draw up to n combinations in one batch.
         * @param n  Number of draws requested.
         * @return   A vector of Draw (fewer than n once the segment is exhausted).
         */
        virtual std::vector<Draw> sampleBlock(int n) = 0;

        /**
         * @brief Check if the sampler has handed out its whole segment.
         * @return True if nothing is left, false if more draws are available.
         */
        virtual bool hasFinished() const = 0;

        /** @brief Number of draws in this sampler's segment. */
        virtual uint64_t size() const = 0;
    };


    /**
     * @brief Full Cartesian product over every person's dose rates and frequencies.
     *
     * Dimensions are ordered [p0.rates, p0.freqs, p1.rates, p1.freqs, ...] and the last one varies
     * fastest, so ordinals follow the lexicographic product order.
     */
    class CartesianSampler final : public Sampler {
    public:
        /**
         * @param people  Non-empty list of people to enumerate.
         * @throws std::invalid_argument if people is empty
         * @throws std::overflow_error if the product does not fit in 64 bits
         */
        explicit CartesianSampler(const std::vector<Person>& people);

        /**
         * @brief Fork-constructor restricted to ordinals [segBegin, segEnd).
         */
        CartesianSampler(const CartesianSampler& other, uint64_t segBegin, uint64_t segEnd);

        std::vector<std::unique_ptr<Sampler>> split(int numThreads) const override;
        std::vector<Draw> sampleBlock(int n) override;
        bool hasFinished() const override { return current_ >= segEnd_; }
        uint64_t size() const override { return segEnd_ - segBegin_; }

        /** @brief Decode one ordinal of the full product. */
        Draw at(uint64_t ordinal) const;

        /** @brief Size of the full product, independent of the segment. */
        uint64_t total() const noexcept { return total_; }

    private:
        std::shared_ptr<const std::vector<Person>> people_;
        uint64_t total_;

        const uint64_t segBegin_;
        const uint64_t segEnd_;
        uint64_t current_;
    };


    /**
     * @brief A sampler that hands out a fixed list of Draws.
     *
     * Each thread only ever sees the draws in its own segment of the global list.
     */
    class PreselectedSampler final : public Sampler {
    public:
        /**
         * @brief Construct the root prototype. Ordinals are reassigned to list positions.
         * @param draws      Full list of pre-chosen draws, all of the same width.
         * @throws std::invalid_argument if widths differ or a rate/frequency pair is missing
         */
        explicit PreselectedSampler(const std::vector<Draw>& draws);

        /**
         * @brief Fork-constructor for each thread, restricted to [segBegin, segEnd).
         * @param sharedDraws  Shared pointer to the full draws list.
         * @param segBegin     Inclusive start index into *sharedDraws.
         * @param segEnd       Exclusive end index.
         */
        PreselectedSampler(std::shared_ptr<const std::vector<Draw>> sharedDraws, size_t segBegin, size_t segEnd);

        std::vector<std::unique_ptr<Sampler>> split(int numThreads) const override;
        std::vector<Draw> sampleBlock(int n) override;
        bool hasFinished() const override;
        uint64_t size() const override { return segEnd_ - segBegin_; }

    private:
        std::shared_ptr<const std::vector<Draw>> draws_;

        /* Segment bounds within draws_: each thread only serves [segBegin_, segEnd_). */
        const size_t segBegin_;
        const size_t segEnd_;

        size_t currentIdx_; /* absolute index in draws_ */
    };
}
