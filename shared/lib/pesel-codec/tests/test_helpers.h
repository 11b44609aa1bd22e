/**
 * @file test_helpers.h
 * @brief Shared test helpers for pesel::codec unit tests
 *
 * Deterministic random source so generated numbers can be asserted exactly.
 */

#pragma once

#include <pesel/codec/random_source.h>

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <vector>

namespace test_helpers {

/// Replays a fixed list of values, one per uniform() call
class SequenceRandomSource : public pesel::codec::IRandomSource {
public:
    SequenceRandomSource(std::initializer_list<int> values)
        : values_(values) {}

    int uniform(int bound) override {
        if (next_ >= values_.size()) {
            throw std::out_of_range("SequenceRandomSource exhausted");
        }
        bounds_.push_back(bound);
        return values_[next_++];
    }

    /// Bounds requested so far, in call order
    const std::vector<int>& bounds() const { return bounds_; }
    std::size_t calls() const { return next_; }

private:
    std::vector<int> values_;
    std::vector<int> bounds_;
    std::size_t next_ = 0;
};

/// Always returns the same value
class ConstantRandomSource : public pesel::codec::IRandomSource {
public:
    explicit ConstantRandomSource(int value) : value_(value) {}
    int uniform(int) override { return value_; }

private:
    int value_;
};

} // namespace test_helpers
