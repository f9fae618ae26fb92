#pragma once

#include "tracing/irandom_source.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace tracectx::testing {

/**
 * @brief Mock random source replaying a fixed sequence of words
 *
 * Wraps around when the sequence is exhausted. The sequence must not
 * be empty.
 */
class MockRandomSource : public IRandomSource {
public:
    explicit MockRandomSource(std::vector<uint64_t> values)
        : values_(std::move(values)) {
        if (values_.empty()) {
            throw std::invalid_argument("MockRandomSource needs at least one value");
        }
    }

    [[nodiscard]] uint64_t next() override {
        const uint64_t value = values_[call_count_ % values_.size()];
        ++call_count_;
        return value;
    }

    [[nodiscard]] size_t call_count() const { return call_count_; }

private:
    std::vector<uint64_t> values_;
    size_t call_count_ = 0;
};

} // namespace tracectx::testing
