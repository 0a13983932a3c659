// ==============================================================================
// Layer 1: DSP Primitive - Sliding Median Filter
// ==============================================================================
// 1-D running median over strided data, used to smooth magnitude matrices
// along either the time axis (stride = numBins) or the frequency axis
// (stride = 1) without copying the axis out first.
//
// The window is kept as a sorted buffer: each step erases the outgoing sample
// and inserts the incoming one by binary search, so a step costs O(log L)
// comparisons plus one short memmove instead of a full re-sort.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace Raga {
namespace DSP {

// =============================================================================
// Boundary Handling
// =============================================================================

/// @brief How samples outside [0, n) are synthesized
enum class BoundaryMode : uint8_t {
    Reflect,  ///< Half-sample symmetric: d c b a | a b c d | d c b a
    Clamp     ///< Edge replication:      a a a a | a b c d | d d d d
};

[[nodiscard]] constexpr std::string_view boundaryModeName(BoundaryMode mode) noexcept {
    switch (mode) {
        case BoundaryMode::Reflect: return "reflect";
        case BoundaryMode::Clamp:   return "clamp";
    }
    return "unknown";
}

namespace detail {

/// @brief Map a possibly out-of-range index into [0, n)
/// @note Reflect folds repeatedly, so kernels longer than the axis stay valid
[[nodiscard]] constexpr size_t boundaryIndex(
    std::ptrdiff_t index, size_t n, BoundaryMode mode) noexcept {
    const auto len = static_cast<std::ptrdiff_t>(n);
    if (index >= 0 && index < len) {
        return static_cast<size_t>(index);
    }
    if (mode == BoundaryMode::Clamp) {
        return index < 0 ? 0 : n - 1;
    }
    const std::ptrdiff_t period = 2 * len;
    std::ptrdiff_t m = index % period;
    if (m < 0) m += period;
    if (m >= len) m = period - 1 - m;
    return static_cast<size_t>(m);
}

} // namespace detail

// =============================================================================
// SlidingMedian Class
// =============================================================================

/// @brief Running median of odd length over a strided sequence
class SlidingMedian {
public:
    SlidingMedian() noexcept = default;

    /// @brief Set the kernel length and reserve the sorted window
    /// @param length Odd kernel length (even lengths are rounded up)
    void prepare(size_t length) {
        length_ = (length == 0) ? 1 : (length | 1u);
        sorted_.clear();
        sorted_.reserve(length_);
    }

    [[nodiscard]] size_t length() const noexcept { return length_; }
    [[nodiscard]] bool isPrepared() const noexcept { return length_ > 0; }

    /// @brief Median-filter count values
    /// @param input First element; element i is input[i * inStride]
    /// @param count Number of elements along the axis
    /// @param inStride Distance between consecutive input elements
    /// @param output First output element; element i is output[i * outStride]
    /// @param outStride Distance between consecutive output elements
    /// @param mode Boundary extension
    /// @pre input and output do not overlap
    void process(const float* input, size_t count, size_t inStride,
                 float* output, size_t outStride, BoundaryMode mode) {
        if (!isPrepared() || input == nullptr || output == nullptr || count == 0) {
            return;
        }

        const auto radius = static_cast<std::ptrdiff_t>(length_ / 2);
        auto at = [&](std::ptrdiff_t i) {
            return input[detail::boundaryIndex(i, count, mode) * inStride];
        };

        sorted_.clear();
        for (std::ptrdiff_t i = -radius; i <= radius; ++i) {
            insert(at(i));
        }
        output[0] = sorted_[length_ / 2];

        for (size_t pos = 1; pos < count; ++pos) {
            const auto p = static_cast<std::ptrdiff_t>(pos);
            erase(at(p - 1 - radius));
            insert(at(p + radius));
            output[pos * outStride] = sorted_[length_ / 2];
        }
    }

private:
    void insert(float value) {
        sorted_.insert(std::upper_bound(sorted_.begin(), sorted_.end(), value), value);
    }

    void erase(float value) {
        auto it = std::lower_bound(sorted_.begin(), sorted_.end(), value);
        if (it != sorted_.end() && !(value < *it)) {
            sorted_.erase(it);
        }
    }

    std::vector<float> sorted_;
    size_t length_ = 0;
};

} // namespace DSP
} // namespace Raga
