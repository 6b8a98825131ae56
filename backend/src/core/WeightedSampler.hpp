#pragma once
#include <algorithm>
#include <cstdint>
#include <random>
#include <vector>

/*
  Discrete weighted sampling over non-negative integer weights.

  Index i owns the half-open range [c(i-1), c(i)) of the cumulative sums, so a
  draw that lands exactly on a boundary goes to the later index and a
  zero-weight index is never chosen. With every draw in [0, total) this picks
  the same index as walking the weights in order and subtracting each one
  until the draw falls below it.
*/
class WeightedSampler {
public:
    explicit WeightedSampler(const std::vector<int>& weights) {
        cumulative.reserve(weights.size());
        std::int64_t running = 0;
        for (int w : weights) {
            if (w > 0) running += w;
            cumulative.push_back(running);
        }
    }

    std::int64_t totalWeight() const {
        return cumulative.empty() ? 0 : cumulative.back();
    }

    bool empty() const { return totalWeight() == 0; }

    // draw must be in [0, totalWeight())
    std::size_t indexFor(std::int64_t draw) const {
        auto it = std::upper_bound(cumulative.begin(), cumulative.end(), draw);
        return static_cast<std::size_t>(it - cumulative.begin());
    }

    // Caller checks empty() first.
    template <typename Engine>
    std::size_t sample(Engine& rng) const {
        std::uniform_int_distribution<std::int64_t> dist(0, totalWeight() - 1);
        return indexFor(dist(rng));
    }

private:
    std::vector<std::int64_t> cumulative;
};
