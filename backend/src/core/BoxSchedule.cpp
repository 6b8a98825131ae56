#include "BoxSchedule.hpp"
#include <stdexcept>
#include <utility>

BoxSchedule::BoxSchedule()
    : weights{ 16, 8, 4, 2, 1 }
{
}

BoxSchedule::BoxSchedule(std::vector<int> boxWeights)
    : weights(std::move(boxWeights))
{
    if (weights.empty())
        throw std::invalid_argument("BoxSchedule needs at least one box");
    for (int w : weights) {
        if (w < 1)
            throw std::invalid_argument("BoxSchedule weights must be positive");
    }
}

BoxSchedule BoxSchedule::halving(int boxCount) {
    if (boxCount < 1 || boxCount > 30)
        throw std::invalid_argument("BoxSchedule::halving: box count must be in [1,30]");

    std::vector<int> w;
    w.reserve(boxCount);
    for (int b = 1; b <= boxCount; ++b) {
        w.push_back(1 << (boxCount - b));
    }
    return BoxSchedule(std::move(w));
}

int BoxSchedule::weightFor(int box) const {
    if (box < 1 || box > boxCount()) return 0;
    return weights[box - 1];
}
