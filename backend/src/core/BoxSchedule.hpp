#pragma once
#include <vector>

/*
  Number of Leitner boxes and how often each one is drawn from.
  Box b (1-based) has weight weights[b - 1]; a card whose box is above
  boxCount() is mastered and never selected again.
*/
class BoxSchedule {
public:
    // 5 boxes weighted 16, 8, 4, 2, 1
    BoxSchedule();
    explicit BoxSchedule(std::vector<int> boxWeights);

    // N boxes, each weighted half of the previous one (last box = 1).
    static BoxSchedule halving(int boxCount);

    int boxCount() const { return static_cast<int>(weights.size()); }
    int weightFor(int box) const;
    bool isMastered(int box) const { return box > boxCount(); }
    const std::vector<int>& boxWeights() const { return weights; }

private:
    std::vector<int> weights;
};
