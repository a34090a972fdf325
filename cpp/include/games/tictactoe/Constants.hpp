#pragma once

#include <cstdint>

namespace tictactoe {

using mask_t = uint16_t;
const int kBoardDimension = 3;
const int kNumCells = kBoardDimension * kBoardDimension;

const int kWinGoal = 100;
const int kDrawGoal = 50;
const int kLossGoal = 0;

}  // namespace tictactoe
