#pragma once

#include <string>

namespace scanplot {

// Display title from an instrument file name, e.g.
//   "Scan_2025_05_26_14_7_x_Pico3.txt" -> "Pico 3 - 2025/05/26 14:07"
// Tokens are the '_'-separated parts of the stem. Names with fewer than
// 8 tokens are shown as their stem.
std::string displayTitle(const std::string& filename);

}  // namespace scanplot
