#pragma once

#include <array>
#include <cstdint>

namespace verhoeff {
namespace checksum {
namespace tables {

// Group product of the dihedral group D5
inline constexpr std::array<std::array<uint8_t, 10>, 10> MULTIPLICATION = {{
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
    {1, 2, 3, 4, 0, 6, 7, 8, 9, 5},
    {2, 3, 4, 0, 1, 7, 8, 9, 5, 6},
    {3, 4, 0, 1, 2, 8, 9, 5, 6, 7},
    {4, 0, 1, 2, 3, 9, 5, 6, 7, 8},
    {5, 9, 8, 7, 6, 0, 4, 3, 2, 1},
    {6, 5, 9, 8, 7, 1, 0, 4, 3, 2},
    {7, 6, 5, 9, 8, 2, 1, 0, 4, 3},
    {8, 7, 6, 5, 9, 3, 2, 1, 0, 4},
    {9, 8, 7, 6, 5, 4, 3, 2, 1, 0},
}};

// Row i is applied to the digit at position i mod 8, counted from the units digit
inline constexpr std::array<std::array<uint8_t, 10>, 8> PERMUTATION = {{
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
    {1, 5, 7, 6, 2, 8, 3, 0, 9, 4},
    {5, 8, 0, 3, 7, 9, 6, 1, 4, 2},
    {8, 9, 1, 6, 0, 4, 3, 5, 2, 7},
    {9, 4, 5, 3, 1, 2, 6, 8, 7, 0},
    {4, 2, 8, 6, 5, 7, 3, 9, 0, 1},
    {2, 7, 9, 3, 8, 0, 6, 4, 1, 5},
    {7, 0, 4, 6, 9, 1, 3, 2, 5, 8},
}};

inline constexpr std::array<uint8_t, 10> INVERSE = {0, 4, 3, 2, 1, 5, 6, 7, 8, 9};

inline constexpr size_t PERMUTATION_PERIOD = PERMUTATION.size();

} // namespace tables
} // namespace checksum
} // namespace verhoeff
