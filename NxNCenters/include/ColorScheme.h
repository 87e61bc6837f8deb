#pragma once

#include <array>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "CubeTypes.h"

// Face to color layout of a cube
class ColorScheme {
public:
    explicit ColorScheme(const std::array<Color, 6>& faceColors);

    // Blue front, Orange left, Yellow up
    static ColorScheme boy();

    Color colorOf(FaceName f) const { return colors[faceIndex(f)]; }
    FaceName faceOf(Color c) const;
    Color oppositeColor(Color c) const;

    // Every color used exactly once
    bool isPermutation() const;

    // Same layout up to a whole-cube orientation
    bool same(const ColorScheme& other) const;

    bool operator==(const ColorScheme& other) const { return colors == other.colors; }
    bool operator!=(const ColorScheme& other) const { return !(*this == other); }

    std::string toString() const;

    // The 24 proper rotations of the cube
    static const std::vector<glm::mat3>& orientations();

private:
    std::array<Color, 6> colors;
};
