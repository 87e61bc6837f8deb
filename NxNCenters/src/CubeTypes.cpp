#include "CubeTypes.h"
#include "Errors.h"

#include <algorithm>
#include <cstdlib>

const std::array<FaceName, 6> kAllFaces = {
    FaceName::F, FaceName::R, FaceName::U, FaceName::L, FaceName::D, FaceName::B
};

const std::array<SliceName, 3> kAllSlices = {SliceName::M, SliceName::E, SliceName::S};

const std::array<AxisName, 3> kAllAxes = {AxisName::X, AxisName::Y, AxisName::Z};

const std::array<Color, 6> kAllColors = {
    Color::Blue, Color::Orange, Color::Yellow, Color::Green, Color::Red, Color::White
};

const std::array<FaceFrame, 6> kFaceFrames = {
    FaceFrame{{0, 0, 1}, {1, 0, 0}, {0, 1, 0}},   // F
    FaceFrame{{1, 0, 0}, {0, 0, -1}, {0, 1, 0}},  // R
    FaceFrame{{0, 1, 0}, {1, 0, 0}, {0, 0, -1}},  // U
    FaceFrame{{-1, 0, 0}, {0, 0, 1}, {0, 1, 0}},  // L
    FaceFrame{{0, -1, 0}, {1, 0, 0}, {0, 0, 1}},  // D
    FaceFrame{{0, 0, -1}, {-1, 0, 0}, {0, 1, 0}}, // B
};

FaceName faceFromNormal(const glm::vec3& dir) {
    float len = glm::length(dir);
    if (len < 0.01f) {
        throw InternalError("faceFromNormal: zero direction");
    }
    glm::vec3 normalized = dir / len;

    float bestDot = -2.0f;
    FaceName best = FaceName::F;
    for (FaceName f : kAllFaces) {
        float dot = glm::dot(normalized, frameOf(f).normal);
        if (dot > bestDot) {
            bestDot = dot;
            best = f;
        }
    }
    return best;
}

Block Block::normalized() const {
    return Block(Point{std::min(start.row, end.row), std::min(start.col, end.col)},
                 Point{std::max(start.row, end.row), std::max(start.col, end.col)});
}

int Block::rows() const { return std::abs(end.row - start.row) + 1; }

int Block::cols() const { return std::abs(end.col - start.col) + 1; }

bool Block::contains(const Point& p) const {
    Block b = normalized();
    return p.row >= b.start.row && p.row <= b.end.row && p.col >= b.start.col && p.col <= b.end.col;
}

std::string toString(FaceName f) {
    switch (f) {
        case FaceName::F: return "F";
        case FaceName::R: return "R";
        case FaceName::U: return "U";
        case FaceName::L: return "L";
        case FaceName::D: return "D";
        case FaceName::B: return "B";
    }
    throw InternalError("unknown face " + std::to_string(static_cast<int>(f)));
}

std::string toString(SliceName s) {
    switch (s) {
        case SliceName::M: return "M";
        case SliceName::E: return "E";
        case SliceName::S: return "S";
    }
    throw InternalError("unknown slice " + std::to_string(static_cast<int>(s)));
}

std::string toString(AxisName a) {
    switch (a) {
        case AxisName::X: return "X";
        case AxisName::Y: return "Y";
        case AxisName::Z: return "Z";
    }
    throw InternalError("unknown axis " + std::to_string(static_cast<int>(a)));
}

std::string toString(Color c) {
    switch (c) {
        case Color::Blue: return "Blue";
        case Color::Orange: return "Orange";
        case Color::Yellow: return "Yellow";
        case Color::Green: return "Green";
        case Color::Red: return "Red";
        case Color::White: return "White";
    }
    throw InternalError("unknown color " + std::to_string(static_cast<int>(c)));
}

std::string toString(Transform t) {
    switch (t) {
        case Transform::Identity: return "IDENTITY";
        case Transform::Rot90CW: return "ROT_90_CW";
        case Transform::Rot90CCW: return "ROT_90_CCW";
        case Transform::Rot180: return "ROT_180";
    }
    throw InternalError("unknown transform " + std::to_string(static_cast<int>(t)));
}

std::string toString(const Point& p) {
    return "(" + std::to_string(p.row) + "," + std::to_string(p.col) + ")";
}

std::string toString(const Block& b) {
    return "[" + toString(b.start) + "-" + toString(b.end) + "]";
}

char colorChar(Color c) {
    return toString(c)[0];
}
