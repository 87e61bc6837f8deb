#pragma once

#include <array>
#include <string>

#include <glm/glm.hpp>

// Faces are listed in the order used for iteration everywhere (F R U L D B)
enum class FaceName : int { F, R, U, L, D, B };

// Inner slices, each rotating like its reference face: M like L, E like D, S like F
enum class SliceName : int { M, E, S };

// Whole-cube rotation axes, each rotating like a face: X like R, Y like U, Z like F
enum class AxisName : int { X, Y, Z };

enum class Color : int { Blue, Orange, Yellow, Green, Red, White };

// Which line a slice index selects on a face
enum class SliceCut : int { Row, Col };

// Coordinate transform between two faces' center grids
enum class Transform : int { Identity, Rot90CW, Rot90CCW, Rot180 };

constexpr int kFaceCount = 6;

extern const std::array<FaceName, 6> kAllFaces;
extern const std::array<SliceName, 3> kAllSlices;
extern const std::array<AxisName, 3> kAllAxes;
extern const std::array<Color, 6> kAllColors;

// Right-handed frame of a face seen from outside: normal = right x up
struct FaceFrame {
    glm::vec3 normal;
    glm::vec3 right;
    glm::vec3 up;
};

extern const std::array<FaceFrame, 6> kFaceFrames;

inline int faceIndex(FaceName f) { return static_cast<int>(f); }
inline const FaceFrame& frameOf(FaceName f) { return kFaceFrames[faceIndex(f)]; }

// Snaps a direction to the face whose normal it points at
FaceName faceFromNormal(const glm::vec3& dir);

// (row, col) on a center grid; row 0 is the bottom line, col 0 the left one
struct Point {
    int row = 0;
    int col = 0;

    bool operator==(const Point& other) const { return row == other.row && col == other.col; }
    bool operator!=(const Point& other) const { return !(*this == other); }
    bool operator<(const Point& other) const {
        return row != other.row ? row < other.row : col < other.col;
    }
};

// Rectangle on a center grid given by two corner points (inclusive)
struct Block {
    Point start;
    Point end;

    Block() = default;
    Block(Point a, Point b) : start(a), end(b) {}
    explicit Block(Point p) : start(p), end(p) {}

    Block normalized() const;
    int rows() const;
    int cols() const;
    int size() const { return rows() * cols(); }
    bool contains(const Point& p) const;

    bool operator==(const Block& other) const { return start == other.start && end == other.end; }
    bool operator!=(const Block& other) const { return !(*this == other); }
};

std::string toString(FaceName f);
std::string toString(SliceName s);
std::string toString(AxisName a);
std::string toString(Color c);
std::string toString(Transform t);
std::string toString(const Point& p);
std::string toString(const Block& b);
char colorChar(Color c);
