#pragma once

#include <array>
#include <optional>
#include <utility>
#include <vector>

#include "CubeTypes.h"

// How one face of a slice ring is crossed. `slot` counts cells from the edge
// the ring enters the face through, `index` is the slice index (0 = next to
// the slice's reference face).
struct FaceWalk {
    FaceName face = FaceName::F;
    FaceName entryFace = FaceName::F;
    bool horizontalEdge = false; // entry edge is the top or bottom edge
    bool slotInverted = false;
    bool indexInverted = false;

    Point computePoint(int index, int slot, int nSlices) const;
    std::pair<int, int> indexAndSlot(const Point& p, int nSlices) const;
};

// Reference-point walk around the 4 faces of one slice
class WalkingInfo {
public:
    WalkingInfo(SliceName slice, int nSlices, const std::array<FaceWalk, 4>& faces);

    SliceName slice() const { return sliceName; }
    int size() const { return nSlices; }
    const std::array<FaceWalk, 4>& faces() const { return walks; }

    bool contains(FaceName f) const;
    const FaceWalk& of(FaceName f) const;

    Point computePoint(FaceName f, int index, int slot) const { return of(f).computePoint(index, slot, nSlices); }
    int sliceIndex(FaceName f, const Point& p) const { return of(f).indexAndSlot(p, nSlices).first; }

    // Where a center moves to on `to` when its slice carries it from `from`
    Point translatePoint(FaceName from, FaceName to, const Point& p) const;

    // Grid transform equivalent to translatePoint(a, b, .)
    Transform getTransform(FaceName a, FaceName b) const;

private:
    SliceName sliceName;
    int nSlices;
    std::array<FaceWalk, 4> walks;
};

// Size dependent geometry of the (N-2)x(N-2) center grids
class CubeGeometry {
public:
    explicit CubeGeometry(int nSlices);

    int size() const { return nSlices; }
    int inv(int i) const { return nSlices - 1 - i; }

    Point rotateClockwise(const Point& p, int times = 1) const;
    Block rotateClockwise(const Block& b, int times = 1) const;
    Point applyTransform(Transform t, const Point& p) const { return transformPoint(t, p, nSlices); }

    static Point transformPoint(Transform t, const Point& p, int nSlices);
    static int clockwiseTurns(Transform t);
    static Transform fromClockwiseTurns(int turns);
    // `first` applied, then `second`
    static Transform compose(Transform first, Transform second);
    static Transform inverse(Transform t);

    WalkingInfo createWalkingInfo(SliceName slice) const;
    const WalkingInfo& walkingInfo(SliceName slice) const;

    // Grid transform under the whole-cube rotation carrying source onto target.
    // Empty for the same face; opposite faces use a 180 degree turn about the
    // first axis perpendicular to the source.
    static std::optional<Transform> deriveTransformType(FaceName source, FaceName target);

    // Cells of sideFace on the line parallel to layerFace, layerSliceIndex
    // lines away from it (0 = closest), in increasing coordinate order
    std::vector<Point> iterateOrthogonalFaceCenterPieces(FaceName layerFace, FaceName sideFace,
                                                         int layerSliceIndex) const;

private:
    int nSlices;
    std::vector<WalkingInfo> walks;
};
