#include "CubeGeometry.h"
#include "CubeTopology.h"
#include "Errors.h"

#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

namespace {

constexpr int kVirtualGrid = 3;

int invert(int i, int n) { return n - 1 - i; }

glm::vec3 rotateAbout(const glm::vec3& v, const glm::vec3& axis, float degrees) {
    glm::mat4 rotation = glm::rotate(glm::mat4(1.0f), glm::radians(degrees), axis);
    glm::vec4 r = rotation * glm::vec4(v, 0.0f);
    return glm::vec3(std::round(r.x), std::round(r.y), std::round(r.z));
}

bool sameDirection(const glm::vec3& a, const glm::vec3& b) {
    return glm::dot(a, b) > 0.5f;
}

} // namespace

Point FaceWalk::computePoint(int index, int slot, int nSlices) const {
    int i = indexInverted ? invert(index, nSlices) : index;
    int s = slotInverted ? invert(slot, nSlices) : slot;
    if (horizontalEdge) {
        return Point{s, i};
    }
    return Point{i, s};
}

std::pair<int, int> FaceWalk::indexAndSlot(const Point& p, int nSlices) const {
    int i = horizontalEdge ? p.col : p.row;
    int s = horizontalEdge ? p.row : p.col;
    if (indexInverted) i = invert(i, nSlices);
    if (slotInverted) s = invert(s, nSlices);
    return {i, s};
}

WalkingInfo::WalkingInfo(SliceName slice, int nSlices, const std::array<FaceWalk, 4>& faces)
    : sliceName(slice), nSlices(nSlices), walks(faces) {}

bool WalkingInfo::contains(FaceName f) const {
    for (const auto& w : walks) {
        if (w.face == f) {
            return true;
        }
    }
    return false;
}

const FaceWalk& WalkingInfo::of(FaceName f) const {
    for (const auto& w : walks) {
        if (w.face == f) {
            return w;
        }
    }
    throw InternalError("face " + toString(f) + " is not on slice " + toString(sliceName));
}

Point WalkingInfo::translatePoint(FaceName from, FaceName to, const Point& p) const {
    auto indexSlot = of(from).indexAndSlot(p, nSlices);
    return of(to).computePoint(indexSlot.first, indexSlot.second, nSlices);
}

Transform WalkingInfo::getTransform(FaceName a, FaceName b) const {
    const FaceWalk& wa = of(a);
    const FaceWalk& wb = of(b);

    for (int turns = 0; turns < 4; ++turns) {
        Transform t = CubeGeometry::fromClockwiseTurns(turns);
        bool match = true;
        for (int r = 0; r < kVirtualGrid && match; ++r) {
            for (int c = 0; c < kVirtualGrid && match; ++c) {
                Point p{r, c};
                auto indexSlot = wa.indexAndSlot(p, kVirtualGrid);
                Point walked = wb.computePoint(indexSlot.first, indexSlot.second, kVirtualGrid);
                match = walked == CubeGeometry::transformPoint(t, p, kVirtualGrid);
            }
        }
        if (match) {
            return t;
        }
    }
    throw InternalError("no grid transform maps " + toString(a) + " onto " + toString(b) +
                        " along slice " + toString(sliceName));
}

CubeGeometry::CubeGeometry(int nSlices) : nSlices(nSlices) {
    if (nSlices < 0) {
        throw InternalError("negative center size " + std::to_string(nSlices));
    }
    for (SliceName s : kAllSlices) {
        walks.push_back(createWalkingInfo(s));
    }
}

Point CubeGeometry::rotateClockwise(const Point& p, int times) const {
    return transformPoint(fromClockwiseTurns(times), p, nSlices);
}

Block CubeGeometry::rotateClockwise(const Block& b, int times) const {
    return Block(rotateClockwise(b.start, times), rotateClockwise(b.end, times));
}

Point CubeGeometry::transformPoint(Transform t, const Point& p, int nSlices) {
    switch (t) {
        case Transform::Identity: return p;
        case Transform::Rot90CW: return Point{invert(p.col, nSlices), p.row};
        case Transform::Rot90CCW: return Point{p.col, invert(p.row, nSlices)};
        case Transform::Rot180: return Point{invert(p.row, nSlices), invert(p.col, nSlices)};
    }
    throw InternalError("unknown transform " + std::to_string(static_cast<int>(t)));
}

int CubeGeometry::clockwiseTurns(Transform t) {
    switch (t) {
        case Transform::Identity: return 0;
        case Transform::Rot90CW: return 1;
        case Transform::Rot180: return 2;
        case Transform::Rot90CCW: return 3;
    }
    throw InternalError("unknown transform " + std::to_string(static_cast<int>(t)));
}

Transform CubeGeometry::fromClockwiseTurns(int turns) {
    switch (((turns % 4) + 4) % 4) {
        case 1: return Transform::Rot90CW;
        case 2: return Transform::Rot180;
        case 3: return Transform::Rot90CCW;
        default: return Transform::Identity;
    }
}

Transform CubeGeometry::compose(Transform first, Transform second) {
    return fromClockwiseTurns(clockwiseTurns(first) + clockwiseTurns(second));
}

Transform CubeGeometry::inverse(Transform t) {
    return fromClockwiseTurns(-clockwiseTurns(t));
}

WalkingInfo CubeGeometry::createWalkingInfo(SliceName slice) const {
    const auto& ring = CubeTopology::cycleOrder(slice);
    const glm::vec3& axis = frameOf(CubeTopology::referenceFace(slice)).normal;

    std::array<FaceWalk, 4> faces{};
    for (int k = 0; k < 4; ++k) {
        FaceWalk& w = faces[k];
        w.face = ring[k];
        w.entryFace = ring[(k + 3) % 4];

        const FaceFrame& frame = frameOf(w.face);
        const glm::vec3& entry = frameOf(w.entryFace).normal;

        w.horizontalEdge = std::abs(glm::dot(entry, frame.up)) > 0.5f;
        if (w.horizontalEdge) {
            w.slotInverted = sameDirection(entry, frame.up);
            w.indexInverted = glm::dot(axis, frame.right) > 0.0f;
        } else {
            w.slotInverted = sameDirection(entry, frame.right);
            w.indexInverted = glm::dot(axis, frame.up) > 0.0f;
        }
    }
    return WalkingInfo(slice, nSlices, faces);
}

const WalkingInfo& CubeGeometry::walkingInfo(SliceName slice) const {
    return walks[static_cast<int>(slice)];
}

std::optional<Transform> CubeGeometry::deriveTransformType(FaceName source, FaceName target) {
    if (source == target) {
        return std::nullopt;
    }

    const FaceFrame& s = frameOf(source);
    const FaceFrame& t = frameOf(target);

    glm::vec3 right;
    glm::vec3 up;
    if (CubeTopology::isAdjacent(source, target)) {
        glm::vec3 axis = glm::cross(s.normal, t.normal);
        right = rotateAbout(s.right, axis, 90.0f);
        up = rotateAbout(s.up, axis, 90.0f);
    } else {
        // half turn about the axis of the first connecting slice, as wholeCubeAlg plays it
        SliceName slice = CubeTopology::slicesConnecting(source, target).front();
        const glm::vec3& axis = frameOf(CubeTopology::axisFace(CubeTopology::axisOfSlice(slice))).normal;
        right = rotateAbout(s.right, axis, 180.0f);
        up = rotateAbout(s.up, axis, 180.0f);
    }

    if (sameDirection(right, t.right) && sameDirection(up, t.up)) {
        return Transform::Identity;
    }
    if (sameDirection(right, -t.up) && sameDirection(up, t.right)) {
        return Transform::Rot90CW;
    }
    if (sameDirection(right, t.up) && sameDirection(up, -t.right)) {
        return Transform::Rot90CCW;
    }
    if (sameDirection(right, -t.right) && sameDirection(up, -t.up)) {
        return Transform::Rot180;
    }
    throw InternalError("rotation of " + toString(source) + " onto " + toString(target) +
                        " is not a grid transform");
}

std::vector<Point> CubeGeometry::iterateOrthogonalFaceCenterPieces(FaceName layerFace, FaceName sideFace,
                                                                   int layerSliceIndex) const {
    if (!CubeTopology::isAdjacent(layerFace, sideFace)) {
        throw InternalError("face " + toString(sideFace) + " is not orthogonal to " + toString(layerFace));
    }
    if (layerSliceIndex < 0 || layerSliceIndex >= nSlices) {
        throw InternalError("layer slice index " + std::to_string(layerSliceIndex) + " out of range");
    }

    const FaceFrame& frame = frameOf(sideFace);
    const glm::vec3& toLayer = frameOf(layerFace).normal;

    std::vector<Point> points;
    points.reserve(nSlices);
    if (std::abs(glm::dot(toLayer, frame.up)) > 0.5f) {
        int row = glm::dot(toLayer, frame.up) < 0.0f ? layerSliceIndex : inv(layerSliceIndex);
        for (int c = 0; c < nSlices; ++c) {
            points.push_back(Point{row, c});
        }
    } else {
        int col = glm::dot(toLayer, frame.right) < 0.0f ? layerSliceIndex : inv(layerSliceIndex);
        for (int r = 0; r < nSlices; ++r) {
            points.push_back(Point{r, col});
        }
    }
    return points;
}
