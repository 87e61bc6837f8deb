#include "CubeTopology.h"
#include "Errors.h"

#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

namespace CubeTopology {
namespace {

std::array<FaceName, 4> buildCycle(FaceName rotatingFace) {
    const glm::vec3& axis = frameOf(rotatingFace).normal;

    FaceName start = FaceName::F;
    for (FaceName f : kAllFaces) {
        if (std::abs(glm::dot(frameOf(f).normal, axis)) < 0.5f) {
            start = f;
            break;
        }
    }

    std::array<FaceName, 4> cycle{};
    cycle[0] = start;
    for (int i = 1; i < 4; ++i) {
        cycle[i] = faceFromNormal(rotateVector(frameOf(cycle[i - 1]).normal, rotatingFace));
    }
    return cycle;
}

const std::array<std::array<FaceName, 4>, 3>& sliceCycles() {
    static const std::array<std::array<FaceName, 4>, 3> cycles = {
        buildCycle(FaceName::L), buildCycle(FaceName::D), buildCycle(FaceName::F)
    };
    return cycles;
}

const std::array<std::array<FaceName, 4>, 3>& axisCycles() {
    static const std::array<std::array<FaceName, 4>, 3> cycles = {
        buildCycle(FaceName::R), buildCycle(FaceName::U), buildCycle(FaceName::F)
    };
    return cycles;
}

} // namespace

glm::mat4 quarterTurn(FaceName f, int n) {
    return glm::rotate(glm::mat4(1.0f), glm::radians(-90.0f * static_cast<float>(n)), frameOf(f).normal);
}

glm::vec3 rotateVector(const glm::vec3& v, FaceName f, int n) {
    glm::vec4 r = quarterTurn(f, n) * glm::vec4(v, 0.0f);
    return glm::vec3(std::round(r.x), std::round(r.y), std::round(r.z));
}

FaceName opposite(FaceName f) {
    return faceFromNormal(-frameOf(f).normal);
}

bool isAdjacent(FaceName a, FaceName b) {
    return std::abs(glm::dot(frameOf(a).normal, frameOf(b).normal)) < 0.5f;
}

std::array<FaceName, 4> adjacentFaces(FaceName f) {
    std::array<FaceName, 4> result{};
    int i = 0;
    for (FaceName other : kAllFaces) {
        if (isAdjacent(f, other)) {
            result[i++] = other;
        }
    }
    return result;
}

FaceName referenceFace(SliceName s) {
    switch (s) {
        case SliceName::M: return FaceName::L;
        case SliceName::E: return FaceName::D;
        case SliceName::S: return FaceName::F;
    }
    throw InternalError("unknown slice " + std::to_string(static_cast<int>(s)));
}

FaceName axisFace(AxisName a) {
    switch (a) {
        case AxisName::X: return FaceName::R;
        case AxisName::Y: return FaceName::U;
        case AxisName::Z: return FaceName::F;
    }
    throw InternalError("unknown axis " + std::to_string(static_cast<int>(a)));
}

SliceName sliceOfAxis(AxisName a) {
    switch (a) {
        case AxisName::X: return SliceName::M;
        case AxisName::Y: return SliceName::E;
        case AxisName::Z: return SliceName::S;
    }
    throw InternalError("unknown axis " + std::to_string(static_cast<int>(a)));
}

AxisName axisOfSlice(SliceName s) {
    switch (s) {
        case SliceName::M: return AxisName::X;
        case SliceName::E: return AxisName::Y;
        case SliceName::S: return AxisName::Z;
    }
    throw InternalError("unknown slice " + std::to_string(static_cast<int>(s)));
}

const std::array<FaceName, 4>& cycleOrder(SliceName s) {
    int i = static_cast<int>(s);
    if (i < 0 || i > 2) {
        throw InternalError("unknown slice " + std::to_string(i));
    }
    return sliceCycles()[i];
}

const std::array<FaceName, 4>& cycleOrder(AxisName a) {
    int i = static_cast<int>(a);
    if (i < 0 || i > 2) {
        throw InternalError("unknown axis " + std::to_string(i));
    }
    return axisCycles()[i];
}

bool sliceContainsFace(SliceName s, FaceName f) {
    return isAdjacent(referenceFace(s), f);
}

SliceCut doesSliceCutRowsOrColumns(SliceName s, FaceName f) {
    const glm::vec3& axis = frameOf(referenceFace(s)).normal;
    const FaceFrame& frame = frameOf(f);
    if (std::abs(glm::dot(axis, frame.right)) > 0.5f) {
        return SliceCut::Col;
    }
    if (std::abs(glm::dot(axis, frame.up)) > 0.5f) {
        return SliceCut::Row;
    }
    throw InternalError("slice " + toString(s) + " does not cross face " + toString(f));
}

bool doesSliceStartWithFace(SliceName s, FaceName f) {
    const glm::vec3& axis = frameOf(referenceFace(s)).normal;
    const FaceFrame& frame = frameOf(f);
    // index 0 lies next to the reference face, so it is coordinate 0 when the
    // face's coordinate grows away from that face
    if (doesSliceCutRowsOrColumns(s, f) == SliceCut::Col) {
        return glm::dot(axis, frame.right) < 0.0f;
    }
    return glm::dot(axis, frame.up) < 0.0f;
}

std::vector<SliceName> slicesConnecting(FaceName a, FaceName b) {
    if (a == b) {
        throw InternalError("no slice connects face " + toString(a) + " with itself");
    }
    std::vector<SliceName> result;
    for (SliceName s : {SliceName::E, SliceName::M, SliceName::S}) {
        if (sliceContainsFace(s, a) && sliceContainsFace(s, b)) {
            result.push_back(s);
        }
    }
    return result;
}

int cycleSteps(const std::array<FaceName, 4>& cycle, FaceName from, FaceName to) {
    int iFrom = -1;
    int iTo = -1;
    for (int i = 0; i < 4; ++i) {
        if (cycle[i] == from) iFrom = i;
        if (cycle[i] == to) iTo = i;
    }
    if (iFrom < 0 || iTo < 0) {
        throw InternalError("faces " + toString(from) + ", " + toString(to) + " are not on one cycle");
    }
    return (iTo - iFrom + 4) % 4;
}

}
