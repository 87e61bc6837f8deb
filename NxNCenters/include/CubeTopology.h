#pragma once

#include <array>
#include <vector>

#include <glm/glm.hpp>

#include "CubeTypes.h"

// Size independent adjacency of the 6 faces, 3 slices and 3 whole-cube axes.
// Everything here is derived from kFaceFrames by rotating face normals.
namespace CubeTopology {

FaceName opposite(FaceName f);
bool isAdjacent(FaceName a, FaceName b);
std::array<FaceName, 4> adjacentFaces(FaceName f);

FaceName referenceFace(SliceName s);
FaceName axisFace(AxisName a);
SliceName sliceOfAxis(AxisName a);
AxisName axisOfSlice(SliceName s);

// Faces in the order content flows on a positive (clockwise) turn, e.g. M: F D B U
const std::array<FaceName, 4>& cycleOrder(SliceName s);
const std::array<FaceName, 4>& cycleOrder(AxisName a);

bool sliceContainsFace(SliceName s, FaceName f);

// Row when the slice index picks a row on f, Col when it picks a column
SliceCut doesSliceCutRowsOrColumns(SliceName s, FaceName f);

// True when slice index 0 (next to the reference face) is row/col 0 on f
bool doesSliceStartWithFace(SliceName s, FaceName f);

// Slices whose cycle holds both faces, ordered E, M, S: one for adjacent faces, two for opposite
std::vector<SliceName> slicesConnecting(FaceName a, FaceName b);

// Quarter turns needed to carry content from `from` to `to` along a cycle (0..3)
int cycleSteps(const std::array<FaceName, 4>& cycle, FaceName from, FaceName to);

// Rotation matrix of n clockwise quarter turns seen from outside face f
glm::mat4 quarterTurn(FaceName f, int n = 1);
glm::vec3 rotateVector(const glm::vec3& v, FaceName f, int n = 1);

}
