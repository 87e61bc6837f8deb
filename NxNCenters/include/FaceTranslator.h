#pragma once

#include <vector>

#include "Alg.h"
#include "CubeGeometry.h"
#include "CubeTypes.h"

// One inner-slice way of carrying a center from the source face to the target face
struct SliceAlgorithmResult {
    SliceName slice = SliceName::M;
    int sliceIndex = 1; // 1-based inner layer
    int n = 1;          // quarter turns of the slice
    Point sourceCoord;

    Alg alg() const { return Alg::slice(slice, sliceIndex, n); }
};

struct TranslationResult {
    Point sourceCoord;
    Alg wholeCubeRotation;
    std::vector<SliceAlgorithmResult> sliceAlgorithms; // one for adjacent faces, two for opposite
    Transform transform = Transform::Identity;         // grid transform from source to target
};

// Answers where a center must start on one face to arrive at a given cell of
// another, and which moves bring it there
class FaceTranslator {
public:
    explicit FaceTranslator(const CubeGeometry& geometry) : geometry(geometry) {}

    TranslationResult translate(FaceName target, FaceName source, const Point& targetCoord) const;

    // Inverse of the slice half of translate along `slice`
    Point translateTargetFromSource(FaceName source, FaceName target, const Point& sourceCoord,
                                    SliceName slice) const;

    // Whole-cube rotation carrying the content of `source` onto `target`
    Alg wholeCubeAlg(FaceName source, FaceName target) const;

    // Quarter turns of `slice` moving content from `from` to `to` (-1, 1 or 2)
    static int sliceTurns(SliceName slice, FaceName from, FaceName to);

private:
    static int signedSteps(int steps);

    const CubeGeometry& geometry;
};
