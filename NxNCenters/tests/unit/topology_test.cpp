// Face relations, slice rings and their orientation conventions.

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "CubeTopology.h"
#include "Errors.h"

using namespace CubeTopology;

void testOpposites() {
    std::cout << "\n=== Test: Opposite Faces ===\n";

    assert(opposite(FaceName::F) == FaceName::B);
    assert(opposite(FaceName::R) == FaceName::L);
    assert(opposite(FaceName::U) == FaceName::D);
    for (FaceName f : kAllFaces) {
        assert(opposite(opposite(f)) == f);
        assert(!isAdjacent(f, f));
        assert(!isAdjacent(f, opposite(f)));
    }

    auto around = adjacentFaces(FaceName::F);
    assert(around[0] == FaceName::R);
    assert(around[1] == FaceName::U);
    assert(around[2] == FaceName::L);
    assert(around[3] == FaceName::D);

    std::cout << "PASSED: Opposite faces\n";
}

void testCycles() {
    std::cout << "\n=== Test: Slice and Axis Cycles ===\n";

    const auto& m = cycleOrder(SliceName::M);
    assert(m[0] == FaceName::F && m[1] == FaceName::D && m[2] == FaceName::B && m[3] == FaceName::U);

    const auto& e = cycleOrder(SliceName::E);
    assert(e[0] == FaceName::F && e[1] == FaceName::R && e[2] == FaceName::B && e[3] == FaceName::L);

    const auto& s = cycleOrder(SliceName::S);
    assert(s[0] == FaceName::R && s[1] == FaceName::D && s[2] == FaceName::L && s[3] == FaceName::U);

    const auto& x = cycleOrder(AxisName::X);
    assert(x[0] == FaceName::F && x[1] == FaceName::U && x[2] == FaceName::B && x[3] == FaceName::D);

    const auto& y = cycleOrder(AxisName::Y);
    assert(y[0] == FaceName::F && y[1] == FaceName::L && y[2] == FaceName::B && y[3] == FaceName::R);

    assert(cycleSteps(m, FaceName::U, FaceName::F) == 1);
    assert(cycleSteps(m, FaceName::B, FaceName::F) == 2);
    assert(cycleSteps(m, FaceName::D, FaceName::F) == 3);

    bool thrown = false;
    try {
        cycleSteps(m, FaceName::R, FaceName::F);
    } catch (const InternalError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED: Slice and axis cycles\n";
}

void testSliceMembership() {
    std::cout << "\n=== Test: Slice Membership ===\n";

    assert(referenceFace(SliceName::M) == FaceName::L);
    assert(referenceFace(SliceName::E) == FaceName::D);
    assert(referenceFace(SliceName::S) == FaceName::F);
    for (SliceName s : kAllSlices) {
        assert(sliceOfAxis(axisOfSlice(s)) == s);
        assert(!sliceContainsFace(s, referenceFace(s)));
        assert(!sliceContainsFace(s, opposite(referenceFace(s))));
    }

    auto fu = slicesConnecting(FaceName::F, FaceName::U);
    assert(fu.size() == 1 && fu[0] == SliceName::M);
    auto fr = slicesConnecting(FaceName::F, FaceName::R);
    assert(fr.size() == 1 && fr[0] == SliceName::E);
    auto ur = slicesConnecting(FaceName::U, FaceName::R);
    assert(ur.size() == 1 && ur[0] == SliceName::S);

    // opposite faces share two rings, E before M before S
    auto fb = slicesConnecting(FaceName::F, FaceName::B);
    assert(fb.size() == 2 && fb[0] == SliceName::E && fb[1] == SliceName::M);
    auto ud = slicesConnecting(FaceName::U, FaceName::D);
    assert(ud.size() == 2 && ud[0] == SliceName::M && ud[1] == SliceName::S);

    bool thrown = false;
    try {
        slicesConnecting(FaceName::F, FaceName::F);
    } catch (const InternalError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED: Slice membership\n";
}

void testCutsAndStarts() {
    std::cout << "\n=== Test: Rows, Columns and Index Origin ===\n";

    assert(doesSliceCutRowsOrColumns(SliceName::M, FaceName::F) == SliceCut::Col);
    assert(doesSliceCutRowsOrColumns(SliceName::E, FaceName::F) == SliceCut::Row);
    assert(doesSliceCutRowsOrColumns(SliceName::S, FaceName::U) == SliceCut::Row);
    assert(doesSliceCutRowsOrColumns(SliceName::S, FaceName::R) == SliceCut::Col);

    assert(doesSliceStartWithFace(SliceName::M, FaceName::F));
    assert(!doesSliceStartWithFace(SliceName::M, FaceName::B));
    assert(doesSliceStartWithFace(SliceName::E, FaceName::F));
    assert(doesSliceStartWithFace(SliceName::M, FaceName::U));

    bool thrown = false;
    try {
        doesSliceCutRowsOrColumns(SliceName::M, FaceName::L);
    } catch (const InternalError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED: Rows, columns and index origin\n";
}

void testQuarterTurns() {
    std::cout << "\n=== Test: Quarter Turns ===\n";

    // U clockwise carries R onto F and F onto L
    assert(faceFromNormal(rotateVector(frameOf(FaceName::R).normal, FaceName::U)) == FaceName::F);
    assert(faceFromNormal(rotateVector(frameOf(FaceName::F).normal, FaceName::U)) == FaceName::L);
    // L clockwise carries U onto F
    assert(faceFromNormal(rotateVector(frameOf(FaceName::U).normal, FaceName::L)) == FaceName::F);

    for (FaceName f : kAllFaces) {
        glm::vec3 v(1.0f, 2.0f, 3.0f);
        glm::vec3 back = rotateVector(rotateVector(v, f, 1), f, 3);
        assert(back == v);
        assert(rotateVector(frameOf(f).normal, f) == frameOf(f).normal);
    }

    std::cout << "PASSED: Quarter turns\n";
}

int main() {
    std::cout << "=================================\n";
    std::cout << "Cube Topology Tests\n";
    std::cout << "=================================\n";

    testOpposites();
    testCycles();
    testSliceMembership();
    testCutsAndStarts();
    testQuarterTurns();

    std::cout << "\n=================================\n";
    std::cout << "All tests completed!\n";
    std::cout << "=================================\n";

    return 0;
}
