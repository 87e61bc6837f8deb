#include "FaceTranslator.h"
#include "CubeTopology.h"
#include "Errors.h"

int FaceTranslator::signedSteps(int steps) {
    return steps == 3 ? -1 : steps;
}

int FaceTranslator::sliceTurns(SliceName slice, FaceName from, FaceName to) {
    return signedSteps(CubeTopology::cycleSteps(CubeTopology::cycleOrder(slice), from, to));
}

TranslationResult FaceTranslator::translate(FaceName target, FaceName source, const Point& targetCoord) const {
    if (target == source) {
        throw InternalError("cannot translate face " + toString(target) + " onto itself");
    }

    std::vector<SliceName> slices = CubeTopology::slicesConnecting(source, target);
    if (slices.empty()) {
        throw InternalError("no slice connects " + toString(source) + " with " + toString(target));
    }

    TranslationResult result;
    for (SliceName s : slices) {
        const WalkingInfo& walk = geometry.walkingInfo(s);

        SliceAlgorithmResult sliceResult;
        sliceResult.slice = s;
        sliceResult.sliceIndex = walk.sliceIndex(target, targetCoord) + 1;
        sliceResult.n = sliceTurns(s, source, target);
        sliceResult.sourceCoord = walk.translatePoint(target, source, targetCoord);
        result.sliceAlgorithms.push_back(sliceResult);
    }

    const SliceAlgorithmResult& primary = result.sliceAlgorithms.front();
    result.sourceCoord = primary.sourceCoord;
    result.transform = geometry.walkingInfo(primary.slice).getTransform(source, target);
    result.wholeCubeRotation = wholeCubeAlg(source, target);
    return result;
}

Point FaceTranslator::translateTargetFromSource(FaceName source, FaceName target, const Point& sourceCoord,
                                                SliceName slice) const {
    if (target == source) {
        throw InternalError("cannot translate face " + toString(source) + " onto itself");
    }
    return geometry.walkingInfo(slice).translatePoint(source, target, sourceCoord);
}

Alg FaceTranslator::wholeCubeAlg(FaceName source, FaceName target) const {
    if (target == source) {
        return Alg();
    }
    std::vector<SliceName> slices = CubeTopology::slicesConnecting(source, target);
    AxisName axis = CubeTopology::axisOfSlice(slices.front());
    int n = signedSteps(CubeTopology::cycleSteps(CubeTopology::cycleOrder(axis), source, target));
    return Alg::whole(axis, n);
}
