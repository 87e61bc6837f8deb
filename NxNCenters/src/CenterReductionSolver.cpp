#include "CenterReductionSolver.h"
#include "ColorScheme.h"
#include "CubeTopology.h"
#include "Errors.h"

#include <algorithm>

CenterReductionSolver::CenterReductionSolver(Operator& op, const Config& config, const Logger& logger)
    : cube(op.cube()),
      op(op),
      config(config),
      logger(logger),
      translator(op.cube().geometry()),
      commutator(op.cube(), op, logger) {}

bool CenterReductionSolver::isCubeSolved(const Cube& cube) {
    return cube.matchesOriginalScheme();
}

void CenterReductionSolver::solve(TrackerHolder& holder) {
    if (solved()) {
        return;
    }

    logger.info("NxNCenters", [&](std::ostream& out) { out << "reducing centers of " << cube.size() << "x" << cube.size(); });

    std::vector<const FaceTracker*> faces;
    for (const auto& t : holder.trackers()) {
        faces.push_back(&t);
    }

    assertMatchesScheme(holder);
    while (doFaces(holder, faces)) {
        assertMatchesScheme(holder);
    }

    if (!solved()) {
        throw InternalError("center reduction stopped before the centers were solved\n" + cube.dump());
    }
    logger.info("NxNCenters", [&](std::ostream& out) { out << "centers solved, " << getBlockStatistics().toString(); });
}

void CenterReductionSolver::solveSingleFace(TrackerHolder& holder, const FaceTracker& target) {
    if (isFaceSolved(holder.faceOf(target), target.color())) {
        return;
    }
    while (doFaces(holder, {&target})) {
        assertMatchesScheme(holder);
    }
    assertMatchesScheme(holder);
}

bool CenterReductionSolver::doFaces(TrackerHolder& holder, const std::vector<const FaceTracker*>& faces) {
    bool workDone = false;
    for (const FaceTracker* t : faces) {
        if (doCenter(holder, *t)) {
            workDone = true;
            assertMatchesScheme(holder);
        }
    }
    return workDone;
}

bool CenterReductionSolver::doCenter(TrackerHolder& holder, const FaceTracker& tracker) {
    const Color color = tracker.color();
    FaceName face = holder.faceOf(tracker);

    if (isFaceSolved(face, color)) {
        return false;
    }

    bool available = false;
    for (FaceName f : kAllFaces) {
        if (f != face && cube.countColorOnFace(f, color) > 0) {
            available = true;
            break;
        }
    }
    if (!available) {
        logger.debug("NxNCenters", [&](std::ostream& out) { out << "no " << toString(color) << " left for " << toString(face); });
        return false;
    }

    logger.debug("NxNCenters", [&](std::ostream& out) { out << "working on " << toString(color) << " at " << toString(face); });

    op.play(translator.wholeCubeAlg(face, FaceName::F));
    const FaceColors colors = holder.getFaceColors();

    std::vector<FaceName> sources;
    for (FaceName f : CubeTopology::adjacentFaces(FaceName::F)) {
        sources.push_back(f);
    }
    sources.push_back(FaceName::B);

    bool workDone = false;
    for (FaceName source : sources) {
        if (cube.countColorOnFace(source, color) == 0) {
            continue;
        }
        if (doCenterFromFace(holder, colors, color, source)) {
            workDone = true;
        }
        if (isFaceSolved(FaceName::F, color)) {
            break;
        }
    }
    return workDone;
}

bool CenterReductionSolver::doCenterFromFace(TrackerHolder& holder, const FaceColors& colors, Color color,
                                             FaceName source) {
    if (cube.countColorOnFace(source, color) == 0) {
        return false;
    }

    bool workDone = false;
    if (source == FaceName::U || source == FaceName::B) {
        if (cube.nSlices() % 2 && config.useOddCubeSwitchCenters()) {
            if (cube.countColorOnFace(source, color) - cube.countColorOnFace(FaceName::F, color) > 2) {
                swapEntireFaceOddCube(color, source);
            }
        }
        if (config.useCompleteSlices() && doCompleteSlices(holder, colors, color, source)) {
            workDone = true;
        }
    }

    if (config.searchBlocks) {
        if (doBlocks(holder, color, source)) {
            workDone = true;
        }
    } else {
        const int n = cube.nSlices();
        for (int r = 0; r < n; ++r) {
            for (int c = 0; c < n; ++c) {
                auto guard = holder.preservePhysicalFaces();
                if (commutator.blockCommutator(FaceName::F, source, color, Block(Point{r, c}),
                                               SearchBlockMode::CompleteBlock, config.preserveCage)) {
                    workDone = true;
                }
            }
        }
    }
    return workDone;
}

bool CenterReductionSolver::doBlocks(TrackerHolder& holder, Color color, FaceName source) {
    const SliceCut cut = commutator.cutFor(source, FaceName::F);
    std::vector<Block> blocks = commutator.searchBigBlock(
        FaceName::F, [this, color](FaceName f, const Point& p) { return cube.centerColor(f, p) != color; }, cut);

    if (blocks.empty()) {
        return false;
    }

    logger.debug("NxNCenters", [&](std::ostream& out) {
        out << blocks.size() << " unsolved blocks for " << toString(color) << " from " << toString(source)
            << ", largest " << blocks.front().size();
    });

    bool workDone = false;
    for (const Block& block : blocks) {
        auto guard = holder.preservePhysicalFaces();
        if (commutator.blockCommutator(FaceName::F, source, color, block, SearchBlockMode::ExactMatch,
                                       config.preserveCage)) {
            workDone = true;
        }
    }
    return workDone;
}

bool CenterReductionSolver::doCompleteSlices(TrackerHolder& holder, const FaceColors& colors, Color color,
                                             FaceName source) {
    bool workDone = false;
    while (true) {
        auto guard = holder.preservePhysicalFaces();
        if (!doOneCompleteSlice(colors, color, source)) {
            return workDone;
        }
        workDone = true;
    }
}

bool CenterReductionSolver::doOneCompleteSlice(const FaceColors& colors, Color color, FaceName source) {
    std::vector<CompleteSlice> sourceSlices = searchSlicesOnFace(source, color, std::nullopt, true);
    if (sourceSlices.empty()) {
        return false;
    }

    const int n = cube.nSlices();
    const int middle = n % 2 ? n / 2 : -1;
    const Color sourceColor = colors[faceIndex(source)];

    for (const CompleteSlice& sourceSlice : sourceSlices) {
        if (sourceSlice.index == middle) {
            continue;
        }

        std::vector<CompleteSlice> targetSlices = searchSlicesOnFace(FaceName::F, color, sourceSlice.index, false);
        const CompleteSlice& weakest = targetSlices.front();

        if ((weakest.matches != 0 && config.searchCompleteSlicesOnlyTargetZero) ||
            sourceSlice.matches <= weakest.matches) {
            continue;
        }

        // Both faces' own colors together must gain, otherwise two faces can
        // keep trading the same line
        int gain = sourceSlice.matches - weakest.matches +
                   cube.countColorOnBlock(FaceName::F, lineBlock(weakest), sourceColor) -
                   cube.countColorOnBlock(source, lineBlock(sourceSlice), sourceColor);
        if (gain <= 0) {
            continue;
        }

        swapSlice(weakest, sourceSlice, source);
        return true;
    }
    return false;
}

void CenterReductionSolver::swapSlice(const CompleteSlice& targetSlice, const CompleteSlice& sourceSlice,
                                      FaceName source) {
    const CubeGeometry& geometry = cube.geometry();
    const int last = cube.nSlices() - 1;

    // The slice moves columns of F, so a row is turned into a column first
    int targetColumn = targetSlice.index;
    if (targetSlice.isRow) {
        targetColumn = geometry.rotateClockwise(Point{targetSlice.index, 0}, -1).col;
        op.play(Alg::face(FaceName::F, -1));
    }

    const SliceName slice = SliceName::M;
    const int sliceIndex = geometry.walkingInfo(slice).sliceIndex(FaceName::F, Point{0, targetColumn});

    // The half turn of the source carries the source line into the slice
    Block onSource(translator.translateTargetFromSource(FaceName::F, source, Point{0, targetColumn}, slice),
                   translator.translateTargetFromSource(FaceName::F, source, Point{last, targetColumn}, slice));
    Block required = geometry.rotateClockwise(onSource.normalized(), 2).normalized();

    Block line = lineBlock(sourceSlice);
    int rotation = -1;
    for (int k = 0; k < 4; ++k) {
        if (geometry.rotateClockwise(line, k).normalized() == required) {
            rotation = k;
            break;
        }
    }
    if (rotation < 0) {
        throw InternalError("source line " + toString(line) + " on " + toString(source) + " cannot reach " +
                            toString(required));
    }
    if (rotation != 0) {
        op.play(Alg::face(source, rotation == 3 ? -1 : rotation));
    }

    const int n = FaceTranslator::sliceTurns(slice, source, FaceName::F);
    Alg swap = Alg::slice(slice, sliceIndex + 1, -n) + Alg::face(source, 2) + Alg::slice(slice, sliceIndex + 1, n);

    logger.debug("NxNCenters", [&](std::ostream& out) {
        out << "swap " << (sourceSlice.isRow ? "row " : "column ") << sourceSlice.index << " of "
            << toString(source) << " (" << sourceSlice.matches << ") into column " << targetColumn << " of F ("
            << targetSlice.matches << "): " << swap.toString();
    });
    op.play(swap);
}

std::vector<CenterReductionSolver::CompleteSlice>
CenterReductionSolver::searchSlicesOnFace(FaceName face, Color color, std::optional<int> index, bool searchMax) const {
    const int n = cube.nSlices();

    std::vector<int> indices;
    if (index) {
        indices = {*index, cube.inv(*index)};
    } else {
        for (int i = 0; i < n; ++i) {
            indices.push_back(i);
        }
    }

    std::vector<CompleteSlice> result;
    for (bool isRow : {true, false}) {
        for (int i : indices) {
            CompleteSlice s{isRow, i, 0};
            s.matches = cube.countColorOnBlock(face, lineBlock(s), color);
            // a single piece is left to the commutators
            if (s.matches > 1 || !searchMax) {
                result.push_back(s);
            }
        }
    }

    std::stable_sort(result.begin(), result.end(), [searchMax](const CompleteSlice& a, const CompleteSlice& b) {
        return searchMax ? a.matches > b.matches : a.matches < b.matches;
    });
    return result;
}

Block CenterReductionSolver::lineBlock(const CompleteSlice& slice) const {
    const int last = cube.nSlices() - 1;
    if (slice.isRow) {
        return Block(Point{slice.index, 0}, Point{slice.index, last});
    }
    return Block(Point{0, slice.index}, Point{last, slice.index});
}

void CenterReductionSolver::swapEntireFaceOddCube(Color color, FaceName source) {
    throw InternalError("swapping the whole " + toString(color) + " face from " + toString(source) +
                        " is not implemented");
}

bool CenterReductionSolver::isFaceSolved(FaceName face, Color color) const {
    return cube.isCenterMonochrome(face) && cube.centerColor(face, Point{0, 0}) == color;
}

void CenterReductionSolver::assertMatchesScheme(const TrackerHolder& holder) const {
    if (!config.sanityCheckIsBoy) {
        return;
    }
    ColorScheme layout(holder.getFaceColors());
    if (!layout.same(cube.originalScheme())) {
        throw InternalError("tracked layout " + layout.toString() + " does not match " +
                            cube.originalScheme().toString());
    }
}
