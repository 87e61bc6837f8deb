#include "BlockCommutator.h"
#include "CubeTopology.h"
#include "Errors.h"

#include <algorithm>
#include <sstream>

namespace {

bool intersects(const std::pair<int, int>& a, const std::pair<int, int>& b) {
    return a.first <= b.second && b.first <= a.second;
}

std::pair<int, int> lines(const Block& b, SliceCut cut) {
    Block nb = b.normalized();
    if (cut == SliceCut::Row) {
        return {nb.start.row, nb.end.row};
    }
    return {nb.start.col, nb.end.col};
}

} // namespace

int BlockStatistics::total() const {
    int count = 0;
    for (const auto& entry : sizes) {
        count += entry.second;
    }
    return count;
}

int BlockStatistics::totalPieces() const {
    int count = 0;
    for (const auto& entry : sizes) {
        count += entry.first * entry.second;
    }
    return count;
}

std::string BlockStatistics::toString() const {
    std::ostringstream out;
    out << total() << " commutators, " << totalPieces() << " pieces";
    for (auto it = sizes.rbegin(); it != sizes.rend(); ++it) {
        out << "\n  size " << it->first << ": " << it->second;
    }
    return out.str();
}

BlockCommutator::BlockCommutator(Cube& cube, Operator& op, const Logger& logger)
    : cube(cube), op(op), logger(logger), translator(cube.geometry()) {}

SliceName BlockCommutator::commutatorSlice(FaceName source, FaceName target) const {
    return CubeTopology::slicesConnecting(source, target).front();
}

SliceCut BlockCommutator::cutFor(FaceName source, FaceName target) const {
    return CubeTopology::doesSliceCutRowsOrColumns(commutatorSlice(source, target), target);
}

std::pair<int, int> BlockCommutator::indexRange(SliceName slice, FaceName face, const Block& block) const {
    const WalkingInfo& walk = cube.geometry().walkingInfo(slice);
    int a = walk.sliceIndex(face, block.start);
    int b = walk.sliceIndex(face, block.end);
    return {std::min(a, b), std::max(a, b)};
}

Block BlockCommutator::naturalSourceBlock(FaceName source, FaceName target, const Block& targetBlock) const {
    Block k = targetBlock.normalized();
    Point start = translator.translate(target, source, k.start).sliceAlgorithms.front().sourceCoord;
    Point end = translator.translate(target, source, k.end).sliceAlgorithms.front().sourceCoord;
    return Block(start, end).normalized();
}

bool BlockCommutator::isValidBlock(const Block& block, SliceCut cut) const {
    const auto& geometry = cube.geometry();
    auto own = lines(block, cut);
    for (int direction : {1, -1}) {
        if (!intersects(own, lines(geometry.rotateClockwise(block, direction), cut))) {
            return true;
        }
    }
    return false;
}

bool BlockCommutator::isBlock(FaceName face, const Block& block, const CellPredicate& predicate) const {
    Block b = block.normalized();
    for (int r = b.start.row; r <= b.end.row; ++r) {
        for (int c = b.start.col; c <= b.end.col; ++c) {
            if (!predicate(face, Point{r, c})) {
                return false;
            }
        }
    }
    return true;
}

std::optional<int> BlockCommutator::searchBlock(FaceName target, FaceName source, Color requiredColor,
                                                SearchBlockMode mode, const Block& targetBlock) const {
    Block k = targetBlock.normalized();
    const int size = k.size();
    const int onTarget = cube.countColorOnBlock(target, k, requiredColor);

    if (onTarget == size) {
        return std::nullopt;
    }

    int minRequired = size;
    switch (mode) {
        case SearchBlockMode::CompleteBlock:
            minRequired = size;
            break;
        case SearchBlockMode::BigThanSource:
            minRequired = onTarget + 1;
            break;
        case SearchBlockMode::ExactMatch:
            if (onTarget > 0) {
                return std::nullopt;
            }
            minRequired = size;
            break;
    }

    Block candidate = naturalSourceBlock(source, target, k);
    for (int n = 0; n < 4; ++n) {
        if (cube.countColorOnBlock(source, candidate, requiredColor) >= minRequired) {
            return (4 - n) % 4;
        }
        candidate = cube.geometry().rotateClockwise(candidate, 1);
    }
    return std::nullopt;
}

std::vector<Block> BlockCommutator::searchBigBlock(FaceName face, const CellPredicate& predicate,
                                                   SliceCut cut) const {
    const int n = cube.nSlices();
    std::vector<Block> blocks;

    for (int row = 0; row < n; ++row) {
        for (int col = 0; col < n; ++col) {
            Point start{row, col};
            if (!predicate(face, start)) {
                continue;
            }

            Block single(start);
            if (isValidBlock(single, cut)) {
                blocks.push_back(single);
            }

            int rowMax = row;
            for (int r = row + 1; r < n; ++r) {
                Block b(start, Point{r, col});
                if (!isValidBlock(b, cut) || !isBlock(face, b, predicate)) {
                    break;
                }
                rowMax = r;
            }

            int colMax = col;
            for (int c = col + 1; c < n; ++c) {
                Block b(start, Point{rowMax, c});
                if (!isValidBlock(b, cut) || !isBlock(face, b, predicate)) {
                    break;
                }
                colMax = c;
            }

            Block extended(start, Point{rowMax, colMax});
            if (extended != single && isValidBlock(extended, cut)) {
                blocks.push_back(extended);
            }
        }
    }

    std::stable_sort(blocks.begin(), blocks.end(),
                     [](const Block& a, const Block& b) { return a.size() > b.size(); });
    return blocks;
}

std::vector<Block> BlockCommutator::searchBigBlock(FaceName face, Color color, SliceCut cut) const {
    return searchBigBlock(face, [this, color](FaceName f, const Point& p) { return cube.centerColor(f, p) == color; },
                          cut);
}

CommutatorResult BlockCommutator::executeCommutator(FaceName source, FaceName target, const Block& targetBlock,
                                                    std::optional<Block> sourceBlock, bool preserveState,
                                                    bool dryRun) {
    if (source == target) {
        throw InternalError("commutator source and target are both " + toString(source));
    }

    const auto& geometry = cube.geometry();

    CommutatorResult result;
    result.slice = commutatorSlice(source, target);
    result.targetBlock = targetBlock.normalized();
    result.naturalSourceBlock = naturalSourceBlock(source, target, result.targetBlock);

    const SliceName slice = result.slice;
    const int n = FaceTranslator::sliceTurns(slice, source, target);
    const auto targetLines = indexRange(slice, target, result.targetBlock);

    // The rotated block must leave the target block's slice lines
    std::optional<Block> rotated;
    for (int direction : {1, -1}) {
        Block candidate = geometry.rotateClockwise(result.targetBlock, direction).normalized();
        if (!intersects(targetLines, indexRange(slice, target, candidate))) {
            rotated = candidate;
            result.targetClockwise = direction == 1;
            break;
        }
    }
    if (!rotated) {
        throw InternalError("block " + toString(result.targetBlock) + " on " + toString(target) +
                            " overlaps its own slices under both rotations");
    }
    const auto rotatedLines = indexRange(slice, target, *rotated);

    result.sourceBlock = sourceBlock ? sourceBlock->normalized() : result.naturalSourceBlock;
    int setup = -1;
    for (int k = 0; k < 4; ++k) {
        if (geometry.rotateClockwise(result.sourceBlock, k).normalized() == result.naturalSourceBlock) {
            setup = k;
            break;
        }
    }
    if (setup < 0) {
        throw InternalError("source block " + toString(result.sourceBlock) + " cannot be turned onto " +
                            toString(result.naturalSourceBlock));
    }
    result.setupRotations = setup;

    Point secondStart = translator.translateTargetFromSource(target, source, rotated->start, slice);
    Point secondEnd = translator.translateTargetFromSource(target, source, rotated->end, slice);
    result.secondBlock = Block(secondStart, secondEnd).normalized();

    const Alg sliceOnTarget = Alg::sliceRange(slice, targetLines.first + 1, targetLines.second + 1, n);
    const Alg sliceOnRotated = Alg::sliceRange(slice, rotatedLines.first + 1, rotatedLines.second + 1, n);
    const Alg turn = Alg::face(target, result.targetClockwise ? 1 : -1);
    const Alg core = sliceOnTarget + turn + sliceOnRotated + turn.inverse() +
                     sliceOnTarget.inverse() + turn + sliceOnRotated.inverse() + turn.inverse();

    Alg setupAlg;
    if (setup != 0) {
        setupAlg = Alg::face(source, setup == 3 ? -1 : setup);
    }
    result.alg = setupAlg + core;
    if (preserveState && setup != 0) {
        result.alg += setupAlg.inverse();
        result.secondBlock = geometry.rotateClockwise(result.secondBlock, -setup).normalized();
    }

    logger.debug("Commutator", [&](std::ostream& out) {
        out << toString(source) << " -> " << toString(target) << " block " << toString(result.targetBlock)
            << " from " << toString(result.sourceBlock) << (dryRun ? " (dry run)" : "") << ": "
            << result.alg.toString();
    });

    if (!dryRun) {
        op.play(result.alg);
    }
    return result;
}

bool BlockCommutator::blockCommutator(FaceName target, FaceName source, Color requiredColor,
                                      const Block& targetBlock, SearchBlockMode mode, bool preserveState) {
    Block k = targetBlock.normalized();
    if (!isValidBlock(k, cutFor(source, target))) {
        return false;
    }

    std::optional<int> rotation = searchBlock(target, source, requiredColor, mode, k);
    if (!rotation) {
        return false;
    }

    Block natural = naturalSourceBlock(source, target, k);
    Block sourceBlock = cube.geometry().rotateClockwise(natural, (4 - *rotation) % 4);

    executeCommutator(source, target, k, sourceBlock, preserveState);
    stats.record(k.size());

    if (mode != SearchBlockMode::BigThanSource && cube.countColorOnBlock(target, k, requiredColor) != k.size()) {
        throw InternalError("block " + toString(k) + " on " + toString(target) + " was not filled with " +
                            toString(requiredColor));
    }
    return true;
}
