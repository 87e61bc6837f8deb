#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Alg.h"
#include "Cube.h"
#include "CubeTypes.h"
#include "FaceTranslator.h"
#include "Logger.h"
#include "Operator.h"

enum class SearchBlockMode : int {
    CompleteBlock, // every source cell has the color
    BigThanSource, // more matching cells than the target block already holds
    ExactMatch,    // target holds none of the color, every source cell has it
};

struct CommutatorResult {
    Alg alg;
    SliceName slice = SliceName::M;
    Block targetBlock;
    Block naturalSourceBlock; // source cells the slice carries onto the target block
    Block sourceBlock;        // where the moved source content starts
    Block secondBlock;        // source cells receiving the old target content
    int setupRotations = 0;   // clockwise turns of the source face before the commutator
    bool targetClockwise = true;
};

// Histogram of executed commutators by block size
class BlockStatistics {
public:
    void record(int blockSize) { ++sizes[blockSize]; }
    void reset() { sizes.clear(); }

    const std::map<int, int>& histogram() const { return sizes; }
    int total() const;
    int totalPieces() const;
    std::string toString() const;

private:
    std::map<int, int> sizes;
};

// 3-cycles rectangular blocks of centers between two faces with
//   slice(C) face(T) slice(C2) face(T)' slice(C)' face(T) slice(C2)' face(T)'
// where C are the slice lines of the target block and C2 those of the block
// after one turn of the target face.
class BlockCommutator {
public:
    using CellPredicate = std::function<bool(FaceName, const Point&)>;

    BlockCommutator(Cube& cube, Operator& op, const Logger& logger);

    BlockCommutator(const BlockCommutator&) = delete;
    BlockCommutator& operator=(const BlockCommutator&) = delete;

    // Slice carrying content between the faces and how it cuts the target
    SliceName commutatorSlice(FaceName source, FaceName target) const;
    SliceCut cutFor(FaceName source, FaceName target) const;

    Block naturalSourceBlock(FaceName source, FaceName target, const Block& targetBlock) const;

    // Clockwise turns of the source face that bring a qualifying block onto
    // the natural source block, or nothing
    std::optional<int> searchBlock(FaceName target, FaceName source, Color requiredColor, SearchBlockMode mode,
                                   const Block& targetBlock) const;

    // Rectangles of cells accepted by the predicate, largest first
    std::vector<Block> searchBigBlock(FaceName face, const CellPredicate& predicate, SliceCut cut) const;
    std::vector<Block> searchBigBlock(FaceName face, Color color, SliceCut cut) const;

    // Some turn of the target face moves the block off its own slice lines
    bool isValidBlock(const Block& block, SliceCut cut) const;

    CommutatorResult executeCommutator(FaceName source, FaceName target, const Block& targetBlock,
                                       std::optional<Block> sourceBlock, bool preserveState, bool dryRun = false);

    // Searches the source and runs the commutator; false when nothing qualified
    bool blockCommutator(FaceName target, FaceName source, Color requiredColor, const Block& targetBlock,
                         SearchBlockMode mode, bool preserveState);

    const BlockStatistics& statistics() const { return stats; }
    void resetStatistics() { stats.reset(); }

private:
    std::pair<int, int> indexRange(SliceName slice, FaceName face, const Block& block) const;
    bool isBlock(FaceName face, const Block& block, const CellPredicate& predicate) const;

    Cube& cube;
    Operator& op;
    const Logger& logger;
    FaceTranslator translator;
    BlockStatistics stats;
};
