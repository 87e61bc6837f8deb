#pragma once

#include <optional>
#include <vector>

#include "BlockCommutator.h"
#include "Config.h"
#include "Cube.h"
#include "FaceTracker.h"
#include "FaceTranslator.h"
#include "Logger.h"
#include "Operator.h"

// Reduces every center grid to one color, face by face
class CenterReductionSolver {
public:
    CenterReductionSolver(Operator& op, const Config& config, const Logger& logger);

    CenterReductionSolver(const CenterReductionSolver&) = delete;
    CenterReductionSolver& operator=(const CenterReductionSolver&) = delete;

    // Throws InternalError when the centers could not be reduced
    void solve(TrackerHolder& holder);
    void solveSingleFace(TrackerHolder& holder, const FaceTracker& target);

    bool solved() const { return isCubeSolved(cube); }
    static bool isCubeSolved(const Cube& cube);

    const BlockStatistics& getBlockStatistics() const { return commutator.statistics(); }
    void resetBlockStatistics() { commutator.resetStatistics(); }

private:
    // A full row or column of the center grid
    struct CompleteSlice {
        bool isRow = false;
        int index = 0;
        int matches = 0;
    };

    bool doFaces(TrackerHolder& holder, const std::vector<const FaceTracker*>& faces);
    bool doCenter(TrackerHolder& holder, const FaceTracker& tracker);
    bool doCenterFromFace(TrackerHolder& holder, const FaceColors& colors, Color color, FaceName source);

    bool doCompleteSlices(TrackerHolder& holder, const FaceColors& colors, Color color, FaceName source);
    bool doOneCompleteSlice(const FaceColors& colors, Color color, FaceName source);
    void swapSlice(const CompleteSlice& targetSlice, const CompleteSlice& sourceSlice, FaceName source);
    std::vector<CompleteSlice> searchSlicesOnFace(FaceName face, Color color, std::optional<int> index,
                                                  bool searchMax) const;
    Block lineBlock(const CompleteSlice& slice) const;

    bool doBlocks(TrackerHolder& holder, Color color, FaceName source);
    void swapEntireFaceOddCube(Color color, FaceName source);

    bool isFaceSolved(FaceName face, Color color) const;
    void assertMatchesScheme(const TrackerHolder& holder) const;

    Cube& cube;
    Operator& op;
    const Config& config;
    const Logger& logger;
    FaceTranslator translator;
    BlockCommutator commutator;
};
