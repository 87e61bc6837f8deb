// Face trackers on odd and even cubes, caching and the preserve scopes.

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "Alg.h"
#include "ColorScheme.h"
#include "Config.h"
#include "Cube.h"
#include "Errors.h"
#include "FaceTracker.h"
#include "Logger.h"
#include "Operator.h"

namespace {

FaceColors boyColors() {
    FaceColors colors{};
    for (FaceName f : kAllFaces) {
        colors[faceIndex(f)] = ColorScheme::boy().colorOf(f);
    }
    return colors;
}

int trackerTags(const Cube& cube) {
    int count = 0;
    for (int i = 0; i < cube.stickerCount(); ++i) {
        for (const auto& tag : cube.sticker(i).tags.all()) {
            if (tag.kind == TagKind::FaceTracker) ++count;
        }
    }
    return count;
}

} // namespace

void testSolvedLayouts() {
    std::cout << "\n=== Test: Trackers on Solved Cubes ===\n";

    Config config;
    Logger logger;
    for (int size = 3; size <= 8; ++size) {
        Cube cube(size);
        TrackerHolder holder(cube, config, logger);
        assert(holder.trackers().size() == 6);
        assert(holder.getFaceColors() == boyColors());
        assert(holder.isBoy());
        assert(holder.faceByColor(Color::Blue) == FaceName::F);
        assert(holder.trackerByColor(Color::Yellow).color() == Color::Yellow);
        assert(holder.adjacentTrackers(holder.trackerByColor(Color::Blue)).size() == 4);
        for (const auto& e : cube.edges()) assert(holder.partMatchFaces(e));
        for (const auto& c : cube.corners()) assert(holder.partMatchFaces(c));

        // even cubes mark two centers, odd cubes read the fixed middle
        assert(trackerTags(cube) == (size % 2 ? 0 : 2));
    }

    std::cout << "PASSED: Trackers on solved cubes\n";
}

void testScrambledBijection() {
    std::cout << "\n=== Test: Scrambled Cubes Keep a Bijection ===\n";

    Config config;
    Logger logger;
    for (int size = 4; size <= 7; ++size) {
        for (unsigned int seed = 1; seed <= 5; ++seed) {
            Cube cube(size);
            Operator op(cube, logger);
            op.play(Alg::scramble(size, seed));

            TrackerHolder holder(cube, config, logger);
            FaceColors colors = holder.getFaceColors();
            assert(ColorScheme(colors).isPermutation());
            assert(ColorScheme(colors).same(cube.originalScheme()));

            // the layout follows whole-cube turns
            op.play(Alg::parse("X Y'"));
            assert(ColorScheme(holder.getFaceColors()).same(cube.originalScheme()));
        }
    }

    std::cout << "PASSED: Scrambled cubes keep a bijection\n";
}

void testTwoByTwo() {
    std::cout << "\n=== Test: 2x2 Has No Trackers ===\n";

    Config config;
    Logger logger;
    Cube cube(2);
    bool thrown = false;
    try {
        TrackerHolder holder(cube, config, logger);
    } catch (const InternalError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED: 2x2 has no trackers\n";
}

void testTagsReleased() {
    std::cout << "\n=== Test: Tags Released With Holder ===\n";

    Config config;
    Logger logger;
    Cube cube(6);
    Operator op(cube, logger);
    op.play(Alg::scramble(6, 11));
    {
        TrackerHolder first(cube, config, logger);
        TrackerHolder second(cube, config, logger);
        assert(first.id() != second.id());
        assert(trackerTags(cube) == 4);
    }
    assert(trackerTags(cube) == 0);

    std::cout << "PASSED: Tags released with holder\n";
}

void testCache() {
    std::cout << "\n=== Test: Face Color Cache ===\n";

    Config config;
    Logger logger;
    Cube cube(5);
    Operator op(cube, logger);
    TrackerHolder holder(cube, config, logger);

    assert(holder.getFaceColors() == boyColors());
    op.play(Alg::parse("Y"));
    // Y turns like U: R comes to F
    assert(holder.faceColor(FaceName::F) == Color::Red);
    assert(holder.faceByColor(Color::Blue) == FaceName::L);

    {
        auto frozen = holder.frozenFaceColors();
        op.play(Alg::parse("Y'"));
        assert(holder.faceColor(FaceName::F) == Color::Red);
    }
    assert(holder.faceColor(FaceName::F) == Color::Blue);

    std::cout << "PASSED: Face color cache\n";
}

void testPhysicalFacesGuard() {
    std::cout << "\n=== Test: Preserve Physical Faces ===\n";

    Config config;
    config.validateTrackers = true;
    Logger logger;
    Cube cube(4);
    Operator op(cube, logger);
    TrackerHolder holder(cube, config, logger);

    std::vector<FaceName> before;
    for (const auto& t : holder.trackers()) before.push_back(holder.faceOf(t));

    // F's marked center is cell (0,0); M[1] carries it down to D
    {
        auto guard = holder.preservePhysicalFaces();
        assert(holder.insidePreserveScope());
        op.play(Alg::parse("M[1]"));
        assert(holder.faceOf(holder.trackers()[0]) == FaceName::D);
        // the layout of the scope's start until the guard puts the tag back
        assert(holder.getFaceColors() == boyColors());
    }
    assert(!holder.insidePreserveScope());
    for (size_t i = 0; i < before.size(); ++i) {
        assert(holder.faceOf(holder.trackers()[i]) == before[i]);
    }
    assert(holder.getFaceColors() == boyColors());

    // an exception leaving the scope still restores the trackers
    bool caught = false;
    try {
        auto guard = holder.preservePhysicalFaces();
        op.play(Alg::parse("M[1] M[2]"));
        throw std::runtime_error("interrupted");
    } catch (const std::runtime_error&) {
        caught = true;
    }
    assert(caught);
    assert(!holder.insidePreserveScope());
    for (size_t i = 0; i < before.size(); ++i) {
        assert(holder.faceOf(holder.trackers()[i]) == before[i]);
    }

    std::cout << "PASSED: Preserve physical faces\n";
}

void testValidationCatchesDrift() {
    std::cout << "\n=== Test: Validation Catches Changed Colors ===\n";

    Config config;
    config.validateTrackers = true;
    Logger logger;
    Cube cube(5);
    Operator op(cube, logger);
    TrackerHolder holder(cube, config, logger);

    bool thrown = false;
    try {
        auto guard = holder.preservePhysicalFaces();
        op.play(Alg::parse("Y"));
    } catch (const InternalError&) {
        thrown = true;
    }
    assert(thrown);
    assert(!holder.insidePreserveScope());

    std::cout << "PASSED: Validation catches changed colors\n";
}

int main() {
    std::cout << "=================================\n";
    std::cout << "Face Tracker Tests\n";
    std::cout << "=================================\n";

    testSolvedLayouts();
    testScrambledBijection();
    testTwoByTwo();
    testTagsReleased();
    testCache();
    testPhysicalFacesGuard();
    testValidationCatchesDrift();

    std::cout << "\n=================================\n";
    std::cout << "All tests completed!\n";
    std::cout << "=================================\n";

    return 0;
}
