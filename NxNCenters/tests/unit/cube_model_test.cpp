// Sticker arena: moves, tags, counters and part descriptors.

#include <cassert>
#include <iostream>
#include <string>

#include "ColorScheme.h"
#include "Cube.h"
#include "Errors.h"

void testSolvedCube() {
    std::cout << "\n=== Test: Solved Cube ===\n";

    for (int size = 2; size <= 7; ++size) {
        Cube cube(size);
        assert(cube.stickerCount() == 6 * size * size);
        assert(cube.nSlices() == size - 2);
        assert(cube.matchesOriginalScheme());
        for (FaceName f : kAllFaces) {
            assert(cube.isCenterMonochrome(f));
            assert(cube.faceColor(f) == ColorScheme::boy().colorOf(f));
        }
    }

    Cube cube(4);
    assert(cube.countColorOnFace(FaceName::F, Color::Blue) == 4);
    assert(cube.countColorOnFace(FaceName::F, Color::Red) == 0);
    assert(cube.centerColor(FaceName::U, Point{1, 1}) == Color::Yellow);

    std::cout << "PASSED: Solved cube\n";
}

void testConstructionErrors() {
    std::cout << "\n=== Test: Construction Errors ===\n";

    bool thrown = false;
    try {
        Cube cube(1);
    } catch (const InternalError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        std::array<Color, 6> twice = {Color::Blue, Color::Blue, Color::Yellow, Color::Orange, Color::White,
                                      Color::Green};
        Cube cube(3, ColorScheme(twice));
    } catch (const InternalError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        Cube cube(4);
        cube.center(FaceName::F, Point{2, 0});
    } catch (const InternalError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED: Construction errors\n";
}

void testPeriodicity() {
    std::cout << "\n=== Test: Four Quarter Turns ===\n";

    for (int size = 2; size <= 7; ++size) {
        Cube cube(size);
        if (cube.nSlices() > 0) cube.rotateSlice(SliceName::M, 1);
        cube.rotateFace(FaceName::R);
        cube.rotateFace(FaceName::F, -1);
        const auto start = cube.colors();

        for (FaceName f : kAllFaces) {
            for (int i = 0; i < 4; ++i) cube.rotateFace(f);
            assert(cube.colors() == start);
        }
        for (SliceName s : kAllSlices) {
            for (int index = 1; index <= cube.nSlices(); ++index) {
                for (int i = 0; i < 4; ++i) cube.rotateSlice(s, index);
                assert(cube.colors() == start);
            }
        }
        for (AxisName a : kAllAxes) {
            for (int i = 0; i < 4; ++i) cube.rotateWhole(a);
            assert(cube.colors() == start);
        }

        cube.rotateFace(FaceName::U, 1);
        cube.rotateFace(FaceName::U, -1);
        assert(cube.colors() == start);
    }

    std::cout << "PASSED: Four quarter turns\n";
}

void testKnownMoves() {
    std::cout << "\n=== Test: Known Move Effects ===\n";

    Cube cube(3);
    // U clockwise brings R's top row onto F
    cube.rotateFace(FaceName::U);
    for (int col = 0; col < 3; ++col) {
        assert(cube.sticker(FaceName::F, 2, col).color == Color::Red);
        assert(cube.sticker(FaceName::F, 1, col).color == Color::Blue);
    }

    Cube sliced(3);
    // M turns like L and brings U's middle column onto F
    sliced.rotateSlice(SliceName::M, 1);
    for (int row = 0; row < 3; ++row) {
        assert(sliced.sticker(FaceName::F, row, 1).color == Color::Yellow);
        assert(sliced.sticker(FaceName::F, row, 0).color == Color::Blue);
        assert(sliced.sticker(FaceName::D, row, 1).color == Color::Blue);
    }

    Cube whole(4);
    // X turns like R and brings D onto F
    whole.rotateWhole(AxisName::X);
    assert(whole.isCenterMonochrome(FaceName::F));
    assert(whole.faceColor(FaceName::F) == Color::White);
    assert(whole.matchesOriginalScheme());

    std::cout << "PASSED: Known move effects\n";
}

void testTagsTravel() {
    std::cout << "\n=== Test: Tags Travel With Stickers ===\n";

    Cube cube(4);
    StickerTag probe;
    probe.kind = TagKind::Probe;
    probe.id = 7;
    cube.center(FaceName::F, Point{0, 0}).tags.add(probe);

    cube.rotateFace(FaceName::F);
    assert(cube.center(FaceName::F, Point{1, 0}).tags.has(TagKind::Probe, 0, 7));
    assert(!cube.center(FaceName::F, Point{0, 0}).tags.has(TagKind::Probe, 0, 7));

    // column 0 of F is inner slice M[1]; it goes down to D
    cube.rotateFace(FaceName::F, -1);
    cube.rotateSlice(SliceName::M, 1);
    int onD = 0;
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 2; ++c) {
            if (cube.center(FaceName::D, Point{r, c}).tags.has(TagKind::Probe, 0, 7)) ++onD;
        }
    }
    assert(onD == 1);

    cube.clearTags(TagKind::Probe);
    for (int i = 0; i < cube.stickerCount(); ++i) {
        assert(!cube.sticker(i).tags.hasKind(TagKind::Probe));
    }

    std::cout << "PASSED: Tags travel with stickers\n";
}

void testModifyCounter() {
    std::cout << "\n=== Test: Modify Counter ===\n";

    Cube cube(4);
    unsigned long start = cube.modifyCounter();
    cube.rotateFace(FaceName::R);
    assert(cube.modifyCounter() == start + 1);
    cube.rotateSlices(SliceName::E, 1, 2);
    assert(cube.modifyCounter() == start + 2);
    cube.rotateFace(FaceName::R, 4);
    assert(cube.modifyCounter() == start + 2);
    cube.reset();
    assert(cube.modifyCounter() == start + 3);
    assert(cube.matchesOriginalScheme());

    bool thrown = false;
    try {
        cube.rotateSlices(SliceName::E, 1, 3);
    } catch (const InternalError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED: Modify counter\n";
}

void testParts() {
    std::cout << "\n=== Test: Edges and Corners ===\n";

    Cube cube(5);
    assert(cube.edges().size() == 12);
    assert(cube.corners().size() == 8);
    for (const auto& e : cube.edges()) {
        assert(e.firstStickers.size() == 3);
        assert(e.secondStickers.size() == 3);
        for (size_t i = 0; i < e.firstStickers.size(); ++i) {
            assert(cube.sticker(e.firstStickers[i]).color == ColorScheme::boy().colorOf(e.first));
            assert(cube.sticker(e.secondStickers[i]).color == ColorScheme::boy().colorOf(e.second));
        }
    }
    for (const auto& c : cube.corners()) {
        for (int i = 0; i < 3; ++i) {
            assert(cube.sticker(c.stickers[i]).color == ColorScheme::boy().colorOf(c.faces[i]));
        }
    }
    for (const auto& f : cube.faces()) {
        assert(f.opposite != f.name);
        for (int e : f.edges) {
            const Edge& edge = cube.edges()[e];
            assert(edge.first == f.name || edge.second == f.name);
        }
    }
    const Edge& fu = cube.edgeBetween(FaceName::U, FaceName::F);
    assert(fu.first == FaceName::F && fu.second == FaceName::U);

    for (const auto& s : cube.slices()) {
        assert(s.count == 3);
    }

    std::cout << "PASSED: Edges and corners\n";
}

void testDump() {
    std::cout << "\n=== Test: Dump ===\n";

    Cube cube(3);
    std::string text = cube.dump();
    int lines = 0;
    for (char ch : text) {
        if (ch == '\n') ++lines;
    }
    assert(lines == 9);
    assert(text.find("OOO BBB RRR GGG") != std::string::npos);
    std::cout << text;

    std::cout << "PASSED: Dump\n";
}

int main() {
    std::cout << "=================================\n";
    std::cout << "Cube Model Tests\n";
    std::cout << "=================================\n";

    testSolvedCube();
    testConstructionErrors();
    testPeriodicity();
    testKnownMoves();
    testTagsTravel();
    testModifyCounter();
    testParts();
    testDump();

    std::cout << "\n=================================\n";
    std::cout << "All tests completed!\n";
    std::cout << "=================================\n";

    return 0;
}
