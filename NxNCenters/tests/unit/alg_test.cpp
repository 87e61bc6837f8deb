// Move notation, algorithm algebra and the operator's history.

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "Alg.h"
#include "Cube.h"
#include "Errors.h"
#include "Logger.h"
#include "Operator.h"

void testParse() {
    std::cout << "\n=== Test: Parse ===\n";

    Alg alg = Alg::parse("R U' F2 M[2] M[1:3]' X");
    assert(alg.count() == 6);
    assert(alg.toString() == "R U' F2 M[2] M[1:3]' X");

    const auto& moves = alg.moves();
    assert(moves[0].kind == AlgMove::Kind::Face && moves[0].face == FaceName::R && moves[0].n == 1);
    assert(moves[1].n == -1);
    assert(moves[2].n == 2);
    assert(moves[3].kind == AlgMove::Kind::Slice && moves[3].first == 2 && moves[3].last == 2);
    assert(moves[4].first == 1 && moves[4].last == 3 && moves[4].n == -1);
    assert(moves[5].kind == AlgMove::Kind::Whole && moves[5].axis == AxisName::X);

    assert(Alg::parse("  ").empty());
    assert(Alg::parse("y").moves().front().axis == AxisName::Y);

    for (const char* bad : {"Q", "M[", "M[0]", "M[3:1]", "R[1]", "R2x", "M[99999999999]"}) {
        bool thrown = false;
        try {
            Alg::parse(bad);
        } catch (const AlgParseError&) {
            thrown = true;
        }
        std::cout << "  '" << bad << "' rejected: " << (thrown ? "yes" : "no") << "\n";
        assert(thrown);
    }

    std::cout << "PASSED: Parse\n";
}

void testAlgebra() {
    std::cout << "\n=== Test: Inverse, Simplify, Repeat ===\n";

    assert(Alg::parse("R U").inverse().toString() == "U' R'");
    assert(Alg::parse("R R").simplify().toString() == "R2");
    assert(Alg::parse("R R'").simplify().empty());
    assert(Alg::parse("R R R").simplify().toString() == "R'");
    assert(Alg::parse("R U U' R'").simplify().empty());
    assert(Alg::parse("M[1] M[1:2]").simplify().count() == 2);

    assert((Alg::face(FaceName::R) * 2).toString() == "R2");
    assert((Alg::parse("R U") * 2).toString() == "R U R U");
    assert((Alg::parse("R U") * -1) == Alg::parse("R U").inverse());

    Alg a = Alg::face(FaceName::F) + Alg::slice(SliceName::E, 1, -1);
    a += Alg::whole(AxisName::Z, 2);
    assert(a.toString() == "F E[1]' Z2");

    std::cout << "PASSED: Inverse, simplify, repeat\n";
}

void testScramble() {
    std::cout << "\n=== Test: Scramble ===\n";

    Alg first = Alg::scramble(5, 42);
    Alg again = Alg::scramble(5, 42);
    assert(first == again);
    assert(first.count() == 50);
    assert(Alg::scramble(5, 43) != first);
    assert(Alg::scramble(3, 1, 12).count() == 12);

    for (const auto& m : Alg::scramble(4, 9).moves()) {
        if (m.kind == AlgMove::Kind::Slice) {
            assert(m.first >= 1 && m.last <= 2);
        }
        assert(m.kind != AlgMove::Kind::Whole);
    }

    bool thrown = false;
    try {
        Alg::scramble(1, 0);
    } catch (const InternalError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED: Scramble\n";
}

void testOperatorHistory() {
    std::cout << "\n=== Test: Operator History ===\n";

    Logger logger;
    Cube cube(5);
    Operator op(cube, logger);
    const auto solved = cube.colors();

    assert(!op.undo());

    Alg scramble = Alg::scramble(5, 3);
    op.play(scramble);
    assert(op.movesPlayed() == scramble.count());
    assert(op.historyAlg() == scramble);
    assert(cube.colors() != solved);

    op.play(scramble, true);
    assert(cube.colors() == solved);

    std::size_t mark = op.historyMark();
    op.play(Alg::parse("R U M[2]"));
    op.undoTo(mark);
    assert(cube.colors() == solved);
    assert(op.historyMark() == mark);

    op.play(Alg::parse("F"));
    assert(op.undo());
    assert(cube.colors() == solved);

    std::cout << "PASSED: Operator history\n";
}

void testQueryRestoreState() {
    std::cout << "\n=== Test: Query Restore State ===\n";

    Logger logger;
    Cube cube(4);
    Operator op(cube, logger);
    op.play(Alg::parse("R U"));
    const auto before = cube.colors();

    {
        Operator::QueryRestoreState restore(op);
        op.play(Alg::parse("F2 E[1] L'"));
        assert(cube.colors() != before);
    }
    assert(cube.colors() == before);
    assert(op.history().size() == 2);

    std::cout << "PASSED: Query restore state\n";
}

void testAbortAndListener() {
    std::cout << "\n=== Test: Abort and Listener ===\n";

    std::ostringstream log;
    Logger logger(log, LogLevel::Debug);
    Cube cube(4);
    Operator op(cube, logger);

    int heard = 0;
    op.setMoveListener([&](const AlgMove&) { ++heard; });
    op.play(Alg::parse("R U R'"));
    assert(heard == 3);
    op.undo();
    assert(heard == 4);
    assert(log.str().find("[debug] Operator: play R U R'") != std::string::npos);

    const auto before = cube.colors();
    op.requestAbort();
    bool thrown = false;
    try {
        op.play(Alg::parse("F B"));
    } catch (const OpAbortedError&) {
        thrown = true;
    }
    assert(thrown);
    assert(cube.colors() == before);

    op.clearAbort();
    op.play(Alg::parse("F"));
    assert(cube.colors() != before);

    std::cout << "PASSED: Abort and listener\n";
}

int main() {
    std::cout << "=================================\n";
    std::cout << "Alg and Operator Tests\n";
    std::cout << "=================================\n";

    testParse();
    testAlgebra();
    testScramble();
    testOperatorHistory();
    testQueryRestoreState();
    testAbortAndListener();

    std::cout << "\n=================================\n";
    std::cout << "All tests completed!\n";
    std::cout << "=================================\n";

    return 0;
}
