#include "Operator.h"
#include "Errors.h"

Operator::Operator(Cube& cube, const Logger& logger) : target(cube), logger(logger) {}

void Operator::apply(const AlgMove& move) {
    switch (move.kind) {
        case AlgMove::Kind::Face:
            target.rotateFace(move.face, move.n);
            break;
        case AlgMove::Kind::Slice:
            if (move.first == 0) {
                target.rotateSlices(move.slice, 1, target.nSlices(), move.n);
            } else {
                target.rotateSlices(move.slice, move.first, move.last, move.n);
            }
            break;
        case AlgMove::Kind::Whole:
            target.rotateWhole(move.axis, move.n);
            break;
    }

    if (moveListener) {
        moveListener(move);
    }
}

void Operator::play(const Alg& alg, bool inverse) {
    Alg inverted;
    const Alg* toPlay = &alg;
    if (inverse) {
        inverted = alg.inverse();
        toPlay = &inverted;
    }

    logger.debug("Operator", [&](std::ostream& out) { out << "play " << toPlay->toString(); });

    for (const auto& move : toPlay->moves()) {
        if (abortFlag) {
            logger.info("Operator", [&](std::ostream& out) { out << "aborted before " << move.toString(); });
            throw OpAbortedError();
        }
        apply(move);
        historyMoves.push_back(move);
        ++played;
    }
}

bool Operator::undo() {
    if (historyMoves.empty()) {
        return false;
    }
    AlgMove last = historyMoves.back();
    historyMoves.pop_back();
    apply(last.inverse());
    return true;
}

void Operator::undoTo(std::size_t mark) {
    while (historyMoves.size() > mark) {
        undo();
    }
}
