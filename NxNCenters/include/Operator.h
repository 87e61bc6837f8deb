#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include "Alg.h"
#include "Cube.h"
#include "Logger.h"

// Plays algorithms on a cube one atomic move at a time and keeps the history
class Operator {
public:
    using MoveListener = std::function<void(const AlgMove&)>;

    Operator(Cube& cube, const Logger& logger);

    Operator(const Operator&) = delete;
    Operator& operator=(const Operator&) = delete;

    Cube& cube() { return target; }
    const Cube& cube() const { return target; }

    // Throws OpAbortedError before the next move once an abort was requested
    void play(const Alg& alg, bool inverse = false);

    // Reverts the last played move; false when the history is empty
    bool undo();
    std::size_t historyMark() const { return historyMoves.size(); }
    void undoTo(std::size_t mark);
    const std::vector<AlgMove>& history() const { return historyMoves; }
    Alg historyAlg() const { return Alg(historyMoves); }

    // Atomic moves applied by play, undo not subtracted
    long movesPlayed() const { return played; }

    void requestAbort() { abortFlag = true; }
    void clearAbort() { abortFlag = false; }
    bool abortRequested() const { return abortFlag; }

    void setMoveListener(MoveListener listener) { moveListener = std::move(listener); }

    // Undoes every move played while alive
    class QueryRestoreState {
    public:
        explicit QueryRestoreState(Operator& op) : op(op), mark(op.historyMark()) {}
        ~QueryRestoreState() { op.undoTo(mark); }

        QueryRestoreState(const QueryRestoreState&) = delete;
        QueryRestoreState& operator=(const QueryRestoreState&) = delete;

    private:
        Operator& op;
        std::size_t mark;
    };

private:
    void apply(const AlgMove& move);

    Cube& target;
    const Logger& logger;
    std::vector<AlgMove> historyMoves;
    std::atomic<bool> abortFlag{false};
    long played = 0;
    MoveListener moveListener;
};
