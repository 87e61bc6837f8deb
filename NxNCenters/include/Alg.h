#pragma once

#include <string>
#include <utility>
#include <vector>

#include "CubeTypes.h"

// One atomic move with a signed quarter-turn count
struct AlgMove {
    enum class Kind : int { Face, Slice, Whole };

    Kind kind = Kind::Face;
    FaceName face = FaceName::F;
    SliceName slice = SliceName::M;
    AxisName axis = AxisName::X;
    int first = 0; // 1-based inclusive slice range, 0/0 = every inner layer
    int last = 0;
    int n = 1;

    bool sameLayers(const AlgMove& other) const;
    AlgMove inverse() const;
    std::string toString() const;

    bool operator==(const AlgMove& other) const { return sameLayers(other) && n == other.n; }
    bool operator!=(const AlgMove& other) const { return !(*this == other); }
};

class Alg {
public:
    Alg() = default;
    explicit Alg(std::vector<AlgMove> moves) : moveList(std::move(moves)) {}

    static Alg face(FaceName f, int n = 1);
    static Alg slice(SliceName s, int index, int n = 1);
    static Alg sliceRange(SliceName s, int first, int last, int n = 1);
    static Alg whole(AxisName a, int n = 1);

    // Standard notation: R R' R2 M[2] M[1:3]' X, separated by spaces
    static Alg parse(const std::string& text);

    // Deterministic random face and inner slice turns
    static Alg scramble(int cubeSize, unsigned int seed, int length = 0);

    Alg inverse() const;
    // Merges neighbouring moves on identical layers and drops full turns
    Alg simplify() const;

    Alg operator+(const Alg& other) const;
    Alg& operator+=(const Alg& other);
    // Single move: multiplies its count. Sequence: repeats it, negative = inverse
    Alg operator*(int k) const;

    const std::vector<AlgMove>& moves() const { return moveList; }
    bool empty() const { return moveList.empty(); }
    int count() const { return static_cast<int>(moveList.size()); }
    std::string toString() const;

    bool operator==(const Alg& other) const { return moveList == other.moveList; }
    bool operator!=(const Alg& other) const { return !(*this == other); }

private:
    std::vector<AlgMove> moveList;
};
