#include "Alg.h"
#include "Errors.h"

#include <cctype>
#include <cstdlib>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

int normalizedCount(int n) {
    int m = ((n % 4) + 4) % 4;
    return m == 3 ? -1 : m;
}

std::string countSuffix(int n) {
    switch (((n % 4) + 4) % 4) {
        case 0: return "0";
        case 1: return "";
        case 2: return "2";
        default: return "'";
    }
}

int parseNumber(const std::string& token, size_t& pos) {
    size_t start = pos;
    while (pos < token.size() && std::isdigit(static_cast<unsigned char>(token[pos]))) {
        ++pos;
    }
    if (start == pos) {
        throw AlgParseError("expected a number in '" + token + "'");
    }
    try {
        return std::stoi(token.substr(start, pos - start));
    } catch (const std::out_of_range&) {
        throw AlgParseError("number out of range in '" + token + "'");
    }
}

AlgMove parseMove(const std::string& token) {
    AlgMove move;
    switch (token[0]) {
        case 'F': move.kind = AlgMove::Kind::Face; move.face = FaceName::F; break;
        case 'R': move.kind = AlgMove::Kind::Face; move.face = FaceName::R; break;
        case 'U': move.kind = AlgMove::Kind::Face; move.face = FaceName::U; break;
        case 'L': move.kind = AlgMove::Kind::Face; move.face = FaceName::L; break;
        case 'D': move.kind = AlgMove::Kind::Face; move.face = FaceName::D; break;
        case 'B': move.kind = AlgMove::Kind::Face; move.face = FaceName::B; break;
        case 'M': move.kind = AlgMove::Kind::Slice; move.slice = SliceName::M; break;
        case 'E': move.kind = AlgMove::Kind::Slice; move.slice = SliceName::E; break;
        case 'S': move.kind = AlgMove::Kind::Slice; move.slice = SliceName::S; break;
        case 'X': case 'x': move.kind = AlgMove::Kind::Whole; move.axis = AxisName::X; break;
        case 'Y': case 'y': move.kind = AlgMove::Kind::Whole; move.axis = AxisName::Y; break;
        case 'Z': case 'z': move.kind = AlgMove::Kind::Whole; move.axis = AxisName::Z; break;
        default: throw AlgParseError("unknown move '" + token + "'");
    }

    size_t pos = 1;
    if (pos < token.size() && token[pos] == '[') {
        if (move.kind != AlgMove::Kind::Slice) {
            throw AlgParseError("only slices take an index: '" + token + "'");
        }
        ++pos;
        move.first = parseNumber(token, pos);
        move.last = move.first;
        if (pos < token.size() && token[pos] == ':') {
            ++pos;
            move.last = parseNumber(token, pos);
        }
        if (pos >= token.size() || token[pos] != ']') {
            throw AlgParseError("missing ']' in '" + token + "'");
        }
        ++pos;
        if (move.first < 1 || move.first > move.last) {
            throw AlgParseError("bad slice range in '" + token + "'");
        }
    }

    move.n = 1;
    if (pos < token.size() && std::isdigit(static_cast<unsigned char>(token[pos]))) {
        move.n = parseNumber(token, pos);
    }
    if (pos < token.size() && token[pos] == '\'') {
        move.n = -move.n;
        ++pos;
    }
    if (pos != token.size()) {
        throw AlgParseError("unexpected text in '" + token + "'");
    }
    return move;
}

} // namespace

bool AlgMove::sameLayers(const AlgMove& other) const {
    if (kind != other.kind) {
        return false;
    }
    switch (kind) {
        case Kind::Face: return face == other.face;
        case Kind::Slice: return slice == other.slice && first == other.first && last == other.last;
        case Kind::Whole: return axis == other.axis;
    }
    return false;
}

AlgMove AlgMove::inverse() const {
    AlgMove m = *this;
    m.n = -n;
    return m;
}

std::string AlgMove::toString() const {
    std::string s;
    switch (kind) {
        case Kind::Face:
            s = ::toString(face);
            break;
        case Kind::Slice:
            s = ::toString(slice);
            if (first > 0) {
                s += "[" + std::to_string(first);
                if (last != first) {
                    s += ":" + std::to_string(last);
                }
                s += "]";
            }
            break;
        case Kind::Whole:
            s = ::toString(axis);
            break;
    }
    return s + countSuffix(n);
}

Alg Alg::face(FaceName f, int n) {
    AlgMove m;
    m.kind = AlgMove::Kind::Face;
    m.face = f;
    m.n = n;
    return Alg(std::vector<AlgMove>{m});
}

Alg Alg::slice(SliceName s, int index, int n) {
    return sliceRange(s, index, index, n);
}

Alg Alg::sliceRange(SliceName s, int first, int last, int n) {
    if (first > last) {
        std::swap(first, last);
    }
    AlgMove m;
    m.kind = AlgMove::Kind::Slice;
    m.slice = s;
    m.first = first;
    m.last = last;
    m.n = n;
    return Alg(std::vector<AlgMove>{m});
}

Alg Alg::whole(AxisName a, int n) {
    AlgMove m;
    m.kind = AlgMove::Kind::Whole;
    m.axis = a;
    m.n = n;
    return Alg(std::vector<AlgMove>{m});
}

Alg Alg::parse(const std::string& text) {
    std::istringstream in(text);
    std::string token;
    std::vector<AlgMove> moves;
    while (in >> token) {
        moves.push_back(parseMove(token));
    }
    return Alg(std::move(moves));
}

Alg Alg::scramble(int cubeSize, unsigned int seed, int length) {
    if (cubeSize < 2) {
        throw InternalError("cannot scramble a cube of size " + std::to_string(cubeSize));
    }
    if (length <= 0) {
        length = 20 + 10 * (cubeSize - 2);
    }

    const int nSlices = cubeSize - 2;
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> layerDist(0, nSlices > 0 ? 8 : 5);
    std::uniform_int_distribution<int> indexDist(1, nSlices > 0 ? nSlices : 1);
    std::uniform_int_distribution<int> countDist(0, 2);
    const int counts[] = {1, 2, -1};

    std::vector<AlgMove> moves;
    moves.reserve(length);
    for (int i = 0; i < length; ++i) {
        int layer = layerDist(gen);
        int n = counts[countDist(gen)];
        if (layer < 6) {
            moves.push_back(face(kAllFaces[layer], n).moves().front());
        } else {
            moves.push_back(slice(kAllSlices[layer - 6], indexDist(gen), n).moves().front());
        }
    }
    return Alg(std::move(moves));
}

Alg Alg::inverse() const {
    std::vector<AlgMove> moves;
    moves.reserve(moveList.size());
    for (auto it = moveList.rbegin(); it != moveList.rend(); ++it) {
        moves.push_back(it->inverse());
    }
    return Alg(std::move(moves));
}

Alg Alg::simplify() const {
    std::vector<AlgMove> stack;
    for (const auto& move : moveList) {
        if (!stack.empty() && stack.back().sameLayers(move)) {
            stack.back().n += move.n;
        } else {
            stack.push_back(move);
        }
        stack.back().n = normalizedCount(stack.back().n);
        if (stack.back().n == 0) {
            stack.pop_back();
        }
    }
    return Alg(std::move(stack));
}

Alg Alg::operator+(const Alg& other) const {
    Alg result = *this;
    result += other;
    return result;
}

Alg& Alg::operator+=(const Alg& other) {
    moveList.insert(moveList.end(), other.moveList.begin(), other.moveList.end());
    return *this;
}

Alg Alg::operator*(int k) const {
    if (moveList.size() == 1) {
        AlgMove m = moveList.front();
        m.n *= k;
        return Alg(std::vector<AlgMove>{m});
    }

    Alg unit = k < 0 ? inverse() : *this;
    Alg result;
    for (int i = 0; i < std::abs(k); ++i) {
        result += unit;
    }
    return result;
}

std::string Alg::toString() const {
    std::string s;
    for (const auto& m : moveList) {
        if (!s.empty()) s += " ";
        s += m.toString();
    }
    return s;
}
