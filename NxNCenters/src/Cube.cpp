#include "Cube.h"
#include "CubeTopology.h"
#include "Errors.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace {

int roundToInt(float v) { return static_cast<int>(std::lround(v)); }

int outerCoordinates(const glm::vec3& cubie, int limit) {
    int count = 0;
    for (int axis = 0; axis < 3; ++axis) {
        if (std::abs(roundToInt(cubie[axis])) == limit) {
            ++count;
        }
    }
    return count;
}

// Position of a sticker along an edge of its face: column on a top or bottom
// edge, row on a left or right edge
int edgeOrder(FaceName face, FaceName neighbour, int row, int col) {
    const FaceFrame& frame = frameOf(face);
    if (std::abs(glm::dot(frameOf(neighbour).normal, frame.up)) > 0.5f) {
        return col;
    }
    return row;
}

} // namespace

Cube::Cube(int size, const ColorScheme& scheme) : n(size), scheme(scheme), geom(size >= 2 ? size - 2 : 0) {
    if (size < 2) {
        throw InternalError("cube size must be at least 2, got " + std::to_string(size));
    }
    if (!scheme.isPermutation()) {
        throw InternalError("color scheme is not a permutation: " + scheme.toString());
    }

    stickers.resize(static_cast<size_t>(kFaceCount) * n * n);

    for (FaceName f : kAllFaces) {
        Face& face = faceDescriptors[faceIndex(f)];
        face.name = f;
        face.opposite = CubeTopology::opposite(f);
    }
    for (SliceName s : kAllSlices) {
        Slice& slice = sliceDescriptors[static_cast<int>(s)];
        slice.name = s;
        slice.referenceFace = CubeTopology::referenceFace(s);
        slice.count = nSlices();
    }

    buildEdges();
    buildCorners();
    reset();
}

int Cube::stickerIndex(FaceName f, int row, int col) const {
    if (row < 0 || row >= n || col < 0 || col >= n) {
        throw InternalError("sticker (" + std::to_string(row) + "," + std::to_string(col) +
                            ") is outside face " + toString(f));
    }
    return faceIndex(f) * n * n + row * n + col;
}

int Cube::centerIndex(FaceName f, const Point& p) const {
    if (p.row < 0 || p.row >= nSlices() || p.col < 0 || p.col >= nSlices()) {
        throw InternalError("center " + toString(p) + " is outside face " + toString(f));
    }
    return stickerIndex(f, p.row + 1, p.col + 1);
}

glm::vec3 Cube::stickerPosition(int index) const {
    int face = index / (n * n);
    int rest = index % (n * n);
    int row = rest / n;
    int col = rest % n;

    const FaceFrame& frame = kFaceFrames[face];
    return static_cast<float>(n) * frame.normal
         + static_cast<float>(2 * col - (n - 1)) * frame.right
         + static_cast<float>(2 * row - (n - 1)) * frame.up;
}

int Cube::stickerAt(FaceName f, const glm::vec3& position) const {
    const FaceFrame& frame = frameOf(f);
    int col = (roundToInt(glm::dot(position, frame.right)) + (n - 1)) / 2;
    int row = (roundToInt(glm::dot(position, frame.up)) + (n - 1)) / 2;
    return stickerIndex(f, row, col);
}

const Cube::Permutation& Cube::layerPermutation(FaceName axisFace, int depth) const {
    auto key = std::make_pair(faceIndex(axisFace), depth);
    auto it = permutations.find(key);
    if (it != permutations.end()) {
        return it->second;
    }

    const glm::vec3& axis = frameOf(axisFace).normal;
    const int layerCoordinate = n - 1 - 2 * depth;

    Permutation permutation;
    for (int i = 0; i < stickerCount(); ++i) {
        glm::vec3 position = stickerPosition(i);
        const glm::vec3& normal = kFaceFrames[i / (n * n)].normal;
        glm::vec3 cubie = position - normal;
        if (roundToInt(glm::dot(cubie, axis)) != layerCoordinate) {
            continue;
        }

        glm::vec3 movedPosition = CubeTopology::rotateVector(position, axisFace);
        glm::vec3 movedNormal = CubeTopology::rotateVector(normal, axisFace);
        permutation.emplace_back(i, stickerAt(faceFromNormal(movedNormal), movedPosition));
    }

    return permutations.emplace(key, std::move(permutation)).first->second;
}

void Cube::applyPermutation(const Permutation& p, int quarterTurns) {
    int turns = ((quarterTurns % 4) + 4) % 4;
    std::vector<Sticker> moved(p.size());
    for (int t = 0; t < turns; ++t) {
        for (size_t i = 0; i < p.size(); ++i) {
            moved[i] = std::move(stickers[p[i].first]);
        }
        for (size_t i = 0; i < p.size(); ++i) {
            stickers[p[i].second] = std::move(moved[i]);
        }
    }
}

void Cube::rotateLayers(FaceName axisFace, int firstDepth, int lastDepth, int quarterTurns) {
    if (firstDepth < 0 || lastDepth >= n || firstDepth > lastDepth) {
        throw InternalError("layer range [" + std::to_string(firstDepth) + "," + std::to_string(lastDepth) +
                            "] is invalid on a cube of size " + std::to_string(n));
    }
    if (quarterTurns % 4 == 0) {
        return;
    }
    for (int depth = firstDepth; depth <= lastDepth; ++depth) {
        applyPermutation(layerPermutation(axisFace, depth), quarterTurns);
    }
    ++counter;
}

void Cube::rotateFace(FaceName f, int quarterTurns) {
    rotateLayers(f, 0, 0, quarterTurns);
}

void Cube::rotateSlice(SliceName s, int index, int quarterTurns) {
    rotateSlices(s, index, index, quarterTurns);
}

void Cube::rotateSlices(SliceName s, int first, int last, int quarterTurns) {
    if (first < 1 || last > nSlices() || first > last) {
        throw InternalError("slice " + toString(s) + "[" + std::to_string(first) + ":" + std::to_string(last) +
                            "] is invalid on a cube of size " + std::to_string(n));
    }
    rotateLayers(CubeTopology::referenceFace(s), first, last, quarterTurns);
}

void Cube::rotateWhole(AxisName a, int quarterTurns) {
    rotateLayers(CubeTopology::axisFace(a), 0, n - 1, quarterTurns);
}

int Cube::countColorOnFace(FaceName f, Color c) const {
    if (nSlices() == 0) {
        return 0;
    }
    return countColorOnBlock(f, Block(Point{0, 0}, Point{nSlices() - 1, nSlices() - 1}), c);
}

int Cube::countColorOnBlock(FaceName f, const Block& b, Color c) const {
    Block nb = b.normalized();
    int count = 0;
    for (int r = nb.start.row; r <= nb.end.row; ++r) {
        for (int col = nb.start.col; col <= nb.end.col; ++col) {
            if (centerColor(f, Point{r, col}) == c) {
                ++count;
            }
        }
    }
    return count;
}

bool Cube::isCenterMonochrome(FaceName f) const {
    if (nSlices() == 0) {
        return true;
    }
    Color first = centerColor(f, Point{0, 0});
    return countColorOnFace(f, first) == nSlices() * nSlices();
}

Color Cube::faceColor(FaceName f) const {
    if (nSlices() == 0) {
        return sticker(f, 0, 0).color;
    }
    return centerColor(f, Point{nSlices() / 2, nSlices() / 2});
}

bool Cube::matchesOriginalScheme() const {
    if (nSlices() == 0) {
        return true;
    }
    std::array<Color, 6> current{};
    for (FaceName f : kAllFaces) {
        if (!isCenterMonochrome(f)) {
            return false;
        }
        current[faceIndex(f)] = centerColor(f, Point{0, 0});
    }
    return ColorScheme(current).same(scheme);
}

const Edge& Cube::edgeBetween(FaceName a, FaceName b) const {
    for (const auto& e : edgeDescriptors) {
        if ((e.first == a && e.second == b) || (e.first == b && e.second == a)) {
            return e;
        }
    }
    throw InternalError("faces " + toString(a) + " and " + toString(b) + " share no edge");
}

void Cube::buildEdges() {
    for (FaceName a : kAllFaces) {
        for (FaceName b : kAllFaces) {
            if (faceIndex(a) >= faceIndex(b) || !CubeTopology::isAdjacent(a, b)) {
                continue;
            }

            const glm::vec3& normalA = frameOf(a).normal;
            const glm::vec3& normalB = frameOf(b).normal;

            std::vector<std::pair<int, int>> wings; // (order on a, sticker)
            for (int row = 0; row < n; ++row) {
                for (int col = 0; col < n; ++col) {
                    int index = stickerIndex(a, row, col);
                    glm::vec3 cubie = stickerPosition(index) - normalA;
                    if (roundToInt(glm::dot(cubie, normalB)) == n - 1 && outerCoordinates(cubie, n - 1) == 2) {
                        wings.emplace_back(edgeOrder(a, b, row, col), index);
                    }
                }
            }
            std::sort(wings.begin(), wings.end());

            Edge edge;
            edge.first = a;
            edge.second = b;
            for (const auto& w : wings) {
                glm::vec3 cubie = stickerPosition(w.second) - normalA;
                edge.firstStickers.push_back(w.second);
                edge.secondStickers.push_back(stickerAt(b, cubie + normalB));
            }
            if (!edge.secondStickers.empty()) {
                // wing 0 sits next to the corner at full grid position 1
                int rest = edge.secondStickers.front() % (n * n);
                edge.sameDirection = edgeOrder(b, a, rest / n, rest % n) == 1;
            }
            edgeDescriptors.push_back(std::move(edge));
        }
    }

    for (FaceName f : kAllFaces) {
        int filled = 0;
        for (int e = 0; e < static_cast<int>(edgeDescriptors.size()); ++e) {
            if (edgeDescriptors[e].first == f || edgeDescriptors[e].second == f) {
                faceDescriptors[faceIndex(f)].edges[filled++] = e;
            }
        }
        if (filled != 4) {
            throw InternalError("face " + toString(f) + " has " + std::to_string(filled) + " edges");
        }
    }
}

void Cube::buildCorners() {
    const float limit = static_cast<float>(n - 1);
    for (int sx : {-1, 1}) {
        for (int sy : {-1, 1}) {
            for (int sz : {-1, 1}) {
                glm::vec3 cubie(limit * sx, limit * sy, limit * sz);
                Corner corner;
                const std::array<glm::vec3, 3> normals = {
                    glm::vec3(static_cast<float>(sx), 0.0f, 0.0f),
                    glm::vec3(0.0f, static_cast<float>(sy), 0.0f),
                    glm::vec3(0.0f, 0.0f, static_cast<float>(sz)),
                };
                for (int i = 0; i < 3; ++i) {
                    corner.faces[i] = faceFromNormal(normals[i]);
                    corner.stickers[i] = stickerAt(corner.faces[i], cubie + normals[i]);
                }
                cornerDescriptors.push_back(corner);
            }
        }
    }

    for (FaceName f : kAllFaces) {
        int filled = 0;
        for (int c = 0; c < static_cast<int>(cornerDescriptors.size()); ++c) {
            const auto& faces = cornerDescriptors[c].faces;
            if (std::find(faces.begin(), faces.end(), f) != faces.end()) {
                faceDescriptors[faceIndex(f)].corners[filled++] = c;
            }
        }
    }
}

std::vector<Color> Cube::colors() const {
    std::vector<Color> result;
    result.reserve(stickers.size());
    for (const auto& s : stickers) {
        result.push_back(s.color);
    }
    return result;
}

void Cube::clearTags(TagKind kind) {
    for (auto& s : stickers) {
        s.tags.removeKind(kind);
    }
}

void Cube::reset() {
    for (FaceName f : kAllFaces) {
        for (int row = 0; row < n; ++row) {
            for (int col = 0; col < n; ++col) {
                Sticker& s = sticker(f, row, col);
                s.color = scheme.colorOf(f);
                s.tags.clear();
            }
        }
    }
    ++counter;
}

std::string Cube::dump() const {
    std::ostringstream out;
    auto line = [&](FaceName f, int row) {
        for (int col = 0; col < n; ++col) {
            out << colorChar(sticker(f, row, col).color);
        }
    };
    const std::string pad(static_cast<size_t>(n) + 1, ' ');

    for (int row = n - 1; row >= 0; --row) {
        out << pad;
        line(FaceName::U, row);
        out << '\n';
    }
    for (int row = n - 1; row >= 0; --row) {
        line(FaceName::L, row);
        out << ' ';
        line(FaceName::F, row);
        out << ' ';
        line(FaceName::R, row);
        out << ' ';
        line(FaceName::B, row);
        out << '\n';
    }
    for (int row = n - 1; row >= 0; --row) {
        out << pad;
        line(FaceName::D, row);
        out << '\n';
    }
    return out.str();
}
