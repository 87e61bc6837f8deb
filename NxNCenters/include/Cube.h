#pragma once

#include <array>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "ColorScheme.h"
#include "CubeGeometry.h"
#include "CubeTypes.h"
#include "Sticker.h"

// Descriptors below hold face names and sticker indices into the cube arena

// Shared by two faces; wing i of `first` sits on the same cubie as wing i of `second`.
// Wings are ordered left to right (bottom to top on vertical edges) on `first`.
struct Edge {
    FaceName first = FaceName::F;
    FaceName second = FaceName::U;
    std::vector<int> firstStickers;
    std::vector<int> secondStickers;
    bool sameDirection = true; // second face's own ordering runs the same way
};

struct Corner {
    std::array<FaceName, 3> faces{};
    std::array<int, 3> stickers{};
};

struct Face {
    FaceName name = FaceName::F;
    FaceName opposite = FaceName::B;
    std::array<int, 4> edges{};   // indices into Cube::edges()
    std::array<int, 4> corners{}; // indices into Cube::corners()
};

struct Slice {
    SliceName name = SliceName::M;
    FaceName referenceFace = FaceName::L;
    int count = 0; // inner layers, indexed 1..count
};

class Cube {
public:
    explicit Cube(int size, const ColorScheme& scheme = ColorScheme::boy());

    Cube(const Cube&) = delete;
    Cube& operator=(const Cube&) = delete;

    int size() const { return n; }
    int nSlices() const { return n - 2; }
    int inv(int i) const { return nSlices() - 1 - i; }

    const CubeGeometry& geometry() const { return geom; }
    const ColorScheme& originalScheme() const { return scheme; }
    unsigned long modifyCounter() const { return counter; }

    // Moves. Slice indices are 1-based inner layers counted from the reference face.
    void rotateFace(FaceName f, int quarterTurns = 1);
    void rotateSlice(SliceName s, int index, int quarterTurns = 1);
    void rotateSlices(SliceName s, int first, int last, int quarterTurns = 1);
    void rotateWhole(AxisName a, int quarterTurns = 1);
    // Layers at depth [firstDepth, lastDepth] from axisFace, turned like axisFace
    void rotateLayers(FaceName axisFace, int firstDepth, int lastDepth, int quarterTurns);

    int stickerCount() const { return static_cast<int>(stickers.size()); }
    int stickerIndex(FaceName f, int row, int col) const;
    Sticker& sticker(int index) { return stickers.at(index); }
    const Sticker& sticker(int index) const { return stickers.at(index); }
    Sticker& sticker(FaceName f, int row, int col) { return stickers[stickerIndex(f, row, col)]; }
    const Sticker& sticker(FaceName f, int row, int col) const { return stickers[stickerIndex(f, row, col)]; }

    // Center grid access, (0,0) is the bottom-left center cell
    int centerIndex(FaceName f, const Point& p) const;
    Sticker& center(FaceName f, const Point& p) { return stickers[centerIndex(f, p)]; }
    const Sticker& center(FaceName f, const Point& p) const { return stickers[centerIndex(f, p)]; }
    Color centerColor(FaceName f, const Point& p) const { return center(f, p).color; }

    int countColorOnFace(FaceName f, Color c) const;
    int countColorOnBlock(FaceName f, const Block& b, Color c) const;
    bool isCenterMonochrome(FaceName f) const;
    // Middle center cell (a corner sticker on a 2x2)
    Color faceColor(FaceName f) const;
    bool matchesOriginalScheme() const;

    const std::array<Face, 6>& faces() const { return faceDescriptors; }
    const Face& face(FaceName f) const { return faceDescriptors[faceIndex(f)]; }
    const std::vector<Edge>& edges() const { return edgeDescriptors; }
    const std::vector<Corner>& corners() const { return cornerDescriptors; }
    const std::array<Slice, 3>& slices() const { return sliceDescriptors; }
    const Edge& edgeBetween(FaceName a, FaceName b) const;

    std::vector<Color> colors() const;
    void clearTags(TagKind kind);
    void reset();

    // Unfolded net, U on top, L F R B in the middle row, D below
    std::string dump() const;

private:
    using Permutation = std::vector<std::pair<int, int>>; // (from, to) for one clockwise quarter turn

    glm::vec3 stickerPosition(int index) const;
    int stickerAt(FaceName f, const glm::vec3& position) const;
    const Permutation& layerPermutation(FaceName axisFace, int depth) const;
    void applyPermutation(const Permutation& p, int quarterTurns);

    void buildEdges();
    void buildCorners();

    int n;
    ColorScheme scheme;
    CubeGeometry geom;
    std::vector<Sticker> stickers;
    unsigned long counter = 0;

    std::array<Face, 6> faceDescriptors{};
    std::vector<Edge> edgeDescriptors;
    std::vector<Corner> cornerDescriptors;
    std::array<Slice, 3> sliceDescriptors{};

    mutable std::map<std::pair<int, int>, Permutation> permutations;
};
