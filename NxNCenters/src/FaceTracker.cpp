#include "FaceTracker.h"
#include "ColorScheme.h"
#include "CubeTopology.h"
#include "Errors.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace {

int nextHolderId = 1;

} // namespace

FaceTracker::FaceTracker(Color color, std::variant<SimpleTracker, MarkedTracker> kind)
    : trackedColor(color), kind(std::move(kind)) {}

FaceTracker FaceTracker::simple(Color color, std::function<bool(FaceName)> predicate, std::string description) {
    return FaceTracker(color, SimpleTracker{std::move(predicate), std::move(description)});
}

FaceTracker FaceTracker::marked(Cube& cube, Color color, int owner, int id, FaceName face, const Point& cell) {
    FaceTracker tracker(color, MarkedTracker{owner, id});
    cube.center(face, cell).tags.add(tracker.tag());
    return tracker;
}

StickerTag FaceTracker::tag() const {
    const auto& m = std::get<MarkedTracker>(kind);
    StickerTag t;
    t.kind = TagKind::FaceTracker;
    t.owner = m.owner;
    t.id = m.id;
    t.color = trackedColor;
    return t;
}

FaceName FaceTracker::face(const Cube& cube) const {
    return std::visit(Overloaded{
        [&](const SimpleTracker& s) {
            for (FaceName f : kAllFaces) {
                if (s.predicate(f)) {
                    return f;
                }
            }
            throw InternalError("no face satisfies tracker " + describe());
        },
        [&](const MarkedTracker& m) {
            const int nSlices = cube.nSlices();
            for (FaceName f : kAllFaces) {
                for (int r = 0; r < nSlices; ++r) {
                    for (int c = 0; c < nSlices; ++c) {
                        if (cube.center(f, Point{r, c}).tags.has(TagKind::FaceTracker, m.owner, m.id)) {
                            return f;
                        }
                    }
                }
            }
            throw InternalError("tag of tracker " + describe() + " is gone");
        },
    }, kind);
}

void FaceTracker::cleanup(Cube& cube) const {
    if (!isMarked()) {
        return;
    }
    StickerTag t = tag();
    for (int i = 0; i < cube.stickerCount(); ++i) {
        cube.sticker(i).tags.remove(t);
    }
}

void FaceTracker::restoreToPhysicalFace(Cube& cube, FaceName f) const {
    if (!isMarked()) {
        return;
    }
    cleanup(cube);
    int middle = cube.nSlices() / 2;
    cube.center(f, Point{middle, middle}).tags.add(tag());
}

std::string FaceTracker::describe() const {
    return std::visit(Overloaded{
        [&](const SimpleTracker& s) { return toString(trackedColor) + " (" + s.description + ")"; },
        [&](const MarkedTracker& m) {
            return toString(trackedColor) + " (marked " + std::to_string(m.owner) + "/" + std::to_string(m.id) + ")";
        },
    }, kind);
}

TrackerHolder::TrackerHolder(Cube& cube, const Config& config, const Logger& logger)
    : cube(cube), config(config), logger(logger), holderId(nextHolderId++) {
    if (cube.nSlices() == 0) {
        throw InternalError("a 2x2 cube has no centers to track");
    }

    faceTrackers.reserve(kFaceCount);
    try {
        if (cube.nSlices() % 2) {
            buildOddTrackers();
        } else {
            buildEvenTrackers();
        }
        getFaceColors();
    } catch (...) {
        releaseTags();
        throw;
    }

    logger.debug("TrackerHolder", [&](std::ostream& out) {
        out << "holder " << holderId << ":";
        for (const auto& t : faceTrackers) {
            out << " " << toString(t.face(cube)) << "=" << t.describe();
        }
    });
}

TrackerHolder::~TrackerHolder() {
    releaseTags();
}

void TrackerHolder::releaseTags() {
    for (int i = 0; i < cube.stickerCount(); ++i) {
        cube.sticker(i).tags.removeAll(TagKind::FaceTracker, holderId);
    }
}

void TrackerHolder::buildOddTrackers() {
    for (FaceName f : {FaceName::F, FaceName::R, FaceName::U}) {
        Color color = cube.faceColor(f);
        faceTrackers.push_back(FaceTracker::simple(
            color, [this, color](FaceName x) { return cube.faceColor(x) == color; },
            "center " + toString(color)));

        Color opposite = cube.faceColor(CubeTopology::opposite(f));
        int paired = static_cast<int>(faceTrackers.size()) - 1;
        faceTrackers.push_back(FaceTracker::simple(
            opposite,
            [this, paired](FaceName x) { return x == CubeTopology::opposite(faceTrackers[paired].face(cube)); },
            "opposite " + toString(color)));
    }
}

Point TrackerHolder::findCell(FaceName f, Color c) const {
    const int nSlices = cube.nSlices();
    for (int r = 0; r < nSlices; ++r) {
        for (int col = 0; col < nSlices; ++col) {
            if (cube.centerColor(f, Point{r, col}) == c) {
                return Point{r, col};
            }
        }
    }
    return Point{nSlices / 2, nSlices / 2};
}

void TrackerHolder::buildEvenTrackers() {
    const ColorScheme& scheme = cube.originalScheme();

    auto best = [&](const std::vector<FaceName>& faces, const std::vector<Color>& colors) {
        std::pair<FaceName, Color> result{faces.front(), colors.front()};
        int bestCount = -1;
        for (FaceName f : faces) {
            for (Color c : colors) {
                int count = cube.countColorOnFace(f, c);
                if (count > bestCount) {
                    bestCount = count;
                    result = {f, c};
                }
            }
        }
        return result;
    };

    auto addOpposite = [&](int paired, Color color) {
        faceTrackers.push_back(FaceTracker::simple(
            color,
            [this, paired](FaceName x) { return x == CubeTopology::opposite(faceTrackers[paired].face(cube)); },
            "opposite " + toString(faceTrackers[paired].color())));
    };

    // 1, 2: the strongest (face, color) pair and its opposite
    std::vector<FaceName> faces(kAllFaces.begin(), kAllFaces.end());
    std::vector<Color> colors(kAllColors.begin(), kAllColors.end());
    auto first = best(faces, colors);
    faceTrackers.push_back(FaceTracker::marked(cube, first.second, holderId, 1, first.first,
                                               findCell(first.first, first.second)));
    addOpposite(0, scheme.oppositeColor(first.second));

    // 3, 4: the strongest pair among the faces and colors left
    FaceName firstOpposite = CubeTopology::opposite(first.first);
    Color secondColor = scheme.oppositeColor(first.second);
    faces.erase(std::remove_if(faces.begin(), faces.end(),
                               [&](FaceName f) { return f == first.first || f == firstOpposite; }),
                faces.end());
    colors.erase(std::remove_if(colors.begin(), colors.end(),
                                [&](Color c) { return c == first.second || c == secondColor; }),
                 colors.end());
    auto third = best(faces, colors);
    faceTrackers.push_back(FaceTracker::marked(cube, third.second, holderId, 3, third.first,
                                               findCell(third.first, third.second)));
    addOpposite(2, scheme.oppositeColor(third.second));

    // 5, 6: whichever remaining face completes a layout of the original scheme
    Color fourthColor = scheme.oppositeColor(third.second);
    Color fifth = Color::Blue;
    for (Color c : kAllColors) {
        if (c != first.second && c != secondColor && c != third.second && c != fourthColor) {
            fifth = c;
            break;
        }
    }
    Color sixth = scheme.oppositeColor(fifth);

    faceTrackers.push_back(FaceTracker::simple(
        fifth,
        [this, fifth, sixth](FaceName x) {
            FaceColors layout{};
            std::array<bool, 6> used{};
            for (int i = 0; i < 4; ++i) {
                FaceName f = faceTrackers[i].face(cube);
                if (f == x) {
                    return false;
                }
                layout[faceIndex(f)] = faceTrackers[i].color();
                used[faceIndex(f)] = true;
            }
            FaceName opposite = CubeTopology::opposite(x);
            if (used[faceIndex(opposite)]) {
                return false;
            }
            layout[faceIndex(x)] = fifth;
            layout[faceIndex(opposite)] = sixth;
            return ColorScheme(layout).same(cube.originalScheme());
        },
        "completes " + toString(fifth)));
    addOpposite(4, sixth);
}

FaceColors TrackerHolder::computeFaceColors() const {
    FaceColors result{};
    std::array<bool, 6> assigned{};
    for (const auto& t : faceTrackers) {
        FaceName f = t.face(cube);
        if (assigned[faceIndex(f)]) {
            throw InternalError("two trackers claim face " + toString(f));
        }
        assigned[faceIndex(f)] = true;
        result[faceIndex(f)] = t.color();
    }
    if (faceTrackers.size() != kAllFaces.size() || !ColorScheme(result).isPermutation()) {
        throw InternalError("tracked face colors are not a permutation: " + ColorScheme(result).toString());
    }
    return result;
}

FaceColors TrackerHolder::getFaceColors() const {
    if (frozen) {
        return *frozen;
    }
    if (preserved) {
        return *preserved;
    }
    if (!hasCache || cachedCounter != cube.modifyCounter()) {
        cachedColors = computeFaceColors();
        cachedCounter = cube.modifyCounter();
        hasCache = true;
    }
    return cachedColors;
}

const FaceTracker& TrackerHolder::trackerByColor(Color c) const {
    for (const auto& t : faceTrackers) {
        if (t.color() == c) {
            return t;
        }
    }
    throw InternalError("no tracker for color " + toString(c));
}

std::vector<const FaceTracker*> TrackerHolder::adjacentTrackers(const FaceTracker& t) const {
    FaceName f = t.face(cube);
    std::vector<const FaceTracker*> result;
    for (const auto& other : faceTrackers) {
        if (CubeTopology::isAdjacent(f, other.face(cube))) {
            result.push_back(&other);
        }
    }
    return result;
}

bool TrackerHolder::isBoy() const {
    return ColorScheme(getFaceColors()).same(ColorScheme::boy());
}

bool TrackerHolder::partMatchFaces(const Edge& edge) const {
    FaceColors colors = getFaceColors();
    for (size_t i = 0; i < edge.firstStickers.size(); ++i) {
        if (cube.sticker(edge.firstStickers[i]).color != colors[faceIndex(edge.first)] ||
            cube.sticker(edge.secondStickers[i]).color != colors[faceIndex(edge.second)]) {
            return false;
        }
    }
    return true;
}

bool TrackerHolder::partMatchFaces(const Corner& corner) const {
    FaceColors colors = getFaceColors();
    for (int i = 0; i < 3; ++i) {
        if (cube.sticker(corner.stickers[i]).color != colors[faceIndex(corner.faces[i])]) {
            return false;
        }
    }
    return true;
}

TrackerHolder::PhysicalFacesGuard::PhysicalFacesGuard(TrackerHolder& holder)
    : holder(holder), savedColors(holder.getFaceColors()), previous(holder.preserved) {
    holder.preserved = savedColors;
    for (const auto& t : holder.faceTrackers) {
        savedFaces.push_back(t.face(holder.cube));
    }
    ++holder.preserveDepth;
}

TrackerHolder::PhysicalFacesGuard::~PhysicalFacesGuard() noexcept(false) {
    for (size_t i = 0; i < holder.faceTrackers.size(); ++i) {
        const FaceTracker& t = holder.faceTrackers[i];
        if (t.isMarked() && t.face(holder.cube) != savedFaces[i]) {
            t.restoreToPhysicalFace(holder.cube, savedFaces[i]);
        }
    }
    --holder.preserveDepth;
    holder.preserved = previous;
    holder.hasCache = false;

    if (holder.config.validateTrackers && !holder.preserved && std::uncaught_exceptions() == 0) {
        FaceColors after = holder.getFaceColors();
        if (after != savedColors) {
            holder.logger.error("TrackerHolder", [&](std::ostream& out) {
                out << "face colors changed: " << ColorScheme(savedColors).toString() << " -> "
                    << ColorScheme(after).toString();
            });
            throw InternalError("tracked face colors changed inside a preserve scope");
        }
    }
}

TrackerHolder::FrozenColorsGuard::FrozenColorsGuard(TrackerHolder& holder)
    : holder(holder), previous(holder.frozen) {
    holder.frozen = holder.getFaceColors();
}

TrackerHolder::FrozenColorsGuard::~FrozenColorsGuard() {
    holder.frozen = previous;
}
