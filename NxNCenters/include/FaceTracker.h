#pragma once

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Config.h"
#include "Cube.h"
#include "CubeTypes.h"
#include "Logger.h"

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Face found by re-evaluating a predicate, nothing to clean up
struct SimpleTracker {
    std::function<bool(FaceName)> predicate;
    std::string description;
};

// Face found by searching the center sticker carrying its tag
struct MarkedTracker {
    int owner = 0;
    int id = 0;
};

class FaceTracker {
public:
    static FaceTracker simple(Color color, std::function<bool(FaceName)> predicate, std::string description);
    // Tags the center `cell` of `face`
    static FaceTracker marked(Cube& cube, Color color, int owner, int id, FaceName face, const Point& cell);

    Color color() const { return trackedColor; }
    bool isMarked() const { return std::holds_alternative<MarkedTracker>(kind); }

    FaceName face(const Cube& cube) const;

    // Removes the tag of a marked tracker
    void cleanup(Cube& cube) const;
    // Moves the tag of a marked tracker to the middle center of `f`
    void restoreToPhysicalFace(Cube& cube, FaceName f) const;

    std::string describe() const;

private:
    FaceTracker(Color color, std::variant<SimpleTracker, MarkedTracker> kind);

    StickerTag tag() const;

    Color trackedColor;
    std::variant<SimpleTracker, MarkedTracker> kind;
};

using FaceColors = std::array<Color, 6>;

// Owns the six trackers that decide which color every face is solved to
class TrackerHolder {
public:
    TrackerHolder(Cube& cube, const Config& config, const Logger& logger);
    ~TrackerHolder();

    TrackerHolder(const TrackerHolder&) = delete;
    TrackerHolder& operator=(const TrackerHolder&) = delete;
    TrackerHolder(TrackerHolder&&) = delete;
    TrackerHolder& operator=(TrackerHolder&&) = delete;

    int id() const { return holderId; }
    const std::vector<FaceTracker>& trackers() const { return faceTrackers; }
    FaceName faceOf(const FaceTracker& t) const { return t.face(cube); }

    // Cached until the cube is modified
    FaceColors getFaceColors() const;
    Color faceColor(FaceName f) const { return getFaceColors()[faceIndex(f)]; }
    const FaceTracker& trackerByColor(Color c) const;
    FaceName faceByColor(Color c) const { return faceOf(trackerByColor(c)); }
    std::vector<const FaceTracker*> adjacentTrackers(const FaceTracker& t) const;
    bool isBoy() const;

    bool partMatchFaces(const Edge& edge) const;
    bool partMatchFaces(const Corner& corner) const;

    bool insidePreserveScope() const { return preserveDepth > 0; }

    // Puts every marked tracker back on the face it had when the guard was made.
    // getFaceColors returns the colors of that moment while the guard lives.
    class PhysicalFacesGuard {
    public:
        explicit PhysicalFacesGuard(TrackerHolder& holder);
        ~PhysicalFacesGuard() noexcept(false);

        PhysicalFacesGuard(const PhysicalFacesGuard&) = delete;
        PhysicalFacesGuard& operator=(const PhysicalFacesGuard&) = delete;

    private:
        TrackerHolder& holder;
        std::vector<FaceName> savedFaces;
        FaceColors savedColors;
        std::optional<FaceColors> previous;
    };

    // getFaceColors returns this snapshot while the guard lives
    class FrozenColorsGuard {
    public:
        explicit FrozenColorsGuard(TrackerHolder& holder);
        ~FrozenColorsGuard();

        FrozenColorsGuard(const FrozenColorsGuard&) = delete;
        FrozenColorsGuard& operator=(const FrozenColorsGuard&) = delete;

    private:
        TrackerHolder& holder;
        std::optional<FaceColors> previous;
    };

    PhysicalFacesGuard preservePhysicalFaces() { return PhysicalFacesGuard(*this); }
    FrozenColorsGuard frozenFaceColors() { return FrozenColorsGuard(*this); }

private:
    void buildOddTrackers();
    void buildEvenTrackers();
    FaceColors computeFaceColors() const;
    void releaseTags();
    Point findCell(FaceName f, Color c) const;

    Cube& cube;
    const Config& config;
    const Logger& logger;
    int holderId;
    std::vector<FaceTracker> faceTrackers;

    int preserveDepth = 0;
    std::optional<FaceColors> frozen;
    std::optional<FaceColors> preserved;
    mutable bool hasCache = false;
    mutable unsigned long cachedCounter = 0;
    mutable FaceColors cachedColors{};
};
