#include "ColorScheme.h"
#include "CubeTopology.h"
#include "Errors.h"

#include <cmath>
#include <set>

namespace {

glm::mat3 roundMatrix(const glm::mat3& m) {
    glm::mat3 r;
    for (int c = 0; c < 3; ++c) {
        for (int row = 0; row < 3; ++row) {
            r[c][row] = std::round(m[c][row]);
        }
    }
    return r;
}

bool sameMatrix(const glm::mat3& a, const glm::mat3& b) {
    for (int c = 0; c < 3; ++c) {
        for (int row = 0; row < 3; ++row) {
            if (std::abs(a[c][row] - b[c][row]) > 0.5f) {
                return false;
            }
        }
    }
    return true;
}

std::vector<glm::mat3> buildOrientations() {
    const std::array<glm::mat3, 3> generators = {
        glm::mat3(CubeTopology::quarterTurn(FaceName::R)),
        glm::mat3(CubeTopology::quarterTurn(FaceName::U)),
        glm::mat3(CubeTopology::quarterTurn(FaceName::F)),
    };

    std::vector<glm::mat3> found = {glm::mat3(1.0f)};
    for (size_t i = 0; i < found.size(); ++i) {
        for (const auto& g : generators) {
            glm::mat3 next = roundMatrix(g * found[i]);
            bool known = false;
            for (const auto& m : found) {
                if (sameMatrix(m, next)) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                found.push_back(next);
            }
        }
    }
    return found;
}

} // namespace

ColorScheme::ColorScheme(const std::array<Color, 6>& faceColors) : colors(faceColors) {}

ColorScheme ColorScheme::boy() {
    std::array<Color, 6> c{};
    c[faceIndex(FaceName::F)] = Color::Blue;
    c[faceIndex(FaceName::R)] = Color::Red;
    c[faceIndex(FaceName::U)] = Color::Yellow;
    c[faceIndex(FaceName::L)] = Color::Orange;
    c[faceIndex(FaceName::D)] = Color::White;
    c[faceIndex(FaceName::B)] = Color::Green;
    return ColorScheme(c);
}

FaceName ColorScheme::faceOf(Color c) const {
    for (FaceName f : kAllFaces) {
        if (colorOf(f) == c) {
            return f;
        }
    }
    throw InternalError("color " + ::toString(c) + " is not in scheme " + toString());
}

Color ColorScheme::oppositeColor(Color c) const {
    return colorOf(CubeTopology::opposite(faceOf(c)));
}

bool ColorScheme::isPermutation() const {
    std::set<Color> seen(colors.begin(), colors.end());
    return seen.size() == colors.size();
}

bool ColorScheme::same(const ColorScheme& other) const {
    for (const auto& rotation : orientations()) {
        bool match = true;
        for (FaceName f : kAllFaces) {
            FaceName moved = faceFromNormal(rotation * frameOf(f).normal);
            if (colorOf(f) != other.colorOf(moved)) {
                match = false;
                break;
            }
        }
        if (match) {
            return true;
        }
    }
    return false;
}

std::string ColorScheme::toString() const {
    std::string s;
    for (FaceName f : kAllFaces) {
        if (!s.empty()) s += " ";
        s += ::toString(f) + "=" + ::toString(colorOf(f));
    }
    return s;
}

const std::vector<glm::mat3>& ColorScheme::orientations() {
    static const std::vector<glm::mat3> all = buildOrientations();
    return all;
}
