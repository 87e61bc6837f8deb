#pragma once

#include <algorithm>
#include <vector>

#include "CubeTypes.h"

enum class TagKind : int { FaceTracker, Marker, Probe };

// Typed attribute carried by a sticker through every rotation
struct StickerTag {
    TagKind kind = TagKind::Marker;
    int owner = 0;
    int id = 0;
    Color color = Color::Blue;

    bool sameKey(const StickerTag& other) const {
        return kind == other.kind && owner == other.owner && id == other.id;
    }
};

class StickerTags {
public:
    void add(const StickerTag& tag) {
        remove(tag);
        tags.push_back(tag);
    }

    bool has(TagKind kind, int owner, int id) const {
        return std::any_of(tags.begin(), tags.end(), [&](const StickerTag& t) {
            return t.kind == kind && t.owner == owner && t.id == id;
        });
    }

    bool hasKind(TagKind kind) const {
        return std::any_of(tags.begin(), tags.end(), [&](const StickerTag& t) { return t.kind == kind; });
    }

    void remove(const StickerTag& tag) {
        tags.erase(std::remove_if(tags.begin(), tags.end(),
                                  [&](const StickerTag& t) { return t.sameKey(tag); }),
                   tags.end());
    }

    void removeAll(TagKind kind, int owner) {
        tags.erase(std::remove_if(tags.begin(), tags.end(),
                                  [&](const StickerTag& t) { return t.kind == kind && t.owner == owner; }),
                   tags.end());
    }

    void removeKind(TagKind kind) {
        tags.erase(std::remove_if(tags.begin(), tags.end(),
                                  [&](const StickerTag& t) { return t.kind == kind; }),
                   tags.end());
    }

    void clear() { tags.clear(); }
    bool empty() const { return tags.empty(); }
    const std::vector<StickerTag>& all() const { return tags; }

private:
    std::vector<StickerTag> tags;
};

struct Sticker {
    Color color = Color::Blue;
    StickerTags tags;
};
