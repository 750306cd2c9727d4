#include "level.hpp"

#include <utility>

namespace {

struct GenreAlias {
    const char* alias;
    const char* canonical;
};

constexpr GenreAlias GENRE_ALIASES[] = {
    {"cyberpunk",        "cyberpunk"},
    {"cyber",            "cyberpunk"},
    {"киберпанк",        "cyberpunk"},
    {"fantasy",          "fantasy"},
    {"фэнтези",          "fantasy"},
    {"horror",           "horror"},
    {"хоррор",           "horror"},
    {"postapocalyptic",  "postapocalyptic"},
    {"post-apocalyptic", "postapocalyptic"},
    {"postapocalypse",   "postapocalyptic"},
    {"постапокалипсис",  "postapocalyptic"},
};

// Lower-cases the Cyrillic capitals (U+0400..U+042F) in a UTF-8 string.
// Other multi-byte sequences pass through untouched.
std::string foldCyrillicUpper(std::string s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == 0xD0 && i + 1 < s.size()) {
            const unsigned char n = static_cast<unsigned char>(s[i + 1]);
            if (n >= 0x80 && n <= 0x8F) {
                // U+0400..U+040F (Ѐ..Џ, incl. Ё) -> U+0450..U+045F
                out.push_back(static_cast<char>(0xD1));
                out.push_back(static_cast<char>(n + 0x10));
                ++i;
                continue;
            }
            if (n >= 0x90 && n <= 0x9F) {
                // А..П -> а..п
                out.push_back(static_cast<char>(0xD0));
                out.push_back(static_cast<char>(n + 0x20));
                ++i;
                continue;
            }
            if (n >= 0xA0 && n <= 0xAF) {
                // Р..Я -> р..я
                out.push_back(static_cast<char>(0xD1));
                out.push_back(static_cast<char>(n - 0x20));
                ++i;
                continue;
            }
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

} // namespace

std::string canonicalGenre(const std::string& genre) {
    std::string g = foldCyrillicUpper(toLower(trim(genre)));
    for (const auto& a : GENRE_ALIASES) {
        if (g == a.alias) return a.canonical;
    }
    return g;
}

std::string levelToAscii(const GeneratedLevel& level) {
    std::string out = gridToAscii(level.tiles);
    const int stride = level.tiles.width + 1;
    auto mark = [&](const Vec2i& p, char c) {
        if (!level.inBounds(p)) return;
        out[static_cast<size_t>(p.y * stride + p.x)] = c;
    };
    for (const Vec2i& p : level.goalPoints) mark(p, '>');
    for (const Vec2i& p : level.spawnPoints) mark(p, '@');
    return out;
}
