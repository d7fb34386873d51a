#include <yframe/palette.h>

#include <algorithm>
#include <array>

namespace yframe {

namespace {

constexpr std::array<uint8_t, 6> CUBE_LEVELS = {0, 95, 135, 175, 215, 255};

constexpr std::array<Rgb, 256> buildPalette() {
    std::array<Rgb, 256> p{};

    constexpr uint8_t base[16][3] = {
        {0, 0, 0},       {205, 0, 0},   {0, 205, 0},   {205, 205, 0},
        {0, 0, 238},     {205, 0, 205}, {0, 205, 205}, {229, 229, 229},
        {127, 127, 127}, {255, 0, 0},   {0, 255, 0},   {255, 255, 0},
        {92, 92, 255},   {255, 0, 255}, {0, 255, 255}, {255, 255, 255},
    };
    for (size_t i = 0; i < 16; i++) {
        p[i] = Rgb{base[i][0], base[i][1], base[i][2]};
    }

    for (size_t i = 16; i <= 231; i++) {
        size_t idx = i - 16;
        p[i] = Rgb{CUBE_LEVELS[idx / 36], CUBE_LEVELS[(idx % 36) / 6], CUBE_LEVELS[idx % 6]};
    }

    for (size_t i = 232; i <= 255; i++) {
        auto shade = static_cast<uint8_t>(8 + (i - 232) * 10);
        p[i] = Rgb{shade, shade, shade};
    }
    return p;
}

constexpr std::array<Rgb, 256> PALETTE = buildPalette();

int dist2(uint8_t r, uint8_t g, uint8_t b, const Rgb& c) {
    int dr = int(r) - int(c.r);
    int dg = int(g) - int(c.g);
    int db = int(b) - int(c.b);
    return dr * dr + dg * dg + db * db;
}

// Nearest index in CUBE_LEVELS
int nearestLevel(uint8_t v) {
    if (v < 48) return 0;
    if (v < 115) return 1;
    if (v < 155) return 2;
    if (v < 195) return 3;
    if (v < 235) return 4;
    return 5;
}

} // namespace

Rgb rgbForIndex(uint8_t index) {
    return PALETTE[index];
}

uint8_t nearestIndex256(uint8_t r, uint8_t g, uint8_t b) {
    int ri = nearestLevel(r);
    int gi = nearestLevel(g);
    int bi = nearestLevel(b);
    int bestIdx = 16 + 36 * ri + 6 * gi + bi;
    int bestD2 = dist2(r, g, b, PALETTE[bestIdx]);

    int avg = (int(r) + int(g) + int(b) + 1) / 3;
    int grayIdx;
    if (avg <= 8) {
        grayIdx = 232;
    } else if (avg >= 238) {
        grayIdx = 255;
    } else {
        grayIdx = 232 + std::clamp((avg - 8 + 5) / 10, 0, 23);
    }
    if (int d2 = dist2(r, g, b, PALETTE[grayIdx]); d2 < bestD2) {
        bestD2 = d2;
        bestIdx = grayIdx;
    }

    for (int i = 0; i < 16; i++) {
        if (int d2 = dist2(r, g, b, PALETTE[i]); d2 < bestD2) {
            bestD2 = d2;
            bestIdx = i;
        }
    }
    return static_cast<uint8_t>(bestIdx);
}

uint8_t nearestIndex16(uint8_t r, uint8_t g, uint8_t b) {
    int bestIdx = 0;
    int bestD2 = dist2(r, g, b, PALETTE[0]);
    for (int i = 1; i < 16; i++) {
        if (int d2 = dist2(r, g, b, PALETTE[i]); d2 < bestD2) {
            bestD2 = d2;
            bestIdx = i;
        }
    }
    return static_cast<uint8_t>(bestIdx);
}

} // namespace yframe
