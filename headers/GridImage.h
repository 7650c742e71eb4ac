#pragma once
#include <SFML/Graphics.hpp>
#include <string>
#include "Grid.h"

// builds a grid from an image: one pixel per cell, dark pixels are walls,
// everything else gets a cost from its brightness (white = 1, darker = dearer)
class GridImage {
public:
    // pixels whose luminance is below this are blocked (0..1)
    static constexpr float kWallLuminance = 0.1f;

    // loads path into grid (resized to the image). false on read errors
    static bool load(const std::string& path, Grid& grid, int maxCost = 9);

    // same conversion for an image already in memory
    static void fromImage(const sf::Image& image, Grid& grid, int maxCost = 9);

    static float luminance(const sf::Color& c);
    static int costForLuminance(float luma, int maxCost);
};
