#include "GridImage.h"
#include <algorithm>
#include <cmath>
#include <iostream>

float GridImage::luminance(const sf::Color& c) {
    // perceived luminance
    return 0.2126f * (c.r / 255.0f) + 0.7152f * (c.g / 255.0f) + 0.0722f * (c.b / 255.0f);
}

int GridImage::costForLuminance(float luma, int maxCost) {
    maxCost = std::max(1, maxCost);
    luma = std::clamp(luma, 0.0f, 1.0f);
    // white maps to 1 and the darkest passable grey approaches maxCost
    return 1 + static_cast<int>(std::lround((1.0f - luma) * static_cast<float>(maxCost - 1)));
}

bool GridImage::load(const std::string& path, Grid& grid, int maxCost) {
    sf::Image image;
    if (!image.loadFromFile(path)) {
        std::cerr << "Error: Could not load grid image: " << path << std::endl;
        return false;
    }

    const sf::Vector2u size = image.getSize();
    if (size.x == 0 || size.y == 0) {
        std::cerr << "Error: Grid image is empty: " << path << std::endl;
        return false;
    }

    fromImage(image, grid, maxCost);
    std::cout << "Loaded " << size.y << "x" << size.x << " grid from " << path << std::endl;
    return true;
}

void GridImage::fromImage(const sf::Image& image, Grid& grid, int maxCost) {
    const unsigned w = image.getSize().x;
    const unsigned h = image.getSize().y;

    // image x is the grid column, image y is the grid row
    grid.resize(static_cast<int>(h), static_cast<int>(w));

    for (unsigned y = 0; y < h; ++y) {
        for (unsigned x = 0; x < w; ++x) {
            const float luma = luminance(image.getPixel(sf::Vector2u(x, y)));
            const int row = static_cast<int>(y);
            const int col = static_cast<int>(x);
            if (luma < kWallLuminance) {
                grid.setBlocked(row, col, true);
            } else {
                grid.setCost(row, col, costForLuminance(luma, maxCost));
            }
        }
    }
}
