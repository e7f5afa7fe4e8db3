/**
 * @file texture.hpp
 * @brief Surface color patterns: solid, 3D checker and image lookups
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "stb_image.h"

#include <cmath>
#include <vector>
#include <string>
#include <memory>
#include <algorithm>
#include <iostream>

namespace slabray {

/**
 * @brief Texture types
 */
enum class TextureType {
    Solid,      // Constant color
    Checker,    // 3D checker pattern keyed by world position
    Image       // Image texture (requires UV coordinates)
};

/**
 * @brief Tagged texture: one struct, behavior picked by `type`
 */
struct Texture {
    TextureType type = TextureType::Solid;
    color color1 = {1.0, 1.0, 1.0};  // Solid color, or even checker cells
    color color2 = {0.0, 0.0, 0.0};  // Odd checker cells
    double scale = 1.0;               // Checker cell edge length

    // Decoded RGB bytes, shared between copies of the texture
    std::shared_ptr<const std::vector<unsigned char>> image_data;
    int image_width = 0;
    int image_height = 0;

    static Texture solid(color c) {
        Texture tex;
        tex.type = TextureType::Solid;
        tex.color1 = c;
        return tex;
    }

    /**
     * @brief Create a 3D checker pattern texture
     * @param c1 Color of cells with even index sum
     * @param c2 Color of cells with odd index sum
     * @param cell_size Edge length of one cell in world units
     */
    static Texture checker(color c1, color c2, double cell_size = 1.0) {
        Texture tex;
        tex.type = TextureType::Checker;
        tex.color1 = c1;
        tex.color2 = c2;
        tex.scale = cell_size;
        return tex;
    }

    /**
     * @brief Create an image texture from tightly packed RGB bytes
     */
    static Texture image(const unsigned char* rgb, int width, int height) {
        Texture tex;
        tex.type = TextureType::Image;
        tex.image_width = width;
        tex.image_height = height;
        tex.image_data = std::make_shared<const std::vector<unsigned char>>(
            rgb, rgb + static_cast<size_t>(width) * height * 3
        );
        return tex;
    }

    /**
     * @brief Load an image texture from file (PNG, JPG, ...)
     * @return Texture, or magenta solid if loading fails
     */
    static Texture load_image(const std::string& filename) {
        int width = 0, height = 0, channels = 0;
        unsigned char* data = stbi_load(filename.c_str(), &width, &height, &channels, 3);

        if (!data) {
            std::cerr << "Error: Could not load texture: " << filename
                      << " (" << stbi_failure_reason() << ")" << std::endl;
            return solid({1.0, 0.0, 1.0});
        }

        Texture tex = image(data, width, height);
        stbi_image_free(data);

        std::cout << "Loaded texture: " << filename << " (" << width << "x" << height << ")" << std::endl;
        return tex;
    }

    /**
     * @brief Checker cell parity at a world position
     * @return true for cells whose floor indices sum to an even number
     */
    bool checker_even(point3 p) const {
        // Parity per axis in floating point: cell indices may exceed any integer type
        double parity = std::fabs(std::fmod(std::floor(p.x / scale), 2.0)) +
                        std::fabs(std::fmod(std::floor(p.y / scale), 2.0)) +
                        std::fabs(std::fmod(std::floor(p.z / scale), 2.0));
        return std::fmod(parity, 2.0) == 0.0;
    }

    /**
     * @brief Sample the texture
     * @param p World position (checker)
     * @param u Surface U coordinate (image)
     * @param v Surface V coordinate (image)
     */
    color sample(point3 p, double u = 0.0, double v = 0.0) const {
        switch (type) {
            case TextureType::Solid:
                return color1;

            case TextureType::Checker:
                return checker_even(p) ? color1 : color2;

            case TextureType::Image: {
                if (!image_data || image_width == 0 || image_height == 0) {
                    return {1.0, 0.0, 1.0};
                }

                // Fractional wrap; v = 1 is the top row
                double fu = u - std::floor(u);
                double fv = 1.0 - v;
                fv = fv - std::floor(fv);

                int i = std::min(static_cast<int>(fu * image_width), image_width - 1);
                int j = std::min(static_cast<int>(fv * image_height), image_height - 1);

                size_t idx = (static_cast<size_t>(j) * image_width + i) * 3;
                const auto& px = *image_data;
                return {px[idx] / 255.0, px[idx + 1] / 255.0, px[idx + 2] / 255.0};
            }
        }

        return color1;
    }
};

} // namespace slabray
