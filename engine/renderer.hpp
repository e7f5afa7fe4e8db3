/**
 * @file renderer.hpp
 * @brief Whitted-style ray tracer renderer
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "scene.hpp"
#include "material.hpp"
#include <vector>
#include <string>
#include <cstdint>

namespace slabray {

/**
 * @brief Image buffer for rendering
 *
 * Row 0 is the top of the image.
 */
struct Image {
    int width;
    int height;
    std::vector<color> pixels;

    Image(int w, int h) : width(w), height(h), pixels(static_cast<size_t>(w) * h) {}

    void set_pixel(int x, int y, color c) {
        pixels[static_cast<size_t>(y) * width + x] = c;
    }

    color get_pixel(int x, int y) const {
        return pixels[static_cast<size_t>(y) * width + x];
    }

    /**
     * @brief Clamp each channel to [0, 1] and quantize to 8 bits
     * @return Tightly packed RGB bytes, top row first
     */
    std::vector<std::uint8_t> to_rgb8() const;

    /**
     * @brief Write image to PPM (P3) file
     * @return true on success
     */
    bool write_ppm(const std::string& filename) const;

    /**
     * @brief Write image to PNG file
     * @return true on success
     */
    bool write_png(const std::string& filename) const;

    /**
     * @brief Pick PPM or PNG from the file extension (PNG by default)
     */
    bool write(const std::string& filename) const;
};

/**
 * @brief Quantize one linear channel value to a display byte
 */
std::uint8_t to_byte(double channel);

/**
 * @brief Whitted-style ray tracer renderer
 *
 * Holds only settings; every query reads the scene and never changes it,
 * so one renderer can shade many pixels concurrently.
 */
class Renderer {
public:
    /**
     * @brief Render settings
     */
    struct Settings {
        int width = 800;
        int height = 600;
        int max_depth = 4;          // Deepest recursion level still shaded
        double epsilon = 1e-3;      // Hit threshold and origin bias
        double fov = 45.0;          // Vertical field of view in degrees

        // Fraction of a light that still reaches a shadowed point (0 = hard shadows)
        double shadow_transmission = 0.0;

        color background_color = {0.1, 0.1, 0.2};  // Solid background
        color background_top = {0.5, 0.7, 1.0};    // Gradient top (sky)
        color background_bottom = {1.0, 1.0, 1.0}; // Gradient bottom (horizon)
        bool use_background_gradient = false;       // Use gradient vs solid

        bool show_progress = true;
    };

    Renderer() = default;
    explicit Renderer(const Settings& settings) : settings_(settings) {}

    /**
     * @brief Render a scene
     * @param scene The scene to render
     * @param camera The camera to use
     * @return Rendered image (linear colors)
     */
    Image render(const Scene& scene, const Camera& camera) const;

    /**
     * @brief Primary ray through the center of pixel (x, y)
     */
    ray primary_ray(const Camera& camera, int x, int y) const;

    /**
     * @brief Color seen along a ray
     * @param depth Recursion level, 0 for primary rays
     */
    color trace(ray r, const Scene& scene, int depth) const;

    /**
     * @brief Background color for a ray that hits nothing
     */
    color background_color(ray r) const;

    /**
     * @brief Weighted diffuse + specular term from all lights
     */
    color local_illumination(ray r, const hit_record& rec, const Material& mat,
                             const Scene& scene) const;

    /**
     * @brief Color along the mirror direction at the hit
     */
    color reflection_color(ray r, const hit_record& rec, const Scene& scene, int depth) const;

    /**
     * @brief Color along the refracted direction at the hit
     *
     * Falls back to reflection_color on total internal reflection.
     */
    color refraction_color(ray r, const hit_record& rec, const Material& mat,
                           const Scene& scene, int depth) const;

    /**
     * @brief Move p off the surface to the side `dir` leaves towards
     */
    point3 offset_origin(point3 p, vec3 normal, vec3 dir) const;

    Settings& settings() { return settings_; }
    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
};

} // namespace slabray
