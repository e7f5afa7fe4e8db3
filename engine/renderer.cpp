/**
 * @file renderer.cpp
 * @brief Implementation of the Whitted-style ray tracer
 */

#include "renderer.hpp"
#include "profiler.hpp"
#include "stb_image_write.h"
#include <fstream>
#include <cmath>
#include <algorithm>
#include <iostream>
#include <limits>
#include <vector>
#include <atomic>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace slabray {

namespace {

constexpr double PI = 3.14159265358979323846;

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// ==================== Image Output ====================

std::uint8_t to_byte(double channel) {
    return static_cast<std::uint8_t>(255.999 * std::clamp(channel, 0.0, 1.0));
}

std::vector<std::uint8_t> Image::to_rgb8() const {
    std::vector<std::uint8_t> data(static_cast<size_t>(width) * height * 3);

    for (size_t i = 0; i < pixels.size(); ++i) {
        data[i * 3 + 0] = to_byte(pixels[i].x);
        data[i * 3 + 1] = to_byte(pixels[i].y);
        data[i * 3 + 2] = to_byte(pixels[i].z);
    }

    return data;
}

bool Image::write_ppm(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "P3\n" << width << ' ' << height << "\n255\n";

    std::vector<std::uint8_t> data = to_rgb8();
    for (size_t i = 0; i < data.size(); i += 3) {
        file << static_cast<int>(data[i]) << ' '
             << static_cast<int>(data[i + 1]) << ' '
             << static_cast<int>(data[i + 2]) << '\n';
    }

    return static_cast<bool>(file);
}

bool Image::write_png(const std::string& filename) const {
    std::vector<std::uint8_t> data = to_rgb8();
    return stbi_write_png(filename.c_str(), width, height, 3, data.data(), width * 3) != 0;
}

bool Image::write(const std::string& filename) const {
    if (ends_with(filename, ".ppm")) {
        return write_ppm(filename);
    }
    return write_png(filename);
}

// ==================== Frame Driver ====================

ray Renderer::primary_ray(const Camera& camera, int x, int y) const {
    double aspect = static_cast<double>(settings_.width) / settings_.height;
    double scale = std::tan(settings_.fov * PI / 360.0);

    double ndc_x = 2.0 * (x + 0.5) / settings_.width - 1.0;
    double ndc_y = 1.0 - 2.0 * (y + 0.5) / settings_.height;

    vec3 camera_dir = {ndc_x * scale * aspect, ndc_y * scale, 1.0};
    return ray_create(camera.origin, camera.to_world(camera_dir));
}

Image Renderer::render(const Scene& scene, const Camera& camera) const {
    Image image(settings_.width, settings_.height);

    Timer total_timer;

    if (settings_.show_progress) {
        std::cout << "Rendering " << settings_.width << "x" << settings_.height
                  << " image (" << scene.boxes.size() << " boxes, "
                  << scene.planes.size() << " planes, "
                  << scene.lights.size() << " lights, max depth "
                  << settings_.max_depth << ")" << std::endl;
    }

    std::atomic<int> completed_lines{0};
    const int total_lines = settings_.height;

    Timer render_timer;

    // Rows are independent: each writes only its own pixels
    #pragma omp parallel for schedule(dynamic, 1)
    for (int y = 0; y < settings_.height; ++y) {
        for (int x = 0; x < settings_.width; ++x) {
            ray r = primary_ray(camera, x, y);
            image.set_pixel(x, y, trace(r, scene, 0));
        }

        int done = ++completed_lines;
        if (settings_.show_progress && (done % 50 == 0 || done == total_lines)) {
            #pragma omp critical
            {
                std::cout << "\rProgress: " << (100 * done / total_lines) << "% ("
                          << done << "/" << total_lines << " lines)" << std::flush;
            }
        }
    }

    Profiler::instance().record("Pixel Rendering", Profiler::Duration(render_timer.elapsed_ms()));
    Profiler::instance().record("Total Render", Profiler::Duration(total_timer.elapsed_ms()));

    if (settings_.show_progress) {
        std::cout << "\nDone in " << total_timer.elapsed_sec() << " s" << std::endl;
    }

    return image;
}

// ==================== Shading & Transport ====================

color Renderer::trace(ray r, const Scene& scene, int depth) const {
    if (depth > settings_.max_depth) {
        return background_color(r);
    }

    hit_record rec = hit_record_init();
    if (!scene.hit(r, settings_.epsilon, std::numeric_limits<double>::infinity(), rec)) {
        return background_color(r);
    }

    const Material& mat = scene.get_material(rec.material_id);

    double kr = mat.reflective();
    double kt = mat.transmissive();
    double handed_off = kr + kt;
    if (handed_off > 1.0) {
        kr /= handed_off;
        kt /= handed_off;
    }
    double kl = std::max(0.0, 1.0 - kr - kt);

    color result = vec3_zero();

    if (kl > 0.0) {
        result = vec3_scale(local_illumination(r, rec, mat, scene), kl);
    }

    if (kr > 0.0) {
        result = vec3_add(result, vec3_scale(reflection_color(r, rec, scene, depth), kr));
    }

    if (kt > 0.0) {
        result = vec3_add(result, vec3_scale(refraction_color(r, rec, mat, scene, depth), kt));
    }

    if (mat.is_emissive()) {
        result = vec3_add(result, mat.emission);
    }
    return result;
}

color Renderer::local_illumination(ray r, const hit_record& rec, const Material& mat,
                                   const Scene& scene) const {
    color base = mat.color_at(rec.point, rec.u, rec.v);
    vec3 view_dir = vec3_negate(r.direction);

    color diffuse_sum = vec3_mul(scene.ambient_light, base);
    color specular_sum = vec3_zero();

    for (const auto& light : scene.lights) {
        vec3 to_light = vec3_sub(light.position, rec.point);
        double distance = vec3_length(to_light);
        if (distance <= 0.0) {
            continue;
        }
        vec3 light_dir = vec3_scale(to_light, 1.0 / distance);

        // Lights behind the surface contribute neither diffuse nor highlight
        double lambert = vec3_dot(rec.normal, light_dir);
        if (lambert <= 0.0) {
            continue;
        }

        double shadow = 1.0;
        point3 probe = offset_origin(rec.point, rec.normal, light_dir);
        if (scene.is_shadowed(probe, light.position, settings_.epsilon)) {
            shadow = settings_.shadow_transmission;
        }
        if (shadow <= 0.0) {
            continue;
        }

        double strength = light.intensity * light.attenuation(distance) * shadow;

        diffuse_sum = vec3_add(diffuse_sum,
            vec3_scale(vec3_mul(base, light.light_color), lambert * strength));

        vec3 reflect_dir = vec3_reflect(vec3_negate(light_dir), rec.normal);
        double highlight = std::pow(std::max(0.0, vec3_dot(view_dir, reflect_dir)),
                                    mat.specular_exponent);
        specular_sum = vec3_add(specular_sum,
            vec3_scale(light.light_color, highlight * strength));
    }

    return vec3_add(vec3_scale(diffuse_sum, mat.diffuse()),
                    vec3_scale(specular_sum, mat.specular()));
}

color Renderer::reflection_color(ray r, const hit_record& rec, const Scene& scene, int depth) const {
    vec3 reflected = vec3_reflect(r.direction, rec.normal);
    ray bounce = ray_create(offset_origin(rec.point, rec.normal, reflected), reflected);
    return trace(bounce, scene, depth + 1);
}

color Renderer::refraction_color(ray r, const hit_record& rec, const Material& mat,
                                 const Scene& scene, int depth) const {
    // The stored normal always faces the ray, so front_face tells entering from exiting
    double eta = rec.front_face ? 1.0 / mat.refractive_index : mat.refractive_index;

    vec3 refracted;
    if (!vec3_refract(r.direction, rec.normal, eta, &refracted)) {
        // Total internal reflection
        return reflection_color(r, rec, scene, depth);
    }

    ray bounce = ray_create(offset_origin(rec.point, rec.normal, refracted), refracted);
    return trace(bounce, scene, depth + 1);
}

point3 Renderer::offset_origin(point3 p, vec3 normal, vec3 dir) const {
    vec3 offset = vec3_scale(normal, settings_.epsilon);
    return vec3_dot(dir, normal) >= 0.0 ? vec3_add(p, offset) : vec3_sub(p, offset);
}

color Renderer::background_color(ray r) const {
    if (settings_.use_background_gradient) {
        // Horizon-to-zenith ramp keyed by the vertical direction
        double t = 0.5 * (r.direction.y + 1.0);
        return vec3_lerp(settings_.background_bottom, settings_.background_top, t);
    }

    return settings_.background_color;
}

} // namespace slabray
