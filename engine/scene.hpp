/**
 * @file scene.hpp
 * @brief Scene container, lights, camera and nearest-hit queries
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "primitives.hpp"
#include "material.hpp"
#include <vector>
#include <cmath>
#include <iostream>

namespace slabray {

/**
 * @brief Point light source
 *
 * Brightness falls off as 1 / (1 + k1*d + k2*d^2); zero coefficients
 * disable the falloff.
 */
struct PointLight {
    point3 position;
    color light_color;
    double intensity;
    double k1;
    double k2;

    PointLight(point3 pos, color c, double i = 1.0, double linear = 0.0, double quadratic = 0.0)
        : position(pos), light_color(c), intensity(i), k1(linear), k2(quadratic) {}

    double attenuation(double distance) const {
        return 1.0 / (1.0 + k1 * distance + k2 * distance * distance);
    }
};

/**
 * @brief Pinhole camera: eye position plus an orthonormal basis
 *
 * Field of view and aspect ratio belong to the frame driver; the camera
 * only moves camera-space directions (x right, y up, z forward) into the
 * world.
 */
struct Camera {
    point3 origin;
    vec3 right;
    vec3 up;
    vec3 forward;

    /**
     * @param lookfrom Camera position
     * @param lookat Point to look at
     * @param vup View up vector
     */
    Camera(point3 lookfrom, point3 lookat, vec3 vup) {
        origin = lookfrom;
        forward = vec3_normalize(vec3_sub(lookat, lookfrom));
        right = vec3_normalize(vec3_cross(forward, vup));
        up = vec3_cross(right, forward);
    }

    vec3 to_world(vec3 dir) const {
        return vec3_add(vec3_add(vec3_scale(right, dir.x), vec3_scale(up, dir.y)),
                        vec3_scale(forward, dir.z));
    }
};

/**
 * @brief Scene containing primitives, materials and lights
 *
 * Filled once while the scene is built, then only read while rendering.
 */
class Scene {
public:
    std::vector<Box> boxes;
    std::vector<Plane> planes;
    std::vector<Material> materials;
    std::vector<PointLight> lights;
    color ambient_light = {0.0, 0.0, 0.0};

    /**
     * @brief Add a material and return its ID
     */
    int add_material(const Material& mat) {
        int id = static_cast<int>(materials.size());
        materials.push_back(mat);
        return id;
    }

    void add_box(point3 center, vec3 half_extents, int material_id) {
        boxes.emplace_back(center, half_extents, material_id);
    }

    /**
     * @brief Add a box from its full edge lengths
     */
    void add_box_sized(point3 center, double w, double h, double d, int material_id) {
        boxes.emplace_back(center, vec3{w / 2.0, h / 2.0, d / 2.0}, material_id);
    }

    void add_plane(point3 point, vec3 normal, int material_id) {
        planes.emplace_back(point, normal, material_id);
    }

    void add_light(const PointLight& light) {
        lights.push_back(light);
    }

    bool empty() const {
        return boxes.empty() && planes.empty();
    }

    /**
     * @brief Warn about materials that hand out more than all their energy
     * @return Number of offending materials
     */
    int validate() const {
        int bad = 0;
        for (size_t i = 0; i < materials.size(); ++i) {
            if (materials[i].overcommitted()) {
                std::cerr << "Warning: material " << i << " has reflective + transmissive > 1;"
                          << " weights will be rescaled" << std::endl;
                ++bad;
            }
        }
        return bad;
    }

    /**
     * @brief Check if a point is in shadow from a light
     *
     * Only occluders strictly between the point and the light count.
     * @param point Biased surface point
     * @param light_pos The light position
     * @param t_min Distance ignored at both ends of the segment
     */
    bool is_shadowed(point3 point, point3 light_pos, double t_min) const {
        vec3 to_light = vec3_sub(light_pos, point);
        double distance = vec3_length(to_light);
        if (distance <= 2.0 * t_min) {
            return false;
        }

        ray shadow_ray = ray_create(point, to_light);
        hit_record rec = hit_record_init();
        return hit(shadow_ray, t_min, distance - t_min, rec);
    }

    /**
     * @brief Test ray against all objects in scene (linear scan)
     * @param r The ray
     * @param t_min Minimum t value
     * @param t_max Maximum t value
     * @param rec Hit record to populate with the closest hit
     * @return true if any intersection found
     */
    bool hit(ray r, double t_min, double t_max, hit_record& rec) const {
        hit_record temp_rec = hit_record_init();
        bool hit_anything = false;
        double closest_so_far = t_max;

        for (const auto& box : boxes) {
            if (box.hit(r, t_min, closest_so_far, temp_rec)) {
                hit_anything = true;
                closest_so_far = temp_rec.t;
                rec = temp_rec;
            }
        }

        for (const auto& plane : planes) {
            if (plane.hit(r, t_min, closest_so_far, temp_rec)) {
                hit_anything = true;
                closest_so_far = temp_rec.t;
                rec = temp_rec;
            }
        }

        return hit_anything;
    }

    const Material& get_material(int id) const {
        return materials[id];
    }
};

} // namespace slabray
