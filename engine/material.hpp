/**
 * @file material.hpp
 * @brief Surface reflectance parameters for Whitted shading
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "texture.hpp"
#include <array>

namespace slabray {

/**
 * @brief Index names into Material::albedo
 */
enum AlbedoChannel {
    kDiffuse = 0,
    kSpecular = 1,
    kReflective = 2,
    kTransmissive = 3
};

/**
 * @brief Material properties
 *
 * The albedo splits incoming energy four ways. Diffuse and specular form
 * the local (Phong) term; reflective and transmissive take their share
 * from what is left, so their sum is expected to stay within 1.
 */
struct Material {
    Texture texture = Texture::solid({0.7, 0.7, 0.7});  // Base color
    double specular_exponent = 50.0;                    // Phong lobe sharpness
    std::array<double, 4> albedo = {1.0, 0.0, 0.0, 0.0};
    double refractive_index = 1.0;                      // 1.0 = air
    color emission = {0.0, 0.0, 0.0};                   // Self-luminous color

    color color_at(point3 p, double u = 0.0, double v = 0.0) const {
        return texture.sample(p, u, v);
    }

    double diffuse() const { return albedo[kDiffuse]; }
    double specular() const { return albedo[kSpecular]; }
    double reflective() const { return albedo[kReflective]; }
    double transmissive() const { return albedo[kTransmissive]; }

    bool is_emissive() const {
        return emission.x > 0.0 || emission.y > 0.0 || emission.z > 0.0;
    }

    /**
     * @brief Reflective plus transmissive exceeds the available energy
     */
    bool overcommitted() const {
        return reflective() + transmissive() > 1.0;
    }

    /**
     * @brief Diffuse surface with a soft highlight
     */
    static Material matte(color c, double specular = 0.1, double exponent = 10.0) {
        Material m;
        m.texture = Texture::solid(c);
        m.albedo = {1.0 - specular, specular, 0.0, 0.0};
        m.specular_exponent = exponent;
        return m;
    }

    /**
     * @brief Diffuse surface with a procedural or image texture
     */
    static Material textured(Texture tex, double specular = 0.1, double exponent = 10.0) {
        Material m;
        m.texture = tex;
        m.albedo = {1.0 - specular, specular, 0.0, 0.0};
        m.specular_exponent = exponent;
        return m;
    }

    /**
     * @brief Mirror; `reflectivity` of the energy goes to the reflected ray
     */
    static Material mirror(color tint, double reflectivity = 0.8) {
        Material m;
        m.texture = Texture::solid(tint);
        m.albedo = {0.6, 0.3, reflectivity, 0.0};
        m.specular_exponent = 1425.0;
        return m;
    }

    /**
     * @brief Glass-like dielectric
     */
    static Material glass(double ior = 1.5, double reflectivity = 0.1, double transparency = 0.8) {
        Material m;
        m.texture = Texture::solid({0.6, 0.7, 0.8});
        m.albedo = {0.0, 0.5, reflectivity, transparency};
        m.specular_exponent = 125.0;
        m.refractive_index = ior;
        return m;
    }

    /**
     * @brief Self-luminous surface, unaffected by lights and shadows
     */
    static Material emissive(color emit, color c = {0.0, 0.0, 0.0}) {
        Material m;
        m.texture = Texture::solid(c);
        m.emission = emit;
        return m;
    }
};

} // namespace slabray
