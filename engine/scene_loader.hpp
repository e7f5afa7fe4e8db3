/**
 * @file scene_loader.hpp
 * @brief JSON scene file loading
 */

#pragma once

#include <nlohmann/json.hpp>
#include "scene.hpp"
#include "material.hpp"
#include "texture.hpp"
#include "renderer.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <unordered_map>

namespace slabray {

using json = nlohmann::json;

/**
 * @brief Load a scene from a JSON file
 *
 * Missing keys keep their defaults; a file that cannot be read or parsed,
 * or that describes a degenerate camera or plane, yields `valid == false`
 * after the error has been printed.
 */
class SceneLoader {
public:
    struct SceneData {
        Scene scene;
        Renderer::Settings settings;

        // Camera settings
        point3 camera_position = {3.0, 4.0, 2.0};
        point3 camera_target = {0.0, -0.5, -3.0};
        vec3 camera_up = {0.0, 1.0, 0.0};

        std::string output_file = "output.png";
        bool valid = false;
    };

    // Shortest vector accepted as a direction
    static constexpr double kMinLength = 1e-12;

    /**
     * @brief Read a 3-vector, falling back to `fallback` when absent
     */
    static vec3 parse_vec3(const json& obj, const std::string& key, vec3 fallback) {
        if (!obj.contains(key)) {
            return fallback;
        }
        const json& arr = obj.at(key);
        if (arr.is_number()) {
            double s = arr.get<double>();
            return {s, s, s};
        }
        auto v = arr.get<std::vector<double>>();
        if (v.size() < 3) {
            std::cerr << "Warning: '" << key << "' needs 3 components, using default" << std::endl;
            return fallback;
        }
        return {v[0], v[1], v[2]};
    }

    /**
     * @brief Parse a texture from JSON
     */
    static Texture parse_texture(const json& tex) {
        std::string type = tex.value("type", "solid");

        if (type == "checker") {
            double scale = tex.value("scale", 1.0);
            if (!std::isfinite(scale) || scale <= 0.0) {
                std::cerr << "Warning: checker scale must be positive, using 1.0" << std::endl;
                scale = 1.0;
            }
            return Texture::checker(parse_vec3(tex, "color1", {1.0, 1.0, 1.0}),
                                    parse_vec3(tex, "color2", {0.0, 0.0, 0.0}),
                                    scale);
        }
        if (type == "image") {
            std::string filename = tex.value("file", "");
            if (filename.empty()) {
                std::cerr << "Error: Image texture missing 'file' property" << std::endl;
                return Texture::solid({1.0, 0.0, 1.0});  // Magenta for error
            }
            return Texture::load_image(filename);
        }
        return Texture::solid(parse_vec3(tex, "color", {0.7, 0.7, 0.7}));
    }

    /**
     * @brief Parse one material entry
     */
    static Material parse_material(const json& mat) {
        Material m;

        if (mat.contains("texture")) {
            m.texture = parse_texture(mat["texture"]);
        } else {
            m.texture = Texture::solid(parse_vec3(mat, "color", {0.7, 0.7, 0.7}));
        }

        m.specular_exponent = std::max(0.0, mat.value("specular_exponent", m.specular_exponent));
        m.refractive_index = mat.value("refractive_index", m.refractive_index);
        m.emission = parse_vec3(mat, "emission", m.emission);

        if (mat.contains("albedo")) {
            auto a = mat["albedo"].get<std::vector<double>>();
            for (size_t i = 0; i < m.albedo.size() && i < a.size(); ++i) {
                m.albedo[i] = std::clamp(a[i], 0.0, 1.0);
            }
        }

        return m;
    }

    /**
     * @brief Parse a scene document that is already in memory
     */
    static SceneData parse(const json& j) {
        SceneData data;
        Renderer::Settings& s = data.settings;

        if (j.contains("camera")) {
            const json& cam = j["camera"];
            data.camera_position = parse_vec3(cam, "position", data.camera_position);
            data.camera_target = parse_vec3(cam, "target", data.camera_target);
            data.camera_up = parse_vec3(cam, "up", data.camera_up);
            s.fov = cam.value("fov", s.fov);
        }

        // The camera basis needs a view direction that is not parallel to up
        vec3 view = vec3_sub(data.camera_target, data.camera_position);
        if (vec3_length(vec3_cross(data.camera_up, view)) < kMinLength) {
            std::cerr << "Error: camera 'up' is zero or parallel to the view direction" << std::endl;
            return SceneData{};
        }

        if (j.contains("render")) {
            const json& r = j["render"];
            s.width = r.value("width", s.width);
            s.height = r.value("height", s.height);
            s.max_depth = r.value("max_depth", s.max_depth);
            s.epsilon = r.value("epsilon", s.epsilon);
            s.shadow_transmission = std::clamp(r.value("shadow_transmission", s.shadow_transmission), 0.0, 1.0);
            data.output_file = r.value("output", data.output_file);
        }

        if (j.contains("background")) {
            const json& bg = j["background"];
            if (bg.contains("top") || bg.contains("bottom")) {
                s.use_background_gradient = true;
                s.background_top = parse_vec3(bg, "top", s.background_top);
                s.background_bottom = parse_vec3(bg, "bottom", s.background_bottom);
            } else {
                s.use_background_gradient = false;
                s.background_color = parse_vec3(bg, "color", s.background_color);
            }
        }

        data.scene.ambient_light = parse_vec3(j, "ambient", data.scene.ambient_light);

        // Material name -> ID mapping
        std::unordered_map<std::string, int> material_ids;

        if (j.contains("materials")) {
            for (auto& el : j["materials"].items()) {
                material_ids[el.key()] = data.scene.add_material(parse_material(el.value()));
            }
        }

        if (data.scene.materials.empty()) {
            data.scene.add_material(Material());
        }

        auto get_material = [&](const json& obj) -> int {
            if (obj.contains("material")) {
                std::string name = obj["material"].get<std::string>();
                auto it = material_ids.find(name);
                if (it != material_ids.end()) {
                    return it->second;
                }
                std::cerr << "Warning: Unknown material '" << name << "'" << std::endl;
            }
            return 0;
        };

        if (j.contains("objects")) {
            for (auto& obj : j["objects"]) {
                std::string type = obj.value("type", "");
                int mat_id = get_material(obj);

                if (type == "box" || type == "cube") {
                    if (obj.contains("min") && obj.contains("max")) {
                        data.scene.boxes.push_back(Box::from_corners(
                            parse_vec3(obj, "min", {0, 0, 0}),
                            parse_vec3(obj, "max", {1, 1, 1}), mat_id));
                    } else {
                        point3 center = parse_vec3(obj, "center", {0, 0, 0});
                        vec3 half = obj.contains("half_extents")
                            ? parse_vec3(obj, "half_extents", {0.5, 0.5, 0.5})
                            : vec3_scale(parse_vec3(obj, "size", {1, 1, 1}), 0.5);
                        data.scene.add_box(center, half, mat_id);
                    }
                }
                else if (type == "plane") {
                    vec3 normal = parse_vec3(obj, "normal", {0, 1, 0});
                    if (vec3_length(normal) < kMinLength) {
                        std::cerr << "Error: plane normal has zero length" << std::endl;
                        return SceneData{};
                    }
                    data.scene.add_plane(parse_vec3(obj, "position", {0, 0, 0}), normal, mat_id);
                }
                else {
                    std::cerr << "Warning: Unknown object type '" << type << "'" << std::endl;
                }
            }
        }

        if (j.contains("lights")) {
            for (auto& light : j["lights"]) {
                std::vector<double> falloff = light.value("attenuation", std::vector<double>{0.0, 0.0});
                falloff.resize(2, 0.0);
                data.scene.add_light(PointLight(
                    parse_vec3(light, "position", {0, 5, 0}),
                    parse_vec3(light, "color", {1, 1, 1}),
                    light.value("intensity", 1.0),
                    falloff[0], falloff[1]));
            }
        }

        data.scene.validate();
        data.valid = true;
        return data;
    }

    /**
     * @brief Load scene from JSON file
     * @param filename Path to JSON file
     * @return SceneData with scene and settings, `valid` false on failure
     */
    static SceneData load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open scene file: " << filename << std::endl;
            return SceneData{};
        }

        try {
            json j = json::parse(file);
            SceneData data = parse(j);
            if (!data.valid) {
                return data;
            }
            std::cout << "Loaded scene: " << filename << " (" << data.scene.boxes.size()
                      << " boxes, " << data.scene.planes.size() << " planes, "
                      << data.scene.lights.size() << " lights)" << std::endl;
            return data;
        } catch (const json::exception& e) {
            std::cerr << "Error parsing scene " << filename << ": " << e.what() << std::endl;
            return SceneData{};
        }
    }
};

} // namespace slabray
