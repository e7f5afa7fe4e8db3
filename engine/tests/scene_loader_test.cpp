/**
 * @file scene_loader_test.cpp
 * @brief Tests for JSON scene parsing
 */

#include "engine/scene_loader.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <cstdio>
#include <cmath>
#include <cassert>

using namespace slabray;

constexpr double EPSILON = 1e-9;

bool approx_equal(double a, double b, double eps = EPSILON) {
    return std::abs(a - b) < eps;
}

bool approx_equal(vec3 a, vec3 b, double eps = EPSILON) {
    return approx_equal(a.x, b.x, eps) && approx_equal(a.y, b.y, eps) && approx_equal(a.z, b.z, eps);
}

const char* kSceneText = R"({
    "camera": { "position": [0, 1, 5], "target": [0, 0, 0], "fov": 60 },
    "render": { "width": 64, "height": 32, "max_depth": 3,
                "shadow_transmission": 0.3, "output": "out.ppm" },
    "background": { "top": [0.5, 0.7, 1.0], "bottom": [1, 1, 1] },
    "ambient": 0.05,
    "materials": {
        "floor": { "texture": { "type": "checker", "color1": [1, 1, 1],
                                "color2": [0, 0, 0], "scale": 2.0 } },
        "glass": { "color": [0.9, 0.9, 1.0], "albedo": [0, 0.5, 0.1, 0.8],
                   "refractive_index": 1.5 },
        "hot": { "color": [0.1, 0.1, 0.1], "albedo": [2.0, -1.0, 0, 0],
                 "emission": [1, 0.5, 0] }
    },
    "objects": [
        { "type": "plane", "position": [0, -1, 0], "normal": [0, 2, 0], "material": "floor" },
        { "type": "box", "min": [-1, -1, -1], "max": [1, 0, 1], "material": "glass" },
        { "type": "cube", "center": [3, 0, 0], "size": 2, "material": "hot" },
        { "type": "box", "center": [0, 2, 0], "half_extents": [0.5, 0.25, 1], "material": "nope" },
        { "type": "sphere", "center": [0, 0, 0], "radius": 1 }
    ],
    "lights": [
        { "position": [0, 5, 0], "color": [1, 1, 1], "intensity": 2.0 },
        { "position": [3, 3, 3], "attenuation": [0.1, 0.01] }
    ]
})";

void test_parse_full_scene() {
    std::cout << "Testing full scene parse...\n";

    SceneLoader::SceneData data = SceneLoader::parse(json::parse(kSceneText));
    assert(data.valid);

    const Renderer::Settings& s = data.settings;
    assert(s.width == 64 && s.height == 32);
    assert(s.max_depth == 3);
    assert(approx_equal(s.fov, 60.0));
    assert(approx_equal(s.shadow_transmission, 0.3));
    assert(s.use_background_gradient);
    assert(approx_equal(s.background_top, vec3{0.5, 0.7, 1.0}));
    assert(data.output_file == "out.ppm");

    assert(approx_equal(data.camera_position, vec3{0.0, 1.0, 5.0}));
    assert(approx_equal(data.camera_target, vec3{0.0, 0.0, 0.0}));
    assert(approx_equal(data.camera_up, vec3{0.0, 1.0, 0.0}));

    const Scene& scene = data.scene;
    assert(approx_equal(scene.ambient_light, vec3{0.05, 0.05, 0.05}));
    assert(scene.materials.size() == 3);
    assert(scene.planes.size() == 1);
    assert(scene.boxes.size() == 3);
    assert(scene.lights.size() == 2);

    // Plane normal is normalized on load
    assert(approx_equal(scene.planes[0].normal, vec3{0.0, 1.0, 0.0}));

    // Corner form
    assert(approx_equal(scene.boxes[0].center, vec3{0.0, -0.5, 0.0}));
    assert(approx_equal(scene.boxes[0].half, vec3{1.0, 0.5, 1.0}));

    // Scalar size broadcasts to all three axes
    assert(approx_equal(scene.boxes[1].half, vec3{1.0, 1.0, 1.0}));
    assert(approx_equal(scene.boxes[2].half, vec3{0.5, 0.25, 1.0}));

    // Unknown material name falls back to the first material
    assert(scene.boxes[2].material_id == 0);

    const Material& glass = scene.get_material(scene.boxes[0].material_id);
    assert(approx_equal(glass.refractive_index, 1.5));
    assert(approx_equal(glass.transmissive(), 0.8));

    const Material& hot = scene.get_material(scene.boxes[1].material_id);
    assert(approx_equal(hot.diffuse(), 1.0));
    assert(approx_equal(hot.specular(), 0.0));
    assert(hot.is_emissive());

    const Material& floor = scene.get_material(scene.planes[0].material_id);
    assert(floor.texture.type == TextureType::Checker);
    assert(approx_equal(floor.texture.scale, 2.0));

    assert(approx_equal(scene.lights[0].intensity, 2.0));
    assert(approx_equal(scene.lights[1].k1, 0.1));
    assert(approx_equal(scene.lights[1].k2, 0.01));
    assert(approx_equal(scene.lights[1].intensity, 1.0));

    std::cout << "  PASSED\n";
}

void test_defaults() {
    std::cout << "Testing empty document defaults...\n";

    SceneLoader::SceneData data = SceneLoader::parse(json::object());
    assert(data.valid);
    assert(data.scene.boxes.empty() && data.scene.planes.empty());
    assert(data.scene.materials.size() == 1);

    Renderer::Settings defaults;
    assert(data.settings.width == defaults.width);
    assert(data.settings.max_depth == defaults.max_depth);
    assert(!data.settings.use_background_gradient);
    assert(data.output_file == "output.png");

    std::cout << "  PASSED\n";
}

void test_solid_background() {
    std::cout << "Testing solid background...\n";

    json j = json::parse(R"({ "background": { "color": [0.2, 0.3, 0.4] } })");
    SceneLoader::SceneData data = SceneLoader::parse(j);
    assert(!data.settings.use_background_gradient);
    assert(approx_equal(data.settings.background_color, vec3{0.2, 0.3, 0.4}));

    std::cout << "  PASSED\n";
}

void test_short_vector_keeps_default() {
    std::cout << "Testing short vectors...\n";

    json j = json::parse(R"({ "camera": { "position": [1, 2] } })");
    SceneLoader::SceneData data = SceneLoader::parse(j);
    assert(approx_equal(data.camera_position, SceneLoader::SceneData().camera_position));

    std::cout << "  PASSED\n";
}

void test_checker_scale_fallback() {
    std::cout << "Testing invalid checker scale...\n";

    for (const char* scale : {"0", "-2.5"}) {
        std::string text = std::string(R"({ "materials": { "floor": { "texture":
            { "type": "checker", "scale": )") + scale + " } } } }";
        SceneLoader::SceneData data = SceneLoader::parse(json::parse(text));
        assert(data.valid);
        assert(data.scene.materials[0].texture.type == TextureType::Checker);
        assert(approx_equal(data.scene.materials[0].texture.scale, 1.0));
    }

    std::cout << "  PASSED\n";
}

void test_degenerate_geometry_rejected() {
    std::cout << "Testing degenerate camera and plane...\n";

    // Looking straight down with up = +y leaves no right vector
    json parallel = json::parse(R"({ "camera": { "position": [0, 5, 0], "target": [0, 0, 0],
                                                  "up": [0, 1, 0] } })");
    assert(!SceneLoader::parse(parallel).valid);

    json coincident = json::parse(R"({ "camera": { "position": [1, 1, 1], "target": [1, 1, 1] } })");
    assert(!SceneLoader::parse(coincident).valid);

    json zero_up = json::parse(R"({ "camera": { "up": [0, 0, 0] } })");
    assert(!SceneLoader::parse(zero_up).valid);

    json flat_plane = json::parse(R"({ "objects": [
        { "type": "plane", "position": [0, 0, 0], "normal": [0, 0, 0] } ] })");
    assert(!SceneLoader::parse(flat_plane).valid);

    // The same camera tilted off the vertical is fine
    json tilted = json::parse(R"({ "camera": { "position": [0, 5, 1], "target": [0, 0, 0],
                                                "up": [0, 1, 0] } })");
    assert(SceneLoader::parse(tilted).valid);

    std::cout << "  PASSED\n";
}

void test_load_failures() {
    std::cout << "Testing load failures...\n";

    SceneLoader::SceneData missing = SceneLoader::load("no_such_scene_file.json");
    assert(!missing.valid);

    const char* path = "scene_loader_test_broken.json";
    {
        std::ofstream out(path);
        out << "{ \"objects\": [ ";
    }
    SceneLoader::SceneData broken = SceneLoader::load(path);
    assert(!broken.valid);
    std::remove(path);

    std::cout << "  PASSED\n";
}

void test_load_from_file() {
    std::cout << "Testing load from file...\n";

    const char* path = "scene_loader_test_ok.json";
    {
        std::ofstream out(path);
        out << kSceneText;
    }
    SceneLoader::SceneData data = SceneLoader::load(path);
    std::remove(path);

    assert(data.valid);
    assert(data.scene.boxes.size() == 3);

    std::cout << "  PASSED\n";
}

int main() {
    std::cout << "=== Scene Loader Tests ===\n\n";

    test_parse_full_scene();
    test_defaults();
    test_solid_background();
    test_short_vector_keeps_default();
    test_checker_scale_fallback();
    test_degenerate_geometry_rejected();
    test_load_failures();
    test_load_from_file();

    std::cout << "\n=== All scene loader tests passed! ===\n";
    return 0;
}
