/**
 * @file main.cpp
 * @brief Entry point for the slab tracer
 *
 * Renders a scene from a JSON file, or a built-in demo scene, to PNG/PPM.
 */

#include "renderer.hpp"
#include "scene.hpp"
#include "scene_loader.hpp"
#include "material.hpp"
#include "texture.hpp"
#include "profiler.hpp"

#include <iostream>
#include <string>
#include <stdexcept>
#include <algorithm>

using namespace slabray;

/**
 * @brief Built-in scene: checkered cube, mirror and glass boxes on a floor
 */
Scene create_demo_scene() {
    Scene scene;

    int mat_floor = scene.add_material(Material::matte({0.7, 0.7, 0.7}, 0.05));
    int mat_checker = scene.add_material([] {
        Material m = Material::textured(
            Texture::checker({1.0, 0.0, 1.0}, {0.0, 0.0, 0.0}, 0.5), 0.3, 40.0);
        m.albedo[kReflective] = 0.2;
        return m;
    }());
    int mat_mirror = scene.add_material(Material::mirror({0.9, 0.9, 0.9}, 0.8));
    int mat_glass = scene.add_material(Material::glass(1.5));
    int mat_lamp = scene.add_material(Material::emissive({1.0, 0.9, 0.6}));

    scene.add_plane({0.0, -2.0, 0.0}, {0.0, 1.0, 0.0}, mat_floor);
    scene.add_box_sized({0.0, -0.5, -3.0}, 1.5, 1.5, 1.5, mat_checker);
    scene.add_box_sized({-2.5, -1.0, -4.5}, 1.0, 2.0, 1.0, mat_mirror);
    scene.add_box_sized({1.8, -1.25, -2.0}, 0.8, 1.5, 0.8, mat_glass);
    scene.add_box_sized({0.0, 3.0, -3.0}, 0.4, 0.1, 0.4, mat_lamp);

    scene.add_light(PointLight({-3.0, 5.0, 2.0}, {1.0, 1.0, 0.9}, 1.0, 0.1, 0.01));
    scene.add_light(PointLight({3.0, 3.0, 0.0}, {0.8, 0.8, 1.0}, 0.7, 0.1, 0.01));
    scene.ambient_light = {0.1, 0.1, 0.1};

    return scene;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [scene.json] [output.png|output.ppm] [options]" << std::endl;
    std::cout << "  scene.json     - Scene file to render (optional, uses demo scene if not provided)" << std::endl;
    std::cout << "  output         - Output file (optional, default from scene or 'output.png')" << std::endl;
    std::cout << "  --width N      - Image width in pixels" << std::endl;
    std::cout << "  --height N     - Image height in pixels" << std::endl;
    std::cout << "  --depth N      - Maximum recursion depth" << std::endl;
    std::cout << "  --fov DEG      - Vertical field of view" << std::endl;
    std::cout << "  --shadow F     - Light fraction passing occluders (0 = hard shadows)" << std::endl;
    std::cout << "  --quiet        - No progress output" << std::endl;
    std::cout << "  --profile      - Print timing report after rendering" << std::endl;
}

int main(int argc, char* argv[]) {
    std::cout << "=== Slab Tracer ===" << std::endl;

    SceneLoader::SceneData data;
    data.settings.use_background_gradient = true;
    std::string scene_file;
    bool output_given = false;
    std::string output_file;

    // Overrides applied after the scene file
    int width = -1, height = -1, depth = -1;
    double fov = -1.0, shadow = -1.0;
    bool quiet = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            if (arg == "--width" && i + 1 < argc) { width = std::stoi(argv[++i]); continue; }
            if (arg == "--height" && i + 1 < argc) { height = std::stoi(argv[++i]); continue; }
            if (arg == "--depth" && i + 1 < argc) { depth = std::stoi(argv[++i]); continue; }
            if (arg == "--fov" && i + 1 < argc) { fov = std::stod(argv[++i]); continue; }
            if (arg == "--shadow" && i + 1 < argc) { shadow = std::stod(argv[++i]); continue; }
            if (arg == "--output" && i + 1 < argc) { output_file = argv[++i]; output_given = true; continue; }
            if (arg == "--quiet") { quiet = true; continue; }
            if (arg == "--profile") { Profiler::instance().set_enabled(true); continue; }

            if (arg.size() > 5 && arg.substr(arg.size() - 5) == ".json") {
                scene_file = arg;
            } else if (arg[0] != '-') {
                output_file = arg;
                output_given = true;
            } else {
                std::cerr << "Warning: ignoring unknown option " << arg << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: bad numeric argument (" << e.what() << ")" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (!scene_file.empty()) {
        ProfileScope scope("Scene Load");
        data = SceneLoader::load(scene_file);
        if (!data.valid) {
            return 1;
        }
    } else {
        std::cout << "Using built-in demo scene" << std::endl;
        data.scene = create_demo_scene();
    }

    Renderer::Settings& settings = data.settings;
    if (width > 0) settings.width = width;
    if (height > 0) settings.height = height;
    if (depth >= 0) settings.max_depth = depth;
    if (fov > 0.0) settings.fov = fov;
    if (shadow >= 0.0) settings.shadow_transmission = std::min(shadow, 1.0);
    if (quiet) settings.show_progress = false;
    if (!output_given) output_file = data.output_file;

    if (data.scene.empty()) {
        std::cerr << "Warning: scene has no objects, image will be background only" << std::endl;
    }

    if (settings.width <= 0 || settings.height <= 0) {
        std::cerr << "Error: image size must be positive" << std::endl;
        return 1;
    }

    Camera camera(data.camera_position, data.camera_target, data.camera_up);
    Renderer renderer(settings);

    Image image = renderer.render(data.scene, camera);

    bool written = false;
    {
        ProfileScope scope("Image Write");
        written = image.write(output_file);
    }
    if (!written) {
        std::cerr << "Error: could not write " << output_file << std::endl;
        return 1;
    }
    std::cout << "Saved " << output_file << std::endl;

    if (Profiler::instance().is_enabled()) {
        Profiler::instance().report();
    }

    return 0;
}
