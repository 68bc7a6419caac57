// src/world/scene_provider.cpp
#include "world/scene_provider.hpp"
#include "sim/errors.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace world {

namespace {

const char* const kFamilies[] = {"empty", "office", "warehouse", "forest"};

uint64_t family_salt(const std::string& family) {
    // FNV-1a, stable across runs
    uint64_t h = 1469598103934665603ULL;
    for (char c : family) {
        h ^= static_cast<uint8_t>(c);
        h *= 1099511628211ULL;
    }
    return h;
}

bool footprint_clear(double cx, double cy, double half_x, double half_y, double clear_r) {
    // Closest point of the footprint to the origin
    const double px = std::max(std::abs(cx) - half_x, 0.0);
    const double py = std::max(std::abs(cy) - half_y, 0.0);
    return std::hypot(px, py) >= clear_r;
}

Box make_box(double cx, double cy, double ground_z, double half_x, double half_y, double height) {
    return {{cx - half_x, cy - half_y, ground_z}, {cx + half_x, cy + half_y, ground_z + height}};
}

} // namespace

ProceduralSceneProvider::ProceduralSceneProvider(const ProceduralSceneParams& params)
    : params_(params)
{
    if (params_.families.empty()) {
        throw sim::ConfigurationError("scenes.families must list at least one family");
    }
    for (const auto& f : params_.families) {
        if (!is_known_family(f)) {
            throw sim::ConfigurationError("Unknown scene family: '" + f + "'");
        }
    }
    if (params_.extent_m <= params_.clear_radius_m) {
        throw sim::ConfigurationError("Scene extent must exceed the spawn clear radius");
    }
}

bool ProceduralSceneProvider::is_known_family(const std::string& family) {
    return std::find(std::begin(kFamilies), std::end(kFamilies), family) != std::end(kFamilies);
}

std::vector<std::string> ProceduralSceneProvider::available() const {
    std::vector<std::string> out = params_.families;
    for (const auto& [id, boxes] : fixed_) {
        (void)boxes;
        out.push_back(id);
    }
    return out;
}

void ProceduralSceneProvider::add_scene(const std::string& scene_id, std::vector<Box> boxes) {
    fixed_[scene_id] = std::move(boxes);
}

std::shared_ptr<const Scene> ProceduralSceneProvider::load(const std::string& scene_id, uint64_t seed) {
    std::shared_ptr<const Scene> scene;

    auto fixed_it = fixed_.find(scene_id);
    if (fixed_it != fixed_.end()) {
        scene = std::make_shared<Scene>(scene_id, "fixed", seed,
                                        params_.ground_z_m, fixed_it->second);
    } else if (std::find(params_.families.begin(), params_.families.end(), scene_id)
               != params_.families.end()) {
        scene = std::make_shared<Scene>(scene_id, scene_id, seed,
                                        params_.ground_z_m, generate(scene_id, seed));
    } else {
        throw sim::SceneNotFoundError("Scene '" + scene_id + "' is not available");
    }

    std::string why;
    if (!scene->validate(why)) {
        throw sim::SceneInvalidError("Scene '" + scene_id + "' failed validation: " + why);
    }

    LOG_INFO("[SceneProvider] Loaded scene '%s' (family=%s seed=%llu boxes=%zu)",
             scene_id.c_str(), scene->family().c_str(),
             static_cast<unsigned long long>(seed), scene->boxes().size());
    return scene;
}

std::vector<Box> ProceduralSceneProvider::generate(const std::string& family, uint64_t seed) const {
    std::vector<Box> boxes;
    std::mt19937_64 rng(seed ^ family_salt(family));
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    const double ext = params_.extent_m;
    const double gz = params_.ground_z_m;
    const double clear = params_.clear_radius_m;

    auto uniform = [&](double lo, double hi) { return lo + (hi - lo) * unit(rng); };

    // Rejection-sample a footprint outside the clear radius
    auto place = [&](double half_x, double half_y, double height) {
        for (int attempt = 0; attempt < 64; ++attempt) {
            const double cx = uniform(-ext + half_x, ext - half_x);
            const double cy = uniform(-ext + half_y, ext - half_y);
            if (footprint_clear(cx, cy, half_x, half_y, clear)) {
                boxes.push_back(make_box(cx, cy, gz, half_x, half_y, height));
                return;
            }
        }
    };

    if (family == "empty") {
        return boxes;
    }

    if (family == "office") {
        const double wall_h = 3.0;
        const double t = 0.1;
        boxes.push_back({{-ext - t, -ext - t, gz}, {ext + t, -ext, gz + wall_h}});
        boxes.push_back({{-ext - t, ext, gz}, {ext + t, ext + t, gz + wall_h}});
        boxes.push_back({{-ext - t, -ext, gz}, {-ext, ext, gz + wall_h}});
        boxes.push_back({{ext, -ext, gz}, {ext + t, ext, gz + wall_h}});

        const int desks = 6 + static_cast<int>(uniform(0.0, 5.0));
        for (int i = 0; i < desks; ++i) {
            const bool rotated = unit(rng) < 0.5;
            place(rotated ? 0.4 : 0.8, rotated ? 0.8 : 0.4, 0.75);
        }
    } else if (family == "warehouse") {
        const double rack_half_len = 4.0;
        const double rack_half_w = 0.5;
        const double spacing = 3.5;
        for (double cy = -ext + spacing; cy < ext - 1.0; cy += spacing) {
            for (double cx = -ext + rack_half_len + 1.0; cx < ext - rack_half_len; cx += 2.0 * rack_half_len + 3.0) {
                const double jx = cx + uniform(-0.5, 0.5);
                if (!footprint_clear(jx, cy, rack_half_len, rack_half_w, clear)) continue;
                boxes.push_back(make_box(jx, cy, gz, rack_half_len, rack_half_w, uniform(3.0, 5.0)));
            }
        }
    } else if (family == "forest") {
        const int trees = 30 + static_cast<int>(uniform(0.0, 21.0));
        for (int i = 0; i < trees; ++i) {
            const double r = uniform(0.15, 0.3);
            place(r, r, uniform(6.0, 12.0));
        }
    }

    return boxes;
}

} // namespace world
