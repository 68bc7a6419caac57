// src/world/scene_provider.hpp
#pragma once

#include "world/scene.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace world {

/**
 * SceneProvider - Source of static scene geometry
 *
 * load() must be deterministic in (scene_id, seed).
 *
 * @throws sim::SceneNotFoundError for an unknown scene id
 * @throws sim::SceneInvalidError if the produced geometry fails validation
 */
class SceneProvider {
public:
    virtual ~SceneProvider() = default;

    virtual std::shared_ptr<const Scene> load(const std::string& scene_id, uint64_t seed) = 0;

    virtual std::vector<std::string> available() const = 0;
};

struct ProceduralSceneParams {
    std::vector<std::string> families{"empty", "office", "warehouse", "forest"};
    double ground_z_m = 0.0;
    double clear_radius_m = 3.5;    // Keep obstacles away from the spawn area
    double extent_m = 15.0;         // Half-width of the populated square
};

/**
 * ProceduralSceneProvider - Placeholder scene families
 *
 *   empty     - ground plane only
 *   office    - four walls plus scattered desks
 *   warehouse - rows of tall shelving racks
 *   forest    - randomly placed tree trunks
 *
 * Fixed geometry can also be registered under an id (add_scene), which is
 * validated on every load.
 */
class ProceduralSceneProvider : public SceneProvider {
public:
    /**
     * @throws sim::ConfigurationError for an unknown family name
     */
    explicit ProceduralSceneProvider(const ProceduralSceneParams& params = {});

    std::shared_ptr<const Scene> load(const std::string& scene_id, uint64_t seed) override;

    std::vector<std::string> available() const override;

    void add_scene(const std::string& scene_id, std::vector<Box> boxes);

    static bool is_known_family(const std::string& family);

private:
    std::vector<Box> generate(const std::string& family, uint64_t seed) const;

    ProceduralSceneParams params_;
    std::map<std::string, std::vector<Box>> fixed_;
};

} // namespace world
