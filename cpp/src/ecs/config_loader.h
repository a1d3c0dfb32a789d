#ifndef HOVERTANK_CONFIG_LOADER_H
#define HOVERTANK_CONFIG_LOADER_H

#include "hovertank_interfaces.h"
#include <flecs.h>
#include <string>

namespace hovertank {

// Parse JSON text into prefabs ("vehicle_<id>", "weapon_<id>") and the
// runtime CombatRules. Each returns the number of records applied; a
// malformed document is logged and leaves earlier state untouched.
int load_vehicles_json(flecs::world &ecs, const std::string &text);
int load_weapons_json(flecs::world &ecs, const std::string &text);
int load_rules_json(flecs::world &ecs, const std::string &text);

flecs::entity find_vehicle_prefab(flecs::world &ecs,
                                  const std::string &vehicle_id);
flecs::entity find_weapon_prefab(flecs::world &ecs,
                                 const std::string &weapon_id);

// Unknown ids fall back to the built-in defaults with a warning.
flecs::entity spawn_vehicle_from_prefab(flecs::world &ecs, DynamicsBody *body,
                                        const std::string &vehicle_id,
                                        const std::string &weapon_id,
                                        uint8_t team);

} // namespace hovertank

#endif // HOVERTANK_CONFIG_LOADER_H
