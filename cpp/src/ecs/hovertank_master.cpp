// ═════════════════════════════════════════════════════════════════════════════
// HOVERTANK CORE: UNITY BUILD
// ═════════════════════════════════════════════════════════════════════════════
// The extension compiles ONLY this file. One translation unit means one
// copy of flecs' cached component ids (flecs::type_id<T>), so
// ecs.each<T>() resolves the same ids in every included file.
//
// ORDER MATTERS: the bridge defines g_runtime, so it goes first.
// ═════════════════════════════════════════════════════════════════════════════

// 1. Bridge (TankServer, g_runtime, collaborator adapters)
#include "world_manager.cpp"
#include "register_types.cpp"

// 2. Rendering buffers (projectiles, walls)
#include "rendering_bridge.cpp"

// 3. Runtime services (log, timers, rules)
#include "hovertank_log.cpp"
#include "timer_queue.cpp"
#include "sim_runtime.cpp"

// 4. Data (JSON prefabs + rules)
#include "config_loader.cpp"

// 5. Systems
#include "vitals_systems.cpp"
#include "locomotion_systems.cpp"
#include "module_systems.cpp"
#include "weapon_systems.cpp"
