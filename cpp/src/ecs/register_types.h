#ifndef HOVERTANK_REGISTER_TYPES_H
#define HOVERTANK_REGISTER_TYPES_H

#include <gdextension_interface.h>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/core/defs.hpp>
#include <godot_cpp/godot.hpp>

void initialize_hovertank_module(godot::ModuleInitializationLevel p_level);
void uninitialize_hovertank_module(godot::ModuleInitializationLevel p_level);

#endif // HOVERTANK_REGISTER_TYPES_H
