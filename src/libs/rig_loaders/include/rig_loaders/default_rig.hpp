#pragma once

#include <rig_model/drag_payload.hpp>
#include <rig_model/rig_document.hpp>
#include <vector>

namespace rig_loaders {

// Built-in rig used when no rig file is found.
rig_model::RigDocument generate_default_rig();

// Palette entries offered by the editor, one per slot type.
std::vector<rig_model::DragPayload> default_palette();

} // namespace rig_loaders
