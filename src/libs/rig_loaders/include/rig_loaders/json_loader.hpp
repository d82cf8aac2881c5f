#pragma once

#include <rig_model/drag_payload.hpp>
#include <rig_model/rig_document.hpp>
#include <rig_model/types.hpp>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace rig_loaders {

// Missing optional fields default (null references, origin centre); only text
// that is not a JSON object yields nullopt.
std::optional<rig_model::DragPayload> parse_drag_payload(std::string_view text);
std::string drag_payload_to_json(const rig_model::DragPayload& payload);

// Palette categories and slot type names ("wheel", "support-leg", "STOP_BUTTON", ...).
std::optional<rig_model::SlotType> slot_type_for_category(std::string_view category);

std::optional<rig_model::RigDocument> load_rig_document_from_json(std::istream& in);
std::optional<rig_model::RigDocument> load_rig_document_from_json_file(const std::string& path);

} // namespace rig_loaders
