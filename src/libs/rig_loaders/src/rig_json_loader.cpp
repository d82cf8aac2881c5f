#include <rig_loaders/json_loader.hpp>
#include <rig_placement/slot_generator.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>

namespace rig_loaders {

namespace {

double number_or(const nlohmann::json& j, const char* key, double fallback) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

bool bool_or(const nlohmann::json& j, const char* key, bool fallback) {
    return j.contains(key) && j[key].is_boolean() ? j[key].get<bool>() : fallback;
}

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

// Integer field narrowed to int; values past the int range are clamped to it
// and logged, the model limits are applied later by sanitize_parameters.
int count_or(const nlohmann::json& j, const char* key, int fallback) {
    if (!j.contains(key) || !j[key].is_number_integer()) return fallback;
    const auto& v = j[key];
    const long long int_max = std::numeric_limits<int>::max();
    const long long int_min = std::numeric_limits<int>::min();

    long long value = 0;
    if (v.is_number_unsigned())
        value = v.get<std::uint64_t>() > static_cast<std::uint64_t>(int_max) ? int_max + 1 : static_cast<long long>(v.get<std::uint64_t>());
    else
        value = v.get<long long>();

    if (value < int_min || value > int_max) {
        const long long clamped = std::clamp(value, int_min, int_max);
        spdlog::warn("rig_document_field_clamped key={} value={} using={}", key, v.dump(), clamped);
        return static_cast<int>(clamped);
    }
    return static_cast<int>(value);
}

std::optional<rig_model::ConveyorModel> model_from_string(const std::string& s) {
    if (s == "DPS50") return rig_model::ConveyorModel::DPS50;
    if (s == "DPS60") return rig_model::ConveyorModel::DPS60;
    if (s == "DPS96") return rig_model::ConveyorModel::DPS96;
    return std::nullopt;
}

std::optional<rig_model::EngineType> engine_from_string(const std::string& s) {
    if (s == "NORMAL") return rig_model::EngineType::Normal;
    if (s == "REDACTOR") return rig_model::EngineType::Redactor;
    if (s == "CENTRAL") return rig_model::EngineType::Central;
    return std::nullopt;
}

std::optional<rig_model::StopButtonSide> stop_side_from_string(const std::string& s) {
    if (s == "MOTOR") return rig_model::StopButtonSide::Motor;
    if (s == "OPPOSITE") return rig_model::StopButtonSide::Opposite;
    if (s == "BOTH") return rig_model::StopButtonSide::Both;
    return std::nullopt;
}

std::optional<rig_model::StopButtonEnd> stop_end_from_string(const std::string& s) {
    if (s == "START") return rig_model::StopButtonEnd::Start;
    if (s == "END") return rig_model::StopButtonEnd::End;
    if (s == "BOTH") return rig_model::StopButtonEnd::Both;
    return std::nullopt;
}

// Enum fields that are present but unrecognised keep their default and are logged.
template <typename T, typename Parse>
void read_enum(const nlohmann::json& j, const char* key, std::optional<T>& out, Parse parse) {
    if (!j.contains(key) || j[key].is_null()) return;
    if (!j[key].is_string()) {
        spdlog::warn("rig_document_field_ignored key={} reason=not_a_string", key);
        return;
    }
    const std::string value = j[key].get<std::string>();
    if (auto parsed = parse(value))
        out = *parsed;
    else
        spdlog::warn("rig_document_field_ignored key={} value={}", key, value);
}

rig_model::GeometryParameters parse_parameters(const nlohmann::json& j) {
    rig_model::GeometryParameters p;
    // "L"/"N" are the short names used on the order form.
    p.axis_length = number_or(j, "axis_length", number_or(j, "L", p.axis_length));
    p.belt_width = number_or(j, "belt_width", number_or(j, "N", p.belt_width));

    std::optional<rig_model::ConveyorModel> model;
    read_enum(j, "model", model, model_from_string);
    if (model) p.model = *model;

    read_enum(j, "engine_type", p.engine_type, engine_from_string);

    p.side_guide_enabled = bool_or(j, "side_guide_enabled", p.side_guide_enabled);
    p.side_guide_height = number_or(j, "side_guide_height", p.side_guide_height);

    read_enum(j, "stop_button_side", p.stop_button_side, stop_side_from_string);
    read_enum(j, "stop_button_end", p.stop_button_end, stop_end_from_string);
    if (j.contains("stop_button_count") && j["stop_button_count"].is_object()) {
        const auto& c = j["stop_button_count"];
        p.stop_button_count.motor = count_or(c, "motor", 0);
        p.stop_button_count.opposite = count_or(c, "opposite", 0);
    }

    p.supporting_frame = bool_or(j, "supporting_frame", p.supporting_frame);
    p.frame_height = number_or(j, "frame_height", p.frame_height);
    p.frame_wheels = bool_or(j, "frame_wheels", p.frame_wheels);
    return p;
}

rig_model::EditorSettings parse_editor(const nlohmann::json& j) {
    rig_model::EditorSettings e;
    e.snap_tolerance = number_or(j, "snap_tolerance", e.snap_tolerance);
    if (!(e.snap_tolerance > 0)) {
        spdlog::warn("rig_document_field_ignored key=snap_tolerance value={}", e.snap_tolerance);
        e.snap_tolerance = rig_model::EditorSettings{}.snap_tolerance;
    }
    e.log_file = string_or(j, "log_file", e.log_file);
    e.log_level = string_or(j, "log_level", e.log_level);
    return e;
}

std::optional<rig_model::RigDocument> parse_rig_document(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    rig_model::RigDocument doc;
    doc.name = string_or(j, "name", "");
    if (j.contains("parameters")) {
        if (!j["parameters"].is_object()) return std::nullopt;
        doc.parameters = parse_parameters(j["parameters"]);
    }
    if (j.contains("editor") && j["editor"].is_object())
        doc.editor = parse_editor(j["editor"]);

    if (j.contains("placements")) {
        if (!j["placements"].is_array()) return std::nullopt;
        for (const auto& pl : j["placements"]) {
            if (!pl.is_object()) return std::nullopt;
            if (!pl.contains("slot_id") || !pl["slot_id"].is_string()) return std::nullopt;
            if (!pl.contains("type") || !pl["type"].is_string()) return std::nullopt;
            auto type = rig_placement::slot_type_from_string(pl["type"].get<std::string>());
            if (!type) return std::nullopt;

            rig_model::PlacementRequest req;
            req.type = *type;
            req.slot_id = pl["slot_id"].get<std::string>();
            req.name = string_or(pl, "name", rig_placement::display_name(*type));
            if (pl.contains("asset") && pl["asset"].is_string())
                req.asset_reference = pl["asset"].get<std::string>();
            doc.placements.push_back(std::move(req));
        }
    }
    return doc;
}

} // namespace

std::optional<rig_model::RigDocument> load_rig_document_from_json(std::istream& in) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("rig_document_rejected reason=parse_error what={}", e.what());
        return std::nullopt;
    }
    auto doc = parse_rig_document(j);
    if (!doc) spdlog::warn("rig_document_rejected reason=bad_structure");
    return doc;
}

std::optional<rig_model::RigDocument> load_rig_document_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_rig_document_from_json(f);
}

} // namespace rig_loaders
