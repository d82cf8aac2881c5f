#include <rig_loaders/json_loader.hpp>
#include <rig_placement/slot_generator.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace rig_loaders {

namespace {

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

std::optional<Eigen::Vector3d> parse_vec3(const nlohmann::json& j) {
    if (j.is_array() && j.size() == 3) {
        for (const auto& v : j)
            if (!v.is_number()) return std::nullopt;
        return Eigen::Vector3d(j[0].get<double>(), j[1].get<double>(), j[2].get<double>());
    }
    if (j.is_object()) {
        Eigen::Vector3d out = Eigen::Vector3d::Zero();
        out.x() = j.contains("x") && j["x"].is_number() ? j["x"].get<double>() : 0;
        out.y() = j.contains("y") && j["y"].is_number() ? j["y"].get<double>() : 0;
        out.z() = j.contains("z") && j["z"].is_number() ? j["z"].get<double>() : 0;
        return out;
    }
    return std::nullopt;
}

std::optional<rig_model::BoundingBox> parse_bounding_box(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("min") || !j.contains("max")) return std::nullopt;
    auto min = parse_vec3(j["min"]);
    auto max = parse_vec3(j["max"]);
    if (!min || !max) return std::nullopt;
    return rig_model::BoundingBox{ *min, *max };
}

nlohmann::json vec3_to_json(const Eigen::Vector3d& v) {
    return nlohmann::json::array({ v.x(), v.y(), v.z() });
}

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

std::optional<rig_model::DragPayload> parse_drag_payload(std::string_view text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("drag_payload_rejected reason=parse_error what={}", e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        spdlog::warn("drag_payload_rejected reason=not_an_object");
        return std::nullopt;
    }

    rig_model::DragPayload p;
    if (j.contains("id")) {
        if (j["id"].is_string())
            p.id = j["id"].get<std::string>();
        else if (j["id"].is_number_integer())
            p.id = std::to_string(j["id"].get<long long>());
        else if (j["id"].is_number())
            p.id = j["id"].dump();
    }
    p.name = optional_string(j, "name").value_or("Unnamed Component");
    // Palette entries carry either "category" or the legacy "type" key.
    if (auto category = optional_string(j, "category"))
        p.category = *category;
    else
        p.category = optional_string(j, "type").value_or("unknown");
    p.model_reference = optional_string(j, "glb_url");
    p.original_reference = optional_string(j, "original_url");
    if (j.contains("bounding_box"))
        p.bounding_box = parse_bounding_box(j["bounding_box"]);
    if (j.contains("center")) {
        if (auto c = parse_vec3(j["center"])) p.center = *c;
    }
    return p;
}

std::string drag_payload_to_json(const rig_model::DragPayload& payload) {
    nlohmann::json j;
    j["id"] = payload.id;
    j["name"] = payload.name;
    j["category"] = payload.category;
    j["glb_url"] = payload.model_reference ? nlohmann::json(*payload.model_reference) : nlohmann::json(nullptr);
    j["original_url"] = payload.original_reference ? nlohmann::json(*payload.original_reference) : nlohmann::json(nullptr);
    if (payload.bounding_box)
        j["bounding_box"] = { { "min", vec3_to_json(payload.bounding_box->min) }, { "max", vec3_to_json(payload.bounding_box->max) } };
    else
        j["bounding_box"] = nullptr;
    j["center"] = vec3_to_json(payload.center);
    return j.dump();
}

std::optional<rig_model::SlotType> slot_type_for_category(std::string_view category) {
    if (auto exact = rig_placement::slot_type_from_string(category)) return exact;

    const std::string key = lowercase(category);
    if (key == "engine" || key == "motor" || key == "drive-unit") return rig_model::SlotType::EngineMount;
    if (key == "stop" || key == "button" || key == "emergency-stop") return rig_model::SlotType::StopButton;
    if (key == "side-guide" || key == "guide" || key == "bracket") return rig_model::SlotType::SideGuideBracket;
    if (key == "wheels" || key == "caster") return rig_model::SlotType::Wheel;
    if (key == "leg" || key == "legs" || key == "support-leg" || key == "frame") return rig_model::SlotType::FrameLeg;
    return std::nullopt;
}

} // namespace rig_loaders
