#include <rig_placement/binding_check.hpp>
#include <unordered_map>

namespace rig_placement {

std::vector<StaleBinding> find_stale_bindings(const std::vector<rig_model::PlacedComponent>& placed,
    const std::vector<rig_model::Slot>& slots)
{
    std::unordered_map<std::string, const rig_model::Slot*> by_id;
    for (const auto& s : slots)
        by_id[s.id] = &s;

    std::vector<StaleBinding> out;
    for (const auto& c : placed) {
        auto it = by_id.find(c.slot_id);
        if (it == by_id.end()) {
            out.push_back({ c.id, c.slot_id, StaleReason::MissingSlot });
        } else if (it->second->type != c.type) {
            out.push_back({ c.id, c.slot_id, StaleReason::TypeMismatch });
        }
    }
    return out;
}

const char* to_string(StaleReason reason) {
    switch (reason) {
    case StaleReason::MissingSlot:
        return "missing_slot";
    case StaleReason::TypeMismatch:
        return "type_mismatch";
    }
    return "missing_slot";
}

} // namespace rig_placement
