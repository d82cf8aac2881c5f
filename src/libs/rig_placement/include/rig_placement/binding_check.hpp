#pragma once

#include <rig_model/types.hpp>
#include <string>
#include <vector>

namespace rig_placement {

enum class StaleReason {
    MissingSlot,    // slot id no longer generated
    TypeMismatch    // id resolves, but to a slot of another type
};

struct StaleBinding {
    std::string component_id;
    std::string slot_id;
    StaleReason reason = StaleReason::MissingSlot;
};

// Placed components whose binding does not resolve against `slots`, in
// placement order.
std::vector<StaleBinding> find_stale_bindings(const std::vector<rig_model::PlacedComponent>& placed,
    const std::vector<rig_model::Slot>& slots);

const char* to_string(StaleReason reason);

} // namespace rig_placement
