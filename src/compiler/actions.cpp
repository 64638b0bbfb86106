#include "compiler/actions.hpp"

#include <algorithm>
#include <array>

namespace actions {

namespace {

constexpr std::array<ActionDef, 9> CATALOG = {{
    {"getwindowname", "output_result(w.caption);", ActionKind::Query},
    {"getwindowclassname", "output_result(w.resourceClass);", ActionKind::Query},
    {"getwindowgeometry",
     "output_result(`Window ${w.internalId}`); "
     "output_result(`  Position: ${w.x},${w.y}`); "
     "output_result(`  Geometry: ${w.width}x${w.height}`);",
     ActionKind::Query},
    {"getwindowpid", "output_result(w.pid);", ActionKind::Query},
    {"windowminimize", "w.minimized = true;", ActionKind::Mutation},
    {"windowraise", "workspace.raiseWindow(w);", ActionKind::Mutation},
    {"windowclose", "w.closeWindow();", ActionKind::Mutation},
    {"windowkill", "w.killWindow();", ActionKind::Mutation},
    {"windowactivate", "workspace.setActiveWindow(w);", ActionKind::Mutation},
}};

} // namespace

const ActionDef* find(std::string_view verb) {
    auto it = std::ranges::find(CATALOG, verb, &ActionDef::verb);
    return it != CATALOG.end() ? &*it : nullptr;
}

bool contains(std::string_view verb) {
    return find(verb) != nullptr;
}

std::span<const ActionDef> all() {
    return CATALOG;
}

} // namespace actions
