#include "wxmcp/tool_registry.hpp"
#include "wxmcp/validator.hpp"
#include <stdexcept>

namespace wxmcp {

void ToolRegistry::add(ToolDefinition def, ToolHandler handler) {
    if (def.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool '" + def.name + "' has no handler");
    }
    if (entries_.count(def.name) > 0) {
        throw std::invalid_argument("Tool already registered: " + def.name);
    }
    if (!InputValidator::is_supported(def.input_schema)) {
        throw std::invalid_argument("Tool '" + def.name + "' declares an unsupported input schema");
    }

    std::string name = def.name;
    definitions_.push_back(def);
    entries_.emplace(std::move(name), ToolEntry{std::move(def), std::move(handler)});
}

const ToolEntry* ToolRegistry::find(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

bool ToolRegistry::contains(const std::string& name) const {
    return entries_.count(name) > 0;
}

} // namespace wxmcp
