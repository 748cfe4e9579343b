#pragma once
#include "outcome.hpp"
#include "types.hpp"
#include <functional>
#include <future>
#include <string>
#include <unordered_map>
#include <vector>

namespace wxmcp {

/// Tool body. Runs asynchronously; the returned future is the only point
/// where a session waits.
using ToolHandler = std::function<std::future<ToolResult>(const nlohmann::json& arguments)>;

struct ToolEntry {
    ToolDefinition definition;
    ToolHandler handler;
};

/// Tools by name, listed in registration order.
/// Populated at startup and shared read-only afterwards, so it carries no lock.
class ToolRegistry {
public:
    /// Throws std::invalid_argument on an empty or duplicate name, a missing
    /// handler, or a schema the input validator cannot check.
    void add(ToolDefinition def, ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDefinition>& list() const noexcept { return definitions_; }

    /// nullptr when no tool has that name.
    [[nodiscard]] const ToolEntry* find(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] size_t size() const noexcept { return definitions_.size(); }

private:
    std::vector<ToolDefinition> definitions_;
    std::unordered_map<std::string, ToolEntry> entries_;
};

} // namespace wxmcp
