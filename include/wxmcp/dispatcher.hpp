#pragma once
#include "outcome.hpp"
#include "tool_registry.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace wxmcp {

using RequestHandler = std::function<Outcome(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Routes a method name to its handler. Matching is exact and case-sensitive.
/// The handler table is fixed at construction, so one Dispatcher is shared by
/// every session without locking.
class Dispatcher {
public:
    struct Options {
        Implementation server_info;
        std::optional<std::string> instructions;
    };

    Dispatcher(std::shared_ptr<const ToolRegistry> registry, Options opts);

    // Handlers capture this
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Resolve a request. Never throws: handler exceptions come back as
    /// InternalError, tool exceptions as ToolExecutionFailed.
    [[nodiscard]] Outcome dispatch(const std::string& method, const nlohmann::json& params) const;

    /// Deliver a notification. Returns false when no handler knows the method.
    bool notify(const std::string& method, const nlohmann::json& params) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

    [[nodiscard]] const ToolRegistry& registry() const { return *registry_; }
    [[nodiscard]] const Options& options() const { return opts_; }

private:
    void setup_handlers();

    Outcome handle_initialize(const nlohmann::json& params) const;
    Outcome handle_tools_list() const;
    Outcome handle_tools_call(const nlohmann::json& params) const;
    Outcome invoke_tool(const ToolEntry& tool, const nlohmann::json& arguments) const;

    std::shared_ptr<const ToolRegistry> registry_;
    Options opts_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace wxmcp
