#include "wxmcp/dispatcher.hpp"
#include "wxmcp/logger.hpp"
#include "wxmcp/validator.hpp"
#include "wxmcp/version.hpp"
#include <stdexcept>

namespace wxmcp {

Dispatcher::Dispatcher(std::shared_ptr<const ToolRegistry> registry, Options opts)
    : registry_(std::move(registry)), opts_(std::move(opts)) {
    if (!registry_) {
        throw std::invalid_argument("Dispatcher requires a tool registry");
    }
    setup_handlers();
}

void Dispatcher::setup_handlers() {
    request_handlers_["initialize"] = [this](const nlohmann::json& params) {
        return handle_initialize(params);
    };

    request_handlers_["ping"] = [](const nlohmann::json&) -> Outcome {
        return nlohmann::json::object();
    };

    request_handlers_["tools/list"] = [this](const nlohmann::json&) {
        return handle_tools_list();
    };

    request_handlers_["tools/call"] = [this](const nlohmann::json& params) {
        return handle_tools_call(params);
    };

    notification_handlers_["notifications/initialized"] = [](const nlohmann::json&) {};

    // No in-flight cancellation: a cancelled call still runs to completion
    notification_handlers_["notifications/cancelled"] = [](const nlohmann::json&) {};
}

bool Dispatcher::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

Outcome Dispatcher::dispatch(const std::string& method, const nlohmann::json& params) const {
    auto it = request_handlers_.find(method);
    if (it == request_handlers_.end()) {
        return Failure{FailureKind::MethodNotFound, "Method not found: " + method, std::nullopt};
    }

    try {
        return it->second(params);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(server_logger(), "Handler for " << method << " threw: " << e.what());
        return Failure{FailureKind::InternalError, e.what(), std::nullopt};
    }
}

bool Dispatcher::notify(const std::string& method, const nlohmann::json& params) const {
    auto it = notification_handlers_.find(method);
    if (it == notification_handlers_.end()) {
        return false;
    }
    try {
        it->second(params);
    } catch (const std::exception& e) {
        // Notifications never get a reply; the failure stays in the log
        LOG4CPLUS_WARN(server_logger(), "Notification " << method << " failed: " << e.what());
    }
    return true;
}

Outcome Dispatcher::handle_initialize(const nlohmann::json& params) const {
    if (!params.is_object()) {
        return Failure{FailureKind::InvalidParams, "initialize params must be an object", std::nullopt};
    }

    if (params.contains("clientInfo") && params.at("clientInfo").is_object()) {
        const auto& client = params.at("clientInfo");
        LOG4CPLUS_DEBUG(server_logger(), "initialize from client "
                        << client.value("name", std::string("?")) << " "
                        << client.value("version", std::string("?")));
    }

    InitializeResult result;
    result.protocol_version = std::string(PROTOCOL_VERSION);
    result.server_info = opts_.server_info;
    result.instructions = opts_.instructions;

    nlohmann::json j;
    to_json(j, result);
    return j;
}

Outcome Dispatcher::handle_tools_list() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& def : registry_->list()) {
        nlohmann::json t;
        to_json(t, def);
        tools.push_back(std::move(t));
    }
    return nlohmann::json{{"tools", std::move(tools)}};
}

Outcome Dispatcher::handle_tools_call(const nlohmann::json& params) const {
    if (!params.is_object()) {
        return Failure{FailureKind::InvalidParams, "tools/call params must be an object", std::nullopt};
    }
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return Failure{FailureKind::InvalidParams, "tools/call requires a string 'name'", std::nullopt};
    }
    const std::string name = name_it->get<std::string>();

    const ToolEntry* tool = registry_->find(name);
    if (!tool) {
        return Failure{FailureKind::UnknownTool, "Unknown tool: " + name, std::nullopt};
    }

    nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
    auto checked = InputValidator::validate(tool->definition.input_schema, arguments);
    if (const auto* err = std::get_if<ValidationError>(&checked)) {
        return Failure{
            FailureKind::InvalidParams,
            err->message(),
            nlohmann::json{{"field", err->field}, {"expected", err->expected_type}}
        };
    }

    return invoke_tool(*tool, std::get<nlohmann::json>(checked));
}

Outcome Dispatcher::invoke_tool(const ToolEntry& tool, const nlohmann::json& arguments) const {
    const std::string& name = tool.definition.name;
    try {
        auto fut = tool.handler(arguments);
        if (!fut.valid()) {
            return Failure{FailureKind::InternalError, "Tool '" + name + "' returned no result", std::nullopt};
        }

        ToolResult result = fut.get();
        if (auto* failure = std::get_if<Failure>(&result)) {
            LOG4CPLUS_WARN(tools_logger(), "Tool " << name << " failed ("
                           << to_string(failure->kind) << "): " << failure->message);
            return *failure;
        }

        nlohmann::json j;
        to_json(j, std::get<CallToolResult>(result));
        return j;
    } catch (const std::exception& e) {
        LOG4CPLUS_WARN(tools_logger(), "Tool " << name << " threw: " << e.what());
        return Failure{FailureKind::ToolExecutionFailed, e.what(), std::nullopt};
    } catch (...) {
        LOG4CPLUS_ERROR(tools_logger(), "Tool " << name << " threw a non-standard exception");
        return Failure{FailureKind::InternalError, "Tool '" + name + "' failed with an unknown error", std::nullopt};
    }
}

} // namespace wxmcp
