#include "wxmcp/codec.hpp"
#include "wxmcp/error.hpp"
#include "wxmcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace wxmcp {

namespace {

using simdjson::ondemand::json_type;

// One parser per session worker; simdjson parsers reuse their buffers
simdjson::ondemand::parser& frame_parser() {
    thread_local simdjson::ondemand::parser parser;
    return parser;
}

[[noreturn]] void reject(const std::string& what) {
    throw McpParseError(what);
}

nlohmann::json read_value(simdjson::ondemand::value val);

nlohmann::json read_number(simdjson::ondemand::value val) {
    // Request ids are compared as integers, so keep integral numbers integral
    int64_t as_signed = 0;
    if (val.get_int64().get(as_signed) == simdjson::SUCCESS) return as_signed;
    uint64_t as_unsigned = 0;
    if (val.get_uint64().get(as_unsigned) == simdjson::SUCCESS) return as_unsigned;
    double as_double = 0.0;
    if (auto err = val.get_double().get(as_double)) {
        reject(std::string("Unreadable number: ") + simdjson::error_message(err));
    }
    return as_double;
}

nlohmann::json read_object(simdjson::ondemand::object obj) {
    nlohmann::json out = nlohmann::json::object();
    for (auto field : obj) {
        std::string key(std::string_view(field.unescaped_key()));
        out[key] = read_value(field.value());
    }
    return out;
}

nlohmann::json read_array(simdjson::ondemand::array arr) {
    nlohmann::json out = nlohmann::json::array();
    for (auto elem : arr) {
        out.push_back(read_value(elem.value()));
    }
    return out;
}

nlohmann::json read_value(simdjson::ondemand::value val) {
    switch (val.type()) {
        case json_type::object:  return read_object(val.get_object());
        case json_type::array:   return read_array(val.get_array());
        case json_type::string:  return std::string(std::string_view(val.get_string()));
        case json_type::number:  return read_number(val);
        case json_type::boolean: return bool(val.get_bool());
        case json_type::null:    return nullptr;
    }
    return nullptr;
}

void require_version(const nlohmann::json& frame) {
    auto it = frame.find("jsonrpc");
    if (it == frame.end()) reject("Missing 'jsonrpc' field");
    if (!it->is_string() || it->get_ref<const std::string&>() != JSONRPC_VERSION) {
        reject("Invalid jsonrpc version, expected '2.0'");
    }
}

std::optional<nlohmann::json> params_of(const nlohmann::json& frame) {
    auto it = frame.find("params");
    if (it == frame.end()) return std::nullopt;
    return *it;
}

} // anonymous namespace

FrameShape Codec::shape_of(const nlohmann::json& frame) {
    if (!frame.is_object()) return FrameShape::Unknown;
    const bool has_id = frame.contains("id");
    if (frame.contains("method")) {
        return has_id ? FrameShape::Request : FrameShape::Notification;
    }
    if (has_id && (frame.contains("result") || frame.contains("error"))) {
        return FrameShape::Response;
    }
    return FrameShape::Unknown;
}

nlohmann::json Codec::decode(std::string_view raw) {
    if (raw.empty()) reject("Empty input");

    simdjson::padded_string padded(raw.data(), raw.size());
    simdjson::ondemand::document doc;
    if (auto err = frame_parser().iterate(padded).get(doc)) {
        reject(std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    json_type top;
    if (auto err = doc.type().get(top)) {
        reject(std::string("JSON parse error: ") + simdjson::error_message(err));
    }
    if (top == json_type::array) reject("Batch messages are not supported");
    if (top != json_type::object) reject("Message must be a JSON object");

    nlohmann::json frame;
    try {
        frame = read_object(doc.get_object());
    } catch (const simdjson::simdjson_error& e) {
        reject(std::string("JSON parse error: ") + e.what());
    }
    if (!doc.at_end()) reject("Trailing content after JSON document");
    return frame;
}

JsonRpcMessage Codec::to_message(const nlohmann::json& frame) {
    require_version(frame);

    auto method = frame.find("method");
    if (method != frame.end() && !method->is_string()) {
        reject("'method' must be a string");
    }

    switch (shape_of(frame)) {
        case FrameShape::Request: {
            auto id = id_from_json(frame.at("id"));
            if (!id) reject("Request ID must not be null");
            JsonRpcRequest req;
            req.id = std::move(*id);
            req.method = method->get<std::string>();
            req.params = params_of(frame);
            return req;
        }
        case FrameShape::Notification: {
            JsonRpcNotification notif;
            notif.method = method->get<std::string>();
            notif.params = params_of(frame);
            return notif;
        }
        case FrameShape::Response: {
            JsonRpcResponse resp;
            from_json(frame, resp);
            return resp;
        }
        case FrameShape::Unknown:
            break;
    }
    reject("Cannot determine message type: missing 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    const nlohmann::json frame = decode(raw);
    try {
        return to_message(frame);
    } catch (const McpParseError&) {
        throw;
    } catch (const nlohmann::json::exception& e) {
        // Ids of the wrong type, malformed error objects
        throw McpParseError(std::string("Invalid message: ") + e.what());
    }
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace wxmcp
