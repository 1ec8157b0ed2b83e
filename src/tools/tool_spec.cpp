#include "toolroute/tools/tool_spec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <regex>
#include <set>
#include <sstream>

namespace toolroute::tools {

namespace {

constexpr double kInt64Bound = 9223372036854775808.0;

const std::regex kToolNamePattern(R"(^[a-z][a-z0-9_]{0,63}$)");

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

Error descriptor_error(const std::string& message, const std::string& tool) {
    return Error{ErrorCode::PluginInvalid, message, tool.empty() ? "<unnamed>" : tool};
}

Error type_error(const ParamSpec& param, const std::string& tool) {
    return Error::with_details(
        ErrorCode::ValidationError,
        "Parameter '" + param.name + "' must be of type " +
            std::string(param_type_to_string(param.type)),
        Json{{"field", param.name},
             {"expected", std::string(param_type_to_string(param.type))},
             {"tool", tool}}
    );
}

}  // namespace

std::optional<ParamType> param_type_from_string(std::string_view name) {
    if (name == "string") return ParamType::String;
    if (name == "integer") return ParamType::Integer;
    if (name == "number") return ParamType::Number;
    if (name == "boolean") return ParamType::Boolean;
    return std::nullopt;
}

std::optional<ToolStatus> tool_status_from_string(std::string_view name) {
    if (name == "ready") return ToolStatus::Ready;
    if (name == "stub") return ToolStatus::Stub;
    if (name == "experimental") return ToolStatus::Experimental;
    return std::nullopt;
}

ResourceRole infer_resource_role(std::string_view param_name) {
    if (param_name == "path" || param_name == "source" || param_name == "destination" ||
        ends_with(param_name, "_path")) {
        return ResourceRole::Path;
    }
    if (param_name == "command") {
        return ResourceRole::Command;
    }
    return ResourceRole::None;
}

Json ParamSpec::to_json_schema() const {
    Json schema{
        {"type", std::string(param_type_to_string(type))},
        {"description", description}
    };

    if (enum_values && !enum_values->empty()) {
        schema["enum"] = *enum_values;
    }

    return schema;
}

const ParamSpec* ToolSpec::find_param(std::string_view param_name) const {
    for (const auto& param : parameters) {
        if (param.name == param_name) {
            return &param;
        }
    }
    return nullptr;
}

std::vector<std::string> ToolSpec::required_names() const {
    std::vector<std::string> names;
    for (const auto& param : parameters) {
        if (param.required) {
            names.push_back(param.name);
        }
    }
    return names;
}

bool ToolSpec::has_resource_params() const {
    return std::any_of(parameters.begin(), parameters.end(),
        [](const ParamSpec& p) { return p.resource != ResourceRole::None; });
}

Json ToolSpec::to_descriptor() const {
    Json properties = Json::object();
    for (const auto& param : parameters) {
        Json schema = param.to_json_schema();
        if (param.resource != ResourceRole::None) {
            schema["resource"] = std::string(resource_role_to_string(param.resource));
        }
        properties[param.name] = std::move(schema);
    }

    Json descriptor{
        {"name", name},
        {"status", std::string(tool_status_to_string(status))},
        {"description", description},
        {"required", required_names()},
        {"parameters", properties}
    };
    if (!keywords.empty()) {
        descriptor["keywords"] = keywords;
    }
    if (mutating) {
        descriptor["mutating"] = true;
    }
    return descriptor;
}

Json ToolSpec::to_function_format() const {
    Json properties = Json::object();
    for (const auto& param : parameters) {
        properties[param.name] = param.to_json_schema();
    }

    return Json{
        {"type", "function"},
        {"function", {
            {"name", name},
            {"description", description},
            {"parameters", {
                {"type", "object"},
                {"properties", properties},
                {"required", required_names()}
            }}
        }}
    };
}

std::string ToolSpec::compact() const {
    std::ostringstream ss;
    ss << name << "(";
    for (size_t i = 0; i < parameters.size(); ++i) {
        const auto& param = parameters[i];
        if (i > 0) ss << ", ";
        ss << param.name << (param.required ? "*" : "?") << ":" << param_type_to_string(param.type);
        if (param.enum_values) {
            ss << "[";
            for (size_t j = 0; j < param.enum_values->size(); ++j) {
                if (j > 0) ss << "|";
                ss << (*param.enum_values)[j];
            }
            ss << "]";
        }
    }
    ss << "): " << description;
    return ss.str();
}

Result<ToolSpec, Error> ToolSpec::from_descriptor(const Json& descriptor) {
    using R = Result<ToolSpec, Error>;

    if (!descriptor.is_object()) {
        return R::err(descriptor_error("Descriptor must be an object", ""));
    }

    ToolSpec spec;

    auto name_it = descriptor.find("name");
    if (name_it == descriptor.end() || !name_it->is_string()) {
        return R::err(descriptor_error("Descriptor is missing a string 'name'", ""));
    }
    spec.name = name_it->get<std::string>();
    if (!std::regex_match(spec.name, kToolNamePattern)) {
        return R::err(descriptor_error("Tool name must match [a-z][a-z0-9_]*", spec.name));
    }

    auto status_it = descriptor.find("status");
    if (status_it != descriptor.end()) {
        if (!status_it->is_string()) {
            return R::err(descriptor_error("'status' must be a string", spec.name));
        }
        auto status = tool_status_from_string(status_it->get<std::string>());
        if (!status) {
            return R::err(descriptor_error("'status' must be ready, stub or experimental", spec.name));
        }
        spec.status = *status;
    }

    auto desc_it = descriptor.find("description");
    if (desc_it == descriptor.end() || !desc_it->is_string() || desc_it->get<std::string>().empty()) {
        return R::err(descriptor_error("Descriptor needs a non-empty 'description'", spec.name));
    }
    spec.description = desc_it->get<std::string>();

    Json params = descriptor.value("parameters", Json::object());
    if (!params.is_object()) {
        return R::err(descriptor_error("'parameters' must be an object", spec.name));
    }

    std::set<std::string> required;
    if (auto req_it = descriptor.find("required"); req_it != descriptor.end()) {
        if (!req_it->is_array()) {
            return R::err(descriptor_error("'required' must be an array", spec.name));
        }
        for (const auto& r : *req_it) {
            if (!r.is_string()) {
                return R::err(descriptor_error("'required' entries must be strings", spec.name));
            }
            if (!params.contains(r.get<std::string>())) {
                return R::err(descriptor_error(
                    "Required parameter '" + r.get<std::string>() + "' is not declared", spec.name));
            }
            required.insert(r.get<std::string>());
        }
    }

    for (const auto& [pname, pdesc] : params.items()) {
        if (pname == kConfirmKey) {
            return R::err(descriptor_error("'confirm' is a reserved parameter name", spec.name));
        }
        if (!pdesc.is_object()) {
            return R::err(descriptor_error("Parameter '" + pname + "' must be an object", spec.name));
        }

        ParamSpec param;
        param.name = pname;
        param.description = pdesc.value("description", "");
        param.required = required.count(pname) > 0;

        auto type = param_type_from_string(pdesc.value("type", ""));
        if (!type) {
            return R::err(descriptor_error(
                "Parameter '" + pname + "' has an unsupported type", spec.name));
        }
        param.type = *type;

        if (auto enum_it = pdesc.find("enum"); enum_it != pdesc.end()) {
            if (!enum_it->is_array() || enum_it->empty() || param.type != ParamType::String) {
                return R::err(descriptor_error(
                    "Parameter '" + pname + "' enum must be a non-empty string array", spec.name));
            }
            std::vector<std::string> values;
            for (const auto& v : *enum_it) {
                if (!v.is_string()) {
                    return R::err(descriptor_error(
                        "Parameter '" + pname + "' enum must be a non-empty string array", spec.name));
                }
                values.push_back(v.get<std::string>());
            }
            param.enum_values = std::move(values);
        }

        if (auto role_it = pdesc.find("resource"); role_it != pdesc.end()) {
            std::string role = role_it->is_string() ? role_it->get<std::string>() : "";
            if (role == "path") {
                param.resource = ResourceRole::Path;
            } else if (role == "command") {
                param.resource = ResourceRole::Command;
            } else if (role == "none") {
                param.resource = ResourceRole::None;
            } else {
                return R::err(descriptor_error(
                    "Parameter '" + pname + "' resource must be path, command or none", spec.name));
            }
        } else {
            param.resource = infer_resource_role(pname);
        }

        if (param.resource != ResourceRole::None && param.type != ParamType::String) {
            return R::err(descriptor_error(
                "Resource parameter '" + pname + "' must be a string", spec.name));
        }

        spec.parameters.push_back(std::move(param));
    }

    if (auto kw_it = descriptor.find("keywords"); kw_it != descriptor.end() && kw_it->is_array()) {
        for (const auto& kw : *kw_it) {
            if (kw.is_string()) {
                spec.keywords.push_back(kw.get<std::string>());
            }
        }
    }

    if (auto mut_it = descriptor.find("mutating"); mut_it != descriptor.end()) {
        if (!mut_it->is_boolean()) {
            return R::err(descriptor_error("'mutating' must be a boolean", spec.name));
        }
        spec.mutating = mut_it->get<bool>();
    }

    return R::ok(std::move(spec));
}

Result<Json, Error> validate_args(const ToolSpec& spec, const Json& args) {
    using R = Result<Json, Error>;

    if (!args.is_object()) {
        return R::err(Error::with_details(
            ErrorCode::ValidationError,
            "Arguments must be an object",
            Json{{"tool", spec.name}, {"expected", "object"}}
        ));
    }

    // Check required parameters
    for (const auto& param : spec.parameters) {
        if (!param.required) continue;
        auto it = args.find(param.name);
        if (it == args.end() || it->is_null()) {
            return R::err(Error::with_details(
                ErrorCode::MissingArgument,
                "Missing required argument: " + param.name,
                Json{{"field", param.name}, {"tool", spec.name}}
            ));
        }
    }

    Json cleaned = Json::object();

    for (const auto& [key, value] : args.items()) {
        if (key == kConfirmKey) {
            if (!value.is_boolean()) {
                return R::err(Error::with_details(
                    ErrorCode::ValidationError,
                    "'confirm' must be a boolean",
                    Json{{"field", key}, {"expected", "boolean"}}
                ));
            }
            cleaned[key] = value;
            continue;
        }

        const ParamSpec* param = spec.find_param(key);
        if (!param) {
            spdlog::debug("Dropping unknown argument '{}' for tool {}", key, spec.name);
            continue;
        }

        // Optional parameters may be passed as null to mean "absent"
        if (value.is_null()) {
            continue;
        }

        switch (param->type) {
            case ParamType::String:
                if (!value.is_string()) {
                    return R::err(type_error(*param, spec.name));
                }
                break;
            case ParamType::Integer:
                if (value.is_number_float()) {
                    double d = value.get<double>();
                    // 2^63 is exact as a double; anything at or past it overflows
                    if (std::floor(d) != d || d < -kInt64Bound || d >= kInt64Bound) {
                        return R::err(type_error(*param, spec.name));
                    }
                    cleaned[key] = static_cast<int64_t>(d);
                    continue;
                }
                if (!value.is_number_integer()) {
                    return R::err(type_error(*param, spec.name));
                }
                if (value.is_number_unsigned() &&
                    value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return R::err(type_error(*param, spec.name));
                }
                break;
            case ParamType::Number:
                if (!value.is_number()) {
                    return R::err(type_error(*param, spec.name));
                }
                break;
            case ParamType::Boolean:
                if (!value.is_boolean()) {
                    return R::err(type_error(*param, spec.name));
                }
                break;
        }

        // Check enum values
        if (param->enum_values) {
            const auto& enum_vals = *param->enum_values;
            const auto& str_value = value.get_ref<const std::string&>();
            if (std::find(enum_vals.begin(), enum_vals.end(), str_value) == enum_vals.end()) {
                return R::err(Error::with_details(
                    ErrorCode::ValidationError,
                    "Invalid value for parameter: " + param->name,
                    Json{{"field", param->name}, {"expected", enum_vals}, {"tool", spec.name}}
                ));
            }
        }

        cleaned[key] = value;
    }

    return R::ok(std::move(cleaned));
}

Json strip_reserved(const Json& args) {
    Json out = args;
    if (out.is_object()) {
        out.erase(std::string(kConfirmKey));
    }
    return out;
}

}  // namespace toolroute::tools
