/**
 * @file program_module.cpp
 * @brief program.v1 document parsing, structural validation and serialization
 */

#include "stuckrank/program.hpp"
#include "stuckrank/version.hpp"

#include "common/json_fields.hpp"

#include <format>
#include <unordered_set>
#include <utility>

namespace stuckrank::program {

namespace {

using common::JsonFieldContext;

[[nodiscard]] Error invalid_module(std::string message)
{
    return Error::make("InvalidModule", std::move(message));
}

[[nodiscard]] Result<MethodSignature> parse_target(const nlohmann::json& obj,
                                                   const std::string& context)
{
    auto declaring_class =
        common::require_string(JsonFieldContext{.obj = &obj, .key = "class", .context = context});
    if (!declaring_class) {
        return std::unexpected(declaring_class.error());
    }
    auto name =
        common::require_string(JsonFieldContext{.obj = &obj, .key = "name", .context = context});
    if (!name) {
        return std::unexpected(name.error());
    }
    auto return_type = common::require_string(
        JsonFieldContext{.obj = &obj, .key = "return_type", .context = context});
    if (!return_type) {
        return std::unexpected(return_type.error());
    }
    auto params = common::optional_string_array(
        JsonFieldContext{.obj = &obj, .key = "params", .context = context});
    if (!params) {
        return std::unexpected(params.error());
    }
    return MethodSignature{.declaring_class = std::move(*declaring_class),
                           .name = std::move(*name),
                           .return_type = std::move(*return_type),
                           .params = std::move(*params)};
}

[[nodiscard]] Result<LineSpan> parse_lines(const nlohmann::json& stmt, const std::string& context)
{
    if (!stmt.contains("lines")) {
        return kNoPosition;
    }
    const auto& lines = stmt.at("lines");
    if (!lines.is_array() || lines.size() != 2U || !common::fits_int32(lines.at(0))
        || !common::fits_int32(lines.at(1))) {
        return std::unexpected(Error::make(
            "InvalidFieldType", std::format("Expected [first, last] field 'lines' in {}", context)));
    }
    LineSpan span{.first = lines.at(0).get<std::int32_t>(), .last = lines.at(1).get<std::int32_t>()};
    if (span.first < 1 || span.last < span.first) {
        return std::unexpected(invalid_module(
            std::format("Invalid line span [{}, {}] in {}", span.first, span.last, context)));
    }
    return span;
}

[[nodiscard]] Result<StmtRecord> parse_stmt(const nlohmann::json& obj, const std::string& context)
{
    if (!obj.is_object()) {
        return std::unexpected(
            Error::make("InvalidFieldType", std::format("Statement must be an object in {}", context)));
    }
    StmtRecord stmt;
    auto id = common::require_string(JsonFieldContext{.obj = &obj, .key = "id", .context = context});
    if (!id) {
        return std::unexpected(id.error());
    }
    stmt.id = std::move(*id);
    const std::string stmt_context = std::format("{}/{}", context, stmt.id);

    auto lines = parse_lines(obj, stmt_context);
    if (!lines) {
        return std::unexpected(lines.error());
    }
    stmt.lines = *lines;

    auto succs = common::optional_string_array(
        JsonFieldContext{.obj = &obj, .key = "succs", .context = stmt_context});
    if (!succs) {
        return std::unexpected(succs.error());
    }
    stmt.succs = std::move(*succs);

    if (obj.contains("call")) {
        auto call_obj = common::require_object(
            JsonFieldContext{.obj = &obj, .key = "call", .context = stmt_context});
        if (!call_obj) {
            return std::unexpected(call_obj.error());
        }
        auto kind_text = common::require_string(
            JsonFieldContext{.obj = *call_obj, .key = "kind", .context = stmt_context + ".call"});
        if (!kind_text) {
            return std::unexpected(kind_text.error());
        }
        auto kind = parse_call_kind(*kind_text);
        if (!kind) {
            return std::unexpected(kind.error());
        }
        auto target_obj = common::require_object(
            JsonFieldContext{.obj = *call_obj, .key = "target", .context = stmt_context + ".call"});
        if (!target_obj) {
            return std::unexpected(target_obj.error());
        }
        auto target = parse_target(**target_obj, stmt_context + ".call.target");
        if (!target) {
            return std::unexpected(target.error());
        }
        stmt.call = CallRecord{.kind = *kind, .target = std::move(*target)};
    }

    auto instructions = common::optional_int(
        JsonFieldContext{.obj = &obj, .key = "instructions", .context = stmt_context});
    if (!instructions) {
        return std::unexpected(instructions.error());
    }
    auto branches = common::optional_int(
        JsonFieldContext{.obj = &obj, .key = "branches", .context = stmt_context});
    if (!branches) {
        return std::unexpected(branches.error());
    }
    stmt.instructions = instructions->value_or(1);
    stmt.branches = branches->value_or(0);
    if (stmt.instructions < 0 || stmt.branches < 0) {
        return std::unexpected(
            invalid_module(std::format("Negative instruction or branch count in {}", stmt_context)));
    }
    return stmt;
}

/// Ids unique; successors and entries reference statements of the same method.
[[nodiscard]] VoidResult check_method_structure(const MethodRecord& method,
                                                const std::string& context)
{
    std::unordered_set<std::string> ids;
    for (const auto& stmt : method.stmts) {
        if (!ids.insert(stmt.id).second) {
            return std::unexpected(
                invalid_module(std::format("Duplicate statement id '{}' in {}", stmt.id, context)));
        }
    }
    for (const auto& stmt : method.stmts) {
        for (const auto& succ : stmt.succs) {
            if (!ids.contains(succ)) {
                return std::unexpected(invalid_module(std::format(
                    "Statement '{}' in {} has unknown successor '{}'", stmt.id, context, succ)));
            }
        }
    }
    for (const auto& entry : method.entries) {
        if (!ids.contains(entry)) {
            return std::unexpected(
                invalid_module(std::format("Unknown entry statement '{}' in {}", entry, context)));
        }
    }
    if (!method.has_body && !method.stmts.empty()) {
        return std::unexpected(
            invalid_module(std::format("Method without body has statements in {}", context)));
    }
    return {};
}

[[nodiscard]] Result<MethodRecord> parse_method(const nlohmann::json& obj,
                                                const std::string& class_context)
{
    if (!obj.is_object()) {
        return std::unexpected(Error::make(
            "InvalidFieldType", std::format("Method must be an object in {}", class_context)));
    }
    MethodRecord method;
    auto name =
        common::require_string(JsonFieldContext{.obj = &obj, .key = "name", .context = class_context});
    if (!name) {
        return std::unexpected(name.error());
    }
    method.name = std::move(*name);
    const std::string context = std::format("{}.{}", class_context, method.name);

    auto return_type = common::require_string(
        JsonFieldContext{.obj = &obj, .key = "return_type", .context = context});
    if (!return_type) {
        return std::unexpected(return_type.error());
    }
    method.return_type = std::move(*return_type);

    auto params =
        common::optional_string_array(JsonFieldContext{.obj = &obj, .key = "params", .context = context});
    if (!params) {
        return std::unexpected(params.error());
    }
    method.params = std::move(*params);

    auto is_static =
        common::optional_bool(JsonFieldContext{.obj = &obj, .key = "is_static", .context = context}, false);
    auto is_abstract = common::optional_bool(
        JsonFieldContext{.obj = &obj, .key = "is_abstract", .context = context}, false);
    if (!is_static || !is_abstract) {
        return std::unexpected(!is_static ? is_static.error() : is_abstract.error());
    }
    method.is_static = *is_static;
    method.is_abstract = *is_abstract;

    auto has_body = common::optional_bool(
        JsonFieldContext{.obj = &obj, .key = "has_body", .context = context}, !method.is_abstract);
    if (!has_body) {
        return std::unexpected(has_body.error());
    }
    method.has_body = *has_body;

    auto entries =
        common::optional_string_array(JsonFieldContext{.obj = &obj, .key = "entries", .context = context});
    if (!entries) {
        return std::unexpected(entries.error());
    }
    method.entries = std::move(*entries);

    if (obj.contains("stmts")) {
        auto stmts =
            common::require_array(JsonFieldContext{.obj = &obj, .key = "stmts", .context = context});
        if (!stmts) {
            return std::unexpected(stmts.error());
        }
        method.stmts.reserve((*stmts)->size());
        for (const auto& entry : **stmts) {
            auto stmt = parse_stmt(entry, context);
            if (!stmt) {
                return std::unexpected(stmt.error());
            }
            method.stmts.push_back(std::move(*stmt));
        }
    }

    if (auto check = check_method_structure(method, context); !check) {
        return std::unexpected(check.error());
    }
    return method;
}

[[nodiscard]] Result<ClassRecord> parse_class(const nlohmann::json& obj, std::string_view module)
{
    const std::string module_context = std::format("module {}", module);
    if (!obj.is_object()) {
        return std::unexpected(Error::make(
            "InvalidFieldType", std::format("Class entry must be an object in {}", module_context)));
    }
    ClassRecord klass;
    auto name =
        common::require_string(JsonFieldContext{.obj = &obj, .key = "name", .context = module_context});
    if (!name) {
        return std::unexpected(name.error());
    }
    klass.name = std::move(*name);
    const std::string& context = klass.name;

    auto source_file =
        common::optional_string(JsonFieldContext{.obj = &obj, .key = "source_file", .context = context});
    if (!source_file) {
        return std::unexpected(source_file.error());
    }
    klass.source_file = std::move(*source_file);

    auto super_class =
        common::optional_string(JsonFieldContext{.obj = &obj, .key = "super_class", .context = context});
    if (!super_class) {
        return std::unexpected(super_class.error());
    }
    klass.super_class = std::move(*super_class);

    auto interfaces = common::optional_string_array(
        JsonFieldContext{.obj = &obj, .key = "interfaces", .context = context});
    if (!interfaces) {
        return std::unexpected(interfaces.error());
    }
    klass.interfaces = std::move(*interfaces);

    auto is_interface = common::optional_bool(
        JsonFieldContext{.obj = &obj, .key = "is_interface", .context = context}, false);
    auto is_abstract = common::optional_bool(
        JsonFieldContext{.obj = &obj, .key = "is_abstract", .context = context}, false);
    if (!is_interface || !is_abstract) {
        return std::unexpected(!is_interface ? is_interface.error() : is_abstract.error());
    }
    klass.is_interface = *is_interface;
    klass.is_abstract = *is_abstract;

    if (obj.contains("methods")) {
        auto methods =
            common::require_array(JsonFieldContext{.obj = &obj, .key = "methods", .context = context});
        if (!methods) {
            return std::unexpected(methods.error());
        }
        std::unordered_set<std::string> sub_signatures;
        for (const auto& entry : **methods) {
            auto method = parse_method(entry, context);
            if (!method) {
                return std::unexpected(method.error());
            }
            auto sub_signature =
                make_sub_signature(method->return_type, method->name, method->params);
            if (!sub_signatures.insert(sub_signature).second) {
                return std::unexpected(invalid_module(
                    std::format("Duplicate method '{}' in {}", sub_signature, context)));
            }
            klass.methods.push_back(std::move(*method));
        }
    }
    return klass;
}

}  // namespace

std::string default_source_file(std::string_view class_fqn)
{
    std::string_view simple = class_fqn;
    if (const auto dot = simple.rfind('.'); dot != std::string_view::npos) {
        simple = simple.substr(dot + 1);
    }
    if (const auto dollar = simple.find('$'); dollar != std::string_view::npos) {
        simple = simple.substr(0, dollar);
    }
    return std::string(simple) + ".java";
}

Result<ProgramModule> parse_program_module(const nlohmann::json& doc)
{
    if (!doc.is_object()) {
        return std::unexpected(Error::make("InvalidFieldType", "Program module must be an object"));
    }
    auto schema_version = common::require_string(
        JsonFieldContext{.obj = &doc, .key = "schema_version", .context = "program module"});
    if (!schema_version) {
        return std::unexpected(schema_version.error());
    }
    if (*schema_version != kProgramSchemaVersion) {
        return std::unexpected(invalid_module(std::format(
            "Unsupported schema_version '{}' (expected {})", *schema_version, kProgramSchemaVersion)));
    }
    auto module_name = common::require_string(
        JsonFieldContext{.obj = &doc, .key = "module", .context = "program module"});
    if (!module_name) {
        return std::unexpected(module_name.error());
    }
    auto classes = common::require_array(
        JsonFieldContext{.obj = &doc, .key = "classes", .context = "program module"});
    if (!classes) {
        return std::unexpected(classes.error());
    }

    ProgramModule module{.schema_version = std::move(*schema_version),
                         .module = std::move(*module_name),
                         .classes = {}};
    std::unordered_set<std::string> class_names;
    for (const auto& entry : **classes) {
        auto klass = parse_class(entry, module.module);
        if (!klass) {
            return std::unexpected(klass.error());
        }
        if (!class_names.insert(klass->name).second) {
            return std::unexpected(invalid_module(
                std::format("Class '{}' defined twice in module {}", klass->name, module.module)));
        }
        module.classes.push_back(std::move(*klass));
    }
    return module;
}

void to_json(nlohmann::json& j, const MethodSignature& signature)
{
    j = nlohmann::json{
        {      "class", signature.declaring_class},
        {       "name",            signature.name},
        {"return_type",     signature.return_type},
        {     "params",          signature.params}
    };
}

void to_json(nlohmann::json& j, const StmtRecord& stmt)
{
    j = nlohmann::json{
        {"id", stmt.id}
    };
    if (stmt.lines.has_position()) {
        j["lines"] = nlohmann::json::array({stmt.lines.first, stmt.lines.last});
    }
    if (!stmt.succs.empty()) {
        j["succs"] = stmt.succs;
    }
    if (stmt.call) {
        j["call"] = nlohmann::json{
            {  "kind", std::string(to_string(stmt.call->kind))},
            {"target",                      stmt.call->target}
        };
    }
    j["instructions"] = stmt.instructions;
    if (stmt.branches != 0) {
        j["branches"] = stmt.branches;
    }
}

void to_json(nlohmann::json& j, const MethodRecord& method)
{
    j = nlohmann::json{
        {       "name",        method.name},
        {"return_type", method.return_type},
        {     "params",      method.params},
        {  "is_static",   method.is_static},
        {"is_abstract", method.is_abstract},
        {   "has_body",    method.has_body},
        {      "stmts",       method.stmts}
    };
    if (!method.entries.empty()) {
        j["entries"] = method.entries;
    }
}

void to_json(nlohmann::json& j, const ClassRecord& klass)
{
    j = nlohmann::json{
        {        "name",         klass.name},
        {  "interfaces",   klass.interfaces},
        {"is_interface", klass.is_interface},
        { "is_abstract",  klass.is_abstract},
        {     "methods",      klass.methods}
    };
    if (klass.source_file) {
        j["source_file"] = *klass.source_file;
    }
    if (klass.super_class) {
        j["super_class"] = *klass.super_class;
    }
}

void to_json(nlohmann::json& j, const ProgramModule& module)
{
    j = nlohmann::json{
        {"schema_version", module.schema_version},
        {        "module",         module.module},
        {       "classes",        module.classes}
    };
}

}  // namespace stuckrank::program
