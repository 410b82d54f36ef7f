/**
 * @file program_view.cpp
 * @brief Merging program modules into an indexed whole-program view
 */

#include "stuckrank/program.hpp"

#include <format>
#include <utility>

namespace stuckrank::program {

namespace {

[[nodiscard]] std::string method_key(std::string_view class_name, std::string_view sub_signature)
{
    return std::format("{}|{}", class_name, sub_signature);
}

[[nodiscard]] bool matches(const MethodSignature& signature, const MethodQuery& query)
{
    if (signature.name != query.name) {
        return false;
    }
    if (query.return_type && *query.return_type != signature.return_type) {
        return false;
    }
    if (query.params && *query.params != signature.params) {
        return false;
    }
    return true;
}

}  // namespace

ProgramView ProgramView::build(std::span<const ProgramModule> modules)
{
    ProgramView view;
    for (const auto& module : modules) {
        for (const auto& klass : module.classes) {
            if (view.m_class_index.contains(klass.name)) {
                view.m_duplicate_classes.push_back(klass.name);
                continue;
            }
            view.add_class(klass, module.module);
        }
    }
    return view;
}

void ProgramView::add_class(const ClassRecord& record, std::string_view module)
{
    const auto class_ref = static_cast<ClassRef>(m_classes.size());
    m_class_index.emplace(record.name, class_ref);
    m_classes.push_back(ClassInfo{
        .name = record.name,
        .source_file = record.source_file.value_or(default_source_file(record.name)),
        .module = std::string(module),
        .super_class = record.super_class,
        .interfaces = record.interfaces,
        .is_interface = record.is_interface,
        .is_abstract = record.is_abstract,
        .methods = {},
    });

    for (const auto& method_record : record.methods) {
        const auto method_ref = static_cast<MethodRef>(m_methods.size());
        Method method{
            .signature = MethodSignature{.declaring_class = record.name,
                                         .name = method_record.name,
                                         .return_type = method_record.return_type,
                                         .params = method_record.params},
            .owner = class_ref,
            .is_static = method_record.is_static,
            .is_abstract = method_record.is_abstract,
            .has_body = method_record.has_body,
            .statements = {},
            .entries = {},
        };

        // Statement ids are local to the method; map them onto the arena.
        std::unordered_map<std::string_view, StmtRef> local_ids;
        const auto base = m_statements.size();
        for (std::size_t i = 0; i < method_record.stmts.size(); ++i) {
            const auto ref = static_cast<StmtRef>(base + i);
            local_ids.emplace(method_record.stmts[i].id, ref);
            method.statements.push_back(ref);
        }
        for (const auto& stmt_record : method_record.stmts) {
            Statement stmt{
                .id = stmt_record.id,
                .span = stmt_record.lines,
                .successors = {},
                .call = stmt_record.call,
                .owner = method_ref,
                .instructions = stmt_record.instructions,
                .branches = stmt_record.branches,
            };
            stmt.successors.reserve(stmt_record.succs.size());
            for (const auto& succ : stmt_record.succs) {
                stmt.successors.push_back(local_ids.at(succ));
            }
            m_statements.push_back(std::move(stmt));
        }

        if (method_record.entries.empty()) {
            if (!method.statements.empty()) {
                method.entries.push_back(method.statements.front());
            }
        } else {
            for (const auto& entry : method_record.entries) {
                method.entries.push_back(local_ids.at(entry));
            }
        }

        m_method_index.emplace(method_key(record.name, method.signature.sub_signature()), method_ref);
        m_classes[index_of(class_ref)].methods.push_back(method_ref);
        m_methods.push_back(std::move(method));
    }
}

std::optional<ClassRef> ProgramView::find_class(std::string_view name) const
{
    const auto it = m_class_index.find(std::string(name));
    if (it == m_class_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<MethodRef> ProgramView::find_declared_method(ClassRef klass,
                                                           std::string_view sub_signature) const
{
    const auto it = m_method_index.find(method_key(class_info(klass).name, sub_signature));
    if (it == m_method_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<MethodRef> ProgramView::resolve(const MethodQuery& query) const
{
    const auto klass = find_class(query.declaring_class);
    if (!klass) {
        return std::unexpected(Error::make(
            "EntryPointNotFound",
            std::format("Class '{}' of entry point {} is not loaded", query.declaring_class,
                        query.to_string())));
    }

    std::vector<MethodRef> candidates;
    for (const auto ref : class_info(*klass).methods) {
        if (matches(method(ref).signature, query)) {
            candidates.push_back(ref);
        }
    }
    if (candidates.empty()) {
        return std::unexpected(Error::make(
            "EntryPointNotFound", std::format("No method matches entry point {}", query.to_string())));
    }
    if (candidates.size() > 1U) {
        std::string overloads;
        for (const auto ref : candidates) {
            if (!overloads.empty()) {
                overloads += ", ";
            }
            overloads += method(ref).signature.to_string();
        }
        return std::unexpected(Error::make(
            "AmbiguousEntryPoint",
            std::format("Entry point {} matches {} methods: {}", query.to_string(), candidates.size(),
                        overloads)));
    }
    return candidates.front();
}

std::vector<StmtRef> ProgramView::statements_at_line(std::string_view class_name,
                                                     std::int32_t line) const
{
    std::vector<StmtRef> result;
    const auto klass = find_class(class_name);
    if (!klass) {
        return result;
    }
    for (const auto method_ref : class_info(*klass).methods) {
        for (const auto stmt_ref : method(method_ref).statements) {
            if (statement(stmt_ref).span.contains(line)) {
                result.push_back(stmt_ref);
            }
        }
    }
    return result;
}

const std::string& ProgramView::class_name_of(StmtRef ref) const
{
    return class_info(method(statement(ref).owner).owner).name;
}

}  // namespace stuckrank::program
