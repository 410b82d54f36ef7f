/**
 * @file class_hierarchy.cpp
 * @brief Class hierarchy queries and CHA dispatch
 */

#include "stuckrank/callgraph.hpp"

#include <algorithm>
#include <deque>

namespace stuckrank::callgraph {

ClassHierarchy::ClassHierarchy(const program::ProgramView& view)
    : m_view(&view)
    , m_superclass(view.class_count())
    , m_interfaces(view.class_count())
    , m_subtypes(view.class_count())
{
    for (std::size_t i = 0; i < view.class_count(); ++i) {
        const auto ref = static_cast<ClassRef>(i);
        const auto& info = view.class_info(ref);
        if (info.super_class) {
            if (auto super = view.find_class(*info.super_class)) {
                m_superclass[i] = *super;
                m_subtypes[index_of(*super)].push_back(ref);
            }
        }
        for (const auto& name : info.interfaces) {
            if (auto iface = view.find_class(name)) {
                m_interfaces[i].push_back(*iface);
                m_subtypes[index_of(*iface)].push_back(ref);
            }
        }
    }
}

std::optional<ClassRef> ClassHierarchy::superclass_of(ClassRef klass) const
{
    return m_superclass[index_of(klass)];
}

const std::vector<ClassRef>& ClassHierarchy::interfaces_of(ClassRef klass) const
{
    return m_interfaces[index_of(klass)];
}

const std::vector<ClassRef>& ClassHierarchy::direct_subtypes_of(ClassRef klass) const
{
    return m_subtypes[index_of(klass)];
}

std::vector<ClassRef> ClassHierarchy::subtype_closure(ClassRef klass) const
{
    std::vector<bool> seen(m_subtypes.size(), false);
    std::deque<ClassRef> queue{klass};
    seen[index_of(klass)] = true;
    std::vector<ClassRef> result;
    while (!queue.empty()) {
        const auto current = queue.front();
        queue.pop_front();
        result.push_back(current);
        for (const auto sub : m_subtypes[index_of(current)]) {
            if (!seen[index_of(sub)]) {
                seen[index_of(sub)] = true;
                queue.push_back(sub);
            }
        }
    }
    std::ranges::sort(result);
    return result;
}

std::optional<MethodRef> ClassHierarchy::find_in_superclasses(ClassRef klass,
                                                              std::string_view sub_signature,
                                                              bool concrete_only) const
{
    // A malformed hierarchy may contain a superclass cycle; stop after
    // visiting every class once.
    std::size_t steps = 0;
    for (std::optional<ClassRef> current = klass; current && steps <= m_superclass.size();
         current = m_superclass[index_of(*current)], ++steps) {
        if (auto method = m_view->find_declared_method(*current, sub_signature)) {
            const auto& info = m_view->method(*method);
            if (!concrete_only || (info.has_body && !info.is_abstract)) {
                return method;
            }
        }
    }
    return std::nullopt;
}

std::optional<MethodRef> ClassHierarchy::find_default_method(ClassRef klass,
                                                             std::string_view sub_signature) const
{
    std::vector<bool> seen(m_superclass.size(), false);
    std::deque<ClassRef> queue;
    std::size_t steps = 0;
    for (std::optional<ClassRef> current = klass; current && steps <= m_superclass.size();
         current = m_superclass[index_of(*current)], ++steps) {
        for (const auto iface : m_interfaces[index_of(*current)]) {
            if (!seen[index_of(iface)]) {
                seen[index_of(iface)] = true;
                queue.push_back(iface);
            }
        }
    }
    while (!queue.empty()) {
        const auto iface = queue.front();
        queue.pop_front();
        if (auto method = m_view->find_declared_method(iface, sub_signature)) {
            const auto& info = m_view->method(*method);
            if (info.has_body && !info.is_abstract && !info.is_static) {
                return method;
            }
        }
        for (const auto parent : m_interfaces[index_of(iface)]) {
            if (!seen[index_of(parent)]) {
                seen[index_of(parent)] = true;
                queue.push_back(parent);
            }
        }
    }
    return std::nullopt;
}

std::optional<MethodRef> ClassHierarchy::dispatch(ClassRef klass,
                                                  std::string_view sub_signature) const
{
    if (auto method = find_in_superclasses(klass, sub_signature, true)) {
        return method;
    }
    return find_default_method(klass, sub_signature);
}

std::optional<MethodRef> ClassHierarchy::concrete_declared_method(ClassRef klass,
                                                                  std::string_view sub_signature) const
{
    auto method = m_view->find_declared_method(klass, sub_signature);
    if (!method) {
        return std::nullopt;
    }
    const auto& info = m_view->method(*method);
    if (!info.has_body || info.is_abstract) {
        return std::nullopt;
    }
    return method;
}

std::vector<MethodRef> ClassHierarchy::resolve_virtual(ClassRef static_type,
                                                       std::string_view sub_signature) const
{
    std::vector<MethodRef> targets;
    // The static type's own implementation, inherited or default.
    if (auto method = dispatch(static_type, sub_signature)) {
        targets.push_back(*method);
    }
    for (const auto klass : subtype_closure(static_type)) {
        if (auto declared = concrete_declared_method(klass, sub_signature)) {
            targets.push_back(*declared);
        }
        const auto& info = m_view->class_info(klass);
        if (info.is_interface || info.is_abstract) {
            continue;
        }
        if (auto method = dispatch(klass, sub_signature)) {
            targets.push_back(*method);
        }
    }
    std::ranges::sort(targets);
    const auto [first, last] = std::ranges::unique(targets);
    targets.erase(first, last);
    return targets;
}

}  // namespace stuckrank::callgraph
