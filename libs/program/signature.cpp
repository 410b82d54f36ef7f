/**
 * @file signature.cpp
 * @brief Method signatures and entry-point query parsing
 */

#include "stuckrank/program.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace stuckrank::program {

namespace {

[[nodiscard]] std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

[[nodiscard]] std::string join_params(std::span<const std::string> params)
{
    std::string joined;
    for (const auto& param : params) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += param;
    }
    return joined;
}

[[nodiscard]] Error invalid_entry(std::string_view text, std::string_view reason)
{
    return Error::make("InvalidEntryPoint",
                       std::format("Invalid entry point '{}': {}", text, reason));
}

[[nodiscard]] bool is_identifier(std::string_view text)
{
    if (text.empty()) {
        return false;
    }
    return std::ranges::none_of(text, [](char c) {
        return c == ' ' || c == '\t' || c == '(' || c == ')' || c == ',' || c == ':' || c == '<'
               || c == '>';
    });
}

/// "a, b ,c" -> {"a","b","c"}; "" -> {}
[[nodiscard]] Result<std::vector<std::string>> split_params(std::string_view text,
                                                            std::string_view original)
{
    std::vector<std::string> params;
    const std::string_view body = trim(text);
    if (body.empty()) {
        return params;
    }
    for (auto part : body | std::views::split(',')) {
        const std::string_view param = trim(std::string_view(part.begin(), part.end()));
        if (!is_identifier(param)) {
            return std::unexpected(invalid_entry(original, "malformed parameter list"));
        }
        params.emplace_back(param);
    }
    return params;
}

struct NameAndParams
{
    std::string_view head;
    std::optional<std::vector<std::string>> params;
};

[[nodiscard]] Result<NameAndParams> split_head_and_params(std::string_view text,
                                                          std::string_view original)
{
    const auto open = text.find('(');
    if (open == std::string_view::npos) {
        return NameAndParams{.head = trim(text), .params = std::nullopt};
    }
    if (text.back() != ')' || text.find('(', open + 1) != std::string_view::npos) {
        return std::unexpected(invalid_entry(original, "unbalanced parentheses"));
    }
    auto params = split_params(text.substr(open + 1, text.size() - open - 2), original);
    if (!params) {
        return std::unexpected(params.error());
    }
    return NameAndParams{.head = trim(text.substr(0, open)), .params = std::move(*params)};
}

/// "<com.Foo: void fuzz(byte[])>"
[[nodiscard]] Result<MethodQuery> parse_full_signature(std::string_view text)
{
    const std::string_view inner = trim(text.substr(1, text.size() - 2));
    const auto colon = inner.find(':');
    if (colon == std::string_view::npos) {
        return std::unexpected(invalid_entry(text, "expected '<class: ret name(params)>'"));
    }
    const std::string_view class_name = trim(inner.substr(0, colon));
    const std::string_view rest = trim(inner.substr(colon + 1));

    auto split = split_head_and_params(rest, text);
    if (!split) {
        return std::unexpected(split.error());
    }
    if (!split->params) {
        return std::unexpected(invalid_entry(text, "missing parameter list"));
    }
    const auto space = split->head.rfind(' ');
    if (space == std::string_view::npos) {
        return std::unexpected(invalid_entry(text, "missing return type"));
    }
    const std::string_view return_type = trim(split->head.substr(0, space));
    const std::string_view name = trim(split->head.substr(space + 1));
    if (!is_identifier(class_name) || !is_identifier(return_type) || !is_identifier(name)) {
        return std::unexpected(invalid_entry(text, "malformed signature"));
    }
    return MethodQuery{.declaring_class = std::string(class_name),
                       .name = std::string(name),
                       .return_type = std::string(return_type),
                       .params = std::move(split->params)};
}

}  // namespace

std::string_view to_string(CallKind kind) noexcept
{
    switch (kind) {
        case CallKind::kStatic:
            return "static";
        case CallKind::kSpecial:
            return "special";
        case CallKind::kVirtual:
            return "virtual";
        case CallKind::kInterface:
            return "interface";
        case CallKind::kDynamic:
            return "dynamic";
    }
    return "static";
}

Result<CallKind> parse_call_kind(std::string_view text)
{
    if (text == "static") {
        return CallKind::kStatic;
    }
    if (text == "special") {
        return CallKind::kSpecial;
    }
    if (text == "virtual") {
        return CallKind::kVirtual;
    }
    if (text == "interface") {
        return CallKind::kInterface;
    }
    if (text == "dynamic") {
        return CallKind::kDynamic;
    }
    return std::unexpected(
        Error::make("InvalidFieldType", std::format("Unknown call kind: {}", text)));
}

std::string make_sub_signature(std::string_view return_type,
                               std::string_view name,
                               std::span<const std::string> params)
{
    return std::format("{} {}({})", return_type, name, join_params(params));
}

std::string MethodSignature::sub_signature() const
{
    return make_sub_signature(return_type, name, params);
}

std::string MethodSignature::to_string() const
{
    return std::format("<{}: {}>", declaring_class, sub_signature());
}

std::string MethodQuery::to_string() const
{
    std::string text = declaring_class + "." + name;
    if (params) {
        text += "(" + join_params(*params) + ")";
    }
    if (return_type) {
        text = *return_type + " " + text;
    }
    return text;
}

Result<MethodQuery> parse_method_query(std::string_view text)
{
    const std::string_view input = trim(text);
    if (input.empty()) {
        return std::unexpected(invalid_entry(text, "empty signature"));
    }
    if (input.front() == '<') {
        if (input.back() != '>') {
            return std::unexpected(invalid_entry(text, "unterminated '<'"));
        }
        return parse_full_signature(input);
    }

    auto split = split_head_and_params(input, text);
    if (!split) {
        return std::unexpected(split.error());
    }
    const auto dot = split->head.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == split->head.size()) {
        return std::unexpected(invalid_entry(text, "expected com.example.Class.method"));
    }
    const std::string_view class_name = split->head.substr(0, dot);
    const std::string_view name = split->head.substr(dot + 1);
    if (!is_identifier(class_name) || !is_identifier(name)) {
        return std::unexpected(invalid_entry(text, "malformed class or method name"));
    }
    return MethodQuery{.declaring_class = std::string(class_name),
                       .name = std::string(name),
                       .return_type = std::nullopt,
                       .params = std::move(split->params)};
}

}  // namespace stuckrank::program
