#pragma once

/**
 * @file program.hpp
 * @brief Program representation consumed by the call graph and ICFG
 *
 * Two layers:
 * - Module records (ProgramModule and friends) mirror the on-disk program.v1
 *   document produced for each analyzed binary.
 * - ProgramView merges modules into arenas of classes, methods and
 *   statements addressed by ClassRef / MethodRef / StmtRef.
 */

#include "stuckrank/common.hpp"
#include "stuckrank/diagnostics.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace stuckrank::program {

// ============================================================================
// Signatures
// ============================================================================

enum class CallKind {
    kStatic,     ///< invokestatic
    kSpecial,    ///< constructors, private and super calls
    kVirtual,    ///< invokevirtual
    kInterface,  ///< invokeinterface
    kDynamic     ///< invokedynamic / reflective; never resolved
};

[[nodiscard]] std::string_view to_string(CallKind kind) noexcept;
[[nodiscard]] Result<CallKind> parse_call_kind(std::string_view text);

struct MethodSignature
{
    std::string declaring_class;
    std::string name;
    std::string return_type;
    std::vector<std::string> params;

    /// "ret name(p1,p2)"; the dispatch key used by class hierarchy analysis
    [[nodiscard]] std::string sub_signature() const;

    /// "<declaring_class: ret name(p1,p2)>"
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const MethodSignature&, const MethodSignature&) = default;
};

[[nodiscard]] std::string make_sub_signature(std::string_view return_type,
                                             std::string_view name,
                                             std::span<const std::string> params);

/**
 * @brief Entry-point query; unset parts match anything
 */
struct MethodQuery
{
    std::string declaring_class;
    std::string name;
    std::optional<std::string> return_type;
    std::optional<std::vector<std::string>> params;

    [[nodiscard]] std::string to_string() const;
};

/**
 * Parse an entry-point specification.
 *
 * Accepted forms:
 *   "<com.example.Foo: void fuzz(byte[])>"   full signature
 *   "com.example.Foo.fuzz(byte[])"           parameter list, any return type
 *   "com.example.Foo.fuzz"                   name only
 */
[[nodiscard]] Result<MethodQuery> parse_method_query(std::string_view text);

// ============================================================================
// Module records (program.v1)
// ============================================================================

struct LineSpan
{
    std::int32_t first = 0;
    std::int32_t last = 0;

    [[nodiscard]] bool has_position() const noexcept { return first > 0 && last >= first; }
    [[nodiscard]] bool contains(std::int32_t line) const noexcept
    {
        return has_position() && line >= first && line <= last;
    }
};

/// Span of a statement without source position information.
inline constexpr LineSpan kNoPosition{};

struct CallRecord
{
    CallKind kind = CallKind::kStatic;
    MethodSignature target;
};

struct StmtRecord
{
    std::string id;
    LineSpan lines;
    std::vector<std::string> succs;
    std::optional<CallRecord> call;
    std::int32_t instructions = 1;
    std::int32_t branches = 0;
};

struct MethodRecord
{
    std::string name;
    std::string return_type;
    std::vector<std::string> params;
    bool is_static = false;
    bool is_abstract = false;
    bool has_body = true;
    std::vector<StmtRecord> stmts;
    std::vector<std::string> entries;  ///< empty: first statement
};

struct ClassRecord
{
    std::string name;
    std::optional<std::string> source_file;
    std::optional<std::string> super_class;
    std::vector<std::string> interfaces;
    bool is_interface = false;
    bool is_abstract = false;
    std::vector<MethodRecord> methods;
};

struct ProgramModule
{
    std::string schema_version;
    std::string module;
    std::vector<ClassRecord> classes;
};

/**
 * Parse and structurally validate a program.v1 document.
 * Fails with MissingField / InvalidFieldType / InvalidModule.
 */
[[nodiscard]] Result<ProgramModule> parse_program_module(const nlohmann::json& doc);

void to_json(nlohmann::json& j, const MethodSignature& signature);
void to_json(nlohmann::json& j, const StmtRecord& stmt);
void to_json(nlohmann::json& j, const MethodRecord& method);
void to_json(nlohmann::json& j, const ClassRecord& klass);
void to_json(nlohmann::json& j, const ProgramModule& module);

/// "Foo.java" for "com.example.Foo" and "com.example.Foo$Inner"
[[nodiscard]] std::string default_source_file(std::string_view class_fqn);

// ============================================================================
// ProgramView
// ============================================================================

struct Statement
{
    std::string id;
    LineSpan span;
    std::vector<StmtRef> successors;
    std::optional<CallRecord> call;
    MethodRef owner{};
    std::int32_t instructions = 0;
    std::int32_t branches = 0;
};

struct Method
{
    MethodSignature signature;
    ClassRef owner{};
    bool is_static = false;
    bool is_abstract = false;
    bool has_body = true;
    std::vector<StmtRef> statements;
    std::vector<StmtRef> entries;
};

struct ClassInfo
{
    std::string name;
    std::string source_file;
    std::string module;
    std::optional<std::string> super_class;
    std::vector<std::string> interfaces;
    bool is_interface = false;
    bool is_abstract = false;
    std::vector<MethodRef> methods;
};

/**
 * @brief Whole-program view over the loaded modules
 *
 * Immutable after build(); safe to share across threads by const reference.
 */
class ProgramView
{
public:
    ProgramView() = default;

    /**
     * Merge modules into a view. A class already defined by an earlier module
     * is skipped and recorded in duplicate_classes().
     */
    [[nodiscard]] static ProgramView build(std::span<const ProgramModule> modules);

    [[nodiscard]] std::optional<ClassRef> find_class(std::string_view name) const;

    /// Method declared directly in the class with the given sub-signature.
    [[nodiscard]] std::optional<MethodRef> find_declared_method(ClassRef klass,
                                                               std::string_view sub_signature) const;

    /**
     * Resolve an entry-point query against the declared methods of its class.
     * Fails with EntryPointNotFound (no match) or AmbiguousEntryPoint
     * (several overloads match).
     */
    [[nodiscard]] Result<MethodRef> resolve(const MethodQuery& query) const;

    /// Statements of every method of the class whose span contains the line.
    [[nodiscard]] std::vector<StmtRef> statements_at_line(std::string_view class_name,
                                                          std::int32_t line) const;

    [[nodiscard]] const ClassInfo& class_info(ClassRef ref) const { return m_classes[index_of(ref)]; }
    [[nodiscard]] const Method& method(MethodRef ref) const { return m_methods[index_of(ref)]; }
    [[nodiscard]] const Statement& statement(StmtRef ref) const
    {
        return m_statements[index_of(ref)];
    }

    /// Declaring class name of the method owning the statement.
    [[nodiscard]] const std::string& class_name_of(StmtRef ref) const;

    [[nodiscard]] std::size_t class_count() const noexcept { return m_classes.size(); }
    [[nodiscard]] std::size_t method_count() const noexcept { return m_methods.size(); }
    [[nodiscard]] std::size_t statement_count() const noexcept { return m_statements.size(); }

    [[nodiscard]] const std::vector<std::string>& duplicate_classes() const noexcept
    {
        return m_duplicate_classes;
    }

private:
    void add_class(const ClassRecord& record, std::string_view module);

    std::vector<ClassInfo> m_classes;
    std::vector<Method> m_methods;
    std::vector<Statement> m_statements;
    std::unordered_map<std::string, ClassRef> m_class_index;
    std::unordered_map<std::string, MethodRef> m_method_index;  ///< "class|subsig"
    std::vector<std::string> m_duplicate_classes;
};

// ============================================================================
// Loading
// ============================================================================

struct BinaryFailure
{
    std::string binary;
    std::string code;
    std::string message;
};

/// Outcome of processing a list of binaries with per-binary failure isolation.
struct BinarySummary
{
    std::size_t success_count = 0;
    std::size_t failure_count = 0;
    std::size_t total_binaries = 0;
    std::vector<BinaryFailure> failures;
};

struct LoadOptions
{
    std::string schema_dir;  ///< empty: skip schema validation
    unsigned jobs = 1;
    Diagnostics diagnostics{};
};

struct LoadSummary : BinarySummary
{
    std::vector<std::string> duplicate_classes;
};

struct LoadedProgram
{
    ProgramView view;
    LoadSummary summary;
};

/// Read, validate and parse one program.v1 file.
[[nodiscard]] Result<ProgramModule> read_program_module(const std::filesystem::path& path,
                                                        std::string_view schema_dir);

/**
 * Load every binary; a binary that cannot be read or fails validation is
 * recorded in the summary and skipped.
 */
[[nodiscard]] LoadedProgram load_program(std::span<const std::filesystem::path> binaries,
                                         const LoadOptions& options);

}  // namespace stuckrank::program
