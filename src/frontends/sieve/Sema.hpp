//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema.hpp
/// @brief Name resolution and type checking for Sieve modules.
///
/// @details The checker runs in passes over one Module:
///
/// **Pass 1: Type collection.** Records and enums are entered by name.
/// Clashes with built-in or registered external type names are duplicates.
///
/// **Pass 2: Type resolution.** Record fields and enum payloads are resolved.
/// A type that contains itself is rejected.
///
/// **Pass 3: Signatures.** Every function, filter and filter-map gets a
/// function type and an index equal to its position among callables.
///
/// **Pass 4: Bodies.** Statements and expressions are checked in place:
/// every Expr::type is set, names are bound to local slot ids and calls are
/// annotated with their resolved target.
///
/// **Pass 5: Call graph.** Direct or mutual recursion is an error.
///
/// The checker never stops at the first error. Failed expressions get the
/// Error type, which is compatible with everything so one mistake reports
/// once.
///
/// ## Scopes
///
/// Scopes live in an arena of ScopeRecord entries indexed by integer id.
/// Each record refers to its parent by index. The arena is cleared when a
/// function body has been checked.
///
/// @invariant After analyze(), every reachable Expr has a non-null type.
/// @see Lowerer.hpp - consumes the annotated AST
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/sieve/AST.hpp"
#include "support/diagnostics.hpp"
#include "types/TypeTable.hpp"
#include "types/Types.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace sieve::frontend
{

using types::TypeRef;

/// @brief A local variable, parameter, loop variable or match binding.
struct LocalSymbol
{
    std::string name;
    TypeRef type;
    SourceSpan declSpan;
    LocalId local = kNoLocal;
    bool isMutable = false;
    bool used = false;
    /// Noun used in unused/immutable messages ("local", "parameter", ...).
    const char *what = "local";
    bool warnUnused = true;
};

/// @brief One lexical scope in the arena.
struct ScopeRecord
{
    /// Index of the enclosing scope, or -1 at function level.
    int parent = -1;
    std::vector<LocalSymbol> symbols;
};

/// @brief Checker view of one callable declaration.
struct FunctionInfo
{
    std::string name;
    FunctionDecl *decl = nullptr;
    TypeRef signature;
    uint32_t index = 0;
};

/// @brief Semantic analyzer for one compilation unit.
class Sema
{
  public:
    /// @param diag Sink for every diagnostic the checker produces.
    /// @param externals Host-registered types and functions; may be null.
    Sema(support::DiagnosticEngine &diag, std::shared_ptr<const types::ExternalTypeTable> externals);

    /// @brief Check @p module in place.
    /// @return True when no error was reported by the checker.
    bool analyze(Module &module);

    /// @brief Callables in index order.
    const std::vector<FunctionInfo> &functions() const
    {
        return functions_;
    }

    /// @brief Resolved record or enum type declared as @p name, or null.
    TypeRef lookupDeclaredType(const std::string &name) const;

    bool hasError() const
    {
        return hasError_;
    }

  private:
    /// Declared record or enum during resolution.
    struct TypeDeclInfo
    {
        enum class State
        {
            Pending,
            Visiting,
            Done
        };

        const Decl *decl = nullptr;
        SourceSpan nameSpan;
        State state = State::Pending;
        TypeRef type;
        bool used = false;
        bool cyclic = false;
    };

    //=========================================================================
    /// @name Declarations (Sema_Decl.cpp)
    /// @{
    //=========================================================================

    void collectTypes(Module &module);
    void resolveTypes();
    TypeRef resolveDeclaredType(const std::string &name, SourceSpan useSpan);
    TypeRef resolveTypeNode(const TypeNode &node);
    void collectSignatures(Module &module);
    void checkFunctionBody(FunctionInfo &fn);
    void checkRecursion();
    void reportUnusedTypes();

    /// @}
    //=========================================================================
    /// @name Statements (Sema_Stmt.cpp)
    /// @{
    //=========================================================================

    /// @return True when every path through the block ends in an action.
    bool checkBlock(Block &block, bool functionBody = false);
    bool checkStmt(Stmt &stmt, bool tailOfBody);
    bool checkLet(LetStmt &stmt);
    bool checkAssign(AssignStmt &stmt);
    bool checkExprStmt(ExprStmt &stmt, bool tailOfBody);
    bool checkIf(IfStmt &stmt);
    bool checkMatch(MatchStmt &stmt, SourceSpan span);
    bool checkFor(ForStmt &stmt);
    bool checkAction(ActionStmt &stmt, SourceSpan span);

    /// @}
    //=========================================================================
    /// @name Expressions (Sema_Expr.cpp)
    /// @{
    //=========================================================================

    /// @brief Type @p expr and store the result in Expr::type.
    /// @param expected Contextual type used for empty lists; may be null.
    TypeRef checkExpr(Expr &expr, const TypeRef &expected = nullptr);
    TypeRef checkName(Expr &expr, NameExpr &e);
    TypeRef checkUnary(UnaryExpr &e);
    TypeRef checkBinary(Expr &expr, BinaryExpr &e);
    TypeRef checkField(FieldExpr &e);
    TypeRef checkMethodCall(Expr &expr, MethodCallExpr &e);
    TypeRef checkCall(Expr &expr, CallExpr &e);
    TypeRef checkRecord(Expr &expr, RecordExpr &e);
    TypeRef checkEnum(Expr &expr, EnumExpr &e);
    TypeRef checkList(Expr &expr, ListExpr &e, const TypeRef &expected);

    /// @brief Check call arguments against @p params.
    void checkArgs(const std::string &callee, SourceSpan span, std::vector<ExprPtr> &args,
                   const std::vector<TypeRef> &params);

    /// @brief Check @p expr against @p target and report a mismatch.
    /// @param what Noun phrase inserted after "expected", e.g. "return type".
    void expectType(Expr &expr, const TypeRef &target, const std::string &what);

    /// @}
    //=========================================================================
    /// @name Scopes (Sema.cpp)
    /// @{
    //=========================================================================

    void pushScope();
    void popScope();
    LocalSymbol *declareLocal(LocalSymbol symbol);
    LocalSymbol *lookupLocal(const std::string &name);

    /// @}

    void error(support::DiagKind kind, SourceSpan span, const std::string &message);
    void warning(support::DiagKind kind, SourceSpan span, const std::string &message);
    void mismatch(SourceSpan span, const std::string &what, const TypeRef &expected,
                  const TypeRef &found);

    support::DiagnosticEngine &diag_;
    std::shared_ptr<const types::ExternalTypeTable> externals_;

    std::map<std::string, TypeDeclInfo> declaredTypes_;
    std::vector<std::string> declaredOrder_;

    std::vector<FunctionInfo> functions_;
    std::map<std::string, uint32_t> functionIndex_;

    /// Caller index -> callee index -> first call site.
    std::map<uint32_t, std::map<uint32_t, SourceSpan>> callGraph_;

    std::vector<ScopeRecord> scopes_;
    int currentScope_ = -1;
    LocalId nextLocal_ = 0;
    FunctionInfo *currentFn_ = nullptr;

    bool hasError_ = false;
};

} // namespace sieve::frontend
