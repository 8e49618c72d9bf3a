//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/AstPrinter.cpp
// Purpose: Parenthesized tree dump of the AST for debugging and tests.
// Key invariants: Output is deterministic and independent of checker state
//                 except for the ": Type" suffix on checked expressions.
// Ownership/Lifetime: Stateless.
// Links: frontends/sieve/AST.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/AST.hpp"

namespace sieve::frontend
{

const char *binaryOpSpelling(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Rem:
            return "%";
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::In:
            return "in";
        case BinaryOp::NotIn:
            return "not in";
        case BinaryOp::And:
            return "&&";
        case BinaryOp::Or:
            return "||";
    }
    return "?";
}

namespace
{

class AstPrinter
{
  public:
    explicit AstPrinter(std::ostream &os) : os_(os) {}

    void printExpr(const Expr &expr)
    {
        std::visit(Overload{
                       [&](const LiteralExpr &e) { os_ << e.value.toString(); },
                       [&](const NameExpr &e) { os_ << e.name; },
                       [&](const UnaryExpr &e) {
                           os_ << '(' << (e.op == UnaryOp::Neg ? "-" : "!") << ' ';
                           printExpr(*e.operand);
                           os_ << ')';
                       },
                       [&](const BinaryExpr &e) {
                           os_ << '(' << binaryOpSpelling(e.op) << ' ';
                           printExpr(*e.lhs);
                           os_ << ' ';
                           printExpr(*e.rhs);
                           os_ << ')';
                       },
                       [&](const FieldExpr &e) {
                           os_ << "(. ";
                           printExpr(*e.base);
                           os_ << ' ' << e.field << ')';
                       },
                       [&](const MethodCallExpr &e) {
                           os_ << "(call ";
                           printExpr(*e.receiver);
                           os_ << '.' << e.method;
                           printArgs(e.args);
                           os_ << ')';
                       },
                       [&](const CallExpr &e) {
                           os_ << "(call " << e.callee;
                           printArgs(e.args);
                           os_ << ')';
                       },
                       [&](const RecordExpr &e) {
                           os_ << "(record" << (e.typeName.empty() ? "" : " ") << e.typeName;
                           for (const auto &f : e.fields)
                           {
                               os_ << ' ' << f.name << ':';
                               printExpr(*f.value);
                           }
                           os_ << ')';
                       },
                       [&](const EnumExpr &e) {
                           os_ << '(' << e.enumName << "::" << e.variant;
                           if (e.payload)
                           {
                               os_ << ' ';
                               printExpr(*e.payload);
                           }
                           os_ << ')';
                       },
                       [&](const ListExpr &e) {
                           os_ << "(list";
                           printArgs(e.elements);
                           os_ << ')';
                       },
                       [&](const ErrorExpr &) { os_ << "<error>"; },
                   },
                   expr.node);
    }

    void printBlock(const Block &block, int depth)
    {
        for (const auto &stmt : block.stmts)
            printStmt(*stmt, depth);
    }

    void printStmt(const Stmt &stmt, int depth)
    {
        indent(depth);
        std::visit(Overload{
                       [&](const LetStmt &s) {
                           os_ << "let " << s.name;
                           if (s.annotation)
                               os_ << ": " << s.annotation->toString();
                           os_ << " = ";
                           printExpr(*s.init);
                           os_ << '\n';
                       },
                       [&](const AssignStmt &s) {
                           os_ << "set " << s.name << " = ";
                           printExpr(*s.value);
                           os_ << '\n';
                       },
                       [&](const ExprStmt &s) {
                           os_ << (s.hasSemicolon ? "expr " : "tail ");
                           printExpr(*s.expr);
                           os_ << '\n';
                       },
                       [&](const IfStmt &s) {
                           os_ << "if ";
                           printExpr(*s.cond);
                           os_ << '\n';
                           printBlock(s.thenBlock, depth + 1);
                           if (s.elseBlock)
                           {
                               indent(depth);
                               os_ << "else\n";
                               printBlock(*s.elseBlock, depth + 1);
                           }
                       },
                       [&](const MatchStmt &s) {
                           os_ << "match ";
                           printExpr(*s.scrutinee);
                           os_ << '\n';
                           for (const auto &arm : s.arms)
                           {
                               indent(depth + 1);
                               os_ << "arm " << arm.variant;
                               if (arm.binding)
                                   os_ << '(' << *arm.binding << ')';
                               if (arm.guard)
                               {
                                   os_ << " if ";
                                   printExpr(*arm.guard);
                               }
                               os_ << '\n';
                               printBlock(arm.body, depth + 2);
                           }
                       },
                       [&](const ForStmt &s) {
                           os_ << "for " << s.var << " in ";
                           printExpr(*s.iterable);
                           os_ << '\n';
                           printBlock(s.body, depth + 1);
                       },
                       [&](const ActionStmt &s) {
                           static const char *kNames[] = {"accept", "reject", "return", "abort"};
                           os_ << kNames[static_cast<int>(s.kind)];
                           if (s.value)
                           {
                               os_ << ' ';
                               printExpr(*s.value);
                           }
                           os_ << '\n';
                       },
                       [&](const BlockStmt &s) {
                           os_ << "block\n";
                           printBlock(s.block, depth + 1);
                       },
                   },
                   stmt.node);
    }

    void printDecl(const Decl &decl)
    {
        std::visit(Overload{
                       [&](const FunctionDecl &d) {
                           static const char *kKinds[] = {"function", "filter", "filter-map"};
                           os_ << kKinds[static_cast<int>(d.kind)] << ' ' << d.name << '(';
                           for (size_t i = 0; i < d.params.size(); ++i)
                               os_ << (i ? ", " : "") << d.params[i].name << ": "
                                   << d.params[i].type.toString();
                           os_ << ')';
                           if (d.returnType)
                               os_ << " -> " << d.returnType->toString();
                           os_ << '\n';
                           printBlock(d.body, 1);
                       },
                       [&](const RecordDecl &d) {
                           os_ << "record " << d.name << '\n';
                           for (const auto &f : d.fields)
                           {
                               indent(1);
                               os_ << f.name << ": " << f.type.toString() << '\n';
                           }
                       },
                       [&](const EnumDecl &d) {
                           os_ << "enum " << d.name << '\n';
                           for (const auto &v : d.variants)
                           {
                               indent(1);
                               os_ << v.name;
                               if (v.payload)
                                   os_ << '(' << v.payload->toString() << ')';
                               os_ << '\n';
                           }
                       },
                   },
                   decl.node);
    }

  private:
    void printArgs(const std::vector<ExprPtr> &args)
    {
        for (const auto &a : args)
        {
            os_ << ' ';
            printExpr(*a);
        }
    }

    void indent(int depth)
    {
        for (int i = 0; i < depth; ++i)
            os_ << "  ";
    }

    std::ostream &os_;
};

} // namespace

void printAst(const Module &module, std::ostream &os)
{
    AstPrinter printer(os);
    for (const auto &decl : module.decls)
        printer.printDecl(*decl);
}

} // namespace sieve::frontend
