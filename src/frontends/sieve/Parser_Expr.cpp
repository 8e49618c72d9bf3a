//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Parser_Expr.cpp
// Purpose: Expression parsing with the precedence ladder
//          unary > multiplicative > additive > comparison > && > ||.
// Key invariants: Every parse function returns a non-null ExprPtr; failures
//                 produce ErrorExpr nodes.
// Ownership/Lifetime: See Parser.hpp.
// Links: frontends/sieve/Parser.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Parser.hpp"

namespace sieve::frontend
{

ExprPtr Parser::parseExpression()
{
    return parseLogicalOr();
}

ExprPtr Parser::parseLogicalOr()
{
    ExprPtr lhs = parseLogicalAnd();
    while (check(TokenKind::PipePipe))
    {
        advance();
        ExprPtr rhs = parseLogicalAnd();
        SourceSpan span = SourceSpan::join(lhs->span, rhs->span);
        lhs = makeExpr(span, BinaryExpr{BinaryOp::Or, std::move(lhs), std::move(rhs)});
    }
    return lhs;
}

ExprPtr Parser::parseLogicalAnd()
{
    ExprPtr lhs = parseComparison();
    while (check(TokenKind::AmpAmp))
    {
        advance();
        ExprPtr rhs = parseComparison();
        SourceSpan span = SourceSpan::join(lhs->span, rhs->span);
        lhs = makeExpr(span, BinaryExpr{BinaryOp::And, std::move(lhs), std::move(rhs)});
    }
    return lhs;
}

namespace
{
std::optional<BinaryOp> comparisonOp(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::EqualEqual:
            return BinaryOp::Eq;
        case TokenKind::NotEqual:
            return BinaryOp::Ne;
        case TokenKind::Less:
            return BinaryOp::Lt;
        case TokenKind::LessEqual:
            return BinaryOp::Le;
        case TokenKind::Greater:
            return BinaryOp::Gt;
        case TokenKind::GreaterEqual:
            return BinaryOp::Ge;
        case TokenKind::KwIn:
            return BinaryOp::In;
        default:
            return std::nullopt;
    }
}
} // namespace

ExprPtr Parser::parseComparison()
{
    ExprPtr lhs = parseAdditive();

    std::optional<BinaryOp> op = comparisonOp(peek().kind);
    if (!op && check(TokenKind::KwNot) && check(TokenKind::KwIn, 1))
        op = BinaryOp::NotIn;
    if (!op)
        return lhs;

    advance();
    if (*op == BinaryOp::NotIn)
        advance();
    ExprPtr rhs = parseAdditive();
    SourceSpan span = SourceSpan::join(lhs->span, rhs->span);
    ExprPtr result = makeExpr(span, BinaryExpr{*op, std::move(lhs), std::move(rhs)});

    if (comparisonOp(peek().kind))
    {
        errorAt(peek().span, "comparison operators cannot be chained; use '&&'");
        advance();
        parseAdditive();
    }
    return result;
}

ExprPtr Parser::parseAdditive()
{
    ExprPtr lhs = parseMultiplicative();
    while (check(TokenKind::Plus) || check(TokenKind::Minus))
    {
        BinaryOp op = advance().kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
        ExprPtr rhs = parseMultiplicative();
        SourceSpan span = SourceSpan::join(lhs->span, rhs->span);
        lhs = makeExpr(span, BinaryExpr{op, std::move(lhs), std::move(rhs)});
    }
    return lhs;
}

ExprPtr Parser::parseMultiplicative()
{
    ExprPtr lhs = parseUnary();
    while (check(TokenKind::Star) || check(TokenKind::Slash) || check(TokenKind::Percent))
    {
        TokenKind kind = advance().kind;
        BinaryOp op = kind == TokenKind::Star    ? BinaryOp::Mul
                      : kind == TokenKind::Slash ? BinaryOp::Div
                                                 : BinaryOp::Rem;
        ExprPtr rhs = parseUnary();
        SourceSpan span = SourceSpan::join(lhs->span, rhs->span);
        lhs = makeExpr(span, BinaryExpr{op, std::move(lhs), std::move(rhs)});
    }
    return lhs;
}

ExprPtr Parser::parseUnary()
{
    if (check(TokenKind::Bang) || check(TokenKind::KwNot) || check(TokenKind::Minus))
    {
        Token op = advance();
        ExprPtr operand = parseUnary();
        SourceSpan span = SourceSpan::join(op.span, operand->span);
        UnaryOp uop = op.kind == TokenKind::Minus ? UnaryOp::Neg : UnaryOp::Not;
        return makeExpr(span, UnaryExpr{uop, std::move(operand)});
    }
    return parsePostfix();
}

ExprPtr Parser::parsePostfix()
{
    ExprPtr expr = parsePrimary();
    while (check(TokenKind::Dot))
    {
        advance();
        Token name;
        if (!expect(TokenKind::Identifier, &name))
            return makeExpr(spanFrom(expr->span), ErrorExpr{});

        if (check(TokenKind::LParen))
        {
            std::vector<ExprPtr> args = parseCallArgs();
            SourceSpan span = spanFrom(expr->span);
            MethodCallExpr call;
            call.receiver = std::move(expr);
            call.method = name.text;
            call.methodSpan = name.span;
            call.args = std::move(args);
            expr = makeExpr(span, std::move(call));
        }
        else
        {
            SourceSpan span = spanFrom(expr->span);
            FieldExpr field;
            field.base = std::move(expr);
            field.field = name.text;
            field.fieldSpan = name.span;
            expr = makeExpr(span, std::move(field));
        }
    }
    return expr;
}

std::vector<ExprPtr> Parser::parseCallArgs()
{
    NoRecordLiterals allow(*this, false);
    std::vector<ExprPtr> args;
    expect(TokenKind::LParen);
    if (!check(TokenKind::RParen))
    {
        do
        {
            if (check(TokenKind::RParen))
                break; // trailing comma
            args.push_back(parseExpression());
        } while (match(TokenKind::Comma));
    }
    expect(TokenKind::RParen);
    return args;
}

ExprPtr Parser::parsePrimary()
{
    Token tok = peek();
    switch (tok.kind)
    {
        case TokenKind::IntegerLiteral:
        case TokenKind::StringLiteral:
        case TokenKind::IpLiteral:
        case TokenKind::PrefixLiteral:
        case TokenKind::AsnLiteral:
        case TokenKind::CommunityLiteral:
            advance();
            return makeExpr(tok.span, LiteralExpr{tok.literal});
        case TokenKind::KwTrue:
        case TokenKind::KwFalse:
            advance();
            return makeExpr(tok.span, LiteralExpr{runtime::Value::boolean(tok.kind == TokenKind::KwTrue)});
        case TokenKind::Identifier:
            return parseIdentifierExpr();
        case TokenKind::LBrace:
            if (noRecordLiterals_)
                break;
            return parseRecordLiteral(std::string(), SourceSpan{});
        case TokenKind::LBracket:
            return parseListLiteral();
        case TokenKind::LParen:
        {
            NoRecordLiterals allow(*this, false);
            advance();
            ExprPtr inner = parseExpression();
            expect(TokenKind::RParen);
            inner->span = spanFrom(tok.span);
            return inner;
        }
        case TokenKind::Error:
            // Already reported by the lexer.
            advance();
            hasError_ = true;
            return makeExpr(tok.span, ErrorExpr{});
        default:
            break;
    }
    errorExpected("expression");
    return makeExpr(tok.span, ErrorExpr{});
}

ExprPtr Parser::parseIdentifierExpr()
{
    Token name = advance();

    if (check(TokenKind::LParen))
    {
        CallExpr call;
        call.callee = name.text;
        call.calleeSpan = name.span;
        call.args = parseCallArgs();
        return makeExpr(spanFrom(name.span), std::move(call));
    }

    if (check(TokenKind::ColonColon))
    {
        advance();
        EnumExpr e;
        e.enumName = name.text;
        Token variant;
        if (!expect(TokenKind::Identifier, &variant))
            return makeExpr(spanFrom(name.span), ErrorExpr{});
        e.variant = variant.text;
        e.variantSpan = variant.span;
        if (match(TokenKind::LParen))
        {
            NoRecordLiterals allow(*this, false);
            e.payload = parseExpression();
            expect(TokenKind::RParen);
        }
        return makeExpr(spanFrom(name.span), std::move(e));
    }

    if (check(TokenKind::LBrace) && !noRecordLiterals_)
        return parseRecordLiteral(name.text, name.span);

    return makeExpr(name.span, NameExpr{name.text});
}

ExprPtr Parser::parseRecordLiteral(std::string typeName, SourceSpan typeSpan)
{
    NoRecordLiterals allow(*this, false);
    Token open = peek();
    SourceSpan start = typeSpan.isValid() ? typeSpan : open.span;
    expect(TokenKind::LBrace);

    RecordExpr record;
    record.typeName = std::move(typeName);
    record.typeSpan = typeSpan;

    while (!check(TokenKind::RBrace) && !check(TokenKind::Eof))
    {
        Token field;
        if (!expect(TokenKind::Identifier, &field))
            break;
        if (!expect(TokenKind::Colon))
            break;
        FieldInit init;
        init.name = field.text;
        init.nameSpan = field.span;
        init.value = parseExpression();
        record.fields.push_back(std::move(init));
        if (!match(TokenKind::Comma))
            break;
    }
    expect(TokenKind::RBrace);
    return makeExpr(spanFrom(start), std::move(record));
}

ExprPtr Parser::parseListLiteral()
{
    NoRecordLiterals allow(*this, false);
    Token open = advance();
    ListExpr list;
    while (!check(TokenKind::RBracket) && !check(TokenKind::Eof))
    {
        list.elements.push_back(parseExpression());
        if (!match(TokenKind::Comma))
            break;
    }
    expect(TokenKind::RBracket);
    return makeExpr(spanFrom(open.span), std::move(list));
}

} // namespace sieve::frontend
