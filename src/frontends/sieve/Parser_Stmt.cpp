//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Parser_Stmt.cpp
// Purpose: Statement and block parsing, including match arms and terminal
//          actions.
// Key invariants: parseBlock() resynchronizes after every damaged statement so
//                 later statements are still parsed and checked.
// Ownership/Lifetime: See Parser.hpp.
// Links: frontends/sieve/Parser.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Parser.hpp"

namespace sieve::frontend
{

Block Parser::parseBlock()
{
    Block block;
    Token open = peek();
    int savedArmDepth = matchArmDepth_;
    matchArmDepth_ = 0;

    if (!expect(TokenKind::LBrace))
    {
        matchArmDepth_ = savedArmDepth;
        block.span = open.span;
        return block;
    }

    while (!check(TokenKind::RBrace) && !check(TokenKind::Eof) && !atDeclarationKeyword())
    {
        size_t before = pos_;
        StmtPtr stmt = parseStatement();
        if (stmt)
            block.stmts.push_back(std::move(stmt));
        if (panic_)
            syncToStatement();
        if (pos_ == before && !check(TokenKind::RBrace))
            advance(); // guarantee progress on an unparseable token
    }
    expect(TokenKind::RBrace);
    matchArmDepth_ = savedArmDepth;
    block.span = spanFrom(open.span);
    return block;
}

StmtPtr Parser::parseStatement()
{
    switch (peek().kind)
    {
        case TokenKind::KwLet:
            return parseLetStmt();
        case TokenKind::KwIf:
            return parseIfStmt();
        case TokenKind::KwMatch:
            return parseMatchStmt();
        case TokenKind::KwFor:
            return parseForStmt();
        case TokenKind::KwAccept:
        case TokenKind::KwReject:
        case TokenKind::KwReturn:
        case TokenKind::KwAbort:
            return parseActionStmt();
        case TokenKind::LBrace:
        {
            SourceSpan start = peek().span;
            Block block = parseBlock();
            return makeStmt(spanFrom(start), BlockStmt{std::move(block)});
        }
        case TokenKind::Identifier:
            if (check(TokenKind::Equal, 1))
                return parseAssignStmt();
            return parseExprStmt();
        default:
            return parseExprStmt();
    }
}

bool Parser::parseStatementEnd()
{
    if (match(TokenKind::Semicolon))
        return true;
    if (check(TokenKind::RBrace))
        return false;
    if (matchArmDepth_ > 0 && check(TokenKind::Comma))
        return false;
    errorExpected({TokenKind::Semicolon, TokenKind::RBrace});
    return false;
}

StmtPtr Parser::parseLetStmt()
{
    Token kw = advance();
    LetStmt let;
    Token name;
    if (!expect(TokenKind::Identifier, &name))
        return nullptr;
    let.name = name.text;
    let.nameSpan = name.span;
    if (match(TokenKind::Colon))
        let.annotation = parseType();
    if (!expect(TokenKind::Equal))
        return nullptr;
    let.init = parseExpression();
    parseStatementEnd();
    return makeStmt(spanFrom(kw.span), std::move(let));
}

StmtPtr Parser::parseAssignStmt()
{
    Token name = advance();
    advance(); // '='
    AssignStmt assign;
    assign.name = name.text;
    assign.nameSpan = name.span;
    assign.value = parseExpression();
    parseStatementEnd();
    return makeStmt(spanFrom(name.span), std::move(assign));
}

StmtPtr Parser::parseIfStmt()
{
    Token kw = advance();
    IfStmt stmt;
    {
        NoRecordLiterals guard(*this, true);
        stmt.cond = parseExpression();
    }
    stmt.thenBlock = parseBlock();
    if (match(TokenKind::KwElse))
    {
        if (check(TokenKind::KwIf))
        {
            SourceSpan start = peek().span;
            Block elseBlock;
            elseBlock.stmts.push_back(parseIfStmt());
            elseBlock.span = spanFrom(start);
            stmt.elseBlock = std::move(elseBlock);
        }
        else
        {
            stmt.elseBlock = parseBlock();
        }
    }
    return makeStmt(spanFrom(kw.span), std::move(stmt));
}

bool Parser::parseMatchArm(MatchArm &arm)
{
    Token pattern;
    if (!expect(TokenKind::Identifier, &pattern))
        return false;
    arm.variant = pattern.text;
    arm.patternSpan = pattern.span;

    if (match(TokenKind::LParen))
    {
        Token binding;
        if (!expect(TokenKind::Identifier, &binding))
            return false;
        arm.binding = binding.text;
        arm.bindingSpan = binding.span;
        if (!expect(TokenKind::RParen))
            return false;
        arm.patternSpan = spanFrom(pattern.span);
    }

    if (match(TokenKind::KwIf))
        arm.guard = parseExpression();

    if (!expect(TokenKind::FatArrow))
        return false;

    if (check(TokenKind::LBrace))
    {
        arm.body = parseBlock();
        return true;
    }

    SourceSpan start = peek().span;
    ++matchArmDepth_;
    StmtPtr stmt = parseStatement();
    --matchArmDepth_;
    if (stmt)
        arm.body.stmts.push_back(std::move(stmt));
    arm.body.span = spanFrom(start);
    return !panic_;
}

StmtPtr Parser::parseMatchStmt()
{
    Token kw = advance();
    MatchStmt stmt;
    {
        NoRecordLiterals guard(*this, true);
        stmt.scrutinee = parseExpression();
    }
    if (!expect(TokenKind::LBrace))
        return makeStmt(spanFrom(kw.span), std::move(stmt));

    while (!check(TokenKind::RBrace) && !check(TokenKind::Eof))
    {
        MatchArm arm;
        bool ok = parseMatchArm(arm);
        stmt.arms.push_back(std::move(arm));
        if (!ok)
        {
            // Skip to the next arm separator or the end of the match.
            while (!check(TokenKind::Comma) && !check(TokenKind::RBrace) && !check(TokenKind::Eof) &&
                   !atDeclarationKeyword())
                advance();
            panic_ = false;
        }
        if (match(TokenKind::Comma) || check(TokenKind::RBrace))
            continue;
        // Block-bodied arms may omit the separating comma.
        if (pos_ > 0 && tokens_[pos_ - 1].kind == TokenKind::RBrace)
            continue;
        errorExpected({TokenKind::Comma, TokenKind::RBrace});
        break;
    }
    expect(TokenKind::RBrace);
    return makeStmt(spanFrom(kw.span), std::move(stmt));
}

StmtPtr Parser::parseForStmt()
{
    Token kw = advance();
    ForStmt stmt;
    Token var;
    if (!expect(TokenKind::Identifier, &var))
        return nullptr;
    stmt.var = var.text;
    stmt.varSpan = var.span;
    if (!expect(TokenKind::KwIn))
        return nullptr;
    {
        NoRecordLiterals guard(*this, true);
        stmt.iterable = parseExpression();
    }
    stmt.body = parseBlock();
    return makeStmt(spanFrom(kw.span), std::move(stmt));
}

StmtPtr Parser::parseActionStmt()
{
    Token kw = advance();
    ActionStmt action;
    switch (kw.kind)
    {
        case TokenKind::KwAccept:
            action.kind = ActionKind::Accept;
            break;
        case TokenKind::KwReject:
            action.kind = ActionKind::Reject;
            break;
        case TokenKind::KwReturn:
            action.kind = ActionKind::Return;
            break;
        default:
            action.kind = ActionKind::Abort;
            break;
    }

    bool atEnd = check(TokenKind::Semicolon) || check(TokenKind::RBrace) ||
                 (matchArmDepth_ > 0 && check(TokenKind::Comma));
    if (action.kind == ActionKind::Abort || (!atEnd && action.kind != ActionKind::Reject))
        action.value = parseExpression();
    parseStatementEnd();
    return makeStmt(spanFrom(kw.span), std::move(action));
}

StmtPtr Parser::parseExprStmt()
{
    ExprStmt stmt;
    stmt.expr = parseExpression();
    SourceSpan span = stmt.expr->span;
    stmt.hasSemicolon = parseStatementEnd();
    return makeStmt(spanFrom(span), std::move(stmt));
}

} // namespace sieve::frontend
