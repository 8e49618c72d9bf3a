//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Parser_Tokens.cpp
// Purpose: Token buffering, error reporting and panic-mode recovery for the
//          Sieve parser.
// Key invariants: Tokens are pulled from the lexer only when first needed;
//                 recovery always consumes input or stops at a boundary the
//                 caller can make progress on.
// Ownership/Lifetime: See Parser.hpp.
// Links: frontends/sieve/Parser.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Parser.hpp"

namespace sieve::frontend
{

Parser::Parser(Lexer &lexer, support::DiagnosticEngine &diag) : lexer_(lexer), diag_(diag) {}

const Token &Parser::peek(size_t offset)
{
    while (tokens_.size() <= pos_ + offset)
    {
        if (!tokens_.empty() && tokens_.back().kind == TokenKind::Eof)
            return tokens_.back();
        tokens_.push_back(lexer_.next());
        if (unit_ == 0)
            unit_ = tokens_.back().span.unit;
    }
    return tokens_[pos_ + offset];
}

Token Parser::advance()
{
    Token tok = peek();
    if (tok.kind != TokenKind::Eof)
    {
        ++pos_;
        prevEnd_ = tok.span.end;
    }
    return tok;
}

bool Parser::check(TokenKind kind, size_t offset)
{
    return peek(offset).kind == kind;
}

bool Parser::match(TokenKind kind, Token *out)
{
    if (!check(kind))
        return false;
    Token tok = advance();
    if (out)
        *out = std::move(tok);
    return true;
}

bool Parser::expect(TokenKind kind, Token *out)
{
    if (match(kind, out))
        return true;
    errorExpected({kind});
    return false;
}

SourceSpan Parser::spanFrom(const SourceSpan &start) const
{
    uint32_t end = prevEnd_ < start.begin ? start.end : prevEnd_;
    return SourceSpan{start.begin, end, start.unit};
}

void Parser::errorAt(SourceSpan span, const std::string &message)
{
    hasError_ = true;
    if (panic_ || lastErrorPos_ == pos_)
    {
        panic_ = true;
        return;
    }
    panic_ = true;
    lastErrorPos_ = pos_;
    diag_.report(support::makeError(support::DiagKind::ParseError, message, span));
}

void Parser::errorExpected(std::initializer_list<TokenKind> expected)
{
    std::string what;
    size_t i = 0;
    for (TokenKind k : expected)
    {
        if (i)
            what += (i + 1 == expected.size()) ? " or " : ", ";
        what += tokenKindToString(k);
        ++i;
    }
    errorExpected(what.c_str());
}

void Parser::errorExpected(const char *what)
{
    const Token &found = peek();
    if (found.kind == TokenKind::Error)
    {
        // The lexer already explained this token.
        hasError_ = true;
        panic_ = true;
        return;
    }
    std::string foundText = found.kind == TokenKind::Eof ? std::string("end of input")
                                                         : "'" + found.text + "'";
    errorAt(found.span, std::string("expected ") + what + ", found " + foundText);
}

bool Parser::atStatementKeyword()
{
    switch (peek().kind)
    {
        case TokenKind::KwLet:
        case TokenKind::KwIf:
        case TokenKind::KwMatch:
        case TokenKind::KwFor:
        case TokenKind::KwAccept:
        case TokenKind::KwReject:
        case TokenKind::KwReturn:
        case TokenKind::KwAbort:
            return true;
        default:
            return false;
    }
}

bool Parser::atDeclarationKeyword()
{
    switch (peek().kind)
    {
        case TokenKind::KwFunction:
        case TokenKind::KwFilter:
        case TokenKind::KwFilterMap:
        case TokenKind::KwRecord:
        case TokenKind::KwEnum:
            return true;
        default:
            return false;
    }
}

void Parser::syncToStatement()
{
    int depth = 0;
    while (!check(TokenKind::Eof))
    {
        if (depth == 0)
        {
            if (match(TokenKind::Semicolon))
                break;
            if (check(TokenKind::RBrace) || atStatementKeyword() || atDeclarationKeyword())
                break;
        }
        else if (atDeclarationKeyword())
        {
            break;
        }

        Token tok = advance();
        if (tok.kind == TokenKind::LBrace)
        {
            ++depth;
        }
        else if (tok.kind == TokenKind::RBrace)
        {
            // Closing a block opened during recovery ends the damaged statement.
            if (--depth == 0)
                break;
        }
    }
    panic_ = false;
}

void Parser::syncToDeclaration()
{
    while (!check(TokenKind::Eof) && !atDeclarationKeyword())
        advance();
    panic_ = false;
}

} // namespace sieve::frontend
