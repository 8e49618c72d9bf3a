//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Parser_Decl.cpp
// Purpose: Module, declaration and type-annotation parsing.
// Key invariants: parseModule() consumes the entire token stream.
// Ownership/Lifetime: See Parser.hpp.
// Links: frontends/sieve/Parser.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Parser.hpp"

namespace sieve::frontend
{

Module Parser::parseModule()
{
    Module module;
    module.unit = peek().span.unit;
    while (!check(TokenKind::Eof))
    {
        size_t before = pos_;
        DeclPtr decl = parseDeclaration();
        if (decl)
            module.decls.push_back(std::move(decl));
        if (panic_ || pos_ == before)
        {
            if (pos_ == before)
                advance();
            syncToDeclaration();
        }
    }
    return module;
}

DeclPtr Parser::parseDeclaration()
{
    switch (peek().kind)
    {
        case TokenKind::KwFunction:
            return parseFunctionDecl(FunctionKind::Function);
        case TokenKind::KwFilter:
            return parseFunctionDecl(FunctionKind::Filter);
        case TokenKind::KwFilterMap:
            return parseFunctionDecl(FunctionKind::FilterMap);
        case TokenKind::KwRecord:
            return parseRecordDecl();
        case TokenKind::KwEnum:
            return parseEnumDecl();
        default:
            errorExpected({TokenKind::KwFilter, TokenKind::KwFilterMap, TokenKind::KwFunction,
                           TokenKind::KwRecord, TokenKind::KwEnum});
            return nullptr;
    }
}

std::vector<Param> Parser::parseParams()
{
    std::vector<Param> params;
    if (!expect(TokenKind::LParen))
        return params;
    while (!check(TokenKind::RParen) && !check(TokenKind::Eof))
    {
        Token name;
        if (!expect(TokenKind::Identifier, &name) || !expect(TokenKind::Colon))
            break;
        std::optional<TypeNode> type = parseType();
        if (!type)
            break;
        params.push_back(Param{name.text, name.span, std::move(*type)});
        if (!match(TokenKind::Comma))
            break;
    }
    expect(TokenKind::RParen);
    return params;
}

DeclPtr Parser::parseFunctionDecl(FunctionKind kind)
{
    Token kw = advance();
    FunctionDecl fn;
    fn.kind = kind;
    Token name;
    if (!expect(TokenKind::Identifier, &name))
        return nullptr;
    fn.name = name.text;
    fn.nameSpan = name.span;
    fn.params = parseParams();
    if (match(TokenKind::Arrow))
        fn.returnType = parseType();
    if (panic_)
        return nullptr;
    fn.body = parseBlock();
    return std::make_unique<Decl>(spanFrom(kw.span), DeclNode(std::move(fn)));
}

DeclPtr Parser::parseRecordDecl()
{
    Token kw = advance();
    RecordDecl record;
    Token name;
    if (!expect(TokenKind::Identifier, &name) || !expect(TokenKind::LBrace))
        return nullptr;
    record.name = name.text;
    record.nameSpan = name.span;
    while (!check(TokenKind::RBrace) && !check(TokenKind::Eof))
    {
        Token field;
        if (!expect(TokenKind::Identifier, &field) || !expect(TokenKind::Colon))
            return nullptr;
        std::optional<TypeNode> type = parseType();
        if (!type)
            return nullptr;
        record.fields.push_back(FieldDecl{field.text, field.span, std::move(*type)});
        if (!match(TokenKind::Comma))
            break;
    }
    if (!expect(TokenKind::RBrace))
        return nullptr;
    return std::make_unique<Decl>(spanFrom(kw.span), DeclNode(std::move(record)));
}

DeclPtr Parser::parseEnumDecl()
{
    Token kw = advance();
    EnumDecl decl;
    Token name;
    if (!expect(TokenKind::Identifier, &name) || !expect(TokenKind::LBrace))
        return nullptr;
    decl.name = name.text;
    decl.nameSpan = name.span;
    while (!check(TokenKind::RBrace) && !check(TokenKind::Eof))
    {
        Token variant;
        if (!expect(TokenKind::Identifier, &variant))
            return nullptr;
        VariantDecl v{variant.text, variant.span, std::nullopt};
        if (match(TokenKind::LParen))
        {
            v.payload = parseType();
            if (!v.payload || !expect(TokenKind::RParen))
                return nullptr;
            v.span = spanFrom(variant.span);
        }
        decl.variants.push_back(std::move(v));
        if (!match(TokenKind::Comma))
            break;
    }
    if (!expect(TokenKind::RBrace))
        return nullptr;
    return std::make_unique<Decl>(spanFrom(kw.span), DeclNode(std::move(decl)));
}

std::optional<TypeNode> Parser::parseType()
{
    Token name;
    if (!check(TokenKind::Identifier))
    {
        errorExpected("type name");
        return std::nullopt;
    }
    name = advance();
    TypeNode type;
    type.name = name.text;
    if (match(TokenKind::LBracket))
    {
        std::optional<TypeNode> arg = parseType();
        if (!arg)
            return std::nullopt;
        type.args.push_back(std::move(*arg));
        if (!expect(TokenKind::RBracket))
            return std::nullopt;
    }
    type.span = spanFrom(name.span);
    return type;
}

} // namespace sieve::frontend
