//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Token.hpp
// Purpose: Token kinds and token record produced by the Sieve lexer.
// Key invariants: text is exactly the source bytes covered by span.
// Ownership/Lifetime: Tokens own their text and literal payload.
// Links: frontends/sieve/Lexer.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/Value.hpp"
#include "support/source_location.hpp"

#include <string>

namespace sieve::frontend
{

/// @brief Enumerates every token the lexer can produce.
enum class TokenKind
{
    //=========================================================================
    // Special
    //=========================================================================

    Eof,

    /// Unrecognized input; a diagnostic was already reported for it.
    Error,

    //=========================================================================
    // Literals and names
    //=========================================================================

    Identifier,
    IntegerLiteral,
    StringLiteral,
    IpLiteral,
    PrefixLiteral,
    AsnLiteral,
    CommunityLiteral,

    //=========================================================================
    // Keywords
    //=========================================================================

    KwAbort,
    KwAccept,
    KwElse,
    KwEnum,
    KwFalse,
    KwFilter,
    KwFilterMap,
    KwFor,
    KwFunction,
    KwIf,
    KwIn,
    KwLet,
    KwMatch,
    KwNot,
    KwRecord,
    KwReject,
    KwReturn,
    KwTrue,

    //=========================================================================
    // Operators and punctuation
    //=========================================================================

    Plus,
    Minus,
    Star,
    Slash,
    Percent,
    Bang,
    Equal,
    EqualEqual,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    AmpAmp,
    PipePipe,
    Dot,
    Comma,
    Colon,
    ColonColon,
    Semicolon,
    LParen,
    RParen,
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    FatArrow,
    Arrow,
};

/// @brief Readable spelling of @p kind for diagnostics ("'{'", "identifier").
const char *tokenKindToString(TokenKind kind);

/// @brief A token with its source span and literal payload.
struct Token
{
    TokenKind kind = TokenKind::Eof;

    support::SourceSpan span{};

    /// Source text of the token, including quotes for strings.
    std::string text;

    /// Decoded literal for literal tokens (Int, String, IpAddr, Prefix, Asn,
    /// Community); Unit otherwise.
    runtime::Value literal;

    bool is(TokenKind k) const
    {
        return kind == k;
    }

    bool isKeyword() const
    {
        return kind >= TokenKind::KwAbort && kind <= TokenKind::KwTrue;
    }
};

} // namespace sieve::frontend
