//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Lexer.hpp
// Purpose: On-demand tokenizer for Sieve source text.
// Key invariants: Every call to next() either consumes input or returns Eof;
//                 malformed input yields an Error token plus a diagnostic and
//                 scanning continues after it.
// Ownership/Lifetime: The lexer owns a copy of the source; diagnostics go to
//                     the engine passed in, which must outlive the lexer.
// Links: frontends/sieve/Token.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/sieve/Token.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sieve::frontend
{

/// @brief Lazy, restartable token stream over one compilation unit.
class Lexer
{
  public:
    /// @param source Unit text.
    /// @param unitId Unit identifier stamped on every span.
    /// @param diag Engine receiving LexError diagnostics.
    Lexer(std::string source, uint32_t unitId, support::DiagnosticEngine &diag);

    /// @brief Consume and return the next token.
    Token next();

    /// @brief Return the next token without consuming it.
    const Token &peek();

    /// @brief Rewind to the start of the unit.
    /// @details Diagnostics are reported again if the unit is scanned again.
    void reset();

    /// @brief Tokenize the rest of the unit, Eof excluded.
    std::vector<Token> tokenizeAll();

    const std::string &source() const
    {
        return source_;
    }

  private:
    char peekChar(size_t offset = 0) const;
    char getChar();
    bool eof() const;

    void reportError(support::SourceSpan span, const std::string &message);

    void skipWhitespaceAndComments();
    Token makeToken(TokenKind kind, size_t start);

    Token lexIdentifierOrKeyword();
    Token lexNumber();
    Token lexDottedAddress(size_t start);
    Token lexString();

    static std::optional<TokenKind> lookupKeyword(std::string_view name);

    std::string source_;
    uint32_t unitId_;
    support::DiagnosticEngine &diag_;
    size_t pos_ = 0;
    std::optional<Token> peeked_;
};

} // namespace sieve::frontend
