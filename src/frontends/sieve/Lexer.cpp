//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Lexer.cpp
// Purpose: Tokenizer for Sieve: identifiers, keywords, numeric and network
//          literals, strings and punctuation.
// Key invariants: Token spans are contiguous with the trivia between them, so
//                 the source can be rebuilt from the token stream.
// Ownership/Lifetime: See Lexer.hpp.
// Links: frontends/sieve/Lexer.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Lexer.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <limits>
#include <string_view>

namespace sieve::frontend
{

namespace
{

bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

bool isHexDigit(char c)
{
    return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool isIdentifierStart(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isIdentifierChar(char c)
{
    return isIdentifierStart(c) || isDigit(c);
}

struct KeywordEntry
{
    std::string_view text;
    TokenKind kind;
};

/// Sorted for binary search.
constexpr std::array<KeywordEntry, 17> kKeywords = {{
    {"abort", TokenKind::KwAbort},
    {"accept", TokenKind::KwAccept},
    {"else", TokenKind::KwElse},
    {"enum", TokenKind::KwEnum},
    {"false", TokenKind::KwFalse},
    {"filter", TokenKind::KwFilter},
    {"for", TokenKind::KwFor},
    {"function", TokenKind::KwFunction},
    {"if", TokenKind::KwIf},
    {"in", TokenKind::KwIn},
    {"let", TokenKind::KwLet},
    {"match", TokenKind::KwMatch},
    {"not", TokenKind::KwNot},
    {"record", TokenKind::KwRecord},
    {"reject", TokenKind::KwReject},
    {"return", TokenKind::KwReturn},
    {"true", TokenKind::KwTrue},
}};

} // namespace

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "end of input";
        case TokenKind::Error:
            return "invalid token";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::IntegerLiteral:
            return "integer literal";
        case TokenKind::StringLiteral:
            return "string literal";
        case TokenKind::IpLiteral:
            return "IP address literal";
        case TokenKind::PrefixLiteral:
            return "prefix literal";
        case TokenKind::AsnLiteral:
            return "ASN literal";
        case TokenKind::CommunityLiteral:
            return "community literal";
        case TokenKind::KwAbort:
            return "'abort'";
        case TokenKind::KwAccept:
            return "'accept'";
        case TokenKind::KwElse:
            return "'else'";
        case TokenKind::KwEnum:
            return "'enum'";
        case TokenKind::KwFalse:
            return "'false'";
        case TokenKind::KwFilter:
            return "'filter'";
        case TokenKind::KwFilterMap:
            return "'filter-map'";
        case TokenKind::KwFor:
            return "'for'";
        case TokenKind::KwFunction:
            return "'function'";
        case TokenKind::KwIf:
            return "'if'";
        case TokenKind::KwIn:
            return "'in'";
        case TokenKind::KwLet:
            return "'let'";
        case TokenKind::KwMatch:
            return "'match'";
        case TokenKind::KwNot:
            return "'not'";
        case TokenKind::KwRecord:
            return "'record'";
        case TokenKind::KwReject:
            return "'reject'";
        case TokenKind::KwReturn:
            return "'return'";
        case TokenKind::KwTrue:
            return "'true'";
        case TokenKind::Plus:
            return "'+'";
        case TokenKind::Minus:
            return "'-'";
        case TokenKind::Star:
            return "'*'";
        case TokenKind::Slash:
            return "'/'";
        case TokenKind::Percent:
            return "'%'";
        case TokenKind::Bang:
            return "'!'";
        case TokenKind::Equal:
            return "'='";
        case TokenKind::EqualEqual:
            return "'=='";
        case TokenKind::NotEqual:
            return "'!='";
        case TokenKind::Less:
            return "'<'";
        case TokenKind::LessEqual:
            return "'<='";
        case TokenKind::Greater:
            return "'>'";
        case TokenKind::GreaterEqual:
            return "'>='";
        case TokenKind::AmpAmp:
            return "'&&'";
        case TokenKind::PipePipe:
            return "'||'";
        case TokenKind::Dot:
            return "'.'";
        case TokenKind::Comma:
            return "','";
        case TokenKind::Colon:
            return "':'";
        case TokenKind::ColonColon:
            return "'::'";
        case TokenKind::Semicolon:
            return "';'";
        case TokenKind::LParen:
            return "'('";
        case TokenKind::RParen:
            return "')'";
        case TokenKind::LBrace:
            return "'{'";
        case TokenKind::RBrace:
            return "'}'";
        case TokenKind::LBracket:
            return "'['";
        case TokenKind::RBracket:
            return "']'";
        case TokenKind::FatArrow:
            return "'=>'";
        case TokenKind::Arrow:
            return "'->'";
    }
    return "token";
}

Lexer::Lexer(std::string source, uint32_t unitId, support::DiagnosticEngine &diag)
    : source_(std::move(source)), unitId_(unitId), diag_(diag)
{
}

std::optional<TokenKind> Lexer::lookupKeyword(std::string_view name)
{
    auto it = std::lower_bound(kKeywords.begin(), kKeywords.end(), name,
                               [](const KeywordEntry &e, std::string_view n) { return e.text < n; });
    if (it != kKeywords.end() && it->text == name)
        return it->kind;
    return std::nullopt;
}

char Lexer::peekChar(size_t offset) const
{
    size_t at = pos_ + offset;
    return at < source_.size() ? source_[at] : '\0';
}

char Lexer::getChar()
{
    return pos_ < source_.size() ? source_[pos_++] : '\0';
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

void Lexer::reportError(support::SourceSpan span, const std::string &message)
{
    diag_.report(support::makeError(support::DiagKind::LexError, message, span));
}

void Lexer::skipWhitespaceAndComments()
{
    while (!eof())
    {
        char c = peekChar();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r')
        {
            getChar();
        }
        else if (c == '/' && peekChar(1) == '/')
        {
            while (!eof() && peekChar() != '\n')
                getChar();
        }
        else if (c == '/' && peekChar(1) == '*')
        {
            size_t start = pos_;
            pos_ += 2;
            bool closed = false;
            while (!eof())
            {
                if (peekChar() == '*' && peekChar(1) == '/')
                {
                    pos_ += 2;
                    closed = true;
                    break;
                }
                getChar();
            }
            if (!closed)
            {
                reportError({static_cast<uint32_t>(start), static_cast<uint32_t>(pos_), unitId_},
                            "unterminated block comment");
            }
        }
        else
        {
            break;
        }
    }
}

Token Lexer::makeToken(TokenKind kind, size_t start)
{
    Token tok;
    tok.kind = kind;
    tok.span = {static_cast<uint32_t>(start), static_cast<uint32_t>(pos_), unitId_};
    tok.text = source_.substr(start, pos_ - start);
    return tok;
}

Token Lexer::lexIdentifierOrKeyword()
{
    size_t start = pos_;
    while (isIdentifierChar(peekChar()))
        getChar();
    std::string_view text(source_.data() + start, pos_ - start);

    if (text == "filter" && peekChar() == '-' && peekChar(1) == 'm' && peekChar(2) == 'a' &&
        peekChar(3) == 'p' && !isIdentifierChar(peekChar(4)))
    {
        pos_ += 4;
        return makeToken(TokenKind::KwFilterMap, start);
    }

    if (text.size() > 2 && text[0] == 'A' && text[1] == 'S' &&
        std::all_of(text.begin() + 2, text.end(), isDigit))
    {
        Token tok = makeToken(TokenKind::AsnLiteral, start);
        uint32_t value = 0;
        auto [end, ec] = std::from_chars(text.data() + 2, text.data() + text.size(), value);
        if (ec != std::errc() || end != text.data() + text.size())
        {
            reportError(tok.span, "AS number out of range: " + tok.text);
            tok.kind = TokenKind::Error;
            return tok;
        }
        tok.literal = runtime::Value::asn(runtime::Asn{value});
        return tok;
    }

    if (auto kw = lookupKeyword(text))
        return makeToken(*kw, start);
    return makeToken(TokenKind::Identifier, start);
}

Token Lexer::lexNumber()
{
    size_t start = pos_;

    if (peekChar() == '0' && (peekChar(1) == 'x' || peekChar(1) == 'X'))
    {
        pos_ += 2;
        while (isHexDigit(peekChar()))
            getChar();
        Token tok = makeToken(TokenKind::IntegerLiteral, start);
        uint64_t value = 0;
        std::string_view digits(source_.data() + start + 2, pos_ - start - 2);
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
        if (digits.empty() || ec != std::errc() || end != digits.data() + digits.size())
        {
            reportError(tok.span, digits.empty() ? "invalid hex literal: expected hex digits after 0x"
                                                 : "hex literal out of range");
            tok.kind = TokenKind::Error;
            return tok;
        }
        tok.literal = runtime::Value::integer(static_cast<int64_t>(value));
        return tok;
    }

    while (isDigit(peekChar()))
        getChar();

    if (peekChar() == '.' && isDigit(peekChar(1)))
        return lexDottedAddress(start);

    if (peekChar() == ':' && isDigit(peekChar(1)))
    {
        getChar();
        while (isDigit(peekChar()))
            getChar();
        Token tok = makeToken(TokenKind::CommunityLiteral, start);
        size_t colon = tok.text.find(':');
        unsigned asn = 0;
        unsigned value = 0;
        auto r1 = std::from_chars(tok.text.data(), tok.text.data() + colon, asn);
        auto r2 = std::from_chars(tok.text.data() + colon + 1, tok.text.data() + tok.text.size(),
                                  value);
        if (r1.ec != std::errc() || r2.ec != std::errc() || asn > 0xFFFF || value > 0xFFFF)
        {
            reportError(tok.span, "community out of range: " + tok.text);
            tok.kind = TokenKind::Error;
            return tok;
        }
        tok.literal = runtime::Value::community(
            runtime::Community::make(static_cast<uint16_t>(asn), static_cast<uint16_t>(value)));
        return tok;
    }

    Token tok = makeToken(TokenKind::IntegerLiteral, start);
    int64_t value = 0;
    auto [end, ec] = std::from_chars(tok.text.data(), tok.text.data() + tok.text.size(), value);
    if (ec != std::errc() || end != tok.text.data() + tok.text.size())
    {
        reportError(tok.span, "integer literal out of range: " + tok.text);
        tok.kind = TokenKind::Error;
        return tok;
    }
    tok.literal = runtime::Value::integer(value);
    return tok;
}

Token Lexer::lexDottedAddress(size_t start)
{
    // Consume the widest digit/dot run, then an optional /length.
    while (isDigit(peekChar()) || (peekChar() == '.' && isDigit(peekChar(1))))
        getChar();
    bool isPrefix = false;
    if (peekChar() == '/' && isDigit(peekChar(1)))
    {
        isPrefix = true;
        getChar();
        while (isDigit(peekChar()))
            getChar();
    }

    Token tok = makeToken(isPrefix ? TokenKind::PrefixLiteral : TokenKind::IpLiteral, start);
    if (isPrefix)
    {
        if (auto prefix = runtime::Prefix::parse(tok.text); prefix && !prefix->addr.v6)
        {
            tok.literal = runtime::Value::prefix(*prefix);
            return tok;
        }
        reportError(tok.span, "invalid prefix literal: " + tok.text);
    }
    else
    {
        if (auto ip = runtime::IpAddr::parse(tok.text); ip && !ip->v6)
        {
            tok.literal = runtime::Value::ipAddr(*ip);
            return tok;
        }
        reportError(tok.span, "invalid IPv4 address literal: " + tok.text);
    }
    tok.kind = TokenKind::Error;
    return tok;
}

Token Lexer::lexString()
{
    size_t start = pos_;
    getChar(); // opening quote
    std::string value;
    bool ok = true;

    while (!eof())
    {
        char c = peekChar();
        if (c == '"')
        {
            getChar();
            Token tok = makeToken(ok ? TokenKind::StringLiteral : TokenKind::Error, start);
            if (ok)
                tok.literal = runtime::Value::string(std::move(value));
            return tok;
        }
        if (c == '\n')
            break;
        getChar();
        if (c != '\\')
        {
            value += c;
            continue;
        }
        size_t escapeStart = pos_ - 1;
        char escaped = getChar();
        switch (escaped)
        {
            case 'n':
                value += '\n';
                break;
            case 't':
                value += '\t';
                break;
            case '0':
                value += '\0';
                break;
            case '\\':
            case '"':
                value += escaped;
                break;
            default:
                ok = false;
                reportError({static_cast<uint32_t>(escapeStart), static_cast<uint32_t>(pos_), unitId_},
                            std::string("invalid escape sequence: \\") + escaped);
                break;
        }
    }

    Token tok = makeToken(TokenKind::Error, start);
    reportError(tok.span, "unterminated string literal");
    return tok;
}

const Token &Lexer::peek()
{
    if (!peeked_)
        peeked_ = next();
    return *peeked_;
}

void Lexer::reset()
{
    pos_ = 0;
    peeked_.reset();
}

std::vector<Token> Lexer::tokenizeAll()
{
    std::vector<Token> tokens;
    while (true)
    {
        Token tok = next();
        if (tok.kind == TokenKind::Eof)
            break;
        tokens.push_back(std::move(tok));
    }
    return tokens;
}

Token Lexer::next()
{
    if (peeked_.has_value())
    {
        Token tok = std::move(*peeked_);
        peeked_.reset();
        return tok;
    }

    skipWhitespaceAndComments();

    if (eof())
    {
        Token tok;
        tok.kind = TokenKind::Eof;
        tok.span = {static_cast<uint32_t>(pos_), static_cast<uint32_t>(pos_), unitId_};
        return tok;
    }

    char c = peekChar();
    if (isIdentifierStart(c))
        return lexIdentifierOrKeyword();
    if (isDigit(c))
        return lexNumber();
    if (c == '"')
        return lexString();

    size_t start = pos_;
    getChar();

    // Two-character operators first.
    auto twoChar = [&](char second, TokenKind two, TokenKind one) {
        if (peekChar() == second)
        {
            getChar();
            return makeToken(two, start);
        }
        return makeToken(one, start);
    };

    switch (c)
    {
        case '+':
            return makeToken(TokenKind::Plus, start);
        case '-':
            return twoChar('>', TokenKind::Arrow, TokenKind::Minus);
        case '*':
            return makeToken(TokenKind::Star, start);
        case '/':
            return makeToken(TokenKind::Slash, start);
        case '%':
            return makeToken(TokenKind::Percent, start);
        case '!':
            return twoChar('=', TokenKind::NotEqual, TokenKind::Bang);
        case '=':
            if (peekChar() == '>')
            {
                getChar();
                return makeToken(TokenKind::FatArrow, start);
            }
            return twoChar('=', TokenKind::EqualEqual, TokenKind::Equal);
        case '<':
            return twoChar('=', TokenKind::LessEqual, TokenKind::Less);
        case '>':
            return twoChar('=', TokenKind::GreaterEqual, TokenKind::Greater);
        case ':':
            return twoChar(':', TokenKind::ColonColon, TokenKind::Colon);
        case '.':
            return makeToken(TokenKind::Dot, start);
        case ',':
            return makeToken(TokenKind::Comma, start);
        case ';':
            return makeToken(TokenKind::Semicolon, start);
        case '(':
            return makeToken(TokenKind::LParen, start);
        case ')':
            return makeToken(TokenKind::RParen, start);
        case '{':
            return makeToken(TokenKind::LBrace, start);
        case '}':
            return makeToken(TokenKind::RBrace, start);
        case '[':
            return makeToken(TokenKind::LBracket, start);
        case ']':
            return makeToken(TokenKind::RBracket, start);
        case '&':
            if (peekChar() == '&')
            {
                getChar();
                return makeToken(TokenKind::AmpAmp, start);
            }
            break;
        case '|':
            if (peekChar() == '|')
            {
                getChar();
                return makeToken(TokenKind::PipePipe, start);
            }
            break;
        default:
            // Swallow UTF-8 continuation bytes so the error covers one code point.
            while ((static_cast<unsigned char>(peekChar()) & 0xC0) == 0x80)
                getChar();
            break;
    }

    Token tok = makeToken(TokenKind::Error, start);
    reportError(tok.span, "unexpected character '" + tok.text + "'");
    return tok;
}

} // namespace sieve::frontend
