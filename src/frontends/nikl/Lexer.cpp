//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Implementation of the Nikl lexical analyzer.
///
/// @details
///
/// ## Keyword Lookup
///
/// Keywords, boolean literals and type names share one sorted array
/// (kKeywordTable) searched with std::lower_bound. Lookup is case-sensitive:
/// `True` is a literal, `true` an identifier.
///
/// ## Number Literals
///
/// Decimal digits with at most one '.'. No dot yields an integer literal that
/// must fit in int64_t; one dot yields a float literal. A second dot is an
/// invalid-number error covering the whole digit/dot run.
///
/// ## Operators
///
/// Two-character operators (`==`, `!=`, `<=`, `>=`, `->`) are matched before
/// their single-character forms. A lone `!` is an unexpected character.
///
/// ## Identifiers
///
/// Identifiers start with a letter or '_' and continue with letters, digits
/// or '_'. Besides ASCII, any UTF-8 encoded scalar in one of the alphabetic
/// ranges of kUnicodeLetters counts as a letter, and the decimal digit ranges
/// of kUnicodeDigits as digits. Malformed UTF-8 never forms an identifier.
///
/// @see Lexer.hpp for the class interface
///
//===----------------------------------------------------------------------===//

#include "frontends/nikl/Lexer.hpp"

#include "support/debug_trace.hpp"

#include <algorithm>
#include <array>
#include <charconv>

namespace nikl::frontends
{

//===----------------------------------------------------------------------===//
// TokenKind to string conversion
//===----------------------------------------------------------------------===//

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "end of input";
        case TokenKind::IntegerLiteral:
            return "integer";
        case TokenKind::FloatLiteral:
            return "float";
        case TokenKind::StringLiteral:
            return "string";
        case TokenKind::BooleanLiteral:
            return "boolean";
        case TokenKind::Identifier:
            return "identifier";

        // Keywords
        case TokenKind::KwImport:
            return "'import'";
        case TokenKind::KwPub:
            return "'pub'";
        case TokenKind::KwAs:
            return "'as'";
        case TokenKind::KwLet:
            return "'let'";
        case TokenKind::KwConst:
            return "'const'";
        case TokenKind::KwFn:
            return "'fn'";
        case TokenKind::KwSpawn:
            return "'spawn'";
        case TokenKind::KwWait:
            return "'wait'";
        case TokenKind::KwReturn:
            return "'return'";
        case TokenKind::KwDel:
            return "'del'";
        case TokenKind::KwIn:
            return "'in'";
        case TokenKind::KwIf:
            return "'if'";
        case TokenKind::KwElif:
            return "'elif'";
        case TokenKind::KwElse:
            return "'else'";
        case TokenKind::KwFor:
            return "'for'";
        case TokenKind::KwWhile:
            return "'while'";
        case TokenKind::KwLoop:
            return "'loop'";
        case TokenKind::KwBreak:
            return "'break'";
        case TokenKind::KwContinue:
            return "'continue'";
        case TokenKind::KwAnd:
            return "'and'";
        case TokenKind::KwOr:
            return "'or'";
        case TokenKind::KwNot:
            return "'not'";

        // Type names
        case TokenKind::TyInt:
            return "'Int'";
        case TokenKind::TyFloat:
            return "'Float'";
        case TokenKind::TyString:
            return "'String'";
        case TokenKind::TyBool:
            return "'Bool'";
        case TokenKind::TyArray:
            return "'Array'";
        case TokenKind::TyTuple:
            return "'Tuple'";
        case TokenKind::TyHashMap:
            return "'HashMap'";

        // Operators
        case TokenKind::Plus:
            return "'+'";
        case TokenKind::Minus:
            return "'-'";
        case TokenKind::Star:
            return "'*'";
        case TokenKind::Slash:
            return "'/'";
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
        case TokenKind::Arrow:
            return "'->'";

        // Punctuation
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
        case TokenKind::Comma:
            return "','";
        case TokenKind::Colon:
            return "':'";
        case TokenKind::Dot:
            return "'.'";
    }
    return "?";
}

bool Token::isKeyword() const
{
    return kind >= TokenKind::KwImport && kind <= TokenKind::KwNot;
}

bool Token::isTypeName() const
{
    return kind >= TokenKind::TyInt && kind <= TokenKind::TyHashMap;
}

std::string describeToken(const Token &tok)
{
    if (tok.is(TokenKind::Eof))
        return "end of input";
    return "'" + tok.text + "'";
}

const char *lexErrorCode(LexErrorKind kind)
{
    switch (kind)
    {
        case LexErrorKind::UnexpectedChar:
            return "N1001";
        case LexErrorKind::UnterminatedString:
            return "N1002";
        case LexErrorKind::InvalidNumber:
            return "N1003";
    }
    return "N1000";
}

//===----------------------------------------------------------------------===//
// Keyword lookup table
//===----------------------------------------------------------------------===//

namespace
{

struct KeywordEntry
{
    std::string_view key;
    TokenKind kind;
};

// Sorted by byte value for binary search; uppercase sorts first.
constexpr std::array<KeywordEntry, 31> kKeywordTable = {{
    {"Array", TokenKind::TyArray},
    {"Bool", TokenKind::TyBool},
    {"False", TokenKind::BooleanLiteral},
    {"Float", TokenKind::TyFloat},
    {"HashMap", TokenKind::TyHashMap},
    {"Int", TokenKind::TyInt},
    {"String", TokenKind::TyString},
    {"True", TokenKind::BooleanLiteral},
    {"Tuple", TokenKind::TyTuple},
    {"and", TokenKind::KwAnd},
    {"as", TokenKind::KwAs},
    {"break", TokenKind::KwBreak},
    {"const", TokenKind::KwConst},
    {"continue", TokenKind::KwContinue},
    {"del", TokenKind::KwDel},
    {"elif", TokenKind::KwElif},
    {"else", TokenKind::KwElse},
    {"fn", TokenKind::KwFn},
    {"for", TokenKind::KwFor},
    {"if", TokenKind::KwIf},
    {"import", TokenKind::KwImport},
    {"in", TokenKind::KwIn},
    {"let", TokenKind::KwLet},
    {"loop", TokenKind::KwLoop},
    {"not", TokenKind::KwNot},
    {"or", TokenKind::KwOr},
    {"pub", TokenKind::KwPub},
    {"return", TokenKind::KwReturn},
    {"spawn", TokenKind::KwSpawn},
    {"wait", TokenKind::KwWait},
    {"while", TokenKind::KwWhile},
}};

inline bool isLetter(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

inline bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

inline bool isWhitespace(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

inline bool isIdentifierStart(char c)
{
    return isLetter(c) || c == '_';
}

inline bool isIdentifierContinue(char c)
{
    return isLetter(c) || isDigit(c) || c == '_';
}

inline bool isUtf8Continuation(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

struct CodePointRange
{
    char32_t first;
    char32_t last;
};

/// Alphabetic code points outside ASCII, sorted and disjoint.
constexpr std::array<CodePointRange, 40> kUnicodeLetters{{
    {0x00AA, 0x00AA}, {0x00B5, 0x00B5}, {0x00BA, 0x00BA}, {0x00C0, 0x00D6},
    {0x00D8, 0x00F6}, {0x00F8, 0x02C1}, {0x02C6, 0x02D1}, {0x02E0, 0x02E4},
    {0x0370, 0x0374}, {0x0376, 0x037D}, {0x037F, 0x037F}, {0x0386, 0x0386},
    {0x0388, 0x03FF}, {0x0400, 0x0481}, {0x048A, 0x052F}, {0x0531, 0x0556},
    {0x0560, 0x0588}, {0x05D0, 0x05EA}, {0x0620, 0x064A}, {0x0671, 0x06D3},
    {0x0904, 0x0939}, {0x0E01, 0x0E30}, {0x10A0, 0x10FF}, {0x1100, 0x11FF},
    {0x1E00, 0x1FBC}, {0x1FC2, 0x1FFC}, {0x2C00, 0x2CE4}, {0x3041, 0x3096},
    {0x30A1, 0x30FA}, {0x3105, 0x312F}, {0x3131, 0x318E}, {0x3400, 0x4DBF},
    {0x4E00, 0x9FFF}, {0xA000, 0xA48C}, {0xAC00, 0xD7A3}, {0xF900, 0xFAFF},
    {0xFF21, 0xFF3A}, {0xFF41, 0xFF5A}, {0xFF66, 0xFFDC}, {0x20000, 0x2FA1F},
}};

/// Decimal digit code points outside ASCII, sorted and disjoint.
constexpr std::array<CodePointRange, 6> kUnicodeDigits{{
    {0x0660, 0x0669},
    {0x06F0, 0x06F9},
    {0x0966, 0x096F},
    {0x09E6, 0x09EF},
    {0x0E50, 0x0E59},
    {0xFF10, 0xFF19},
}};

template <size_t N>
bool inRanges(const std::array<CodePointRange, N> &ranges, char32_t cp)
{
    auto it = std::lower_bound(ranges.begin(),
                               ranges.end(),
                               cp,
                               [](const CodePointRange &range, char32_t key)
                               { return range.last < key; });
    return it != ranges.end() && it->first <= cp;
}

/// @brief Decode the UTF-8 sequence starting at @p pos.
/// @return Sequence length in bytes, or 0 when the bytes are malformed.
size_t decodeUtf8(std::string_view text, size_t pos, char32_t &cp)
{
    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t length = 0;
    if (lead >= 0xC2 && lead <= 0xDF)
    {
        length = 2;
        cp = lead & 0x1F;
    }
    else if (lead >= 0xE0 && lead <= 0xEF)
    {
        length = 3;
        cp = lead & 0x0F;
    }
    else if (lead >= 0xF0 && lead <= 0xF4)
    {
        length = 4;
        cp = lead & 0x07;
    }
    else
    {
        return 0;
    }

    if (pos + length > text.size())
        return 0;
    for (size_t i = 1; i < length; ++i)
    {
        const char c = text[pos + i];
        if (!isUtf8Continuation(c))
            return 0;
        cp = (cp << 6) | (static_cast<unsigned char>(c) & 0x3F);
    }

    // Reject overlong forms, surrogates and values past U+10FFFF.
    static constexpr char32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[length] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
        return 0;
    return length;
}

} // anonymous namespace

std::optional<TokenKind> Lexer::lookupKeyword(std::string_view name)
{
    auto it = std::lower_bound(kKeywordTable.begin(),
                               kKeywordTable.end(),
                               name,
                               [](const KeywordEntry &entry, std::string_view key)
                               { return entry.key < key; });
    if (it != kKeywordTable.end() && it->key == name)
        return it->kind;
    return std::nullopt;
}

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string source, uint32_t fileId) : source_(std::move(source)), fileId_(fileId)
{
}

char Lexer::peekChar() const
{
    if (pos_ >= source_.size())
        return '\0';
    return source_[pos_];
}

char Lexer::peekChar(size_t offset) const
{
    if (pos_ + offset >= source_.size())
        return '\0';
    return source_[pos_ + offset];
}

size_t Lexer::identifierCharLength(bool start) const
{
    if (eof())
        return 0;

    const char c = source_[pos_];
    if (static_cast<unsigned char>(c) < 0x80)
    {
        const bool ok = start ? isIdentifierStart(c) : isIdentifierContinue(c);
        return ok ? 1 : 0;
    }

    char32_t cp = 0;
    const size_t length = decodeUtf8(source_, pos_, cp);
    if (length == 0)
        return 0;
    if (inRanges(kUnicodeLetters, cp) || (!start && inRanges(kUnicodeDigits, cp)))
        return length;
    return 0;
}

char Lexer::getChar()
{
    if (pos_ >= source_.size())
        return '\0';
    char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else if (!isUtf8Continuation(c))
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

support::SourceLoc Lexer::currentLoc() const
{
    return support::SourceLoc{fileId_, line_, column_};
}

support::Diag Lexer::makeLexError(LexErrorKind kind,
                                  support::SourceLoc loc,
                                  std::string_view lexeme) const
{
    std::string where =
        " at line " + std::to_string(loc.line) + ", column " + std::to_string(loc.column);
    std::string message;
    switch (kind)
    {
        case LexErrorKind::UnexpectedChar:
            message = "Unexpected character '" + std::string(lexeme) + "'" + where;
            break;
        case LexErrorKind::UnterminatedString:
            message = "Unterminated string starting" + where;
            break;
        case LexErrorKind::InvalidNumber:
            message = "Invalid number '" + std::string(lexeme) + "'" + where;
            break;
    }
    return support::makeError(loc, std::move(message), lexErrorCode(kind));
}

void Lexer::skipLineComment()
{
    getChar();
    getChar();
    while (!eof() && peekChar() != '\n')
        getChar();
}

void Lexer::skipWhitespaceAndComments()
{
    while (!eof())
    {
        char c = peekChar();

        if (isWhitespace(c))
        {
            getChar();
            continue;
        }

        if (c == '/' && peekChar(1) == '/')
        {
            skipLineComment();
            continue;
        }

        break;
    }
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();

    for (size_t n = identifierCharLength(false); n != 0; n = identifierCharLength(false))
    {
        for (size_t i = 0; i < n; ++i)
            tok.text.push_back(getChar());
    }

    if (auto kw = lookupKeyword(tok.text))
    {
        tok.kind = *kw;
        if (tok.kind == TokenKind::BooleanLiteral)
            tok.boolValue = tok.text == "True";
        return tok;
    }

    tok.kind = TokenKind::Identifier;
    return tok;
}

support::Expected<Token> Lexer::lexNumber()
{
    Token tok;
    tok.loc = currentLoc();

    int dots = 0;
    while (!eof() && (isDigit(peekChar()) || peekChar() == '.'))
    {
        char c = getChar();
        if (c == '.')
            ++dots;
        tok.text.push_back(c);
    }

    if (dots > 1)
        return makeLexError(LexErrorKind::InvalidNumber, tok.loc, tok.text);

    const char *first = tok.text.data();
    const char *last = first + tok.text.size();

    if (dots == 0)
    {
        auto [ptr, ec] = std::from_chars(first, last, tok.intValue);
        if (ec != std::errc() || ptr != last)
            return makeLexError(LexErrorKind::InvalidNumber, tok.loc, tok.text);
        tok.kind = TokenKind::IntegerLiteral;
        return tok;
    }

    auto [ptr, ec] = std::from_chars(first, last, tok.floatValue);
    if (ec != std::errc() || ptr != last)
        return makeLexError(LexErrorKind::InvalidNumber, tok.loc, tok.text);
    tok.kind = TokenKind::FloatLiteral;
    return tok;
}

support::Expected<Token> Lexer::lexString()
{
    Token tok;
    tok.loc = currentLoc();
    tok.text.push_back(getChar()); // opening quote

    while (!eof() && peekChar() != '"')
    {
        char c = getChar();
        tok.text.push_back(c);
        tok.stringValue.push_back(c);
    }

    if (eof())
        return makeLexError(LexErrorKind::UnterminatedString, tok.loc, tok.text);

    tok.text.push_back(getChar()); // closing quote
    tok.kind = TokenKind::StringLiteral;
    return tok;
}

support::Expected<Token> Lexer::lexOperator()
{
    Token tok;
    tok.loc = currentLoc();

    auto single = [&](TokenKind kind) -> Token
    {
        tok.kind = kind;
        tok.text.push_back(getChar());
        return tok;
    };
    auto pairOr = [&](char second, TokenKind pairKind, TokenKind singleKind) -> Token
    {
        tok.text.push_back(getChar());
        if (peekChar() == second)
        {
            tok.text.push_back(getChar());
            tok.kind = pairKind;
        }
        else
        {
            tok.kind = singleKind;
        }
        return tok;
    };

    char c = peekChar();
    switch (c)
    {
        case '+':
            return single(TokenKind::Plus);
        case '*':
            return single(TokenKind::Star);
        case '/':
            return single(TokenKind::Slash);
        case '-':
            return pairOr('>', TokenKind::Arrow, TokenKind::Minus);
        case '=':
            return pairOr('=', TokenKind::EqualEqual, TokenKind::Equal);
        case '<':
            return pairOr('=', TokenKind::LessEqual, TokenKind::Less);
        case '>':
            return pairOr('=', TokenKind::GreaterEqual, TokenKind::Greater);
        case '!':
            if (peekChar(1) == '=')
            {
                tok.text = "!=";
                getChar();
                getChar();
                tok.kind = TokenKind::NotEqual;
                return tok;
            }
            return makeLexError(LexErrorKind::UnexpectedChar, tok.loc, "!");
        case '(':
            return single(TokenKind::LParen);
        case ')':
            return single(TokenKind::RParen);
        case '{':
            return single(TokenKind::LBrace);
        case '}':
            return single(TokenKind::RBrace);
        case '[':
            return single(TokenKind::LBracket);
        case ']':
            return single(TokenKind::RBracket);
        case ',':
            return single(TokenKind::Comma);
        case ':':
            return single(TokenKind::Colon);
        case '.':
            return single(TokenKind::Dot);
        default:
            break;
    }

    // Report the whole UTF-8 sequence rather than its lead byte.
    std::string lexeme(1, c);
    for (size_t i = 1; isUtf8Continuation(peekChar(i)); ++i)
        lexeme.push_back(peekChar(i));
    return makeLexError(LexErrorKind::UnexpectedChar, tok.loc, lexeme);
}

support::Expected<Token> Lexer::next()
{
    char c = peekChar();

    if (identifierCharLength(true) != 0)
        return lexIdentifierOrKeyword();

    if (isDigit(c))
        return lexNumber();

    if (c == '"')
        return lexString();

    return lexOperator();
}

support::Expected<std::vector<Token>> Lexer::tokenize()
{
    std::vector<Token> tokens;
    while (true)
    {
        skipWhitespaceAndComments();
        if (eof())
            break;

        auto tok = next();
        if (!tok)
            return tok.error();
        tokens.push_back(std::move(tok.value()));
    }

    Token eofTok;
    eofTok.kind = TokenKind::Eof;
    eofTok.loc = currentLoc();
    tokens.push_back(std::move(eofTok));

    if (support::isDebugTraceEnabled())
        support::debugTrace("lex", std::to_string(tokens.size()) + " tokens");
    return tokens;
}

support::Expected<std::vector<Token>> tokenize(std::string_view source, uint32_t fileId)
{
    return Lexer(std::string(source), fileId).tokenize();
}

} // namespace nikl::frontends
