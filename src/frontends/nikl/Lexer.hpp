//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Lexical analyzer for the Nikl scripting language.
///
/// The lexer makes a single forward pass over the source with one character
/// of lookahead and produces the complete token stream, always terminated by
/// an Eof token. The first lexical error aborts the scan; the remaining input
/// is not examined.
///
/// Lexical errors form a closed set (see LexErrorKind). Each is reported as a
/// Diagnostic whose code identifies the kind and whose location is the start
/// of the offending lexeme.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/nikl/Token.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nikl::frontends
{

/// @brief The three ways tokenization can fail.
enum class LexErrorKind
{
    UnexpectedChar,     ///< N1001
    UnterminatedString, ///< N1002
    InvalidNumber,      ///< N1003
};

/// @brief Diagnostic code for a lexical error kind.
const char *lexErrorCode(LexErrorKind kind);

/// @brief Tokenizer for Nikl source text.
class Lexer
{
  public:
    /// @brief Create a lexer over @p source.
    /// @param fileId SourceManager id stamped on every token; 0 when the text
    ///        has no backing file.
    explicit Lexer(std::string source, uint32_t fileId = 0);

    /// @brief Scan the whole source.
    /// @return Token stream ending in Eof, or the first lexical error.
    support::Expected<std::vector<Token>> tokenize();

  private:
    //=========================================================================
    // Character Handling
    //=========================================================================

    char peekChar() const;
    char peekChar(size_t offset) const;

    /// @brief Consume one byte, advancing line/column.
    /// @details A newline moves to column 1 of the next line. UTF-8
    ///          continuation bytes do not advance the column.
    char getChar();

    bool eof() const;

    /// @brief Byte length of the identifier character at the cursor, or 0.
    /// @param start Whether the character would begin the identifier.
    size_t identifierCharLength(bool start) const;
    support::SourceLoc currentLoc() const;

    support::Diag makeLexError(LexErrorKind kind,
                               support::SourceLoc loc,
                               std::string_view lexeme) const;

    //=========================================================================
    // Scanning
    //=========================================================================

    void skipWhitespaceAndComments();
    void skipLineComment();

    support::Expected<Token> next();
    Token lexIdentifierOrKeyword();
    support::Expected<Token> lexNumber();
    support::Expected<Token> lexString();
    support::Expected<Token> lexOperator();

    static std::optional<TokenKind> lookupKeyword(std::string_view name);

    std::string source_;
    uint32_t fileId_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
};

/// @brief Convenience wrapper: `Lexer(source, fileId).tokenize()`.
support::Expected<std::vector<Token>> tokenize(std::string_view source, uint32_t fileId = 0);

} // namespace nikl::frontends
