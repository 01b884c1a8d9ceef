#ifndef TREE_SCHEME_READER_HPP
#define TREE_SCHEME_READER_HPP

#include "tree_scheme.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace tree_scheme {

struct SyntaxError
{
  std::string message;
  // 1-based, 0 when the error has no position in the source
  std::size_t line{ 0 };
  std::size_t column{ 0 };

  [[nodiscard]] bool operator==(const SyntaxError &) const noexcept = default;
};

[[nodiscard]] inline std::string to_string(const SyntaxError &error)
{
  if (error.line == 0) { return "SyntaxError: " + error.message; }
  return "SyntaxError: " + error.message + " (line: " + std::to_string(error.line)
         + ", column: " + std::to_string(error.column) + ")";
}

struct Token
{
  enum struct Type : std::uint8_t { open_paren, close_paren, quote, identifier, integer, boolean, string };

  Type type{ Type::open_paren };
  std::variant<std::monostate, std::string, int_type, bool> value{};

  [[nodiscard]] bool operator==(const Token &) const noexcept = default;
};

namespace detail {
  [[nodiscard]] constexpr bool is_whitespace(const char ch) noexcept
  {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
  }

  [[nodiscard]] constexpr bool is_digit(const char ch) noexcept { return ch >= '0' && ch <= '9'; }

  // bytes above 0x7f are let through so UTF-8 names like `λ` can be written
  [[nodiscard]] constexpr bool is_identifier_start(const char ch) noexcept
  {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || std::string_view{ "!$%&*/:<=>?_^" }.contains(ch)
           || static_cast<unsigned char>(ch) > 0x7f;
  }

  [[nodiscard]] constexpr bool is_identifier_char(const char ch) noexcept
  {
    return is_identifier_start(ch) || is_digit(ch) || ch == '+' || ch == '-' || ch == '#';
  }

  class Lexer
  {
  public:
    explicit Lexer(std::string_view t_input) noexcept : input{ t_input } {}

    [[nodiscard]] std::expected<std::vector<Token>, SyntaxError> run()
    {
      while (const auto ch = current()) {
        if (is_whitespace(*ch)) {
          advance();
        } else if (*ch == ';') {
          while (current() && *current() != '\n') { advance(); }
        } else if (*ch == '(') {
          tokens.push_back(Token{ Token::Type::open_paren });
          advance();
        } else if (*ch == ')') {
          tokens.push_back(Token{ Token::Type::close_paren });
          advance();
        } else if (*ch == '\'') {
          tokens.push_back(Token{ Token::Type::quote });
          advance();
        } else {
          if (auto result = read_atom(*ch); !result) { return std::unexpected(std::move(result.error())); }
          if (auto result = expect_delimiter(); !result) { return std::unexpected(std::move(result.error())); }
        }
      }

      return std::move(tokens);
    }

  private:
    std::string_view input;
    std::size_t position{ 0 };
    std::size_t line{ 1 };
    std::size_t column{ 1 };
    std::vector<Token> tokens;

    [[nodiscard]] std::optional<char> current() const noexcept
    {
      if (position < input.size()) { return input[position]; }
      return std::nullopt;
    }

    [[nodiscard]] std::optional<char> peek() const noexcept
    {
      if (position + 1 < input.size()) { return input[position + 1]; }
      return std::nullopt;
    }

    void advance() noexcept
    {
      if (current() == '\n') {
        ++line;
        column = 1;
      } else {
        ++column;
      }
      ++position;
    }

    [[nodiscard]] std::unexpected<SyntaxError> error(std::string message) const
    {
      return std::unexpected(SyntaxError{ std::move(message), line, column });
    }

    [[nodiscard]] static std::string describe(const std::optional<char> ch)
    {
      if (ch) { return std::string(1, *ch); }
      return "end of input";
    }

    [[nodiscard]] std::expected<void, SyntaxError> read_atom(const char ch)
    {
      if ((ch == '+' || ch == '-') && peek() && is_digit(*peek())) {
        // `+` is not accepted by from_chars, `-` is
        if (ch == '+') { advance(); }
        return read_integer();
      }

      if (ch == '+' || ch == '-') {
        tokens.push_back(Token{ Token::Type::identifier, std::string(1, ch) });
        advance();
        return {};
      }

      if (is_digit(ch)) { return read_integer(); }
      if (ch == '#') { return read_boolean(); }
      if (ch == '"') { return read_string(); }

      if (is_identifier_start(ch)) {
        const auto start = position;
        while (current() && is_identifier_char(*current())) { advance(); }
        tokens.push_back(Token{ Token::Type::identifier, std::string{ input.substr(start, position - start) } });
        return {};
      }

      return error("Unexpected character: " + describe(ch));
    }

    [[nodiscard]] std::expected<void, SyntaxError> read_integer()
    {
      const auto start = position;
      if (current() == '-') { advance(); }
      while (current() && is_digit(*current())) { advance(); }

      const auto text = input.substr(start, position - start);
      int_type value{};
      const auto [end, errc] = std::from_chars(text.data(), text.data() + text.size(), value);
      if (errc != std::errc{} || end != text.data() + text.size()) {
        return error("Integer literal out of range: " + std::string{ text });
      }

      tokens.push_back(Token{ Token::Type::integer, value });
      return {};
    }

    [[nodiscard]] std::expected<void, SyntaxError> read_boolean()
    {
      advance();

      const auto ch = current();
      if (ch != 't' && ch != 'f') { return error("Unexpected character when looking for t/f: " + describe(ch)); }

      tokens.push_back(Token{ Token::Type::boolean, ch == 't' });
      advance();
      return {};
    }

    [[nodiscard]] std::expected<void, SyntaxError> read_string()
    {
      advance();

      // no escapes, everything up to the next `"` is the string
      const auto start = position;
      while (current() != '"') {
        if (!current()) { return error("Expected end quote, but found EOF instead"); }
        advance();
      }

      tokens.push_back(Token{ Token::Type::string, std::string{ input.substr(start, position - start) } });
      advance();
      return {};
    }

    // everything but `(` and `'` has to be followed by whitespace, `)`, a comment or the end of input
    [[nodiscard]] std::expected<void, SyntaxError> expect_delimiter()
    {
      const auto ch = current();
      if (!ch || is_whitespace(*ch) || *ch == ')' || *ch == ';') { return {}; }
      return error("Unexpected character when looking for a delimiter: " + describe(ch));
    }
  };

  [[nodiscard]] inline std::expected<Node, SyntaxError> parse_expression(std::span<const Token> tokens,
    std::size_t &position)
  {
    if (position >= tokens.size()) { return std::unexpected(SyntaxError{ "Expected an expression, found end of input" }); }

    const auto &token = tokens[position++];

    switch (token.type) {
    case Token::Type::open_paren: {
      std::vector<Node> items;
      while (position < tokens.size() && tokens[position].type != Token::Type::close_paren) {
        auto item = parse_expression(tokens, position);
        if (!item) { return item; }
        items.push_back(std::move(*item));
      }
      if (position >= tokens.size()) { return std::unexpected(SyntaxError{ "Expected ')', found end of input" }); }
      ++position;
      return Node{ std::move(items) };
    }
    case Token::Type::close_paren:
      return std::unexpected(SyntaxError{ "Unexpected ')'" });
    case Token::Type::quote: {
      // 'x is (quote x)
      auto quoted = parse_expression(tokens, position);
      if (!quoted) { return quoted; }
      return Node{ std::vector<Node>{ Node{ Identifier{ "quote" } }, std::move(*quoted) } };
    }
    case Token::Type::identifier:
      return Node{ Identifier{ std::get<std::string>(token.value) } };
    case Token::Type::integer:
      return Node{ std::get<int_type>(token.value) };
    case Token::Type::boolean:
      return Node{ std::get<bool>(token.value) };
    case Token::Type::string:
      return Node{ std::get<std::string>(token.value) };
    }

    return std::unexpected(SyntaxError{ "Unknown token" });
  }
}// namespace detail

[[nodiscard]] inline std::expected<std::vector<Token>, SyntaxError> tokenize(std::string_view input)
{
  return detail::Lexer{ input }.run();
}

[[nodiscard]] inline std::expected<std::vector<Node>, SyntaxError> parse(std::span<const Token> tokens)
{
  std::vector<Node> result;
  std::size_t position = 0;
  while (position < tokens.size()) {
    auto node = detail::parse_expression(tokens, position);
    if (!node) { return std::unexpected(std::move(node.error())); }
    result.push_back(std::move(*node));
  }
  return result;
}

[[nodiscard]] inline std::expected<std::vector<Node>, SyntaxError> read(std::string_view input)
{
  const auto tokens = tokenize(input);
  if (!tokens) { return std::unexpected(tokens.error()); }
  return parse(*tokens);
}

}// namespace tree_scheme

#endif
