#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include <tree_scheme/reader.hpp>

using tree_scheme::Identifier;
using tree_scheme::int_type;
using tree_scheme::Node;
using tree_scheme::Token;

namespace {
Token open_paren() { return Token{ Token::Type::open_paren }; }
Token close_paren() { return Token{ Token::Type::close_paren }; }
Token quote_mark() { return Token{ Token::Type::quote }; }
Token identifier(std::string name) { return Token{ Token::Type::identifier, std::move(name) }; }
Token integer(int_type value) { return Token{ Token::Type::integer, value }; }
Token boolean(bool value) { return Token{ Token::Type::boolean, value }; }
Token string(std::string value) { return Token{ Token::Type::string, std::move(value) }; }

std::vector<Token> tokens(std::string_view input)
{
  auto result = tree_scheme::tokenize(input);
  REQUIRE(result.has_value());
  return *result;
}

std::string token_error(std::string_view input)
{
  const auto result = tree_scheme::tokenize(input);
  REQUIRE_FALSE(result.has_value());
  return tree_scheme::to_string(result.error());
}

std::string parse_error(std::string_view input)
{
  const auto result = tree_scheme::read(input);
  REQUIRE_FALSE(result.has_value());
  return tree_scheme::to_string(result.error());
}

Node id(std::string name) { return Node{ Identifier{ std::move(name) } }; }
Node num(int_type value) { return Node{ value }; }
}// namespace


TEST_CASE("simple lexing", "[lexer]")
{
  CHECK(tokens("(+ 2 3)") == std::vector{ open_paren(), identifier("+"), integer(2), integer(3), close_paren() });
  CHECK(tokens("(+ 21 325)") == std::vector{ open_paren(), identifier("+"), integer(21), integer(325), close_paren() });
  CHECK(tokens("(- 7 42)") == std::vector{ open_paren(), identifier("-"), integer(7), integer(42), close_paren() });
}

TEST_CASE("signed integers", "[lexer]")
{
  CHECK(tokens("(+ -8 +2 -33)") == std::vector{ open_paren(), identifier("+"), integer(-8), integer(2), integer(-33), close_paren() });
  CHECK(tokens("-9223372036854775808") == std::vector{ integer(std::numeric_limits<int_type>::min()) });
  CHECK(token_error("99999999999999999999")
        == "SyntaxError: Integer literal out of range: 99999999999999999999 (line: 1, column: 21)");
}

TEST_CASE("booleans", "[lexer]")
{
  CHECK(tokens("#t") == std::vector{ boolean(true) });
  CHECK(tokens("#f") == std::vector{ boolean(false) });
  CHECK(token_error("#x") == "SyntaxError: Unexpected character when looking for t/f: x (line: 1, column: 2)");
  CHECK(token_error("#") == "SyntaxError: Unexpected character when looking for t/f: end of input (line: 1, column: 2)");
}

TEST_CASE("identifiers", "[lexer]")
{
  for (const std::string_view name : { "*", "<", "<=", "if", "while", "$t$%*=:t059s", "set!", "λ", "a-b+c#" }) {
    CHECK(tokens(name) == std::vector{ identifier(std::string{ name }) });
  }
}

TEST_CASE("strings", "[lexer]")
{
  CHECK(tokens(R"("hello")") == std::vector{ string("hello") });
  CHECK(tokens(R"("a _ $ snthoeau(*&G#$()*^!")") == std::vector{ string("a _ $ snthoeau(*&G#$()*^!") });
  CHECK(tokens(R"("")") == std::vector{ string("") });
  CHECK(token_error(R"("truncated)") == "SyntaxError: Expected end quote, but found EOF instead (line: 1, column: 11)");
}

TEST_CASE("whitespace", "[lexer]")
{
  CHECK(tokens("(+ 1 1)\n(+\n    2\t2 \n )\r\n  \n")
        == std::vector{ open_paren(),
          identifier("+"),
          integer(1),
          integer(1),
          close_paren(),
          open_paren(),
          identifier("+"),
          integer(2),
          integer(2),
          close_paren() });
  CHECK(tokens("").empty());
  CHECK(tokens(" \n\t ").empty());
}

TEST_CASE("comments", "[lexer]")
{
  CHECK(tokens("; nothing here") == std::vector<Token>{});
  CHECK(tokens("(+ 1 ; one\n 2)") == std::vector{ open_paren(), identifier("+"), integer(1), integer(2), close_paren() });
  CHECK(tokens("x;y") == std::vector{ identifier("x") });
}

TEST_CASE("bad syntax", "[lexer]")
{
  CHECK(token_error(R"((\))") == R"(SyntaxError: Unexpected character: \ (line: 1, column: 2))");
}

TEST_CASE("delimiter checking", "[lexer]")
{
  CHECK(token_error("(+-)") == "SyntaxError: Unexpected character when looking for a delimiter: - (line: 1, column: 3)");
  CHECK(
    token_error("(-22+)") == "SyntaxError: Unexpected character when looking for a delimiter: + (line: 1, column: 5)");
  CHECK(token_error("(22+)") == "SyntaxError: Unexpected character when looking for a delimiter: + (line: 1, column: 4)");
  CHECK(token_error("(+ 2 3)\n(+ 1 2-)")
        == "SyntaxError: Unexpected character when looking for a delimiter: - (line: 2, column: 7)");
  CHECK(token_error("#t#f") == "SyntaxError: Unexpected character when looking for a delimiter: # (line: 1, column: 3)");
}

TEST_CASE("quoting", "[lexer]")
{
  CHECK(tokens("'(a)") == std::vector{ quote_mark(), open_paren(), identifier("a"), close_paren() });
  CHECK(tokens("'('a 'b)") == std::vector{ quote_mark(), open_paren(), quote_mark(), identifier("a"), quote_mark(), identifier("b"), close_paren() });
  CHECK(tokens("(list 'a b)") == std::vector{ open_paren(), identifier("list"), quote_mark(), identifier("a"), identifier("b"), close_paren() });
}

TEST_CASE("parsing builds nested nodes", "[parser]")
{
  const auto nodes = tree_scheme::read("(+ 1 (- 3 2)) #t \"s\"");
  REQUIRE(nodes.has_value());
  CHECK(*nodes
        == std::vector{ Node{ std::vector{ id("+"), num(1), Node{ std::vector{ id("-"), num(3), num(2) } } } },
          Node{ true },
          Node{ std::string{ "s" } } });

  const auto empty = tree_scheme::read("()");
  REQUIRE(empty.has_value());
  CHECK(*empty == std::vector{ Node{ std::vector<Node>{} } });
}

TEST_CASE("quote shorthand", "[parser]")
{
  const auto nodes = tree_scheme::read("'x '(a b)");
  REQUIRE(nodes.has_value());
  CHECK(*nodes
        == std::vector{ Node{ std::vector{ id("quote"), id("x") } },
          Node{ std::vector{ id("quote"), Node{ std::vector{ id("a"), id("b") } } } } });
}

TEST_CASE("parser errors", "[parser]")
{
  CHECK(parse_error("(+ 1 2") == "SyntaxError: Expected ')', found end of input");
  CHECK(parse_error("(+ 1 2))") == "SyntaxError: Unexpected ')'");
  CHECK(parse_error(")") == "SyntaxError: Unexpected ')'");
  CHECK(parse_error("'") == "SyntaxError: Expected an expression, found end of input");
  CHECK(parse_error("(\"open") == "SyntaxError: Expected end quote, but found EOF instead (line: 1, column: 7)");
}
