/*
MIT License

Copyright (c) 2023-2024 Jason Turner

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifndef TREE_SCHEME_HPP
#define TREE_SCHEME_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/// Goals
// * plain tree walking, the syntax tree is the program
// * every special form is an ordinary procedure that receives its operands unevaluated
// * scopes are shared, never copied, and go away with their last reference
// * no exceptions, every failure comes back as an std::expected
// * C++23 as a minimum
// * never thread safe

/// Notes
// it's a scheme-like language with a few caveats:
// * only `#f` is false, `0` and `()` are both true
// * `define` never overwrites a local binding, `set!` never creates one
// * closures see every later change made to the scope they were created in
// * `()` is the "nothing" value returned by `define` and `set!`
// * a closure stored in the scope it captured keeps that scope alive, there is no cycle collection


namespace tree_scheme {

inline constexpr int tree_scheme_version_major{ 0 };
inline constexpr int tree_scheme_version_minor{ 0 };
inline constexpr int tree_scheme_version_patch{ 1 };

using int_type = std::int64_t;

struct Value;
struct Closure;
class Environment;

using list_type = std::vector<Value>;
using environment_ptr = std::shared_ptr<Environment>;

struct RuntimeError
{
  std::string message;

  [[nodiscard]] bool operator==(const RuntimeError &) const noexcept = default;
};

using eval_result = std::expected<Value, RuntimeError>;

// native procedures get the raw operands and the caller's scope and decide for themselves what to evaluate
using function_ptr = eval_result (*)(std::span<const Value>, const environment_ptr &);

struct Symbol
{
  std::string name;

  [[nodiscard]] bool operator==(const Symbol &) const noexcept = default;
};

struct NativeFunction
{
  function_ptr ptr{ nullptr };
  std::string_view name;
};

struct Procedure
{
  std::variant<NativeFunction, std::shared_ptr<const Closure>> function;

  // identity, not structure. Two closures built from the same text are still different procedures
  [[nodiscard]] bool operator==(const Procedure &other) const noexcept
  {
    if (const auto *native = std::get_if<NativeFunction>(&function); native != nullptr) {
      const auto *other_native = std::get_if<NativeFunction>(&other.function);
      return other_native != nullptr && native->ptr == other_native->ptr;
    }

    const auto *other_closure = std::get_if<std::shared_ptr<const Closure>>(&other.function);
    return other_closure != nullptr && *other_closure == std::get<std::shared_ptr<const Closure>>(function);
  }
};

struct Value
{
  std::variant<Symbol, int_type, bool, std::string, list_type, Procedure> value;

  [[nodiscard]] bool operator==(const Value &other) const { return value == other.value; }
};

[[nodiscard]] inline Value make_nil() { return Value{ list_type{} }; }

template<typename Result> [[nodiscard]] const Result *get_if(const Value *value) noexcept
{
  if (value == nullptr) { return nullptr; }
  return std::get_if<Result>(&value->value);
}

[[nodiscard]] inline bool is_false(const Value &value) noexcept
{
  const auto *boolean = get_if<bool>(&value);
  return boolean != nullptr && !*boolean;
}


//
// rendering
//
[[nodiscard]] inline std::string to_raw_string(const Value &input);

[[nodiscard]] inline std::string to_raw_string(const Symbol &symbol) { return symbol.name; }
[[nodiscard]] inline std::string to_raw_string(const int_type value) { return std::to_string(value); }
[[nodiscard]] inline std::string to_raw_string(const bool value) { return value ? "#t" : "#f"; }
[[nodiscard]] inline std::string to_raw_string(const std::string &string) { return '"' + string + '"'; }
[[nodiscard]] inline std::string to_raw_string(const Procedure &) { return "#<procedure>"; }

[[nodiscard]] inline std::string to_raw_string(std::span<const Value> list)
{
  std::string result = "(";

  if (!list.empty()) {
    for (const auto &item : list.first(list.size() - 1)) { result += to_raw_string(item) + ' '; }
    result += to_raw_string(list.back());
  }

  result += ")";
  return result;
}

inline std::string to_raw_string(const Value &input)
{
  return std::visit([](const auto &value) { return to_raw_string(value); }, input.value);
}

// symbols and lists are data once they are values, so they print quoted
[[nodiscard]] inline std::string to_string(const Value &input)
{
  if (std::holds_alternative<Symbol>(input.value) || std::holds_alternative<list_type>(input.value)) {
    return "'" + to_raw_string(input);
  }
  return to_raw_string(input);
}

[[nodiscard]] inline std::string to_string(const RuntimeError &error) { return "RuntimeError: " + error.message; }

[[nodiscard]] inline std::unexpected<RuntimeError> make_error(std::string_view description, const Value &context)
{
  return std::unexpected(RuntimeError{ std::string{ description } + ": " + to_string(context) });
}

[[nodiscard]] inline std::unexpected<RuntimeError> make_error(std::string_view description,
  std::span<const Value> context)
{
  return std::unexpected(RuntimeError{ std::string{ description } + ": " + to_raw_string(context) });
}


class Environment
{
public:
  explicit Environment(environment_ptr parent = nullptr) noexcept : parent_scope{ std::move(parent) } {}

  [[nodiscard]] static environment_ptr make_child(environment_ptr parent)
  {
    return std::make_shared<Environment>(std::move(parent));
  }

  [[nodiscard]] const environment_ptr &parent() const noexcept { return parent_scope; }

  [[nodiscard]] bool has_local(std::string_view name) const { return bindings.contains(name); }

  // always writes to this scope, replacing any local binding of the same name
  void bind(std::string name, Value value) { bindings.insert_or_assign(std::move(name), std::move(value)); }

  [[nodiscard]] const Value *find(std::string_view name) const
  {
    for (const auto *scope = this; scope != nullptr; scope = scope->parent_scope.get()) {
      if (const auto found = scope->bindings.find(name); found != scope->bindings.end()) { return &found->second; }
    }
    return nullptr;
  }

  // rebinds the name in the nearest scope that already has it, never creates a binding
  [[nodiscard]] bool assign(std::string_view name, Value value)
  {
    for (auto *scope = this; scope != nullptr; scope = scope->parent_scope.get()) {
      if (const auto found = scope->bindings.find(name); found != scope->bindings.end()) {
        found->second = std::move(value);
        return true;
      }
    }
    return false;
  }

  [[nodiscard]] std::size_t size() const noexcept { return bindings.size(); }
  [[nodiscard]] auto begin() const noexcept { return bindings.begin(); }
  [[nodiscard]] auto end() const noexcept { return bindings.end(); }

private:
  environment_ptr parent_scope;
  std::map<std::string, Value, std::less<>> bindings;
};


struct Closure
{
  std::vector<std::string> parameter_names;
  list_type statements;
  environment_ptr scope;

  [[nodiscard]] eval_result invoke(std::span<const Value> params, const environment_ptr &caller) const;
};


[[nodiscard]] inline eval_result eval(const Value &expr, const environment_ptr &scope);

[[nodiscard]] inline eval_result sequence(std::span<const Value> expressions, const environment_ptr &scope)
{
  auto result = make_nil();
  for (const auto &expression : expressions) {
    auto next = eval(expression, scope);
    if (!next) { return next; }
    result = std::move(*next);
  }
  return result;
}

[[nodiscard]] inline eval_result apply(const Procedure &procedure,
  std::span<const Value> params,
  const environment_ptr &scope)
{
  if (const auto *native = std::get_if<NativeFunction>(&procedure.function); native != nullptr) {
    return (native->ptr)(params, scope);
  }

  return std::get<std::shared_ptr<const Closure>>(procedure.function)->invoke(params, scope);
}

[[nodiscard]] inline eval_result invoke_function(std::span<const Value> expression, const environment_ptr &scope)
{
  // keeps the procedure, and with it any closure body, alive for the whole call
  const auto resolved = eval(expression.front(), scope);
  if (!resolved) { return resolved; }

  const auto *procedure = get_if<Procedure>(&*resolved);
  if (procedure == nullptr) { return make_error("first element must be a procedure", *resolved); }

  return apply(*procedure, expression.subspan(1), scope);
}

inline eval_result eval(const Value &expr, const environment_ptr &scope)
{
  if (const auto *list = get_if<list_type>(&expr); list != nullptr) {
    // a non-empty list is a call, the empty list is just data
    if (!list->empty()) { return invoke_function(*list, scope); }
  } else if (const auto *symbol = get_if<Symbol>(&expr); symbol != nullptr) {
    if (const auto *found = scope->find(symbol->name); found != nullptr) { return *found; }
    return make_error("identifier not found", expr);
  }

  return expr;
}

template<typename Type>
[[nodiscard]] std::expected<Type, RuntimeError> eval_to(const Value &expr, const environment_ptr &scope)
{
  auto result = eval(expr, scope);
  if (!result) { return std::unexpected(std::move(result.error())); }

  if (const auto *value = get_if<Type>(&*result); value != nullptr) { return *value; }
  return make_error("parameter type mismatch", *result);
}

inline eval_result Closure::invoke(std::span<const Value> params, const environment_ptr &caller) const
{
  if (params.size() != parameter_names.size()) {
    return make_error(
      "incorrect number of params for lambda, expected " + std::to_string(parameter_names.size()), params);
  }

  auto new_scope = Environment::make_child(scope);

  // arguments are evaluated where the call is written, then bound where the lambda was written
  for (std::size_t index = 0; index < params.size(); ++index) {
    auto value = eval(params[index], caller);
    if (!value) { return value; }
    new_scope->bind(parameter_names[index], std::move(*value));
  }

  return sequence(statements, new_scope);
}

[[nodiscard]] inline eval_result quote(const Value &expr, const bool quasi, const environment_ptr &scope)
{
  const auto *list = get_if<list_type>(&expr);
  if (list == nullptr) { return expr; }

  if (quasi && !list->empty()) {
    if (const auto *head = get_if<Symbol>(&list->front()); head != nullptr && head->name == "unquote") {
      if (list->size() != 2) { return make_error("unquote takes exactly one param", expr); }
      return eval((*list)[1], scope);
    }
  }

  list_type result;
  result.reserve(list->size());
  for (const auto &item : *list) {
    auto quoted = quote(item, quasi, scope);
    if (!quoted) { return quoted; }
    result.push_back(std::move(*quoted));
  }
  return Value{ std::move(result) };
}


//
// built-ins
//
[[nodiscard]] inline eval_result definer(std::span<const Value> params, const environment_ptr &scope)
{
  if (params.size() != 2) { return make_error("wrong param count, expected (define Symbol Expression)", params); }

  const auto *id = get_if<Symbol>(&params[0]);
  if (id == nullptr) { return make_error("define expects a Symbol", params[0]); }
  if (scope->has_local(id->name)) { return make_error("duplicate define", params[0]); }

  auto value = eval(params[1], scope);
  if (!value) { return value; }

  // the initializer may have bound the same name in this scope
  if (scope->has_local(id->name)) { return make_error("duplicate define", params[0]); }

  scope->bind(id->name, std::move(*value));
  return make_nil();
}

[[nodiscard]] inline eval_result setter(std::span<const Value> params, const environment_ptr &scope)
{
  if (params.size() != 2) { return make_error("wrong param count, expected (set! Symbol Expression)", params); }

  const auto *id = get_if<Symbol>(&params[0]);
  if (id == nullptr) { return make_error("set! expects a Symbol", params[0]); }
  if (scope->find(id->name) == nullptr) { return make_error("cannot set! an undefined identifier", params[0]); }

  auto value = eval(params[1], scope);
  if (!value) { return value; }

  if (!scope->assign(id->name, std::move(*value))) {
    return make_error("cannot set! an undefined identifier", params[0]);
  }
  return make_nil();
}

[[nodiscard]] inline eval_result lambda(std::span<const Value> params, const environment_ptr &scope)
{
  if (params.size() < 2) { return make_error("wrong param count, expected (lambda (Symbol...) Statement...)", params); }

  const auto *names = get_if<list_type>(&params[0]);
  if (names == nullptr) { return make_error("lambda expects a list of parameter names", params[0]); }

  std::vector<std::string> parameter_names;
  parameter_names.reserve(names->size());
  for (const auto &name : *names) {
    const auto *id = get_if<Symbol>(&name);
    if (id == nullptr) { return make_error("lambda parameter must be a Symbol", name); }
    parameter_names.push_back(id->name);
  }

  return Value{ Procedure{ std::make_shared<const Closure>(
    Closure{ std::move(parameter_names), list_type(std::next(params.begin()), params.end()), scope }) } };
}

[[nodiscard]] inline eval_result ifer(std::span<const Value> params, const environment_ptr &scope)
{
  // need to be careful to not execute unexecuted branches
  if (params.size() != 3) { return make_error("wrong param count, expected (if condition then else)", params); }

  const auto condition = eval(params[0], scope);
  if (!condition) { return condition; }

  if (is_false(*condition)) { return eval(params[2], scope); }
  return eval(params[1], scope);
}

[[nodiscard]] inline eval_result adder(std::span<const Value> params, const environment_ptr &scope)
{
  if (params.size() < 2) { return make_error("wrong param count, expected (+ Integer Integer...)", params); }

  std::vector<int_type> operands;
  operands.reserve(params.size());
  for (const auto &param : params) {
    const auto next = eval_to<int_type>(param, scope);
    if (!next) { return std::unexpected(next.error()); }
    operands.push_back(*next);
  }

  // the sum wraps and every wrap is counted, only the exact total has to fit
  int_type sum = 0;
  int wraps = 0;
  for (const auto operand : operands) {
    if (operand > 0 && sum > std::numeric_limits<int_type>::max() - operand) {
      ++wraps;
    } else if (operand < 0 && sum < std::numeric_limits<int_type>::min() - operand) {
      --wraps;
    }
    sum = static_cast<int_type>(static_cast<std::uint64_t>(sum) + static_cast<std::uint64_t>(operand));
  }

  if (wraps != 0) { return make_error("integer overflow in +", params); }

  return Value{ sum };
}

[[nodiscard]] inline eval_result subtracter(std::span<const Value> params, const environment_ptr &scope)
{
  if (params.size() != 2) { return make_error("wrong param count, expected (- Integer Integer)", params); }

  // both sides are evaluated before either is checked
  const auto lhs = eval(params[0], scope);
  if (!lhs) { return lhs; }
  const auto rhs = eval(params[1], scope);
  if (!rhs) { return rhs; }

  const auto *left = get_if<int_type>(&*lhs);
  const auto *right = get_if<int_type>(&*rhs);
  if (left == nullptr || right == nullptr) { return make_error("parameter type mismatch", list_type{ *lhs, *rhs }); }

  if ((*right < 0 && *left > std::numeric_limits<int_type>::max() + *right)
      || (*right > 0 && *left < std::numeric_limits<int_type>::min() + *right)) {
    return make_error("integer overflow in -", params);
  }

  return Value{ *left - *right };
}

[[nodiscard]] inline eval_result logical_and(std::span<const Value> params, const environment_ptr &scope)
{
  auto result = Value{ true };
  for (const auto &param : params) {
    auto next = eval(param, scope);
    if (!next) { return next; }
    if (is_false(*next)) { return Value{ false }; }
    result = std::move(*next);
  }

  return result;
}

[[nodiscard]] inline eval_result logical_or(std::span<const Value> params, const environment_ptr &scope)
{
  for (const auto &param : params) {
    auto next = eval(param, scope);
    if (!next || !is_false(*next)) { return next; }
  }

  return Value{ false };
}

[[nodiscard]] inline eval_result list(std::span<const Value> params, const environment_ptr &scope)
{
  list_type result;
  result.reserve(params.size());
  for (const auto &param : params) {
    auto next = eval(param, scope);
    if (!next) { return next; }
    result.push_back(std::move(*next));
  }

  return Value{ std::move(result) };
}

[[nodiscard]] inline eval_result quoter(std::span<const Value> params, const environment_ptr &scope)
{
  if (params.size() != 1) { return make_error("wrong param count, expected (quote Expression)", params); }
  return quote(params[0], false, scope);
}

[[nodiscard]] inline eval_result quasiquoter(std::span<const Value> params, const environment_ptr &scope)
{
  if (params.size() != 1) { return make_error("wrong param count, expected (quasiquote Expression)", params); }
  return quote(params[0], true, scope);
}

[[nodiscard]] inline eval_result raiser(std::span<const Value> params, const environment_ptr &scope)
{
  if (params.size() != 1) { return make_error("wrong param count, expected (error Expression)", params); }

  const auto message = eval(params[0], scope);
  if (!message) { return message; }

  return std::unexpected(RuntimeError{ to_string(*message) });
}


inline constexpr std::array<std::pair<std::string_view, function_ptr>, 13> builtins{ {
  { "define", definer },
  { "set!", setter },
  { "lambda", lambda },
  { "λ", lambda },
  { "if", ifer },
  { "+", adder },
  { "-", subtracter },
  { "and", logical_and },
  { "or", logical_or },
  { "list", list },
  { "quote", quoter },
  { "quasiquote", quasiquoter },
  { "error", raiser },
} };

// every call gets its own root, nothing is shared between two interpretations
[[nodiscard]] inline environment_ptr make_global_scope()
{
  auto scope = std::make_shared<Environment>();
  for (const auto &[name, ptr] : builtins) {
    scope->bind(std::string{ name }, Value{ Procedure{ NativeFunction{ ptr, name } } });
  }
  return scope;
}


//
// syntax tree, as handed over by the reader
//
struct Identifier
{
  std::string name;

  [[nodiscard]] bool operator==(const Identifier &) const noexcept = default;
};

struct Node
{
  std::variant<Identifier, int_type, bool, std::string, std::vector<Node>> value;

  [[nodiscard]] bool operator==(const Node &other) const { return value == other.value; }
};

[[nodiscard]] inline list_type from_nodes(std::span<const Node> nodes);

[[nodiscard]] inline Value from_node(const Node &node)
{
  return std::visit(
    [](const auto &value) -> Value {
      using type = std::remove_cvref_t<decltype(value)>;
      if constexpr (std::is_same_v<type, Identifier>) {
        return Value{ Symbol{ value.name } };
      } else if constexpr (std::is_same_v<type, std::vector<Node>>) {
        return Value{ from_nodes(value) };
      } else {
        return Value{ value };
      }
    },
    node.value);
}

inline list_type from_nodes(std::span<const Node> nodes)
{
  list_type result;
  result.reserve(nodes.size());
  for (const auto &node : nodes) { result.push_back(from_node(node)); }
  return result;
}

[[nodiscard]] inline eval_result interpret(std::span<const Node> nodes)
{
  const auto program = from_nodes(nodes);
  return sequence(program, make_global_scope());
}

}// namespace tree_scheme

#endif
