#ifndef TREE_SCHEME_UTILITY_HPP
#define TREE_SCHEME_UTILITY_HPP

#include "tree_scheme.hpp"

#include <format>
#include <string>
#include <vector>

namespace tree_scheme {

[[nodiscard]] inline std::string to_string(const Value &input, bool annotate);

[[nodiscard]] inline std::string to_string(const Symbol &symbol, bool annotate)
{
  if (annotate) { return std::format("[symbol] {}", symbol.name); }
  return "'" + symbol.name;
}

[[nodiscard]] inline std::string to_string(const int_type value, bool annotate)
{
  std::string result;
  if (annotate) { result = "[int] "; }
  return result + std::format("{}", value);
}

[[nodiscard]] inline std::string to_string(const bool value, bool annotate)
{
  std::string result;
  if (annotate) { result = "[bool] "; }
  return result + to_raw_string(value);
}

[[nodiscard]] inline std::string to_string(const std::string &string, bool annotate)
{
  if (annotate) { return std::format("[string] \"{}\"", string); }
  return std::format("\"{}\"", string);
}

[[nodiscard]] inline std::string to_string(const list_type &list, bool annotate)
{
  std::string result;
  if (annotate) { result += std::format("[list] {{{}}} ", list.size()); }
  return result + "'" + to_raw_string(list);
}

[[nodiscard]] inline std::string to_string(const Procedure &procedure, bool annotate)
{
  if (!annotate) { return to_raw_string(procedure); }

  if (const auto *native = std::get_if<NativeFunction>(&procedure.function); native != nullptr) {
    return std::format("[native] {}", native->name);
  }

  const auto &closure = *std::get<std::shared_ptr<const Closure>>(procedure.function);
  std::string parameters;
  for (const auto &name : closure.parameter_names) {
    if (!parameters.empty()) { parameters += ' '; }
    parameters += name;
  }
  return std::format("[closure] ({}) statements {{{}}}", parameters, closure.statements.size());
}

inline std::string to_string(const Value &input, bool annotate)
{
  return std::visit([&](const auto &value) { return to_string(value, annotate); }, input.value);
}

// one line per binding of this scope only, parents are not included
[[nodiscard]] inline std::vector<std::string> describe_bindings(const Environment &scope)
{
  std::vector<std::string> result;
  result.reserve(scope.size());
  for (const auto &[name, value] : scope) { result.push_back(std::format("{}: {}", name, to_string(value, true))); }
  return result;
}

}// namespace tree_scheme

#endif
