#include "SchemeCompiler.hpp"

#include <type_traits>

Scheme SchemeCompiler::compile(const json& raw) {
  Scheme scheme;
  if (!raw.is_array()) {
    return scheme;
  }

  for (const auto& element : raw) {
    if (element.is_string()) {
      scheme.emplace_back(Literal{element.get<std::string>()});
    } else if (element.is_object()) {
      auto it = element.find("key");
      if (it != element.end() && it->is_string()) {
        scheme.emplace_back(MetadataKey{it->get<std::string>()});
      }
    }
  }
  return scheme;
}

std::string SchemeCompiler::describe(const Scheme& scheme) {
  std::string result;
  for (const auto& token : scheme) {
    std::visit(
        [&result](const auto& t) {
          using T = std::decay_t<decltype(t)>;
          if constexpr (std::is_same_v<T, Literal>) {
            result += t.text;
          } else {
            result += "{" + t.name + "}";
          }
        },
        token);
  }
  return result;
}
