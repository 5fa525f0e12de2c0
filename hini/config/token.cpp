#include "token.hpp"

#include <fmt/format.h>

#include <type_traits>

namespace hini
{
  size_t
  token_line(const Token& token)
  {
    return std::visit([](const auto& tok) { return tok.line; }, token);
  }

  std::string
  to_string(const Token& token)
  {
    return std::visit(
        [](const auto& tok) -> std::string {
          using T = std::decay_t<decltype(tok)>;
          if constexpr (std::is_same_v<T, SectionHeader>)
          {
            if (tok.inherits)
              return fmt::format("[{} : {}]", tok.name, *tok.inherits);
            return fmt::format("[{}]", tok.name);
          }
          else
            return fmt::format("{} = '{}'", tok.key, tok.value);
        },
        token);
  }

}  // namespace hini
