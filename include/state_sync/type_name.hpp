#pragma once

#include <string>
#include <string_view>

namespace state_sync {

namespace detail {

template <typename T>
constexpr std::string_view pretty_function() {
#if defined(_MSC_VER) && !defined(__clang__)
  return __FUNCSIG__;
#else
  return __PRETTY_FUNCTION__;
#endif
}

// The signature of a known type tells where the type name starts and how much
// of the signature trails it
inline constexpr std::string_view known_type      = "double";
inline constexpr std::string_view known_signature = pretty_function<double>();
inline constexpr std::size_t      name_offset     = known_signature.find(known_type);
inline constexpr std::size_t      name_trailer    = known_signature.size() - name_offset - known_type.size();

constexpr bool is_identifier_char(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

} // namespace detail

// Compiler spelling of T, for diagnostics
template <typename T>
constexpr std::string_view type_name() {
  auto name = detail::pretty_function<T>();
  name.remove_prefix(detail::name_offset);
  name.remove_suffix(detail::name_trailer);

  if (name.starts_with("const ")) {
    name.remove_prefix(6);
  }
  return name;
}

// Spelling of T that is identical on every compiler, used where a type name
// travels on the wire: no class/struct/enum keywords, no standard library
// inline namespaces, no whitespace around punctuation.
template <typename T>
std::string wire_type_name() {
  constexpr std::string_view dropped[] = {"class ", "struct ", "enum ", "__cxx11::", "__1::"};

  std::string_view name = type_name<T>();
  std::string      result;
  result.reserve(name.size());

  while (!name.empty()) {
    bool const at_boundary = result.empty() || !detail::is_identifier_char(result.back());

    bool skipped = false;
    for (auto const token : dropped) {
      if (at_boundary && name.starts_with(token)) {
        name.remove_prefix(token.size());
        skipped = true;
        break;
      }
    }
    if (skipped) {
      continue;
    }

    if (name.front() == ' ') {
      // Keep the space in "unsigned int", drop it in "a, b" and "> >"
      bool const joins_words = !result.empty() && detail::is_identifier_char(result.back()) && name.size() > 1 &&
                               detail::is_identifier_char(name[1]);
      if (joins_words) {
        result.push_back(' ');
      }
      name.remove_prefix(1);
      continue;
    }

    result.push_back(name.front());
    name.remove_prefix(1);
  }
  return result;
}

} // namespace state_sync
