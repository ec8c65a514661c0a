#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

namespace mtc {

namespace details {
inline constexpr std::string_view kNoSep;
}  // namespace details

/// Concatenates at compile time the std::string_view template arguments, separated by 'Sep', into a static storage.
/// The storage is null terminated (the null char is not part of 'value').
template <std::string_view const& Sep, std::string_view const&... Strs>
class JoinStringViewWithSep {
 private:
  static constexpr auto impl() noexcept {
    constexpr std::size_t kNbStrs = sizeof...(Strs);
    constexpr std::size_t kLen = (Strs.size() + ... + 0U) + (kNbStrs == 0U ? 0U : (kNbStrs - 1U) * Sep.size());
    std::array<char, kLen + 1U> arr{};
    auto it = arr.begin();
    bool first = true;
    auto append = [&it, &first](std::string_view str) {
      if (!first) {
        it = std::ranges::copy(Sep, it).out;
      }
      first = false;
      it = std::ranges::copy(str, it).out;
    };
    (append(Strs), ...);
    arr.back() = '\0';
    return arr;
  }

  static constexpr auto arr = impl();

 public:
  static constexpr std::string_view value{arr.data(), arr.size() - 1U};

  static constexpr const char* const c_str = arr.data();
};

template <std::string_view const&... Strs>
using JoinStringView = JoinStringViewWithSep<details::kNoSep, Strs...>;

template <std::string_view const&... Strs>
static constexpr auto JoinStringView_v = JoinStringView<Strs...>::value;

namespace details {
template <std::string_view const& Sep, const auto& a, typename>
struct make_joined_string_view_impl;

template <std::string_view const& Sep, const auto& a, std::size_t... i>
struct make_joined_string_view_impl<Sep, a, std::index_sequence<i...>> {
  static constexpr auto value = JoinStringViewWithSep<Sep, a[i]...>::value;
};
}  // namespace details

/// Joined string view of all the elements of an array like compile time value of std::string_view.
template <std::string_view const& Sep, const auto& a>
using make_joined_string_view = details::make_joined_string_view_impl<Sep, a, std::make_index_sequence<std::size(a)>>;

/// Creates a std::string_view on a storage with a single char available at compile time.
template <char Char>
class CharToStringView {
 private:
  static constexpr char ch = Char;

 public:
  static constexpr std::string_view value{&ch, 1};
};

template <char Char>
static constexpr auto CharToStringView_v = CharToStringView<Char>::value;

}  // namespace mtc
