#include "apioutputtype.hpp"

#include <string_view>

#include "enum-string.hpp"

namespace mtc {

ApiOutputType ApiOutputTypeFromString(std::string_view str) {
  return EnumFromStringCaseInsensitive<ApiOutputType>(str);
}

}  // namespace mtc
