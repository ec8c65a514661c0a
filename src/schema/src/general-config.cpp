#include "general-config.hpp"

#include <string_view>

#include "file.hpp"
#include "mtc_const.hpp"
#include "read-json.hpp"

namespace mtc {

schema::GeneralConfig ReadGeneralConfig(std::string_view dataDir) {
  return ReadJsonOrCreateFile<schema::GeneralConfig>(
      File{dataDir, File::Type::kStatic, kGeneralConfigFileName, File::IfError::kNoThrow});
}

}  // namespace mtc
