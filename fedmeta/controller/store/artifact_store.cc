#include "fedmeta/controller/store/artifact_store.h"

#include "absl/strings/str_cat.h"

namespace fedmeta::controller {

std::string RoundKey::ToString() const {
  return absl::StrCat(run_id, "-", sequence, "-", round);
}

}  // namespace fedmeta::controller
