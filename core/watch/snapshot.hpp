#pragma once

#include <string>

#include "watch_types.hpp"

namespace trellico {
namespace watch {

// Stems of regular files directly in dir whose name ends with extension.
// A missing dir yields an empty set; other filesystem errors return false.
bool scan_plan_stems(const std::string &dir, const std::string &extension, StemSet &out, std::string &error);

// Names of sub-directories of dir that contain a manifest file
bool scan_prd_entries(const std::string &dir, const std::string &manifest, StemSet &out, std::string &error);

}  // namespace watch
}  // namespace trellico
