#pragma once

#include <string>

namespace trellico {
namespace process {

// Random RFC 4122 version-4 UUID in canonical 8-4-4-4-12 lowercase hex form
std::string generate_process_id();

}  // namespace process
}  // namespace trellico
