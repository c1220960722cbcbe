#pragma once

#include <string>

#include "provider_descriptor.hpp"

namespace trellico {
namespace provider {

enum class AvailabilityError { NONE, NOT_INSTALLED, NOT_LOGGED_IN, UNKNOWN };

// "not_installed", "not_logged_in", "unknown" (empty for NONE)
const char *availability_error_to_string(AvailabilityError type);

struct ProviderStatus {
    bool available = false;
    std::string error;
    AvailabilityError error_type = AvailabilityError::NONE;
    std::string auth_instructions;
};

/**
 * @brief Is the provider installed, runnable and logged in?
 *
 * Runs "<binary> --version" (pipes, no terminal) and kills it after
 * timeout_ms. Blocks the caller for at most roughly timeout_ms.
 */
ProviderStatus check_availability(const IProviderDescriptor &descriptor, int timeout_ms = 5000);

}  // namespace provider
}  // namespace trellico
