#pragma once

#include <string>

namespace agent_core {

/**
 * @brief Generates a random RFC 4122 version-4 UUID ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx").
 *
 * Bytes come from OpenSSL's CSPRNG. Throws std::runtime_error if the generator
 * cannot produce them.
 */
std::string generate_task_id();

// True for the lower-case 8-4-4-4-12 form produced by generate_task_id().
bool is_generated_task_id(const std::string& id);

}  // namespace agent_core
