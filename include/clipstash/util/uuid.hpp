#pragma once

#include <cstddef>
#include <string>

namespace clipstash {

// Fills a buffer with random bytes, returning false on failure
using RandomSource = bool (*)(void* buffer, size_t size);

/**
 * Generate a random (version 4) UUID in canonical 8-4-4-4-12 form.
 *
 * @throws std::runtime_error if the random source fails
 */
std::string generate_uuid();
std::string generate_uuid(RandomSource source);

/**
 * Fill a buffer with cryptographically secure random bytes.
 *
 * @return false if the random source failed
 */
bool random_bytes(void* buffer, size_t size);

}  // namespace clipstash
