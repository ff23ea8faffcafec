#pragma once

#include <string>

namespace clubhouse::agents {

// Random UUID v4 from the OpenSSL CSPRNG. Throws std::runtime_error when
// the generator cannot be seeded.
std::string GenerateNonce();

}  // namespace clubhouse::agents
