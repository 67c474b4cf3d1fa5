#ifndef ID_UTILS_H
#define ID_UTILS_H

#include <string>

namespace IdUtils {

// Random version-4 UUID (RFC 4122) from the OpenSSL CSPRNG. Throws
// std::runtime_error when the generator cannot be seeded.
std::string generateUuid();

bool isUuid(const std::string &value);

} // namespace IdUtils

#endif
