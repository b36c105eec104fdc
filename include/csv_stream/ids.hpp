#pragma once
#include <string>

namespace cs {

// Random RFC 4122 version-4 identifier, lowercase hex with dashes.
// Backed by OpenSSL RAND_bytes; falls back to std::random_device if the CSPRNG is unavailable.
std::string new_uuid4();

}
