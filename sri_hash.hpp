#pragma once

#include <string>

namespace amo {

// Converts an AMO file digest ("sha256:<hex>") into the self-describing
// integrity string the packaging side verifies downloads against
// ("sha256-<base64>"). Throws MalformedHashError on anything else.
std::string toSriHash(const std::string &digest);

} // namespace amo
