#pragma once

#include <string>

namespace cloudpulse {

// Random (v4) UUID in canonical lowercase form.
auto GenerateUuid() -> std::string;

} // namespace cloudpulse
