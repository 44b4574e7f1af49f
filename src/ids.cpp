#include "ids.h"

#include <uuid/uuid.h>

namespace cloudpulse {

auto GenerateUuid() -> std::string {
    uuid_t out;
    uuid_generate_random(out);
    char str[37];
    uuid_unparse_lower(out, str);
    return std::string(str);
}

} // namespace cloudpulse
