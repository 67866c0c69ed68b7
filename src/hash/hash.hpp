#pragma once

#include <string>

namespace teldrive
{
    namespace hashing
    {
        // Lowercase hex MD5 of the input.
        std::string md5Hex(const std::string &text);

        // Random version-4 UUID in canonical 8-4-4-4-12 form.
        std::string newUuid();
    }
}
