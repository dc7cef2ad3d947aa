#pragma once

#include <cctype>
#include <string>
#include <uuid/uuid.h>

namespace shared::util {

/**
 * UUID helpers backed by libuuid.
 */
class UuidUtil {
public:
    /**
     * Generate a random (v4) UUID in lowercase hyphenated form.
     */
    static std::string generate() {
        uuid_t uuid;
        uuid_generate_random(uuid);
        char buf[37];
        uuid_unparse_lower(uuid, buf);
        return std::string(buf);
    }

    /**
     * Accepts the hyphenated form (36 chars) and the simple form (32 hex digits).
     */
    static bool isValid(const std::string& uuid) {
        if (uuid.length() == 36) {
            for (size_t i = 0; i < uuid.length(); ++i) {
                if (i == 8 || i == 13 || i == 18 || i == 23) {
                    if (uuid[i] != '-') return false;
                } else if (!std::isxdigit(static_cast<unsigned char>(uuid[i]))) {
                    return false;
                }
            }
            return true;
        }

        if (uuid.length() == 32) {
            for (char c : uuid) {
                if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
            }
            return true;
        }

        return false;
    }
};

} // namespace shared::util
