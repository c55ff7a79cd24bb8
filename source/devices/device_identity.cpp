#include "devices/device_identity.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_utils.hpp"

#include <openssl/evp.h>
#include <cstdio>

namespace devices {

std::string derive_device_id(const std::string &natural_key) {
    std::string normalized = text_utils::to_lower(natural_key);

    unsigned char digest[EVP_MAX_MD_SIZE] = {};
    unsigned int digest_length = 0;
    if (EVP_Digest(normalized.data(), normalized.size(), digest, &digest_length,
                   EVP_sha256(), nullptr) != 1 || digest_length < 16) {
        debug_log::warn("SHA-256 digest failed for device key: " + natural_key);
        return "";
    }

    // 8-4-4-4-12 over the first 16 bytes.
    static const int group_ends[] = {4, 6, 8, 10, 16};
    std::string identifier;
    identifier.reserve(36);
    int group = 0;
    for (int index = 0; index < 16; index++) {
        char hex[3];
        std::snprintf(hex, sizeof(hex), "%02x", digest[index]);
        identifier += hex;
        if (index + 1 == group_ends[group] && group < 4) {
            identifier += '-';
            group++;
        }
    }
    return identifier;
}

} // namespace devices
