#ifndef SIMDECK_DEVICE_IDENTITY_HPP
#define SIMDECK_DEVICE_IDENTITY_HPP

#include <string>

namespace devices {

// Derives the stable device id from a platform natural key (UDID, AVD name key).
// The key is lowercased, hashed with SHA-256, and the first 16 bytes are
// rendered as a UUID string, so equal keys (ignoring case) always give equal ids.
std::string derive_device_id(const std::string &natural_key);

} // namespace devices

#endif // SIMDECK_DEVICE_IDENTITY_HPP
