#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace inkshell {

// Content fingerprints identify a photo by its bytes, independent of its name.
// Device files are named "ink_<16 hex>.jpg" so the fingerprint survives the round trip.

// Lower-case hex SHA-256 of `data`; empty on hashing failure.
std::string sha256_hex(const std::uint8_t* data, std::size_t len);

// First 16 hex digits of the SHA-256, the key used for dedup.
std::string content_fingerprint(const std::vector<std::uint8_t>& data);

std::string fingerprint_filename(const std::string& fingerprint);

// Extracts the fingerprint from a device file name; false for foreign names.
bool fingerprint_from_filename(const std::string& name, std::string& fingerprint);

} // namespace inkshell
