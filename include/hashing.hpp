#pragma once
#include <cstdint>
#include <string>

// Lower-case hex SHA-256 of the bytes of s.
std::string sha256_hex(const std::string& s);

// 64-bit FNV-1a; cheap and stable across platforms.
std::uint64_t fnv1a64(const char* data, std::size_t n);
