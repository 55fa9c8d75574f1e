#pragma once
#include <cstddef>
#include <string>

// "iphash:" followed by the first 6 bytes of SHA-256(ip + "|" + salt) in hex.
// Always 19 characters; throws std::runtime_error if the digest fails.
std::string hash_source(const std::string &ip, const std::string &salt);

constexpr const char *kSourceHashPrefix = "iphash:";
constexpr size_t kSourceHashBytes = 6;
