#pragma once

#include "toolguard/common/result.hpp"

#include <array>
#include <filesystem>
#include <string>

namespace toolguard::security {

using SecretKey = std::array<unsigned char, 32>;

[[nodiscard]] SecretKey generate_key();

/// Read the 32-byte key at `path`, or create it (mode 0600) when absent.
[[nodiscard]] common::Result<SecretKey> load_or_create_key(const std::filesystem::path &path);

/// ChaCha20-Poly1305. Output is base64(nonce || ciphertext || tag).
[[nodiscard]] common::Result<std::string> encrypt_secret(const SecretKey &key,
                                                         const std::string &plaintext);
[[nodiscard]] common::Result<std::string> decrypt_secret(const SecretKey &key,
                                                         const std::string &ciphertext);

} // namespace toolguard::security
