#include "toolguard/security/secrets.hpp"

#include "toolguard/common/fs.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace toolguard::security {

namespace {

constexpr std::size_t NONCE_SIZE = 12;
constexpr std::size_t TAG_SIZE = 16;

using Bytes = std::vector<unsigned char>;
using Nonce = std::array<unsigned char, NONCE_SIZE>;

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::string b64_encode(const Bytes &bytes) {
  const int output_len = 4 * static_cast<int>((bytes.size() + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), bytes.data(),
                  static_cast<int>(bytes.size()));
  return output;
}

common::Result<Bytes> b64_decode(const std::string &text) {
  if (text.empty()) {
    return common::Result<Bytes>::success({});
  }
  if (text.size() % 4 != 0) {
    return common::Result<Bytes>::failure("Invalid base64 length");
  }

  Bytes decoded(text.size());
  const int len = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char *>(text.data()),
                                  static_cast<int>(text.size()));
  if (len < 0) {
    return common::Result<Bytes>::failure("Invalid base64 input");
  }

  std::size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
  }
  if (text.size() > 1 && text[text.size() - 2] == '=') {
    ++padding;
  }
  decoded.resize(static_cast<std::size_t>(len) - padding);
  return common::Result<Bytes>::success(std::move(decoded));
}

common::Status init_cipher(EVP_CIPHER_CTX *ctx, const SecretKey &key, const Nonce &nonce,
                           bool encrypt) {
  const auto init = encrypt ? EVP_EncryptInit_ex : EVP_DecryptInit_ex;
  if (init(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) {
    return common::Status::error(encrypt ? "Encrypt init failed" : "Decrypt init failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE),
                          nullptr) != 1) {
    return common::Status::error("Failed to set nonce size");
  }
  if (init(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
    return common::Status::error("Failed to set key/nonce");
  }
  return common::Status::success();
}

common::Result<Bytes> chacha_encrypt(const SecretKey &key, const Nonce &nonce,
                                     const std::string &plaintext) {
  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return common::Result<Bytes>::failure("Failed to create cipher context");
  }
  if (const auto status = init_cipher(ctx.get(), key, nonce, true); !status.ok()) {
    return common::Result<Bytes>::failure(status.error());
  }

  Bytes ciphertext(plaintext.size() + TAG_SIZE);
  int out_len = 0;
  int total_len = 0;
  if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &out_len,
                        reinterpret_cast<const unsigned char *>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1) {
    return common::Result<Bytes>::failure("Encrypt update failed");
  }
  total_len += out_len;
  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total_len, &out_len) != 1) {
    return common::Result<Bytes>::failure("Encrypt final failed");
  }
  total_len += out_len;

  std::array<unsigned char, TAG_SIZE> tag{};
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(TAG_SIZE),
                          tag.data()) != 1) {
    return common::Result<Bytes>::failure("Failed to get tag");
  }

  ciphertext.resize(static_cast<std::size_t>(total_len));
  ciphertext.insert(ciphertext.end(), tag.begin(), tag.end());
  return common::Result<Bytes>::success(std::move(ciphertext));
}

common::Result<std::string> chacha_decrypt(const SecretKey &key, const Nonce &nonce,
                                           const Bytes &ciphertext_with_tag) {
  if (ciphertext_with_tag.size() < TAG_SIZE) {
    return common::Result<std::string>::failure("Ciphertext too short");
  }
  const std::size_t data_size = ciphertext_with_tag.size() - TAG_SIZE;
  Bytes tag(ciphertext_with_tag.begin() + static_cast<long>(data_size),
            ciphertext_with_tag.end());

  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return common::Result<std::string>::failure("Failed to create cipher context");
  }
  if (const auto status = init_cipher(ctx.get(), key, nonce, false); !status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }

  Bytes plaintext(data_size + TAG_SIZE);
  int out_len = 0;
  int total_len = 0;
  if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, ciphertext_with_tag.data(),
                        static_cast<int>(data_size)) != 1) {
    return common::Result<std::string>::failure("Decrypt update failed");
  }
  total_len += out_len;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(TAG_SIZE),
                          tag.data()) != 1) {
    return common::Result<std::string>::failure("Failed to set tag");
  }
  if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &out_len) != 1) {
    return common::Result<std::string>::failure("Decryption failed");
  }
  total_len += out_len;

  return common::Result<std::string>::success(std::string(
      reinterpret_cast<const char *>(plaintext.data()), static_cast<std::size_t>(total_len)));
}

} // namespace

SecretKey generate_key() {
  SecretKey key{};
  RAND_bytes(key.data(), static_cast<int>(key.size()));
  return key;
}

common::Result<SecretKey> load_or_create_key(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      return common::Result<SecretKey>::failure("Failed to read key file: " + path.string());
    }
    SecretKey key{};
    in.read(reinterpret_cast<char *>(key.data()), static_cast<std::streamsize>(key.size()));
    if (in.gcount() != static_cast<std::streamsize>(key.size())) {
      return common::Result<SecretKey>::failure("Key file has invalid size: " + path.string());
    }
    return common::Result<SecretKey>::success(key);
  }

  if (path.has_parent_path()) {
    const auto dir = common::ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return common::Result<SecretKey>::failure(dir.error());
    }
  }

  const auto key = generate_key();
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return common::Result<SecretKey>::failure("Failed to write key file: " + path.string());
  }
  out.write(reinterpret_cast<const char *>(key.data()), static_cast<std::streamsize>(key.size()));
  out.close();
  if (!out) {
    return common::Result<SecretKey>::failure("Failed to write key file: " + path.string());
  }

#ifndef _WIN32
  chmod(path.c_str(), 0600);
#endif

  return common::Result<SecretKey>::success(key);
}

common::Result<std::string> encrypt_secret(const SecretKey &key, const std::string &plaintext) {
  Nonce nonce{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    return common::Result<std::string>::failure("Failed to generate nonce");
  }

  const auto ciphertext = chacha_encrypt(key, nonce, plaintext);
  if (!ciphertext.ok()) {
    return common::Result<std::string>::failure(ciphertext.error());
  }

  Bytes blob;
  blob.reserve(NONCE_SIZE + ciphertext.value().size());
  blob.insert(blob.end(), nonce.begin(), nonce.end());
  blob.insert(blob.end(), ciphertext.value().begin(), ciphertext.value().end());
  return common::Result<std::string>::success(b64_encode(blob));
}

common::Result<std::string> decrypt_secret(const SecretKey &key, const std::string &ciphertext) {
  const auto decoded = b64_decode(ciphertext);
  if (!decoded.ok()) {
    return common::Result<std::string>::failure(decoded.error());
  }
  if (decoded.value().size() < NONCE_SIZE + TAG_SIZE) {
    return common::Result<std::string>::failure("Ciphertext too short");
  }

  Nonce nonce{};
  std::copy_n(decoded.value().begin(), NONCE_SIZE, nonce.begin());
  Bytes payload(decoded.value().begin() + static_cast<long>(NONCE_SIZE), decoded.value().end());
  return chacha_decrypt(key, nonce, payload);
}

} // namespace toolguard::security
