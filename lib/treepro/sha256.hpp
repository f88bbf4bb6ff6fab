#ifndef SHA256_HPP
#define SHA256_HPP

#include "ihashcalculator.hpp"

/**
 * @brief SHA-256 digest backed by OpenSSL's EVP interface
 *
 * Used for structural signatures, where a collision would merge two
 * directories that do not look alike.
 *
 * @throws std::runtime_error if OpenSSL fails to allocate or run the digest
 */
class Sha256 : public IHashCalculator {
public:
  std::string calculateHash(const std::string &bytes) const override;
};

#endif // SHA256_HPP
