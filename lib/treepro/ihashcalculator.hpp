#ifndef IHASHCALCULATOR_HPP
#define IHASHCALCULATOR_HPP

#include <string>

/**
 * @brief Digest over an in-memory byte string, returned as lowercase hex
 */
class IHashCalculator {
public:
    virtual std::string calculateHash(const std::string& bytes) const = 0;
    virtual ~IHashCalculator() = default;
};

#endif // IHASHCALCULATOR_HPP
