/**
 * @file fingerprint.hpp
 * @brief Structural signatures for directory nodes
 *
 * A signature summarizes what a directory "looks like": how many files of
 * each extension it holds and the signatures of its subdirectories. Two
 * directories with equal signatures are collapsed into one identical group
 * when the tree is displayed.
 *
 * File names and contents are never part of a signature. Two directories
 * holding {a.go} and {b.go} compare equal, which is the intended
 * granularity for display collapsing.
 */

#ifndef FINGERPRINT_HPP
#define FINGERPRINT_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "direntry.hpp"
#include "ihashcalculator.hpp"

/** @brief Normalized extension -> number of files, ordered by extension */
using ExtensionHistogram = std::map<std::string, std::size_t>;

/**
 * @class Fingerprint
 * @brief Computes structural signatures from already-computed child data
 *
 * Pure functions of their inputs: no filesystem access, no dependency on
 * the order entries were read in. Every signature carries a category tag
 * ("d:", "l:", "e:") so signatures of different categories never collide.
 *
 * @note The calculator reference must outlive the Fingerprint object
 * @see IHashCalculator
 */
class Fingerprint {
private:
  const IHashCalculator &hashCalculator;

public:
  /** @brief Extension token used for files without a dot in their name */
  static constexpr const char *kNoExtension = "<noext>";

  explicit Fingerprint(const IHashCalculator &calculator)
      : hashCalculator(calculator) {}

  /**
   * @brief Signature of a directory that was read successfully
   *
   * Extensions are taken in key order and child signatures are sorted
   * before hashing. Each field is length-prefixed so no two different
   * inputs produce the same byte stream.
   *
   * @param extensions Histogram over all files of the directory, including
   *                   files hidden by the display limit
   * @param childSignatures Signatures of the immediate subdirectories, in
   *                        any order
   */
  std::string forDirectory(const ExtensionHistogram &extensions,
                           std::vector<std::string> childSignatures) const;

  /**
   * @brief Signature of a subdirectory skipped by the depth limit
   *
   * Derived from the path, so two depth-limited branches never match each
   * other or a real leaf directory.
   */
  std::string forUnknownContents(const std::filesystem::path &path) const;

  /**
   * @brief Signature of a directory whose read failed
   *
   * Derived from the path and the error category, so a broken directory
   * never groups with an empty one.
   */
  std::string forError(const std::filesystem::path &path,
                       ReadErrorKind kind) const;

  /**
   * @brief Signature used for nodes that reach grouping without one
   */
  static std::string fallback(const std::string &name, std::size_t depth);

  /**
   * @brief Lower-cased extension of a file name, including the dot
   *
   * The extension starts at the last '.' of the name, so "archive.tar.gz"
   * yields ".gz" and ".bashrc" yields ".bashrc". Names without a dot yield
   * kNoExtension.
   */
  static std::string normalizeExtension(const std::string &filename);
};

#endif // FINGERPRINT_HPP
