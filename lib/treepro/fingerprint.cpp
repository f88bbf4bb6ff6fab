#include "fingerprint.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace {

void appendU64(std::string &out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<char>(value & 0xffu));
    value >>= 8;
  }
}

// Length-prefixed field: 8-byte little-endian size, then the raw bytes.
void appendField(std::string &out, const std::string &field) {
  appendU64(out, static_cast<std::uint64_t>(field.size()));
  out += field;
}

} // namespace

std::string
Fingerprint::forDirectory(const ExtensionHistogram &extensions,
                          std::vector<std::string> childSignatures) const {
  std::string encoded;
  appendField(encoded, "files");
  appendU64(encoded, static_cast<std::uint64_t>(extensions.size()));
  for (const auto &[ext, count] : extensions) {
    appendField(encoded, ext);
    appendU64(encoded, static_cast<std::uint64_t>(count));
  }

  std::sort(childSignatures.begin(), childSignatures.end());
  appendField(encoded, "dirs");
  appendU64(encoded, static_cast<std::uint64_t>(childSignatures.size()));
  for (const auto &sig : childSignatures) {
    appendField(encoded, sig);
  }

  return "d:" + hashCalculator.calculateHash(encoded);
}

std::string
Fingerprint::forUnknownContents(const std::filesystem::path &path) const {
  std::string encoded;
  appendField(encoded, "leaf");
  appendField(encoded, path.string());
  return "l:" + hashCalculator.calculateHash(encoded);
}

std::string Fingerprint::forError(const std::filesystem::path &path,
                                  ReadErrorKind kind) const {
  std::string encoded;
  appendField(encoded, "error");
  appendField(encoded, path.string());
  appendField(encoded, readErrorKindName(kind));
  return "e:" + hashCalculator.calculateHash(encoded);
}

std::string Fingerprint::fallback(const std::string &name, std::size_t depth) {
  return "name:" + name + ":level:" + std::to_string(depth);
}

std::string Fingerprint::normalizeExtension(const std::string &filename) {
  const auto dot = filename.rfind('.');
  if (dot == std::string::npos)
    return kNoExtension;

  std::string ext = filename.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}
