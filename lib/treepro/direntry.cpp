#include "direntry.hpp"

std::string readErrorLabel(const ReadError &error) {
  if (error.isPermissionDenied())
    return "Permission denied";

  const std::string &msg = error.message;
  const auto first = msg.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return "error";
  const auto last = msg.find_last_not_of(" \t\r\n");
  return msg.substr(first, last - first + 1);
}
