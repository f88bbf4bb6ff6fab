// Minimal logging utility (header-only) for treepro.
// Enabled by setting TREEPRO_LOG to any value other than "" or "0".
#ifndef TREEPRO_LOG_HPP
#define TREEPRO_LOG_HPP

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

inline bool treeproLogEnabled() {
  const char *v = std::getenv("TREEPRO_LOG");
  return v && *v && *v != '0';
}

inline void treeproLogf(const char *level, const char *fmt, ...) {
  std::fprintf(stderr, "[treepro][%s] ", level);
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fprintf(stderr, "\n");
}

#define TP_LOGI(fmt, ...)                                                     \
  do {                                                                         \
    if (treeproLogEnabled())                                                   \
      treeproLogf("INFO", fmt, ##__VA_ARGS__);                                 \
  } while (0)

#define TP_LOGW(fmt, ...)                                                     \
  do {                                                                         \
    if (treeproLogEnabled())                                                   \
      treeproLogf("WARN", fmt, ##__VA_ARGS__);                                 \
  } while (0)

#define TP_LOGE(fmt, ...)                                                     \
  do {                                                                         \
    if (treeproLogEnabled())                                                   \
      treeproLogf("ERROR", fmt, ##__VA_ARGS__);                                \
  } while (0)

#endif // TREEPRO_LOG_HPP
