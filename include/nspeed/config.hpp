/**
 * @file config.hpp
 * @brief Flat "section.key = value" store filled from INI, JSON or YAML.
 *
 * Backends (CMake opt-in):
 *   - IniBackend  : inih library       (NSPEED_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json       (NSPEED_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (NSPEED_CONFIG_YAML_ENABLED)
 *
 * JSON and YAML documents are one level of sections holding scalars, the
 * same shape as an INI file. A backend that is compiled out still takes part
 * in dispatch and answers ConfigError::kFormatNotSupported.
 *
 * Values are read with GetString(), or with the Overlay*() family: a
 * missing key leaves the field alone, a malformed or out-of-range value is
 * kInvalidValue.
 *
 * @code
 *   nspeed::MultiConfig cfg;
 *   cfg.LoadFile("speedtest.ini");
 *   uint32_t seg = 1024;
 *   cfg.Overlay("transfer", "segment_size", seg);
 * @endcode
 */

#ifndef NSPEED_CONFIG_HPP_
#define NSPEED_CONFIG_HPP_

#include "nspeed/platform.hpp"
#include "nspeed/vocabulary.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#ifdef NSPEED_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef NSPEED_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef NSPEED_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace nspeed {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:       return "file not found";
    case ConfigError::kParseError:         return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kBufferFull:         return "too many entries";
    case ConfigError::kInvalidValue:       return "invalid value";
    default:                               return "unknown";
  }
}

#ifndef NSPEED_CONFIG_MAX_FILE_SIZE
#define NSPEED_CONFIG_MAX_FILE_SIZE 8192U
#endif

// ============================================================================
// Value text parsing
// ============================================================================

namespace detail {

inline bool SameName(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    const char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    const char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
  }
  return *a == *b;
}

inline const char* SkipBlanks(const char* p) noexcept {
  while (*p == ' ' || *p == '\t') ++p;
  return p;
}

/// True when only blanks remain after @p end.
inline bool AtEnd(const char* end) noexcept { return *SkipBlanks(end) == '\0'; }

/**
 * @brief Whole-string unsigned parse. Base 16 accepts an optional 0x.
 * A leading '-' is rejected rather than wrapped.
 */
inline bool ParseUnsigned(const char* text, int base, uint64_t max,
                          uint64_t& out) noexcept {
  const char* p = SkipBlanks(text);
  if (*p == '-' || *p == '\0') return false;
  char* end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(p, &end, base);
  if (end == p || errno == ERANGE || !AtEnd(end) || v > max) return false;
  out = static_cast<uint64_t>(v);
  return true;
}

inline bool ParseSigned(const char* text, int64_t& out) noexcept {
  const char* p = SkipBlanks(text);
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(p, &end, 10);
  if (end == p || errno == ERANGE || !AtEnd(end)) return false;
  out = static_cast<int64_t>(v);
  return true;
}

inline bool ParseReal(const char* text, double& out) noexcept {
  const char* p = SkipBlanks(text);
  char* end = nullptr;
  const double v = std::strtod(p, &end);
  if (end == p || !AtEnd(end)) return false;
  out = v;
  return true;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::SameName(ext, "ini") || detail::SameName(ext, "cfg") ||
           detail::SameName(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::SameName(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::SameName(ext, "yaml") || detail::SameName(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxNameLen = 48;
  static constexpr uint32_t kMaxValueLen = 128;

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  // --- Strict overlays ---

  expected<void, ConfigError> Overlay(const char* section, const char* key,
                                      uint64_t& field) const {
    return OverlayUnsigned(section, key, 10, UINT64_MAX, field);
  }

  expected<void, ConfigError> Overlay(const char* section, const char* key,
                                      uint32_t& field) const {
    uint64_t v = field;
    auto r = OverlayUnsigned(section, key, 10, UINT32_MAX, v);
    field = static_cast<uint32_t>(v);
    return r;
  }

  expected<void, ConfigError> Overlay(const char* section, const char* key,
                                      int32_t& field) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return expected<void, ConfigError>::success();
    int64_t v = 0;
    if (!detail::ParseSigned(e->value, v) || v < INT32_MIN || v > INT32_MAX) {
      return Invalid();
    }
    field = static_cast<int32_t>(v);
    return expected<void, ConfigError>::success();
  }

  expected<void, ConfigError> Overlay(const char* section, const char* key,
                                      double& field) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return expected<void, ConfigError>::success();
    if (!detail::ParseReal(e->value, field)) return Invalid();
    return expected<void, ConfigError>::success();
  }

  /// Hex with optional 0x, at most @p max.
  expected<void, ConfigError> OverlayHex(const char* section, const char* key,
                                         uint64_t max, uint64_t& field) const {
    return OverlayUnsigned(section, key, 16, max, field);
  }

  /// Port 1..65535; 0 is rejected since every configured port is fixed.
  expected<void, ConfigError> OverlayPort(const char* section, const char* key,
                                          uint16_t& field) const {
    uint64_t v = field;
    auto r = OverlayUnsigned(section, key, 10, 65535U, v);
    if (!r.has_value()) return r;
    if (v == 0U) return Invalid();
    field = static_cast<uint16_t>(v);
    return r;
  }

  // --- Query ---

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /// First offending line of the last failed INI parse, 0 if unknown.
  int32_t ErrorLine() const noexcept { return error_line_; }

  /**
   * @brief Insert or replace one value; names longer than kMaxNameLen - 1
   * and values longer than kMaxValueLen - 1 are truncated.
   * @return false when the table is full.
   */
  bool Set(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::SameName(entries_[i].section, section) &&
          detail::SameName(entries_[i].key, key)) {
        CopyTruncated(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_++];
    CopyTruncated(e.section, section, kMaxNameLen);
    CopyTruncated(e.key, key, kMaxNameLen);
    CopyTruncated(e.value, value, kMaxValueLen);
    return true;
  }

 protected:
  struct Entry {
    char section[kMaxNameLen];
    char key[kMaxNameLen];
    char value[kMaxValueLen];
  };

  const Entry* Find(const char* section, const char* key) const {
    NSPEED_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::SameName(entries_[i].section, section) &&
          detail::SameName(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  expected<void, ConfigError> OverlayUnsigned(const char* section,
                                              const char* key, int base,
                                              uint64_t max,
                                              uint64_t& field) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return expected<void, ConfigError>::success();
    if (!detail::ParseUnsigned(e->value, base, max, field)) return Invalid();
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> Invalid() {
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }

  static void CopyTruncated(char* dst, const char* src, uint32_t cap) noexcept {
    (void)std::snprintf(dst, cap, "%s", (src != nullptr) ? src : "");
  }

  /// Whole file into @p buf; a file that does not fit is a parse error.
  static expected<uint32_t, ConfigError> Slurp(const char* path, char* buf,
                                               uint32_t cap) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    const size_t n = std::fread(buf, 1, cap - 1U, f);
    const bool truncated = (n == cap - 1U) && std::fgetc(f) != EOF;
    std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kParseError);
    }
    buf[n] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(n));
  }

  static const char* Extension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;
  int32_t error_line_ = 0;

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: backend compiled out. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef NSPEED_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    return Finish(store, ini_parse(path, &OnValue, &store));
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    return Finish(store, ini_parse_string(data, &OnValue, &store));
  }

 private:
  // inih: 0 ok, -1 open failed, -2 out of memory, >0 first bad line.
  static expected<void, ConfigError> Finish(ConfigStore& store, int rc) {
    store.error_line_ = (rc > 0) ? rc : 0;
    if (rc == 0) return expected<void, ConfigError>::success();
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    return expected<void, ConfigError>::error(ConfigError::kParseError);
  }

  static int OnValue(void* user, const char* section, const char* name,
                     const char* value) {
    return static_cast<ConfigStore*>(user)->Set(
               (section != nullptr) ? section : "",
               (name != nullptr) ? name : "",
               (value != nullptr) ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef NSPEED_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[NSPEED_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::Slurp(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    const auto doc = nlohmann::json::parse(data, data + size, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = doc.begin(); sec != doc.end(); ++sec) {
      if (!sec->is_object()) {
        auto r = Put(store, "", sec.key(), *sec);
        if (!r.has_value()) return r;
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        auto r = Put(store, sec.key(), kv.key(), *kv);
        if (!r.has_value()) return r;
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Put(ConfigStore& store,
                                         const std::string& section,
                                         const std::string& key,
                                         const nlohmann::json& v) {
    char text[ConfigStore::kMaxValueLen];
    if (v.is_string()) {
      ConfigStore::CopyTruncated(text, v.get_ref<const std::string&>().c_str(),
                                 sizeof(text));
    } else if (v.is_boolean()) {
      ConfigStore::CopyTruncated(text, v.get<bool>() ? "true" : "false",
                                 sizeof(text));
    } else if (v.is_number_unsigned()) {
      std::snprintf(text, sizeof(text), "%llu",
                    static_cast<unsigned long long>(v.get<uint64_t>()));
    } else if (v.is_number_integer()) {
      std::snprintf(text, sizeof(text), "%lld",
                    static_cast<long long>(v.get<int64_t>()));
    } else if (v.is_number_float()) {
      std::snprintf(text, sizeof(text), "%.17g", v.get<double>());
    } else {
      // Arrays, nested objects and null have no flat form.
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!store.Set(section.c_str(), key.c_str(), text)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }
};
#endif

#ifdef NSPEED_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[NSPEED_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::Slurp(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(std::string(data, size));
    } catch (const fkyaml::exception&) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      const auto name = sec.key().get_value<std::string>();
      if (!sec->is_mapping()) {
        auto r = Put(store, "", name, *sec);
        if (!r.has_value()) return r;
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        auto r = Put(store, name, kv.key().get_value<std::string>(), *kv);
        if (!r.has_value()) return r;
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Put(ConfigStore& store,
                                         const std::string& section,
                                         const std::string& key,
                                         const fkyaml::node& v) {
    char text[ConfigStore::kMaxValueLen];
    if (v.is_string()) {
      ConfigStore::CopyTruncated(text, v.get_value<std::string>().c_str(),
                                 sizeof(text));
    } else if (v.is_boolean()) {
      ConfigStore::CopyTruncated(text, v.get_value<bool>() ? "true" : "false",
                                 sizeof(text));
    } else if (v.is_integer()) {
      std::snprintf(text, sizeof(text), "%lld",
                    static_cast<long long>(v.get_value<int64_t>()));
    } else if (v.is_float_number()) {
      std::snprintf(text, sizeof(text), "%.17g", v.get_value<double>());
    } else {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!store.Set(section.c_str(), key.c_str(), text)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

/**
 * @brief ConfigStore that loads through the listed backends.
 *
 * kAuto picks the backend by file extension; unknown or missing extensions
 * go to the first backend listed.
 */
template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    NSPEED_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = FormatOf(path);
    return Route<Backends...>(format, [this, path](auto tag) {
      using Parser = ConfigParser<typename decltype(tag)::Backend>;
      return Parser::ParseFile(*this, path);
    });
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    NSPEED_ASSERT(data != nullptr);
    return Route<Backends...>(format, [this, data, size](auto tag) {
      using Parser = ConfigParser<typename decltype(tag)::Backend>;
      return Parser::ParseBuffer(*this, data, size);
    });
  }

 private:
  template <typename B>
  struct Tag {
    using Backend = B;
  };

  template <typename First, typename... Rest, typename Fn>
  static expected<void, ConfigError> Route(ConfigFormat format, Fn&& fn) {
    if (First::kFormat == format) return fn(Tag<First>{});
    if constexpr (sizeof...(Rest) > 0) {
      return Route<Rest...>(format, fn);
    } else {
      return expected<void, ConfigError>::error(
          ConfigError::kFormatNotSupported);
    }
  }

  template <typename First, typename... Rest>
  static ConfigFormat MatchExtension(const char* ext) noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return MatchExtension<Rest...>(ext);
    } else {
      return FirstFormat<Backends...>();
    }
  }

  template <typename First, typename...>
  static constexpr ConfigFormat FirstFormat() noexcept {
    return First::kFormat;
  }

  static ConfigFormat FormatOf(const char* path) noexcept {
    const char* ext = Extension(path);
    return (ext == nullptr) ? FirstFormat<Backends...>()
                            : MatchExtension<Backends...>(ext);
  }
};

/// INI first, so unknown extensions are read as INI.
using MultiConfig = Config<IniBackend, JsonBackend, YamlBackend>;

}  // namespace nspeed

#endif  // NSPEED_CONFIG_HPP_
