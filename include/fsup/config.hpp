/**
 * @file config.hpp
 * @brief Multi-format configuration reader with compile-time backend selection.
 *
 * Every format is flattened to a "section + key = value" table held inline
 * (no heap). Backends are composed at compile time via Config<Backends...>;
 * each one is enabled from CMake:
 *   - IniBackend  : inih           (FSUP_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (FSUP_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (FSUP_CONFIG_YAML_ENABLED)
 *
 * Usage:
 * @code
 *   fsup::MultiConfig cfg;
 *   cfg.LoadFile("supervisor.ini");
 *   int32_t max_id = cfg.GetInt("supervisor", "max_probe_id", 10000);
 * @endcode
 */

#ifndef FSUP_CONFIG_HPP_
#define FSUP_CONFIG_HPP_

#include "fsup/platform.hpp"
#include "fsup/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>

#ifdef FSUP_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef FSUP_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef FSUP_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace fsup {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept { return detail::CaseEqual(ext, "json"); }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

#ifndef FSUP_CONFIG_MAX_FILE_SIZE
#define FSUP_CONFIG_MAX_FILE_SIZE 4096U
#endif

// ============================================================================
// ConfigStore - flat key/value table shared by all backends
// ============================================================================

class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key, const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  double GetDouble(const char* section, const char* key, double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    const double val = std::strtod(e->value, &end);
    return (end == e->value) ? default_val : val;
  }

  /// Empty when the key is missing, is not a whole decimal number, or does
  /// not fit in int32_t.
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    errno = 0;
    const long long val = std::strtoll(e->value, &end, 10);
    if (end == e->value || errno == ERANGE) return {};
    while (*end == ' ' || *end == '\t' || *end == '\r' || *end == '\n') ++end;
    if (*end != '\0') return {};
    if (val < INT32_MIN || val > INT32_MAX) return {};
    return optional<int32_t>(static_cast<int32_t>(val));
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    return optional<bool>(ParseBool(e->value));
  }

  bool HasSection(const char* section) const {
    FSUP_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const { return FindEntry(section, key) != nullptr; }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 48;
  static constexpr uint32_t kMaxValueLen = 128;

  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  /// Later definitions of the same section/key overwrite earlier ones.
  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) && detail::CaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    FSUP_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) && detail::CaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf, uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    const size_t bytes = std::fread(buf, 1, buf_size - 1U, f);
    (void)std::fclose(f);
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') {
      dst[i] = src[i];
      ++i;
    }
    dst[i] = '\0';
  }

  static bool ParseBool(const char* str) noexcept {
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backend compiled out: every load reports kFormatNotSupported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*, uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef FSUP_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    const int rc = ini_parse(path, Handler, &store);
    if (rc == -1) return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (rc != 0) return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t) {
    if (ini_parse_string(data, Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name, const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->AddEntry(section ? section : "", name ? name : "", value ? value : "") ? 1 : 0;
  }
};
#endif

#ifdef FSUP_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[FSUP_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!Add(store, it.key().c_str(), kit.key().c_str(), *kit)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!Add(store, "", it.key().c_str(), *it)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Add(ConfigStore& store, const char* section, const char* key, const nlohmann::json& n) {
    char val[ConfigStore::kMaxValueLen];
    if (n.is_string()) {
      ConfigStore::SafeCopy(val, n.get_ref<const std::string&>().c_str(), sizeof(val));
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(val, n.get<bool>() ? "true" : "false", sizeof(val));
    } else if (n.is_number_integer()) {
      (void)std::snprintf(val, sizeof(val), "%lld", static_cast<long long>(n.get<int64_t>()));
    } else if (n.is_number_float()) {
      (void)std::snprintf(val, sizeof(val), "%g", n.get<double>());
    } else {
      ConfigStore::SafeCopy(val, n.dump().c_str(), sizeof(val));
    }
    return store.AddEntry(section, key, val);
  }
};
#endif

#ifdef FSUP_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[FSUP_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t size) {
    auto root = fkyaml::node::deserialize(std::string(data, size));
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const auto section = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          const auto key = kit.key().get_value<std::string>();
          if (!Add(store, section.c_str(), key.c_str(), *kit)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!Add(store, "", section.c_str(), node)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Add(ConfigStore& store, const char* section, const char* key, const fkyaml::node& n) {
    char val[ConfigStore::kMaxValueLen];
    if (n.is_string()) {
      ConfigStore::SafeCopy(val, n.get_value<std::string>().c_str(), sizeof(val));
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(val, n.get_value<bool>() ? "true" : "false", sizeof(val));
    } else if (n.is_integer()) {
      (void)std::snprintf(val, sizeof(val), "%lld", static_cast<long long>(n.get_value<int64_t>()));
    } else if (n.is_float_number()) {
      (void)std::snprintf(val, sizeof(val), "%g", n.get_value<double>());
    } else {
      val[0] = '\0';
    }
    return store.AddEntry(section, key, val);
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  /// kAuto picks the backend from the file extension, falling back to the first one.
  expected<void, ConfigError> LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    FSUP_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size, ConfigFormat format) {
    FSUP_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0) return DispatchBuffer<Rest...>(data, size, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

// ============================================================================
// Aliases
// ============================================================================

#if defined(FSUP_CONFIG_INI_ENABLED) && defined(FSUP_CONFIG_JSON_ENABLED) && \
    defined(FSUP_CONFIG_YAML_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend, YamlBackend>;
#elif defined(FSUP_CONFIG_INI_ENABLED) && defined(FSUP_CONFIG_JSON_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend>;
#elif defined(FSUP_CONFIG_INI_ENABLED) && defined(FSUP_CONFIG_YAML_ENABLED)
using MultiConfig = Config<IniBackend, YamlBackend>;
#elif defined(FSUP_CONFIG_JSON_ENABLED) && defined(FSUP_CONFIG_YAML_ENABLED)
using MultiConfig = Config<JsonBackend, YamlBackend>;
#elif defined(FSUP_CONFIG_JSON_ENABLED)
using MultiConfig = Config<JsonBackend>;
#elif defined(FSUP_CONFIG_YAML_ENABLED)
using MultiConfig = Config<YamlBackend>;
#else
using MultiConfig = Config<IniBackend>;
#endif

}  // namespace fsup

#endif  // FSUP_CONFIG_HPP_
