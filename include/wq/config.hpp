/**
 * @file config.hpp
 * @brief Flat "section.key = value" configuration store with pluggable
 *        file-format backends.
 *
 * Backends (CMake opt-in):
 *   - IniBackend  : inih library   (WQ_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (WQ_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (WQ_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to the same model: top-level objects become
 * sections, their scalar members become keys. Top-level scalars land in the
 * "" section.
 *
 * Usage:
 * @code
 *   wq::MultiConfig cfg;
 *   auto r = cfg.LoadFile("task_service.json");
 *   uint32_t delay = cfg.GetUint32("task", "retry_delay_ms", 1000);
 * @endcode
 */

#ifndef WQ_CONFIG_HPP_
#define WQ_CONFIG_HPP_

#include "wq/platform.hpp"
#include "wq/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <strings.h>

#ifdef WQ_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef WQ_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef WQ_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace wq {

// ============================================================================
// ConfigError / ConfigFormat
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kInvalidValue,
};

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

inline const char* ConfigErrorName(ConfigError err) noexcept {
  switch (err) {
    case ConfigError::kFileNotFound:       return "file not found";
    case ConfigError::kParseError:         return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kInvalidValue:       return "invalid value";
  }
  return "unknown";
}

// ============================================================================
// Backend Tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return strcasecmp(ext, "ini") == 0 || strcasecmp(ext, "conf") == 0;
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return strcasecmp(ext, "json") == 0;
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return strcasecmp(ext, "yaml") == 0 || strcasecmp(ext, "yml") == 0;
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  // --- Typed getters ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    auto v = FindInt(section, key);
    return v.has_value() ? *v : default_val;
  }

  /// Negative values fall back to @p default_val.
  uint32_t GetUint32(const char* section, const char* key,
                     uint32_t default_val = 0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long long val = std::strtoll(e->value.c_str(), &end, 10);
    if (end == e->value.c_str() || val < 0) return default_val;
    if (val > static_cast<long long>(UINT32_MAX)) return UINT32_MAX;
    return static_cast<uint32_t>(val);
  }

  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    auto v = FindInt(section, key);
    if (!v.has_value()) return default_val;
    if (*v < 0) return 0;
    if (*v > 65535) return 65535;
    return static_cast<uint16_t>(*v);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value.c_str()) : default_val;
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(e->value.c_str(), &end);
    return (end == e->value.c_str()) ? default_val : val;
  }

  std::optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return std::nullopt;
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    if (end == e->value.c_str()) return std::nullopt;
    return static_cast<int32_t>(val);
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    WQ_ASSERT(section != nullptr);
    for (const auto& e : entries_) {
      if (strcasecmp(e.section.c_str(), section) == 0) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  /// Insert or overwrite one entry (used by parsers and by tests).
  void Set(const char* section, const char* key, const char* value) {
    for (auto& e : entries_) {
      if (strcasecmp(e.section.c_str(), section) == 0 &&
          strcasecmp(e.key.c_str(), key) == 0) {
        e.value = value;
        return;
      }
    }
    entries_.push_back(Entry{section, key, value});
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  std::vector<Entry> entries_;

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kFileNotFound);
    }
    std::string content;
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
      content.append(buf, n);
    }
    const bool failed = (std::ferror(f) != 0);
    std::fclose(f);
    if (failed) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kParseError);
    }
    return expected<std::string, ConfigError>::success(std::move(content));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    WQ_ASSERT(section != nullptr && key != nullptr);
    for (const auto& e : entries_) {
      if (strcasecmp(e.section.c_str(), section) == 0 &&
          strcasecmp(e.key.c_str(), key) == 0) {
        return &e;
      }
    }
    return nullptr;
  }

  static bool ParseBool(const char* str) noexcept {
    return strcasecmp(str, "true") == 0 || strcasecmp(str, "1") == 0 ||
           strcasecmp(str, "yes") == 0 || strcasecmp(str, "on") == 0;
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: format compiled out. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseBuffer(ConfigStore&,
                                                 const std::string&) {
    return expected<void, ConfigError>::error(
        ConfigError::kFormatNotSupported);
  }
};

#ifdef WQ_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    if (ini_parse_string(data.c_str(), Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    s->Set(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

#ifdef WQ_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.Set(it.key().c_str(), kit.key().c_str(), ToStr(*kit).c_str());
        }
      } else {
        store.Set("", it.key().c_str(), ToStr(*it).c_str());
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    return n.dump();
  }
};
#endif

#ifdef WQ_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto root = fkyaml::node::deserialize(data);
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          store.Set(sec.c_str(), key.c_str(), ToStr(*kit).c_str());
        }
      } else {
        store.Set("", sec.c_str(), ToStr(node).c_str());
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    return std::string();
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

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    WQ_ASSERT(path != nullptr);
    auto content = ReadFile(path);
    if (!content.has_value()) {
      return expected<void, ConfigError>::error(content.get_error());
    }
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return Dispatch<Backends...>(content.value(), format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data,
                                         ConfigFormat format) {
    return Dispatch<Backends...>(data, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> Dispatch(const std::string& data,
                                       ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return Dispatch<Rest...>(data, format);
    }
    return expected<void, ConfigError>::error(
        ConfigError::kFormatNotSupported);
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

using MultiConfig = Config<
#ifdef WQ_CONFIG_INI_ENABLED
    IniBackend,
#endif
#ifdef WQ_CONFIG_YAML_ENABLED
    YamlBackend,
#endif
    JsonBackend>;

#ifdef WQ_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef WQ_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef WQ_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace wq

#endif  // WQ_CONFIG_HPP_
