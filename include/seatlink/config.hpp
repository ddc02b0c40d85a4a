/**
 * @file config.hpp
 * @brief Multi-format configuration with template-based backend dispatch, and
 *        the ClientConfig record loaded from it.
 *
 * Supported backends (CMake opt-in):
 *   - IniBackend  : inih library   (SEATLINK_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (SEATLINK_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (SEATLINK_CONFIG_YAML_ENABLED)
 *
 * All formats are flattened to "section + key = value". Values can also be
 * set through ConfigStore::Set(), which is how overrides and builds without
 * any backend feed LoadClientConfig().
 *
 * @code
 *   seatlink::MultiConfig cfg;
 *   if (cfg.LoadFile("seat.ini").has_value()) {
 *     auto client_cfg = seatlink::LoadClientConfig(cfg);
 *   }
 * @endcode
 */

#ifndef SEATLINK_CONFIG_HPP_
#define SEATLINK_CONFIG_HPP_

#include "seatlink/log.hpp"
#include "seatlink/platform.hpp"
#include "seatlink/reassembler.hpp"
#include "seatlink/serializer.hpp"
#include "seatlink/vocabulary.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <string>
#include <tuple>
#include <utility>

#ifdef SEATLINK_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef SEATLINK_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef SEATLINK_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace seatlink {

enum class ConfigFormat : uint8_t {
  kIni = 0,
  kJson,
  kYaml,
};

// ============================================================================
// Backend tags
// ============================================================================

namespace detail {

/// ASCII case-insensitive equality for section, key and keyword names.
inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    if (std::tolower(static_cast<unsigned char>(*a)) !=
        std::tolower(static_cast<unsigned char>(*b))) {
      return false;
    }
  }
  return *a == *b;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") ||
           detail::StrCaseEqual(ext, "cfg") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "yaml") ||
           detail::StrCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore - flat section/key/value table
// ============================================================================

#ifndef SEATLINK_CONFIG_MAX_FILE_SIZE
#define SEATLINK_CONFIG_MAX_FILE_SIZE 8192U
#endif

/**
 * @brief Fixed-capacity table of "section + key = value" strings.
 *
 * Section and key lookups ignore case. Values are kept as text and converted
 * by the reader; LoadClientConfig() only needs strings and integers.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxNameLen = 48;
  static constexpr uint32_t kMaxValueLen = 128;

  /// Value text, or nullptr if the key is missing.
  const char* Find(const char* section, const char* key) const {
    SEATLINK_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key)) {
        return entries_[i].value;
      }
    }
    return nullptr;
  }

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  /// Empty if the key is missing or its value is not a whole integer.
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const char* text = Find(section, key);
    if (text == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(text, &end, 10);
    if (end == text) return {};
    while (*end == ' ' || *end == '\t') ++end;
    if (*end != '\0') return {};
    return optional<int32_t>(static_cast<int32_t>(val));
  }

  /// Insert or overwrite one value. Overlong text is cut to kMaxValueLen - 1.
  expected<void, ConfigError> Set(const char* section, const char* key,
                                  const char* value) {
    SEATLINK_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key)) {
        CopyText(entries_[i].value, value, kMaxValueLen);
        return expected<void, ConfigError>::success();
      }
    }
    if (count_ >= kMaxEntries) {
      SEATLINK_LOG_WARN("Config", "table full, dropping [%s] %s", section, key);
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    Entry& e = entries_[count_++];
    CopyText(e.section, section, kMaxNameLen);
    CopyText(e.key, key, kMaxNameLen);
    CopyText(e.value, value, kMaxValueLen);
    return expected<void, ConfigError>::success();
  }

 private:
  struct Entry {
    char section[kMaxNameLen];
    char key[kMaxNameLen];
    char value[kMaxValueLen];
  };

  static void CopyText(char* dst, const char* src, uint32_t dst_size) noexcept {
    uint32_t i = 0;
    if (src != nullptr) {
      for (; i + 1U < dst_size && src[i] != '\0'; ++i) dst[i] = src[i];
    }
    dst[i] = '\0';
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;
};

namespace detail {

/// Whole file into @p out. Files above SEATLINK_CONFIG_MAX_FILE_SIZE are
/// refused rather than parsed truncated.
inline expected<void, ConfigError> ReadConfigFile(const char* path,
                                                  std::string& out) {
  FILE* f = std::fopen(path, "rb");
  if (f == nullptr) {
    return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
  }
  out.assign(SEATLINK_CONFIG_MAX_FILE_SIZE + 1U, '\0');
  size_t bytes = std::fread(&out[0], 1, out.size(), f);
  (void)std::fclose(f);
  if (bytes > SEATLINK_CONFIG_MAX_FILE_SIZE) {
    SEATLINK_LOG_WARN("Config", "%s exceeds %u bytes", path,
                      static_cast<unsigned>(SEATLINK_CONFIG_MAX_FILE_SIZE));
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }
  out.resize(bytes);
  return expected<void, ConfigError>::success();
}

inline const char* FileExtension(const char* path) noexcept {
  const char* dot = nullptr;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '.') dot = p;
    if (*p == '/') dot = nullptr;
  }
  return (dot != nullptr) ? dot + 1 : nullptr;
}

}  // namespace detail

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: format not compiled in. */
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

#ifdef SEATLINK_CONFIG_INI_ENABLED
/// inih parses files itself; the handler stops it on the first full table.
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    Context ctx{&store, false};
    return Result(ini_parse(path, Handler, &ctx), ctx);
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    Context ctx{&store, false};
    return Result(ini_parse_string(data, Handler, &ctx), ctx);
  }

 private:
  struct Context {
    ConfigStore* store;
    bool full;
  };

  static expected<void, ConfigError> Result(int rc, const Context& ctx) {
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (ctx.full) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    if (rc != 0) {
      SEATLINK_LOG_WARN("Config", "INI syntax error on line %d", rc);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* ctx = static_cast<Context*>(user);
    if (!ctx->store->Set(section ? section : "", name ? name : "", value)
             .has_value()) {
      ctx->full = true;
      return 0;
    }
    return 1;
  }
};
#endif

#ifdef SEATLINK_CONFIG_JSON_ENABLED
/// Objects one level deep become sections; top-level scalars use section "".
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    std::string text;
    auto r = detail::ReadConfigFile(path, text);
    if (!r.has_value()) return r;
    return ParseBuffer(store, text.data(), static_cast<uint32_t>(text.size()));
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (!it->is_object()) {
        auto r = Put(store, "", it.key(), *it);
        if (!r.has_value()) return r;
        continue;
      }
      for (auto kit = it->begin(); kit != it->end(); ++kit) {
        auto r = Put(store, it.key().c_str(), kit.key(), *kit);
        if (!r.has_value()) return r;
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Put(ConfigStore& store,
                                         const char* section,
                                         const std::string& key,
                                         const nlohmann::json& n) {
    std::string text;
    if (n.is_string()) {
      text = n.get<std::string>();
    } else if (n.is_number() || n.is_boolean()) {
      text = n.dump();
    } else {
      SEATLINK_LOG_WARN("Config", "[%s] %s is not a scalar", section,
                        key.c_str());
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return store.Set(section, key.c_str(), text.c_str());
  }
};
#endif

#ifdef SEATLINK_CONFIG_YAML_ENABLED
/// Same layout as JSON: mappings one level deep become sections.
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    std::string text;
    auto r = detail::ReadConfigFile(path, text);
    if (!r.has_value()) return r;
    return ParseBuffer(store, text.data(), static_cast<uint32_t>(text.size()));
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(std::string(data, size));
    } catch (const std::exception& e) {
      SEATLINK_LOG_WARN("Config", "YAML: %s", e.what());
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const std::string name = it.key().get_value<std::string>();
      if (!it->is_mapping()) {
        auto r = Put(store, "", name, *it);
        if (!r.has_value()) return r;
        continue;
      }
      for (auto kit = it->begin(); kit != it->end(); ++kit) {
        auto r = Put(store, name.c_str(),
                     kit.key().get_value<std::string>(), *kit);
        if (!r.has_value()) return r;
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Put(ConfigStore& store,
                                         const char* section,
                                         const std::string& key,
                                         const fkyaml::node& n) {
    std::string text;
    if (n.is_string()) {
      text = n.get_value<std::string>();
    } else if (n.is_boolean()) {
      text = n.get_value<bool>() ? "true" : "false";
    } else if (n.is_integer()) {
      text = std::to_string(n.get_value<int64_t>());
    } else if (n.is_float_number()) {
      text = std::to_string(n.get_value<double>());
    } else {
      SEATLINK_LOG_WARN("Config", "[%s] %s is not a scalar", section,
                        key.c_str());
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return store.Set(section, key.c_str(), text.c_str());
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

/**
 * @brief ConfigStore plus loaders for the listed backends.
 *
 * LoadFile() picks the backend from the file extension; an unknown or
 * missing extension falls back to the first backend.
 */
template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(const char* path) {
    SEATLINK_ASSERT(path != nullptr);
    const ConfigFormat format = FormatOf(path);
    SEATLINK_LOG_DEBUG("Config", "loading %s", path);
    return Dispatch<Backends...>(format, [&](auto parser) {
      return decltype(parser)::ParseFile(*this, path);
    });
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    SEATLINK_ASSERT(data != nullptr);
    return Dispatch<Backends...>(format, [&](auto parser) {
      return decltype(parser)::ParseBuffer(*this, data, size);
    });
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest, typename Fn>
  static expected<void, ConfigError> Dispatch(ConfigFormat format, Fn&& fn) {
    if (First::kFormat == format) return fn(ConfigParser<First>{});
    if constexpr (sizeof...(Rest) > 0) {
      return Dispatch<Rest...>(format, std::forward<Fn>(fn));
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  static ConfigFormat FormatOf(const char* path) noexcept {
    const char* ext = detail::FileExtension(path);
    if (ext == nullptr) return Head::kFormat;
    ConfigFormat found = Head::kFormat;
    bool matched = false;
    (void)std::initializer_list<int>{
        (!matched && Backends::MatchesExtension(ext)
             ? (found = Backends::kFormat, matched = true, 0)
             : 0)...};
    return found;
  }
};

#if defined(SEATLINK_CONFIG_INI_ENABLED) || \
    defined(SEATLINK_CONFIG_JSON_ENABLED) || defined(SEATLINK_CONFIG_YAML_ENABLED)
#define SEATLINK_CONFIG_HAS_BACKEND 1

/// Every backend compiled into this build.
using MultiConfig = Config<
#ifdef SEATLINK_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(SEATLINK_CONFIG_INI_ENABLED) && \
    (defined(SEATLINK_CONFIG_JSON_ENABLED) || defined(SEATLINK_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef SEATLINK_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(SEATLINK_CONFIG_JSON_ENABLED) && defined(SEATLINK_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef SEATLINK_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

// ============================================================================
// ClientConfig
// ============================================================================

static constexpr uint32_t kDefaultResponseTimeoutMs = 10000U;
static constexpr uint32_t kDefaultMaxFrameSize = 20U;

struct ClientConfig {
  uint32_t response_timeout_ms = kDefaultResponseTimeoutMs;
  uint32_t max_frame_size = kDefaultMaxFrameSize;  ///< link MTU in bytes
  ReassemblyPolicy reassembly = ReassemblyPolicy::kImmediate;
  uint32_t max_completed_messages = kDefaultMaxCompletedMessages;
  uint8_t status_layout = 1;
  optional<log::Level> log_level;  ///< empty: leave the logger untouched
};

namespace detail {

/// Missing key -> @p out untouched. Present but non-integer or outside
/// [lo, hi] -> false.
inline bool ReadRanged(const ConfigStore& store, const char* section,
                       const char* key, int32_t lo, int32_t hi,
                       uint32_t& out) {
  if (!store.HasKey(section, key)) return true;
  auto v = store.FindInt(section, key);
  if (!v.has_value() || v.value() < lo || v.value() > hi) {
    SEATLINK_LOG_WARN("Config", "[%s] %s = '%s' is not in %d..%d", section, key,
                      store.Find(section, key), lo, hi);
    return false;
  }
  out = static_cast<uint32_t>(v.value());
  return true;
}

}  // namespace detail

/**
 * @brief Build a ClientConfig from a loaded store.
 *
 * Keys (all optional):
 *   [link]     response_timeout_ms   1..600000
 *   [link]     max_frame_size        4..255
 *   [link]     reassembly            immediate | final_flag
 *   [link]     max_completed_messages 1..256
 *   [protocol] status_layout         known layout version (1)
 *   [log]      level                 debug | info | warn | error | fatal | off
 *
 * @return kInvalidValue on the first malformed or out-of-range value.
 */
inline expected<ClientConfig, ConfigError> LoadClientConfig(
    const ConfigStore& store) {
  using Result = expected<ClientConfig, ConfigError>;
  ClientConfig cfg;

  if (!detail::ReadRanged(store, "link", "response_timeout_ms", 1, 600000,
                          cfg.response_timeout_ms) ||
      !detail::ReadRanged(store, "link", "max_frame_size", 4, 255,
                          cfg.max_frame_size) ||
      !detail::ReadRanged(store, "link", "max_completed_messages", 1, 256,
                          cfg.max_completed_messages)) {
    return Result::error(ConfigError::kInvalidValue);
  }

  if (store.HasKey("link", "reassembly")) {
    const char* mode = store.Find("link", "reassembly");
    if (detail::StrCaseEqual(mode, "immediate")) {
      cfg.reassembly = ReassemblyPolicy::kImmediate;
    } else if (detail::StrCaseEqual(mode, "final_flag")) {
      cfg.reassembly = ReassemblyPolicy::kFinalFlag;
    } else {
      SEATLINK_LOG_WARN("Config", "unknown reassembly mode '%s'", mode);
      return Result::error(ConfigError::kInvalidValue);
    }
  }

  uint32_t layout = cfg.status_layout;
  if (!detail::ReadRanged(store, "protocol", "status_layout", 0, 255, layout) ||
      FindStatusLayout(static_cast<uint8_t>(layout)) == nullptr) {
    SEATLINK_LOG_WARN("Config", "unsupported status layout %u",
                      static_cast<unsigned>(layout));
    return Result::error(ConfigError::kInvalidValue);
  }
  cfg.status_layout = static_cast<uint8_t>(layout);

  if (store.HasKey("log", "level")) {
    const char* name = store.Find("log", "level");
    auto level = log::ParseLevel(name);
    if (!level.has_value()) {
      SEATLINK_LOG_WARN("Config", "unknown log level '%s'", name);
      return Result::error(ConfigError::kInvalidValue);
    }
    cfg.log_level = level;
  }

  return Result::success(std::move(cfg));
}

}  // namespace seatlink

#endif  // SEATLINK_CONFIG_HPP_
