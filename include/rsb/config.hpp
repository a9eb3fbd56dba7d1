/**
 * @file config.hpp
 * @brief Multi-format configuration reader with template-based backend dispatch.
 *
 * Backends are empty tag types; each one selects a ConfigParser<Backend>
 * specialization and Config<Backends...> composes them at compile time.
 *
 * Supported backends (CMake opt-in):
 *   - IniBackend  : inih library       (RSB_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json      (RSB_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (RSB_CONFIG_YAML_ENABLED)
 *
 * Every format lands in the same two-level "section / key = value" store.
 * JSON and YAML documents are read one mapping deep: a top-level mapping is
 * a section, a top-level scalar goes to the unnamed section "". Sequences
 * become one space-joined value so argument lists ("args: [-m, uvicorn]")
 * read back as a single string. Section and key lookups ignore case.
 *
 * Usage:
 * @code
 *   rsb::MultiConfig cfg;
 *   if (cfg.LoadFile("rs485_bridge.yaml")) {
 *     uint16_t port = cfg.GetPort("server", "port", 8001);
 *   }
 * @endcode
 */

#ifndef RSB_CONFIG_HPP_
#define RSB_CONFIG_HPP_

#include "rsb/platform.hpp"
#include "rsb/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <tuple>

#ifdef RSB_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef RSB_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef RSB_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef RSB_CONFIG_MAX_FILE_SIZE
#define RSB_CONFIG_MAX_FILE_SIZE (64U * 1024U)
#endif

#ifndef RSB_CONFIG_MAX_ENTRIES
#define RSB_CONFIG_MAX_ENTRIES 256U
#endif

namespace rsb {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char FoldCase(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline std::string Folded(const char* s) {
  std::string out;
  if (s == nullptr) return out;
  for (; *s != '\0'; ++s) out.push_back(FoldCase(*s));
  return out;
}

inline bool CaseEqual(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    if (FoldCase(*a) != FoldCase(*b)) return false;
  }
  return *a == *b;
}

/// Whole file into memory, bounded by RSB_CONFIG_MAX_FILE_SIZE.
inline expected<std::string, ConfigError> ReadConfigFile(const char* path) {
  using Result = expected<std::string, ConfigError>;
  std::unique_ptr<FILE, int (*)(FILE*)> fp(std::fopen(path, "rb"),
                                           &std::fclose);
  if (!fp) return Result::error(ConfigError::kFileNotFound);

  std::string data;
  char chunk[4096];
  size_t n;
  while ((n = std::fread(chunk, 1, sizeof(chunk), fp.get())) > 0U) {
    if (data.size() + n > RSB_CONFIG_MAX_FILE_SIZE) {
      return Result::error(ConfigError::kBufferFull);
    }
    data.append(chunk, n);
  }
  if (std::ferror(fp.get()) != 0) return Result::error(ConfigError::kParseError);
  return Result::success(std::move(data));
}

/// True if @p s equals any of @p names, ignoring case.
template <size_t N>
bool MatchesAny(const char* s, const char* const (&names)[N]) noexcept {
  for (const char* name : names) {
    if (CaseEqual(s, name)) return true;
  }
  return false;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    static constexpr const char* kExts[] = {"ini", "cfg", "conf"};
    return detail::MatchesAny(ext, kExts);
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    static constexpr const char* kExts[] = {"json"};
    return detail::MatchesAny(ext, kExts);
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    static constexpr const char* kExts[] = {"yaml", "yml"};
    return detail::MatchesAny(ext, kExts);
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const std::string* v = Lookup(section, key);
    return (v != nullptr) ? v->c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    const auto n = LeadingInteger(Lookup(section, key));
    return n.has_value() ? static_cast<int32_t>(*n) : default_val;
  }

  /// @brief Non-negative integer; negative or unparsable values yield default.
  uint32_t GetUint(const char* section, const char* key,
                   uint32_t default_val = 0) const {
    const auto n = LeadingInteger(Lookup(section, key));
    if (!n.has_value() || *n < 0) return default_val;
    return (*n > 0xFFFFFFFFLL) ? 0xFFFFFFFFU : static_cast<uint32_t>(*n);
  }

  /// @brief Port number, clamped into [0, 65535].
  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    const auto n = LeadingInteger(Lookup(section, key));
    if (!n.has_value()) return default_val;
    if (*n < 0) return 0U;
    return (*n > 65535) ? 65535U : static_cast<uint16_t>(*n);
  }

  /// @brief true/1/yes/on (any case) is true; any other present value is false.
  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const std::string* v = Lookup(section, key);
    return (v != nullptr) ? IsTruthy(*v) : default_val;
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    const std::string* v = Lookup(section, key);
    if (v == nullptr) return default_val;
    char* end = nullptr;
    const double d = std::strtod(v->c_str(), &end);
    return (end == v->c_str()) ? default_val : d;
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const auto n = LeadingInteger(Lookup(section, key));
    if (!n.has_value()) return std::nullopt;
    return static_cast<int32_t>(*n);
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const std::string* v = Lookup(section, key);
    if (v == nullptr) return std::nullopt;
    return IsTruthy(*v);
  }

  bool HasSection(const char* section) const {
    RSB_ASSERT(section != nullptr);
    const std::string prefix = detail::Folded(section) + '\n';
    auto it = values_.lower_bound(prefix);
    return it != values_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
  }

  bool HasKey(const char* section, const char* key) const {
    return Lookup(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(values_.size());
  }

  /**
   * @brief Insert or overwrite a value. Null arguments read as "".
   * @return false when a new key would exceed RSB_CONFIG_MAX_ENTRIES.
   */
  bool Set(const char* section, const char* key, const char* value) {
    const std::string k = Slot(section, key);
    auto it = values_.find(k);
    if (it == values_.end()) {
      if (values_.size() >= RSB_CONFIG_MAX_ENTRIES) return false;
      it = values_.emplace(k, std::string()).first;
    }
    it->second = (value != nullptr) ? value : "";
    return true;
  }

 protected:
  /// Extension after the last '.' of the final path component, or nullptr.
  static const char* ExtensionOf(const char* path) noexcept {
    const char* base = std::strrchr(path, '/');
    base = (base != nullptr) ? base + 1 : path;
    const char* dot = std::strrchr(base, '.');
    return (dot != nullptr && dot[1] != '\0') ? dot + 1 : nullptr;
  }

 private:
  // Section and key are joined with '\n', which neither may contain.
  static std::string Slot(const char* section, const char* key) {
    return detail::Folded(section) + '\n' + detail::Folded(key);
  }

  const std::string* Lookup(const char* section, const char* key) const {
    RSB_ASSERT(section != nullptr && key != nullptr);
    auto it = values_.find(Slot(section, key));
    return (it != values_.end()) ? &it->second : nullptr;
  }

  static optional<long long> LeadingInteger(const std::string* v) {
    if (v == nullptr) return std::nullopt;
    char* end = nullptr;
    const long long n = std::strtoll(v->c_str(), &end, 10);
    if (end == v->c_str()) return std::nullopt;
    return n;
  }

  static bool IsTruthy(const std::string& v) noexcept {
    static constexpr const char* kTrue[] = {"true", "1", "yes", "on"};
    return detail::MatchesAny(v.c_str(), kTrue);
  }

  std::map<std::string, std::string> values_;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Unspecialized: the backend was compiled out. */
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

namespace detail {

/**
 * @brief Shared flattening for tree formats.
 *
 * @tparam Tree supplies `Node`, `Parse(text) -> optional<Node>`,
 *         `IsMap(n)`, `IsList(n)`, `ForEachEntry(n, fn(key, child))`,
 *         `ForEachItem(n, fn(child))` and `Scalar(n) -> std::string`.
 */
template <typename Tree>
struct TreeLoader {
  static expected<void, ConfigError> Load(ConfigStore& store, const char* data,
                                          uint32_t size) {
    auto root = Tree::Parse(std::string(data, size));
    if (!root.has_value() || !Tree::IsMap(*root)) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    bool full = false;
    Tree::ForEachEntry(*root, [&](const std::string& name,
                                  const typename Tree::Node& child) {
      if (full) return;
      if (Tree::IsMap(child)) {
        Tree::ForEachEntry(child, [&](const std::string& key,
                                      const typename Tree::Node& leaf) {
          if (!full && !store.Set(name.c_str(), key.c_str(), Flat(leaf).c_str())) {
            full = true;
          }
        });
      } else if (!store.Set("", name.c_str(), Flat(child).c_str())) {
        full = true;
      }
    });
    if (full) return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> LoadPath(ConfigStore& store,
                                              const char* path) {
    auto text = ReadConfigFile(path);
    if (!text.has_value()) {
      return expected<void, ConfigError>::error(text.get_error());
    }
    return Load(store, text.value().data(),
                static_cast<uint32_t>(text.value().size()));
  }

  static std::string Flat(const typename Tree::Node& n) {
    if (!Tree::IsList(n)) return Tree::Scalar(n);
    std::string joined;
    Tree::ForEachItem(n, [&](const typename Tree::Node& item) {
      if (!joined.empty()) joined += ' ';
      joined += Flat(item);
    });
    return joined;
  }
};

inline std::string FormatDouble(double v) {
  char b[64];
  (void)std::snprintf(b, sizeof(b), "%g", v);
  return b;
}

}  // namespace detail

// --- INI ---

#ifdef RSB_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    return Map(ini_parse(path, &OnEntry, &store));
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t size) {
    const std::string text(data, size);
    return Map(ini_parse_string(text.c_str(), &OnEntry, &store));
  }

 private:
  /// inih: 0 ok, -1 open failure, -2 allocation, >0 first bad line.
  static expected<void, ConfigError> Map(int rc) {
    if (rc == 0) return expected<void, ConfigError>::success();
    return expected<void, ConfigError>::error(
        (rc == -1) ? ConfigError::kFileNotFound : ConfigError::kParseError);
  }

  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    return static_cast<ConfigStore*>(user)->Set(section, name, value) ? 1 : 0;
  }
};
#endif

// --- JSON ---

#ifdef RSB_CONFIG_JSON_ENABLED
namespace detail {

struct JsonTree {
  using Node = nlohmann::json;

  static optional<Node> Parse(const std::string& text) {
    Node j = Node::parse(text, nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    return j;
  }
  static bool IsMap(const Node& n) { return n.is_object(); }
  static bool IsList(const Node& n) { return n.is_array(); }

  template <typename Fn>
  static void ForEachEntry(const Node& n, Fn&& fn) {
    for (auto it = n.begin(); it != n.end(); ++it) fn(it.key(), *it);
  }
  template <typename Fn>
  static void ForEachItem(const Node& n, Fn&& fn) {
    for (const Node& item : n) fn(item);
  }

  static std::string Scalar(const Node& n) {
    if (n.is_string()) return n.get_ref<const std::string&>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_unsigned()) return std::to_string(n.get<uint64_t>());
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    if (n.is_number_float()) return FormatDouble(n.get<double>());
    if (n.is_null()) return std::string();
    return n.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }
};

}  // namespace detail

template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    return detail::TreeLoader<detail::JsonTree>::LoadPath(store, path);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t size) {
    return detail::TreeLoader<detail::JsonTree>::Load(store, data, size);
  }
};
#endif

// --- YAML ---

#ifdef RSB_CONFIG_YAML_ENABLED
namespace detail {

struct YamlTree {
  using Node = fkyaml::node;

  /// fkYAML reports syntax errors by throwing; they become a parse error.
  static optional<Node> Parse(const std::string& text) {
    try {
      return Node::deserialize(text);
    } catch (const fkyaml::exception&) {
      return std::nullopt;
    }
  }
  static bool IsMap(const Node& n) { return n.is_mapping(); }
  static bool IsList(const Node& n) { return n.is_sequence(); }

  template <typename Fn>
  static void ForEachEntry(const Node& n, Fn&& fn) {
    for (auto it = n.begin(); it != n.end(); ++it) {
      if (it.key().is_string()) fn(it.key().get_value<std::string>(), *it);
    }
  }
  template <typename Fn>
  static void ForEachItem(const Node& n, Fn&& fn) {
    for (const Node& item : n) fn(item);
  }

  static std::string Scalar(const Node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return FormatDouble(n.get_value<double>());
    return std::string();
  }
};

}  // namespace detail

template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    return detail::TreeLoader<detail::YamlTree>::LoadPath(store, path);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t size) {
    return detail::TreeLoader<detail::YamlTree>::Load(store, data, size);
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");
  using Primary = typename std::tuple_element<0, std::tuple<Backends...>>::type;

 public:
  /**
   * @brief Parse @p path into this store (keys already present are
   *        overwritten). kAuto picks the backend from the extension and
   *        falls back to the first backend.
   */
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    RSB_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = FormatFor(ExtensionOf(path));
    return Route<Backends...>(format, [&](auto tag) {
      return ConfigParser<decltype(tag)>::ParseFile(*this, path);
    });
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    RSB_ASSERT(data != nullptr);
    return Route<Backends...>(format, [&](auto tag) {
      return ConfigParser<decltype(tag)>::ParseBuffer(*this, data, size);
    });
  }

 private:
  template <typename First, typename... Rest, typename Fn>
  static expected<void, ConfigError> Route(ConfigFormat format, Fn&& fn) {
    if (format == First::kFormat) return fn(First{});
    if constexpr (sizeof...(Rest) > 0) {
      return Route<Rest...>(format, fn);
    } else {
      return expected<void, ConfigError>::error(
          ConfigError::kFormatNotSupported);
    }
  }

  static ConfigFormat FormatFor(const char* ext) noexcept {
    if (ext == nullptr) return Primary::kFormat;
    ConfigFormat found = Primary::kFormat;
    // The first backend claiming the extension wins.
    (void)((Backends::MatchesExtension(ext) ? (found = Backends::kFormat, true)
                                            : false) ||
           ...);
    return found;
  }
};

// ============================================================================
// Aliases
// ============================================================================

using MultiConfig = Config<
#ifdef RSB_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(RSB_CONFIG_INI_ENABLED) && \
    (defined(RSB_CONFIG_JSON_ENABLED) || defined(RSB_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef RSB_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(RSB_CONFIG_JSON_ENABLED) && defined(RSB_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef RSB_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;

#ifdef RSB_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef RSB_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef RSB_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace rsb

#endif  // RSB_CONFIG_HPP_
