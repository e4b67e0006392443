/**
 * @file Settings.hpp
 * @brief Layered settings for rendering, comparison, messages and logging
 *
 * Precedence, lowest to highest:
 * - RULE P1: Built-in defaults (Settings::defaults())
 * - RULE P2: Settings file (.json or .toml)
 * - RULE P3: Environment variables {PREFIX}_* (see EnvMapper.hpp)
 * - RULE P4: Explicit dot-path overrides
 *
 * Layers are combined with deep_merge(), so a layer only replaces the keys
 * it names.
 */

#ifndef RECON_SETTINGS_HPP
#define RECON_SETTINGS_HPP

#include "recon/Compare.hpp"
#include "recon/Errors.hpp"
#include "recon/Messages.hpp"
#include "recon/Serialize.hpp"
#include "recon/Value.hpp"

#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace recon {

/**
 * @brief Sources for Settings::load()
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::string prefix = "RECON";            ///< Empty disables the environment layer
    std::map<std::string, Value> overrides;  ///< dot-path → value, highest precedence
};

/**
 * @brief Settings tree with typed accessors
 */
class Settings {
public:
    /// Built-in defaults only
    Settings();
    explicit Settings(Value data) : data_(std::move(data)) {}

    /**
     * @brief Load with the precedence defaults → file → env → overrides
     *
     * @throws FileNotFoundError, ConfigParseError for the settings file
     * @throws SettingsError if an override names no known setting
     */
    static Settings load(const LoadOptions& opts);

    /**
     * @brief Default tree
     *
     * ```
     * render.max_depth = 9        compare.skip_type_check = false
     * render.expand = 9           compare.sort_arrays = false
     * render.indent_size = 4      compare.reverse_check = false
     * render.indent_char = " "    compare.exclude = []
     * render.strong = false       messages.<id> = built-in template
     * render.explore = false      log.level = "warn"
     * render.newline = "\n"
     * ```
     */
    static Value defaults();

    const Value& data() const noexcept { return data_; }

    /// @throws KeyError, TypeError (see DotPath.hpp)
    const Value& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const Value& v);

    /**
     * @brief Typed read with fallback for a missing key
     * @throws SettingsError if the key holds a value of another type
     */
    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        if (!contains(path)) return fallback;
        const Value& v = at(path);
        if constexpr (std::is_integral<T>::value && !std::is_same<T, bool>::value) {
            if (!v.is_number_integer()) {
                throw SettingsError(path, std::string("expected an integer (") + type_name(v) + ")");
            }
        }
        try {
            return v.get<T>();
        } catch (const nlohmann::json::type_error&) {
            throw SettingsError(path, std::string("wrong type (") + type_name(v) + ")");
        }
    }

    /**
     * @brief Rendering options from render.*
     * @throws SettingsError for out-of-range values
     */
    RenderContext render_context() const;

    /// Comparison options from compare.* (no property list)
    CompareOptions compare_options() const;

    /**
     * @brief Catalog with messages.* applied over the defaults
     * @throws SettingsError for unknown ids or invalid templates
     */
    MessageCatalog message_catalog() const;

    std::string log_level() const;

    std::string to_json_string(int indent = 2) const;

private:
    Value data_;
};

/**
 * @brief Split "key=value" and type the value with parse_value()
 * @throws SettingsError if there is no '=' or the key is empty
 */
std::pair<std::string, Value> parse_override(const std::string& text);

} // namespace recon

#endif // RECON_SETTINGS_HPP
