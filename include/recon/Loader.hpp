/**
 * @file Loader.hpp
 * @brief Reading property bags and settings from files
 *
 * Supported formats, chosen by extension:
 * - .json  nlohmann::json
 * - .toml  toml++ (date-times become "datetime" leaves)
 * - .rexpr one literal expression, read with extract_value()
 *
 * RULE F1: A missing file throws FileNotFoundError
 * RULE F2: Syntax errors throw ConfigParseError with line/column when known
 * RULE F3: An unknown extension throws ConfigParseError
 * RULE F4: An empty settings path loads nothing (empty map)
 */

#ifndef RECON_LOADER_HPP
#define RECON_LOADER_HPP

#include "recon/Value.hpp"
#include <string>

namespace recon {

// ============================================================================
// Format loaders
// ============================================================================

/**
 * @brief Load a JSON document
 * @throws FileNotFoundError, ConfigParseError
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML document
 *
 * TOML offset and local date-times are stored as datetime leaves so that
 * they serialize as [datetime] literals. Local dates and times stay strings.
 *
 * @throws FileNotFoundError, ConfigParseError
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a file holding one literal expression
 *
 * A MalformedLiteral or UnsupportedArgumentShape from the parser is
 * reported as ConfigParseError (offset in the details).
 *
 * @throws FileNotFoundError, ConfigParseError
 */
Value load_literal_file(const std::string& path);

// ============================================================================
// Entry points
// ============================================================================

/**
 * @brief Load a value tree from any supported format (RULES F1-F3)
 */
Value load_property_bag(const std::string& path);

/**
 * @brief Load a settings file (.json or .toml only, RULE F4)
 */
Value load_settings_file(const std::string& path);

/**
 * @brief Read a whole file as text
 * @throws FileNotFoundError
 */
std::string load_text_file(const std::string& path);

/**
 * @brief Write @p text to @p path, replacing its contents
 * @throws ReconError if the file cannot be written
 */
void write_text_file(const std::string& path, const std::string& text);

/**
 * @brief Lower-case extension including the dot (".json"), or empty
 */
std::string get_file_extension(const std::string& path);

} // namespace recon

#endif // RECON_LOADER_HPP
