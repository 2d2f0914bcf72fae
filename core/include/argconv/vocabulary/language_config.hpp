// argconv/vocabulary/language_config.hpp - Language definition files
//
// Loads custom true/false vocabularies from YAML:
//
//   language: xx
//   name: Example
//   true_strings: [Yes, Sure]
//   false_strings: [No, Nope]
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "argconv/vocabulary/languages.hpp"

namespace argconv
{

// ============================================================================
// Loading Result
// ============================================================================

/**
 * Result of loading a language definition.
 */
struct LanguageLoadResult
{
  /// Loaded language (only valid if success == true)
  Language language;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static LanguageLoadResult ok(Language lang)
  {
    LanguageLoadResult r;
    r.language = std::move(lang);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static LanguageLoadResult fail(std::string msg)
  {
    LanguageLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Loading API
// ============================================================================

/**
 * Load a language definition from a YAML file.
 *
 * @param path Path to the file
 * @return LanguageLoadResult with the language or an error message
 */
[[nodiscard]] LanguageLoadResult load_language_file(const std::filesystem::path & path);

/**
 * Parse a language definition from YAML text.
 */
[[nodiscard]] LanguageLoadResult parse_language_yaml(std::string_view text);

}  // namespace argconv
