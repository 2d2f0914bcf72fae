// argconv/vocabulary/languages.hpp - True/false word lists
//
// The boolean converter recognizes words from the configured languages in
// addition to the language-independent defaults ("True", "1", "False", "0",
// "None" and the empty string).
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gsl/span>

namespace argconv
{

/**
 * A named set of true and false words.
 */
struct Language
{
  std::string code;  ///< e.g. "fi"
  std::string name;  ///< e.g. "Finnish"
  std::vector<std::string> true_strings;
  std::vector<std::string> false_strings;
};

/**
 * Bundled language definitions: "en", "fi", "de", "sv" and "nl".
 *
 * @return std::nullopt for an unknown code (codes are case-insensitive)
 */
[[nodiscard]] std::optional<Language> builtin_language(std::string_view code);

class Languages
{
public:
  /// Defaults plus English.
  Languages();

  /// Defaults plus English and the given bundled languages; unknown codes are ignored.
  explicit Languages(const std::vector<std::string> & codes);

  /**
   * Add a bundled language.
   *
   * @return false if no language with this code is bundled
   */
  bool add_builtin(std::string_view code);

  /// Add a language; a language with the same code is replaced.
  void add_language(Language language);

  [[nodiscard]] const std::vector<Language> & languages() const noexcept { return languages_; }

  /// All true words, title-cased.
  [[nodiscard]] gsl::span<const std::string> true_strings() const noexcept { return true_strings_; }

  /// All false words, title-cased.
  [[nodiscard]] gsl::span<const std::string> false_strings() const noexcept
  {
    return false_strings_;
  }

  /// Whether the title-cased word is a true word.
  [[nodiscard]] bool is_true(std::string_view title_cased) const;
  [[nodiscard]] bool is_false(std::string_view title_cased) const;

private:
  void rebuild();

  std::vector<Language> languages_;
  std::vector<std::string> true_strings_;
  std::vector<std::string> false_strings_;
};

}  // namespace argconv
