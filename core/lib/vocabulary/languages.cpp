// argconv/vocabulary/languages.cpp - True/false word lists
//
#include "argconv/vocabulary/languages.hpp"

#include <algorithm>

#include "argconv/basic/text.hpp"

namespace argconv
{

namespace
{

const std::vector<Language> & bundled_languages()
{
  static const std::vector<Language> k_languages = {
    {"en", "English", {"Yes", "On"}, {"No", "Off"}},
    {"fi", "Finnish", {"Tosi", "Kyllä", "Päällä"}, {"Epätosi", "Ei", "Pois"}},
    {"de", "German", {"Wahr", "Ja", "An", "Ein"}, {"Falsch", "Nein", "Aus", "Unwahr"}},
    {"sv", "Swedish", {"Sant", "Ja", "På"}, {"Falskt", "Nej", "Av"}},
    {"nl", "Dutch", {"Waar", "Ja", "Aan"}, {"Onwaar", "Nee", "Uit"}},
  };
  return k_languages;
}

void add_unique(std::vector<std::string> & words, std::string word)
{
  if (std::find(words.begin(), words.end(), word) == words.end()) {
    words.push_back(std::move(word));
  }
}

}  // namespace

std::optional<Language> builtin_language(std::string_view code)
{
  const std::string lowered = to_lower_ascii(code);
  for (const auto & language : bundled_languages()) {
    if (language.code == lowered) return language;
  }
  return std::nullopt;
}

Languages::Languages()
{
  add_builtin("en");
}

Languages::Languages(const std::vector<std::string> & codes) : Languages()
{
  for (const auto & code : codes) {
    add_builtin(code);
  }
}

bool Languages::add_builtin(std::string_view code)
{
  auto language = builtin_language(code);
  if (!language) return false;
  add_language(std::move(*language));
  return true;
}

void Languages::add_language(Language language)
{
  auto it = std::find_if(languages_.begin(), languages_.end(), [&](const Language & l) {
    return l.code == language.code;
  });
  if (it != languages_.end()) {
    *it = std::move(language);
  } else {
    languages_.push_back(std::move(language));
  }
  rebuild();
}

void Languages::rebuild()
{
  true_strings_ = {"True", "1"};
  false_strings_ = {"False", "0", "None", ""};
  for (const auto & language : languages_) {
    for (const auto & word : language.true_strings) {
      add_unique(true_strings_, to_title(word));
    }
    for (const auto & word : language.false_strings) {
      add_unique(false_strings_, to_title(word));
    }
  }
}

bool Languages::is_true(std::string_view title_cased) const
{
  return std::find(true_strings_.begin(), true_strings_.end(), title_cased) != true_strings_.end();
}

bool Languages::is_false(std::string_view title_cased) const
{
  return std::find(false_strings_.begin(), false_strings_.end(), title_cased) !=
         false_strings_.end();
}

}  // namespace argconv
