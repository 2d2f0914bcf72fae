// argconv/vocabulary/language_config.cpp - Language definition files
//
#include "argconv/vocabulary/language_config.hpp"

#include <yaml-cpp/yaml.h>

namespace argconv
{

namespace
{

/// Read an optional list of words
bool parse_words(
  const YAML::Node & root, const char * key, std::vector<std::string> & out, std::string & error)
{
  const YAML::Node node = root[key];
  if (!node) {
    return true;
  }
  if (!node.IsSequence()) {
    error = std::string(key) + " must be a list";
    return false;
  }
  for (const auto & word : node) {
    if (!word.IsScalar()) {
      error = std::string(key) + " entries must be strings";
      return false;
    }
    out.push_back(word.as<std::string>());
  }
  return true;
}

LanguageLoadResult parse_language(const YAML::Node & root)
{
  if (!root.IsMap()) {
    return LanguageLoadResult::fail("language definition must be a map");
  }
  if (!root["language"] || !root["language"].IsScalar()) {
    return LanguageLoadResult::fail("missing 'language' code");
  }

  Language language;
  language.code = root["language"].as<std::string>();
  if (root["name"]) {
    language.name = root["name"].as<std::string>();
  } else {
    language.name = language.code;
  }

  std::string error;
  if (!parse_words(root, "true_strings", language.true_strings, error) ||
      !parse_words(root, "false_strings", language.false_strings, error)) {
    return LanguageLoadResult::fail(error);
  }
  if (language.true_strings.empty() && language.false_strings.empty()) {
    return LanguageLoadResult::fail("language '" + language.code + "' defines no words");
  }
  return LanguageLoadResult::ok(std::move(language));
}

}  // namespace

LanguageLoadResult load_language_file(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return LanguageLoadResult::fail("language file not found: " + path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception & e) {
    return LanguageLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_language(root);
}

LanguageLoadResult parse_language_yaml(std::string_view text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(text));
  } catch (const YAML::Exception & e) {
    return LanguageLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_language(root);
}

}  // namespace argconv
