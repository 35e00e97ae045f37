#ifndef RUNNER_LANGUAGE_HPP
#define RUNNER_LANGUAGE_HPP

#include <map>
#include <string>
#include <vector>

namespace runner {

// How a source file in a given language is staged and launched.
struct Language {
  std::string name;
  // Absolute path of the interpreter binary.
  std::string interpreter;
  // Name of the staged source file inside the workspace.
  std::string file_name;
  // Interpreter options, passed before the source file.
  std::vector<std::string> args;
  // Remove the indentation common to every line before staging.
  bool dedent = false;
};

// Builds a Language using the built-in profile for name, if any.
Language MakeLanguage(const std::string& name, const std::string& interpreter);

// Resolves an interpreter name through PATH. Paths containing a slash are
// only checked to be executable. Throws if nothing executable is found.
std::string ResolveInterpreter(const std::string& interpreter);

// The allow-list of languages a request may ask for. Immutable once the
// configuration is built.
class LanguageTable {
 public:
  // Adds or replaces a language.
  void Add(const Language& language);

  // Adds a language from a NAME=PATH string, resolving PATH.
  void AddFromFlag(const std::string& value);

  // Returns nullptr if the language is not allowed.
  const Language* Find(const std::string& name) const;

  std::vector<std::string> Names() const;

  bool Empty() const { return languages_.empty(); }

 private:
  std::map<std::string, Language> languages_;
};

}  // namespace runner

#endif
