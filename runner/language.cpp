#include "runner/language.hpp"

#include <unistd.h>

#include <kj/debug.h>

#include "util/which.hpp"

namespace runner {

Language MakeLanguage(const std::string& name, const std::string& interpreter) {
  Language language;
  language.name = name;
  language.interpreter = interpreter;
  if (name == "python") {
    language.file_name = "main.py";
    // Unbuffered, isolated from the user site and PYTHON* variables, no
    // bytecode written next to the source.
    language.args = {"-u", "-I", "-B"};
    language.dedent = true;
  } else if (name == "sh" || name == "bash") {
    language.file_name = "main.sh";
  } else if (name == "node") {
    language.file_name = "main.js";
  } else if (name == "ruby") {
    language.file_name = "main.rb";
  } else {
    language.file_name = "main";
  }
  return language;
}

std::string ResolveInterpreter(const std::string& interpreter) {
  KJ_REQUIRE(!interpreter.empty(), "Empty interpreter path");
  if (interpreter.find('/') != std::string::npos) {
    KJ_REQUIRE(access(interpreter.c_str(), X_OK) == 0,
               "Interpreter is not executable", interpreter);
    return interpreter;
  }
  std::string path = util::which(interpreter);
  KJ_REQUIRE(!path.empty(), "Interpreter not found in PATH", interpreter);
  return path;
}

void LanguageTable::Add(const Language& language) {
  KJ_REQUIRE(!language.name.empty(), "Empty language name");
  languages_[language.name] = language;
}

void LanguageTable::AddFromFlag(const std::string& value) {
  size_t pos = value.find('=');
  KJ_REQUIRE(pos != std::string::npos && pos != 0 && pos + 1 < value.size(),
             "Languages must be given as NAME=PATH", value);
  std::string name = value.substr(0, pos);
  Add(MakeLanguage(name, ResolveInterpreter(value.substr(pos + 1))));
}

const Language* LanguageTable::Find(const std::string& name) const {
  auto it = languages_.find(name);
  if (it == languages_.end()) return nullptr;
  return &it->second;
}

std::vector<std::string> LanguageTable::Names() const {
  std::vector<std::string> names;
  for (const auto& language : languages_) names.push_back(language.first);
  return names;
}

}  // namespace runner
