#include "language/language_factory.hpp"

#include "glog/logging.h"
#include "language/cpp_handler.hpp"
#include "language/go_handler.hpp"
#include "language/java_handler.hpp"
#include "language/javascript_handler.hpp"
#include "language/python_handler.hpp"
#include "language/ruby_handler.hpp"

namespace language {

std::unique_ptr<LanguageHandler> LanguageHandlerFactory::Create(
    Language language) {
  switch (language) {
    case Language::PYTHON:
      return std::unique_ptr<LanguageHandler>(new PythonHandler);
    case Language::JAVASCRIPT:
      return std::unique_ptr<LanguageHandler>(new JavascriptHandler);
    case Language::JAVA:
      return std::unique_ptr<LanguageHandler>(new JavaHandler);
    case Language::CPP:
      return std::unique_ptr<LanguageHandler>(new CppHandler);
    case Language::GO:
      return std::unique_ptr<LanguageHandler>(new GoHandler);
    case Language::RUBY:
      return std::unique_ptr<LanguageHandler>(new RubyHandler);
  }
  LOG(FATAL) << "Invalid language " << static_cast<int>(language);
  return nullptr;
}

}  // namespace language
