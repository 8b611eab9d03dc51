#ifndef LANGUAGE_LANGUAGE_FACTORY_HPP
#define LANGUAGE_LANGUAGE_FACTORY_HPP

#include <memory>
#include <string>

#include "language/language_handler.hpp"

namespace language {

class LanguageHandlerFactory {
 public:
  static std::unique_ptr<LanguageHandler> Create(Language language);

  // Throws std::invalid_argument for unknown tags.
  static std::unique_ptr<LanguageHandler> Create(const std::string& tag) {
    return Create(ParseLanguage(tag));
  }
};

}  // namespace language

#endif
