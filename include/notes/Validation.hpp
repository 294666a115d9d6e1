#pragma once

#include "notes/model/Note.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <variant>
#include <vector>

namespace nb::notes {

constexpr static unsigned int DEFAULT_MAX_TITLE_LENGTH = 200;

struct FieldError {
    std::string field;
    std::string message;
};

struct ValidationError {
    std::vector<FieldError> errors;

    [[nodiscard]] std::string message() const;
};

template <typename T>
using Validated = std::variant<T, ValidationError>;

Validated<model::NoteDraft> validateCreate(const nlohmann::json& body,
                                           unsigned int maxTitleLength = DEFAULT_MAX_TITLE_LENGTH);

// null members count as absent
Validated<model::NotePatch> validatePatch(const nlohmann::json& body,
                                          unsigned int maxTitleLength = DEFAULT_MAX_TITLE_LENGTH);

void to_json(nlohmann::json& j, const FieldError& e);
void to_json(nlohmann::json& j, const ValidationError& e);

}
