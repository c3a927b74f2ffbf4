#pragma once

#include <string>

#include "coroform/form/field.hpp"

namespace coroform {

// Built-in validators. An empty message selects the default text.

// Stops the chain with "This field is required." unless the field holds a
// value (non-blank text, non-zero number, checked box, uploaded file)
Validator data_required(std::string message = {});

// Stops the chain unless a non-empty value was submitted
Validator input_required(std::string message = {});

// Stops the chain silently when nothing but whitespace was submitted
Validator optional();

// Text length within [min, max]; -1 leaves a bound open
Validator length(int min = -1, int max = -1, std::string message = {});

// Same value as the field named `other` in the same form
Validator equal_to(std::string other, std::string message = {});

// user@domain.tld shaped address
Validator email(std::string message = {});

} // namespace coroform
