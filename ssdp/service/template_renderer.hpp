#pragma once

#include "ssdp/service/param_value.hpp"
#include "ssdp/service/service_descriptor.hpp"

#include <stdexcept>
#include <string>

namespace ssdp
{

/// Unknown placeholder or unbalanced brace in a template or field value.
class TemplateError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Replace every "{name}" in @p text with the value of field @p name.
 *
 * "{{" and "}}" produce literal braces.
 * @throws TemplateError on an unknown name or an unbalanced brace.
 */
std::string substitute(const std::string& text, const FieldMap& fields);

/**
 * @brief Build the fields of one service.
 *
 * Params are evaluated first (producers are invoked, literals copied), then the service's keys are
 * layered on top. Finally every value goes through exactly one substitution pass, in insertion order,
 * against the map as it is at that moment. A value referring to a field that comes later in the
 * order therefore sees that field unresolved. Configurations rely on this, keep it single-pass.
 */
FieldMap resolve(const ParamSet& params, const Service& service);

/// Convert bare "\n" and "\r\n" line endings to "\r\n".
std::string normalize_line_endings(const std::string& text);

/// Substitute @p fields into @p template_text and normalize line endings for the wire.
std::string render(const std::string& template_text, const FieldMap& fields);

} // namespace ssdp
