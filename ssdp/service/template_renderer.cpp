#include "ssdp/service/template_renderer.hpp"

namespace ssdp
{

std::string substitute(const std::string& text, const FieldMap& fields)
{
    std::string result;
    result.reserve(text.size());

    std::size_t position = 0;
    while (position < text.size())
    {
        const char current = text[position];
        const bool doubled = position + 1 < text.size() && text[position + 1] == current;

        if (current == '{')
        {
            if (doubled)
            {
                result.push_back('{');
                position += 2;
                continue;
            }

            const std::size_t close = text.find('}', position + 1);
            if (close == std::string::npos)
            {
                throw TemplateError("Unbalanced '{' at offset " + std::to_string(position));
            }

            const std::string name = text.substr(position + 1, close - position - 1);
            auto field             = fields.find(name);
            if (field == fields.end())
            {
                throw TemplateError("Unknown placeholder '{" + name + "}'");
            }

            result += field->second;
            position = close + 1;
        }
        else if (current == '}')
        {
            if (!doubled)
            {
                throw TemplateError("Single '}' at offset " + std::to_string(position));
            }
            result.push_back('}');
            position += 2;
        }
        else
        {
            result.push_back(current);
            ++position;
        }
    }

    return result;
}

FieldMap resolve(const ParamSet& params, const Service& service)
{
    FieldMap fields;
    for (const auto& param : params)
    {
        fields.set(param.first, evaluate(param.second));
    }

    for (const auto& override_entry : service)
    {
        fields.set(override_entry.first, override_entry.second);
    }

    for (auto& field : fields)
    {
        std::string resolved = substitute(field.second, fields);
        field.second         = std::move(resolved);
    }

    return fields;
}

std::string normalize_line_endings(const std::string& text)
{
    std::string result;
    result.reserve(text.size() + text.size() / 16);

    for (std::size_t position = 0; position < text.size(); ++position)
    {
        const char current = text[position];
        if (current == '\r' && position + 1 < text.size() && text[position + 1] == '\n')
        {
            continue;
        }

        if (current == '\n')
        {
            result += "\r\n";
        }
        else
        {
            result.push_back(current);
        }
    }

    return result;
}

std::string render(const std::string& template_text, const FieldMap& fields)
{
    return normalize_line_endings(substitute(template_text, fields));
}

} // namespace ssdp
