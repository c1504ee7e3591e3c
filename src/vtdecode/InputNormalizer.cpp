// SPDX-License-Identifier: Apache-2.0
#include <vtdecode/InputNormalizer.h>
#include <vtdecode/logging.h>

#include <crispy/utils.h>

#include <nlohmann/json.hpp>

// Objects keep their member order so that the last matching "data" member wins.
using json = nlohmann::ordered_json;

namespace vtdecode
{

namespace
{
    std::optional<json> parseArray(std::string_view data, std::string_view strategy)
    {
        auto document = json::parse(data, nullptr, false);
        if (document.is_discarded())
        {
            inputLog()("{}: not valid JSON", strategy);
            return std::nullopt;
        }
        if (!document.is_array())
        {
            inputLog()("{}: JSON value is not an array", strategy);
            return std::nullopt;
        }
        return document;
    }

    std::optional<std::string> concatenateObjectData(std::string_view data)
    {
        constexpr auto Name = std::string_view("object-array");

        auto const document = parseArray(data, Name);
        if (!document)
            return std::nullopt;

        auto result = std::string {};
        for (auto const& [index, element]: document->items())
        {
            if (element.is_null())
                continue;

            if (!element.is_object())
            {
                inputLog()("{}: element {} is not an object", Name, index);
                return std::nullopt;
            }

            json::string_t const* chunk = nullptr;
            for (auto const& [key, member]: element.items())
            {
                if (crispy::toLower(key) != "data" || member.is_null())
                    continue;

                if (!member.is_string())
                {
                    inputLog()("{}: element {} has a non-string {} member", Name, index, key);
                    return std::nullopt;
                }

                chunk = &member.get_ref<json::string_t const&>();
            }

            if (chunk)
                result += *chunk;
        }
        return result;
    }

    std::optional<std::string> concatenateStrings(std::string_view data)
    {
        constexpr auto Name = std::string_view("string-array");

        auto const document = parseArray(data, Name);
        if (!document)
            return std::nullopt;

        auto result = std::string {};
        for (auto const& [index, element]: document->items())
        {
            if (element.is_null())
                continue;

            if (!element.is_string())
            {
                inputLog()("{}: element {} is not a string", Name, index);
                return std::nullopt;
            }

            result += element.get_ref<json::string_t const&>();
        }
        return result;
    }

    std::optional<std::string> identity(std::string_view data)
    {
        return std::string(data);
    }
} // namespace

std::vector<NormalizationStrategy> const& defaultNormalizationStrategies()
{
    static auto const strategies = std::vector<NormalizationStrategy> {
        NormalizationStrategy { "object-array", &concatenateObjectData },
        NormalizationStrategy { "string-array", &concatenateStrings },
        NormalizationStrategy { "identity", &identity },
    };
    return strategies;
}

std::string normalizeInput(std::string_view data, gsl::span<NormalizationStrategy const> strategies)
{
    auto const trimmed = crispy::trimmed(data);
    if (trimmed.empty() || trimmed.front() != '[')
    {
        inputLog()("Using raw input of {} bytes.", data.size());
        return std::string(data);
    }

    for (auto const& strategy: strategies)
    {
        if (auto result = strategy.apply(data))
        {
            inputLog()("Input normalized by {} strategy: {} -> {} bytes.", strategy.name, data.size(), result->size());
            return std::move(*result);
        }
    }

    inputLog()("No strategy matched, using raw input of {} bytes.", data.size());
    return std::string(data);
}

std::string normalizeInput(std::string_view data)
{
    auto const& strategies = defaultNormalizationStrategies();
    return normalizeInput(data, gsl::span<NormalizationStrategy const>(strategies.data(), strategies.size()));
}

} // namespace vtdecode
