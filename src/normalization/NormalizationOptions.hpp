#pragma once

#include <string>

namespace normalization
{

// Per-call switches selecting which passes run. Copied into each call.
struct NormalizationOptions
{
    bool normalize = true; // master switch: false only trims
    bool url_normalization = true;
    bool email_normalization = true;
    bool unit_normalization = false;
    bool phone_normalization = true;
    bool optional_pluralization_normalization = true;
    bool replace_remaining_symbols = true;

    // Explicit language selector, never detected
    std::string language = "en-us";

    // "a", "b", "en" and "en-*" select the English rule set
    [[nodiscard]] bool isEnglish() const
    {
        if (language == "a" || language == "b" || language == "en" || language == "EN")
            return true;
        return language.size() > 3 && (language[0] == 'e' || language[0] == 'E') &&
               (language[1] == 'n' || language[1] == 'N') && (language[2] == '-' || language[2] == '_');
    }
};

} // namespace normalization
