#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace tr::utils
{

inline std::string_view trim(std::string_view text)
{
    constexpr std::string_view kBlank = " \t\r\n";
    auto begin = text.find_first_not_of(kBlank);
    if (begin == std::string_view::npos)
    {
        return {};
    }
    return text.substr(begin, text.find_last_not_of(kBlank) - begin + 1);
}

// ASCII only.
inline std::string to_lower(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return lowered;
}

} // namespace tr::utils
