// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef UTF_H_9023417561029384
#define UTF_H_9023417561029384

#include <string>
#include <string_view>
#include <type_traits>


namespace ferry
{
//convert between UTF-8 (std::string) and UTF-32 (std::wstring, Linux wchar_t)
template <class TargetString> TargetString utfTo(std::string_view  str);
template <class TargetString> TargetString utfTo(std::wstring_view str);






//######################## implementation ########################
namespace impl
{
static_assert(sizeof(wchar_t) == 4);

const char32_t REPLACEMENT_CHAR = 0xfffd;


inline
void codePointToUtf8(char32_t cp, std::string& output)
{
    if (cp > 0x10ffff || (0xd800 <= cp && cp <= 0xdfff))
        cp = REPLACEMENT_CHAR;

    if (cp < 0x80)
        output += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        output += static_cast<char>(0xc0 | (cp >> 6));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else if (cp < 0x10000)
    {
        output += static_cast<char>(0xe0 | (cp >> 12));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else
    {
        output += static_cast<char>(0xf0 | (cp >> 18));
        output += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
}


inline
std::wstring utf8ToWide(std::string_view str)
{
    std::wstring output;
    output.reserve(str.size());

    for (size_t i = 0; i < str.size();)
    {
        const auto lead = static_cast<unsigned char>(str[i]);

        size_t trailLen = 0;
        char32_t cp = 0;
        if (lead < 0x80)
            cp = lead;
        else if ((lead & 0xe0) == 0xc0) { trailLen = 1; cp = lead & 0x1f; }
        else if ((lead & 0xf0) == 0xe0) { trailLen = 2; cp = lead & 0x0f; }
        else if ((lead & 0xf8) == 0xf0) { trailLen = 3; cp = lead & 0x07; }
        else
        {
            output += static_cast<wchar_t>(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        if (i + trailLen >= str.size()) //truncated sequence
        {
            output += static_cast<wchar_t>(REPLACEMENT_CHAR);
            break;
        }

        bool valid = true;
        for (size_t k = 1; k <= trailLen; ++k)
        {
            const auto trail = static_cast<unsigned char>(str[i + k]);
            if ((trail & 0xc0) != 0x80)
            {
                valid = false;
                trailLen = k - 1;
                break;
            }
            cp = (cp << 6) | (trail & 0x3f);
        }

        output += static_cast<wchar_t>(valid ? cp : REPLACEMENT_CHAR);
        i += 1 + trailLen;
    }
    return output;
}


inline
std::string wideToUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());
    for (const wchar_t c : str)
        codePointToUtf8(static_cast<char32_t>(c), output);
    return output;
}
}


template <class TargetString> inline
TargetString utfTo(std::string_view str)
{
    if constexpr (std::is_same_v<TargetString, std::string>)
        return std::string(str);
    else
    {
        static_assert(std::is_same_v<TargetString, std::wstring>);
        return impl::utf8ToWide(str);
    }
}


template <class TargetString> inline
TargetString utfTo(std::wstring_view str)
{
    if constexpr (std::is_same_v<TargetString, std::wstring>)
        return std::wstring(str);
    else
    {
        static_assert(std::is_same_v<TargetString, std::string>);
        return impl::wideToUtf8(str);
    }
}
}

#endif //UTF_H_9023417561029384
