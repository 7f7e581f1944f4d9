// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef STRING_TOOLS_H_2130948715602938
#define STRING_TOOLS_H_2130948715602938

#include <charconv>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <type_traits>


//string helpers working on both std::string and std::wstring
namespace ferry
{
bool startsWith(std::string_view  str, std::string_view  prefix);
bool startsWith(std::wstring_view str, std::wstring_view prefix);
bool endsWith  (std::string_view  str, std::string_view  postfix);
bool endsWith  (std::wstring_view str, std::wstring_view postfix);
bool contains  (std::string_view  str, std::string_view  term);
bool contains  (std::wstring_view str, std::wstring_view term);

bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs);
std::string asciiToLowerCpy(std::string_view str);

enum class IfNotFoundReturn
{
    all,
    none
};
std::string  afterLast  (std::string_view  str, std::string_view  term, IfNotFoundReturn infr);
std::wstring afterLast  (std::wstring_view str, std::wstring_view term, IfNotFoundReturn infr);
std::string  beforeLast (std::string_view  str, std::string_view  term, IfNotFoundReturn infr);
std::wstring beforeLast (std::wstring_view str, std::wstring_view term, IfNotFoundReturn infr);
std::string  afterFirst (std::string_view  str, std::string_view  term, IfNotFoundReturn infr);
std::wstring afterFirst (std::wstring_view str, std::wstring_view term, IfNotFoundReturn infr);
std::string  beforeFirst(std::string_view  str, std::string_view  term, IfNotFoundReturn infr);
std::wstring beforeFirst(std::wstring_view str, std::wstring_view term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
std::vector<std::string> split(std::string_view str, std::string_view delimiter, SplitOnEmpty soe);

void replace(std::string&  str, std::string_view  oldTerm, std::string_view  newTerm);
void replace(std::wstring& str, std::wstring_view oldTerm, std::wstring_view newTerm);
std::string  replaceCpy(std::string_view  str, std::string_view  oldTerm, std::string_view  newTerm);
std::wstring replaceCpy(std::wstring_view str, std::wstring_view oldTerm, std::wstring_view newTerm);

void trim(std::string&  str);
void trim(std::wstring& str);
std::string  trimCpy(std::string_view  str);
std::wstring trimCpy(std::wstring_view str);

template <class S, class Num> S numberTo(const Num& number);
template <class Num> Num stringTo(std::string_view str); //returns 0 on parse failure

std::string formatAsHexString(std::string_view blob); //bytes -> lower-case hex digits






//######################## implementation ########################
namespace impl
{
template <class C> inline
bool isWhiteSpace(C c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

template <class C> inline
bool startsWith(std::basic_string_view<C> str, std::basic_string_view<C> prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

template <class C> inline
bool endsWith(std::basic_string_view<C> str, std::basic_string_view<C> postfix)
{
    return str.size() >= postfix.size() && str.compare(str.size() - postfix.size(), postfix.size(), postfix) == 0;
}

template <class C> inline
std::basic_string<C> afterLast(std::basic_string_view<C> str, std::basic_string_view<C> term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(term);
    if (term.empty() || pos == str.npos)
        return infr == IfNotFoundReturn::all ? std::basic_string<C>(str) : std::basic_string<C>();
    return std::basic_string<C>(str.substr(pos + term.size()));
}

template <class C> inline
std::basic_string<C> beforeLast(std::basic_string_view<C> str, std::basic_string_view<C> term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(term);
    if (term.empty() || pos == str.npos)
        return infr == IfNotFoundReturn::all ? std::basic_string<C>(str) : std::basic_string<C>();
    return std::basic_string<C>(str.substr(0, pos));
}

template <class C> inline
std::basic_string<C> afterFirst(std::basic_string_view<C> str, std::basic_string_view<C> term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (term.empty() || pos == str.npos)
        return infr == IfNotFoundReturn::all ? std::basic_string<C>(str) : std::basic_string<C>();
    return std::basic_string<C>(str.substr(pos + term.size()));
}

template <class C> inline
std::basic_string<C> beforeFirst(std::basic_string_view<C> str, std::basic_string_view<C> term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (term.empty() || pos == str.npos)
        return infr == IfNotFoundReturn::all ? std::basic_string<C>(str) : std::basic_string<C>();
    return std::basic_string<C>(str.substr(0, pos));
}

template <class C> inline
void replace(std::basic_string<C>& str, std::basic_string_view<C> oldTerm, std::basic_string_view<C> newTerm)
{
    if (oldTerm.empty())
        return;

    std::basic_string<C> output;
    size_t pos = 0;
    for (;;)
    {
        const size_t posFound = str.find(oldTerm, pos);
        if (posFound == str.npos)
            break;
        output.append(str, pos, posFound - pos);
        output += newTerm;
        pos = posFound + oldTerm.size();
    }
    if (pos == 0)
        return;
    output.append(str, pos);
    str = std::move(output);
}

template <class C> inline
std::basic_string<C> trimCpy(std::basic_string_view<C> str)
{
    size_t first = 0;
    size_t last = str.size();
    while (first < last && isWhiteSpace(str[first]))
        ++first;
    while (last > first && isWhiteSpace(str[last - 1]))
        --last;
    return std::basic_string<C>(str.substr(first, last - first));
}
}


inline bool startsWith(std::string_view  str, std::string_view  prefix) { return impl::startsWith(str, prefix); }
inline bool startsWith(std::wstring_view str, std::wstring_view prefix) { return impl::startsWith(str, prefix); }
inline bool endsWith  (std::string_view  str, std::string_view  postfix) { return impl::endsWith(str, postfix); }
inline bool endsWith  (std::wstring_view str, std::wstring_view postfix) { return impl::endsWith(str, postfix); }
inline bool contains  (std::string_view  str, std::string_view  term) { return str.find(term) != str.npos; }
inline bool contains  (std::wstring_view str, std::wstring_view term) { return str.find(term) != str.npos; }


inline
std::string asciiToLowerCpy(std::string_view str)
{
    std::string output(str);
    for (char& c : output)
        if ('A' <= c && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    return output;
}


inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() && asciiToLowerCpy(lhs) == asciiToLowerCpy(rhs);
}


inline std::string  afterLast  (std::string_view  str, std::string_view  term, IfNotFoundReturn infr) { return impl::afterLast  (str, term, infr); }
inline std::wstring afterLast  (std::wstring_view str, std::wstring_view term, IfNotFoundReturn infr) { return impl::afterLast  (str, term, infr); }
inline std::string  beforeLast (std::string_view  str, std::string_view  term, IfNotFoundReturn infr) { return impl::beforeLast (str, term, infr); }
inline std::wstring beforeLast (std::wstring_view str, std::wstring_view term, IfNotFoundReturn infr) { return impl::beforeLast (str, term, infr); }
inline std::string  afterFirst (std::string_view  str, std::string_view  term, IfNotFoundReturn infr) { return impl::afterFirst (str, term, infr); }
inline std::wstring afterFirst (std::wstring_view str, std::wstring_view term, IfNotFoundReturn infr) { return impl::afterFirst (str, term, infr); }
inline std::string  beforeFirst(std::string_view  str, std::string_view  term, IfNotFoundReturn infr) { return impl::beforeFirst(str, term, infr); }
inline std::wstring beforeFirst(std::wstring_view str, std::wstring_view term, IfNotFoundReturn infr) { return impl::beforeFirst(str, term, infr); }


inline
std::vector<std::string> split(std::string_view str, std::string_view delimiter, SplitOnEmpty soe)
{
    std::vector<std::string> output;
    if (delimiter.empty())
    {
        if (!str.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(str);
        return output;
    }

    for (;;)
    {
        const size_t pos = str.find(delimiter);
        const std::string_view block = str.substr(0, pos);

        if (!block.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(block);

        if (pos == str.npos)
            return output;
        str.remove_prefix(pos + delimiter.size());
    }
}


inline void replace(std::string&  str, std::string_view  oldTerm, std::string_view  newTerm) { impl::replace(str, oldTerm, newTerm); }
inline void replace(std::wstring& str, std::wstring_view oldTerm, std::wstring_view newTerm) { impl::replace(str, oldTerm, newTerm); }

inline
std::string replaceCpy(std::string_view str, std::string_view oldTerm, std::string_view newTerm)
{
    std::string output(str);
    replace(output, oldTerm, newTerm);
    return output;
}

inline
std::wstring replaceCpy(std::wstring_view str, std::wstring_view oldTerm, std::wstring_view newTerm)
{
    std::wstring output(str);
    replace(output, oldTerm, newTerm);
    return output;
}


inline bool isWhiteSpace(char c) { return impl::isWhiteSpace(c); }
inline bool isDigit     (char c) { return '0' <= c && c <= '9'; } //not locale-dependent


inline std::string  trimCpy(std::string_view  str) { return impl::trimCpy(str); }
inline std::wstring trimCpy(std::wstring_view str) { return impl::trimCpy(str); }
inline void trim(std::string&  str) { str = trimCpy(str); }
inline void trim(std::wstring& str) { str = trimCpy(str); }


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);

    if constexpr (std::is_same_v<S, std::wstring>)
        return std::to_wstring(number);
    else
    {
        static_assert(std::is_same_v<S, std::string>);
        return std::to_string(number);
    }
}


template <class Num> inline
Num stringTo(std::string_view str)
{
    static_assert(std::is_integral_v<Num>);

    const std::string tmp = trimCpy(str);
    const char* first = tmp.c_str();
    if (*first == '+')
        ++first;

    Num number = 0;
    if (const auto [ptr, ec] = std::from_chars(first, tmp.c_str() + tmp.size(), number);
        ec != std::errc())
        return 0;
    return number;
}


inline
std::string formatAsHexString(std::string_view blob)
{
    const char* const digits = "0123456789abcdef";

    std::string output;
    output.reserve(blob.size() * 2);
    for (const char c : blob)
    {
        const auto b = static_cast<unsigned char>(c);
        output += digits[b >> 4];
        output += digits[b & 0xf];
    }
    return output;
}
}

#endif //STRING_TOOLS_H_2130948715602938
