/**
 * @file InputHistory.cpp
 * @brief InputHistory implementation.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/frontend/InputHistory.hpp>

#include <algorithm>
#include <charconv>
#include <system_error>

namespace zyppy::frontend {

std::string trimLine(std::string_view line)
{
    constexpr std::string_view kBlank = " \t\r\n\v\f";

    const auto first = line.find_first_not_of(kBlank);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = line.find_last_not_of(kBlank);
    return std::string{line.substr(first, last - first + 1)};
}

std::optional<core::usize> parseRecall(std::string_view line) noexcept
{
    if (line == "!!")
    {
        return 1;
    }
    if (!line.starts_with("!-") || line.size() == 2)
    {
        return std::nullopt;
    }

    core::usize back = 0;
    const char* first = line.data() + 2;
    const char* last  = line.data() + line.size();
    const auto [end, ec] = std::from_chars(first, last, back);
    if (ec != std::errc{} || end != last || back == 0)
    {
        return std::nullopt;
    }
    return back;
}

InputHistory::InputHistory(core::usize limit)
    : _limit{std::max<core::usize>(limit, 1)}
{
}

bool InputHistory::record(std::string_view line)
{
    std::string trimmed = trimLine(line);
    if (trimmed.empty())
    {
        return false;
    }

    _entries.push_back(std::move(trimmed));
    if (_entries.size() > _limit)
    {
        _entries.erase(_entries.begin());
    }
    return true;
}

std::optional<std::string> InputHistory::recall(core::usize back) const
{
    if (back == 0 || back > _entries.size())
    {
        return std::nullopt;
    }
    return _entries[_entries.size() - back];
}

} // namespace zyppy::frontend
