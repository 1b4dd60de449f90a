#include <transfer/progress_parser.hpp>

#include <utility/algorithm/split.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <regex>

namespace Transfer
{
    namespace
    {
        std::regex const& progressPattern()
        {
            // count, percentage, rate, eta. The count is "1,234,567" or with -h "1.23M".
            static const std::regex pattern{
                R"((\d[\d,.]*[KMGTP]?)\s+(\d{1,3})%\s+([\d.,]+[kKMGTP]?B/s)\s+(\d+:\d{2}:\d{2}))"};
            return pattern;
        }

        std::regex const& sizePattern()
        {
            static const std::regex pattern{R"(\d+[KMGT]?B)"};
            return pattern;
        }

        bool contains(std::string_view str, std::string_view what)
        {
            return str.find(what) != std::string_view::npos;
        }

        template <typename PredicateT>
        std::optional<std::string> findLast(std::vector<std::string> const& lines, PredicateT&& predicate)
        {
            const auto iter = std::find_if(lines.rbegin(), lines.rend(), predicate);
            if (iter == lines.rend())
                return std::nullopt;
            return *iter;
        }
    }

    std::optional<std::string> parseProgressLine(std::string_view line)
    {
        std::match_results<std::string_view::const_iterator> match;
        if (std::regex_search(line.begin(), line.end(), match, progressPattern()))
            return fmt::format("{}% • {} • {} remaining", match[2].str(), match[3].str(), match[4].str());

        if (contains(line, "speedup"))
            return std::string{Utility::Algorithm::trim(line)};

        return std::nullopt;
    }

    std::vector<std::string> LineSplitter::feed(std::string_view chunk)
    {
        std::vector<std::string> lines;
        for (auto c : chunk)
        {
            if (c == '\n' || c == '\r')
            {
                if (!pending_.empty())
                    lines.push_back(std::move(pending_));
                pending_.clear();
            }
            else
            {
                pending_.push_back(c);
            }
        }
        return lines;
    }

    std::optional<std::string> LineSplitter::finish()
    {
        if (pending_.empty())
            return std::nullopt;
        auto rest = std::move(pending_);
        pending_.clear();
        return rest;
    }

    ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval)
        : interval_{interval}
        , last_{std::nullopt}
    {}

    bool ProgressThrottle::admit(std::chrono::steady_clock::time_point now)
    {
        if (last_ && now - *last_ < interval_)
            return false;
        last_ = now;
        return true;
    }

    std::string summarizeOutput(std::string_view output)
    {
        const auto lines = Utility::Algorithm::splitLines(Utility::Algorithm::trim(output));
        if (lines.empty())
            return "Transfer completed successfully";

        auto const& lastLine = lines.back();
        if (contains(lastLine, "total") || contains(lastLine, "speedup"))
            return lastLine;

        if (auto line = findLast(lines, [](std::string const& line) {
                return contains(line, "%") || contains(line, "speedup") || contains(line, "sent");
            }))
        {
            return *line;
        }

        if (auto line = findLast(lines, [](std::string const& line) {
                return std::regex_search(line, sizePattern()) || contains(line, "files") || contains(line, "bytes");
            }))
        {
            return *line;
        }

        return lastLines(output, 2);
    }

    std::string lastLines(std::string_view output, std::size_t count)
    {
        const auto lines = Utility::Algorithm::splitLines(output);
        const auto first = lines.size() > count ? lines.size() - count : 0;

        std::string result;
        for (auto i = first; i < lines.size(); ++i)
        {
            if (!result.empty())
                result.push_back('\n');
            result.append(lines[i]);
        }
        return result;
    }
}
