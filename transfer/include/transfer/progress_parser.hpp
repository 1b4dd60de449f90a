#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Transfer
{
    /**
     * @brief Translates one line of rsync -P output into a short progress message.
     *
     * "  1,234,567  67%  123.45kB/s    0:00:05" becomes "67% • 123.45kB/s • 0:00:05 remaining",
     * a summary line containing "speedup" is returned trimmed. Everything else yields nothing.
     */
    std::optional<std::string> parseProgressLine(std::string_view line);

    /**
     * @brief Splits a stream of output chunks into lines. An incomplete last line is kept until the next chunk.
     * "\r" terminates a line like "\n" does, rsync redraws its progress line with it.
     */
    class LineSplitter
    {
      public:
        std::vector<std::string> feed(std::string_view chunk);

        /**
         * @brief Returns the incomplete rest, if any, once the stream ended.
         */
        std::optional<std::string> finish();

      private:
        std::string pending_{};
    };

    /**
     * @brief Lets one progress message through per interval. The first one always passes.
     */
    class ProgressThrottle
    {
      public:
        explicit ProgressThrottle(std::chrono::milliseconds interval);

        bool admit(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

      private:
        std::chrono::milliseconds interval_;
        std::optional<std::chrono::steady_clock::time_point> last_;
    };

    /**
     * @brief The most informative line of the output of a successful transfer.
     *
     * Preference: a last line with "total" or "speedup", the last progress line, the last line with
     * a byte or file count, the last two lines. Empty output gives "Transfer completed successfully".
     */
    std::string summarizeOutput(std::string_view output);

    /**
     * @brief The last count non-empty lines joined with "\n".
     */
    std::string lastLines(std::string_view output, std::size_t count);
}
