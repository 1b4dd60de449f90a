#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace Transfer
{
    /**
     * @brief Progress messages of one execution, in the order they were produced.
     * One thread pushes, any number of threads consume. Once closed and drained, next() returns nothing.
     */
    class ProgressChannel
    {
      public:
        /**
         * @brief Messages pushed after close() are dropped.
         */
        void push(std::string message);
        void close();

        /**
         * @brief Blocks until a message is available or the channel is closed and empty.
         */
        std::optional<std::string> next();

        /**
         * @brief Never blocks.
         */
        std::optional<std::string> tryNext();

        bool closed() const;

      private:
        mutable std::mutex mutex_{};
        std::condition_variable condition_{};
        std::deque<std::string> messages_{};
        bool closed_{false};
    };
}
