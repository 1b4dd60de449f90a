#pragma once

#include <string>
#include <unordered_map>

namespace Subprocess
{
    /**
     * @brief Environment variables handed to a child process.
     */
    class Environment
    {
      public:
        Environment() = default;

        /**
         * @param clean Start empty instead of copying the environment of this process.
         * @param mergeIn Variables that are set on top, overwriting existing ones.
         */
        Environment(bool clean, std::unordered_map<std::string, std::string> const& mergeIn);

        /**
         * @brief The environment of this process.
         */
        static Environment current();

        std::unordered_map<std::string, std::string>& variables();
        std::unordered_map<std::string, std::string> const& variables() const;

        void loadFromCurrent();
        void set(std::string const& key, std::string const& value);
        void merge(std::unordered_map<std::string, std::string> const& other, bool overwrite = true);

      private:
        std::unordered_map<std::string, std::string> environment_;
    };
}
