#include <process/environment.hpp>

#include <boost/process/v2/environment.hpp>

namespace bp2 = boost::process::v2;

namespace Subprocess
{
    Environment::Environment(bool clean, std::unordered_map<std::string, std::string> const& mergeIn)
        : environment_{}
    {
        if (!clean)
            loadFromCurrent();

        merge(mergeIn, true);
    }

    Environment Environment::current()
    {
        Environment environment{};
        environment.loadFromCurrent();
        return environment;
    }

    std::unordered_map<std::string, std::string>& Environment::variables()
    {
        return environment_;
    }

    std::unordered_map<std::string, std::string> const& Environment::variables() const
    {
        return environment_;
    }

    void Environment::loadFromCurrent()
    {
        environment_ = {};
        const auto currentEnv = bp2::environment::current();
        for (auto iter = currentEnv.begin(); iter != currentEnv.end(); ++iter)
        {
            auto deref = *iter;
            if (deref.key().empty())
                continue;
            environment_.emplace(deref.key().string(), deref.value().string());
        }
    }

    void Environment::set(std::string const& key, std::string const& value)
    {
        environment_[key] = value;
    }

    void Environment::merge(std::unordered_map<std::string, std::string> const& other, bool overwrite)
    {
        for (auto const& [key, value] : other)
        {
            if (overwrite || environment_.find(key) == environment_.end())
                environment_[key] = value;
        }
    }
}
