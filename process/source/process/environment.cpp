#include <process/boost_process.hpp>

#include <process/environment.hpp>

namespace bp2 = boost::process::v2;

Environment::Environment(bool clean, std::unordered_map<std::string, std::string> const& mergeIn)
    : environment_{}
{
    if (!clean)
        loadFromCurrent();

    merge(mergeIn, true);
}
Environment Environment::current()
{
    Environment env{};
    env.loadFromCurrent();
    return env;
}
std::unordered_map<std::string, std::string>& Environment::environment()
{
    return environment_;
}
std::unordered_map<std::string, std::string> const& Environment::environment() const
{
    return environment_;
}
std::optional<std::string> Environment::get(std::string const& key) const
{
    auto iter = environment_.find(key);
    if (iter == environment_.end() || iter->second.empty())
        return std::nullopt;
    return iter->second;
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
void Environment::merge(std::unordered_map<std::string, std::string> const& other, bool overwrite)
{
    for (auto const& [key, value] : other)
    {
        if (overwrite || environment_.find(key) == environment_.end())
        {
            environment_[key] = value;
        }
    }
}
