#pragma once

#include <optional>
#include <string>
#include <unordered_map>

class Environment
{
  public:
    Environment() = default;
    Environment(bool clean, std::unordered_map<std::string, std::string> const& mergeIn);

    static Environment current();

    std::unordered_map<std::string, std::string>& environment();
    std::unordered_map<std::string, std::string> const& environment() const;

    /**
     * @brief Returns the value of the variable, std::nullopt if it is unset or empty.
     */
    std::optional<std::string> get(std::string const& key) const;

    void loadFromCurrent();
    void merge(std::unordered_map<std::string, std::string> const& other, bool overwrite = true);

  private:
    std::unordered_map<std::string, std::string> environment_;
};
