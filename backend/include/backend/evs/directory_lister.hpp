#pragma once

#include <backend/evs/operation.hpp>
#include <shared_data/remote_entry.hpp>

#include <string>
#include <vector>

/**
 * @brief Lists the entries of a remote directory.
 */
class DirectoryLister : public Operation
{
  public:
    DirectoryLister(Evs::Session const& session, CommandRunner& runner, std::string remoteDirectory);
    ~DirectoryLister() override = default;
    DirectoryLister(DirectoryLister const&) = delete;
    DirectoryLister(DirectoryLister&&) = delete;
    DirectoryLister& operator=(DirectoryLister const&) = delete;
    DirectoryLister& operator=(DirectoryLister&&) = delete;

    SharedData::OperationType type() const override
    {
        return SharedData::OperationType::List;
    }

    /**
     * @brief Runs the listing. A failed listing yields no entries, it cannot be told apart from an empty directory.
     */
    std::vector<SharedData::RemoteEntry> perform();

  private:
    std::string remoteDirectory_;
};
