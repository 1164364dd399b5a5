#pragma once

#include <shared_data/shared_data.hpp>

namespace SharedData
{
    /**
     * @brief The steps of an upload in execution order. The value is the step number reported in errors.
     */
    enum class UploadStep
    {
        StageLocally = 1,
        UploadToStaging = 2,
        CreateRemoteDirectory = 3,
        CopyWithin = 4,
        DeleteStaging = 5,
        PurgeTrash = 6
    };
    BOOST_DESCRIBE_ENUM(
        UploadStep,
        StageLocally,
        UploadToStaging,
        CreateRemoteDirectory,
        CopyWithin,
        DeleteStaging,
        PurgeTrash)

    inline int stepNumber(UploadStep step)
    {
        return static_cast<int>(step);
    }
}
