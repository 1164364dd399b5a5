#pragma once

#include <shared_data/shared_data.hpp>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        OperationErrorType,
        ImplementationError, // This should never occur, it indicates a bug in the program:
        ConfigError,
        AuthError,
        ProtocolError,
        TransferError,
        NotFoundError);
}
