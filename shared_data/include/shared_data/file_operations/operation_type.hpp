#pragma once

#include <shared_data/shared_data.hpp>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(OperationType, List, Upload, Download, Delete)
}
