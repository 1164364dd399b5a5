#pragma once

#ifdef __clang__
#    pragma clang diagnostic push
#    pragma clang diagnostic ignored "-Weverything"
#endif
#include <boost/process/v2.hpp>
#ifdef __clang__
#    pragma clang diagnostic pop
#endif
