#ifndef ESGATE_UTILITIES_TESTING_H
#define ESGATE_UTILITIES_TESTING_H

#include <catch2/catch.hpp>

#include <esgate/core/exception.h>

#endif
