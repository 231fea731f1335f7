#pragma once

#include "memmsg/cast.hpp"
#include "memmsg/layout.hpp"
#include "memmsg/status.hpp"
#include "memmsg/traits/validate.hpp"
