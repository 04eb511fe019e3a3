#pragma once

#include <aiomega/common/error.h>
#include <aiomega/common/error_forward.h>
#include <aiomega/common/expected.h>
#include <aiomega/common/unexpected.h>

