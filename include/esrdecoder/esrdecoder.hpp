#pragma once

#include "decode_error.hpp"
#include "esr.hpp"
#include "field_info.hpp"
#include "midr.hpp"
#include "parse.hpp"
#include "smccc.hpp"
#include "sysreg.hpp"
#include "version.hpp"
