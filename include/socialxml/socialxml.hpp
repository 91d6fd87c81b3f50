// socialxml.hpp - public entry points: validation, formatting, diagnostics
#pragma once
#include "socialxml/diagnostics.hpp"
#include "socialxml/diagnostics_json.hpp"
#include "socialxml/env.hpp"
#include "socialxml/format.hpp"
#include "socialxml/validate.hpp"
