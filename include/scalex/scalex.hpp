#pragma once

#include <scalex/chunk/chunk.hpp>
#include <scalex/chunk/column.hpp>
#include <scalex/core/datum.hpp>
#include <scalex/core/decimal.hpp>
#include <scalex/core/error.hpp>
#include <scalex/core/field_type.hpp>
#include <scalex/core/time.hpp>
#include <scalex/expression/builtin.hpp>
#include <scalex/expression/builtins.hpp>
#include <scalex/expression/column.hpp>
#include <scalex/expression/constant.hpp>
#include <scalex/expression/constant_fold.hpp>
#include <scalex/expression/expression.hpp>
#include <scalex/expression/function_registry.hpp>
#include <scalex/expression/scalar_function.hpp>
#include <scalex/expression/schema.hpp>
#include <scalex/session/context.hpp>
#include <scalex/util/codec.hpp>
