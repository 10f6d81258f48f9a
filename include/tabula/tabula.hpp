#pragma once

/// Convenience umbrella header for the Tabula library.

#include <tabula/core/column.hpp>
#include <tabula/core/diagnostics.hpp>
#include <tabula/core/policy.hpp>
#include <tabula/runtime/column_vector.hpp>
#include <tabula/runtime/key.hpp>
#include <tabula/runtime/ops.hpp>
#include <tabula/runtime/resolver.hpp>
#include <tabula/runtime/row_builder.hpp>
#include <tabula/runtime/table.hpp>
