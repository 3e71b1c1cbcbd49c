#pragma once

/// Convenience umbrella header for the tsx library.

#include <tsx/core/content_hash.hpp>
#include <tsx/core/cursor.hpp>
#include <tsx/core/data_point.hpp>
#include <tsx/core/error.hpp>
#include <tsx/core/index.hpp>
#include <tsx/core/print.hpp>
#include <tsx/core/series.hpp>
#include <tsx/core/time.hpp>
#include <tsx/core/value_storage.hpp>
#include <tsx/ops/asof.hpp>
#include <tsx/ops/join.hpp>
#include <tsx/ops/resample.hpp>
#include <tsx/ops/window.hpp>
