#pragma once

#include "common/constants.hpp"
#include "core/error_codes.hpp"
#include "core/options.hpp"
#include "core/progress_bar.hpp"
#include "io/output_sink.hpp"
#include "io/stream_adapter.hpp"
#include "io/terminal.hpp"
