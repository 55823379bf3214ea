#pragma once

// Public surface of the statkit analysis engine

#include "engine/analysis_engine.hpp"
#include "engine/analysis_request.hpp"
#include "engine/analysis_result.hpp"
#include "engine/chart_descriptor.hpp"
#include "export/result_serializer.hpp"
#include "statkit/core/cancellation.hpp"
#include "statkit/core/dataset.hpp"
#include "statkit/core/errors.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"
