#pragma once

#include "ulidkit/app/app_service.h"
#include "ulidkit/core/clock.h"
#include "ulidkit/core/ulid_generator.h"

// execute_generate: mint ids per req and print them, one per line or as a JSON document.
int execute_generate(const ulidkit::app::MintRequest& req, ulidkit::core::UlidGenerator& gen,
                     ulidkit::core::IClock& clock, bool as_json);
