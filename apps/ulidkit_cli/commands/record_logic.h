#pragma once

#include "ulidkit/app/app_service.h"
#include "ulidkit/core/clock.h"
#include "ulidkit/core/id_generator.h"
#include "ulidkit/storage/record_store.h"

#include <optional>
#include <string>

// execute_record_add: create a record and print it as JSON.
// execute_record_list: print the matching records as a JSON document.
// Both take only interface types. Concrete storage headers are rejected in this TU.
int execute_record_add(const ulidkit::app::CreateRecordRequest& req,
                       ulidkit::storage::IRecordStore& store,
                       ulidkit::core::IIdGenerator& id_gen, ulidkit::core::IClock& clock);
int execute_record_list(const std::optional<std::string>& kind,
                        const ulidkit::storage::IRecordStore& store);
